#include "reducer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <random>
#include <string>

namespace count2vec {

namespace {

void ValidateRank(const Eigen::MatrixXd& matrix, int k) {
    Eigen::Index max_rank = std::min(matrix.rows(), matrix.cols());
    if (k <= 0 || k > max_rank) {
        throw InvalidParameterError("Embedding size k must be in (0, " +
                                    std::to_string(max_rank) + "], got " +
                                    std::to_string(k));
    }
}

// 列正交化，返回与 m 同形状的 Q（要求 m.cols() <= m.rows()）
Eigen::MatrixXd Orthonormalize(const Eigen::MatrixXd& m) {
    Eigen::HouseholderQR<Eigen::MatrixXd> qr(m);
    return qr.householderQ() * Eigen::MatrixXd::Identity(m.rows(), m.cols());
}

// 取前 k 个分量，返回 U_k * Sigma_k
//
// 奇异向量的符号不唯一：约定每个右奇异向量中绝对值最大的分量为正，
// 对应的左奇异向量一起翻转
Eigen::MatrixXd ScaledLeftVectors(const Eigen::MatrixXd& u,
                                  const Eigen::VectorXd& singular_values,
                                  const Eigen::MatrixXd& v, int k) {
    Eigen::MatrixXd reduced = u.leftCols(k) * singular_values.head(k).asDiagonal();
    for (int j = 0; j < k; ++j) {
        Eigen::Index pivot = 0;
        v.col(j).cwiseAbs().maxCoeff(&pivot);
        if (v(pivot, j) < 0) {
            reduced.col(j) *= -1.0;
        }
    }
    return reduced;
}

} // namespace

RandomizedSvdReducer::RandomizedSvdReducer() = default;

RandomizedSvdReducer::RandomizedSvdReducer(const Config& config)
    : config_(config) {
    if (config_.oversamples < 0) {
        throw InvalidParameterError("Oversamples must be non-negative, got " +
                                    std::to_string(config_.oversamples));
    }
}

Eigen::MatrixXd RandomizedSvdReducer::Reduce(const Eigen::MatrixXd& matrix, int k,
                                             std::uint64_t seed, int iterations) const {
    ValidateRank(matrix, k);
    if (iterations < 0) {
        throw InvalidParameterError("Iteration count must be non-negative, got " +
                                    std::to_string(iterations));
    }
    
    const Eigen::Index rows = matrix.rows();
    const Eigen::Index cols = matrix.cols();
    const Eigen::Index sketch = std::min<Eigen::Index>(k + config_.oversamples,
                                                       std::min(rows, cols));
    
    // -------------------------------------------------------------------------
    // 步骤 1：高斯随机投影
    // -------------------------------------------------------------------------
    // 显式循环保证取数顺序固定，同一个 seed 得到同一个 omega
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd omega(cols, sketch);
    for (Eigen::Index c = 0; c < sketch; ++c) {
        for (Eigen::Index r = 0; r < cols; ++r) {
            omega(r, c) = normal(rng);
        }
    }
    
    Eigen::MatrixXd q = Orthonormalize(matrix * omega);
    
    // -------------------------------------------------------------------------
    // 步骤 2：幂迭代
    // -------------------------------------------------------------------------
    // 每次迭代后重新正交化，避免小奇异值方向被数值误差淹没
    for (int it = 0; it < iterations; ++it) {
        Eigen::MatrixXd z = Orthonormalize(matrix.transpose() * q);
        q = Orthonormalize(matrix * z);
    }
    
    // -------------------------------------------------------------------------
    // 步骤 3：在 q 张成的子空间里做小规模 SVD
    // -------------------------------------------------------------------------
    // B = Q^T M，大小 sketch x cols
    Eigen::MatrixXd b = q.transpose() * matrix;
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(b, Eigen::ComputeThinU | Eigen::ComputeThinV);
    
    Eigen::MatrixXd u = q * svd.matrixU();
    return ScaledLeftVectors(u, svd.singularValues(), svd.matrixV(), k);
}

Eigen::MatrixXd ExactSvdReducer::Reduce(const Eigen::MatrixXd& matrix, int k,
                                        std::uint64_t /*seed*/, int /*iterations*/) const {
    ValidateRank(matrix, k);
    Eigen::BDCSVD<Eigen::MatrixXd> svd(matrix, Eigen::ComputeThinU | Eigen::ComputeThinV);
    return ScaledLeftVectors(svd.matrixU(), svd.singularValues(), svd.matrixV(), k);
}

Eigen::MatrixXd ReduceToKDim(const Eigen::MatrixXd& matrix, int k,
                             std::uint64_t seed, int iterations) {
    RandomizedSvdReducer reducer;
    return reducer.Reduce(matrix, k, seed, iterations);
}

} // namespace count2vec
