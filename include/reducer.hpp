#pragma once

#include <cstdint>
#include <Eigen/Dense>

namespace count2vec {

constexpr std::uint64_t kDefaultSeed = 4355;
constexpr int kDefaultIterations = 10;

// 截断 SVD 降维接口
//
// Reduce 返回 matrix 的前 k 个左奇异向量乘以对应奇异值（U_k * Sigma_k），
// 形状为 (rows, k)，行顺序与输入一致。
// 相同的 matrix / k / seed / iterations 必须得到完全相同的结果。
class RankReducer {
public:
    virtual ~RankReducer() = default;
    
    virtual Eigen::MatrixXd Reduce(const Eigen::MatrixXd& matrix, int k,
                                   std::uint64_t seed, int iterations) const = 0;
};

// 随机化 SVD（随机投影 + 幂迭代）
class RandomizedSvdReducer : public RankReducer {
public:
    struct Config {
        int oversamples = 10;    // 随机投影的额外列数
        
        Config() = default;
    };
    
    RandomizedSvdReducer();
    explicit RandomizedSvdReducer(const Config& config);
    
    Eigen::MatrixXd Reduce(const Eigen::MatrixXd& matrix, int k,
                           std::uint64_t seed, int iterations) const override;
    
private:
    Config config_;
};

// 完整 SVD，忽略 seed 和 iterations，用作精度参照
class ExactSvdReducer : public RankReducer {
public:
    Eigen::MatrixXd Reduce(const Eigen::MatrixXd& matrix, int k,
                           std::uint64_t seed, int iterations) const override;
};

// 用 RandomizedSvdReducer 把共现矩阵降到 k 维
Eigen::MatrixXd ReduceToKDim(const Eigen::MatrixXd& matrix, int k = 2,
                             std::uint64_t seed = kDefaultSeed,
                             int iterations = kDefaultIterations);

} // namespace count2vec
