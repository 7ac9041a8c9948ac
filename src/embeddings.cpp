#include "embeddings.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace count2vec {

WordEmbeddings::WordEmbeddings(Vocabulary vocab, Eigen::MatrixXd vectors)
    : vocab_(std::move(vocab)), vectors_(std::move(vectors)) {
    if (static_cast<size_t>(vectors_.rows()) != vocab_.Size()) {
        throw InvalidParameterError("Embedding rows (" + std::to_string(vectors_.rows()) +
                                    ") do not match vocabulary size (" +
                                    std::to_string(vocab_.Size()) + ")");
    }
}

Eigen::VectorXd WordEmbeddings::Vector(const std::string& word) const {
    return vectors_.row(vocab_.IndexOf(word)).transpose();
}

double CosineSimilarity(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    double norm = a.norm() * b.norm();
    if (norm == 0.0) return 0.0;
    return a.dot(b) / norm;
}

std::vector<std::pair<std::string, double>> WordEmbeddings::NearestNeighbors(
    const std::string& word, size_t top_n) const {
    return NearestNeighbors(Vector(word), top_n, {word});
}

std::vector<std::pair<std::string, double>> WordEmbeddings::NearestNeighbors(
    const Eigen::VectorXd& query, size_t top_n,
    const std::vector<std::string>& exclude) const {
    if (query.size() != vectors_.cols()) {
        throw InvalidParameterError("Query has " + std::to_string(query.size()) +
                                    " dimensions, embeddings have " +
                                    std::to_string(vectors_.cols()));
    }
    
    std::vector<std::pair<std::string, double>> results;
    results.reserve(vocab_.Size());
    for (size_t i = 0; i < vocab_.Size(); ++i) {
        const std::string& candidate = vocab_.GetWord(static_cast<int>(i));
        if (std::find(exclude.begin(), exclude.end(), candidate) != exclude.end()) {
            continue;
        }
        double sim = CosineSimilarity(query, vectors_.row(i).transpose());
        results.emplace_back(candidate, sim);
    }
    
    // 相似度相同时保持词表顺序
    std::stable_sort(results.begin(), results.end(),
                     [](const std::pair<std::string, double>& a,
                        const std::pair<std::string, double>& b) {
                         return a.second > b.second;
                     });
    if (results.size() > top_n) {
        results.resize(top_n);
    }
    return results;
}

void WordEmbeddings::Save(const std::string& filename, bool binary) const {
    // 向量文件以空白分隔，无法表示空词或含空白的词
    for (const auto& word : vocab_.Words()) {
        if (word.empty() || word.find_first_of(" \t\r\n\v\f") != std::string::npos) {
            throw InvalidParameterError("Cannot save word \"" + word +
                                        "\" to a vector file: empty or contains whitespace");
        }
    }
    
    std::ofstream file(filename, binary ? std::ios::binary : std::ios::out);
    if (!file) {
        throw std::runtime_error("Cannot open vector file for writing: " + filename);
    }
    
    file << vocab_.Size() << " " << vectors_.cols() << "\n";
    
    for (size_t i = 0; i < vocab_.Size(); ++i) {
        file << vocab_.GetWord(static_cast<int>(i)) << " ";
        
        if (binary) {
            // 二进制格式按 float 存储，与 word2vec 工具兼容
            std::vector<float> vec(vectors_.cols());
            for (Eigen::Index j = 0; j < vectors_.cols(); ++j) {
                vec[j] = static_cast<float>(vectors_(i, j));
            }
            file.write(reinterpret_cast<const char*>(vec.data()),
                       vec.size() * sizeof(float));
        } else {
            for (Eigen::Index j = 0; j < vectors_.cols(); ++j) {
                file << vectors_(i, j) << " ";
            }
        }
        file << "\n";
    }
    
    if (!file) {
        throw std::runtime_error("Error while writing vector file: " + filename);
    }
}

WordEmbeddings WordEmbeddings::Load(const std::string& filename, bool binary) {
    std::ifstream file(filename, binary ? std::ios::binary : std::ios::in);
    if (!file) {
        throw std::runtime_error("Cannot open vector file: " + filename);
    }
    
    // 读取头部信息：词汇量和向量维度
    size_t vocab_size;
    size_t vector_size;
    if (!(file >> vocab_size >> vector_size)) {
        throw std::runtime_error("Malformed vector file header: " + filename);
    }
    
    std::vector<std::string> words(vocab_size);
    Eigen::MatrixXd vectors(vocab_size, vector_size);
    std::vector<float> vec(vector_size);
    
    for (size_t i = 0; i < vocab_size; ++i) {
        // operator>> 会跳过上一行残留的空白和换行
        if (!(file >> words[i])) {
            throw std::runtime_error("Unexpected end of vector file: " + filename);
        }
        
        if (binary) {
            file.get();  // 跳过词后的空格
            file.read(reinterpret_cast<char*>(vec.data()), vector_size * sizeof(float));
            if (!file) {
                throw std::runtime_error("Truncated vector for word \"" + words[i] +
                                         "\" in " + filename);
            }
            for (size_t j = 0; j < vector_size; ++j) {
                vectors(i, j) = vec[j];
            }
        } else {
            for (size_t j = 0; j < vector_size; ++j) {
                if (!(file >> vectors(i, j))) {
                    throw std::runtime_error("Malformed vector for word \"" + words[i] +
                                             "\" in " + filename);
                }
            }
        }
    }
    
    Vocabulary vocab = Vocabulary::FromWords(words);
    if (vocab.Size() != vocab_size) {
        throw std::runtime_error("Duplicate words in vector file: " + filename);
    }
    
    // 文件中的词序不一定是字典序，按词表索引重排行
    Eigen::MatrixXd ordered(vocab_size, vector_size);
    for (size_t i = 0; i < vocab_size; ++i) {
        ordered.row(vocab.IndexOf(words[i])) = vectors.row(i);
    }
    return WordEmbeddings(std::move(vocab), std::move(ordered));
}

} // namespace count2vec
