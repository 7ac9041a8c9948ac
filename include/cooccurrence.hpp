#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <Eigen/Dense>
#include "corpus.hpp"

namespace count2vec {

class Vocabulary;

// 共现矩阵及其使用的 词 -> 行/列 映射
struct CooccurrenceResult {
    Eigen::MatrixXd matrix;
    std::unordered_map<std::string, int> word_to_index;
};

class CooccurrenceCounter {
public:
    struct Config {
        int window = 4;         // 窗口半径
        int num_threads = 1;    // 按文档切分的计数线程数
        
        Config() = default;
    };
    
    // window 或 num_threads <= 0 时抛出 InvalidParameterError
    explicit CooccurrenceCounter(const Config& config);
    
    // 统计 V x V 共现矩阵，V = vocab.Size()
    // 语料中出现词表外的词时抛出 LookupError，此时不返回任何结果
    Eigen::MatrixXd Count(const Corpus& corpus, const Vocabulary& vocab) const;
    
    const Config& GetConfig() const { return config_; }
    
private:
    Config config_;
    
    void CountDocuments(const std::vector<std::vector<int>>& documents,
                        size_t begin, size_t end, Eigen::MatrixXd& counts) const;
};

// 由语料推导词汇表并统计共现矩阵
CooccurrenceResult ComputeCooccurrenceMatrix(const Corpus& corpus, int window_size = 4);

} // namespace count2vec
