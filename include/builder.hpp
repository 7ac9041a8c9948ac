#pragma once

#include <cstdint>
#include <string>
#include "embeddings.hpp"
#include "reducer.hpp"

namespace count2vec {

// 语料文件 -> 词汇表 -> 共现矩阵 -> 截断 SVD -> 向量文件
class EmbeddingBuilder {
public:
    struct Config {
        std::string corpus_file;
        std::string output_file;
        std::string vocab_file;             // 为空则不保存词汇表
        bool add_boundary_markers = true;   // 每篇文档首尾加 START / END
        int window = 4;                     // 共现窗口半径
        int num_threads = 1;                // 计数线程数
        int dimensions = 2;                 // 降维后的维度 k
        int iterations = kDefaultIterations; // 幂迭代次数
        std::uint64_t seed = kDefaultSeed;  // 随机投影种子
        bool binary = false;                // 二进制输出
        bool exact = false;                 // 使用完整 SVD 代替随机化 SVD
        
        Config() = default;
    };
    
    explicit EmbeddingBuilder(const Config& config);
    
    // 执行完整流程并保存结果
    WordEmbeddings Build();
    
private:
    Config config_;
};

// 解析随机种子：只接受非负十进制整数
// 负数、多余字符或超出 uint64 范围时抛出 InvalidParameterError
std::uint64_t ParseSeed(const std::string& text);

} // namespace count2vec
