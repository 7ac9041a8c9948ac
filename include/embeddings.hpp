#pragma once

#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>
#include "vocabulary.hpp"

namespace count2vec {

// 词汇表 + 对应的 V x k 词向量，第 i 行对应词表第 i 个词
class WordEmbeddings {
public:
    WordEmbeddings() = default;
    
    // vectors.rows() 必须等于 vocab.Size()
    WordEmbeddings(Vocabulary vocab, Eigen::MatrixXd vectors);
    
    const Vocabulary& Vocab() const { return vocab_; }
    const Eigen::MatrixXd& Vectors() const { return vectors_; }
    size_t Size() const { return vocab_.Size(); }
    int Dimensions() const { return static_cast<int>(vectors_.cols()); }
    
    // 获取词向量，词不存在时抛出 LookupError
    Eigen::VectorXd Vector(const std::string& word) const;
    
    // 与 word 余弦相似度最高的 top_n 个词（不含 word 本身），按相似度降序
    std::vector<std::pair<std::string, double>> NearestNeighbors(
        const std::string& word, size_t top_n) const;
    
    // 与任意查询向量余弦相似度最高的 top_n 个词，exclude 中的词不参与排序
    std::vector<std::pair<std::string, double>> NearestNeighbors(
        const Eigen::VectorXd& query, size_t top_n,
        const std::vector<std::string>& exclude) const;
    
    // 保存/加载（word2vec 格式：首行 "<词数> <维度>"，之后每行一个词及其向量）
    // 空词或含空白的词无法写入，抛出 InvalidParameterError
    void Save(const std::string& filename, bool binary = false) const;
    static WordEmbeddings Load(const std::string& filename, bool binary = false);
    
private:
    Vocabulary vocab_;
    Eigen::MatrixXd vectors_;
};

// 余弦相似度，任一向量为零向量时返回 0
double CosineSimilarity(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

} // namespace count2vec
