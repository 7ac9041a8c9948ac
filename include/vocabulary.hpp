#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include "corpus.hpp"

namespace count2vec {

// 语料中所有不重复的词（按字典序排列）及其数量
struct DistinctWordsResult {
    std::vector<std::string> words;
    size_t count = 0;
};

// 收集语料中的不重复词，结果按字节序升序排列
// 与遍历顺序无关：同一语料多次调用结果完全一致
DistinctWordsResult DistinctWords(const Corpus& corpus);

class Vocabulary {
public:
    Vocabulary() = default;
    
    // 从语料构建词汇表
    static Vocabulary FromCorpus(const Corpus& corpus);
    
    // 从给定词表构建（排序并去重）
    static Vocabulary FromWords(std::vector<std::string> words);
    
    // 保存/加载词汇表（每行一个词，按索引顺序）
    // 词中含换行时 Save 抛出 InvalidParameterError
    void Save(const std::string& filename) const;
    void Load(const std::string& filename);
    
    // 查询
    int GetWordIndex(const std::string& word) const;   // 不存在返回 -1
    int IndexOf(const std::string& word) const;        // 不存在抛出 LookupError
    bool Contains(const std::string& word) const { return GetWordIndex(word) != -1; }
    const std::string& GetWord(int index) const { return words_[index]; }
    const std::vector<std::string>& Words() const { return words_; }
    const std::unordered_map<std::string, int>& WordToIndex() const { return word_to_index_; }
    size_t Size() const { return words_.size(); }
    
private:
    std::vector<std::string> words_;
    std::unordered_map<std::string, int> word_to_index_;
    
    void BuildIndex();
};

} // namespace count2vec
