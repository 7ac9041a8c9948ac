#include "vocabulary.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace count2vec {

DistinctWordsResult DistinctWords(const Corpus& corpus) {
    std::unordered_set<std::string> seen;
    for (const auto& document : corpus) {
        for (const auto& word : document) {
            seen.insert(word);
        }
    }
    
    // unordered_set 的迭代顺序不确定，排序后才能作为行/列编号
    DistinctWordsResult result;
    result.words.assign(seen.begin(), seen.end());
    std::sort(result.words.begin(), result.words.end());
    result.count = result.words.size();
    return result;
}

Vocabulary Vocabulary::FromCorpus(const Corpus& corpus) {
    Vocabulary vocab;
    vocab.words_ = DistinctWords(corpus).words;
    vocab.BuildIndex();
    return vocab;
}

Vocabulary Vocabulary::FromWords(std::vector<std::string> words) {
    std::sort(words.begin(), words.end());
    words.erase(std::unique(words.begin(), words.end()), words.end());
    
    Vocabulary vocab;
    vocab.words_ = std::move(words);
    vocab.BuildIndex();
    return vocab;
}

void Vocabulary::BuildIndex() {
    word_to_index_.clear();
    word_to_index_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
        word_to_index_[words_[i]] = static_cast<int>(i);
    }
}

int Vocabulary::GetWordIndex(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? it->second : -1;
}

int Vocabulary::IndexOf(const std::string& word) const {
    int index = GetWordIndex(word);
    if (index == -1) {
        throw LookupError(word);
    }
    return index;
}

void Vocabulary::Save(const std::string& filename) const {
    // 每行一个词，词本身不能含换行
    for (const auto& word : words_) {
        if (word.find_first_of("\r\n") != std::string::npos) {
            throw InvalidParameterError("Cannot save word containing a line break: " + word);
        }
    }
    
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file for writing: " + filename);
    }
    for (const auto& word : words_) {
        file << word << "\n";
    }
    if (!file) {
        throw std::runtime_error("Error while writing vocabulary file: " + filename);
    }
}

void Vocabulary::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file: " + filename);
    }
    
    std::vector<std::string> words;
    std::string word;
    // 整行就是一个词：保留词内空格，空行表示空字符串
    while (std::getline(file, word)) {
        words.push_back(word);
    }
    if (file.bad()) {
        throw std::runtime_error("Error while reading vocabulary file: " + filename);
    }
    
    std::sort(words.begin(), words.end());
    auto dup = std::adjacent_find(words.begin(), words.end());
    if (dup != words.end()) {
        throw std::runtime_error("Duplicate word in vocabulary file " + filename + ": " + *dup);
    }
    
    words_ = std::move(words);
    BuildIndex();
}

} // namespace count2vec
