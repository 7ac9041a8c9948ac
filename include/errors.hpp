#pragma once

#include <stdexcept>
#include <string>

namespace count2vec {

// 参数非法：k 超出 (0, V]、窗口 <= 0、线程数 <= 0 等
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

// 词不在词汇表中
class LookupError : public std::out_of_range {
public:
    explicit LookupError(const std::string& word)
        : std::out_of_range("Word not in vocabulary: " + word), word_(word) {}

    const std::string& Word() const { return word_; }

private:
    std::string word_;
};

} // namespace count2vec
