#pragma once

#include <string>
#include <vector>

namespace count2vec {

// 一篇文档 = 有序的词序列；语料 = 有序的文档序列
using Document = std::vector<std::string>;
using Corpus = std::vector<Document>;

// 文档边界标记
constexpr const char* kStartToken = "START";
constexpr const char* kEndToken = "END";

// 按空白切分一行文本
// add_boundary_markers 为 true 时首尾加上 START / END
Document ParseDocument(const std::string& line, bool add_boundary_markers = true);

// 从文件读取语料，每个非空行是一篇文档
Corpus ReadCorpus(const std::string& filename, bool add_boundary_markers = true);

// 语料中的总词数
long long CorpusTokenCount(const Corpus& corpus);

} // namespace count2vec
