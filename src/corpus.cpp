#include "corpus.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace count2vec {

Document ParseDocument(const std::string& line, bool add_boundary_markers) {
    Document document;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) {
        document.push_back(word);
    }
    
    // 空行不产生文档内容，也不加标记
    if (document.empty() || !add_boundary_markers) {
        return document;
    }
    
    document.insert(document.begin(), kStartToken);
    document.push_back(kEndToken);
    return document;
}

Corpus ReadCorpus(const std::string& filename, bool add_boundary_markers) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open corpus file: " + filename);
    }
    
    Corpus corpus;
    std::string line;
    while (std::getline(file, line)) {
        Document document = ParseDocument(line, add_boundary_markers);
        if (document.empty()) continue;  // 跳过空行
        corpus.push_back(std::move(document));
    }
    
    if (file.bad()) {
        throw std::runtime_error("Error while reading corpus file: " + filename);
    }
    return corpus;
}

long long CorpusTokenCount(const Corpus& corpus) {
    long long total = 0;
    for (const auto& document : corpus) {
        total += static_cast<long long>(document.size());
    }
    return total;
}

} // namespace count2vec
