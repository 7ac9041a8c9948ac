#include "builder.hpp"
#include "cooccurrence.hpp"
#include "corpus.hpp"
#include "errors.hpp"
#include "vocabulary.hpp"
#include <chrono>
#include <iostream>
#include <memory>

namespace count2vec {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - start).count();
}

} // namespace

std::uint64_t ParseSeed(const std::string& text) {
    // std::stoull 会接受 "-5" 并回绕成 2^64 - 5
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos || text[first] == '-' || text[first] == '+') {
        throw InvalidParameterError("Seed must be a non-negative integer, got \"" + text + "\"");
    }
    
    size_t parsed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &parsed);
    } catch (const std::exception&) {
        throw InvalidParameterError("Seed must be a non-negative integer, got \"" + text + "\"");
    }
    if (parsed != text.size()) {
        throw InvalidParameterError("Seed must be a non-negative integer, got \"" + text + "\"");
    }
    return static_cast<std::uint64_t>(value);
}

EmbeddingBuilder::EmbeddingBuilder(const Config& config)
    : config_(config) {
    if (config_.corpus_file.empty() || config_.output_file.empty()) {
        throw InvalidParameterError("Corpus file and output file are required");
    }
    if (config_.dimensions <= 0) {
        throw InvalidParameterError("Embedding size must be positive, got " +
                                    std::to_string(config_.dimensions));
    }
}

WordEmbeddings EmbeddingBuilder::Build() {
    auto start_time = std::chrono::steady_clock::now();
    
    // 读取语料
    std::cout << "Reading corpus from " << config_.corpus_file << "...\n";
    Corpus corpus = ReadCorpus(config_.corpus_file, config_.add_boundary_markers);
    std::cout << "Documents: " << corpus.size()
              << ", Tokens: " << CorpusTokenCount(corpus) << "\n";
    
    // 构建词汇表
    Vocabulary vocab = Vocabulary::FromCorpus(corpus);
    std::cout << "Vocabulary size: " << vocab.Size() << "\n";
    if (!config_.vocab_file.empty()) {
        vocab.Save(config_.vocab_file);
        std::cout << "Vocabulary saved to " << config_.vocab_file << "\n";
    }
    
    // 统计共现矩阵
    CooccurrenceCounter::Config counter_config;
    counter_config.window = config_.window;
    counter_config.num_threads = config_.num_threads;
    CooccurrenceCounter counter(counter_config);
    
    std::cout << "Counting co-occurrences (window " << config_.window
              << ", threads " << config_.num_threads << ")...\n";
    Eigen::MatrixXd counts = counter.Count(corpus, vocab);
    std::cout << "Total co-occurrences: " << static_cast<long long>(counts.sum()) << "\n";
    
    // 降维
    std::unique_ptr<RankReducer> reducer;
    if (config_.exact) {
        reducer = std::make_unique<ExactSvdReducer>();
    } else {
        reducer = std::make_unique<RandomizedSvdReducer>();
    }
    
    std::cout << "Running " << (config_.exact ? "exact" : "truncated")
              << " SVD over " << counts.rows() << " words (k = "
              << config_.dimensions << ")...\n";
    Eigen::MatrixXd reduced = reducer->Reduce(counts, config_.dimensions,
                                              config_.seed, config_.iterations);
    
    WordEmbeddings embeddings(std::move(vocab), std::move(reduced));
    embeddings.Save(config_.output_file, config_.binary);
    
    std::cout << "Done in " << SecondsSince(start_time) << " seconds\n";
    std::cout << "Vectors saved to " << config_.output_file << "\n";
    return embeddings;
}

} // namespace count2vec
