#include "cooccurrence.hpp"
#include "vocabulary.hpp"
#include "errors.hpp"
#include <algorithm>
#include <functional>
#include <thread>

namespace count2vec {

CooccurrenceCounter::CooccurrenceCounter(const Config& config)
    : config_(config) {
    if (config_.window <= 0) {
        throw InvalidParameterError("Window size must be positive, got " +
                                    std::to_string(config_.window));
    }
    if (config_.num_threads <= 0) {
        throw InvalidParameterError("Thread count must be positive, got " +
                                    std::to_string(config_.num_threads));
    }
}

Eigen::MatrixXd CooccurrenceCounter::Count(const Corpus& corpus, const Vocabulary& vocab) const {
    // -------------------------------------------------------------------------
    // 步骤 1：把每篇文档转成词索引序列
    // -------------------------------------------------------------------------
    // 查找失败在这里一次性暴露，计数阶段不会再出错
    std::vector<std::vector<int>> documents;
    documents.reserve(corpus.size());
    for (const auto& document : corpus) {
        std::vector<int> indices;
        indices.reserve(document.size());
        for (const auto& word : document) {
            indices.push_back(vocab.IndexOf(word));
        }
        documents.push_back(std::move(indices));
    }
    
    const Eigen::Index vocab_size = static_cast<Eigen::Index>(vocab.Size());
    Eigen::MatrixXd counts = Eigen::MatrixXd::Zero(vocab_size, vocab_size);
    
    size_t num_threads = std::min<size_t>(config_.num_threads, documents.size());
    if (num_threads <= 1) {
        CountDocuments(documents, 0, documents.size(), counts);
        return counts;
    }
    
    // -------------------------------------------------------------------------
    // 步骤 2：多线程计数
    // -------------------------------------------------------------------------
    // 每个线程负责一段连续的文档，写入自己的局部矩阵，最后求和
    // 计数是整数，求和顺序不影响结果
    std::vector<Eigen::MatrixXd> partials(num_threads,
                                          Eigen::MatrixXd::Zero(vocab_size, vocab_size));
    size_t chunk = (documents.size() + num_threads - 1) / num_threads;
    
    std::vector<std::thread> threads;
    for (size_t t = 0; t < num_threads; ++t) {
        size_t begin = std::min(documents.size(), t * chunk);
        size_t end = std::min(documents.size(), begin + chunk);
        threads.emplace_back(&CooccurrenceCounter::CountDocuments, this,
                             std::cref(documents), begin, end, std::ref(partials[t]));
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    for (const auto& partial : partials) {
        counts += partial;
    }
    return counts;
}

void CooccurrenceCounter::CountDocuments(const std::vector<std::vector<int>>& documents,
                                         size_t begin, size_t end,
                                         Eigen::MatrixXd& counts) const {
    const int window = config_.window;
    
    for (size_t d = begin; d < end; ++d) {
        const auto& sentence = documents[d];
        const int length = static_cast<int>(sentence.size());
        
        for (int word_pos = 0; word_pos < length; ++word_pos) {
            int row = sentence[word_pos];
            
            // 窗口 [word_pos - window, word_pos + window]，截断到文档边界
            // 边界附近的词上下文更少，不做填充
            // 先截断偏移量再相加，window 接近 INT_MAX 时也不会溢出
            int first = word_pos - std::min(window, word_pos);
            int last = word_pos + std::min(window, length - 1 - word_pos);
            
            for (int context_pos = first; context_pos <= last; ++context_pos) {
                if (context_pos == word_pos) continue;  // 跳过中心词自己
                counts(row, sentence[context_pos]) += 1.0;
            }
        }
    }
}

CooccurrenceResult ComputeCooccurrenceMatrix(const Corpus& corpus, int window_size) {
    CooccurrenceCounter::Config config;
    config.window = window_size;
    CooccurrenceCounter counter(config);
    
    Vocabulary vocab = Vocabulary::FromCorpus(corpus);
    
    CooccurrenceResult result;
    result.matrix = counter.Count(corpus, vocab);
    result.word_to_index = vocab.WordToIndex();
    return result;
}

} // namespace count2vec
