#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "embeddings.hpp"
#include "errors.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: distance <vector_file> [binary 0|1]\n";
        return 1;
    }
    
    std::string vector_file = argv[1];
    bool binary = argc > 2 && std::string(argv[2]) != "0";
    std::cout << "Loading vectors from " << vector_file << "...\n";
    
    count2vec::WordEmbeddings embeddings;
    try {
        embeddings = count2vec::WordEmbeddings::Load(vector_file, binary);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    std::cout << "Vocabulary size: " << embeddings.Size()
              << ", Vector size: " << embeddings.Dimensions() << "\n";
    std::cout << "Vectors loaded successfully!\n\n";
    std::cout << "Enter word or sentence (EXIT to break): ";
    
    std::string input;
    while (std::getline(std::cin, input)) {
        if (input == "EXIT") break;
        if (input.empty()) {
            std::cout << "\nEnter word or sentence (EXIT to break): ";
            continue;
        }
        
        std::istringstream iss(input);
        std::vector<std::string> words;
        std::string word;
        while (iss >> word) {
            words.push_back(word);
        }
        
        // 多个词则对单位向量求平均
        Eigen::VectorXd query = Eigen::VectorXd::Zero(embeddings.Dimensions());
        int found_count = 0;
        for (const auto& w : words) {
            try {
                Eigen::VectorXd vec = embeddings.Vector(w);
                double norm = vec.norm();
                if (norm > 0.0) {
                    query += vec / norm;
                }
                found_count++;
            } catch (const count2vec::LookupError& e) {
                std::cout << "Word \"" << e.Word() << "\" not found in vocabulary\n";
            }
        }
        
        if (found_count == 0) {
            std::cout << "\nEnter word or sentence (EXIT to break): ";
            continue;
        }
        query /= found_count;
        
        auto results = embeddings.NearestNeighbors(query, 40, words);
        
        std::cout << "\n                                              Word       Cosine distance\n";
        std::cout << "------------------------------------------------------------------------\n";
        for (const auto& r : results) {
            printf("%50s\t\t%f\n", r.first.c_str(), r.second);
        }
        
        std::cout << "\nEnter word or sentence (EXIT to break): ";
    }
    
    return 0;
}
