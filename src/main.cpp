#include <iostream>
#include <string>
#include <getopt.h>
#include "count2vec.hpp"

void PrintUsage(const char* prog_name) {
    std::cout << "count2vec - co-occurrence + truncated SVD word vectors\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " -t <file> -o <file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -t, --train <file>      语料文件路径，每行一篇文档 (必需)\n";
    std::cout << "  -o, --output <file>     输出向量文件路径 (必需)\n";
    std::cout << "  -v, --vocab <file>      保存词汇表 (可选)\n";
    std::cout << "  -s, --size <int>        向量维度 k (默认: 2)\n";
    std::cout << "  -w, --window <int>      窗口半径 (默认: 4)\n";
    std::cout << "  -i, --iter <int>        SVD 幂迭代次数 (默认: 10)\n";
    std::cout << "  -r, --seed <int>        随机种子 (默认: 4355)\n";
    std::cout << "  -p, --threads <int>     计数线程数 (默认: 1)\n";
    std::cout << "  -m, --markers <0|1>     文档首尾加 START/END (默认: 1)\n";
    std::cout << "  -x, --exact <0|1>       使用完整 SVD (默认: 0)\n";
    std::cout << "  -b, --binary <0|1>      二进制格式保存 (默认: 0)\n";
    std::cout << "  -h, --help              显示帮助信息\n";
}

int main(int argc, char** argv) {
    count2vec::EmbeddingBuilder::Config config;
    
    static struct option long_options[] = {
        {"train",   required_argument, 0, 't'},
        {"output",  required_argument, 0, 'o'},
        {"vocab",   required_argument, 0, 'v'},
        {"size",    required_argument, 0, 's'},
        {"window",  required_argument, 0, 'w'},
        {"iter",    required_argument, 0, 'i'},
        {"seed",    required_argument, 0, 'r'},
        {"threads", required_argument, 0, 'p'},
        {"markers", required_argument, 0, 'm'},
        {"exact",   required_argument, 0, 'x'},
        {"binary",  required_argument, 0, 'b'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };
    
    int opt;
    int option_index = 0;
    
    try {
        while ((opt = getopt_long(argc, argv, "t:o:v:s:w:i:r:p:m:x:b:h",
                                  long_options, &option_index)) != -1) {
            switch (opt) {
                case 't':
                    config.corpus_file = optarg;
                    break;
                case 'o':
                    config.output_file = optarg;
                    break;
                case 'v':
                    config.vocab_file = optarg;
                    break;
                case 's':
                    config.dimensions = std::stoi(optarg);
                    break;
                case 'w':
                    config.window = std::stoi(optarg);
                    break;
                case 'i':
                    config.iterations = std::stoi(optarg);
                    break;
                case 'r':
                    config.seed = count2vec::ParseSeed(optarg);
                    break;
                case 'p':
                    config.num_threads = std::stoi(optarg);
                    break;
                case 'm':
                    config.add_boundary_markers = (std::stoi(optarg) != 0);
                    break;
                case 'x':
                    config.exact = (std::stoi(optarg) != 0);
                    break;
                case 'b':
                    config.binary = (std::stoi(optarg) != 0);
                    break;
                case 'h':
                default:
                    PrintUsage(argv[0]);
                    return (opt == 'h') ? 0 : 1;
            }
        }
    } catch (const std::exception& e) {
        // std::stoi / ParseSeed 解析失败
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }
    
    // 验证必需参数
    if (config.corpus_file.empty() || config.output_file.empty()) {
        std::cerr << "Error: -train and -output are required\n";
        PrintUsage(argv[0]);
        return 1;
    }
    
    try {
        count2vec::EmbeddingBuilder builder(config);
        builder.Build();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    return 0;
}
