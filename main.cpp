#include "checksum/checksum_generator.hpp"
#include "common/byte_io.hpp"
#include "common/hash_utils.hpp"
#include "common/sync_options.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void printHelp() {
    std::cout << "Usage:\n"
              << " blocksync checksums <file> [options]   Print index, weak and strong checksum per block\n"
              << " blocksync help                         Show this help\n"
              << "\nOptions:\n"
              << " --block-size <bytes>   Block size (default " << Config::BLOCK_SIZE << ")\n"
              << " --hash <name>          OpenSSL digest name (default " << Config::DEFAULT_HASH << ")\n"
              << " --legacy               Strong checksum as block bytes + digest of empty input\n";
}

bool parseOptions(int argc, char** argv, int first, SyncOptions& options) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--legacy") {
            options.strongHashMode = StrongHashMode::LegacyAppend;
        } else if (arg == "--hash" && i + 1 < argc) {
            options.hashAlgorithm = argv[++i];
        } else if (arg == "--block-size" && i + 1 < argc) {
            char* end = nullptr;
            unsigned long long size = std::strtoull(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || size == 0) {
                std::cerr << "Invalid block size: " << argv[i] << "\n";
                return false;
            }
            options.blockSize = static_cast<size_t>(size);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

int runChecksums(const std::string& path, const SyncOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error opening file: " << path << "\n";
        return 1;
    }

    StreamReader reader(file);
    auto started = generateChecksums(&reader, CancellationToken(), options);
    if (!started.success) {
        std::cerr << "Failed to start checksum generation: " << started.message << "\n";
        return 1;
    }

    while (auto fingerprint = started.data->next()) {
        if (fingerprint->error) {
            std::cerr << "Block " << fingerprint->index << ": " << fingerprint->error->message << "\n";
            return 1;
        }
        std::cout << fingerprint->index << " "
                  << std::hex << fingerprint->weakHash << std::dec << " "
                  << HashUtils::toHex(fingerprint->strongHash) << "\n";
    }
    return 0;
}

}

int main(int argc, char** argv) {

    if (argc < 2) {
        std::cerr << "Insufficient arguments\n";
        printHelp();
        return 1;
    }

    std::string mode = argv[1];
    if (mode == "help" || mode == "--help") {
        printHelp();
        return 0;
    }

    if (mode == "checksums") {
        if (argc < 3) {
            std::cerr << "Usage: blocksync checksums <file> [options]\n";
            return 1;
        }
        SyncOptions options;
        if (!parseOptions(argc, argv, 3, options)) return 1;
        return runChecksums(argv[2], options);
    }

    std::cerr << "Unknown command. Run 'blocksync help' for available commands.\n";
    return 1;
}
