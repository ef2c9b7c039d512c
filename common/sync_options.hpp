#pragma once
#include "config.hpp"
#include "strong_hasher.hpp"
#include <cstddef>
#include <string>

enum class StrongHashMode {
    Digest,        // digest of the block bytes alone
    LegacyAppend   // block bytes followed by the digest of empty input, as old indexes were built
};

// Per session settings. Checksum generation and apply must run with the same
// blockSize or cache offsets will not line up.
struct SyncOptions {
    size_t blockSize = Config::BLOCK_SIZE;
    std::string hashAlgorithm = Config::DEFAULT_HASH;   // OpenSSL digest name
    StrongHasherFactory hasherFactory;                  // wins over hashAlgorithm when set
    StrongHashMode strongHashMode = StrongHashMode::Digest;
};
