#pragma once
#include "result.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct BlockFingerprint {
    uint64_t index = 0;               // block number in source order
    uint32_t weakHash = 0;            // rolling checksum
    std::string strongHash;           // raw digest bytes
    std::optional<SyncError> error;   // set -> hashes are meaningless

    static BlockFingerprint makeBlock(uint64_t index, uint32_t weak, std::string strong) {
        BlockFingerprint f;
        f.index = index;
        f.weakHash = weak;
        f.strongHash = std::move(strong);
        return f;
    }

    static BlockFingerprint makeError(uint64_t index, SyncError err) {
        BlockFingerprint f;
        f.index = index;
        f.error = std::move(err);
        return f;
    }
};
