#pragma once
#include "result.hpp"
#include <cstdint>
#include <optional>
#include <vector>

// Either literal bytes for a changed block, or a reference to the block at
// `index` in the cache. Empty literal data counts as a reference.
struct BlockOperation {
    uint64_t index = 0;                      // used for the cache offset when data is absent
    std::optional<std::vector<char>> data;   // literal block, shipped in full
    std::optional<SyncError> error;

    bool isReuse() const {
        return !data.has_value() || data->empty();
    }

    static BlockOperation makeReuse(uint64_t index) {
        BlockOperation op;
        op.index = index;
        return op;
    }

    static BlockOperation makeLiteral(uint64_t index, std::vector<char> data) {
        BlockOperation op;
        op.index = index;
        op.data = std::move(data);
        return op;
    }

    static BlockOperation makeError(uint64_t index, SyncError err) {
        BlockOperation op;
        op.index = index;
        op.error = std::move(err);
        return op;
    }
};
