#include "block_applier.hpp"
#include "../common/log.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace {

Result<void> writeBlock(ByteWriter& destination, const char* data, size_t len) {
    Result<void> res = destination.write(data, len);
    if (!res.success) {
        return Result<void>::Error(res.error().wrap("failed writing block to destination"));
    }
    return Result<void>::Ok();
}

}

Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             const OperationSource& nextOperation,
                             const CancellationToken& token,
                             size_t blockSize) {
    if (blockSize == 0) {
        return Result<void>::Error(ErrorCode::InvalidInput, "block size must be greater than zero");
    }

    std::vector<char> buffer(blockSize);

    while (std::optional<BlockOperation> op = nextOperation()) {
        if (auto reason = token.reason()) {
            return Result<void>::Error(reason->wrap("failed applying block operations"));
        }

        if (op->error) {
            return Result<void>::Error(op->error->wrap("failed applying operation"));
        }

        if (!op->isReuse()) {
            Result<void> res = writeBlock(destination, op->data->data(), op->data->size());
            if (!res.success) return res;
            continue;
        }

        if (op->index > std::numeric_limits<uint64_t>::max() / blockSize) {
            return Result<void>::Error(ErrorCode::InvalidInput,
                                       "block index " + std::to_string(op->index) + " is out of range");
        }
        uint64_t offset = op->index * blockSize;

        ReadResult r = cache.readAt(buffer.data(), blockSize, offset);
        if (r.status == ReadStatus::Error) {
            return Result<void>::Error(SyncError(ErrorCode::Io, r.message).wrap("failed reading cached block"));
        }
        if (r.status == ReadStatus::Eof) {
            Log::warn("Apply", "short read of cached block " + std::to_string(op->index) + ": " +
                               std::to_string(r.bytes) + " of " + std::to_string(blockSize) + " bytes");
        }

        Result<void> res = writeBlock(destination, buffer.data(), r.bytes);
        if (!res.success) return res;
    }

    return Result<void>::Ok();
}

Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             Channel<BlockOperation>& operations,
                             const CancellationToken& token,
                             size_t blockSize) {
    return applyOperations(destination, cache,
                           [&operations]() { return operations.receive(); },
                           token, blockSize);
}

Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             const std::vector<BlockOperation>& operations,
                             const CancellationToken& token,
                             size_t blockSize) {
    size_t next = 0;
    return applyOperations(destination, cache,
                           [&operations, &next]() -> std::optional<BlockOperation> {
                               if (next >= operations.size()) return std::nullopt;
                               return operations[next++];
                           },
                           token, blockSize);
}
