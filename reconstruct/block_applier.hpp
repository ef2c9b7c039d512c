#pragma once
#include "../common/block_operation.hpp"
#include "../common/byte_io.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/config.hpp"
#include "../common/result.hpp"
#include <functional>
#include <optional>
#include <vector>

using OperationSource = std::function<std::optional<BlockOperation>()>;

// Rebuilds content by writing one block per operation to `destination`, in
// the order the operations arrive. A non-empty literal is written as is; any
// other block is read from `cache` at index * blockSize (fewer bytes at the end of
// the cache). Stops at the first faulty operation, cache or write failure, or
// when the token fires.
//
// Remaining operations are not drained on failure. The producer must be able
// to notice that nobody is receiving anymore (close the channel, or watch the
// same token), otherwise it blocks forever on its next send.
//
// The destination, cache and operation channel stay owned by the caller.
Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             const OperationSource& nextOperation,
                             const CancellationToken& token,
                             size_t blockSize = Config::BLOCK_SIZE);

Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             Channel<BlockOperation>& operations,
                             const CancellationToken& token,
                             size_t blockSize = Config::BLOCK_SIZE);

Result<void> applyOperations(ByteWriter& destination,
                             ByteReaderAt& cache,
                             const std::vector<BlockOperation>& operations,
                             const CancellationToken& token,
                             size_t blockSize = Config::BLOCK_SIZE);
