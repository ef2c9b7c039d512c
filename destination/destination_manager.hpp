#pragma once
#include "../common/block_fingerprint.hpp"
#include "../common/block_operation.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/result.hpp"
#include "../common/sync_options.hpp"
#include <string>
#include <vector>

// File level entry points: fingerprint the file at destPath, or rebuild it
// from a stream of block operations using its current content as the cache.
class DestinationManager {
public:
    explicit DestinationManager(const std::string& destinationPath, const SyncOptions& options = {});

    // all fingerprints of the file, failing on the first error record
    Result<std::vector<BlockFingerprint>> getFileBlockHashes(const CancellationToken& token = {}) const;

    // Writes into destPath + ".sync.tmp" and replaces the file only when every
    // operation was applied. On failure the original file is untouched. The
    // operation channel is closed on return so that the producer can stop.
    Result<void> applyOperations(Channel<BlockOperation>& operations, const CancellationToken& token = {});

    std::string tempPath() const;

private:
    std::string destPath_;
    SyncOptions options_;
};
