#include "destination_manager.hpp"
#include "../checksum/checksum_generator.hpp"
#include "../common/byte_io.hpp"
#include "../common/log.hpp"
#include "../reconstruct/block_applier.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

DestinationManager::DestinationManager(const std::string& destinationPath, const SyncOptions& options)
    : destPath_(destinationPath), options_(options) {}

std::string DestinationManager::tempPath() const {
    return destPath_ + ".sync.tmp";
}

Result<std::vector<BlockFingerprint>> DestinationManager::getFileBlockHashes(const CancellationToken& token) const {
    using HashesResult = Result<std::vector<BlockFingerprint>>;

    std::ifstream file(destPath_, std::ios::binary);
    if (!file) {
        Log::error("Destination", "error opening destination file: " + destPath_);
        return HashesResult::Error(ErrorCode::Io, "failed to open file: " + destPath_);
    }

    StreamReader reader(file);
    auto started = generateChecksums(&reader, token, options_);
    if (!started.success) {
        return HashesResult::Error(started.error());
    }

    std::vector<BlockFingerprint> blocks;
    while (auto fingerprint = started.data->next()) {
        if (fingerprint->error) {
            // ChecksumStream's destructor releases the generator
            return HashesResult::Error(fingerprint->error->wrap("block " + std::to_string(fingerprint->index)));
        }
        blocks.push_back(std::move(*fingerprint));
    }

    return HashesResult::Ok(std::move(blocks));
}

Result<void> DestinationManager::applyOperations(Channel<BlockOperation>& operations, const CancellationToken& token) {
    std::ifstream oldFile(destPath_, std::ios::binary);
    std::istringstream empty;
    std::istream& cacheStream = oldFile.is_open() ? static_cast<std::istream&>(oldFile) : empty;
    if (!oldFile.is_open()) {
        // only a file that is really absent may stand in as an empty cache
        std::error_code ec;
        bool exists = std::filesystem::exists(destPath_, ec);
        if (ec || exists) {
            operations.close();
            Log::error("Destination", "error opening destination file: " + destPath_);
            return Result<void>::Error(ErrorCode::Io, "failed to open file: " + destPath_);
        }
        Log::info("Destination", destPath_ + " does not exist yet, rebuilding from literal blocks only");
    }

    std::string tempFilePath = tempPath();
    std::ofstream tempFile(tempFilePath, std::ios::binary | std::ios::trunc);
    if (!tempFile.is_open()) {
        operations.close();
        return Result<void>::Error(ErrorCode::Io, "failed to open temporary file: " + tempFilePath);
    }

    StreamReaderAt cache(cacheStream);
    StreamWriter writer(tempFile);
    Result<void> res = ::applyOperations(writer, cache, operations, token, options_.blockSize);
    operations.close();

    tempFile.close();
    if (res.success && tempFile.fail()) {
        res = Result<void>::Error(ErrorCode::Io, "failed to flush temporary file: " + tempFilePath);
    }
    oldFile.close();

    if (!res.success) {
        std::remove(tempFilePath.c_str());
        Log::error("Destination", "rebuild of " + destPath_ + " failed: " + res.message);
        return res;
    }

    if (std::rename(tempFilePath.c_str(), destPath_.c_str()) != 0) {
        std::remove(tempFilePath.c_str());
        return Result<void>::Error(ErrorCode::Io, "failed to replace " + destPath_);
    }

    Log::info("Destination", "rebuilt " + destPath_);
    return Result<void>::Ok();
}
