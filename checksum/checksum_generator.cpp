#include "checksum_generator.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include <exception>
#include <string>
#include <system_error>
#include <vector>

namespace {

// closes the channel on every way out of the generator
struct ChannelCloser {
    Channel<BlockFingerprint>& channel;
    ~ChannelCloser() { channel.close(); }
};

// Fill `buffer` with up to `length` bytes. Bytes of a partially filled block
// are dropped when the source fails half way.
ReadResult readBlock(ByteReader& source, char* buffer, size_t length) {
    size_t filled = 0;
    while (filled < length) {
        ReadResult r = source.read(buffer + filled, length - filled);
        if (r.status == ReadStatus::Error) return r;

        filled += r.bytes;
        if (r.status == ReadStatus::Eof) return ReadResult::Eof(filled);
        if (r.bytes == 0) return ReadResult::Error("source returned no data without reaching the end");
    }
    return ReadResult::Ok(filled);
}

std::string strongChecksum(StrongHasher& hasher, StrongHashMode mode, const char* block, size_t len) {
    hasher.reset();
    if (mode == StrongHashMode::LegacyAppend) {
        // the block itself followed by the digest of nothing
        return std::string(block, len) + hasher.digest();
    }
    hasher.update(block, len);
    return hasher.digest();
}

void runGenerator(ByteReader* source,
                  CancellationToken token,
                  std::unique_ptr<StrongHasher> hasher,
                  StrongHashMode mode,
                  size_t blockSize,
                  std::shared_ptr<Channel<BlockFingerprint>> out) {
    ChannelCloser closer{*out};
    uint64_t index = 0;

    try {
        std::vector<char> buffer(blockSize);

        while (true) {
            if (auto reason = token.reason()) {
                out->send(BlockFingerprint::makeError(index, *reason));
                return;
            }

            ReadResult r = readBlock(*source, buffer.data(), blockSize);
            if (r.status == ReadStatus::Error) {
                SyncError err = SyncError(ErrorCode::Io, r.message).wrap("failed reading block");
                if (!out->send(BlockFingerprint::makeError(index, err))) return;
                ++index;
                // the consumer decides whether a bad block is fatal
                continue;
            }
            if (r.bytes == 0) break;

            uint32_t weak = HashUtils::computeWeakHash(buffer.data(), r.bytes);
            std::string strong = strongChecksum(*hasher, mode, buffer.data(), r.bytes);
            if (!out->send(BlockFingerprint::makeBlock(index, weak, std::move(strong)))) return;
            ++index;

            if (r.status == ReadStatus::Eof) break;
        }
    } catch (const std::exception& e) {
        Log::error("Checksums", "generator stopped at block " + std::to_string(index) + ": " + e.what());
        out->send(BlockFingerprint::makeError(
            index, SyncError(ErrorCode::Internal, std::string("checksum generation failed: ") + e.what())));
    }
}

}

ChecksumStream::ChecksumStream(ConstructKey, std::shared_ptr<Channel<BlockFingerprint>> channel)
    : channel_(std::move(channel)) {}

ChecksumStream::~ChecksumStream() {
    close();
    if (worker_.joinable()) worker_.join();
}

std::optional<BlockFingerprint> ChecksumStream::next() {
    return channel_->receive();
}

void ChecksumStream::close() {
    channel_->close();
}

Result<std::unique_ptr<ChecksumStream>> generateChecksums(ByteReader* source,
                                                          CancellationToken token,
                                                          const SyncOptions& options) {
    using StreamResult = Result<std::unique_ptr<ChecksumStream>>;

    auto channel = std::make_shared<Channel<BlockFingerprint>>();
    auto stream = std::make_unique<ChecksumStream>(ChecksumStream::ConstructKey{}, channel);
    auto fail = [&channel, &stream](const SyncError& err) {
        channel->close();
        return StreamResult::Error(err, std::move(stream));
    };

    if (source == nullptr) {
        return fail(SyncError(ErrorCode::InvalidInput, "reader required"));
    }
    if (options.blockSize == 0) {
        return fail(SyncError(ErrorCode::InvalidInput, "block size must be greater than zero"));
    }
    if (!options.hasherFactory && !EvpHasher::isSupported(options.hashAlgorithm)) {
        return fail(SyncError(ErrorCode::InvalidInput, "unknown digest algorithm: " + options.hashAlgorithm));
    }

    std::unique_ptr<StrongHasher> hasher;
    try {
        if (options.hasherFactory) {
            hasher = options.hasherFactory();
        } else {
            hasher = std::make_unique<EvpHasher>(options.hashAlgorithm);
        }
    } catch (const std::exception& e) {
        return fail(SyncError(ErrorCode::Internal, std::string("failed to create hasher: ") + e.what()));
    }
    if (!hasher) {
        return fail(SyncError(ErrorCode::InvalidInput, "hasher factory returned no hasher"));
    }

    try {
        stream->worker_ = std::thread(runGenerator, source, std::move(token), std::move(hasher),
                                      options.strongHashMode, options.blockSize, channel);
    } catch (const std::system_error& e) {
        return fail(SyncError(ErrorCode::Internal, std::string("failed to start generator thread: ") + e.what()));
    }
    return StreamResult::Ok(std::move(stream));
}
