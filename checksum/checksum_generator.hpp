#pragma once
#include "../common/block_fingerprint.hpp"
#include "../common/byte_io.hpp"
#include "../common/cancellation.hpp"
#include "../common/channel.hpp"
#include "../common/result.hpp"
#include "../common/sync_options.hpp"
#include <memory>
#include <optional>
#include <thread>

class ChecksumStream;

// Starts reading `source` block by block on a background thread and returns
// immediately. Each block yields one fingerprint; a failed read yields a
// fingerprint carrying the error and generation carries on with the next
// block. When the token fires, one final fingerprint carrying the
// cancellation error is emitted and the stream ends.
//
// On invalid arguments the result is an error, and its data is a stream that
// is already closed. `source` is not owned and must outlive the stream.
Result<std::unique_ptr<ChecksumStream>> generateChecksums(ByteReader* source,
                                                          CancellationToken token,
                                                          const SyncOptions& options = {});

// Receiving end of a running checksum generator. Fingerprints arrive in
// block order; next() returns std::nullopt once the generator has finished.
class ChecksumStream {
    struct ConstructKey {};

public:
    // built by generateChecksums only
    ChecksumStream(ConstructKey, std::shared_ptr<Channel<BlockFingerprint>> channel);
    ~ChecksumStream();   // closes the channel and waits for the generator thread

    ChecksumStream(const ChecksumStream&) = delete;
    ChecksumStream& operator=(const ChecksumStream&) = delete;

    std::optional<BlockFingerprint> next();

    // stop consuming. A generator blocked on a send is released and exits
    // without reading further blocks.
    void close();

private:
    friend Result<std::unique_ptr<ChecksumStream>> generateChecksums(ByteReader* source,
                                                                     CancellationToken token,
                                                                     const SyncOptions& options);

    std::shared_ptr<Channel<BlockFingerprint>> channel_;
    std::thread worker_;
};
