#include "byte_io.hpp"

ReadResult StreamReader::read(char* buffer, size_t length) {
    if (length == 0) return ReadResult::Ok(0);

    in_.read(buffer, static_cast<std::streamsize>(length));
    size_t n = static_cast<size_t>(in_.gcount());

    if (in_.bad()) {
        return ReadResult::Error("stream read failed");
    }
    if (n < length) {
        if (in_.eof()) return ReadResult::Eof(n);
        return ReadResult::Error("stream read stopped early");
    }
    return ReadResult::Ok(n);
}

ReadResult StreamReaderAt::readAt(char* buffer, size_t length, uint64_t offset) {
    in_.clear();
    in_.seekg(0, std::ios::end);
    std::streamoff end = in_.tellg();
    if (in_.fail() || end < 0) {
        return ReadResult::Error("failed to determine cache size");
    }

    uint64_t size = static_cast<uint64_t>(end);
    if (offset >= size) {
        return ReadResult::Eof(0);
    }

    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (in_.fail()) {
        return ReadResult::Error("failed to seek to offset " + std::to_string(offset));
    }

    in_.read(buffer, static_cast<std::streamsize>(length));
    size_t n = static_cast<size_t>(in_.gcount());
    if (in_.bad()) {
        return ReadResult::Error("stream read failed at offset " + std::to_string(offset));
    }
    if (n < length) {
        in_.clear();  // eof is expected here, keep the stream usable for the next block
        return ReadResult::Eof(n);
    }
    return ReadResult::Ok(n);
}

Result<void> StreamWriter::write(const char* data, size_t length) {
    if (length == 0) return Result<void>::Ok();

    out_.write(data, static_cast<std::streamsize>(length));
    if (!out_) {
        return Result<void>::Error(ErrorCode::Io, "stream write failed");
    }
    return Result<void>::Ok();
}
