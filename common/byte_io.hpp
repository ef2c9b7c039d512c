#pragma once
#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

enum class ReadStatus { Ok, Eof, Error };

struct ReadResult {
    size_t bytes;          // valid bytes placed in the buffer, also on Eof
    ReadStatus status;
    std::string message;   // only for Error

    static ReadResult Ok(size_t n) { return {n, ReadStatus::Ok, ""}; }
    static ReadResult Eof(size_t n) { return {n, ReadStatus::Eof, ""}; }
    static ReadResult Error(const std::string& msg) { return {0, ReadStatus::Error, msg}; }
};

// Sequential source. May return fewer bytes than asked for.
class ByteReader {
public:
    virtual ~ByteReader() = default;
    virtual ReadResult read(char* buffer, size_t length) = 0;
};

// Random access source, e.g. the previous version of a file.
class ByteReaderAt {
public:
    virtual ~ByteReaderAt() = default;
    virtual ReadResult readAt(char* buffer, size_t length, uint64_t offset) = 0;
};

// Sequential, append only sink.
class ByteWriter {
public:
    virtual ~ByteWriter() = default;
    virtual Result<void> write(const char* data, size_t length) = 0;
};

// Adapters over standard streams. They never close or own the stream.

class StreamReader : public ByteReader {
public:
    explicit StreamReader(std::istream& in) : in_(in) {}
    ReadResult read(char* buffer, size_t length) override;
private:
    std::istream& in_;
};

class StreamReaderAt : public ByteReaderAt {
public:
    explicit StreamReaderAt(std::istream& in) : in_(in) {}
    ReadResult readAt(char* buffer, size_t length, uint64_t offset) override;
private:
    std::istream& in_;
};

class StreamWriter : public ByteWriter {
public:
    explicit StreamWriter(std::ostream& out) : out_(out) {}
    Result<void> write(const char* data, size_t length) override;
private:
    std::ostream& out_;
};
