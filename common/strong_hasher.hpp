#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

struct evp_md_ctx_st;
struct evp_md_st;

// Cryptographic digest fed block by block. reset() must be called before a
// new block is hashed.
class StrongHasher {
public:
    virtual ~StrongHasher() = default;

    virtual void reset() = 0;
    virtual void update(const char* data, size_t len) = 0;
    virtual std::string digest() = 0;   // raw bytes, finalizes the current state
    virtual size_t size() const = 0;    // digest length in bytes
    virtual std::string name() const = 0;
};

using StrongHasherFactory = std::function<std::unique_ptr<StrongHasher>()>;

// Any digest OpenSSL knows by name (md5, sha1, sha256, ...).
// Throws std::runtime_error when libcrypto reports a failure.
class EvpHasher : public StrongHasher {
public:
    explicit EvpHasher(const std::string& algorithm);
    ~EvpHasher() override;

    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;

    void reset() override;
    void update(const char* data, size_t len) override;
    std::string digest() override;
    size_t size() const override;
    std::string name() const override;

    static bool isSupported(const std::string& algorithm);

private:
    std::string algorithm_;
    const evp_md_st* md_;
    evp_md_ctx_st* ctx_;
};

std::unique_ptr<StrongHasher> makeDefaultHasher();
