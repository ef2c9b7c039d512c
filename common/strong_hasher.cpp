#include "strong_hasher.hpp"
#include "config.hpp"
#include <openssl/evp.h>
#include <stdexcept>

EvpHasher::EvpHasher(const std::string& algorithm)
    : algorithm_(algorithm), md_(EVP_get_digestbyname(algorithm.c_str())), ctx_(nullptr) {
    if (md_ == nullptr) {
        throw std::runtime_error("unknown digest algorithm: " + algorithm);
    }
    ctx_ = EVP_MD_CTX_new();
    if (ctx_ == nullptr) {
        throw std::runtime_error("failed to allocate digest context");
    }
    reset();
}

EvpHasher::~EvpHasher() {
    EVP_MD_CTX_free(ctx_);
}

void EvpHasher::reset() {
    if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) {
        throw std::runtime_error("failed to initialise " + algorithm_ + " digest");
    }
}

void EvpHasher::update(const char* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("failed to update " + algorithm_ + " digest");
    }
}

std::string EvpHasher::digest() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, out, &outLen) != 1) {
        throw std::runtime_error("failed to finalise " + algorithm_ + " digest");
    }
    return std::string(reinterpret_cast<const char*>(out), outLen);
}

size_t EvpHasher::size() const {
    return static_cast<size_t>(EVP_MD_size(md_));
}

std::string EvpHasher::name() const {
    return algorithm_;
}

bool EvpHasher::isSupported(const std::string& algorithm) {
    return EVP_get_digestbyname(algorithm.c_str()) != nullptr;
}

std::unique_ptr<StrongHasher> makeDefaultHasher() {
    return std::make_unique<EvpHasher>(Config::DEFAULT_HASH);
}
