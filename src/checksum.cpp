// src/checksum.cpp
// Streaming MD5 and base64 decoding.

#include "checksum.hpp"

#include <cctype>
#include <memory>

#include <openssl/evp.h>

namespace tether {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw TetherError::io("unable to initialise MD5 context");
    }
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

Md5::Md5(Md5&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Md5& Md5::operator=(Md5&& other) noexcept {
    if (this != &other) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Md5::update(const uint8_t* data, size_t len) {
    if (len == 0) return;
    if (!ctx_ || EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw TetherError::io("MD5 update failed");
    }
}

std::string Md5::hex_digest() const {
    MdCtxPtr copy(EVP_MD_CTX_new());
    if (!ctx_ || !copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_) != 1) {
        throw TetherError::io("MD5 digest failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(copy.get(), digest, &digest_len) != 1) {
        throw TetherError::io("MD5 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; i++) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size() + 3);
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean.push_back(c);
    }

    if (clean.size() % 4 == 1) {
        throw TetherError::malformed_message("invalid base64 length");
    }
    while (clean.size() % 4 != 0) {
        clean.push_back('=');
    }
    if (clean.empty()) return {};

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;

    // '=' is only valid as trailing padding.
    for (size_t i = 0; i + padding < clean.size(); i++) {
        if (clean[i] == '=') {
            throw TetherError::malformed_message("invalid base64 padding");
        }
    }

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) {
        throw TetherError::malformed_message("invalid base64 data");
    }
    // EVP_DecodeBlock counts the padding as zero bytes.
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

bool digest_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace tether
