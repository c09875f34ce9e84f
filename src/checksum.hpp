// src/checksum.hpp
// Streaming MD5 and base64 decoding on OpenSSL EVP.

#pragma once

#include "tether/error.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace tether {

// Incremental MD5. hex_digest() finalizes a copy, so update() may continue
// afterwards.
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;
    Md5(Md5&& other) noexcept;
    Md5& operator=(Md5&& other) noexcept;

    void update(const uint8_t* data, size_t len);
    void update(const std::string& data) {
        update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    // Lowercase hex, 32 characters.
    std::string hex_digest() const;

private:
    evp_md_ctx_st* ctx_ = nullptr;
};

// Decode standard base64 (with or without padding; whitespace is skipped).
// Throws TetherError (MalformedMessage) on invalid input.
std::vector<uint8_t> base64_decode(const std::string& text);

// Case-insensitive comparison of two hex digests.
bool digest_equals(const std::string& a, const std::string& b);

} // namespace tether
