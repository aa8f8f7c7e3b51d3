//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_UTIL_FERNET_HPP
#define CMDCHAT_COMMON_INCLUDE_UTIL_FERNET_HPP

#include <boost/core/span.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

// Authenticated symmetric encryption using Fernet tokens
// (https://github.com/fernet/spec/blob/master/Spec.md).
// A token embeds its creation time, so receivers can reject old tokens.
// Token layout (before URL-safe base64 encoding):
//   version (1 byte, 0x80) | timestamp (8 bytes, big endian seconds) |
//   IV (16 bytes) | AES-128-CBC ciphertext (PKCS7) | HMAC-SHA256 (32 bytes)

namespace cmdchat {

inline constexpr std::size_t fernet_raw_key_size = 32;
inline constexpr std::size_t fernet_encoded_key_size = 44;

// The size of a serialized token carrying plaintext_size bytes
constexpr std::size_t fernet_token_size(std::size_t plaintext_size) noexcept
{
    std::size_t raw_size = 1u + 8u + 16u + (plaintext_size / 16u + 1u) * 16u + 32u;
    return 4u * ((raw_size + 2u) / 3u);
}

class fernet
{
    std::array<unsigned char, 16> signing_key_;
    std::array<unsigned char, 16> encryption_key_;

    std::string encrypt_impl(
        std::string_view plaintext,
        std::uint64_t timestamp,
        boost::span<const unsigned char, 16> iv
    ) const;

public:
    // Tokens created more than this in the future are rejected
    static constexpr std::chrono::seconds max_clock_skew{60};

    // Constructs the object from the raw key bytes
    explicit fernet(boost::span<const unsigned char, fernet_raw_key_size> raw_key) noexcept;

    fernet(const fernet&) noexcept = default;
    fernet& operator=(const fernet&) noexcept = default;

    // Key material is cleansed from memory
    ~fernet();

    // Generates a fresh key using the CSPRNG, in its URL-safe base64 form
    static std::string generate_key();

    // Parses a URL-safe base64 key, as returned by generate_key()
    static result<fernet> from_key(std::string_view encoded_key);

    // Encrypts plaintext, returning the token
    result<std::string> encrypt(
        std::string_view plaintext,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    ) const;

    // Verifies and decrypts a token. Tokens older than max_age are rejected
    // with errc::token_expired. A max_age of zero disables the check.
    result<std::string> decrypt(
        std::string_view token,
        std::chrono::seconds max_age,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
    ) const;
};

}  // namespace cmdchat

#endif
