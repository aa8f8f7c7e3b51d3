//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_UTIL_RSA_HPP
#define CMDCHAT_COMMON_INCLUDE_UTIL_RSA_HPP

#include <boost/core/span.hpp>

#include <memory>
#include <openssl/evp.h>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

// RSA primitives used by the key exchange. The symmetric key is transported
// with RSA-OAEP, using SHA-256 for both the hash and MGF1, and an empty label.

namespace cmdchat {

inline constexpr unsigned default_rsa_key_bits = 2048u;

// An RSA private key, with its public half
class rsa_keypair
{
    struct pkey_deleter
    {
        void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
    };
    std::unique_ptr<EVP_PKEY, pkey_deleter> key_;

    explicit rsa_keypair(EVP_PKEY* key) noexcept : key_(key) {}

public:
    // Generates a new keypair, with public exponent 65537
    static result<rsa_keypair> generate(unsigned bits = default_rsa_key_bits);

    // Serializes the public key as a PEM SubjectPublicKeyInfo
    result<std::string> public_key_pem() const;

    // Decrypts an OAEP-encrypted payload
    result<std::vector<unsigned char>> decrypt(boost::span<const unsigned char> ciphertext) const;
};

// Encrypts plaintext with OAEP using the given PEM public key. Returns
// errc::invalid_public_key if the key can't be loaded or is not an RSA key.
result<std::vector<unsigned char>> rsa_encrypt(
    std::string_view public_key_pem,
    boost::span<const unsigned char> plaintext
);

}  // namespace cmdchat

#endif
