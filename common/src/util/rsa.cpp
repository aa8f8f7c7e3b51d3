//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/rsa.hpp"

#include <boost/core/span.hpp>

#include <memory>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

using namespace cmdchat;

namespace {

struct pkey_ctx_deleter
{
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;

struct pkey_deleter
{
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};
using pkey_ptr = std::unique_ptr<EVP_PKEY, pkey_deleter>;

struct bio_deleter
{
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
using bio_ptr = std::unique_ptr<BIO, bio_deleter>;

struct bn_deleter
{
    void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
};
using bn_ptr = std::unique_ptr<BIGNUM, bn_deleter>;

}  // namespace

// Sets OAEP with SHA-256 for both the digest and MGF1. The label is left empty
static bool setup_oaep(EVP_PKEY_CTX* ctx) noexcept
{
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
           EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
           EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}

result<rsa_keypair> rsa_keypair::generate(unsigned bits)
{
    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr)};
    if (!ctx)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    bn_ptr exponent{BN_new()};
    if (!exponent || BN_set_word(exponent.get(), RSA_F4) != 1)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), exponent.get()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &key) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    return rsa_keypair(key);
}

result<std::string> rsa_keypair::public_key_pem() const
{
    bio_ptr bio{BIO_new(BIO_s_mem())};
    if (!bio)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    char* data = nullptr;
    long size = BIO_get_mem_data(bio.get(), &data);
    if (size <= 0 || data == nullptr)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    return std::string(data, static_cast<std::size_t>(size));
}

result<std::vector<unsigned char>> rsa_keypair::decrypt(boost::span<const unsigned char> ciphertext) const
{
    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new(key_.get(), nullptr)};
    if (!ctx)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !setup_oaep(ctx.get()))
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    // Get the maximum output size
    std::size_t out_size = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_size, ciphertext.data(), ciphertext.size()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    // Decrypt
    std::vector<unsigned char> res(out_size);
    if (EVP_PKEY_decrypt(ctx.get(), res.data(), &out_size, ciphertext.data(), ciphertext.size()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    res.resize(out_size);
    return res;
}

result<std::vector<unsigned char>> cmdchat::rsa_encrypt(
    std::string_view public_key_pem,
    boost::span<const unsigned char> plaintext
)
{
    // Load the key
    bio_ptr bio{BIO_new_mem_buf(public_key_pem.data(), static_cast<int>(public_key_pem.size()))};
    if (!bio)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    pkey_ptr key{PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)};
    if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA)
    {
        // Don't leave the PEM decoding errors in the thread's error queue
        ERR_clear_error();
        CMDCHAT_RETURN_ERROR(errc::invalid_public_key)
    }

    // Setup the encryption context
    pkey_ctx_ptr ctx{EVP_PKEY_CTX_new(key.get(), nullptr)};
    if (!ctx)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !setup_oaep(ctx.get()))
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    // Encrypt
    std::size_t out_size = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_size, plaintext.data(), plaintext.size()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    std::vector<unsigned char> res(out_size);
    if (EVP_PKEY_encrypt(ctx.get(), res.data(), &out_size, plaintext.data(), plaintext.size()) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    res.resize(out_size);
    return res;
}
