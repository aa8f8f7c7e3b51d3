//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/fernet.hpp"

#include <boost/core/span.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "error.hpp"
#include "util/base64.hpp"

using namespace cmdchat;

static constexpr unsigned char token_version = 0x80;
static constexpr std::size_t version_size = 1;
static constexpr std::size_t timestamp_size = 8;
static constexpr std::size_t iv_size = 16;
static constexpr std::size_t block_size = 16;
static constexpr std::size_t hmac_size = 32;
static constexpr std::size_t header_size = version_size + timestamp_size + iv_size;

namespace {

struct cipher_ctx_deleter
{
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

}  // namespace

static std::uint64_t to_unix_seconds(std::chrono::system_clock::time_point tp) noexcept
{
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return secs < 0 ? 0u : static_cast<std::uint64_t>(secs);
}

static std::array<unsigned char, hmac_size> compute_hmac(
    boost::span<const unsigned char> key,
    boost::span<const unsigned char> data
)
{
    std::array<unsigned char, hmac_size> res{};
    unsigned int res_size = 0;
    auto* ok = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        data.data(),
        data.size(),
        res.data(),
        &res_size
    );
    if (ok == nullptr || res_size != hmac_size)
        throw std::runtime_error("fernet: HMAC computation failed");
    return res;
}

fernet::fernet(boost::span<const unsigned char, fernet_raw_key_size> raw_key) noexcept
{
    std::copy(raw_key.begin(), raw_key.begin() + 16, signing_key_.begin());
    std::copy(raw_key.begin() + 16, raw_key.end(), encryption_key_.begin());
}

fernet::~fernet()
{
    OPENSSL_cleanse(signing_key_.data(), signing_key_.size());
    OPENSSL_cleanse(encryption_key_.data(), encryption_key_.size());
}

std::string fernet::generate_key()
{
    std::array<unsigned char, fernet_raw_key_size> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) <= 0)
        throw std::runtime_error("Generating fernet key: RAND_bytes");
    auto res = base64_encode(raw, true, base64_alphabet::url_safe);
    OPENSSL_cleanse(raw.data(), raw.size());
    return res;
}

result<fernet> fernet::from_key(std::string_view encoded_key)
{
    auto raw = base64_decode(encoded_key, true, base64_alphabet::url_safe);
    if (raw.has_error())
        return raw.error();
    if (raw->size() != fernet_raw_key_size)
    {
        OPENSSL_cleanse(raw->data(), raw->size());
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    }
    fernet res(boost::span<const unsigned char, fernet_raw_key_size>(raw->data(), fernet_raw_key_size));
    OPENSSL_cleanse(raw->data(), raw->size());
    return res;
}

std::string fernet::encrypt_impl(
    std::string_view plaintext,
    std::uint64_t timestamp,
    boost::span<const unsigned char, 16> iv
) const
{
    // Header
    std::vector<unsigned char> buff;
    buff.reserve(header_size + plaintext.size() + block_size + hmac_size);
    buff.push_back(token_version);
    for (int i = 7; i >= 0; --i)
        buff.push_back(static_cast<unsigned char>((timestamp >> (i * 8)) & 0xff));
    buff.insert(buff.end(), iv.begin(), iv.end());

    // Ciphertext
    cipher_ctx_ptr ctx{EVP_CIPHER_CTX_new()};
    if (!ctx)
        throw std::runtime_error("fernet: EVP_CIPHER_CTX_new");
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryption_key_.data(), iv.data()) != 1)
        throw std::runtime_error("fernet: EVP_EncryptInit_ex");
    std::size_t offset = buff.size();
    buff.resize(offset + plaintext.size() + block_size);
    int len = 0;
    if (EVP_EncryptUpdate(
            ctx.get(),
            buff.data() + offset,
            &len,
            reinterpret_cast<const unsigned char*>(plaintext.data()),
            static_cast<int>(plaintext.size())
        ) != 1)
        throw std::runtime_error("fernet: EVP_EncryptUpdate");
    offset += static_cast<std::size_t>(len);
    if (EVP_EncryptFinal_ex(ctx.get(), buff.data() + offset, &len) != 1)
        throw std::runtime_error("fernet: EVP_EncryptFinal_ex");
    offset += static_cast<std::size_t>(len);
    buff.resize(offset);

    // Signature, over everything written so far
    auto mac = compute_hmac(signing_key_, buff);
    buff.insert(buff.end(), mac.begin(), mac.end());

    return base64_encode(buff, true, base64_alphabet::url_safe);
}

result<std::string> fernet::encrypt(std::string_view plaintext, std::chrono::system_clock::time_point now)
    const
{
    std::array<unsigned char, iv_size> iv{};
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) <= 0)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    try
    {
        return encrypt_impl(plaintext, to_unix_seconds(now), iv);
    }
    catch (const std::runtime_error&)
    {
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    }
}

result<std::string> fernet::decrypt(
    std::string_view token,
    std::chrono::seconds max_age,
    std::chrono::system_clock::time_point now
) const
{
    // Decode
    auto decoded = base64_decode(token, true, base64_alphabet::url_safe);
    if (decoded.has_error())
        CMDCHAT_RETURN_ERROR(errc::invalid_token)
    const auto& raw = decoded.value();

    // Check the layout
    if (raw.size() < header_size + block_size + hmac_size)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)
    if ((raw.size() - header_size - hmac_size) % block_size != 0u)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)
    if (raw[0] != token_version)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)

    // Verify the signature in constant time
    boost::span<const unsigned char> signed_part(raw.data(), raw.size() - hmac_size);
    std::array<unsigned char, hmac_size> expected_mac{};
    try
    {
        expected_mac = compute_hmac(signing_key_, signed_part);
    }
    catch (const std::runtime_error&)
    {
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    }
    if (CRYPTO_memcmp(expected_mac.data(), raw.data() + signed_part.size(), hmac_size) != 0)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)

    // Check the timestamp
    std::uint64_t timestamp = 0;
    for (std::size_t i = 0; i < timestamp_size; ++i)
        timestamp = (timestamp << 8) | raw[version_size + i];
    auto current = to_unix_seconds(now);
    if (max_age.count() > 0 && timestamp + static_cast<std::uint64_t>(max_age.count()) < current)
        CMDCHAT_RETURN_ERROR(errc::token_expired)
    if (timestamp > current + static_cast<std::uint64_t>(max_clock_skew.count()))
        CMDCHAT_RETURN_ERROR(errc::invalid_token)

    // Decrypt
    const unsigned char* iv = raw.data() + version_size + timestamp_size;
    const unsigned char* ciphertext = raw.data() + header_size;
    auto ciphertext_size = static_cast<int>(signed_part.size() - header_size);

    cipher_ctx_ptr ctx{EVP_CIPHER_CTX_new()};
    if (!ctx)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, encryption_key_.data(), iv) != 1)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)
    std::string res(static_cast<std::size_t>(ciphertext_size) + block_size, '\0');
    int len = 0;
    if (EVP_DecryptUpdate(
            ctx.get(),
            reinterpret_cast<unsigned char*>(res.data()),
            &len,
            ciphertext,
            ciphertext_size
        ) != 1)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)
    std::size_t total = static_cast<std::size_t>(len);

    // Bad padding
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(res.data()) + total, &len) != 1)
        CMDCHAT_RETURN_ERROR(errc::invalid_token)
    total += static_cast<std::size_t>(len);
    res.resize(total);

    return res;
}
