//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/fernet.hpp"

#include <boost/test/unit_test.hpp>

#include <array>
#include <chrono>
#include <string>
#include <vector>

#include "error.hpp"
#include "util/base64.hpp"

using namespace cmdchat;
using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(fernet_)

static const std::array<unsigned char, fernet_raw_key_size> raw_key{
    0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f,
    0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18, 0x19, 0x1a, 0x1b, 0x1c, 0x1d, 0x1e, 0x1f,
};

// 2024-01-01T00:00:00Z
static const auto some_time = std::chrono::system_clock::time_point(1704067200s);

BOOST_AUTO_TEST_CASE(generate_key)
{
    auto key1 = fernet::generate_key();
    auto key2 = fernet::generate_key();

    // URL-safe base64 of 32 bytes
    BOOST_TEST(key1.size() == fernet_encoded_key_size);
    BOOST_TEST(key1 != key2);
    BOOST_TEST(fernet::from_key(key1).has_value());
}

BOOST_AUTO_TEST_CASE(from_key_error)
{
    // Not base64
    BOOST_TEST(fernet::from_key("not a key!").has_error());

    // Too short
    auto short_key = base64_encode(boost::span<const unsigned char>(raw_key.data(), 16), true, base64_alphabet::url_safe);
    BOOST_TEST(fernet::from_key(short_key).error() == error_code(errc::crypto_failure));

    // Empty
    BOOST_TEST(fernet::from_key("").has_error());
}

BOOST_AUTO_TEST_CASE(encrypt_decrypt)
{
    fernet f(raw_key);
    const std::vector<std::string> plaintexts{"", "a", "hello world", std::string(1000, 'x'), std::string(16, 'b')};
    for (const auto& plaintext : plaintexts)
    {
        BOOST_TEST_CONTEXT(plaintext.size())
        {
            auto token = f.encrypt(plaintext, some_time);
            BOOST_TEST_REQUIRE(token.has_value());
            BOOST_TEST(token->size() == fernet_token_size(plaintext.size()));

            auto decrypted = f.decrypt(*token, 60s, some_time + 1s);
            BOOST_TEST_REQUIRE(decrypted.has_value());
            BOOST_TEST(*decrypted == plaintext);
        }
    }
}

BOOST_AUTO_TEST_CASE(from_key_interoperates)
{
    // A context built from the encoded key is equivalent to the original one
    auto encoded = base64_encode(raw_key, true, base64_alphabet::url_safe);
    auto f1 = fernet::from_key(encoded);
    BOOST_TEST_REQUIRE(f1.has_value());
    fernet f2(raw_key);

    auto token = f1->encrypt("some message");
    BOOST_TEST_REQUIRE(token.has_value());
    auto decrypted = f2.decrypt(*token, 60s);
    BOOST_TEST_REQUIRE(decrypted.has_value());
    BOOST_TEST(*decrypted == "some message");
}

BOOST_AUTO_TEST_CASE(tokens_are_randomized)
{
    // The IV is random, so encrypting twice yields different tokens
    fernet f(raw_key);
    auto token1 = f.encrypt("hello", some_time);
    auto token2 = f.encrypt("hello", some_time);
    BOOST_TEST_REQUIRE(token1.has_value());
    BOOST_TEST_REQUIRE(token2.has_value());
    BOOST_TEST(*token1 != *token2);
}

BOOST_AUTO_TEST_CASE(modified_token)
{
    fernet f(raw_key);
    auto token = f.encrypt("hello world", some_time);
    BOOST_TEST_REQUIRE(token.has_value());
    auto raw = base64_decode(*token, true, base64_alphabet::url_safe);
    BOOST_TEST_REQUIRE(raw.has_value());

    // Flipping any bit causes the token to be rejected
    for (std::size_t i = 0; i < raw->size(); ++i)
    {
        BOOST_TEST_CONTEXT(i)
        {
            auto modified = *raw;
            modified[i] ^= 0x01;
            auto modified_token = base64_encode(modified, true, base64_alphabet::url_safe);
            auto res = f.decrypt(modified_token, 60s, some_time);
            BOOST_TEST(res.has_error());
        }
    }
}

BOOST_AUTO_TEST_CASE(wrong_key)
{
    auto other_key = raw_key;
    other_key[0] = 0xff;
    fernet f1(raw_key);
    fernet f2(other_key);

    auto token = f1.encrypt("hello", some_time);
    BOOST_TEST_REQUIRE(token.has_value());
    BOOST_TEST(f2.decrypt(*token, 60s, some_time).error() == error_code(errc::invalid_token));
}

BOOST_AUTO_TEST_CASE(malformed_token)
{
    fernet f(raw_key);
    BOOST_TEST(f.decrypt("", 60s, some_time).error() == error_code(errc::invalid_token));
    BOOST_TEST(f.decrypt("abc", 60s, some_time).error() == error_code(errc::invalid_token));
    BOOST_TEST(f.decrypt("not base64 at all!", 60s, some_time).error() == error_code(errc::invalid_token));
    BOOST_TEST(f.decrypt(std::string(100, 'A'), 60s, some_time).error() == error_code(errc::invalid_token));
}

BOOST_AUTO_TEST_CASE(expired_token)
{
    fernet f(raw_key);
    auto token = f.encrypt("hello", some_time);
    BOOST_TEST_REQUIRE(token.has_value());

    // Within the max age
    BOOST_TEST(f.decrypt(*token, 3600s, some_time + 3600s).has_value());

    // Past the max age
    BOOST_TEST(f.decrypt(*token, 3600s, some_time + 3601s).error() == error_code(errc::token_expired));

    // No max age
    BOOST_TEST(f.decrypt(*token, 0s, some_time + 100000s).has_value());
}

BOOST_AUTO_TEST_CASE(token_from_the_future)
{
    fernet f(raw_key);
    auto token = f.encrypt("hello", some_time);
    BOOST_TEST_REQUIRE(token.has_value());

    // Small clock skews are tolerated
    BOOST_TEST(f.decrypt(*token, 60s, some_time - 60s).has_value());

    // Larger ones are not
    BOOST_TEST(f.decrypt(*token, 60s, some_time - 61s).error() == error_code(errc::invalid_token));
}

BOOST_AUTO_TEST_CASE(token_size)
{
    // 1 + 8 + 16 + 16 + 32 = 73 raw bytes
    BOOST_TEST(fernet_token_size(0) == 100u);
    BOOST_TEST(fernet_token_size(15) == 100u);

    // 1 + 8 + 16 + 32 + 32 = 89 raw bytes
    BOOST_TEST(fernet_token_size(16) == 120u);

    // 1 + 8 + 16 + 1008 + 32 = 1065 raw bytes
    BOOST_TEST(fernet_token_size(1000) == 1420u);
}

BOOST_AUTO_TEST_SUITE_END()
