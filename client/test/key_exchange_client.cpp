//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "key_exchange_client.hpp"

#include <boost/core/span.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <string>

#include "client_config.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "util/fernet.hpp"
#include "util/rsa.hpp"

using namespace cmdchat;

namespace {

struct fixture
{
    rsa_keypair keypair{rsa_keypair::generate().value()};
    std::string server_key{fernet::generate_key()};

    // What the server sends on success
    http_result success_response() const
    {
        auto pem = keypair.public_key_pem().value();
        boost::span<const unsigned char> plaintext(
            reinterpret_cast<const unsigned char*>(server_key.data()),
            server_key.size()
        );
        auto encrypted = rsa_encrypt(pem, plaintext).value();
        return http_result{200u, std::string(encrypted.begin(), encrypted.end())};
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(key_exchange_client_)

BOOST_AUTO_TEST_CASE(make_key_request_)
{
    client_config cfg;
    cfg.username = "alice";
    cfg.password = "abc";

    auto jv = boost::json::parse(make_key_request(cfg, "PEM"));
    boost::json::value expected{
        {"pubkey",   "PEM"  },
        {"username", "alice"},
        {"password", "abc"  },
    };
    BOOST_TEST(jv == expected);

    // No password
    cfg.password.reset();
    jv = boost::json::parse(make_key_request(cfg, "PEM"));
    BOOST_TEST(!jv.as_object().contains("password"));
}

BOOST_FIXTURE_TEST_CASE(success, fixture)
{
    auto res = parse_key_response(success_response(), keypair);
    BOOST_TEST_REQUIRE(res.has_value());

    // The recovered cipher is compatible with the server's
    auto server_cipher = fernet::from_key(server_key).value();
    auto token = server_cipher.encrypt("hello").value();
    auto decrypted = res->decrypt(token, std::chrono::seconds(60));
    BOOST_TEST_REQUIRE(decrypted.has_value());
    BOOST_TEST(*decrypted == "hello");
}

BOOST_FIXTURE_TEST_CASE(unauthorized, fixture)
{
    auto res = parse_key_response(http_result{401u, R"({"error":"unauthorized"})"}, keypair);
    BOOST_TEST(res.error() == error_code(errc::requires_auth));
}

BOOST_FIXTURE_TEST_CASE(bad_request, fixture)
{
    auto res = parse_key_response(http_result{400u, R"({"error":"invalid public key"})"}, keypair);
    BOOST_TEST(res.error() == error_code(errc::invalid_public_key));

    res = parse_key_response(http_result{400u, R"({"error":"public key is required"})"}, keypair);
    BOOST_TEST(res.error() == error_code(errc::invalid_public_key));

    res = parse_key_response(http_result{400u, R"({"error":"invalid username"})"}, keypair);
    BOOST_TEST(res.error() == error_code(errc::invalid_username));
}

BOOST_FIXTURE_TEST_CASE(other_status, fixture)
{
    auto res = parse_key_response(http_result{500u, ""}, keypair);
    BOOST_TEST(res.error() == error_code(errc::crypto_failure));
}

BOOST_FIXTURE_TEST_CASE(wrong_keypair, fixture)
{
    // The key was encrypted for somebody else
    auto other = rsa_keypair::generate().value();
    auto res = parse_key_response(success_response(), other);
    BOOST_TEST(res.error() == error_code(errc::crypto_failure));
}

BOOST_AUTO_TEST_SUITE_END()
