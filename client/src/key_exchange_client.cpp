//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "key_exchange_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/span.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>

#include <openssl/crypto.h>
#include <string>
#include <string_view>

#include "client_config.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "util/fernet.hpp"
#include "util/rsa.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

// 400 responses carry {"error": "<reason>"}
static bool is_username_rejection(std::string_view body)
{
    error_code ec;
    auto jv = boost::json::parse(body, ec);
    if (ec || !jv.is_object())
        return false;
    const auto* err = jv.get_object().if_contains("error");
    return err && err->is_string() && err->get_string() == "invalid username";
}

std::string cmdchat::make_key_request(const client_config& cfg, std::string_view public_key_pem)
{
    boost::json::object res{
        {"pubkey",   public_key_pem},
        {"username", cfg.username  },
    };
    if (cfg.password.has_value())
        res["password"] = *cfg.password;
    return boost::json::serialize(res);
}

result<fernet> cmdchat::parse_key_response(const http_result& response, const rsa_keypair& keypair)
{
    if (response.status == 401u)
        CMDCHAT_RETURN_ERROR(errc::requires_auth)
    if (response.status == 400u)
    {
        if (is_username_rejection(response.body))
            CMDCHAT_RETURN_ERROR(errc::invalid_username)
        CMDCHAT_RETURN_ERROR(errc::invalid_public_key)
    }
    if (response.status != 200u)
        CMDCHAT_RETURN_ERROR(errc::crypto_failure)

    // The body is the encrypted key, as raw bytes
    auto decrypted = keypair.decrypt(boost::span<const unsigned char>(
        reinterpret_cast<const unsigned char*>(response.body.data()),
        response.body.size()
    ));
    if (decrypted.has_error())
        return decrypted.error();

    // The key is transported in its base64 form
    std::string_view encoded_key(reinterpret_cast<const char*>(decrypted->data()), decrypted->size());
    auto res = fernet::from_key(encoded_key);

    // Don't leave key material around
    OPENSSL_cleanse(decrypted->data(), decrypted->size());
    return res;
}

asio::awaitable<result_with_message<fernet>> cmdchat::exchange_keys(
    asio::any_io_executor ex,
    const client_config& cfg
)
{
    // Generate the keypair. This is only used for this exchange
    auto keypair = rsa_keypair::generate();
    if (keypair.has_error())
        CMDCHAT_CO_RETURN_ERROR_WITH_MESSAGE(keypair.error(), "Generating the RSA keypair")
    auto pem = keypair->public_key_pem();
    if (pem.has_error())
        CMDCHAT_CO_RETURN_ERROR_WITH_MESSAGE(pem.error(), "Serializing the public key")

    // Send it to the server
    auto body = make_key_request(cfg, *pem);
    http_request_params params;
    params.method = boost::beast::http::verb::post;
    params.target = "/get_key";
    params.body = body;
    params.content_type = "application/json";
    params.timeout = cfg.connect_timeout;
    auto response = co_await http_request(std::move(ex), cfg.host, cfg.port, params);
    if (response.has_error())
        CMDCHAT_CO_RETURN_ERROR_WITH_MESSAGE(response.error(), "Connecting to the server")

    // Recover the symmetric key
    auto res = parse_key_response(*response, *keypair);
    if (res.has_error())
        CMDCHAT_CO_RETURN_ERROR_WITH_MESSAGE(res.error(), "Key exchange")
    co_return std::move(res).value();
}
