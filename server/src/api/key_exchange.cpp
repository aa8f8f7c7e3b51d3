//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/key_exchange.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/core/span.hpp>

#include <string>

#include "business_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/room_registry.hpp"
#include "shared_state.hpp"
#include "util/rsa.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

asio::awaitable<response_builder::response_type> cmdchat::handle_get_key(request_context& ctx, shared_state& st)
{
    // Authenticate. No key material is sent if this fails
    auto password = ctx.get_param("password");
    if (!st.check_password(password.value_or("")))
        co_return ctx.response().unauthorized_json();

    // Get the client's public key
    auto pubkey = ctx.get_param("pubkey");
    if (!pubkey.has_value())
        co_return ctx.response().bad_request_json("public key is required");

    // Validate the username, if the client identified itself. The user is
    // only recorded once the request is known to succeed
    auto username = ctx.get_param("username");
    if (username.has_value() && validate_username(*username))
        co_return ctx.response().bad_request_json("invalid username");

    // Encrypt the key
    const auto& key = st.symmetric_key();
    auto encrypted = rsa_encrypt(
        *pubkey,
        boost::span<const unsigned char>(reinterpret_cast<const unsigned char*>(key.data()), key.size())
    );
    if (encrypted.has_error())
    {
        if (encrypted.error() == errc::invalid_public_key)
            co_return ctx.response().bad_request_json("invalid public key");
        co_return ctx.response().internal_server_error(encrypted.error(), "Encrypting the symmetric key");
    }

    if (username.has_value())
    {
        auto user_result = st.registry().ensure_user(ctx.remote_address(), *username);
        if (user_result.has_error())
            co_return ctx.response().bad_request_json("invalid username");
    }

    co_return ctx.response().binary_response(*encrypted);
}
