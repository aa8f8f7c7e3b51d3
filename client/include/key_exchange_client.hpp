//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_KEY_EXCHANGE_CLIENT_HPP
#define CMDCHAT_CLIENT_INCLUDE_KEY_EXCHANGE_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <string>

#include "client_config.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "util/fernet.hpp"
#include "util/rsa.hpp"

namespace cmdchat {

// Composes the body of the POST /get_key request
std::string make_key_request(const client_config& cfg, std::string_view public_key_pem);

// Interprets the server's answer to a key request, decrypting the symmetric key
// with the given keypair. Errors:
//   errc::requires_auth        the password was rejected (401)
//   errc::invalid_username     the server rejected our username (400)
//   errc::invalid_public_key   the server rejected our public key (400)
//   errc::crypto_failure       any other status, or the key can't be decrypted
//   errc::invalid_base64       the decrypted key is not a valid Fernet key
result<fernet> parse_key_response(const http_result& response, const rsa_keypair& keypair);

// Runs the hybrid key exchange: generates an RSA keypair, sends its public half
// to the server and recovers the symmetric key from the response.
// The keypair is destroyed when this function returns.
boost::asio::awaitable<result_with_message<fernet>> exchange_keys(
    boost::asio::any_io_executor ex,
    const client_config& cfg
);

}  // namespace cmdchat

#endif
