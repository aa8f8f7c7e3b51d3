//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_API_KEY_EXCHANGE_HPP
#define CMDCHAT_SERVER_INCLUDE_API_KEY_EXCHANGE_HPP

#include <boost/asio/awaitable.hpp>

#include "request_context.hpp"

namespace cmdchat {

class shared_state;

// GET/POST /get_key. Parameters: password, pubkey (PEM) and username
// (optional). Responds with the server's symmetric key, encrypted with
// the supplied public key using RSA-OAEP.
boost::asio::awaitable<response_builder::response_type> handle_get_key(request_context& ctx, shared_state& st);

}  // namespace cmdchat

#endif
