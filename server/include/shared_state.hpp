//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_SHARED_STATE_HPP
#define CMDCHAT_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "server_config.hpp"

namespace cmdchat {

// Forward declaration
class room_registry;

// Contains singleton objects shared by all sessions in the server
class shared_state
{
    struct
    {
        server_config config_;
        std::string symmetric_key_;
        std::unique_ptr<room_registry> registry_;
    } impl_;

public:
    // Generates the server-wide symmetric key. Throws if the key can't be generated
    shared_state(server_config config, boost::asio::any_io_executor ex);
    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    const server_config& config() const noexcept { return impl_.config_; }

    // The Fernet key shared with clients, in its URL-safe base64 form
    const std::string& symmetric_key() const noexcept { return impl_.symmetric_key_; }

    room_registry& registry() noexcept { return *impl_.registry_; }

    // Checks a password against the admin password, in constant time.
    // Always succeeds if no admin password has been configured.
    bool check_password(std::string_view password) const noexcept;
};

}  // namespace cmdchat

#endif
