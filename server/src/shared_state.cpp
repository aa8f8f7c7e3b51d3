//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <openssl/crypto.h>
#include <string_view>

#include "services/room_registry.hpp"
#include "util/fernet.hpp"

using namespace cmdchat;

shared_state::shared_state(server_config config, boost::asio::any_io_executor ex)
    : impl_{
          std::move(config),
          fernet::generate_key(),
          nullptr,
      }
{
    impl_.registry_ = std::make_unique<room_registry>(std::move(ex), impl_.config_);
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}

bool shared_state::check_password(std::string_view password) const noexcept
{
    const auto& expected = impl_.config_.admin_password;
    if (!expected.has_value())
        return true;

    // Lengths are compared first. This leaks the password length, but not its contents
    if (expected->size() != password.size())
        return false;
    return CRYPTO_memcmp(expected->data(), password.data(), password.size()) == 0;
}
