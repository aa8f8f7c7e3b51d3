//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_API_API_TYPES_HPP
#define CMDCHAT_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/core/span.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// This file contains type definitions for HTTP API objects.
// Types for incoming requests are owning, since they're used after parsing,
// and match exactly the types and field names in the API.
// Types for responses are non-owning and lightweight,
// since they are only used as intermediate types for serialization.

namespace cmdchat {

//
// Incoming messages
//

// The request body for POST /rooms
struct create_room_request
{
    // Untrimmed, unvalidated room name
    std::string name;

    // Defaults to public if not present
    room_type type{room_type::public_room};

    // Defaults to empty if not present
    std::string description;

    // Parses a request from a JSON string. Fails with invalid_room_type if
    // the type is present but not valid, and with websocket_parse_error
    // if the JSON doesn't have the expected shape.
    static result<create_room_request> from_json(std::string_view from);
};

//
// Outgoing messages
//

// A room together with its live member count
struct room_listing
{
    const room& data;
    std::size_t member_count;
};

// Response for GET /rooms
struct rooms_response
{
    boost::span<const room_listing> rooms;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Response for POST /rooms
struct create_room_response
{
    room_listing created_room;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

// Response for GET /health
struct health_response
{
    std::int64_t timestamp;
    std::size_t active_rooms;
    std::size_t total_users;
    std::size_t active_connections;

    // Serializes the object as a JSON string.
    std::string to_json() const;
};

}  // namespace cmdchat

#endif
