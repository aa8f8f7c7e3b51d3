//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/rooms.hpp"

#include <boost/asio/awaitable.hpp>

#include <string>
#include <vector>

#include "api/api_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/room_registry.hpp"
#include "shared_state.hpp"
#include "timestamp.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

asio::awaitable<response_builder::response_type> cmdchat::handle_list_rooms(request_context& ctx, shared_state& st)
{
    auto& registry = st.registry();
    auto rooms = registry.list_rooms();

    std::vector<room_listing> listings;
    listings.reserve(rooms.size());
    for (const auto& r : rooms)
        listings.push_back(room_listing{r, registry.member_count(r.id)});

    co_return ctx.response().json_response(rooms_response{listings});
}

asio::awaitable<response_builder::response_type> cmdchat::handle_create_room(request_context& ctx, shared_state& st)
{
    // Authenticate
    auto password = ctx.get_param("password");
    if (!st.check_password(password.value_or("")))
        co_return ctx.response().unauthorized_json();

    // Parse params
    auto parse_result = ctx.parse_json_body<create_room_request>();
    if (parse_result.has_error())
    {
        if (parse_result.error() == errc::invalid_room_type)
            co_return ctx.response().bad_request_json("invalid room type");
        co_return ctx.response().bad_request_json("Invalid body provided");
    }
    auto& req_params = parse_result.value();

    // Create the room. This validates the name
    auto room_result = st.registry().create_room(
        req_params.name,
        req_params.type,
        ctx.get_param("username").value_or("unknown"),
        std::move(req_params.description)
    );
    if (room_result.has_error())
        co_return ctx.response().bad_request_json("invalid room name");

    log_info("Created room " + room_result->name + " (" + room_result->id + ")");
    co_return ctx.response().json_response(create_room_response{
        room_listing{*room_result, 0u}
    });
}

asio::awaitable<response_builder::response_type> cmdchat::handle_health(request_context& ctx, shared_state& st)
{
    const auto& registry = st.registry();
    co_return ctx.response().json_response(health_response{
        serialize_timestamp(current_timestamp()),
        registry.active_rooms(),
        registry.total_users(),
        registry.active_connections(),
    });
}
