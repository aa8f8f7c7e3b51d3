//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace cmdchat;

result<create_room_request> create_room_request::from_json(std::string_view from)
{
    // Parse the JSON
    error_code ec;
    auto jv = boost::json::parse(from, ec);
    if (ec)
        return ec;
    const auto* obj = jv.if_object();
    if (!obj)
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)

    // Optional string members. A member with the wrong type is an error
    auto get_string = [obj](std::string_view key, std::string& to) -> bool {
        auto it = obj->find(key);
        if (it == obj->end())
            return true;
        const auto* s = it->value().if_string();
        if (!s)
            return false;
        to.assign(s->data(), s->size());
        return true;
    };

    create_room_request res;
    std::string type;
    if (!get_string("name", res.name) || !get_string("type", type) || !get_string("description", res.description))
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)

    if (!type.empty())
    {
        auto parsed_type = parse_room_type(type);
        if (parsed_type.has_error())
            return parsed_type.error();
        res.type = *parsed_type;
    }

    return res;
}

static boost::json::object room_to_json(const room_listing& r)
{
    return boost::json::object({
        {"id",           r.data.id                             },
        {"name",         r.data.name                           },
        {"type",         to_string(r.data.type)                },
        {"created_by",   r.data.created_by                     },
        {"created_at",   serialize_timestamp(r.data.created_at)},
        {"description",  r.data.description                    },
        {"is_active",    r.data.is_active                      },
        {"member_count", r.member_count                        },
        {"max_members",  r.data.max_members                    },
    });
}

std::string rooms_response::to_json() const
{
    boost::json::array rooms_json;
    rooms_json.reserve(rooms.size());
    for (const auto& r : rooms)
    {
        auto obj = room_to_json(r);
        obj.emplace("active_users", r.member_count);
        rooms_json.push_back(std::move(obj));
    }

    return boost::json::serialize(boost::json::object({
        {"rooms", std::move(rooms_json)},
        {"total", rooms.size()         },
    }));
}

std::string create_room_response::to_json() const
{
    return boost::json::serialize(boost::json::object({
        {"success", true                       },
        {"room",    room_to_json(created_room)},
    }));
}

std::string health_response::to_json() const
{
    return boost::json::serialize(boost::json::object({
        {"status",             "healthy"         },
        {"timestamp",          timestamp         },
        {"active_rooms",       active_rooms      },
        {"total_users",        total_users       },
        {"active_connections", active_connections},
    }));
}
