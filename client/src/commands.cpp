//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "commands.hpp"

#include <boost/beast/core/string.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "business_types.hpp"

using namespace cmdchat;

namespace {

enum class command_kind
{
    quit,
    help,
    clear,
    rooms,
    join,
    users,
    me,
    nick,
    status,
    history,
};

struct command_alias
{
    std::string_view alias;
    command_kind kind;
};

constexpr command_alias aliases[] = {
    {"quit",     command_kind::quit   },
    {"q",        command_kind::quit   },
    {"exit",     command_kind::quit   },
    {"leave",    command_kind::quit   },
    {"help",     command_kind::help   },
    {"h",        command_kind::help   },
    {"?",        command_kind::help   },
    {"clear",    command_kind::clear  },
    {"cls",      command_kind::clear  },
    {"rooms",    command_kind::rooms  },
    {"r",        command_kind::rooms  },
    {"room",     command_kind::rooms  },
    {"join",     command_kind::join   },
    {"j",        command_kind::join   },
    {"go",       command_kind::join   },
    {"users",    command_kind::users  },
    {"u",        command_kind::users  },
    {"who",      command_kind::users  },
    {"me",       command_kind::me     },
    {"action",   command_kind::me     },
    {"nick",     command_kind::nick   },
    {"name",     command_kind::nick   },
    {"username", command_kind::nick   },
    {"status",   command_kind::status },
    {"s",        command_kind::status },
    {"history",  command_kind::history},
    {"hist",     command_kind::history},
    {"log",      command_kind::history},
};

std::optional<command_kind> find_command(std::string_view name) noexcept
{
    for (const auto& entry : aliases)
    {
        if (boost::beast::iequals(entry.alias, name))
            return entry.kind;
    }
    return std::nullopt;
}

constexpr std::string_view help_text =
    "Available commands:\n"
    "  /quit, /q, /exit, /leave      Leave the chat\n"
    "  /help, /h, /?                 Show this help\n"
    "  /clear, /cls                  Clear the screen\n"
    "  /rooms, /r, /room             List available rooms\n"
    "  /join <room>, /j, /go         Join a room\n"
    "  /users, /u, /who              Show users seen in the current room\n"
    "  /me <action>, /action         Show an action\n"
    "  /nick <name>, /name           Change your username\n"
    "  /status, /s                   Show connection status\n"
    "  /history, /hist, /log         Show recent messages";

}  // namespace

std::optional<any_command> cmdchat::parse_command(std::string_view line)
{
    line = trim(line);

    // Bare quit words
    using boost::beast::iequals;
    if (iequals(line, "q") || iequals(line, "quit") || iequals(line, "exit"))
        return any_command(quit_command{});

    if (line.empty() || line.front() != command_prefix)
        return std::nullopt;
    line.remove_prefix(1);

    // Split the command name from its argument
    auto space_pos = line.find_first_of(" \t");
    std::string name(line.substr(0, space_pos));
    std::string_view arg = space_pos == std::string_view::npos ? std::string_view()
                                                               : trim(line.substr(space_pos));

    auto kind = find_command(name);
    if (!kind.has_value())
        return any_command(unknown_command{std::move(name)});

    switch (*kind)
    {
    case command_kind::quit: return any_command(quit_command{});
    case command_kind::help: return any_command(help_command{});
    case command_kind::clear: return any_command(clear_command{});
    case command_kind::rooms: return any_command(rooms_command{});
    case command_kind::join: return any_command(join_command{std::string(arg)});
    case command_kind::users: return any_command(users_command{});
    case command_kind::me: return any_command(me_command{std::string(arg)});
    case command_kind::nick: return any_command(nick_command{std::string(arg)});
    case command_kind::status: return any_command(status_command{});
    case command_kind::history:
    default: return any_command(history_command{});
    }
}

std::string_view cmdchat::command_help() noexcept { return help_text; }
