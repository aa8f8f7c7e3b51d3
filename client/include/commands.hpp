//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_COMMANDS_HPP
#define CMDCHAT_CLIENT_INCLUDE_COMMANDS_HPP

#include <boost/variant2/variant.hpp>

#include <optional>
#include <string>
#include <string_view>

// Local commands, typed by the user with a leading slash (e.g. /join tech).
// Commands are resolved once, when parsing the line, and never reach the server.

namespace cmdchat {

inline constexpr char command_prefix = '/';

struct quit_command
{
};

struct help_command
{
};

struct clear_command
{
};

struct rooms_command
{
};

// Lists the users seen in the current room
struct users_command
{
};

// room may be empty if the user didn't provide it
struct join_command
{
    std::string room;
};

// name may be empty if the user didn't provide it
struct nick_command
{
    std::string name;
};

// An action, shown locally as "* username action". action may be empty
struct me_command
{
    std::string action;
};

struct status_command
{
};

struct history_command
{
};

// The command name is not in the alias table
struct unknown_command
{
    std::string name;
};

using any_command = boost::variant2::variant<
    quit_command,
    help_command,
    clear_command,
    rooms_command,
    join_command,
    users_command,
    me_command,
    nick_command,
    status_command,
    history_command,
    unknown_command>;

// Parses a line of user input. Returns an empty optional if the line
// is not a command, and should be sent as a chat message.
// Bare q, quit and exit lines (without the prefix) are quit commands, too.
std::optional<any_command> parse_command(std::string_view line);

// Help text listing the available commands
std::string_view command_help() noexcept;

}  // namespace cmdchat

#endif
