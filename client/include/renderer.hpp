//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_RENDERER_HPP
#define CMDCHAT_CLIENT_INCLUDE_RENDERER_HPP

#include <iosfwd>
#include <string_view>

#include "timestamp.hpp"

namespace cmdchat {

// Everything the client shows to the user goes through a renderer.
// The chat logic never writes to the terminal directly.
class renderer
{
public:
    virtual ~renderer() {}

    // A chat message. is_own is set for messages sent by the current user,
    // and is_system for messages generated by the server.
    virtual void render_message(
        std::string_view username,
        std::string_view content,
        timestamp_t timestamp,
        bool is_own,
        bool is_system
    ) = 0;

    virtual void info(std::string_view msg) = 0;
    virtual void success(std::string_view msg) = 0;
    virtual void warning(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;

    // Transient status information, like connection state changes
    virtual void status(std::string_view msg) = 0;

    // Clears the screen
    virtual void clear() = 0;
};

// Writes plain text lines to an output stream (stdout in production)
class console_renderer final : public renderer
{
    std::ostream& os_;

    void write_line(std::string_view prefix, std::string_view msg);

public:
    explicit console_renderer(std::ostream& os) noexcept : os_(os) {}

    void render_message(
        std::string_view username,
        std::string_view content,
        timestamp_t timestamp,
        bool is_own,
        bool is_system
    ) override final;
    void info(std::string_view msg) override final;
    void success(std::string_view msg) override final;
    void warning(std::string_view msg) override final;
    void error(std::string_view msg) override final;
    void status(std::string_view msg) override final;
    void clear() override final;
};

}  // namespace cmdchat

#endif
