//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_TEST_RECORDING_RENDERER_HPP
#define CMDCHAT_CLIENT_TEST_RECORDING_RENDERER_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "renderer.hpp"
#include "timestamp.hpp"

namespace cmdchat {
namespace test {

struct rendered_message
{
    std::string username;
    std::string content;
    timestamp_t timestamp;
    bool is_own;
    bool is_system;
};

// Stores everything it's asked to render, so tests can inspect it
class recording_renderer final : public renderer
{
public:
    std::vector<rendered_message> messages;
    std::vector<std::string> infos;
    std::vector<std::string> successes;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<std::string> statuses;
    std::size_t clears{};

    void render_message(
        std::string_view username,
        std::string_view content,
        timestamp_t timestamp,
        bool is_own,
        bool is_system
    ) override final
    {
        messages.push_back({std::string(username), std::string(content), timestamp, is_own, is_system});
    }
    void info(std::string_view msg) override final { infos.emplace_back(msg); }
    void success(std::string_view msg) override final { successes.emplace_back(msg); }
    void warning(std::string_view msg) override final { warnings.emplace_back(msg); }
    void error(std::string_view msg) override final { errors.emplace_back(msg); }
    void status(std::string_view msg) override final { statuses.emplace_back(msg); }
    void clear() override final { ++clears; }

    // Whether a message with this content was rendered
    bool has_message(std::string_view content) const
    {
        return std::any_of(messages.begin(), messages.end(), [content](const rendered_message& m) {
            return m.content == content;
        });
    }
};

}  // namespace test
}  // namespace cmdchat

#endif
