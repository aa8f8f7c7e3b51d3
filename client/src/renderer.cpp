//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "renderer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <string_view>

#include "timestamp.hpp"

using namespace cmdchat;

// Formats the time of day as HH:MM:SS, in local time
static void write_time(std::ostream& os, timestamp_t tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buff{};
    localtime_r(&t, &tm_buff);
    os << std::put_time(&tm_buff, "%H:%M:%S");
}

void console_renderer::write_line(std::string_view prefix, std::string_view msg)
{
    os_ << prefix << ' ' << msg << std::endl;
}

void console_renderer::render_message(
    std::string_view username,
    std::string_view content,
    timestamp_t timestamp,
    bool is_own,
    bool is_system
)
{
    os_ << '[';
    write_time(os_, timestamp);
    os_ << "] ";
    if (is_system)
        os_ << "SYSTEM: ";
    else if (is_own)
        os_ << username << " (you): ";
    else
        os_ << username << ": ";
    os_ << content << std::endl;
}

void console_renderer::info(std::string_view msg) { write_line("[INFO]", msg); }

void console_renderer::success(std::string_view msg) { write_line("[SUCCESS]", msg); }

void console_renderer::warning(std::string_view msg) { write_line("[WARNING]", msg); }

void console_renderer::error(std::string_view msg) { write_line("[ERROR]", msg); }

void console_renderer::status(std::string_view msg)
{
    os_ << '[';
    write_time(os_, std::chrono::system_clock::now());
    os_ << "] " << msg << std::endl;
}

// Erase the display and move the cursor to the top left corner
void console_renderer::clear() { os_ << "\033[2J\033[H" << std::flush; }
