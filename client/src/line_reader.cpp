//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "line_reader.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/system/system_error.hpp>

#include <cerrno>
#include <string>
#include <unistd.h>

#include "error.hpp"

using namespace cmdchat;
namespace asio = boost::asio;

// The descriptor is owned by the stream_descriptor, so we need our own copy
static int dup_stdin()
{
    int fd = ::dup(STDIN_FILENO);
    if (fd < 0)
        throw boost::system::system_error(error_code(errno, boost::system::system_category()), "dup(stdin)");
    return fd;
}

stdin_line_reader::stdin_line_reader(asio::any_io_executor ex) : input_(std::move(ex), dup_stdin()) {}

asio::awaitable<result<std::string>> stdin_line_reader::read_line()
{
    if (cancelled_)
        co_return asio::error::operation_aborted;

    auto [ec, n] = co_await asio::async_read_until(input_, asio::dynamic_buffer(buffer_), '\n', asio::as_tuple);
    if (cancelled_)
        co_return asio::error::operation_aborted;

    // A final line without a newline is still a line
    if (ec == asio::error::eof && !buffer_.empty())
    {
        std::string res = std::move(buffer_);
        buffer_.clear();
        co_return res;
    }
    if (ec)
        co_return ec;

    // Consume the line, including the newline
    std::string res = buffer_.substr(0, n - 1u);
    buffer_.erase(0, n);
    if (!res.empty() && res.back() == '\r')
        res.pop_back();
    co_return res;
}

void stdin_line_reader::cancel()
{
    cancelled_ = true;
    error_code ignored;
    input_.cancel(ignored);
}
