//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_LINE_READER_HPP
#define CMDCHAT_CLIENT_INCLUDE_LINE_READER_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <string>

#include "error.hpp"

namespace cmdchat {

// Source of user input lines. Reads are asynchronous so they
// can be interrupted when the client shuts down.
class line_reader
{
public:
    virtual ~line_reader() {}

    // Reads a line, without the trailing newline. Fails with asio::error::eof
    // when no more input is available, and with asio::error::operation_aborted
    // if cancel() is called.
    virtual boost::asio::awaitable<result<std::string>> read_line() = 0;

    // Cancels any outstanding and future reads
    virtual void cancel() = 0;
};

// Reads lines from the process' standard input
class stdin_line_reader final : public line_reader
{
    boost::asio::posix::stream_descriptor input_;
    std::string buffer_;
    bool cancelled_{false};

public:
    // Duplicates the standard input descriptor. Throws on error
    explicit stdin_line_reader(boost::asio::any_io_executor ex);

    boost::asio::awaitable<result<std::string>> read_line() override final;
    void cancel() override final;
};

}  // namespace cmdchat

#endif
