//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// This file enables separate compilation for Boost.Asio, reducing
// build times for the other files. It's compiled once, as part of
// cmdchat_common, and shared by the server, the client and the tests.

#include <boost/asio/impl/src.hpp>
