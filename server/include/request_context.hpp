//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP
#define CMDCHAT_SERVER_INCLUDE_REQUEST_CONTEXT_HPP

#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/core/span.hpp>
#include <boost/url/url_view.hpp>

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"

// Contains a request_context class, which encapsulates a Boost.Beast HTTP request
// and provides an easy way to build HTTP responses.

namespace cmdchat {

// Provides an easy way to build HTTP responses. This class is instantiated by
// the request_context.
// All the functions returning an actual response can be called at most once,
// since they will move internal state.
// All responses include CORS headers allowing any origin.
class response_builder
{
public:
    // The type of the HTTP responses. We use the type-erased message_generator class to allow
    // bodies of different types with a uniform interface.
    using response_type = boost::beast::http::message_generator;

    // Sets the content-type of the response
    response_builder& set_content_type(std::string_view value)
    {
        assert(!used_);
        header_.set(boost::beast::http::field::content_type, value);
        return *this;
    }

    // Sends a response with a JSON body. The type T must have a to_json() const
    // member function returning a string that performs the JSON serialization.
    template <class T>
    response_type json_response(const T& value, boost::beast::http::status status = boost::beast::http::status::ok)
    {
        return json_response_impl(status, value.to_json());
    }

    // Sends a 200 response with the given bytes as an application/octet-stream body
    response_type binary_response(boost::span<const unsigned char> body);

    // Returns an empty response (204).
    response_type empty_response();

    // Returns a "method not allowed" response with a simple plaintext body.
    response_type method_not_allowed()
    {
        return plaintext_response(boost::beast::http::status::method_not_allowed, "Method not allowed");
    }

    // Returns a "bad request" response with a simple plaintext body.
    response_type bad_request_text(std::string why)
    {
        return plaintext_response(boost::beast::http::status::bad_request, std::move(why));
    }

    // Returns a "not found" response with a simple plaintext body.
    response_type not_found_text()
    {
        return plaintext_response(boost::beast::http::status::not_found, "Not found");
    }

    // Returns an error response, with a JSON body {"error": error_message}.
    // Used by the API, to communicate errors that are likely to happen during normal operation
    // and should be processed by the client, like authentication failures.
    response_type json_error(boost::beast::http::status status, std::string_view error_message);

    response_type bad_request_json(std::string_view error_message)
    {
        return json_error(boost::beast::http::status::bad_request, error_message);
    }

    response_type unauthorized_json() { return json_error(boost::beast::http::status::unauthorized, "unauthorized"); }

    // Returns an internal server error response. Error information is logged
    // but not sent in the response.
    response_type internal_server_error(error_code ec, std::string_view what);
    response_type internal_server_error(const error_with_message& err)
    {
        return internal_server_error(err.ec, err.msg);
    }

private:
    using header_type = boost::beast::http::response_header<boost::beast::http::fields>;

    bool keep_alive_;
    header_type header_;
    bool used_{};

    response_builder(unsigned version, bool keep_alive);
    response_type plaintext_response(boost::beast::http::status status, std::string content);
    response_type json_response_impl(boost::beast::http::status status, std::string serialized_json);

    header_type move_header()
    {
        assert(!used_);
        used_ = true;
        return std::move(header_);
    }

    template <class Body, class... Args>
    boost::beast::http::response<Body> build_response(Args&&... args)
    {
        boost::beast::http::response<Body> res{move_header(), std::forward<Args>(args)...};
        res.keep_alive(keep_alive_);
        return res;
    }

    friend class request_context;
};

// Encapsulates a Boost.Beast request and provides an easy way to build responses.
// Intended to be passed to the HTTP API handler functions.
class request_context
{
public:
    // The Boost.Beast request type
    using request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructor. remote_address is the address of the peer that sent the request
    request_context(request_type&& req, std::string remote_address = {})
        : request_(std::move(req)),
          response_(request_.version(), request_.keep_alive()),
          remote_address_(std::move(remote_address))
    {
    }

    // Parses the HTTP request target line into a URL. Returns an error_code on
    // failure. This should be called prior to invoking any API handler functions.
    error_code parse_request_target();

    // Returns the request target as a URL. parse_request_target must have been
    // called and succeeded.
    const boost::urls::url_view& request_target() const
    {
        assert(target_.has_value());
        return *target_;
    }

    // Returns the HTTP method of the request.
    boost::beast::http::verb request_method() const noexcept { return request_.method(); }

    const request_type& request() const noexcept { return request_; }

    const std::string& remote_address() const noexcept { return remote_address_; }

    // Attempts to parse the request body as JSON, and converts the result
    // to type T. T must have a static member function with signature
    // result<T> from_json(std::string_view).
    // The request content-type is validated before attempting the parse.
    template <class T>
    result<T> parse_json_body() const
    {
        // Validate content-type
        if (!has_content_type("application/json"))
            CMDCHAT_RETURN_ERROR(errc::invalid_content_type)

        // Parse the json
        return T::from_json(request_.body());
    }

    // Looks up a request parameter. The following sources are tried in order,
    // and the first non-empty value wins:
    //   1. A string member of the JSON body, if the request has a JSON content-type.
    //   2. A field of the body, if the request has a urlencoded form content-type.
    //   3. The query string.
    // parse_request_target must have been called and succeeded.
    std::optional<std::string> get_param(std::string_view name) const;

    // Returns true if the request's Content-Type media type equals media_type,
    // ignoring any parameters (like charset)
    bool has_content_type(std::string_view media_type) const;

    // Returns a response_builder object
    response_builder& response() noexcept { return response_; }

private:
    request_type request_;
    response_builder response_;
    std::string remote_address_;
    std::optional<boost::urls::url_view> target_;
};

// Looks up a query parameter in url, decoding it ('+' is decoded as a space).
// Returns an empty optional if it's not present or it's empty.
std::optional<std::string> find_query_param(const boost::urls::url_view& url, std::string_view name);

}  // namespace cmdchat

#endif
