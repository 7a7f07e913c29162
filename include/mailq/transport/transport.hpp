/*

transport.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string_view>
#include <functional>
#include <utility>
#include <mailq/export.hpp>

namespace mailq
{

/**
Delivery capability used by `message::send()`.
**/
class MAILQ_EXPORT transport
{
public:
    virtual ~transport() = default;

    /**
    Handing one mail over for delivery.

    @param recipients Recipient line, one or more comma separated recipients.
    @param subject    Subject line.
    @param body       Message body.
    @param headers    Header block, lines joined by CRLF.
    @return           True if the mail was accepted.
    **/
    virtual bool send(std::string_view recipients, std::string_view subject, std::string_view body,
        std::string_view headers) = 0;
};


/**
Transport forwarding to a callable.
**/
class MAILQ_EXPORT function_transport : public transport
{
public:
    using function_t = std::function<bool(std::string_view, std::string_view, std::string_view, std::string_view)>;

    explicit function_transport(function_t fn) : fn_(std::move(fn))
    {
    }

    bool send(std::string_view recipients, std::string_view subject, std::string_view body,
        std::string_view headers) override
    {
        return fn_ && fn_(recipients, subject, body, headers);
    }

private:
    function_t fn_;
};

} // namespace mailq
