/*

domain_resolver.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <string>
#include <string_view>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <mailq/detail/log.hpp>
#include <mailq/export.hpp>

namespace mailq::net
{

/**
Capability telling whether a domain can receive mail.
**/
class MAILQ_EXPORT domain_resolver
{
public:
    virtual ~domain_resolver() = default;

    /**
    Checking the domain for a mail exchanger or an address record.

    @param domain Domain part of an address.
    @return       True if at least one MX or A record exists.
    **/
    virtual bool has_mx_or_a(std::string_view domain) const = 0;
};


/**
Record types queried by `dns_resolver`.
**/
struct dns_options
{
    bool check_mx = true;
    bool check_a = true;
};


/**
Resolver backed by the system DNS configuration.

MX records are queried through the resolver library, address records through the Boost.Asio resolver.
**/
class MAILQ_EXPORT dns_resolver : public domain_resolver
{
public:
    static constexpr std::size_t ANSWER_BUFFER_SIZE = 4096;

    explicit dns_resolver(dns_options options = dns_options{}) : options_(options)
    {
    }

    bool has_mx_or_a(std::string_view domain) const override
    {
        if (domain.empty())
            return false;
        if (options_.check_mx && has_mx(domain))
            return true;
        if (options_.check_a && has_address(domain))
            return true;

        MAILQ_DEBUG("No MX or A record for `" + std::string(domain) + "`.");
        return false;
    }

    bool has_mx(std::string_view domain) const
    {
        const std::string name(domain);
        std::array<unsigned char, ANSWER_BUFFER_SIZE> answer{};
        int len = ::res_query(name.c_str(), ns_c_in, ns_t_mx, answer.data(), static_cast<int>(answer.size()));
        if (len < 0)
            return false;
        if (static_cast<std::size_t>(len) > answer.size())
            len = static_cast<int>(answer.size());

        ns_msg handle;
        if (::ns_initparse(answer.data(), len, &handle) < 0)
        {
            MAILQ_WARN("Malformed MX answer for `" + name + "`.");
            return false;
        }
        return ns_msg_count(handle, ns_s_an) > 0;
    }

    bool has_address(std::string_view domain) const
    {
        boost::asio::io_context context;
        boost::asio::ip::tcp::resolver resolver(context);
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(std::string(domain), std::string(), ec);
        if (ec)
        {
            MAILQ_DEBUG("Address lookup for `" + std::string(domain) + "` failed: " + ec.message());
            return false;
        }
        return !endpoints.empty();
    }

    const dns_options& options() const { return options_; }

private:
    dns_options options_;
};

} // namespace mailq::net
