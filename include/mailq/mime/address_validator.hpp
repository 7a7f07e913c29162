/*

address_validator.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <utility>
#include <algorithm>
#include <boost/algorithm/string/replace.hpp>
#include <boost/regex.hpp>
#include <mailq/detail/ascii.hpp>
#include <mailq/net/domain_resolver.hpp>
#include <mailq/export.hpp>

namespace mailq
{

/**
Syntax check of mail addresses, optionally followed by a DNS check of the domain.
**/
class MAILQ_EXPORT address_validator
{
public:

    /**
    Maximum length of the local part.
    **/
    static constexpr std::size_t LOCAL_PART_MAX_LENGTH = 64;

    /**
    Maximum length of the domain part.
    **/
    static constexpr std::size_t DOMAIN_MAX_LENGTH = 255;

    /**
    Validator performing the syntax checks only.
    **/
    address_validator() = default;

    /**
    Validator which also asks the resolver for MX or A records of the domain.

    @param resolver Domain resolver, null disables the DNS check.
    **/
    explicit address_validator(std::shared_ptr<const net::domain_resolver> resolver)
        : resolver_(std::move(resolver))
    {
    }

    /**
    Validating an address.

    @param address Address as `local@domain`.
    @return        True if the syntax is valid and, if a resolver is set, the domain resolves.
    **/
    bool validate(std::string_view address) const
    {
        if (!check_syntax(address))
            return false;
        if (!resolver_)
            return true;

        const auto at = address.rfind('@');
        return resolver_->has_mx_or_a(address.substr(at + 1));
    }

    /**
    Validating the syntax of an address, no network access.

    @param address Address as `local@domain`.
    @return        True if valid, false if not.
    **/
    static bool check_syntax(std::string_view address)
    {
        const auto at = address.rfind('@');
        if (at == std::string_view::npos)
            return false;

        const std::string_view local = address.substr(0, at);
        const std::string_view domain = address.substr(at + 1);

        if (local.empty() || local.size() > LOCAL_PART_MAX_LENGTH)
            return false;
        if (domain.empty() || domain.size() > DOMAIN_MAX_LENGTH)
            return false;
        if (local.front() == '.' || local.back() == '.')
            return false;
        if (local.find("..") != std::string_view::npos)
            return false;
        if (!std::all_of(domain.begin(), domain.end(), detail::is_domain_char))
            return false;
        if (domain.find("..") != std::string_view::npos)
            return false;

        return check_local_part(local);
    }

    const std::shared_ptr<const net::domain_resolver>& resolver() const { return resolver_; }

private:

    /**
    Matching the local part with escaped backslashes removed against the unquoted atom or the quoted string form.
    **/
    static bool check_local_part(std::string_view local)
    {
        static const boost::regex ATOM_RE(R"re((\\.|[A-Za-z0-9!#%&`_=/$'*+?^{}|~.-])+)re",
            boost::regex::perl | boost::regex::no_mod_s);
        static const boost::regex QUOTED_RE(R"re("(\\"|[^"])+")re",
            boost::regex::perl | boost::regex::no_mod_s);

        const std::string unescaped = boost::algorithm::replace_all_copy(std::string(local), "\\\\", "");
        return boost::regex_match(unescaped, ATOM_RE) || boost::regex_match(unescaped, QUOTED_RE);
    }

    std::shared_ptr<const net::domain_resolver> resolver_;
};

} // namespace mailq
