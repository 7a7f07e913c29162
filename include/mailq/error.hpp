/*

error.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <stdexcept>
#include <system_error>
#include <expected>
#include <utility>
#include <mailq/export.hpp>
#include <mailq/macros.hpp>

namespace mailq
{

/**
Failure conditions reported by the library.
**/
enum class errc
{
    invalid_address = 1,
    duplicate_entry,
    invalid_header,
    argument_type,
    delivery_failure,
    resolver_failure
};


class error_category_impl : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "mailq";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<errc>(ev))
        {
            case errc::invalid_address:
                return "invalid address";
            case errc::duplicate_entry:
                return "duplicate entry";
            case errc::invalid_header:
                return "invalid header";
            case errc::argument_type:
                return "argument type mismatch";
            case errc::delivery_failure:
                return "delivery failure";
            case errc::resolver_failure:
                return "resolver failure";
        }
        return "unknown mailq error";
    }
};


inline const std::error_category& error_category() noexcept
{
    static const error_category_impl category;
    return category;
}


inline std::error_code make_error_code(errc e) noexcept
{
    return std::error_code(static_cast<int>(e), error_category());
}


/**
Failure carried by `result`.
**/
struct MAILQ_EXPORT error_info
{
    std::error_code code;
    std::string message;
    std::string details;

    bool is(errc e) const noexcept
    {
        return code == make_error_code(e);
    }
};


/**
Value or failure of a library operation.
**/
template<typename T>
using result = std::expected<T, error_info>;


inline std::unexpected<error_info> fail(errc e, std::string message, std::string details = {})
{
    return std::unexpected<error_info>(error_info{make_error_code(e), std::move(message), std::move(details)});
}


/**
Error thrown on misuse that cannot be recovered at the call site.
**/
class error : public std::runtime_error
{
public:
    error(const std::string& msg, const std::string& details, errc code = errc::argument_type)
        : std::runtime_error(msg), details_(details), code_(make_error_code(code))
    {
    }

    error(const char* msg, const std::string& details, errc code = errc::argument_type)
        : std::runtime_error(msg), details_(details), code_(make_error_code(code))
    {
    }

    std::string details() const { return details_; }

    std::error_code code() const { return code_; }

protected:
    std::string details_;
    std::error_code code_;
};

} // namespace mailq


// The module interface adds this specialization outside of its export block.
#if !defined(MAILQ_MODULE_INTERFACE)
#include <mailq/error_enum.hpp>
#endif
