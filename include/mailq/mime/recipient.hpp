/*

recipient.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <mailq/detail/ascii.hpp>
#include <mailq/mime/address_validator.hpp>
#include <mailq/error.hpp>
#include <mailq/export.hpp>

namespace mailq
{


/**
Validated mail address with an optional name.

The address is checked once, when the recipient is created; afterwards the recipient cannot change.
**/
class MAILQ_EXPORT recipient
{
public:

    /**
    Creating a recipient without a name.

    @param address   Mail address.
    @param validator Validator applied to the address.
    @return          Recipient, or `errc::invalid_address`.
    **/
    [[nodiscard]] static result<recipient> create(std::string_view address,
        const address_validator& validator = address_validator{})
    {
        if (!validator.validate(address))
            return fail(errc::invalid_address, "Invalid address.", std::string(address) + " is not a valid email address");
        return recipient(std::nullopt, std::string(address));
    }

    /**
    Creating a named recipient.

    The name must be usable in a header line, so line breaks and control characters other than TAB are refused.

    @param name      Display name.
    @param address   Mail address.
    @param validator Validator applied to the address.
    @return          Recipient, or `errc::invalid_address`.
    **/
    [[nodiscard]] static result<recipient> create(std::string_view name, std::string_view address,
        const address_validator& validator = address_validator{})
    {
        if (!detail::is_valid_header_value(name))
            return fail(errc::invalid_address, "Invalid name.", "Name of " + std::string(address) +
                " contains line breaks or control characters");
        if (!validator.validate(address))
            return fail(errc::invalid_address, "Invalid address.", std::string(address) + " is not a valid email address");
        return recipient(std::string(name), std::string(address));
    }

    const std::optional<std::string>& name() const { return name_; }

    const std::string& address() const { return address_; }

    /**
    Formatting as `name <address>`, or the bare address when there is no name.
    **/
    std::string to_string() const
    {
        if (!name_.has_value())
            return address_;

        std::string out;
        out.reserve(name_->size() + address_.size() + 3);
        out += *name_;
        out += " <";
        out += address_;
        out += '>';
        return out;
    }

    bool operator==(const recipient&) const = default;

private:
    recipient(std::optional<std::string> name, std::string address)
        : name_(std::move(name)), address_(std::move(address))
    {
    }

    std::optional<std::string> name_;
    std::string address_;
};


} // namespace mailq
