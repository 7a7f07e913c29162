/*

header.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <type_traits>
#include <utility>
#include <initializer_list>
#include <boost/algorithm/string/predicate.hpp>
#include <mailq/detail/ascii.hpp>
#include <mailq/detail/log.hpp>
#include <mailq/mime/address_validator.hpp>
#include <mailq/mime/recipient.hpp>
#include <mailq/mime/recipient_list.hpp>
#include <mailq/error.hpp>
#include <mailq/export.hpp>

namespace mailq
{


/**
Message header, either with a textual value or with a list of recipients.

The type name is fixed by the kind, except for the generic header which takes any valid name.
**/
class MAILQ_EXPORT header
{
public:

    enum class kind_t {GENERIC, FROM, REPLY_TO, CC, BCC};

    static constexpr std::string_view FROM_TYPE = "From";
    static constexpr std::string_view REPLY_TO_TYPE = "Reply-To";
    static constexpr std::string_view CC_TYPE = "Cc";
    static constexpr std::string_view BCC_TYPE = "Bcc";

    /**
    Separator between the type name and the value.
    **/
    static constexpr std::string_view TYPE_SEPARATOR = ": ";

    /**
    Checking if a type name belongs to one of the typed kinds, compared case insensitively.
    **/
    static bool is_reserved_type(std::string_view type)
    {
        for (std::string_view reserved : {FROM_TYPE, REPLY_TO_TYPE, CC_TYPE, BCC_TYPE})
            if (boost::algorithm::iequals(type, reserved))
                return true;
        return false;
    }

    /**
    Creating a header with an arbitrary type name.

    The names of the typed kinds are refused, those headers are made by their own factories.

    @param type    Header name.
    @param content Header value.
    @return        Header, or `errc::invalid_header` for a malformed or reserved name or a malformed value.
    **/
    [[nodiscard]] static result<header> generic(std::string_view type, std::string_view content)
    {
        if (!detail::is_valid_header_name(type))
            return fail(errc::invalid_header, "Header name format error.", "Name is `" + std::string(type) + "`.");
        if (is_reserved_type(type))
            return fail(errc::invalid_header, "Reserved header name.", "Name is `" + std::string(type) + "`.");
        if (!detail::is_valid_header_value(content))
            return fail(errc::invalid_header, "Header value format error.", "Value is `" + std::string(content) + "`.");
        return header(kind_t::GENERIC, std::string(type), std::string(content));
    }

    /**
    Creating the author header.

    @param sender    Author address.
    @param validator Validator applied to the address.
    @return          Header, or `errc::invalid_address`.
    **/
    [[nodiscard]] static result<header> from(std::string_view sender, const address_validator& validator = address_validator{})
    {
        if (!validator.validate(sender))
            return fail(errc::invalid_address, "Invalid address.", std::string(sender) + " is not a valid email address");
        return header(kind_t::FROM, std::string(FROM_TYPE), std::string(sender));
    }

    /**
    Creating the reply address header.

    The address is taken as given, only the header value rules are checked.
    **/
    [[nodiscard]] static result<header> reply_to(std::string_view address)
    {
        if (!detail::is_valid_header_value(address))
            return fail(errc::invalid_header, "Header value format error.", "Value is `" + std::string(address) + "`.");
        return header(kind_t::REPLY_TO, std::string(REPLY_TO_TYPE), std::string(address));
    }

    static header cc()
    {
        return header(kind_t::CC, std::string(CC_TYPE), recipient_list());
    }

    /**
    Creating the carbon copy header from a list.

    Recipients are added one by one, so repeated addresses are kept once.
    **/
    static header cc(const recipient_list& recipients)
    {
        header hdr = cc();
        hdr.add_all(recipients);
        return hdr;
    }

    static header bcc()
    {
        return header(kind_t::BCC, std::string(BCC_TYPE), recipient_list());
    }

    static header bcc(const recipient_list& recipients)
    {
        header hdr = bcc();
        hdr.add_all(recipients);
        return hdr;
    }

    kind_t kind() const { return kind_; }

    const std::string& type() const { return type_; }

    /**
    Checking if the header holds recipients instead of text.
    **/
    bool has_recipients() const
    {
        return std::holds_alternative<recipient_list>(payload_);
    }

    /**
    Getting the header value; for the recipient kinds the formatted recipient list.
    **/
    std::string content() const
    {
        return std::visit([](const auto& payload) -> std::string
            {
                if constexpr (std::is_same_v<std::decay_t<decltype(payload)>, recipient_list>)
                    return payload.to_string();
                else
                    return payload;
            }, payload_);
    }

    /**
    Getting the recipients of a Cc or Bcc header.

    @return Recipients, null for the other kinds.
    **/
    const recipient_list* recipients() const
    {
        return std::get_if<recipient_list>(&payload_);
    }

    /**
    Adding a recipient to a Cc or Bcc header.

    @param rcpt  Recipient to add.
    @return      Nothing, or `errc::duplicate_entry`.
    @throw error Header kind without recipients.
    **/
    [[nodiscard]] result<void> add_recipient(const recipient& rcpt)
    {
        return recipient_payload().add(rcpt);
    }

    /**
    Adding a recipient by address.

    @return      Nothing, `errc::invalid_address` or `errc::duplicate_entry`.
    @throw error Header kind without recipients.
    **/
    [[nodiscard]] result<void> add_recipient(std::string_view address, const address_validator& validator = address_validator{})
    {
        recipient_list& list = recipient_payload();
        auto rcpt = recipient::create(address, validator);
        if (!rcpt)
            return std::unexpected(rcpt.error());
        return list.add(*rcpt);
    }

    /**
    Adding a named recipient.

    @return      Nothing, `errc::invalid_address` or `errc::duplicate_entry`.
    @throw error Header kind without recipients.
    **/
    [[nodiscard]] result<void> add_recipient(std::string_view name, std::string_view address,
        const address_validator& validator = address_validator{})
    {
        recipient_list& list = recipient_payload();
        auto rcpt = recipient::create(name, address, validator);
        if (!rcpt)
            return std::unexpected(rcpt.error());
        return list.add(*rcpt);
    }

    /**
    Formatting as a header line without the line ending.
    **/
    std::string to_string() const
    {
        std::string line = type_;
        line += TYPE_SEPARATOR;
        line += content();
        return line;
    }

private:
    using payload_t = std::variant<std::string, recipient_list>;

    header(kind_t kind, std::string type, payload_t payload)
        : kind_(kind), type_(std::move(type)), payload_(std::move(payload))
    {
    }

    recipient_list& recipient_payload()
    {
        auto* list = std::get_if<recipient_list>(&payload_);
        if (list == nullptr)
            throw error("Header holds no recipients.", "Type is `" + type_ + "`.", errc::argument_type);
        return *list;
    }

    void add_all(const recipient_list& recipients)
    {
        for (const auto& rcpt : recipients)
        {
            if (!add_recipient(rcpt))
                MAILQ_DEBUG("Skipping repeated " + type_ + " recipient " + rcpt.address() + ".");
        }
    }

    kind_t kind_;
    std::string type_;
    payload_t payload_;
};


} // namespace mailq
