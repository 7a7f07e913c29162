/*

message.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <utility>
#include <mailq/detail/log.hpp>
#include <mailq/mime/address_validator.hpp>
#include <mailq/mime/header.hpp>
#include <mailq/mime/header_list.hpp>
#include <mailq/mime/recipient.hpp>
#include <mailq/mime/recipient_list.hpp>
#include <mailq/net/domain_resolver.hpp>
#include <mailq/transport/transport.hpp>
#include <mailq/error.hpp>
#include <mailq/export.hpp>
#include <mailq/version.hpp>


namespace mailq
{

/**
Options of a message.
**/
struct message_options
{
    /**
    Product name of the `X-Mailer` header.
    **/
    std::string mailer_name = PRODUCT_NAME;

    /**
    Product version of the `X-Mailer` header.
    **/
    std::string mailer_version = VERSION;

    /**
    Resolver checking the domains of the message addresses, null for syntax checks only.
    **/
    std::shared_ptr<const net::domain_resolver> resolver;
};


/**
Mail message with To recipients, author, carbon copies and other headers, sent in batch or one recipient at a time.
**/
class MAILQ_EXPORT message
{
public:

    static constexpr std::string_view MAILER_HEADER = "X-Mailer";
    static constexpr std::string_view TO_HEADER = "To";

    /**
    Prefix of the error recorded for a failed delivery.
    **/
    static constexpr std::string_view SEND_ERROR_PREFIX = "Unable to send to ";

    /**
    Creating an empty message carrying the `X-Mailer` header.

    @param options     Mailer name and version, resolver for the address checks.
    @throw error       Mailer name or version not usable as a header value.
    **/
    explicit message(message_options options = message_options{})
        : options_(std::move(options)), validator_(options_.resolver)
    {
        reset();
    }

    message(const message&) = default;

    message(message&&) = default;

    ~message() = default;

    message& operator=(const message&) = default;

    message& operator=(message&&) = default;

    /**
    Clearing subject, content, recipients, headers and errors; the `X-Mailer` header is added again.

    @throw error Mailer name or version not usable as a header value.
    **/
    void reset()
    {
        subject_.clear();
        content_.clear();
        to_.reset();
        headers_.reset();
        errors_.clear();

        auto mailer = header::generic(MAILER_HEADER, options_.mailer_name + " " + options_.mailer_version);
        if (!mailer)
            throw error(mailer.error().message, mailer.error().details, errc::invalid_header);
        auto added = headers_.add(std::move(*mailer));
        if (!added)
            throw error(added.error().message, added.error().details, errc::duplicate_entry);
    }

    /**
    Setting the author.

    @param address Author address.
    @return        Nothing, `errc::invalid_address`, or `errc::duplicate_entry` if the author is already set.
    **/
    [[nodiscard]] result<void> from(std::string_view address)
    {
        auto hdr = header::from(address, validator_);
        if (!hdr)
            return std::unexpected(hdr.error());
        return headers_.add(std::move(*hdr));
    }

    /**
    Getting the author header.

    @return Header, null if the author is not set.
    **/
    const header* from() const
    {
        return headers_.find(header::FROM_TYPE);
    }

    /**
    Setting the reply address.

    @return Nothing, `errc::invalid_header` or `errc::duplicate_entry`.
    **/
    [[nodiscard]] result<void> reply_to(std::string_view address)
    {
        auto hdr = header::reply_to(address);
        if (!hdr)
            return std::unexpected(hdr.error());
        return headers_.add(std::move(*hdr));
    }

    const header* reply_to() const
    {
        return headers_.find(header::REPLY_TO_TYPE);
    }

    /**
    Replacing the To recipients.
    **/
    void to(recipient_list recipients)
    {
        to_ = std::move(recipients);
    }

    const recipient_list& to() const
    {
        return to_;
    }

    /**
    Setting the carbon copy recipients.

    @param recipients Recipients copied into the Cc header.
    @return           Nothing, or `errc::duplicate_entry` if the Cc header is already set.
    **/
    [[nodiscard]] result<void> cc(const recipient_list& recipients)
    {
        return headers_.add(header::cc(recipients));
    }

    const header* cc() const
    {
        return headers_.find(header::CC_TYPE);
    }

    /**
    Setting the blind carbon copy recipients.

    @param recipients Recipients copied into the Bcc header.
    @return           Nothing, or `errc::duplicate_entry` if the Bcc header is already set.
    **/
    [[nodiscard]] result<void> bcc(const recipient_list& recipients)
    {
        return headers_.add(header::bcc(recipients));
    }

    const header* bcc() const
    {
        return headers_.find(header::BCC_TYPE);
    }

    void subject(std::string text)
    {
        subject_ = std::move(text);
    }

    const std::string& subject() const
    {
        return subject_;
    }

    void content(std::string text)
    {
        content_ = std::move(text);
    }

    const std::string& content() const
    {
        return content_;
    }

    /**
    Adding a To recipient by address.

    @return Nothing, `errc::invalid_address` or `errc::duplicate_entry`.
    **/
    [[nodiscard]] result<void> add_recipient(std::string_view address)
    {
        auto rcpt = recipient::create(address, validator_);
        if (!rcpt)
        {
            MAILQ_WARN("message::add_recipient: " + rcpt.error().details);
            return std::unexpected(rcpt.error());
        }
        return to_.add(*rcpt);
    }

    /**
    Adding a named To recipient.

    @return Nothing, `errc::invalid_address` or `errc::duplicate_entry`.
    **/
    [[nodiscard]] result<void> add_recipient(std::string_view name, std::string_view address)
    {
        auto rcpt = recipient::create(name, address, validator_);
        if (!rcpt)
        {
            MAILQ_WARN("message::add_recipient: " + rcpt.error().details);
            return std::unexpected(rcpt.error());
        }
        return to_.add(*rcpt);
    }

    [[nodiscard]] result<void> add_recipient(const recipient& rcpt)
    {
        return to_.add(rcpt);
    }

    /**
    Adding another header.

    The From, Reply-To, Cc and Bcc names are refused with `errc::invalid_header`; their own setters apply.

    @param type    Header name.
    @param content Header value.
    @return        Nothing, `errc::invalid_header` or `errc::duplicate_entry`.
    **/
    [[nodiscard]] result<void> add_header(std::string_view type, std::string_view content)
    {
        auto hdr = header::generic(type, content);
        if (!hdr)
            return std::unexpected(hdr.error());
        return headers_.add(std::move(*hdr));
    }

    /**
    Removing a header, including the ones set by the other methods.

    @return True if the header existed.
    **/
    bool remove_header(std::string_view type)
    {
        return headers_.remove(type);
    }

    const header_list& headers() const
    {
        return headers_;
    }

    const address_validator& validator() const
    {
        return validator_;
    }

    /**
    Formatting the message: author, To, Cc and Bcc lines followed by the content and an empty line.

    Without an author the first line is empty.
    **/
    std::string format() const
    {
        std::string out;
        if (const header* author = from())
            out += author->to_string();
        out += '\n';
        out += TO_HEADER;
        out += header::TYPE_SEPARATOR;
        out += to_.to_string();
        out += '\n';
        if (const header* copy = cc())
        {
            out += copy->to_string();
            out += '\n';
        }
        if (const header* blind = bcc())
        {
            out += blind->to_string();
            out += '\n';
        }
        out += content_;
        out += "\n\n";
        return out;
    }

    /**
    Sending the message.

    In batch mode the transport is called once with all To recipients on one line. Otherwise it is called once per
    recipient in list order, and a failure is recorded without stopping the remaining deliveries. Errors of a
    previous call are cleared first.

    @param transp Delivery capability.
    @param batch  Flag for one call with all recipients.
    @return       Number of failed deliveries; at most one in batch mode.
    **/
    std::size_t send(transport& transp, bool batch = false)
    {
        errors_.clear();
        const std::string header_block = headers_.to_string();

        if (batch)
        {
            const std::string line = to_.to_string();
            MAILQ_DEBUG("Sending batch to " + line + ".");
            if (!transp.send(line, subject_, content_, header_block))
                record_failure(line);
            return errors_.size();
        }

        MAILQ_DEBUG("Sending to " + std::to_string(to_.size()) + " recipients one by one.");
        for (const auto& rcpt : to_)
        {
            const std::string line = rcpt.to_string();
            if (!transp.send(line, subject_, content_, header_block))
                record_failure(line);
        }
        MAILQ_DEBUG("Sent to " + std::to_string(to_.size() - errors_.size()) + " of " + std::to_string(to_.size()) +
            " recipients.");
        return errors_.size();
    }

    /**
    Sending the message once to all recipients.
    **/
    std::size_t batch_send(transport& transp)
    {
        return send(transp, true);
    }

    /**
    Getting the delivery errors of the last send.
    **/
    const std::vector<std::string>& errors() const
    {
        return errors_;
    }

private:
    void record_failure(const std::string& line)
    {
        std::string msg(SEND_ERROR_PREFIX);
        msg += line;
        MAILQ_WARN(msg);
        errors_.push_back(std::move(msg));
    }

    message_options options_;
    address_validator validator_;
    std::string subject_;
    std::string content_;
    recipient_list to_;
    header_list headers_;
    std::vector<std::string> errors_;
};


} // namespace mailq


#ifdef _MSC_VER
#pragma warning(pop)
#endif
