/*

recipient_list.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <mailq/mime/recipient.hpp>
#include <mailq/error.hpp>
#include <mailq/export.hpp>

namespace mailq
{


/**
Recipients in insertion order, unique by address.

Uniqueness is guaranteed by `add()`. Writing through the non-const index operator replaces an entry without checking
for duplicates.
**/
class MAILQ_EXPORT recipient_list
{
public:
    using container_type = std::vector<recipient>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;
    using size_type = container_type::size_type;

    /**
    Separator of the formatted recipients.
    **/
    static constexpr std::string_view SEPARATOR = ", ";

    recipient_list() = default;

    /**
    Adding a recipient if its address is not present yet.

    @param rcpt Recipient to add.
    @return     Nothing, or `errc::duplicate_entry` if the address is already in the list.
    **/
    [[nodiscard]] result<void> add(const recipient& rcpt)
    {
        if (contains(rcpt.address()))
            return fail(errc::duplicate_entry, "Duplicate recipient.", rcpt.address());
        recipients_.push_back(rcpt);
        return {};
    }

    /**
    Checking for an address, compared case sensitively.
    **/
    bool contains(std::string_view address) const
    {
        return std::any_of(recipients_.begin(), recipients_.end(),
            [address](const recipient& r) { return r.address() == address; });
    }

    /**
    Formatting the recipients separated by comma and space.

    @return Formatted list, empty string for the empty list.
    **/
    std::string to_string() const
    {
        std::string out;
        for (size_type i = 0; i < recipients_.size(); ++i)
        {
            if (i > 0)
                out += SEPARATOR;
            out += recipients_[i].to_string();
        }
        return out;
    }

    /**
    Removing all recipients.
    **/
    void reset()
    {
        recipients_.clear();
    }

    recipient& operator[](size_type index) { return recipients_[index]; }
    const recipient& operator[](size_type index) const { return recipients_[index]; }

    const recipient& at(size_type index) const { return recipients_.at(index); }

    size_type size() const { return recipients_.size(); }
    bool empty() const { return recipients_.empty(); }

    iterator begin() { return recipients_.begin(); }
    iterator end() { return recipients_.end(); }
    const_iterator begin() const { return recipients_.begin(); }
    const_iterator end() const { return recipients_.end(); }

private:
    container_type recipients_;
};


} // namespace mailq
