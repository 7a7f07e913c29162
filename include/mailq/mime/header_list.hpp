/*

header_list.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <mailq/mime/header.hpp>
#include <mailq/error.hpp>
#include <mailq/export.hpp>

namespace mailq
{


/**
Headers in insertion order, at most one per type name.

Type names are compared case sensitively. As with `recipient_list`, the non-const index operator bypasses the
uniqueness check.
**/
class MAILQ_EXPORT header_list
{
public:
    using container_type = std::vector<header>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;
    using size_type = container_type::size_type;

    /**
    Separator of the formatted header lines.
    **/
    static constexpr std::string_view LINE_SEPARATOR = "\r\n";

    header_list() = default;

    /**
    Adding a header if no header of the same type exists.

    @param hdr Header to add.
    @return    Nothing, or `errc::duplicate_entry`.
    **/
    [[nodiscard]] result<void> add(header hdr)
    {
        if (find(hdr.type()) != nullptr)
            return fail(errc::duplicate_entry, "Duplicate header.", "Type is `" + hdr.type() + "`.");
        headers_.push_back(std::move(hdr));
        return {};
    }

    /**
    Looking up a header by type name.

    @param type Header type name.
    @return     First header of the type, null if there is none.
    **/
    const header* find(std::string_view type) const
    {
        auto it = std::find_if(headers_.begin(), headers_.end(),
            [type](const header& h) { return h.type() == type; });
        return it == headers_.end() ? nullptr : &*it;
    }

    header* find(std::string_view type)
    {
        auto it = std::find_if(headers_.begin(), headers_.end(),
            [type](const header& h) { return h.type() == type; });
        return it == headers_.end() ? nullptr : &*it;
    }

    bool contains(std::string_view type) const
    {
        return find(type) != nullptr;
    }

    /**
    Removing the header of the given type.

    @return True if a header was removed.
    **/
    bool remove(std::string_view type)
    {
        auto it = std::find_if(headers_.begin(), headers_.end(),
            [type](const header& h) { return h.type() == type; });
        if (it == headers_.end())
            return false;
        headers_.erase(it);
        return true;
    }

    /**
    Formatting the header block: lines joined by CRLF, without the trailing one.
    **/
    std::string to_string() const
    {
        std::string out;
        for (size_type i = 0; i < headers_.size(); ++i)
        {
            if (i > 0)
                out += LINE_SEPARATOR;
            out += headers_[i].to_string();
        }
        return out;
    }

    void reset()
    {
        headers_.clear();
    }

    header& operator[](size_type index) { return headers_[index]; }
    const header& operator[](size_type index) const { return headers_[index]; }

    const header& at(size_type index) const { return headers_.at(index); }

    size_type size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    iterator begin() { return headers_.begin(); }
    iterator end() { return headers_.end(); }
    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

private:
    container_type headers_;
};


} // namespace mailq
