#pragma once

#include <string_view>

namespace mailq
{
namespace detail
{
    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // Hostname characters accepted in the domain part of an address.
    [[nodiscard]] constexpr bool is_domain_char(char c) noexcept
    {
        return is_ascii_alnum(c) || c == '.' || c == '-';
    }

    // RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        for (char ch : name)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            const bool ok = ((c >= 33 && c <= 57) || (c >= 59 && c <= 126));
            if (!ok)
                return false;
        }
        return true;
    }

    // Conservative validation: reject CR/LF and other control characters (except TAB).
    [[nodiscard]] inline bool is_valid_header_value(std::string_view value) noexcept
    {
        for (char ch : value)
        {
            unsigned char c = static_cast<unsigned char>(ch);

            if (ch == '\r' || ch == '\n')
                return false;
            if (c < 32 && ch != '\t')
                return false;
            if (c == 127)
                return false;
        }
        return true;
    }
}
}
