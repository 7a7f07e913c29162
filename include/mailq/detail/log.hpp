/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <iostream>
#include <utility>
#include <mailq/macros.hpp>

namespace mailq::log
{

enum class level
{
    debug,
    info,
    warning,
    error,
    none
};


inline const char* level_name(level lvl) noexcept
{
    switch (lvl)
    {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
        case level::none:
            break;
    }
    return "none";
}


/**
Receiver of every message passing the level filter.
**/
using sink_t = std::function<void(level, std::string_view)>;


namespace detail
{

struct state
{
    std::mutex mutex;
    level threshold = level::warning;
    sink_t sink;
};


inline state& global()
{
    static state st;
    return st;
}


inline void default_sink(level lvl, std::string_view text)
{
    std::clog << "mailq " << level_name(lvl) << ": " << text << std::endl;
}

} // namespace detail


/**
Replacing the sink; an empty sink restores the default one writing to `std::clog`.
**/
inline void set_sink(sink_t sink)
{
    auto& st = detail::global();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.sink = std::move(sink);
}


/**
Setting the lowest level that reaches the sink.
**/
inline void set_level(level lvl)
{
    auto& st = detail::global();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.threshold = lvl;
}


inline level current_level()
{
    auto& st = detail::global();
    std::lock_guard<std::mutex> lock(st.mutex);
    return st.threshold;
}


inline bool enabled(level lvl)
{
    return lvl != level::none && lvl >= current_level();
}


inline void write(level lvl, std::string_view text)
{
    auto& st = detail::global();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (lvl == level::none || lvl < st.threshold)
        return;
    if (st.sink)
        st.sink(lvl, text);
    else
        detail::default_sink(lvl, text);
}

} // namespace mailq::log
