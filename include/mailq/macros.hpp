/*

macros.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

// Macros only, so the file can follow `import mailq;`.

#include <expected>


/**
Returning the failure of `expr` from the enclosing function, which must return a `result`.
**/
#define MAILQ_TRY(expr) \
    do { \
        auto&& _mailq_res = (expr); \
        if (!_mailq_res) \
            return std::unexpected(_mailq_res.error()); \
    } while (0)


#define MAILQ_LOG(lvl, msg) \
    do { \
        if (::mailq::log::enabled(lvl)) \
            ::mailq::log::write(lvl, (msg)); \
    } while (0)

#define MAILQ_DEBUG(msg) MAILQ_LOG(::mailq::log::level::debug, msg)
#define MAILQ_INFO(msg) MAILQ_LOG(::mailq::log::level::info, msg)
#define MAILQ_WARN(msg) MAILQ_LOG(::mailq::log::level::warning, msg)
#define MAILQ_ERROR(msg) MAILQ_LOG(::mailq::log::level::error, msg)
