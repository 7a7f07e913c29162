/*

version.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#define MAILQ_VERSION_MAJOR 0
#define MAILQ_VERSION_MINOR 1

namespace mailq
{

/**
Product name announced in the default `X-Mailer` header.
**/
inline constexpr const char* PRODUCT_NAME = "MailQueue";

/**
Version announced in the default `X-Mailer` header.
**/
inline constexpr const char* VERSION = "0.1";

} // namespace mailq
