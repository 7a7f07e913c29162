/*

error_enum.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <system_error>
#include <mailq/error.hpp>


namespace std
{

template<>
struct is_error_code_enum<mailq::errc> : true_type
{
};

} // namespace std
