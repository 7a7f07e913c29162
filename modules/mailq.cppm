/*

mailq.cppm
----------

C++20 module interface for mailq library.

Every header is exported from this single unit, so each entity is attached to one module. Macros do not cross
`import mailq;`; `mailq/import.hpp` includes `mailq/macros.hpp` after the import for `MAILQ_TRY` and the log macros.

Usage:
    #include <mailq/import.hpp>

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

module;

// Global module fragment - non-modular dependencies
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <ctime>
#include <expected>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <pthread.h>
#include <signal.h>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/regex.hpp>

#define MAILQ_MODULE_INTERFACE

export module mailq;

export {
    #include <mailq/mailq.hpp>
}

#include <mailq/error_enum.hpp>
