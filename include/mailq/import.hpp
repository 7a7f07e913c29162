#pragma once

// Use only when the toolchain supports C++20 modules and the mailq module interface is built.
#if defined(MAILQ_USE_MODULES)
import mailq;
#include <mailq/macros.hpp>
#else
#include <mailq/mailq.hpp>
#endif
