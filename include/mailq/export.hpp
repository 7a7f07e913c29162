#pragma once

// The library is header-only; symbols are exported only from the module library.
#ifndef MAILQ_EXPORT
#  if defined(_WIN32) || defined(__CYGWIN__)
#    if defined(MAILQ_USE_MODULES) && defined(MAILQ_EXPORTS)
#      define MAILQ_EXPORT __declspec(dllexport)
#    else
#      define MAILQ_EXPORT
#    endif
#  elif defined(__GNUC__) && __GNUC__ >= 4
#    define MAILQ_EXPORT __attribute__((visibility("default")))
#  else
#    define MAILQ_EXPORT
#  endif
#endif
