//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2011 Anton Dedov
//  Copyright (C) 2019-2026 Yaroslav Gorbunov

#ifndef LIBBYTECONV_API_EXPORT_H
#define LIBBYTECONV_API_EXPORT_H

#if defined(_WIN32) && !defined(LIBBYTECONV_STATIC)
#  ifdef LIBBYTECONV_EXPORTS
#    define LIBBYTECONV_API __declspec(dllexport)
#  else
#    define LIBBYTECONV_API __declspec(dllimport)
#  endif
#elif defined(__GNUC__) && __GNUC__ >= 4
#  define LIBBYTECONV_API __attribute__((visibility("default")))
#else
#  define LIBBYTECONV_API
#endif

#endif
