/* Attribute macros and visibility settings for the cqlxx headers.
 *
 * Every batch of cqlxx headers starts with this file and ends with
 * header-post.hxx.  The public wrapper headers (e.g. `<cqlxx/codec>`) do
 * that for you, so applications never include this directly.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */

// No include guard: this runs once per batch of headers.

#if defined(CQLXX_HEADER_PRE)
#  error "Nested include of cqlxx/internal/header-pre.hxx."
#endif
#define CQLXX_HEADER_PRE

#include <version>


/// Function has no side effects, and its result depends only on its inputs.
/** Only for functions which can't throw: the compiler may drop or move calls.
 */
#if __has_cpp_attribute(gnu::pure)
#  define CQLXX_PURE [[gnu::pure]]
#else
#  define CQLXX_PURE
#endif

/// Function is on an error path.  Optimise it for size.
#if __has_cpp_attribute(gnu::cold)
#  define CQLXX_COLD [[gnu::cold]]
#else
#  define CQLXX_COLD
#endif


// Symbols which the library exports.  A shared build on Windows imports them
// explicitly; cqlxx-source.hxx overrides this when building the library.
#if defined(_WIN32)
#  if defined(CQLXX_SHARED) && !defined(CQLXX_LIBEXPORT)
#    define CQLXX_LIBEXPORT __declspec(dllimport)
#  endif
#elif __has_cpp_attribute(gnu::visibility)
#  define CQLXX_LIBEXPORT [[gnu::visibility("default")]]
#endif

#if !defined(CQLXX_LIBEXPORT)
#  define CQLXX_LIBEXPORT
#endif
