/* Settings for compiling the cqlxx library itself.
 *
 * Every source file in the library includes this first, before any other
 * header.  Applications never include it.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_SOURCE)
#  define CQLXX_H_SOURCE

#  if defined(_WIN32) && defined(CQLXX_SHARED)
#    define CQLXX_LIBEXPORT __declspec(dllexport)
#  endif

#endif
