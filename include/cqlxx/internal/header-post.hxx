/* Closes a batch of cqlxx headers opened by header-pre.hxx.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */

// No include guard: this runs once per batch of headers.

#if !defined(CQLXX_HEADER_PRE)
#  error "Include cqlxx/internal/header-post.hxx after header-pre.hxx."
#endif

#undef CQLXX_HEADER_PRE
