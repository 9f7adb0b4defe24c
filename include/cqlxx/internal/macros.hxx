/* Preprocessor helpers for the derivation macros.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it where needed.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_MACROS)
#  define CQLXX_H_MACROS

// Rescan a macro expansion enough times to unroll up to 256 items.
#  define CQLXX_EXPAND(...)                                                   \
    CQLXX_EXPAND4(CQLXX_EXPAND4(CQLXX_EXPAND4(CQLXX_EXPAND4(__VA_ARGS__))))
#  define CQLXX_EXPAND4(...)                                                  \
    CQLXX_EXPAND3(CQLXX_EXPAND3(CQLXX_EXPAND3(CQLXX_EXPAND3(__VA_ARGS__))))
#  define CQLXX_EXPAND3(...)                                                  \
    CQLXX_EXPAND2(CQLXX_EXPAND2(CQLXX_EXPAND2(CQLXX_EXPAND2(__VA_ARGS__))))
#  define CQLXX_EXPAND2(...)                                                  \
    CQLXX_EXPAND1(CQLXX_EXPAND1(CQLXX_EXPAND1(CQLXX_EXPAND1(__VA_ARGS__))))
#  define CQLXX_EXPAND1(...) __VA_ARGS__

#  define CQLXX_PARENS ()

/// Apply `macro(arg, item)` to each item, separating the results by commas.
#  define CQLXX_FOR_EACH(macro, arg, ...)                                     \
    __VA_OPT__(CQLXX_EXPAND(CQLXX_FOR_EACH_HELPER(macro, arg, __VA_ARGS__)))
#  define CQLXX_FOR_EACH_HELPER(macro, arg, item, ...)                        \
    macro(arg, item) __VA_OPT__(                                              \
      , CQLXX_FOR_EACH_AGAIN CQLXX_PARENS(macro, arg, __VA_ARGS__))
#  define CQLXX_FOR_EACH_AGAIN() CQLXX_FOR_EACH_HELPER

#endif
