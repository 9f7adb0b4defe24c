/* Internal access to the library's logger.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it where needed.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_LOG)
#  define CQLXX_H_LOG

#  include <memory>
#  include <string_view>

#  include <spdlog/spdlog.h>

namespace cqlxx::internal
{
/// Name under which cqlxx registers its logger with spdlog.
inline constexpr std::string_view logger_name{"cqlxx"};


/// The cqlxx logger.
/** If the application has registered a logger called "cqlxx" with spdlog
 * before cqlxx first needs one, cqlxx uses that.  Otherwise it creates one
 * which writes to standard error.  Its level comes from the environment
 * variable `CQLXX_LOG_LEVEL` if set, or defaults to "warn".
 */
[[nodiscard]] CQLXX_LIBEXPORT spdlog::logger &logger();
} // namespace cqlxx::internal


#  define CQLXX_LOG_DEBUG(...) ::cqlxx::internal::logger().debug(__VA_ARGS__)
#  define CQLXX_LOG_WARN(...) ::cqlxx::internal::logger().warn(__VA_ARGS__)
#endif
