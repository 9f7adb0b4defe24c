/** The cqlxx logger.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/internal/log.hxx"

#include "cqlxx/internal/header-post.hxx"


namespace
{
std::shared_ptr<spdlog::logger> make_logger()
{
  std::string const name{cqlxx::internal::logger_name};
  if (auto existing{spdlog::get(name)}; existing)
    return existing;

  auto log{std::make_shared<spdlog::logger>(
    name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>())};
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

  auto level{spdlog::level::warn};
  if (char const *const env{std::getenv("CQLXX_LOG_LEVEL")}; env != nullptr)
    level = spdlog::level::from_str(env);
  log->set_level(level);

  spdlog::register_logger(log);
  return log;
}
} // namespace


spdlog::logger &cqlxx::internal::logger()
{
  // Thread-safe initialisation, and it keeps the logger alive.
  static std::shared_ptr<spdlog::logger> const log{make_logger()};
  return *log;
}
