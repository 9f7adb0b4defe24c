/* cqlxx test runner.
 *
 * Usage: runner [-j JOBS] [--list] [PREFIX...]
 *
 * Runs every registered test whose name starts with one of the given
 * prefixes, or all tests if there are none.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include <algorithm>
#include <atomic>
#include <charconv>
#include <functional>
#include <iostream>
#include <mutex>
#include <new>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <cqlxx/all>

#include "helpers.hxx"


namespace cqlxx::test
{
test_failure::test_failure(std::string const &desc, sl loc) :
        std::logic_error{desc}, location{loc}
{}

test_failure::~test_failure() noexcept = default;


std::vector<test_case> &registry()
{
  static std::vector<test_case> tests;
  return tests;
}


[[noreturn]] void check_notreached(std::string const &desc, sl loc)
{
  throw test_failure{desc, loc};
}


void check(bool condition, char const text[], std::string const &desc, sl loc)
{
  if (not condition)
    throw test_failure{
      internal::concat(desc, " (failed expression: '", text, "')"), loc};
}
} // namespace cqlxx::test


namespace
{
using cqlxx::test::test_case;


/// Command-line settings.
struct options
{
  unsigned jobs{4};
  bool list{false};
  std::vector<std::string_view> prefixes;
};


std::optional<options> parse_options(int argc, char const *argv[])
{
  options out;
  for (int arg{1}; arg < argc; ++arg)
  {
    std::string_view const here{argv[arg]};
    if (here == "--list")
    {
      out.list = true;
    }
    else if (here == "-j")
    {
      if (++arg == argc)
        return {};
      std::string_view const number{argv[arg]};
      auto const [end, err]{std::from_chars(
        std::data(number), std::data(number) + std::size(number), out.jobs)};
      if (
        err != std::errc{} or end != std::data(number) + std::size(number) or
        out.jobs == 0)
        return {};
    }
    else
    {
      out.prefixes.push_back(here);
    }
  }
  return out;
}


/// Pick the tests to run, sorted by name.
std::vector<test_case>
select_tests(std::vector<std::string_view> const &prefixes)
{
  std::vector<test_case> out;
  for (auto const &t : cqlxx::test::registry())
    if (
      std::empty(prefixes) or
      std::any_of(
        std::begin(prefixes), std::end(prefixes),
        [&t](std::string_view p) { return t.name.starts_with(p); }))
      out.push_back(t);
  std::sort(std::begin(out), std::end(out), [](auto const &a, auto const &b) {
    return a.name < b.name;
  });
  return out;
}


/// Describe an exception which came out of a test.
/** Our own exceptions know where they were thrown, so say that as well.
 */
template<typename EXCEPTION>
std::string describe(std::string_view kind, EXCEPTION const &err)
{
  if constexpr (requires { err.location; })
    return cqlxx::internal::concat(
      kind, " at ", err.location.file_name(), ":", err.location.line(), ": ",
      err.what());
  else
    return cqlxx::internal::concat(kind, ": ", err.what());
}


/// Run one test.  Return a failure message if it fails.
std::optional<std::string> run_test(test_case const &t)
{
  try
  {
    t.func();
  }
  catch (cqlxx::test::test_failure const &e)
  {
    return describe("Failed", e);
  }
  catch (std::bad_alloc const &)
  {
    return "Out of memory";
  }
  catch (cqlxx::conversion_error const &e)
  {
    return describe("Conversion error", e);
  }
  catch (cqlxx::paging_error const &e)
  {
    return describe("Paging error", e);
  }
  catch (cqlxx::failure const &e)
  {
    return describe("Failure", e);
  }
  catch (cqlxx::usage_error const &e)
  {
    return describe("Usage error", e);
  }
  catch (cqlxx::internal_error const &e)
  {
    return describe("Internal error", e);
  }
  catch (cqlxx::argument_error const &e)
  {
    return describe("Argument error", e);
  }
  catch (std::exception const &e)
  {
    return describe("Exception", e);
  }
  return {};
}


/// Runs a list of tests on a pool of worker threads.
class test_pool final
{
public:
  explicit test_pool(std::vector<test_case> tests) : m_tests{std::move(tests)}
  {}

  /// Run all tests.  Returns the failures, sorted by test name.
  std::vector<std::string> run(unsigned jobs)
  {
    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (unsigned j{0}; j < jobs; ++j)
      workers.emplace_back(std::mem_fn(&test_pool::work), this);
    for (auto &w : workers) w.join();
    std::sort(std::begin(m_failures), std::end(m_failures));
    return m_failures;
  }

private:
  void work()
  {
    for (auto idx{m_next++}; idx < std::size(m_tests); idx = m_next++)
    {
      auto const &t{m_tests[idx]};
      if (auto const msg{run_test(t)}; msg.has_value())
      {
        auto line{cqlxx::internal::concat(t.name, " -- ", *msg)};
        std::lock_guard const lock{m_lock};
        std::cerr << line << '\n';
        m_failures.push_back(std::move(line));
      }
    }
  }

  std::vector<test_case> const m_tests;
  std::atomic<std::size_t> m_next{0};
  std::mutex m_lock;
  std::vector<std::string> m_failures;
};
} // namespace


int main(int argc, char const *argv[])
{
  auto const opts{parse_options(argc, argv)};
  if (not opts.has_value())
  {
    std::cerr << "Usage: " << argv[0] << " [-j JOBS] [--list] [PREFIX...]\n";
    return 2;
  }

  std::set<std::string_view> seen;
  for (auto const &t : cqlxx::test::registry())
    if (not seen.insert(t.name).second)
    {
      std::cerr << "Test registered twice: " << t.name << ".\n";
      return 2;
    }

  auto tests{select_tests(opts->prefixes)};
  if (std::empty(tests))
  {
    std::cerr << "No tests match.\n";
    return 2;
  }
  if (opts->list)
  {
    for (auto const &t : tests) std::cout << t.name << '\n';
    return 0;
  }

  auto const count{std::size(tests)};
  test_pool pool{std::move(tests)};
  auto const failures{pool.run(opts->jobs)};

  std::cout << "Ran " << count << ((count == 1) ? " test.\n" : " tests.\n");
  if (std::empty(failures))
  {
    std::cout << "Tests OK.\n";
    return 0;
  }

  std::cerr << "\n*** " << std::size(failures) << " test(s) failed: ***\n";
  for (auto const &f : failures) std::cerr << "- " << f << '\n';
  return 1;
}
