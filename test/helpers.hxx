/* Test framework for the cqlxx unit tests.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_TEST_HELPERS)
#  define CQLXX_H_TEST_HELPERS

#  include <concepts>
#  include <cstddef>
#  include <optional>
#  include <sstream>
#  include <stdexcept>
#  include <string>
#  include <string_view>
#  include <type_traits>
#  include <vector>

#  include <cqlxx/all>

namespace cqlxx::test
{
/// Exception: a test found something it did not expect.
class test_failure : public std::logic_error
{
public:
  test_failure(std::string const &desc, sl loc = sl::current());
  ~test_failure() noexcept override;

  sl const location;
};


using testfunc = void (*)();


/// A registered test: its name, and the function which runs it.
struct test_case
{
  std::string_view name;
  testfunc func;
};


/// All tests in the runner, in registration order.
/** Registrations happen during static initialisation, from many translation
 * units.  A function-local static gets constructed on first use, so it is
 * always there by the time a registration needs it.
 */
[[nodiscard]] std::vector<test_case> &registry();


/// Register a test function at static initialisation time.
struct registrar
{
  registrar(char const name[], testfunc func)
  {
    registry().push_back({name, func});
  }
};


// Register a test function, so the runner will run it.
#  define CQLXX_REGISTER_TEST(func)                                           \
    [[maybe_unused]] cqlxx::test::registrar const tst_##func{#func, func}


/// Build a byte string from a list of byte values.
template<std::integral... VALUES> inline bytes make_bytes(VALUES... values)
{
  return bytes{static_cast<std::byte>(values)...};
}


/// Represent a value as a string, for failure messages.
/** Binary data shows up as hex.
 */
template<typename T> inline std::string to_string(T const &value)
{
  if constexpr (std::is_same_v<T, bytes>)
  {
    return internal::concat("0x", internal::to_hex(value));
  }
  else if constexpr (std::is_same_v<T, wire_value>)
  {
    if (not value.has_value())
      return std::string{internal::null_literal};
    return internal::concat("0x", internal::to_hex(*value));
  }
  else if constexpr (std::is_same_v<T, std::string>)
  {
    return internal::concat('"', value, '"');
  }
  else if constexpr (std::is_enum_v<T>)
  {
    return internal::concat(
      "enum value ",
      static_cast<long long>(static_cast<std::underlying_type_t<T>>(value)));
  }
  else if constexpr (requires(std::ostream &os) { os << value; })
  {
    std::ostringstream out;
    out << std::boolalpha << value;
    return out.str();
  }
  else
  {
    return "<value>";
  }
}


// Unconditional test failure.
[[noreturn]] void check_notreached(
  std::string const &desc =
    "Execution was never supposed to reach this point.",
  sl loc = sl::current());


// Verify that a condition holds.
// Takes an optional failure description as a second argument.
#  define CQLXX_CHECK(condition, ...)                                         \
    cqlxx::test::check((condition), #condition __VA_OPT__(, ) __VA_ARGS__)

void check(
  bool condition, char const text[],
  std::string const &desc = "Condition check failed.", sl loc = sl::current());


// Verify that a value is what the test expects.
// Takes an optional failure description as a third argument.
#  define CQLXX_CHECK_EQUAL(actual, expected, ...)                            \
    cqlxx::test::check_equal(                                                 \
      (actual), #actual, (expected), #expected __VA_OPT__(, ) __VA_ARGS__)

template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[],
  std::string const &desc = "Equality check failed.", sl loc = sl::current())
{
  if (expected == actual)
    return;
  throw test_failure{
    internal::concat(
      desc, " (", actual_text, " <> ", expected_text,
      ": actual=", cqlxx::test::to_string(actual),
      ", expected=", cqlxx::test::to_string(expected), ")"),
    loc};
}


// Verify that two values differ.
// Takes an optional failure description as a third argument.
#  define CQLXX_CHECK_NOT_EQUAL(value1, value2, ...)                          \
    cqlxx::test::check_not_equal(                                             \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Inequality check failed.",
  sl loc = sl::current())
{
  if (value1 != value2)
    return;
  throw test_failure{
    internal::concat(
      desc, " (", text1, " == ", text2,
      ": both are ", cqlxx::test::to_string(value2), ")"),
    loc};
}


// Verify that "action" does not throw.
// Takes an optional failure description as a second argument.
#  define CQLXX_CHECK_SUCCEEDS(action, ...)                                   \
    cqlxx::test::check_succeeds(                                              \
      ([&]() { action; }), #action __VA_OPT__(, ) __VA_ARGS__)

template<std::invocable F>
inline void check_succeeds(
  F &&f, char const text[], std::string const &desc = "Expected success.",
  sl loc = sl::current())
{
  try
  {
    f();
  }
  catch (std::exception const &e)
  {
    check_notreached(
      internal::concat(desc, " (\"", text, "\" threw: ", e.what(), ")"), loc);
  }
}


// Verify that "action" throws "exception_type".
// Takes an optional failure description as a third argument.
#  define CQLXX_CHECK_THROWS(action, exception_type, ...)                     \
    cqlxx::test::check_throws<exception_type>(                                \
      ([&] { return action, 0; }), #action __VA_OPT__(, ) __VA_ARGS__)

template<typename EXC, std::invocable F>
inline void check_throws(
  F &&f, char const text[],
  std::string const &desc = "Expected an exception.", sl loc = sl::current())
{
  try
  {
    f();
  }
  catch (EXC const &)
  {
    return;
  }
  catch (std::exception const &e)
  {
    check_notreached(
      internal::concat(
        desc, " (\"", text, "\" threw the wrong exception type: ", e.what(),
        ")"),
      loc);
  }
  check_notreached(
    internal::concat(desc, " (\"", text, "\" did not throw)"), loc);
}
} // namespace cqlxx::test
#endif
