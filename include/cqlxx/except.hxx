/* Definition of cqlxx exception classes.
 *
 * cqlxx::decode_error, cqlxx::schema_mismatch, cqlxx::corrupted_state, ...
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/except instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_EXCEPT)
#  define CQLXX_H_EXCEPT

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <cstddef>
#  include <source_location>
#  include <stdexcept>
#  include <string>


namespace cqlxx
{
/**
 * @addtogroup exception Exception classes
 *
 * Every cqlxx exception derives from one of the standard exception classes,
 * so you can catch them generically.  Each of them also records the source
 * location from which it was thrown, in its `location` member.
 *
 * Roughly, there are three families:
 * * `conversion_error` and its children are about values which do not fit
 *   the type they are being converted to or from: bad wire data, values
 *   which violate their type's rules, unknown enum variants.
 * * `usage_error` and its children mean that the application set things up
 *   wrongly, e.g. a UDT definition which does not match the database schema.
 * * `paging_error` and its children mean that a paging token handed back by
 *   a caller could not be used.  These are recoverable: restart the query.
 *
 * @{
 */

/// Run-time failure encountered by cqlxx, similar to std::runtime_error.
struct CQLXX_LIBEXPORT failure : std::runtime_error
{
  explicit failure(
    std::string const &,
    std::source_location = std::source_location::current());
  std::source_location location;
};


/// Internal error in cqlxx library.
struct CQLXX_LIBEXPORT internal_error : std::logic_error
{
  explicit internal_error(
    std::string const &,
    std::source_location = std::source_location::current());
  std::source_location location;
};


/// Error in usage of cqlxx library, similar to std::logic_error.
struct CQLXX_LIBEXPORT usage_error : std::logic_error
{
  explicit usage_error(
    std::string const &,
    std::source_location = std::source_location::current());
  std::source_location location;
};


/// Invalid argument passed to cqlxx, similar to std::invalid_argument.
/** This is also what you get when a textual literal fails to parse.  The
 * message quotes the offending input.
 */
struct CQLXX_LIBEXPORT argument_error : std::invalid_argument
{
  explicit argument_error(
    std::string const &,
    std::source_location = std::source_location::current());
  std::source_location location;
};


/// Value conversion failed, e.g. when converting "Hello" to int.
struct CQLXX_LIBEXPORT conversion_error : std::domain_error
{
  explicit conversion_error(
    std::string const &,
    std::source_location = std::source_location::current());
  std::source_location location;
};


/// Wire data has a length which is impossible for its type.
/** This means corrupted data, or a mismatch between the version of the data
 * and the version of the code reading it.
 */
class CQLXX_LIBEXPORT decode_error : public conversion_error
{
public:
  decode_error(
    std::string const &whatarg, std::size_t expected, std::size_t actual,
    std::source_location = std::source_location::current());

  /// Number of bytes the decoder needed.
  [[nodiscard]] CQLXX_PURE std::size_t expected() const noexcept
  {
    return m_expected;
  }

  /// Number of bytes the decoder actually found.
  [[nodiscard]] CQLXX_PURE std::size_t actual() const noexcept
  {
    return m_actual;
  }

private:
  std::size_t m_expected;
  std::size_t m_actual;
};


/// A value violates the rules of the type it is being encoded as.
/** For example, a set may not contain a null element.
 */
struct CQLXX_LIBEXPORT illegal_value : conversion_error
{
  explicit illegal_value(
    std::string const &,
    std::source_location = std::source_location::current());
};


/// An enum's wire value does not match any of the enum's known variants.
class CQLXX_LIBEXPORT no_such_variant : public conversion_error
{
public:
  no_such_variant(
    std::string const &whatarg, std::string enum_name, std::string value,
    std::source_location = std::source_location::current());

  /// Name of the C++ enum type.
  [[nodiscard]] CQLXX_PURE std::string const &enum_name() const noexcept
  {
    return m_enum;
  }

  /// The wire value, as text, which did not match.
  [[nodiscard]] CQLXX_PURE std::string const &value() const noexcept
  {
    return m_value;
  }

private:
  std::string m_enum;
  std::string m_value;
};


/// Value is null, but the type it is being decoded as has no null.
struct CQLXX_LIBEXPORT unexpected_null : conversion_error
{
  explicit unexpected_null(
    std::string const &,
    std::source_location = std::source_location::current());
};


/// A user-defined type does not match the database schema's definition.
class CQLXX_LIBEXPORT schema_mismatch : public usage_error
{
public:
  schema_mismatch(
    std::string const &whatarg, std::string udt, std::string field,
    std::source_location = std::source_location::current());

  /// The user-defined type's CQL name.
  [[nodiscard]] CQLXX_PURE std::string const &udt() const noexcept
  {
    return m_udt;
  }

  /// The field which could not be matched up.
  [[nodiscard]] CQLXX_PURE std::string const &field() const noexcept
  {
    return m_field;
  }

private:
  std::string m_udt;
  std::string m_field;
};


/// No registered codec can handle the requested type or value.
struct CQLXX_LIBEXPORT codec_not_found : usage_error
{
  explicit codec_not_found(
    std::string const &,
    std::source_location = std::source_location::current());
};


/// A paging token could not be used to resume a query.
struct CQLXX_LIBEXPORT paging_error : failure
{
  explicit paging_error(
    std::string const &,
    std::source_location = std::source_location::current());
};


/// Paging token is damaged, or was never a paging token in the first place.
struct CQLXX_LIBEXPORT corrupted_state : paging_error
{
  explicit corrupted_state(
    std::string const &,
    std::source_location = std::source_location::current());
};


/// Paging token belongs to a different statement, or different parameters.
class CQLXX_LIBEXPORT statement_mismatch : public paging_error
{
public:
  statement_mismatch(
    std::string const &whatarg, std::string component,
    std::source_location = std::source_location::current());

  /// Which part of the statement differs: "query", "parameter count", or
  /// "parameter N".
  [[nodiscard]] CQLXX_PURE std::string const &component() const noexcept
  {
    return m_component;
  }

private:
  std::string m_component;
};

/**
 * @}
 */
} // namespace cqlxx
#endif
