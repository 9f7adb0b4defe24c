/* Result rows, and mapping them to C++ types.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/row instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_ROW)
#  define CQLXX_H_ROW

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <any>
#  include <functional>
#  include <memory>
#  include <optional>
#  include <string>
#  include <string_view>
#  include <tuple>
#  include <type_traits>
#  include <utility>
#  include <variant>
#  include <vector>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/data_type.hxx"
#  include "cqlxx/except.hxx"
#  include "cqlxx/internal/log.hxx"
#  include "cqlxx/udt.hxx"


namespace cqlxx
{
/// One column of a result row: its name, its CQL type, and its raw value.
struct CQLXX_LIBEXPORT column
{
  std::string name;
  data_type type;
  wire_value value;

  [[nodiscard]] bool is_null() const noexcept { return not value.has_value(); }
};


/// A row of a query result, as the statement layer hands it over.
/** Columns are in the order of the query's select list.  Column names are
 * compared exactly.
 */
class CQLXX_LIBEXPORT row
{
public:
  row() = default;
  explicit row(std::vector<column> columns);

  [[nodiscard]] std::size_t size() const noexcept
  {
    return std::size(m_columns);
  }
  [[nodiscard]] bool empty() const noexcept { return std::empty(m_columns); }

  [[nodiscard]] auto begin() const noexcept { return std::begin(m_columns); }
  [[nodiscard]] auto end() const noexcept { return std::end(m_columns); }

  /// Column at position `index`.
  /** @throw argument_error if there is no such column.
   */
  [[nodiscard]] column const &operator[](std::size_t index) const;

  /// Column called `name`.
  /** @throw argument_error if there is no such column.
   */
  [[nodiscard]] column const &at(std::string_view name) const;

  /// Position of the column called `name`, if there is one.
  [[nodiscard]] std::optional<std::size_t>
  index_of(std::string_view name) const noexcept;

  [[nodiscard]] bool has_column(std::string_view name) const noexcept
  {
    return index_of(name).has_value();
  }

  /// Read the column at `index` as a `TYPE`.
  /** The codec gets adapted to the column's type, if it knows how.
   *
   * @throw usage_error if the codec does not accept the column's type.
   */
  template<typename TYPE>
  [[nodiscard]] TYPE
  get(std::size_t index, codec_ptr<TYPE> const &c = default_codec<TYPE>()) const
  {
    return read<TYPE>((*this)[index], c);
  }

  /// Read the column called `name` as a `TYPE`.
  template<typename TYPE>
  [[nodiscard]] TYPE
  get(std::string_view name, codec_ptr<TYPE> const &c = default_codec<TYPE>())
    const
  {
    return read<TYPE>(at(name), c);
  }

private:
  template<typename TYPE>
  [[nodiscard]] static TYPE
  read(column const &col, codec_ptr<TYPE> const &c)
  {
    auto const adapted{adapt_or_keep(c, col.type)};
    if (not adapted->accepts(col.type))
      throw_mismatch(col, *adapted);
    if (col.value.has_value())
      return adapted->decode(bytes_view{*col.value});
    return adapted->decode(std::nullopt);
  }

  [[noreturn]] static void throw_mismatch(column const &, codec_base const &);

  std::vector<column> m_columns;
};


/// Translates a @ref row into a `TYPE`.
template<typename TYPE> class row_mapper
{
public:
  using value_type = TYPE;

  virtual ~row_mapper() = default;

  [[nodiscard]] virtual TYPE map(row const &r) const = 0;

  [[nodiscard]] TYPE operator()(row const &r) const { return map(r); }
};


template<typename TYPE>
using row_mapper_ptr = std::shared_ptr<row_mapper<TYPE> const>;


/// Reads one member's worth of data out of a @ref row.
/** Usually that's just the column of the given name, but a mapper may also
 * look at any other columns.
 */
template<typename TYPE> class column_mapper
{
public:
  virtual ~column_mapper() = default;

  [[nodiscard]] virtual TYPE
  map(std::string_view column_name, row const &r) const = 0;
};


template<typename TYPE>
using column_mapper_ptr = std::shared_ptr<column_mapper<TYPE> const>;


/// How a derived row mapper fills in a member of type `TYPE`.
/** The default reads the member's column using `TYPE`'s default codec.  If
 * the row has no such column and `TYPE` is nullable, the member is null.
 *
 * Specialise this to read a member type differently, e.g. from several
 * columns at once.  A specialisation needs a static `map` function just like
 * this one.
 */
template<typename TYPE> struct column_mapping
{
  [[nodiscard]] static TYPE map(std::string_view column_name, row const &r)
  {
    if constexpr (nullness<TYPE>::has_null)
      if (not r.has_column(column_name))
        return nullness<TYPE>::null();
    return r.get<TYPE>(column_name);
  }
};


/// Column mapper which just reads the named column with a given codec.
template<typename TYPE>
class default_column_mapper final : public column_mapper<TYPE>
{
public:
  explicit default_column_mapper(
    codec_ptr<TYPE> c = default_codec<TYPE>()) :
          m_codec{std::move(c)}
  {}

  [[nodiscard]] TYPE
  map(std::string_view column_name, row const &r) const override
  {
    return r.get<TYPE>(column_name, m_codec);
  }

private:
  codec_ptr<TYPE> m_codec;
};


/// Column mapper for a value which lives in one of two columns.
/** Ignores the column name it is given.  If only the left column is
 * non-null, the result holds a `LEFT` read from there.  In any other case
 * it holds a `RIGHT` read from the right column, and if that was not the
 * only non-null column, logs a warning.
 */
template<typename LEFT, typename RIGHT>
class either_mapper final : public column_mapper<std::variant<LEFT, RIGHT>>
{
public:
  either_mapper(
    std::string left_column, std::string right_column,
    codec_ptr<LEFT> left_codec = default_codec<LEFT>(),
    codec_ptr<RIGHT> right_codec = default_codec<RIGHT>()) :
          m_left_column{std::move(left_column)},
          m_right_column{std::move(right_column)},
          m_left_codec{std::move(left_codec)},
          m_right_codec{std::move(right_codec)}
  {}

  [[nodiscard]] std::variant<LEFT, RIGHT>
  map(std::string_view, row const &r) const override
  {
    bool const left_null{r.at(m_left_column).is_null()},
      right_null{r.at(m_right_column).is_null()};
    if (not left_null and right_null)
      return std::variant<LEFT, RIGHT>{
        std::in_place_index<0>, r.get<LEFT>(m_left_column, m_left_codec)};
    if (left_null == right_null)
      CQLXX_LOG_WARN(
        "Columns {} and {} are both {}; reading {}.", m_left_column,
        m_right_column, (left_null ? "null" : "non-null"), m_right_column);
    return std::variant<LEFT, RIGHT>{
      std::in_place_index<1>, r.get<RIGHT>(m_right_column, m_right_codec)};
  }

private:
  std::string m_left_column, m_right_column;
  codec_ptr<LEFT> m_left_codec;
  codec_ptr<RIGHT> m_right_codec;
};


/// Row mapper which reads a declared struct, one column per member.
/** Column names follow the same rules as UDT field names: an explicit
 * rename, or else the naming scheme.  Each member is read through its
 * @ref column_mapping, unless you give it a @ref column_mapper of its own.
 */
template<declared_udt TYPE> class udt_row_mapper final : public row_mapper<TYPE>
{
public:
  explicit udt_row_mapper(udt_options options = {}) :
          m_options{std::move(options)}
  {}

  /// Read member `member` using `mapper`.
  /** @throw usage_error if the struct has no member of that name and type.
   */
  template<typename FIELD>
  udt_row_mapper &
  with_mapper(std::string_view member, column_mapper_ptr<FIELD> mapper)
  {
    bool found{false};
    std::apply(
      [&](auto const &...m) {
        ((found = found or assign_override(m, member, mapper)), ...);
      },
      udt_fields<TYPE>::members);
    if (not found)
      throw usage_error{internal::concat(
        "C++ type ", udt_fields<TYPE>::name, " has no member '", member,
        "' of the column mapper's type.")};
    return *this;
  }

  [[nodiscard]] TYPE map(row const &r) const override
  {
    TYPE out{};
    std::apply(
      [&](auto const &...m) { (read_member(out, m, r), ...); },
      udt_fields<TYPE>::members);
    return out;
  }

private:
  template<typename MEMBER, typename FIELD>
  bool assign_override(
    MEMBER const &m, std::string_view member,
    column_mapper_ptr<FIELD> const &mapper)
  {
    if constexpr (std::is_same_v<typename MEMBER::field_type, FIELD>)
    {
      if (m.name != member)
        return false;
      m_overrides.emplace_back(std::string{member}, mapper);
      return true;
    }
    else
    {
      return false;
    }
  }

  template<typename MEMBER>
  void read_member(TYPE &out, MEMBER const &m, row const &r) const
  {
    using field_type = typename MEMBER::field_type;
    auto const column_name{m_options.column_for(m.name)};
    for (auto const &[name, mapper] : m_overrides)
      if (name == m.name)
      {
        out.*m.pointer =
          std::any_cast<column_mapper_ptr<field_type>>(mapper)->map(
            column_name, r);
        return;
      }
    out.*m.pointer = column_mapping<field_type>::map(column_name, r);
  }

  udt_options m_options;
  /// Custom column mappers, by member name.  Each holds a column_mapper_ptr.
  std::vector<std::pair<std::string, std::any>> m_overrides;
};


/// Row mapper which reads a `std::tuple`, one column per element in order.
template<typename... TYPES>
class tuple_row_mapper final : public row_mapper<std::tuple<TYPES...>>
{
public:
  [[nodiscard]] std::tuple<TYPES...> map(row const &r) const override
  {
    return read(r, std::index_sequence_for<TYPES...>{});
  }

private:
  template<std::size_t... INDEX>
  [[nodiscard]] static std::tuple<TYPES...>
  read(row const &r, std::index_sequence<INDEX...>)
  {
    return {r.get<TYPES>(INDEX)...};
  }
};


/// Row mapper which reads just the first column.
template<typename TYPE>
class single_row_mapper final : public row_mapper<TYPE>
{
public:
  explicit single_row_mapper(codec_ptr<TYPE> c = default_codec<TYPE>()) :
          m_codec{std::move(c)}
  {}

  [[nodiscard]] TYPE map(row const &r) const override
  {
    return r.get<TYPE>(0, m_codec);
  }

private:
  codec_ptr<TYPE> m_codec;
};


/// Row mapper which returns the row itself.
class CQLXX_LIBEXPORT identity_row_mapper final : public row_mapper<row>
{
public:
  [[nodiscard]] row map(row const &r) const override;
};


/// Row mapper which calls a function.
template<typename TYPE>
class function_row_mapper final : public row_mapper<TYPE>
{
public:
  explicit function_row_mapper(std::function<TYPE(row const &)> func) :
          m_func{std::move(func)}
  {
    if (not m_func)
      throw usage_error{"Creating a row mapper without a function."};
  }

  [[nodiscard]] TYPE map(row const &r) const override { return m_func(r); }

private:
  std::function<TYPE(row const &)> m_func;
};


/// Create a row mapper from a function or lambda taking a @ref row.
template<typename FUNC>
[[nodiscard]] inline auto make_row_mapper(FUNC &&func)
{
  using result = std::remove_cvref_t<std::invoke_result_t<FUNC, row const &>>;
  return std::make_shared<function_row_mapper<result> const>(
    std::forward<FUNC>(func));
}


namespace internal
{
template<typename TYPE> inline constexpr bool is_tuple{false};
template<typename... TYPES>
inline constexpr bool is_tuple<std::tuple<TYPES...>>{true};


template<typename... TYPES>
[[nodiscard]] inline row_mapper_ptr<std::tuple<TYPES...>>
make_tuple_row_mapper(std::tuple<TYPES...> const *)
{
  return std::make_shared<tuple_row_mapper<TYPES...> const>();
}
} // namespace internal


/// The natural row mapper for `TYPE`.
/** A @ref row maps to itself.  A declared struct maps one column per member.
 * A `std::tuple` maps one column per element.  Anything else maps from the
 * first column.
 */
template<typename TYPE>
[[nodiscard]] inline row_mapper_ptr<TYPE> default_row_mapper()
{
  if constexpr (std::is_same_v<TYPE, row>)
    return std::make_shared<identity_row_mapper const>();
  else if constexpr (declared_udt<TYPE>)
    return std::make_shared<udt_row_mapper<TYPE> const>();
  else if constexpr (internal::is_tuple<TYPE>)
    return internal::make_tuple_row_mapper(static_cast<TYPE const *>(nullptr));
  else
    return std::make_shared<single_row_mapper<TYPE> const>();
}
} // namespace cqlxx
#endif
