/* Codecs for user-defined types ("UDTs"), as C++ structs.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/udt instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_UDT)
#  define CQLXX_H_UDT

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <functional>
#  include <map>
#  include <memory>
#  include <mutex>
#  include <shared_mutex>
#  include <string>
#  include <string_view>
#  include <tuple>
#  include <type_traits>
#  include <vector>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/collection.hxx"
#  include "cqlxx/except.hxx"
#  include "cqlxx/internal/concat.hxx"
#  include "cqlxx/internal/literal.hxx"
#  include "cqlxx/internal/log.hxx"
#  include "cqlxx/internal/macros.hxx"
#  include "cqlxx/internal/wire.hxx"
#  include "cqlxx/naming.hxx"
#  include "cqlxx/primitives.hxx"


namespace cqlxx
{
/// The ordered list of a struct's members which make up a UDT.
/** Don't specialise this yourself; use @ref CQLXX_DECLARE_UDT.  A
 * specialisation has:
 * * `name`: the C++ type's name.
 * * `members`: a `std::tuple` of `internal::udt_member`, in order.
 */
template<typename TYPE> struct udt_fields;


/// A struct which has been declared with @ref CQLXX_DECLARE_UDT.
template<typename TYPE>
concept declared_udt = std::is_class_v<TYPE> and requires {
  udt_fields<TYPE>::name;
  udt_fields<TYPE>::members;
};


/// How a C++ struct maps onto a user-defined type.
struct CQLXX_LIBEXPORT udt_options
{
  /// Keyspace of the UDT.  May stay empty until the schema is known.
  std::string keyspace;

  /// CQL name of the UDT.  If empty, derived from the C++ type name.
  std::string name;

  /// Report the type as frozen.  Makes no difference to the data.
  bool frozen{false};

  /// Translation of member names to column names.
  naming_scheme naming{naming_scheme::snake_case()};

  /// Explicit column names for some members.  These bypass `naming`.
  std::map<std::string, std::string, std::less<>> renames;

  /// Column name for C++ member `member`.
  [[nodiscard]] std::string column_for(std::string_view member) const;

  /// CQL type name for C++ type `cxx_name`.
  [[nodiscard]] std::string type_name(std::string_view cxx_name) const;
};
} // namespace cqlxx


namespace cqlxx::internal
{
/// One member of a declared UDT struct: its name and its member pointer.
template<typename CLASS, typename FIELD> struct udt_member
{
  using class_type = CLASS;
  using field_type = FIELD;

  std::string_view name;
  FIELD CLASS::*pointer;
};


template<typename CLASS, typename FIELD>
[[nodiscard]] constexpr udt_member<CLASS, FIELD>
make_udt_member(std::string_view name, FIELD CLASS::*pointer) noexcept
{
  return {name, pointer};
}


/// Strip any namespace qualifiers off a C++ type name.
[[nodiscard]] CQLXX_LIBEXPORT CQLXX_PURE std::string_view
unqualified(std::string_view name) noexcept;


/// Are `declared` and `live` the same user-defined type, by name?
/** An empty keyspace on either side matches any keyspace.
 */
[[nodiscard]] CQLXX_LIBEXPORT bool
same_udt(data_type const &declared, data_type const &live);


/// Everything needed to convert one struct member, behind a uniform face.
template<typename TYPE> struct udt_field
{
  std::string column;
  std::string member;
  any_codec_ptr codec;
  bool nullable;
  std::function<wire_value(TYPE const &)> encode;
  std::function<void(TYPE &, std::optional<bytes_view>)> decode;
  std::function<std::string(TYPE const &)> format;
  std::function<void(TYPE &, std::string_view)> parse;
};


/// Lookup of a column's type in a live schema, if it has that column.
using live_type_lookup =
  std::function<std::optional<data_type>(std::string_view column)>;


template<typename TYPE, typename MEMBER>
[[nodiscard]] inline udt_field<TYPE> bind_member(
  MEMBER const &member, udt_options const &options,
  live_type_lookup const &live)
{
  using field_type = typename MEMBER::field_type;
  auto column{options.column_for(member.name)};
  auto field_codec{default_codec<field_type>()};
  if (live)
    if (auto const type{live(column)}; type.has_value())
      field_codec = adapt_or_keep(field_codec, *type);
  auto const ptr{member.pointer};

  return {
    std::move(column),
    std::string{member.name},
    field_codec,
    nullness<field_type>::has_null,
    [field_codec, ptr](TYPE const &v) { return field_codec->encode(v.*ptr); },
    [field_codec, ptr](TYPE &v, std::optional<bytes_view> data) {
      v.*ptr = field_codec->decode(data);
    },
    [field_codec, ptr](TYPE const &v) { return field_codec->format(v.*ptr); },
    [field_codec, ptr](TYPE &v, std::string_view text) {
      v.*ptr = field_codec->parse(text);
    },
  };
}


/// Bind all of a declared struct's members, in declaration order.
/** If `live` is given, each member's codec gets adapted to the live schema's
 * type for its column.
 */
template<declared_udt TYPE>
[[nodiscard]] inline std::vector<udt_field<TYPE>>
bind_members(udt_options const &options, live_type_lookup const &live = {})
{
  std::vector<udt_field<TYPE>> fields;
  std::apply(
    [&](auto const &...member) {
      (fields.push_back(bind_member<TYPE>(member, options, live)), ...);
    },
    udt_fields<TYPE>::members);
  return fields;
}


/// The CQL type a struct declares, with its members in declaration order.
template<declared_udt TYPE>
[[nodiscard]] inline data_type declared_type(
  udt_options const &options, std::vector<udt_field<TYPE>> const &fields)
{
  std::vector<field_descriptor> descriptors;
  descriptors.reserve(std::size(fields));
  for (auto const &f : fields)
    descriptors.push_back({f.column, f.codec->cql_type()});
  return data_type::udt(
    options.keyspace, options.type_name(udt_fields<TYPE>::name), descriptors,
    options.frozen);
}
} // namespace cqlxx::internal


namespace cqlxx
{
/// Common implementation of the UDT codecs.
/** On the wire, a UDT value is a sequence of fields, each with a length
 * prefix, in the order of the schema's field list.  There is no field count.
 * A value may end early, when it was written before fields were added to
 * the type: the missing trailing fields keep their default values.
 *
 * The literal format is `{column:value,...}`.
 *
 * Subclasses decide the order in which the struct's members go on the wire.
 */
template<declared_udt TYPE> class basic_udt_codec : public codec<TYPE>
{
public:
  [[nodiscard]] data_type cql_type() const override { return m_type; }

  using codec_base::accepts;

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return internal::same_udt(m_type, type);
  }

  [[nodiscard]] wire_value encode(TYPE const &value) const override
  {
    bytes out;
    for (std::size_t pos{0}; pos < width(); ++pos)
      internal::write_framed(out, at(pos).encode(value));
    return out;
  }

  [[nodiscard]] TYPE decode(std::optional<bytes_view> data) const override
  {
    TYPE out{};
    if (not data.has_value())
      return out;
    internal::wire_reader in{*data};
    for (std::size_t pos{0}; pos < width() and not in.at_end(); ++pos)
      at(pos).decode(out, in.read_framed("UDT field"));
    in.expect_end(m_type.to_string());
    return out;
  }

  [[nodiscard]] std::string format(TYPE const &value) const override
  {
    std::string out{'{'};
    for (std::size_t pos{0}; pos < width(); ++pos)
    {
      if (pos > 0)
        out.push_back(',');
      auto const &field{at(pos)};
      out.append(field.column);
      out.push_back(':');
      out.append(field.format(value));
    }
    out.push_back('}');
    return out;
  }

  [[nodiscard]] TYPE parse(std::string_view text) const override
  {
    TYPE out{};
    if (internal::is_null_literal(text))
      return out;
    for (auto const entry :
         internal::split_collection(m_type, text, '{', '}'))
    {
      auto const pair{internal::split_top_level(entry, ':')};
      if (not pair.has_value() or std::size(*pair) != 2)
        internal::throw_bad_literal(m_type, text);
      auto const pos{find((*pair)[0])};
      if (pos == width())
        internal::throw_bad_literal(m_type, text);
      try
      {
        at(pos).parse(out, (*pair)[1]);
      }
      catch (argument_error const &)
      {
        internal::throw_bad_literal(m_type, text);
      }
    }
    return out;
  }

protected:
  explicit basic_udt_codec(data_type type) : m_type{std::move(type)} {}

  /// Number of fields on the wire.
  [[nodiscard]] virtual std::size_t width() const noexcept = 0;

  /// The member which goes into the wire field at position `pos`.
  [[nodiscard]] virtual internal::udt_field<TYPE> const &
  at(std::size_t pos) const noexcept = 0;

private:
  /// Wire position of column `column`, or `width()` if there is none.
  [[nodiscard]] std::size_t find(std::string_view column) const
  {
    std::size_t pos{0};
    while (pos < width() and at(pos).column != column) ++pos;
    return pos;
  }

  data_type m_type;
};


/// UDT codec for a schema whose fields match the struct's declaration.
/** Members go on the wire in declaration order, with no name lookups.
 */
template<declared_udt TYPE>
class identical_udt_codec final : public basic_udt_codec<TYPE>
{
public:
  explicit identical_udt_codec(udt_options const &options = {}) :
          identical_udt_codec{options, internal::bind_members<TYPE>(options)}
  {}

protected:
  [[nodiscard]] std::size_t width() const noexcept override
  {
    return std::size(m_fields);
  }

  [[nodiscard]] internal::udt_field<TYPE> const &
  at(std::size_t pos) const noexcept override
  {
    return m_fields[pos];
  }

private:
  identical_udt_codec(
    udt_options const &options, std::vector<internal::udt_field<TYPE>> fields) :
          basic_udt_codec<TYPE>{internal::declared_type<TYPE>(options, fields)},
          m_fields{std::move(fields)}
  {}

  std::vector<internal::udt_field<TYPE>> m_fields;
};


/// UDT codec for a schema whose field order differs from the declaration.
/** At construction, matches every field in the schema to a struct member by
 * column name, and records the resulting permutation.
 *
 * @throw schema_mismatch if the schema has a field which matches no member;
 * or if a member has no field in the schema, unless the member is nullable;
 * or if a field's type does not match its member's codec.
 */
template<declared_udt TYPE>
class non_identical_udt_codec final : public basic_udt_codec<TYPE>
{
public:
  non_identical_udt_codec(udt_options const &options, data_type const &schema) :
          basic_udt_codec<TYPE>{schema},
          m_fields{internal::bind_members<TYPE>(
            options,
            [&schema](std::string_view column) -> std::optional<data_type> {
              if (auto const index{schema.field_index(column)};
                  index.has_value())
                return schema.field_type(*index);
              return {};
            })}
  {
    auto const udt{schema.to_string()};
    std::vector<bool> used(std::size(m_fields), false);
    for (std::size_t i{0}; i < schema.field_count(); ++i)
    {
      auto const &name{schema.field_name(i)};
      std::size_t member{0};
      while (member < std::size(m_fields) and m_fields[member].column != name)
        ++member;
      if (member == std::size(m_fields))
        throw schema_mismatch{
          internal::concat(
            "Field '", name, "' of ", udt, " matches no member of C++ type ",
            udt_fields<TYPE>::name, "."),
          udt, name};
      if (not m_fields[member].codec->accepts(schema.field_type(i)))
        throw schema_mismatch{
          internal::concat(
            "Field '", name, "' of ", udt, " has type ",
            schema.field_type(i).to_string(), ", but C++ member ",
            m_fields[member].member, " needs ",
            m_fields[member].codec->cql_type().to_string(), "."),
          udt, name};
      used[member] = true;
      m_permutation.push_back(member);
    }

    for (std::size_t member{0}; member < std::size(m_fields); ++member)
      if (not used[member] and not m_fields[member].nullable)
        throw schema_mismatch{
          internal::concat(
            "C++ member ", udt_fields<TYPE>::name,
            "::", m_fields[member].member, " has no field '",
            m_fields[member].column, "' in ", udt,
            ", and is not nullable."),
          udt, m_fields[member].column};
  }

protected:
  [[nodiscard]] std::size_t width() const noexcept override
  {
    return std::size(m_permutation);
  }

  [[nodiscard]] internal::udt_field<TYPE> const &
  at(std::size_t pos) const noexcept override
  {
    return m_fields[m_permutation[pos]];
  }

private:
  std::vector<internal::udt_field<TYPE>> m_fields;
  /// For each wire position, the index of its member in `m_fields`.
  std::vector<std::size_t> m_permutation;
};


/// Codec for a declared struct as a user-defined type.
/** By itself, this codec reads and writes fields in the struct's declaration
 * order.  Use @ref for_schema (or @ref adapt) to get a codec for the field
 * order of a live database schema: that picks either the
 * @ref identical_udt_codec, or builds a @ref non_identical_udt_codec.  The
 * choice is made only once for each distinct version of the schema type.
 * Concurrent calls are safe.
 */
template<declared_udt TYPE> class udt_codec final : public codec<TYPE>
{
public:
  explicit udt_codec(udt_options options = {}) :
          m_options{std::move(options)},
          m_identical{std::make_shared<identical_udt_codec<TYPE> const>(
            m_options)}
  {}

  [[nodiscard]] data_type cql_type() const override
  {
    return m_identical->cql_type();
  }

  using codec_base::accepts;

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return m_identical->accepts(type);
  }

  [[nodiscard]] wire_value encode(TYPE const &value) const override
  {
    return m_identical->encode(value);
  }

  [[nodiscard]] TYPE decode(std::optional<bytes_view> data) const override
  {
    return m_identical->decode(data);
  }

  [[nodiscard]] std::string format(TYPE const &value) const override
  {
    return m_identical->format(value);
  }

  [[nodiscard]] TYPE parse(std::string_view text) const override
  {
    return m_identical->parse(text);
  }

  [[nodiscard]] codec_ptr<TYPE> adapt(data_type const &type) const override
  {
    if (not accepts(type))
      return {};
    auto chosen{for_schema(type)};
    if (chosen == m_identical)
      return {};
    return chosen;
  }

  /// Codec for `schema`'s field order.
  /** @throw schema_mismatch if `schema` is not this user-defined type.
   */
  [[nodiscard]] codec_ptr<TYPE> for_schema(data_type const &schema) const
  {
    if (not accepts(schema))
      throw schema_mismatch{
        internal::concat(
          "Can't use ", schema.to_string(), " as a schema for C++ type ",
          udt_fields<TYPE>::name, ", which maps to ", cql_type().to_string(),
          "."),
        schema.to_string(), ""};
    auto const version{schema.describe()};

    {
      std::shared_lock const lock{m_mutex};
      if (auto const here{m_strategies.find(version)};
          here != std::end(m_strategies))
        return here->second;
    }

    std::unique_lock const lock{m_mutex};
    if (auto const here{m_strategies.find(version)};
        here != std::end(m_strategies))
      return here->second;

    codec_ptr<TYPE> chosen;
    if (matches_declaration(schema))
    {
      chosen = m_identical;
      CQLXX_LOG_DEBUG(
        "Schema {} matches {}; using declared field order.", version,
        udt_fields<TYPE>::name);
    }
    else
    {
      chosen =
        std::make_shared<non_identical_udt_codec<TYPE> const>(m_options, schema);
      CQLXX_LOG_DEBUG(
        "Schema {} differs from {}; mapping fields by name.", version,
        udt_fields<TYPE>::name);
    }
    m_strategies.emplace(version, chosen);
    return chosen;
  }

  /// Copy of this codec, for the UDT in keyspace `keyspace`.
  [[nodiscard]] std::shared_ptr<udt_codec const>
  for_keyspace(std::string keyspace) const
  {
    auto options{m_options};
    options.keyspace = std::move(keyspace);
    return std::make_shared<udt_codec const>(std::move(options));
  }

  [[nodiscard]] udt_options const &options() const noexcept
  {
    return m_options;
  }

private:
  /// Do the schema's fields have the declared names and types, in order?
  [[nodiscard]] bool matches_declaration(data_type const &schema) const
  {
    auto const declared{m_identical->cql_type()};
    if (schema.field_count() != declared.field_count())
      return false;
    for (std::size_t i{0}; i < declared.field_count(); ++i)
      if (
        schema.field_name(i) != declared.field_name(i) or
        not schema.field_type(i).same_shape(declared.field_type(i)))
        return false;
    return true;
  }

  udt_options m_options;
  std::shared_ptr<identical_udt_codec<TYPE> const> m_identical;

  mutable std::shared_mutex m_mutex;
  /// Codec for each schema version seen so far, keyed by its description.
  mutable std::map<std::string, codec_ptr<TYPE>, std::less<>> m_strategies;
};


/// Create a UDT codec for a declared struct.
template<declared_udt TYPE>
[[nodiscard]] inline std::shared_ptr<udt_codec<TYPE> const>
udt_of(udt_options options = {})
{
  return std::make_shared<udt_codec<TYPE> const>(std::move(options));
}


/// A declared struct's default codec uses the default options.
template<declared_udt TYPE> struct natural_codec<TYPE>
{
  [[nodiscard]] static codec_ptr<TYPE> get()
  {
    static auto const c{udt_of<TYPE>()};
    return c;
  }
};
} // namespace cqlxx


#  define CQLXX_UDT_MEMBER(TYPE, member)                                      \
    ::cqlxx::internal::make_udt_member(std::string_view{#member}, &TYPE::member)

/// Declare a struct's members, so cqlxx can derive a UDT codec for it.
/** Use this in the global namespace, listing the members which make up the
 * UDT in the order in which you expect them in the database:
 *
 * ```cxx
 * struct address { std::string street; std::string city; int postalCode; };
 * CQLXX_DECLARE_UDT(address, street, city, postalCode);
 * ```
 *
 * The struct must be default-constructible.
 */
#  define CQLXX_DECLARE_UDT(TYPE, ...)                                        \
    template<> struct cqlxx::udt_fields<TYPE> final                           \
    {                                                                         \
      static constexpr std::string_view name{#TYPE};                          \
      static constexpr std::tuple members{                                    \
        CQLXX_FOR_EACH(CQLXX_UDT_MEMBER, TYPE, __VA_ARGS__)};                 \
    }
#endif
