/* Descriptors for CQL column types.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/data_type instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_DATA_TYPE)
#  define CQLXX_H_DATA_TYPE

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <cstddef>
#  include <optional>
#  include <string>
#  include <string_view>
#  include <vector>

#  include "cqlxx/types.hxx"

namespace cqlxx
{
/// The kinds of column type CQL knows about.
/** Some of these names clash with C++ keywords, so those get a trailing
 * underscore.
 */
enum class type_kind
{
  ascii,
  bigint,
  blob,
  boolean,
  counter,
  date,
  decimal,
  double_,
  float_,
  inet,
  int_,
  smallint,
  text,
  time,
  timestamp,
  timeuuid,
  tinyint,
  uuid,
  varint,
  list,
  set,
  map,
  udt,
};


/// The CQL name of a type kind, e.g. "int" or "list".
[[nodiscard]] CQLXX_LIBEXPORT std::string_view name_of(type_kind) noexcept;


/// Description of a CQL column type: what the database calls a "data type."
/** This is an immutable value type.  Primitive types are just a kind.
 * Collection types also have element types.  A user-defined type ("UDT") has
 * a keyspace, a name, and an ordered list of named fields.
 *
 * Collections and UDTs can be "frozen."  That only affects how the type is
 * written in CQL, e.g. `frozen<list<int>>`; it makes no difference to the
 * binary representation of a value.
 */
class CQLXX_LIBEXPORT data_type
{
public:
  /// Create a primitive type.
  /** @throw usage_error if `kind` is a collection or UDT kind.
   */
  explicit data_type(type_kind kind);

  [[nodiscard]] static data_type list_of(data_type element, bool frozen = false);
  [[nodiscard]] static data_type set_of(data_type element, bool frozen = false);
  [[nodiscard]] static data_type
  map_of(data_type key, data_type value, bool frozen = false);

  /// Create a user-defined type.
  /** The keyspace may be left empty, to be filled in later with
   * @ref with_keyspace.
   */
  [[nodiscard]] static data_type udt(
    std::string keyspace, std::string name,
    std::vector<field_descriptor> const &fields, bool frozen = false);

  [[nodiscard]] type_kind kind() const noexcept { return m_kind; }
  [[nodiscard]] bool frozen() const noexcept { return m_frozen; }

  [[nodiscard]] bool is_collection() const noexcept;

  /// Width of a value of this type, if it always has the same width.
  [[nodiscard]] std::optional<std::size_t> fixed_width() const noexcept;

  [[nodiscard]] bool is_fixed_width() const noexcept
  {
    return fixed_width().has_value();
  }

  /// Element type of a list or set.
  [[nodiscard]] data_type const &element() const;
  /// Key type of a map.
  [[nodiscard]] data_type const &key() const;
  /// Value type of a map.
  [[nodiscard]] data_type const &value() const;

  /// Keyspace of a UDT.  May be empty.
  [[nodiscard]] std::string const &keyspace() const;
  /// Name of a UDT.
  [[nodiscard]] std::string const &name() const;

  /// Number of fields in a UDT.
  [[nodiscard]] std::size_t field_count() const;
  [[nodiscard]] std::string const &field_name(std::size_t index) const;
  [[nodiscard]] data_type const &field_type(std::size_t index) const;
  /// Position of the field called `name` in a UDT, if there is one.
  [[nodiscard]] std::optional<std::size_t>
  field_index(std::string_view name) const;
  /// A UDT's fields, in order.
  [[nodiscard]] std::vector<field_descriptor> fields() const;

  /// Copy of this UDT, in `keyspace`.  Other types are just copied.
  [[nodiscard]] data_type with_keyspace(std::string const &keyspace) const;

  /// Copy of this type, with its frozen flag set as given.
  [[nodiscard]] data_type as_frozen(bool frozen = true) const;

  /// The type as it would appear in CQL, e.g. `frozen<map<text, int>>`.
  /** A UDT shows up as its qualified name, or just its name if it has no
   * keyspace.
   */
  [[nodiscard]] std::string to_string() const;

  /// Full description of the type, including UDT field definitions.
  /** Two UDTs with different field lists have different descriptions.  This
   * is what identifies a schema version.
   */
  [[nodiscard]] std::string describe() const;

  /// Do values of these types have the same binary representation?
  /** Ignores frozen flags.  Also ignores the keyspace of a UDT if either of
   * the two has an empty keyspace.
   */
  [[nodiscard]] bool same_shape(data_type const &other) const;

  [[nodiscard]] bool operator==(data_type const &rhs) const;

private:
  data_type(type_kind kind, bool frozen, std::vector<data_type> params);

  void check_kind(type_kind wanted, char const what[]) const;
  void check_udt(char const what[]) const;

  type_kind m_kind;
  bool m_frozen{false};
  /// Element types of a collection, or field types of a UDT.
  std::vector<data_type> m_params;
  std::string m_keyspace;
  std::string m_name;
  std::vector<std::string> m_field_names;
};


/// One field of a user-defined type, as described by the database schema.
struct CQLXX_LIBEXPORT field_descriptor
{
  std::string name;
  data_type type;

  [[nodiscard]] bool operator==(field_descriptor const &) const = default;
};
} // namespace cqlxx
#endif
