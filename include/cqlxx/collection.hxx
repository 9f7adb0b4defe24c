/* Codecs for CQL collections: list, set, and map.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/collection instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_COLLECTION)
#  define CQLXX_H_COLLECTION

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <algorithm>
#  include <any>
#  include <concepts>
#  include <cstdint>
#  include <deque>
#  include <functional>
#  include <limits>
#  include <list>
#  include <map>
#  include <memory>
#  include <optional>
#  include <set>
#  include <string>
#  include <typeinfo>
#  include <unordered_map>
#  include <unordered_set>
#  include <utility>
#  include <vector>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/internal/literal.hxx"
#  include "cqlxx/internal/wire.hxx"
#  include "cqlxx/primitives.hxx"


namespace cqlxx
{
/// A container which keeps its elements in the order they were added.
template<typename CONTAINER>
concept sequence_container =
  requires(CONTAINER c, typename CONTAINER::value_type v) {
    c.push_back(std::move(v));
    std::begin(c);
    std::end(c);
    std::size(c);
  };


/// A container of unique keys, without mapped values.
template<typename CONTAINER>
concept set_container =
  requires(CONTAINER c, typename CONTAINER::value_type v) {
    typename CONTAINER::key_type;
    c.insert(std::move(v));
    std::size(c);
  } and not requires { typename CONTAINER::mapped_type; };


/// A container mapping unique keys to values.
template<typename CONTAINER>
concept map_container = requires(
  CONTAINER c, typename CONTAINER::key_type k,
  typename CONTAINER::mapped_type v) {
  c.emplace(std::move(k), std::move(v));
  std::size(c);
};


/// Reconstructs a container of type `CONTAINER` while decoding.
/** The decoding algorithms are the same for every container of a given kind.
 * Only this builder differs: it appends with `push_back` where the container
 * supports it, or uses `insert` or `emplace`.  All of that gets decided at
 * compile time.
 */
template<typename CONTAINER> class builder
{
public:
  explicit builder(std::size_t size_hint)
  {
    if constexpr (requires(CONTAINER c, std::size_t n) { c.reserve(n); })
      m_out.reserve(size_hint);
  }

  template<typename VALUE> void add(VALUE &&value)
  {
    if constexpr (sequence_container<CONTAINER>)
      m_out.push_back(std::forward<VALUE>(value));
    else
      m_out.insert(std::forward<VALUE>(value));
  }

  template<typename KEY, typename VALUE> void add(KEY &&key, VALUE &&value)
  {
    m_out.emplace(std::forward<KEY>(key), std::forward<VALUE>(value));
  }

  [[nodiscard]] CONTAINER build() && { return std::move(m_out); }

private:
  CONTAINER m_out;
};
} // namespace cqlxx


namespace cqlxx::internal
{
/// The standard containers which can stand in for one another.
template<typename... CONTAINERS> struct container_family
{};

template<typename ELEMENT>
using list_family = container_family<
  std::vector<ELEMENT>, std::deque<ELEMENT>, std::list<ELEMENT>>;

template<typename ELEMENT>
using set_family =
  container_family<std::set<ELEMENT>, std::unordered_set<ELEMENT>>;

template<typename KEY, typename VALUE>
using map_family =
  container_family<std::map<KEY, VALUE>, std::unordered_map<KEY, VALUE>>;


template<typename TYPE>
concept ordered_key = requires(TYPE const &a, TYPE const &b) {
  { a < b } -> std::convertible_to<bool>;
};

template<typename TYPE>
concept hashed_key = requires(TYPE const &a) {
  { std::hash<TYPE>{}(a) } -> std::convertible_to<std::size_t>;
  { a == a } -> std::convertible_to<bool>;
};


/// Can the standard container `CONTAINER` exist for its element type?
/** A set needs an ordering, an unordered set needs a hash.
 */
template<typename CONTAINER> inline constexpr bool usable_container{true};

template<typename ELEMENT>
inline constexpr bool usable_container<std::set<ELEMENT>>{
  ordered_key<ELEMENT>};

template<typename ELEMENT>
inline constexpr bool usable_container<std::unordered_set<ELEMENT>>{
  hashed_key<ELEMENT>};

template<typename KEY, typename VALUE>
inline constexpr bool usable_container<std::map<KEY, VALUE>>{
  ordered_key<KEY>};

template<typename KEY, typename VALUE>
inline constexpr bool usable_container<std::unordered_map<KEY, VALUE>>{
  hashed_key<KEY>};


template<typename CONTAINER> [[nodiscard]] inline auto family_for()
{
  if constexpr (map_container<CONTAINER>)
    return map_family<
      typename CONTAINER::key_type, typename CONTAINER::mapped_type>{};
  else if constexpr (set_container<CONTAINER>)
    return set_family<typename CONTAINER::value_type>{};
  else
    return list_family<typename CONTAINER::value_type>{};
}


/// The standard containers of the same collection kind as `CONTAINER`.
template<typename CONTAINER>
using family_of = decltype(family_for<CONTAINER>());


/// Does `value` hold exactly a `CONTAINER`?
template<typename CONTAINER>
[[nodiscard]] inline bool holds(std::any const &value) noexcept
{
  if constexpr (usable_container<CONTAINER>)
    return value.type() == typeid(CONTAINER);
  else
    return false;
}


/// Does `value` hold a container of the same kind as `CONTAINER`?
template<typename CONTAINER, typename... ALTERNATIVES>
[[nodiscard]] inline bool
holds_kind(std::any const &value, container_family<ALTERNATIVES...>) noexcept
{
  return holds<CONTAINER>(value) or (holds<ALTERNATIVES>(value) or ...);
}


/// Copy a container's contents into a `CONTAINER`.
template<typename CONTAINER, typename SOURCE>
[[nodiscard]] inline CONTAINER copy_container(SOURCE const &source)
{
  builder<CONTAINER> out{std::size(source)};
  if constexpr (map_container<CONTAINER>)
    for (auto const &[k, v] : source) out.add(k, v);
  else
    for (auto const &element : source) out.add(element);
  return std::move(out).build();
}


/// If `value` holds an `ALTERNATIVE`, copy it into `out`.
template<typename ALTERNATIVE, typename CONTAINER>
inline void
convert_alternative(std::any const &value, std::optional<CONTAINER> &out)
{
  if constexpr (usable_container<ALTERNATIVE>)
    if (not out.has_value())
      if (auto const *const other{std::any_cast<ALTERNATIVE>(&value)})
        out.emplace(copy_container<CONTAINER>(*other));
}


/// Convert `value`, which holds another container of `CONTAINER`'s kind.
/** Returns nothing if `value` holds something else.
 */
template<typename CONTAINER, typename... ALTERNATIVES>
[[nodiscard]] inline std::optional<CONTAINER>
convert_kind(std::any const &value, container_family<ALTERNATIVES...>)
{
  std::optional<CONTAINER> out;
  (convert_alternative<ALTERNATIVES>(value, out), ...);
  return out;
}
} // namespace cqlxx::internal


namespace cqlxx::internal
{
/// Write a collection's element count.
CQLXX_LIBEXPORT void write_count(bytes &out, std::size_t count);


/// Read a collection's element count, and check it for plausibility.
[[nodiscard]] CQLXX_LIBEXPORT std::size_t
read_count(wire_reader &in, data_type const &type);


/// Throw @ref illegal_value for a null element in a collection.
[[noreturn]] CQLXX_LIBEXPORT CQLXX_COLD void
throw_null_element(data_type const &type, std::size_t position);


/// Strip the brackets off a collection or UDT literal, and split it.
/** Returns the items, or throws @ref argument_error quoting the whole of
 * `text` if it is not a properly bracketed list of items.
 */
[[nodiscard]] CQLXX_LIBEXPORT std::vector<std::string_view> split_collection(
  data_type const &type, std::string_view text, char open, char close);


/// Parse one item of a collection literal, blaming the whole literal.
template<typename TYPE>
[[nodiscard]] inline TYPE parse_item(
  codec<TYPE> const &item_codec, std::string_view item,
  data_type const &type, std::string_view text)
{
  try
  {
    return item_codec.parse(item);
  }
  catch (argument_error const &)
  {
    throw_bad_literal(type, text);
  }
}
} // namespace cqlxx::internal


namespace cqlxx
{
/// Common implementation for list and set codecs.
/** These have the same wire format: an element count, and then each of the
 * elements with a length prefix.  Their literals differ only in brackets.
 */
template<typename CONTAINER>
class element_collection_codec : public codec<CONTAINER>
{
public:
  using element_type = typename CONTAINER::value_type;

  [[nodiscard]] data_type cql_type() const override { return m_type; }

  using codec_base::accepts;

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return type.kind() == m_type.kind() and
           m_element->accepts(type.element());
  }

  /// Accepts any standard container of the same collection kind.
  [[nodiscard]] bool accepts(std::any const &value) const override
  {
    return internal::holds_kind<CONTAINER>(
      value, internal::family_of<CONTAINER>{});
  }

  [[nodiscard]] wire_value encode_any(std::any const &value) const override
  {
    if (auto const *const exact{std::any_cast<CONTAINER>(&value)})
      return this->encode(*exact);
    auto const converted{internal::convert_kind<CONTAINER>(
      value, internal::family_of<CONTAINER>{})};
    if (not converted.has_value())
      return codec<CONTAINER>::encode_any(value);
    return this->encode(*converted);
  }

  [[nodiscard]] wire_value encode(CONTAINER const &value) const override
  {
    bytes out;
    internal::write_count(out, std::size(value));
    std::size_t position{0};
    for (auto const &element : value)
    {
      auto const data{m_element->encode(element)};
      if (not data.has_value())
        internal::throw_null_element(m_type, position);
      internal::write_framed(out, *data);
      ++position;
    }
    return out;
  }

  [[nodiscard]] CONTAINER decode(std::optional<bytes_view> data) const override
  {
    if (not data.has_value() or std::empty(*data))
      return {};
    internal::wire_reader in{*data};
    auto const count{internal::read_count(in, m_type)};
    builder<CONTAINER> out{count};
    for (std::size_t i{0}; i < count; ++i)
      out.add(m_element->decode(in.read_framed("collection element")));
    in.expect_end(m_type.to_string());
    return std::move(out).build();
  }

  [[nodiscard]] std::string format(CONTAINER const &value) const override
  {
    std::string out{m_open};
    bool first{true};
    for (auto const &element : value)
    {
      if (not first)
        out.push_back(',');
      first = false;
      out.append(m_element->format(element));
    }
    out.push_back(m_close);
    return out;
  }

  [[nodiscard]] CONTAINER parse(std::string_view text) const override
  {
    if (internal::is_null_literal(text))
      return {};
    auto const items{
      internal::split_collection(m_type, text, m_open, m_close)};
    builder<CONTAINER> out{std::size(items)};
    for (auto const item : items)
      out.add(internal::parse_item(*m_element, item, m_type, text));
    return std::move(out).build();
  }

  /// The codec for the elements.
  [[nodiscard]] codec_ptr<element_type> const &element() const noexcept
  {
    return m_element;
  }

protected:
  element_collection_codec(
    codec_ptr<element_type> element, data_type type, char open, char close) :
          m_element{std::move(element)},
          m_type{std::move(type)},
          m_open{open},
          m_close{close}
  {
    if (not m_element)
      throw usage_error{"Collection codec has no element codec."};
  }

private:
  codec_ptr<element_type> m_element;
  data_type m_type;
  char m_open, m_close;
};


/// Codec for a CQL `list`, as any sequence container.
/** The literal format is `[e1,e2,...]`.
 */
template<sequence_container CONTAINER>
class list_codec final : public element_collection_codec<CONTAINER>
{
public:
  using element_type = typename CONTAINER::value_type;

  explicit list_codec(codec_ptr<element_type> element, bool frozen = false) :
          element_collection_codec<CONTAINER>{
            element, data_type::list_of(element->cql_type(), frozen), '[',
            ']'}
  {}

  [[nodiscard]] codec_ptr<CONTAINER> adapt(data_type const &type) const override
  {
    if (type.kind() != type_kind::list)
      return {};
    auto adapted{this->element()->adapt(type.element())};
    if (not adapted)
      return {};
    return std::make_shared<list_codec const>(
      std::move(adapted), this->cql_type().frozen());
  }
};


/// Codec for a CQL `set`, as any set container.
/** The literal format is `{e1,e2,...}`.  A set can't contain a null, so
 * encoding one throws @ref illegal_value.
 */
template<set_container CONTAINER>
class set_codec final : public element_collection_codec<CONTAINER>
{
public:
  using element_type = typename CONTAINER::value_type;

  explicit set_codec(codec_ptr<element_type> element, bool frozen = false) :
          element_collection_codec<CONTAINER>{
            element, data_type::set_of(element->cql_type(), frozen), '{',
            '}'}
  {}

  [[nodiscard]] codec_ptr<CONTAINER> adapt(data_type const &type) const override
  {
    if (type.kind() != type_kind::set)
      return {};
    auto adapted{this->element()->adapt(type.element())};
    if (not adapted)
      return {};
    return std::make_shared<set_codec const>(
      std::move(adapted), this->cql_type().frozen());
  }
};


/// Codec for a CQL `map`, as any map container.
/** On the wire, a map is a pair count, followed by alternating keys and
 * values, each with its length prefix.  Encoding follows the container's
 * iteration order: for a sorted map, that is the order of its comparator.
 *
 * The literal format is `{k1:v1,k2:v2,...}`.
 */
template<map_container CONTAINER> class map_codec final : public codec<CONTAINER>
{
public:
  using key_type = typename CONTAINER::key_type;
  using mapped_type = typename CONTAINER::mapped_type;

  map_codec(
    codec_ptr<key_type> key, codec_ptr<mapped_type> value,
    bool frozen = false) :
          m_key{std::move(key)},
          m_value{std::move(value)},
          m_type{data_type::map_of(
            m_key->cql_type(), m_value->cql_type(), frozen)}
  {}

  [[nodiscard]] data_type cql_type() const override { return m_type; }

  using codec_base::accepts;

  [[nodiscard]] bool accepts(data_type const &type) const override
  {
    return type.kind() == type_kind::map and m_key->accepts(type.key()) and
           m_value->accepts(type.value());
  }

  /// Accepts any standard container of the same collection kind.
  [[nodiscard]] bool accepts(std::any const &value) const override
  {
    return internal::holds_kind<CONTAINER>(
      value, internal::family_of<CONTAINER>{});
  }

  [[nodiscard]] wire_value encode_any(std::any const &value) const override
  {
    if (auto const *const exact{std::any_cast<CONTAINER>(&value)})
      return this->encode(*exact);
    auto const converted{internal::convert_kind<CONTAINER>(
      value, internal::family_of<CONTAINER>{})};
    if (not converted.has_value())
      return codec<CONTAINER>::encode_any(value);
    return this->encode(*converted);
  }

  [[nodiscard]] wire_value encode(CONTAINER const &value) const override
  {
    bytes out;
    internal::write_count(out, std::size(value));
    std::size_t position{0};
    for (auto const &[k, v] : value)
    {
      auto const key_data{m_key->encode(k)};
      if (not key_data.has_value())
        internal::throw_null_element(m_type, position);
      auto const value_data{m_value->encode(v)};
      if (not value_data.has_value())
        internal::throw_null_element(m_type, position);
      internal::write_framed(out, *key_data);
      internal::write_framed(out, *value_data);
      ++position;
    }
    return out;
  }

  [[nodiscard]] CONTAINER decode(std::optional<bytes_view> data) const override
  {
    if (not data.has_value() or std::empty(*data))
      return {};
    internal::wire_reader in{*data};
    auto const count{internal::read_count(in, m_type)};
    builder<CONTAINER> out{count};
    for (std::size_t i{0}; i < count; ++i)
    {
      auto k{m_key->decode(in.read_framed("map key"))};
      auto v{m_value->decode(in.read_framed("map value"))};
      out.add(std::move(k), std::move(v));
    }
    in.expect_end(m_type.to_string());
    return std::move(out).build();
  }

  [[nodiscard]] std::string format(CONTAINER const &value) const override
  {
    std::string out{'{'};
    bool first{true};
    for (auto const &[k, v] : value)
    {
      if (not first)
        out.push_back(',');
      first = false;
      out.append(m_key->format(k));
      out.push_back(':');
      out.append(m_value->format(v));
    }
    out.push_back('}');
    return out;
  }

  [[nodiscard]] CONTAINER parse(std::string_view text) const override
  {
    if (internal::is_null_literal(text))
      return {};
    auto const entries{internal::split_collection(m_type, text, '{', '}')};
    builder<CONTAINER> out{std::size(entries)};
    for (auto const entry : entries)
    {
      auto const pair{internal::split_top_level(entry, ':')};
      if (not pair.has_value() or std::size(*pair) != 2)
        internal::throw_bad_literal(m_type, text);
      out.add(
        internal::parse_item(*m_key, (*pair)[0], m_type, text),
        internal::parse_item(*m_value, (*pair)[1], m_type, text));
    }
    return std::move(out).build();
  }

  [[nodiscard]] codec_ptr<CONTAINER> adapt(data_type const &type) const override
  {
    if (type.kind() != type_kind::map)
      return {};
    auto key{m_key->adapt(type.key())};
    auto value{m_value->adapt(type.value())};
    if (not key and not value)
      return {};
    return std::make_shared<map_codec const>(
      key ? std::move(key) : m_key, value ? std::move(value) : m_value,
      m_type.frozen());
  }

private:
  codec_ptr<key_type> m_key;
  codec_ptr<mapped_type> m_value;
  data_type m_type;
};


/// Create a codec for a `list` as a `CONTAINER`.
template<sequence_container CONTAINER>
[[nodiscard]] inline codec_ptr<CONTAINER> make_list_codec(
  codec_ptr<typename CONTAINER::value_type> element, bool frozen = false)
{
  return std::make_shared<list_codec<CONTAINER> const>(
    std::move(element), frozen);
}


/// Create a codec for a `set` as a `CONTAINER`.
template<set_container CONTAINER>
[[nodiscard]] inline codec_ptr<CONTAINER> make_set_codec(
  codec_ptr<typename CONTAINER::value_type> element, bool frozen = false)
{
  return std::make_shared<set_codec<CONTAINER> const>(
    std::move(element), frozen);
}


/// Create a codec for a `map` as a `CONTAINER`.
template<map_container CONTAINER>
[[nodiscard]] inline codec_ptr<CONTAINER> make_map_codec(
  codec_ptr<typename CONTAINER::key_type> key,
  codec_ptr<typename CONTAINER::mapped_type> value, bool frozen = false)
{
  return std::make_shared<map_codec<CONTAINER> const>(
    std::move(key), std::move(value), frozen);
}


/// Codec for a `list` as a `std::vector`.
template<typename ELEMENT>
[[nodiscard]] inline codec_ptr<std::vector<ELEMENT>>
list_of(codec_ptr<ELEMENT> element, bool frozen = false)
{
  return make_list_codec<std::vector<ELEMENT>>(std::move(element), frozen);
}


/// Codec for a `set` as a `std::set`.
template<typename ELEMENT>
[[nodiscard]] inline codec_ptr<std::set<ELEMENT>>
set_of(codec_ptr<ELEMENT> element, bool frozen = false)
{
  return make_set_codec<std::set<ELEMENT>>(std::move(element), frozen);
}


/// Codec for a `map` as a `std::unordered_map`.
template<typename KEY, typename VALUE>
[[nodiscard]] inline codec_ptr<std::unordered_map<KEY, VALUE>>
map_of(codec_ptr<KEY> key, codec_ptr<VALUE> value, bool frozen = false)
{
  return make_map_codec<std::unordered_map<KEY, VALUE>>(
    std::move(key), std::move(value), frozen);
}


/// Codec for a `map` as a `std::map`, ordered by `COMPARE`.
template<typename KEY, typename VALUE, typename COMPARE = std::less<KEY>>
[[nodiscard]] inline codec_ptr<std::map<KEY, VALUE, COMPARE>>
sorted_map_of(codec_ptr<KEY> key, codec_ptr<VALUE> value, bool frozen = false)
{
  return make_map_codec<std::map<KEY, VALUE, COMPARE>>(
    std::move(key), std::move(value), frozen);
}


template<has_natural_codec ELEMENT> struct natural_codec<std::vector<ELEMENT>>
{
  [[nodiscard]] static codec_ptr<std::vector<ELEMENT>> get()
  {
    return list_of(default_codec<ELEMENT>());
  }
};


template<has_natural_codec ELEMENT> struct natural_codec<std::deque<ELEMENT>>
{
  [[nodiscard]] static codec_ptr<std::deque<ELEMENT>> get()
  {
    return make_list_codec<std::deque<ELEMENT>>(default_codec<ELEMENT>());
  }
};


template<has_natural_codec ELEMENT> struct natural_codec<std::list<ELEMENT>>
{
  [[nodiscard]] static codec_ptr<std::list<ELEMENT>> get()
  {
    return make_list_codec<std::list<ELEMENT>>(default_codec<ELEMENT>());
  }
};


template<has_natural_codec ELEMENT, typename COMPARE>
struct natural_codec<std::set<ELEMENT, COMPARE>>
{
  [[nodiscard]] static codec_ptr<std::set<ELEMENT, COMPARE>> get()
  {
    return make_set_codec<std::set<ELEMENT, COMPARE>>(
      default_codec<ELEMENT>());
  }
};


template<has_natural_codec ELEMENT>
struct natural_codec<std::unordered_set<ELEMENT>>
{
  [[nodiscard]] static codec_ptr<std::unordered_set<ELEMENT>> get()
  {
    return make_set_codec<std::unordered_set<ELEMENT>>(
      default_codec<ELEMENT>());
  }
};


template<has_natural_codec KEY, has_natural_codec VALUE, typename COMPARE>
struct natural_codec<std::map<KEY, VALUE, COMPARE>>
{
  [[nodiscard]] static codec_ptr<std::map<KEY, VALUE, COMPARE>> get()
  {
    return sorted_map_of<KEY, VALUE, COMPARE>(
      default_codec<KEY>(), default_codec<VALUE>());
  }
};


template<has_natural_codec KEY, has_natural_codec VALUE>
struct natural_codec<std::unordered_map<KEY, VALUE>>
{
  [[nodiscard]] static codec_ptr<std::unordered_map<KEY, VALUE>> get()
  {
    return map_of(default_codec<KEY>(), default_codec<VALUE>());
  }
};
} // namespace cqlxx
#endif
