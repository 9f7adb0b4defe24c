/* Codecs for C++ enums: by name, or by position.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/enum instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_ENUM)
#  define CQLXX_H_ENUM

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <array>
#  include <cstdint>
#  include <memory>
#  include <string>
#  include <string_view>
#  include <type_traits>
#  include <vector>

#  include "cqlxx/internal/macros.hxx"
#  include "cqlxx/mapping_codec.hxx"
#  include "cqlxx/naming.hxx"
#  include "cqlxx/primitives.hxx"


namespace cqlxx
{
/// The closed list of an enum's variants, in declaration order.
/** Don't specialise this yourself; use @ref CQLXX_DECLARE_ENUM.  A
 * specialisation has:
 * * `name`: the enum's name, for diagnostics.
 * * `values`: a `std::array` of the enum's values.
 * * `names`: a `std::array` of their names, as `std::string_view`.
 */
template<typename ENUM> struct enum_variants;


/// An enum type which has been declared with @ref CQLXX_DECLARE_ENUM.
template<typename ENUM>
concept declared_enum = std::is_enum_v<ENUM> and requires {
  enum_variants<ENUM>::name;
  enum_variants<ENUM>::values;
  enum_variants<ENUM>::names;
};


namespace internal
{
/// Position of `value` in `ENUM`'s variant list.
template<declared_enum ENUM>
[[nodiscard]] inline std::size_t variant_index(ENUM value)
{
  auto const &values{enum_variants<ENUM>::values};
  for (std::size_t i{0}; i < std::size(values); ++i)
    if (values[i] == value)
      return i;
  throw illegal_value{concat(
    "Value ", static_cast<std::underlying_type_t<ENUM>>(value),
    " is not a declared variant of ", enum_variants<ENUM>::name, ".")};
}
} // namespace internal


/// Codec for an enum, represented by the names of its variants as `text`.
/** The wire value is the UTF-8 name of the variant, as translated by a
 * @ref naming_scheme; by default the name stays as it is in C++.  Decoding
 * a name which matches none of the variants throws @ref no_such_variant.
 */
template<declared_enum ENUM>
class nominal_enum_codec final : public mapping_codec<std::string, ENUM>
{
public:
  explicit nominal_enum_codec(
    naming_scheme const &naming = naming_scheme::identity()) :
          mapping_codec<std::string, ENUM>{default_codec<std::string>()}
  {
    for (auto const name : enum_variants<ENUM>::names)
      m_names.push_back(naming(name));
  }

protected:
  [[nodiscard]] ENUM inner_to_outer(std::string const &name) const override
  {
    for (std::size_t i{0}; i < std::size(m_names); ++i)
      if (m_names[i] == name)
        return enum_variants<ENUM>::values[i];
    throw no_such_variant{
      internal::concat(
        "Enum ", enum_variants<ENUM>::name, " has no variant named '", name,
        "'."),
      std::string{enum_variants<ENUM>::name}, name};
  }

  [[nodiscard]] std::string outer_to_inner(ENUM const &value) const override
  {
    return m_names[internal::variant_index(value)];
  }

private:
  std::vector<std::string> m_names;
};


/// Codec for an enum, represented by the positions of its variants as `int`.
/** Positions count from zero, in declaration order: not the enum's numeric
 * values.  Decoding a position outside the enum's variant list throws
 * @ref no_such_variant.
 */
template<declared_enum ENUM>
class ordinal_enum_codec final : public mapping_codec<std::int32_t, ENUM>
{
public:
  ordinal_enum_codec() :
          mapping_codec<std::int32_t, ENUM>{default_codec<std::int32_t>()}
  {}

protected:
  [[nodiscard]] ENUM inner_to_outer(std::int32_t const &index) const override
  {
    auto const &values{enum_variants<ENUM>::values};
    if (index < 0 or static_cast<std::size_t>(index) >= std::size(values))
      throw no_such_variant{
        internal::concat(
          "Enum ", enum_variants<ENUM>::name, " has no variant at position ",
          index, "; it has ", std::size(values), " variants."),
        std::string{enum_variants<ENUM>::name}, internal::concat(index)};
    return values[static_cast<std::size_t>(index)];
  }

  [[nodiscard]] std::int32_t outer_to_inner(ENUM const &value) const override
  {
    return static_cast<std::int32_t>(internal::variant_index(value));
  }
};


template<declared_enum ENUM>
[[nodiscard]] inline codec_ptr<ENUM>
nominal_enum(naming_scheme const &naming = naming_scheme::identity())
{
  return std::make_shared<nominal_enum_codec<ENUM> const>(naming);
}


template<declared_enum ENUM> [[nodiscard]] inline codec_ptr<ENUM> ordinal_enum()
{
  return std::make_shared<ordinal_enum_codec<ENUM> const>();
}


/// By default, an enum is stored by name.
template<declared_enum ENUM> struct natural_codec<ENUM>
{
  [[nodiscard]] static codec_ptr<ENUM> get()
  {
    static auto const c{nominal_enum<ENUM>()};
    return c;
  }
};
} // namespace cqlxx


#  define CQLXX_ENUM_VALUE(ENUM, variant) ENUM::variant
#  define CQLXX_ENUM_NAME(ENUM, variant) std::string_view{#variant}

/// Declare an enum's variants, so cqlxx can derive codecs for it.
/** Use this in the global namespace, listing every variant of the enum in
 * its declaration order:
 *
 * ```cxx
 * enum class finger { thumb, index, middle, ring, little };
 * CQLXX_DECLARE_ENUM(finger, thumb, index, middle, ring, little);
 * ```
 */
#  define CQLXX_DECLARE_ENUM(ENUM, ...)                                       \
    template<> struct cqlxx::enum_variants<ENUM> final                        \
    {                                                                         \
      static constexpr std::string_view name{#ENUM};                          \
      static constexpr std::array values{                                     \
        CQLXX_FOR_EACH(CQLXX_ENUM_VALUE, ENUM, __VA_ARGS__)};                 \
      static constexpr std::array names{                                      \
        CQLXX_FOR_EACH(CQLXX_ENUM_NAME, ENUM, __VA_ARGS__)};                  \
    }
#endif
