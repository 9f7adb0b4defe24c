/* The codec contract: conversions between C++ values and CQL values.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/codec instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_CODEC)
#  define CQLXX_H_CODEC

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <any>
#  include <concepts>
#  include <memory>
#  include <optional>
#  include <string>
#  include <string_view>
#  include <typeinfo>

#  include "cqlxx/data_type.hxx"
#  include "cqlxx/except.hxx"
#  include "cqlxx/internal/concat.hxx"
#  include "cqlxx/types.hxx"


namespace cqlxx
{
/**
 * @defgroup codecs Codecs
 *
 * A codec converts values of one C++ type to and from one CQL type.  It does
 * this in two ways: to and from the binary wire format (`encode` and
 * `decode`), and to and from the human-readable CQL literal format (`format`
 * and `parse`).
 *
 * Codecs are immutable.  Once constructed you can share them freely between
 * threads.  You normally hold them through a @ref codec_ptr.
 *
 * @{
 */

/// Traits describing a type's "null value," if any.
/** Some C++ types have a special value or state which corresponds directly
 * to a CQL null.  Most don't: for those, this default applies.
 */
template<typename TYPE> struct nullness
{
  /// Does @c TYPE have a "built-in null value"?
  static constexpr bool has_null = false;

  /// Does a given value correspond to a CQL null value?
  [[nodiscard]] static constexpr bool is_null(TYPE const &) noexcept
  {
    return false;
  }
};


/// Nullness traits for `std::optional`: `std::nullopt` is null.
template<typename TYPE> struct nullness<std::optional<TYPE>>
{
  static constexpr bool has_null = true;

  [[nodiscard]] static constexpr bool
  is_null(std::optional<TYPE> const &value) noexcept
  {
    return not value.has_value();
  }

  [[nodiscard]] static constexpr std::optional<TYPE> null() noexcept
  {
    return {};
  }
};


/// Type-erased base class for all codecs.
/** This is the part of the codec interface which does not depend on the C++
 * value type.  The @ref codec_registry works at this level.
 */
class CQLXX_LIBEXPORT codec_base
{
public:
  codec_base() = default;
  codec_base(codec_base const &) = delete;
  codec_base &operator=(codec_base const &) = delete;
  virtual ~codec_base() noexcept;

  /// The CQL type which this codec serves.
  [[nodiscard]] virtual data_type cql_type() const = 0;

  /// The C++ type which this codec serves.
  [[nodiscard]] virtual std::type_info const &value_type() const noexcept = 0;

  /// Can this codec handle values of CQL type `type`?
  /** By default, a codec accepts any type with the same shape as its own
   * @ref cql_type: frozen flags and missing UDT keyspaces don't matter.
   */
  [[nodiscard]] virtual bool accepts(data_type const &type) const;

  /// Can this codec handle `value`?
  /** By default, a codec accepts only values of exactly its own C++ type.
   */
  [[nodiscard]] virtual bool accepts(std::any const &value) const;

  /// Human-readable description, for diagnostics.
  [[nodiscard]] virtual std::string describe() const;

  /// Encode a value of this codec's type, passed as a `std::any`.
  /** @throw argument_error if `value` does not hold this codec's type.
   */
  [[nodiscard]] virtual wire_value encode_any(std::any const &value) const = 0;

  /// Decode a value into a `std::any` holding this codec's C++ type.
  [[nodiscard]] virtual std::any
  decode_any(std::optional<bytes_view> data) const = 0;

  /// Type-erased @ref codec::adapt.
  [[nodiscard]] virtual any_codec_ptr adapt_any(data_type const &) const = 0;
};


/// Codec for values of C++ type `TYPE`.
template<typename TYPE> class codec : public codec_base
{
public:
  using value_type_t = TYPE;

  /// Encode `value` into wire format.
  /** Returns nothing ("absent") only for a null value.  A value which
   * violates its CQL type's rules throws @ref illegal_value.
   */
  [[nodiscard]] virtual wire_value encode(TYPE const &value) const = 0;

  /// Decode wire data into a value.
  /** An absent value decodes as the type's null, or if it has none, usually
   * as its default value.  Data whose length is impossible for this type
   * throws @ref decode_error.
   */
  [[nodiscard]] virtual TYPE decode(std::optional<bytes_view> data) const = 0;

  /// Represent `value` as a CQL literal.  Null becomes "NULL".
  [[nodiscard]] virtual std::string format(TYPE const &value) const = 0;

  /// Parse a CQL literal.  Accepts "NULL" in any case.
  /** @throw argument_error if `text` is not a valid literal for this type.
   */
  [[nodiscard]] virtual TYPE parse(std::string_view text) const = 0;

  /// Obtain a variant of this codec specialised for a live schema type.
  /** Most codecs need no such thing, and return null.  A user-defined type's
   * codec may need to deal with a schema whose field order differs from the
   * C++ type's declaration, and so may collections or optionals containing
   * user-defined types.
   */
  [[nodiscard]] virtual std::shared_ptr<codec<TYPE> const>
  adapt(data_type const &) const
  {
    return {};
  }

  [[nodiscard]] std::type_info const &value_type() const noexcept override
  {
    return typeid(TYPE);
  }

  [[nodiscard]] wire_value encode_any(std::any const &value) const override
  {
    auto const *const ptr{std::any_cast<TYPE>(&value)};
    if (ptr == nullptr)
      throw argument_error{internal::concat(
        "Codec ", describe(), " can't encode a value of type ",
        value.type().name(), ".")};
    return encode(*ptr);
  }

  [[nodiscard]] std::any
  decode_any(std::optional<bytes_view> data) const override
  {
    return decode(data);
  }

  [[nodiscard]] any_codec_ptr adapt_any(data_type const &type) const override
  {
    return adapt(type);
  }
};


/// Default codec for C++ type `TYPE`.
/** Specialise this to tell cqlxx which codec to use for a type, where it
 * needs one without being told.  Provide a static member function `get()`
 * returning a @ref codec_ptr.
 */
template<typename TYPE> struct natural_codec;


/// Does `TYPE` have a default codec?
template<typename TYPE>
concept has_natural_codec = requires {
  { natural_codec<TYPE>::get() } -> std::convertible_to<codec_ptr<TYPE>>;
};


/// Get the default codec for `TYPE`.
template<has_natural_codec TYPE>
[[nodiscard]] inline codec_ptr<TYPE> default_codec()
{
  return natural_codec<TYPE>::get();
}


/// Adapt `base` to `type` if it needs it, or just return `base`.
template<typename TYPE>
[[nodiscard]] inline codec_ptr<TYPE>
adapt_or_keep(codec_ptr<TYPE> const &base, data_type const &type)
{
  auto adapted{base->adapt(type)};
  return adapted ? adapted : base;
}

/**
 * @}
 */
} // namespace cqlxx
#endif
