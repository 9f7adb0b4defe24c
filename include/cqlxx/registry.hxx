/* The codec registry: find a codec for a CQL type and/or a C++ value.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include cqlxx/registry instead.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(CQLXX_H_REGISTRY)
#  define CQLXX_H_REGISTRY

#  if !defined(CQLXX_HEADER_PRE)
#    error "Include cqlxx headers as <cqlxx/header>, not <cqlxx/header.hxx>."
#  endif

#  include <any>
#  include <functional>
#  include <memory>
#  include <optional>
#  include <shared_mutex>
#  include <string>
#  include <typeinfo>
#  include <vector>

#  include "cqlxx/codec.hxx"
#  include "cqlxx/data_type.hxx"
#  include "cqlxx/except.hxx"
#  include "cqlxx/internal/concat.hxx"


namespace cqlxx
{
/// A collection of codecs, searchable by CQL type and by C++ value.
/** Lookups may run concurrently with each other and with registration.
 *
 * When more than one registered codec matches a lookup, the one registered
 * most recently wins.  So a codec you register yourself shadows any built-in
 * codec for the same type, and of two codecs which both accept the same
 * sample value (such as two optional codecs, which both accept a
 * `std::nullopt`) the later one wins.  An ambiguous lookup writes a debug
 * message to the log.
 */
class CQLXX_LIBEXPORT codec_registry
{
public:
  /// Create a registry.  Unless `builtins` is false, it comes with codecs
  /// for all the primitive types already registered.
  explicit codec_registry(bool builtins = true);

  codec_registry(codec_registry const &) = delete;
  codec_registry &operator=(codec_registry const &) = delete;

  /// Add `c` to the registry.
  void register_codec(any_codec_ptr c);

  /// Number of registered codecs.
  [[nodiscard]] std::size_t size() const;

  /// Find a codec for CQL type `type`.
  /** If the codec can adapt itself to the exact type (e.g. to a UDT's field
   * order in the live schema), the result is the adapted codec.
   *
   * @throw codec_not_found if no registered codec accepts `type`.
   */
  [[nodiscard]] any_codec_ptr resolve(data_type const &type) const;

  /// Find a codec for CQL type `type` which also accepts `sample`.
  /** A collection codec accepts any standard container of its kind, so a
   * `std::deque` sample can find a codec for `std::vector`.
   */
  [[nodiscard]] any_codec_ptr
  resolve(data_type const &type, std::any const &sample) const;

  /// Find a codec which accepts value `sample`, regardless of CQL type.
  [[nodiscard]] any_codec_ptr resolve(std::any const &sample) const;

  /// Find a codec for CQL type `type` with C++ value type `TYPE`.
  template<typename TYPE>
  [[nodiscard]] codec_ptr<TYPE> resolve(data_type const &type) const
  {
    auto const found{find(
      [&type](codec_base const &c) {
        return c.value_type() == typeid(TYPE) and c.accepts(type);
      },
      type.to_string())};
    auto typed{std::dynamic_pointer_cast<codec<TYPE> const>(found)};
    if (not typed)
      throw internal_error{internal::concat(
        "Codec registered for ", typeid(TYPE).name(),
        " is not a codec of that type.")};
    return adapt_or_keep(typed, type);
  }

private:
  using predicate = std::function<bool(codec_base const &)>;

  /// The most recently registered codec matching `match`.
  [[nodiscard]] any_codec_ptr
  find(predicate const &match, std::string const &what) const;

  [[nodiscard]] any_codec_ptr
  adapt(any_codec_ptr const &c, data_type const &type) const;

  mutable std::shared_mutex m_mutex;
  std::vector<any_codec_ptr> m_codecs;
};
} // namespace cqlxx
#endif
