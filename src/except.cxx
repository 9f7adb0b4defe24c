/** Implementation of cqlxx exception classes.
 *
 * Copyright (c) 2021-2026, the cqlxx authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "cqlxx-source.hxx"

#include <utility>

#include "cqlxx/internal/header-pre.hxx"

#include "cqlxx/except.hxx"
#include "cqlxx/internal/concat.hxx"
#include "cqlxx/types.hxx"

#include "cqlxx/internal/header-post.hxx"


cqlxx::failure::failure(std::string const &whatarg, sl loc) :
        std::runtime_error{whatarg}, location{loc}
{}


cqlxx::internal_error::internal_error(std::string const &whatarg, sl loc) :
        std::logic_error{internal::concat("cqlxx internal error: ", whatarg)},
        location{loc}
{}


cqlxx::usage_error::usage_error(std::string const &whatarg, sl loc) :
        std::logic_error{whatarg}, location{loc}
{}


cqlxx::argument_error::argument_error(std::string const &whatarg, sl loc) :
        invalid_argument{whatarg}, location{loc}
{}


cqlxx::conversion_error::conversion_error(std::string const &whatarg, sl loc) :
        domain_error{whatarg}, location{loc}
{}


cqlxx::decode_error::decode_error(
  std::string const &whatarg, std::size_t expected, std::size_t actual,
  sl loc) :
        conversion_error{
          internal::concat(
            whatarg, " (expected ", expected, " bytes, got ", actual, ")"),
          loc},
        m_expected{expected},
        m_actual{actual}
{}


cqlxx::illegal_value::illegal_value(std::string const &whatarg, sl loc) :
        conversion_error{whatarg, loc}
{}


cqlxx::no_such_variant::no_such_variant(
  std::string const &whatarg, std::string enum_name, std::string value,
  sl loc) :
        conversion_error{whatarg, loc},
        m_enum{std::move(enum_name)},
        m_value{std::move(value)}
{}


cqlxx::unexpected_null::unexpected_null(std::string const &whatarg, sl loc) :
        conversion_error{whatarg, loc}
{}


cqlxx::schema_mismatch::schema_mismatch(
  std::string const &whatarg, std::string udt, std::string field, sl loc) :
        usage_error{whatarg, loc},
        m_udt{std::move(udt)},
        m_field{std::move(field)}
{}


cqlxx::codec_not_found::codec_not_found(std::string const &whatarg, sl loc) :
        usage_error{whatarg, loc}
{}


cqlxx::paging_error::paging_error(std::string const &whatarg, sl loc) :
        failure{whatarg, loc}
{}


cqlxx::corrupted_state::corrupted_state(std::string const &whatarg, sl loc) :
        paging_error{whatarg, loc}
{}


cqlxx::statement_mismatch::statement_mismatch(
  std::string const &whatarg, std::string component, sl loc) :
        paging_error{whatarg, loc}, m_component{std::move(component)}
{}
