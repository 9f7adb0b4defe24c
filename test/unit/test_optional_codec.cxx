#include <any>
#include <optional>
#include <string>
#include <tuple>

#include <cqlxx/mapping_codec>
#include <cqlxx/optional_codec>
#include <cqlxx/primitives>

#include "../helpers.hxx"


namespace
{
using cqlxx::test::make_bytes;


void test_optional_null_is_absent()
{
  auto const c{cqlxx::default_codec<std::optional<std::int32_t>>()};
  CQLXX_CHECK(not c->encode(std::nullopt).has_value());
  CQLXX_CHECK_EQUAL(c->encode(7), make_bytes(0, 0, 0, 7));
  CQLXX_CHECK(not c->decode(std::nullopt).has_value());
  CQLXX_CHECK_EQUAL(c->cql_type().to_string(), "int");
}


void test_optional_empty_fixed_width_is_null()
{
  cqlxx::bytes const empty;
  auto const num{cqlxx::default_codec<std::optional<std::int32_t>>()};
  CQLXX_CHECK(
    not num->decode(cqlxx::bytes_view{empty}).has_value(),
    "Empty int value did not decode as null.");

  auto const text{cqlxx::default_codec<std::optional<std::string>>()};
  auto const decoded{text->decode(cqlxx::bytes_view{empty})};
  CQLXX_CHECK(decoded.has_value(), "Empty text value decoded as null.");
  CQLXX_CHECK_EQUAL(*decoded, "");
}


void test_optional_literals()
{
  auto const c{cqlxx::default_codec<std::optional<std::string>>()};
  CQLXX_CHECK_EQUAL(c->format(std::nullopt), "NULL");
  CQLXX_CHECK_EQUAL(c->format("x"), "'x'");
  CQLXX_CHECK(not c->parse("null").has_value());
  CQLXX_CHECK(not c->parse("NuLl").has_value());
  CQLXX_CHECK_EQUAL(c->parse("'NULL'"), std::optional<std::string>{"NULL"});
}


void test_optional_accepts_nullopt_sample()
{
  auto const c{cqlxx::default_codec<std::optional<std::int32_t>>()};
  CQLXX_CHECK(c->accepts(std::any{std::optional<std::int32_t>{3}}));
  CQLXX_CHECK(c->accepts(std::any{std::nullopt}));
  CQLXX_CHECK(not c->accepts(std::any{std::int32_t{3}}));
  CQLXX_CHECK(not c->accepts(std::any{std::optional<std::int64_t>{3}}));
}


struct celsius
{
  double degrees;
  bool operator==(celsius const &) const = default;
};


void test_mapping_codec_delegates()
{
  auto const c{cqlxx::make_mapping_codec<celsius>(
    cqlxx::default_codec<double>(),
    [](double d) { return celsius{d}; },
    [](celsius const &v) { return v.degrees; })};

  CQLXX_CHECK_EQUAL(c->cql_type().to_string(), "double");
  CQLXX_CHECK_EQUAL(
    c->encode(celsius{1.0}), cqlxx::default_codec<double>()->encode(1.0));
  auto const data{*c->encode(celsius{21.5})};
  CQLXX_CHECK(c->decode(cqlxx::bytes_view{data}) == celsius{21.5});
  CQLXX_CHECK_EQUAL(c->format(celsius{21.5}), "21.5");
  CQLXX_CHECK(c->parse("-4.0") == celsius{-4.0});
}


void test_mapping_codec_null_without_null_type()
{
  auto const c{cqlxx::make_mapping_codec<celsius>(
    cqlxx::default_codec<double>(),
    [](double d) { return celsius{d}; },
    [](celsius const &v) { return v.degrees; })};
  CQLXX_CHECK_THROWS(
    std::ignore = c->decode(std::nullopt), cqlxx::unexpected_null);
}


void test_mapping_codec_null_propagates()
{
  auto const c{cqlxx::make_mapping_codec<std::optional<celsius>>(
    cqlxx::default_codec<std::optional<double>>(),
    [](std::optional<double> d) -> std::optional<celsius> {
      if (d.has_value())
        return celsius{*d};
      return std::nullopt;
    },
    [](std::optional<celsius> const &v) -> std::optional<double> {
      if (v.has_value())
        return v->degrees;
      return std::nullopt;
    })};

  CQLXX_CHECK(not c->encode(std::nullopt).has_value());
  CQLXX_CHECK(not c->decode(std::nullopt).has_value());
  CQLXX_CHECK_EQUAL(c->format(std::nullopt), "NULL");
  CQLXX_CHECK(not c->parse("NULL").has_value());
}


void test_mapping_codec_declared_type()
{
  auto const c{cqlxx::make_mapping_codec<celsius>(
    cqlxx::default_codec<double>(),
    [](double d) { return celsius{d}; },
    [](celsius const &v) { return v.degrees; },
    cqlxx::data_type{cqlxx::type_kind::decimal})};
  CQLXX_CHECK_EQUAL(c->cql_type().to_string(), "decimal");
  CQLXX_CHECK(c->accepts(cqlxx::data_type{cqlxx::type_kind::decimal}));
  CQLXX_CHECK(not c->accepts(cqlxx::data_type{cqlxx::type_kind::double_}));
}


CQLXX_REGISTER_TEST(test_optional_null_is_absent);
CQLXX_REGISTER_TEST(test_optional_empty_fixed_width_is_null);
CQLXX_REGISTER_TEST(test_optional_literals);
CQLXX_REGISTER_TEST(test_optional_accepts_nullopt_sample);
CQLXX_REGISTER_TEST(test_mapping_codec_delegates);
CQLXX_REGISTER_TEST(test_mapping_codec_null_without_null_type);
CQLXX_REGISTER_TEST(test_mapping_codec_null_propagates);
CQLXX_REGISTER_TEST(test_mapping_codec_declared_type);
} // namespace
