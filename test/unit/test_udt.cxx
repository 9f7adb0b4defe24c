#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <cqlxx/udt>

#include "../helpers.hxx"


namespace
{
struct address
{
  std::string street;
  std::string city;
  std::int32_t postalCode;
  std::optional<std::string> country;

  bool operator==(address const &) const = default;
};


struct customer
{
  std::string name;
  address home;

  bool operator==(customer const &) const = default;
};
} // namespace


CQLXX_DECLARE_UDT(address, street, city, postalCode, country);
CQLXX_DECLARE_UDT(customer, name, home);


namespace
{
using cqlxx::data_type;
using cqlxx::field_descriptor;
using cqlxx::type_kind;


data_type const text{type_kind::text}, integer{type_kind::int_};


/// Concatenate the length-prefixed encodings of some fields.
cqlxx::bytes
framed(std::initializer_list<cqlxx::wire_value> fields)
{
  cqlxx::bytes out;
  for (auto const &f : fields)
    if (f.has_value())
      cqlxx::internal::write_framed(out, cqlxx::bytes_view{*f});
    else
      cqlxx::internal::write_framed(out, std::nullopt);
  return out;
}


cqlxx::wire_value text_value(std::string const &s)
{
  return cqlxx::to_bytes(s);
}


cqlxx::wire_value int_value(std::int32_t i)
{
  return cqlxx::default_codec<std::int32_t>()->encode(i);
}


address const sample{"Main Street", "Springfield", 1234, std::nullopt};


/// The address type as the database declares it, in declaration order.
data_type address_schema()
{
  return data_type::udt(
    "ks", "address",
    {{"street", text},
     {"city", text},
     {"postal_code", integer},
     {"country", text}});
}


/// The address type with its fields in a different order.
data_type permuted_address_schema()
{
  return data_type::udt(
    "ks", "address",
    {{"postal_code", integer},
     {"country", text},
     {"city", text},
     {"street", text}});
}


void test_udt_declared_type()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const type{c->cql_type()};
  CQLXX_CHECK_EQUAL(type.to_string(), "address");
  CQLXX_CHECK_EQUAL(type.field_count(), 4u);
  CQLXX_CHECK_EQUAL(type.field_name(2), "postal_code");
  CQLXX_CHECK_EQUAL(type.field_type(2).to_string(), "int");
  CQLXX_CHECK_EQUAL(type.field_name(3), "country");
  CQLXX_CHECK(c->accepts(address_schema()));
  CQLXX_CHECK(c->accepts(permuted_address_schema()));
  CQLXX_CHECK(not c->accepts(data_type::udt("ks", "addresses", {})));
}


void test_udt_encodes_fields_in_order()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const expected{framed(
    {text_value("Main Street"), text_value("Springfield"), int_value(1234),
     std::nullopt})};
  CQLXX_CHECK_EQUAL(c->encode(sample), expected);
  CQLXX_CHECK(c->decode(cqlxx::bytes_view{expected}) == sample);
}


void test_udt_literals()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const literal{c->format(sample)};
  CQLXX_CHECK_EQUAL(
    literal,
    "{street:'Main Street',city:'Springfield',postal_code:1234,country:NULL}");
  CQLXX_CHECK(c->parse(literal) == sample);

  // Fields may come in any order, and missing ones keep their defaults.
  auto const partial{c->parse("{ city : 'Paris', street:'Rue, 1' }")};
  CQLXX_CHECK_EQUAL(partial.city, "Paris");
  CQLXX_CHECK_EQUAL(partial.street, "Rue, 1");
  CQLXX_CHECK_EQUAL(partial.postalCode, 0);
  CQLXX_CHECK(not partial.country.has_value());

  CQLXX_CHECK_THROWS(
    std::ignore = c->parse("{zip:1234}"), cqlxx::argument_error);
  CQLXX_CHECK_THROWS(
    std::ignore = c->parse("{postal_code:'x'}"), cqlxx::argument_error);
  CQLXX_CHECK_THROWS(
    std::ignore = c->parse("{street}"), cqlxx::argument_error);
}


void test_udt_permuted_schema()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const permuted{c->for_schema(permuted_address_schema())};

  address const value{"Elm", "Shelbyville", 42, "USA"};
  auto const expected{framed(
    {int_value(42), text_value("USA"), text_value("Shelbyville"),
     text_value("Elm")})};
  CQLXX_CHECK_EQUAL(permuted->encode(value), expected);
  CQLXX_CHECK(
    permuted->decode(cqlxx::bytes_view{expected}) == value,
    "Permuted fields did not decode to the right members.");

  // Adapting picks the same codec.
  auto const adapted{c->adapt(permuted_address_schema())};
  CQLXX_CHECK(adapted != nullptr);
  CQLXX_CHECK(adapted == permuted, "Schema version was not memoised.");
}


void test_udt_identical_schema_matches_permuted_path()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const schema{address_schema()};

  // The declaration order needs no adaptation.
  CQLXX_CHECK(c->adapt(schema) == nullptr);

  cqlxx::identical_udt_codec<address> const identical;
  cqlxx::non_identical_udt_codec<address> const by_name{{}, schema};
  address const value{"Evergreen Terrace", "Springfield", 742, "USA"};
  CQLXX_CHECK_EQUAL(by_name.encode(value), identical.encode(value));
  CQLXX_CHECK_EQUAL(c->for_schema(schema)->encode(value), identical.encode(value));
}


void test_udt_schema_mismatch()
{
  cqlxx::udt_options const options;

  auto const extra{data_type::udt(
    "ks", "address",
    {{"street", text},
     {"city", text},
     {"postal_code", integer},
     {"zip", text}})};
  try
  {
    cqlxx::non_identical_udt_codec<address> const c{options, extra};
    cqlxx::test::check_notreached("Schema field without member accepted.");
  }
  catch (cqlxx::schema_mismatch const &e)
  {
    CQLXX_CHECK_EQUAL(e.udt(), "ks.address");
    CQLXX_CHECK_EQUAL(e.field(), "zip");
  }

  auto const missing{data_type::udt(
    "ks", "address", {{"street", text}, {"city", text}, {"country", text}})};
  CQLXX_CHECK_THROWS(
    (cqlxx::non_identical_udt_codec<address>{options, missing}),
    cqlxx::schema_mismatch, "Non-nullable member without field accepted.");

  auto const wrong_type{data_type::udt(
    "ks", "address",
    {{"street", text},
     {"city", text},
     {"postal_code", text},
     {"country", text}})};
  CQLXX_CHECK_THROWS(
    std::ignore = cqlxx::udt_of<address>()->for_schema(wrong_type),
    cqlxx::schema_mismatch);
}


void test_udt_schema_for_other_type_refused()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const other{data_type::udt(
    "ks", "location",
    {{"street", text},
     {"city", text},
     {"postal_code", integer},
     {"country", text}})};
  CQLXX_CHECK(not c->accepts(other));
  try
  {
    std::ignore = c->for_schema(other);
    cqlxx::test::check_notreached("Schema for a different UDT accepted.");
  }
  catch (cqlxx::schema_mismatch const &e)
  {
    CQLXX_CHECK_EQUAL(e.udt(), "ks.location");
  }

  CQLXX_CHECK_THROWS(
    std::ignore = c->for_schema(data_type{type_kind::int_}),
    cqlxx::schema_mismatch);
  CQLXX_CHECK_THROWS(
    std::ignore = c->for_keyspace("shop")->for_schema(address_schema()),
    cqlxx::schema_mismatch);

  // Refused schemas leave nothing behind: the real one still works.
  CQLXX_CHECK(c->for_schema(address_schema()) != nullptr);
}


void test_udt_nullable_member_may_be_missing()
{
  auto const schema{data_type::udt(
    "ks", "address",
    {{"city", text}, {"street", text}, {"postal_code", integer}})};
  auto const c{cqlxx::udt_of<address>()->for_schema(schema)};

  address const value{"Elm", "Ogdenville", 7, "Nowhere"};
  auto const data{*c->encode(value)};
  CQLXX_CHECK_EQUAL(
    data, framed({text_value("Ogdenville"), text_value("Elm"), int_value(7)}),
    "Member without a schema field was written.");

  auto const decoded{c->decode(cqlxx::bytes_view{data})};
  CQLXX_CHECK_EQUAL(decoded.street, "Elm");
  CQLXX_CHECK_EQUAL(decoded.postalCode, 7);
  CQLXX_CHECK(not decoded.country.has_value());
}


void test_udt_rename()
{
  cqlxx::udt_options options;
  options.name = "postal_address";
  options.renames.emplace("postalCode", "zip");
  auto const c{cqlxx::udt_of<address>(options)};

  CQLXX_CHECK_EQUAL(c->cql_type().to_string(), "postal_address");
  CQLXX_CHECK_EQUAL(c->cql_type().field_name(2), "zip");
  CQLXX_CHECK(c->format(sample).find(",zip:1234,") != std::string::npos);

  auto const schema{data_type::udt(
    "ks", "postal_address",
    {{"zip", integer},
     {"street", text},
     {"city", text},
     {"country", text}})};
  auto const permuted{c->for_schema(schema)};
  auto const data{*permuted->encode(sample)};
  CQLXX_CHECK(permuted->decode(cqlxx::bytes_view{data}) == sample);
  CQLXX_CHECK_EQUAL(
    data, framed(
            {int_value(1234), text_value("Main Street"),
             text_value("Springfield"), std::nullopt}));
}


void test_udt_identity_naming()
{
  cqlxx::udt_options options;
  options.naming = cqlxx::naming_scheme::identity();
  auto const c{cqlxx::udt_of<address>(options)};
  CQLXX_CHECK_EQUAL(c->cql_type().field_name(2), "postalCode");
}


void test_udt_tolerates_missing_trailing_fields()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const old{framed({text_value("Elm"), text_value("Capital City")})};
  auto const decoded{c->decode(cqlxx::bytes_view{old})};
  CQLXX_CHECK_EQUAL(decoded.street, "Elm");
  CQLXX_CHECK_EQUAL(decoded.city, "Capital City");
  CQLXX_CHECK_EQUAL(decoded.postalCode, 0);

  auto trailing{*c->encode(sample)};
  trailing.push_back(std::byte{0});
  CQLXX_CHECK_THROWS(
    std::ignore = c->decode(cqlxx::bytes_view{trailing}), cqlxx::decode_error);

  auto truncated{*c->encode(sample)};
  truncated.resize(std::size(truncated) - 2);
  CQLXX_CHECK_THROWS(
    std::ignore = c->decode(cqlxx::bytes_view{truncated}),
    cqlxx::decode_error);
}


void test_nested_udt_adapts_to_schema()
{
  auto const schema{data_type::udt(
    "ks", "customer",
    {{"name", text}, {"home", permuted_address_schema().as_frozen()}})};
  auto const c{cqlxx::udt_of<customer>()->for_schema(schema)};

  customer const value{"Homer", {"Evergreen Terrace", "Springfield", 742, std::nullopt}};
  auto const inner{
    cqlxx::udt_of<address>()->for_schema(permuted_address_schema())->encode(
      value.home)};
  auto const data{*c->encode(value)};
  CQLXX_CHECK_EQUAL(data, framed({text_value("Homer"), inner}));
  CQLXX_CHECK(c->decode(cqlxx::bytes_view{data}) == value);
}


void test_udt_list_field_adapts()
{
  auto const c{cqlxx::list_of(cqlxx::default_codec<address>())};
  auto const schema{data_type::list_of(permuted_address_schema().as_frozen())};
  auto const adapted{cqlxx::adapt_or_keep(c, schema)};
  CQLXX_CHECK(adapted != c, "List of UDTs did not adapt to the schema.");

  std::vector<address> const value{sample, {"Elm", "Ogdenville", 9, "USA"}};
  auto const data{*adapted->encode(value)};
  CQLXX_CHECK(adapted->decode(cqlxx::bytes_view{data}) == value);
  CQLXX_CHECK_NOT_EQUAL(data, *c->encode(value));
}


void test_udt_strategy_memoised_across_threads()
{
  auto const c{cqlxx::udt_of<address>()};
  auto const schema{permuted_address_schema()};
  std::vector<cqlxx::codec_ptr<address>> results(8);
  std::vector<std::thread> threads;
  for (std::size_t t{0}; t < std::size(results); ++t)
    threads.emplace_back([&c, &schema, &results, t] {
      for (int i{0}; i < 50; ++i) results[t] = c->for_schema(schema);
    });
  for (auto &thread : threads) thread.join();

  for (auto const &r : results)
    CQLXX_CHECK(r == results[0], "Threads got different codecs for a schema.");

  // A different version of the schema gets its own codec.
  auto const other{data_type::udt(
    "ks", "address",
    {{"city", text}, {"street", text}, {"postal_code", integer}})};
  CQLXX_CHECK(c->for_schema(other) != results[0]);
}


void test_udt_for_keyspace()
{
  auto const c{cqlxx::udt_of<address>()->for_keyspace("shop")};
  CQLXX_CHECK_EQUAL(c->cql_type().to_string(), "shop.address");
  CQLXX_CHECK(c->accepts(address_schema().with_keyspace("shop")));
  CQLXX_CHECK(not c->accepts(address_schema()));
  CQLXX_CHECK_EQUAL(c->options().keyspace, "shop");
}


CQLXX_REGISTER_TEST(test_udt_declared_type);
CQLXX_REGISTER_TEST(test_udt_encodes_fields_in_order);
CQLXX_REGISTER_TEST(test_udt_literals);
CQLXX_REGISTER_TEST(test_udt_permuted_schema);
CQLXX_REGISTER_TEST(test_udt_identical_schema_matches_permuted_path);
CQLXX_REGISTER_TEST(test_udt_schema_mismatch);
CQLXX_REGISTER_TEST(test_udt_schema_for_other_type_refused);
CQLXX_REGISTER_TEST(test_udt_nullable_member_may_be_missing);
CQLXX_REGISTER_TEST(test_udt_rename);
CQLXX_REGISTER_TEST(test_udt_identity_naming);
CQLXX_REGISTER_TEST(test_udt_tolerates_missing_trailing_fields);
CQLXX_REGISTER_TEST(test_nested_udt_adapts_to_schema);
CQLXX_REGISTER_TEST(test_udt_list_field_adapts);
CQLXX_REGISTER_TEST(test_udt_strategy_memoised_across_threads);
CQLXX_REGISTER_TEST(test_udt_for_keyspace);
} // namespace
