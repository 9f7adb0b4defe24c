#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include <cqlxx/row>

#include "../helpers.hxx"


namespace
{
struct user
{
  std::string userName;
  std::int32_t age;
  std::optional<std::string> nickname;
};
} // namespace


CQLXX_DECLARE_UDT(user, userName, age, nickname);


namespace
{
using cqlxx::column;
using cqlxx::data_type;
using cqlxx::type_kind;


column text_column(std::string name, std::optional<std::string> value)
{
  column out{std::move(name), data_type{type_kind::text}, std::nullopt};
  if (value.has_value())
    out.value = cqlxx::to_bytes(*value);
  return out;
}


column int_column(std::string name, std::optional<std::int32_t> value)
{
  column out{std::move(name), data_type{type_kind::int_}, std::nullopt};
  if (value.has_value())
    out.value = cqlxx::default_codec<std::int32_t>()->encode(*value);
  return out;
}


cqlxx::row const sample{std::vector<column>{
  text_column("user_name", "ada"), int_column("age", 36),
  text_column("nickname", std::nullopt)}};


void test_row_lookup()
{
  CQLXX_CHECK_EQUAL(std::size(sample), 3u);
  CQLXX_CHECK(not std::empty(sample));
  CQLXX_CHECK_EQUAL(sample[1].name, "age");
  CQLXX_CHECK_EQUAL(sample.at("nickname").is_null(), true);
  CQLXX_CHECK_EQUAL(*sample.index_of("age"), 1u);
  CQLXX_CHECK(not sample.index_of("Age").has_value());
  CQLXX_CHECK(sample.has_column("user_name"));

  CQLXX_CHECK_THROWS(std::ignore = sample[3], cqlxx::argument_error);
  CQLXX_CHECK_THROWS(std::ignore = sample.at("email"), cqlxx::argument_error);

  std::size_t count{0};
  for (auto const &c : sample) count += std::size(c.name);
  CQLXX_CHECK_EQUAL(count, 9u + 3u + 8u);
}


void test_row_get()
{
  CQLXX_CHECK_EQUAL(sample.get<std::string>(0), "ada");
  CQLXX_CHECK_EQUAL(sample.get<std::int32_t>("age"), 36);
  CQLXX_CHECK(not sample.get<std::optional<std::string>>("nickname"));

  // Reading an int column as text is a programming error.
  CQLXX_CHECK_THROWS(
    std::ignore = sample.get<std::string>("age"), cqlxx::usage_error);
  CQLXX_CHECK_THROWS(
    std::ignore = sample.get<std::int64_t>("age"), cqlxx::usage_error);
}


void test_udt_row_mapper()
{
  auto const mapper{cqlxx::default_row_mapper<user>()};
  auto const u{mapper->map(sample)};
  CQLXX_CHECK_EQUAL(u.userName, "ada");
  CQLXX_CHECK_EQUAL(u.age, 36);
  CQLXX_CHECK(not u.nickname.has_value());

  // A nullable member whose column is missing reads as null.
  cqlxx::row const short_row{std::vector<column>{
    text_column("user_name", "grace"), int_column("age", 85)}};
  auto const v{(*mapper)(short_row)};
  CQLXX_CHECK_EQUAL(v.userName, "grace");
  CQLXX_CHECK(not v.nickname.has_value());

  // A non-nullable one is an error.
  cqlxx::row const no_age{
    std::vector<column>{text_column("user_name", "alan")}};
  CQLXX_CHECK_THROWS(std::ignore = mapper->map(no_age), cqlxx::argument_error);
}


void test_udt_row_mapper_renames()
{
  cqlxx::udt_options options;
  options.renames.emplace("age", "years");
  options.naming = cqlxx::naming_scheme::identity();
  cqlxx::udt_row_mapper<user> const mapper{options};

  cqlxx::row const r{std::vector<column>{
    text_column("userName", "edsger"), int_column("years", 72),
    text_column("nickname", "ewd")}};
  auto const u{mapper.map(r)};
  CQLXX_CHECK_EQUAL(u.userName, "edsger");
  CQLXX_CHECK_EQUAL(u.age, 72);
  CQLXX_CHECK_EQUAL(*u.nickname, "ewd");
}


/// Reads a member from a column with a given prefix.
class prefixed_mapper final : public cqlxx::column_mapper<std::string>
{
public:
  [[nodiscard]] std::string
  map(std::string_view column_name, cqlxx::row const &r) const override
  {
    return r.get<std::string>(cqlxx::internal::concat("old_", column_name));
  }
};


void test_udt_row_mapper_custom_column()
{
  cqlxx::udt_row_mapper<user> mapper;
  mapper.with_mapper<std::string>(
    "userName", std::make_shared<prefixed_mapper const>());

  cqlxx::row const r{std::vector<column>{
    text_column("old_user_name", "barbara"), int_column("age", 80)}};
  auto const u{mapper.map(r)};
  CQLXX_CHECK_EQUAL(u.userName, "barbara");
  CQLXX_CHECK_EQUAL(u.age, 80);

  CQLXX_CHECK_THROWS(
    mapper.with_mapper<std::string>(
      "surname", std::make_shared<prefixed_mapper const>()),
    cqlxx::usage_error);
  CQLXX_CHECK_THROWS(
    mapper.with_mapper<std::string>(
      "age", std::make_shared<prefixed_mapper const>()),
    cqlxx::usage_error, "Accepted a mapper of the wrong type.");
}


void test_either_mapper()
{
  cqlxx::either_mapper<std::int32_t, std::string> const mapper{
    "code", "message"};

  cqlxx::row const left{std::vector<column>{
    int_column("code", 404), text_column("message", std::nullopt)}};
  auto const l{mapper.map("", left)};
  CQLXX_CHECK_EQUAL(l.index(), 0u);
  CQLXX_CHECK_EQUAL(std::get<0>(l), 404);

  cqlxx::row const right{std::vector<column>{
    int_column("code", std::nullopt), text_column("message", "gone")}};
  auto const r{mapper.map("", right)};
  CQLXX_CHECK_EQUAL(r.index(), 1u);
  CQLXX_CHECK_EQUAL(std::get<1>(r), "gone");

  // With both columns set, the right one wins.
  cqlxx::row const both{std::vector<column>{
    int_column("code", 500), text_column("message", "oops")}};
  CQLXX_CHECK_EQUAL(std::get<1>(mapper.map("", both)), "oops");

  cqlxx::row const neither{std::vector<column>{
    int_column("code", std::nullopt), text_column("message", std::nullopt)}};
  auto const n{mapper.map("", neither)};
  CQLXX_CHECK_EQUAL(n.index(), 1u);
  CQLXX_CHECK_EQUAL(std::get<1>(n), "");

  cqlxx::row const missing{std::vector<column>{int_column("code", 1)}};
  CQLXX_CHECK_THROWS(
    std::ignore = mapper.map("", missing), cqlxx::argument_error);
}


void test_tuple_and_single_mappers()
{
  auto const tuple_mapper{
    cqlxx::default_row_mapper<std::tuple<std::string, std::int32_t>>()};
  auto const [name, age]{tuple_mapper->map(sample)};
  CQLXX_CHECK_EQUAL(name, "ada");
  CQLXX_CHECK_EQUAL(age, 36);

  auto const single{cqlxx::default_row_mapper<std::string>()};
  CQLXX_CHECK_EQUAL(single->map(sample), "ada");

  auto const identity{cqlxx::default_row_mapper<cqlxx::row>()};
  CQLXX_CHECK_EQUAL(std::size(identity->map(sample)), 3u);

  cqlxx::row const empty;
  CQLXX_CHECK_THROWS(std::ignore = single->map(empty), cqlxx::argument_error);
}


void test_function_row_mapper()
{
  auto const mapper{cqlxx::make_row_mapper([](cqlxx::row const &r) {
    return r.get<std::int32_t>("age") * 2;
  })};
  CQLXX_CHECK_EQUAL(mapper->map(sample), 72);

  CQLXX_CHECK_THROWS(
    cqlxx::function_row_mapper<int>{std::function<int(cqlxx::row const &)>{}},
    cqlxx::usage_error);
}


CQLXX_REGISTER_TEST(test_row_lookup);
CQLXX_REGISTER_TEST(test_row_get);
CQLXX_REGISTER_TEST(test_udt_row_mapper);
CQLXX_REGISTER_TEST(test_udt_row_mapper_renames);
CQLXX_REGISTER_TEST(test_udt_row_mapper_custom_column);
CQLXX_REGISTER_TEST(test_either_mapper);
CQLXX_REGISTER_TEST(test_tuple_and_single_mappers);
CQLXX_REGISTER_TEST(test_function_row_mapper);
} // namespace
