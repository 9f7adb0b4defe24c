#include <string>

#include <cqlxx/naming>

#include "../helpers.hxx"


namespace
{
void test_snake_case()
{
  auto const snake{cqlxx::naming_scheme::snake_case()};
  CQLXX_CHECK_EQUAL(snake("postalCode"), "postal_code");
  CQLXX_CHECK_EQUAL(snake("PostalCode"), "postal_code");
  CQLXX_CHECK_EQUAL(snake("HTTPServer"), "http_server");
  CQLXX_CHECK_EQUAL(snake("userID"), "user_id");
  CQLXX_CHECK_EQUAL(snake("already_snake"), "already_snake");
  CQLXX_CHECK_EQUAL(snake("line2Text"), "line2_text");
  CQLXX_CHECK_EQUAL(snake("my_URL"), "my_url");
  CQLXX_CHECK_EQUAL(snake(""), "");
  CQLXX_CHECK_EQUAL(snake.label(), "snake_case");
}


void test_identity_naming()
{
  auto const same{cqlxx::naming_scheme::identity()};
  CQLXX_CHECK_EQUAL(same("postalCode"), "postalCode");
  CQLXX_CHECK_EQUAL(same.label(), "identity");
}


void test_custom_naming()
{
  cqlxx::naming_scheme const upper{"upper", [](std::string_view name) {
                                     std::string out{name};
                                     for (auto &c : out)
                                       if (c >= 'a' and c <= 'z')
                                         c = static_cast<char>(c - 'a' + 'A');
                                     return out;
                                   }};
  CQLXX_CHECK_EQUAL(upper("city"), "CITY");
  CQLXX_CHECK_EQUAL(upper.label(), "upper");

  CQLXX_CHECK_THROWS(
    (cqlxx::naming_scheme{"broken", {}}), cqlxx::usage_error);
}


CQLXX_REGISTER_TEST(test_snake_case);
CQLXX_REGISTER_TEST(test_identity_naming);
CQLXX_REGISTER_TEST(test_custom_naming);
} // namespace
