#include "errors.hpp"
#include "validation.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace umon;

TEST_CASE("organization ids", "[validation]") {
  CHECK_NOTHROW(validate_org_id("3f2a-b9_c1"));
  CHECK_NOTHROW(validate_org_id(std::string(128, 'a')));
  CHECK_THROWS_AS(validate_org_id(""), ValidationError);
  CHECK_THROWS_AS(validate_org_id(std::string(129, 'a')), ValidationError);
  CHECK_THROWS_AS(validate_org_id("../etc/passwd"), ValidationError);
  CHECK_THROWS_AS(validate_org_id("org id"), ValidationError);
}

TEST_CASE("session tokens", "[validation]") {
  CHECK_NOTHROW(validate_session_token("sk-ant-sid01-AbC_9.x+y/z=="));
  CHECK_THROWS_AS(validate_session_token(""), ValidationError);
  CHECK_THROWS_AS(validate_session_token(std::string(4097, 'a')),
                  ValidationError);
  CHECK_THROWS_AS(validate_session_token("abc;rm -rf"), ValidationError);
  try {
    validate_session_token("bad token");
    FAIL("expected ValidationError");
  } catch (const ValidationError &e) {
    CHECK(e.field() == "session_token");
  }
}
