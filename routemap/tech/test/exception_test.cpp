#include "exception.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <string_view>

#include "configuration_conflict_exception.hpp"
#include "invalid_argument_exception.hpp"

namespace routemap {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("Route map built with 3 static paths").what(), "Route map built with 3 static paths");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Path '{}' declares {} parameters", "/items/{id:int}", 1).what(),
               "Path '/items/{id:int}' declares 1 parameters");
}

TEST(ExceptionTest, FormatTruncated) {
  const std::string longSegment(2 * exception::kMsgMaxLen, 'a');
  const exception ex("Cannot register route '/{}'", longSegment);
  const std::string_view msg = ex.what();
  EXPECT_EQ(msg.size(), exception::kMsgMaxLen);
  EXPECT_TRUE(msg.starts_with("Cannot register route '/aaaa"));
  EXPECT_TRUE(msg.ends_with("aaa..."));
}

TEST(ExceptionTest, FormatExactlyMaxLenIsNotTruncated) {
  const std::string exact(exception::kMsgMaxLen, 'b');
  const exception ex("{}", exact);
  EXPECT_EQ(std::strlen(ex.what()), exception::kMsgMaxLen);
  EXPECT_FALSE(std::string_view(ex.what()).ends_with("..."));
}

TEST(ExceptionTest, DerivedExceptionsAreCatchableAsBase) {
  EXPECT_THROW(throw invalid_argument("bad template {}", "/a/{"), exception);
  EXPECT_THROW(throw configuration_conflict("conflict at {}", "/ws"), exception);
  EXPECT_THROW(throw configuration_conflict("conflict"), std::exception);
}

TEST(ExceptionTest, CopyKeepsMessage) {
  const configuration_conflict original("Conflicting path parameters for path '{}'", "/x/{id:int}");
  const configuration_conflict copy = original;  // NOLINT(performance-unnecessary-copy-initialization)
  EXPECT_STREQ(copy.what(), "Conflicting path parameters for path '/x/{id:int}'");
}

}  // namespace routemap
