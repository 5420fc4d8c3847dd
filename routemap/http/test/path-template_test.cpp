#include "routemap/path-template.hpp"

#include <gtest/gtest.h>

#include "invalid_argument_exception.hpp"
#include "routemap/path-parameter.hpp"

namespace routemap {

TEST(PathTemplateTest, LiteralPathHasNoParameter) {
  const PathTemplate tmpl = ParsePathTemplate("/api/v1/users/");
  EXPECT_EQ(tmpl.path, "/api/v1/users");
  EXPECT_TRUE(tmpl.parameters.empty());
}

TEST(PathTemplateTest, ParsesTypedParameters) {
  const PathTemplate tmpl = ParsePathTemplate("/users/{user_id:int}/files/{name:str}");
  EXPECT_EQ(tmpl.path, "/users/{user_id:int}/files/{name:str}");
  ASSERT_EQ(tmpl.parameters.size(), 2U);
  EXPECT_EQ(tmpl.parameters[0], (PathParameterDefinition{"user_id", "user_id:int", ParamType::Int}));
  EXPECT_EQ(tmpl.parameters[1], (PathParameterDefinition{"name", "name:str", ParamType::Str}));
}

TEST(PathTemplateTest, WhitespaceAroundNameAndTypeIsIgnored) {
  const PathTemplate tmpl = ParsePathTemplate("/x/{ id : uuid }");
  ASSERT_EQ(tmpl.parameters.size(), 1U);
  EXPECT_EQ(tmpl.parameters[0].name, "id");
  EXPECT_EQ(tmpl.parameters[0].full, " id : uuid ");
  EXPECT_EQ(tmpl.parameters[0].type, ParamType::Uuid);
}

TEST(PathTemplateTest, AllTypesAccepted) {
  const PathTemplate tmpl = ParsePathTemplate("/{a:str}/{b:int}/{c:float}/{d:uuid}/{e:path}");
  ASSERT_EQ(tmpl.parameters.size(), 5U);
  EXPECT_EQ(tmpl.parameters[2].type, ParamType::Float);
  EXPECT_EQ(tmpl.parameters[4].type, ParamType::Path);
}

TEST(PathTemplateTest, PartiallyWrappedSegmentsAreLiterals) {
  const PathTemplate tmpl = ParsePathTemplate("/files/prefix{id:int}/{name:str}x");
  EXPECT_TRUE(tmpl.parameters.empty());
}

TEST(PathTemplateTest, CustomDelimiters) {
  const PathTemplate tmpl = ParsePathTemplate("/items/<id:int>/{literal}", '<', '>');
  ASSERT_EQ(tmpl.parameters.size(), 1U);
  EXPECT_EQ(tmpl.parameters[0].full, "id:int");
}

TEST(PathTemplateTest, MissingTypeThrows) {
  EXPECT_THROW((void)ParsePathTemplate("/items/{id}"), invalid_argument);
  EXPECT_THROW((void)ParsePathTemplate("/items/{}"), invalid_argument);
  EXPECT_THROW((void)ParsePathTemplate("/items/{a:int:str}"), invalid_argument);
}

TEST(PathTemplateTest, EmptyNameThrows) { EXPECT_THROW((void)ParsePathTemplate("/items/{ :int}"), invalid_argument); }

TEST(PathTemplateTest, UnknownTypeThrows) {
  EXPECT_THROW((void)ParsePathTemplate("/items/{id:integer}"), invalid_argument);
}

TEST(PathTemplateTest, DuplicateNameThrows) {
  EXPECT_THROW((void)ParsePathTemplate("/a/{id:int}/b/{id:str}"), invalid_argument);
}

}  // namespace routemap
