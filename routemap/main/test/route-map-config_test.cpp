#include "routemap/route-map-config.hpp"

#include <gtest/gtest.h>

#include "invalid_argument_exception.hpp"

namespace routemap {

TEST(RouteMapConfigTest, DefaultIsValid) {
  RouteMapConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.paramOpen, '{');
  EXPECT_EQ(config.paramClose, '}');
  EXPECT_EQ(config.initialNodeCapacity, 16U);
  EXPECT_TRUE(config.staticPaths.empty());
}

TEST(RouteMapConfigTest, FluentSetters) {
  RouteMapConfig config;
  config.withParamDelimiters('<', '>').withInitialNodeCapacity(128).withStaticPath("/assets").withStaticPath("/");
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.paramOpen, '<');
  EXPECT_EQ(config.paramClose, '>');
  EXPECT_EQ(config.initialNodeCapacity, 128U);
  ASSERT_EQ(config.staticPaths.size(), 2U);
  EXPECT_EQ(config.staticPaths[0], "/assets");
}

TEST(RouteMapConfigTest, InvalidDelimiters) {
  EXPECT_THROW(RouteMapConfig{}.withParamDelimiters('{', '{').validate(), invalid_argument);
  EXPECT_THROW(RouteMapConfig{}.withParamDelimiters('/', '}').validate(), invalid_argument);
  EXPECT_THROW(RouteMapConfig{}.withParamDelimiters('{', '/').validate(), invalid_argument);
  EXPECT_THROW(RouteMapConfig{}.withParamDelimiters(' ', '}').validate(), invalid_argument);
  EXPECT_THROW(RouteMapConfig{}.withParamDelimiters('{', '\t').validate(), invalid_argument);
}

TEST(RouteMapConfigTest, InvalidNodeCapacity) {
  EXPECT_THROW(RouteMapConfig{}.withInitialNodeCapacity(0).validate(), invalid_argument);
}

TEST(RouteMapConfigTest, EmptyStaticPath) {
  EXPECT_THROW(RouteMapConfig{}.withStaticPath("").validate(), invalid_argument);
  EXPECT_THROW(RouteMapConfig{}.withStaticPath("  ").validate(), invalid_argument);
}

}  // namespace routemap
