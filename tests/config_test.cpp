// config_test.cpp

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "modmul_config.h"

using namespace modmul;

namespace {
  // getopt_long permutes argv, so hand it writable copies.
  int runParse(std::vector<std::string> args, ViewerConfig& config) {
    args.insert(args.begin(), "modmul_viewer");
    std::vector<char*> argv;
    for (std::string& a : args)
      argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parseArgs((int)args.size(), argv.data(), config);
  }
}

TEST(ConfigTest, DefaultsMatchStartupState) {
  ViewerConfig config;
  EXPECT_EQ(runParse({}, config), CONTINUE);
  EXPECT_EQ(config.imageSize, 1200);
  EXPECT_EQ(config.vertexCount, 3);
  EXPECT_EQ(config.modulus, 100);
  EXPECT_EQ(config.multiplier, 2);
  EXPECT_EQ(config.angleDegrees, -150);
  EXPECT_FALSE(config.verbose);
}

TEST(ConfigTest, CanvasFromImageSize) {
  ViewerConfig config;
  Canvas c = config.canvas();
  EXPECT_DOUBLE_EQ(c.center, 600.0);
  EXPECT_DOUBLE_EQ(c.radius, 540.0);

  config.imageSize = 801;
  c = config.canvas();
  EXPECT_DOUBLE_EQ(c.center, 400.0);
  EXPECT_NEAR(c.radius, 360.45, 1e-9);
}

TEST(ConfigTest, ParametersUseRadians) {
  ViewerConfig config;
  config.angleDegrees = 180;
  Parameters p = config.parameters();
  EXPECT_DOUBLE_EQ(p.angle, 3.14159265358979323846);
  EXPECT_EQ(p.modulus, 100);
}

TEST(ConfigTest, LongAndShortOptions) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"--vertices", "6", "-M", "500", "--multiplier=21", "-a", "-30",
                      "--size", "800", "-v"}, config), CONTINUE);
  EXPECT_EQ(config.vertexCount, 6);
  EXPECT_EQ(config.modulus, 500);
  EXPECT_EQ(config.multiplier, 21);
  EXPECT_EQ(config.angleDegrees, -30);
  EXPECT_EQ(config.imageSize, 800);
  EXPECT_TRUE(config.verbose);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"--vertices", "2"}, config), 1);
  EXPECT_EQ(runParse({"--vertices", "51"}, config), 1);
  EXPECT_EQ(runParse({"--modulus", "0"}, config), 1);
  EXPECT_EQ(runParse({"--modulus", "1001"}, config), 1);
  EXPECT_EQ(runParse({"--angle", "181"}, config), 1);
  EXPECT_EQ(runParse({"--angle", "nan"}, config), 1);
  EXPECT_EQ(runParse({"--angle", "inf"}, config), 1);
  EXPECT_EQ(runParse({"--size", "abc"}, config), 1);
  EXPECT_EQ(runParse({"--multiplier", "-1"}, config), 1);
}

TEST(ConfigTest, StrayArgumentIsRejected) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"extra"}, config), 1);
}

TEST(ConfigTest, HelpExitsCleanly) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"--help"}, config), 0);
}

TEST(ConfigTest, MultiplierClampedToModulus) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"--modulus", "10", "--multiplier", "40"}, config), CONTINUE);
  EXPECT_EQ(config.multiplier, 10);

  ViewerConfig small;
  EXPECT_EQ(runParse({"--modulus", "1"}, small), CONTINUE);
  EXPECT_EQ(small.multiplier, 1);
}

TEST(ConfigTest, CircleVertexCountAccepted) {
  ViewerConfig config;
  EXPECT_EQ(runParse({"-V", "50"}, config), CONTINUE);
  EXPECT_TRUE(isCircle(config.vertexCount));
}
