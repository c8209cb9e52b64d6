#include "lite_test.h"

#include "core/cli_parse.h"

#include <string>

using namespace hexprep::core;

static void TestIntegers()
{
  int v = 0;
  EXPECT_TRUE(parse_positive_int("3", v));
  EXPECT_EQ(v, 3);
  EXPECT_FALSE(parse_positive_int("0", v));
  EXPECT_FALSE(parse_positive_int("-2", v));
  EXPECT_FALSE(parse_positive_int("2x", v));
  EXPECT_FALSE(parse_positive_int("", v));
  EXPECT_FALSE(parse_positive_int("99999999999", v));
  EXPECT_EQ(v, 3);

  EXPECT_TRUE(parse_non_negative_int("0", v));
  EXPECT_EQ(v, 0);
  EXPECT_FALSE(parse_non_negative_int("-1", v));

  unsigned int threads = 0;
  EXPECT_TRUE(parse_positive_uint("8", threads));
  EXPECT_EQ(threads, 8u);
  EXPECT_FALSE(parse_positive_uint("0", threads));
}

static void TestChannelValues()
{
  int v = 0;
  EXPECT_TRUE(parse_channel_value("255", v));
  EXPECT_EQ(v, 255);
  EXPECT_TRUE(parse_channel_value("0", v));
  EXPECT_EQ(v, 0);
  EXPECT_FALSE(parse_channel_value("256", v));
  EXPECT_FALSE(parse_channel_value("-1", v));
  EXPECT_FALSE(parse_channel_value("12.5", v));
}

static void TestBools()
{
  bool b = false;
  EXPECT_TRUE(parse_bool_value("yes", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(parse_bool_value(" OFF ", b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(parse_bool_value("1", b));
  EXPECT_TRUE(b);
  EXPECT_FALSE(parse_bool_value("maybe", b));
}

static void TestStringHelpers()
{
  EXPECT_EQ(trim_copy("  a b \t\n"), std::string("a b"));
  EXPECT_EQ(trim_copy("   "), std::string());
  EXPECT_EQ(to_lower_copy("StRiCt"), std::string("strict"));
}

int main()
{
  TestIntegers();
  TestChannelValues();
  TestBools();
  TestStringHelpers();

  return FinishTests("hexprep_cli_parse_tests");
}
