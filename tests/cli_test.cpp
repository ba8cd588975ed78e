#include <gtest/gtest.h>

#include <persistor/cli.hpp>
#include <string_view>
#include <vector>

namespace persistor {
namespace {

[[nodiscard]] auto parse(std::vector<std::string_view> args) {
  args.insert(args.begin(), "persistor");
  return parse_arguments(Program_arguments{args});
}

TEST(ParseArguments, DefaultsWithoutOptions) {
  const auto parsed = parse({});
  ASSERT_TRUE(parsed) << parsed.error();
  EXPECT_FALSE(parsed->device);
  EXPECT_FALSE(parsed->disk);
  EXPECT_EQ(parsed->label, "persistence");
  EXPECT_EQ(parsed->mountpoint, "/mnt/kali_persistence");
  EXPECT_FALSE(parsed->assume_yes);
  EXPECT_FALSE(parsed->help);
}

TEST(ParseArguments, LongAndShortFlags) {
  const auto parsed =
      parse({"--device", "/dev/sdc1", "-l", "usbdata", "--mount", "/media/p", "-y"});
  ASSERT_TRUE(parsed) << parsed.error();
  ASSERT_TRUE(parsed->device);
  EXPECT_EQ(*parsed->device, "/dev/sdc1");
  EXPECT_EQ(parsed->label, "usbdata");
  EXPECT_EQ(parsed->mountpoint, "/media/p");
  EXPECT_TRUE(parsed->assume_yes);
}

TEST(ParseArguments, DiskSelectsCreationMode) {
  const auto parsed = parse({"-k", "/dev/sdb"});
  ASSERT_TRUE(parsed) << parsed.error();
  ASSERT_TRUE(parsed->disk);
  EXPECT_EQ(*parsed->disk, "/dev/sdb");
}

TEST(ParseArguments, HelpStopsParsing) {
  const auto parsed = parse({"--help", "--bogus"});
  ASSERT_TRUE(parsed) << parsed.error();
  EXPECT_TRUE(parsed->help);
}

TEST(ParseArguments, RejectsMissingValue) {
  const auto parsed = parse({"--device"});
  ASSERT_FALSE(parsed);
  EXPECT_NE(parsed.error().find("--device"), std::string::npos);
}

TEST(ParseArguments, RejectsUnknownFlagAndPositional) {
  EXPECT_FALSE(parse({"--force"}));
  EXPECT_FALSE(parse({"/dev/sdb"}));
}

TEST(ParseArguments, RejectsDeviceTogetherWithDisk) {
  EXPECT_FALSE(parse({"--device", "/dev/sdb3", "--disk", "/dev/sdb"}));
}

TEST(ParseArguments, RejectsLabelLongerThanExt4Allows) {
  EXPECT_FALSE(parse({"--label", "a-label-of-seventeen"}));
  EXPECT_TRUE(parse({"--label", "sixteen-bytes-ok"}));
}

TEST(ParseArguments, RejectsRelativeMountpoint) {
  EXPECT_FALSE(parse({"--mount", "mnt/persistence"}));
}

TEST(HelpMessage, NamesEveryOption) {
  const auto help = help_message();
  for (const auto* const flag : {"--device", "--label", "--mount", "--disk", "--yes", "--help"}) {
    EXPECT_NE(help.find(flag), std::string::npos) << flag;
  }
  EXPECT_NE(help.find("/mnt/kali_persistence"), std::string::npos);
}

}  // namespace
}  // namespace persistor
