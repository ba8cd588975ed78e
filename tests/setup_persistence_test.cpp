#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <persistor/persistor_main.hpp>
#include <persistor/provisioner.hpp>
#include <string>
#include <string_view>
#include <tests/fake_disk_tools.hpp>
#include <tests/temp_directory.hpp>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace persistor {
namespace {

[[nodiscard]] std::string read_file(const fs::path& path) {
  std::ifstream file(path, std::ios_base::binary);
  return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

// A live stick in /dev/sdb next to the installed system on /dev/sda. Runs
// mount below a scratch directory so that the marker lands in a real file.
class SetupPersistence : public ::testing::Test {
 protected:
  testing::Fake_disk_tools tools;
  testing::Temp_directory sandbox;
  const Refresh_policy refresh{.attempts = 3, .interval = 0ms};
  std::vector<std::string> prompts{};
  bool operator_answer{true};

  void SetUp() override {
    tools.add_disk("sda", "gpt", 476940);
    tools.add_partition("sda", 2, 513, 476940, {}, "ext4");
    tools.root = "/dev/sda2";

    tools.add_disk("sdb", "msdos", 59668, {{.start_mib = 4704, .end_mib = 59668}});
    tools.add_partition("sdb", 1, 0, 4700, "Kali Live", "iso9660");
    tools.add_partition("sdb", 2, 4700, 4704, {}, "vfat");
  }

  [[nodiscard]] fs::path mountpoint() const { return sandbox.path() / "kali_persistence"; }

  int run_with(std::vector<std::string> options, const bool privileged = true) {
    std::vector<std::string> args{"persistor", "--mount", mountpoint().string()};
    args.insert(args.end(), std::make_move_iterator(options.begin()),
                std::make_move_iterator(options.end()));
    const std::vector<std::string_view> views(args.begin(), args.end());

    const Run_environment env{.tools = tools,
                              .privileged = privileged,
                              .confirm =
                                  [this](const std::string_view message) {
                                    prompts.emplace_back(message);
                                    return operator_answer;
                                  },
                              .refresh = &refresh};
    return run(Program_arguments{views}, env);
  }
};

TEST_F(SetupPersistence, LabelledPartitionIsMountedWrittenAndUnmounted) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");

  EXPECT_EQ(run_with({}), 0);
  EXPECT_EQ(read_file(mountpoint() / "persistence.conf"), "/ union\n");
  EXPECT_TRUE(tools.called("mount /dev/sdb3 " + mountpoint().string()));
  EXPECT_TRUE(tools.called("unmount " + mountpoint().string()));
  EXPECT_TRUE(tools.mounts.empty());
  EXPECT_FALSE(tools.called("format"));
}

TEST_F(SetupPersistence, ExistingMountIsLeftInPlace) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");
  const auto usb_mount = sandbox.path() / "media-usb";
  fs::create_directory(usb_mount);
  tools.mounts["/dev/sdb3"] = usb_mount;

  EXPECT_EQ(run_with({"--device", "/dev/sdb3"}), 0);
  EXPECT_EQ(read_file(usb_mount / "persistence.conf"), "/ union\n");
  EXPECT_FALSE(tools.called("mount "));
  EXPECT_FALSE(tools.called("unmount"));
  EXPECT_EQ(tools.mounts.at("/dev/sdb3"), usb_mount);
  EXPECT_FALSE(fs::exists(mountpoint() / "persistence.conf"));
}

TEST_F(SetupPersistence, ExplicitDeviceWithOtherFilesystemChangesNothing) {
  tools.add_partition("sdb", 3, 4704, 59668, {}, "ntfs");

  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({"--device", "/dev/sdb3"}), 1);
  const auto errors = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(errors.find("Wrong filesystem"), std::string::npos) << errors;
  EXPECT_FALSE(tools.mutated());
}

TEST_F(SetupPersistence, CreatesPartitionWithoutAskingWhenAssumedYes) {
  EXPECT_EQ(run_with({"--disk", "/dev/sdb", "--yes"}), 0);
  EXPECT_TRUE(prompts.empty());
  EXPECT_TRUE(tools.called("format /dev/sdb3 ext4 persistence"));
  EXPECT_EQ(tools.attributes["/dev/sdb3"].label, "persistence");
  EXPECT_EQ(read_file(mountpoint() / "persistence.conf"), "/ union\n");
  EXPECT_TRUE(tools.mounts.empty());
}

TEST_F(SetupPersistence, CreationAsksFirst) {
  EXPECT_EQ(run_with({"--disk", "/dev/sdb", "--label", "kalidata"}), 0);
  ASSERT_EQ(prompts.size(), 1u);
  EXPECT_NE(prompts.front().find("/dev/sdb"), std::string::npos);
  EXPECT_TRUE(tools.called("format /dev/sdb3 ext4 kalidata"));
}

TEST_F(SetupPersistence, DeclinedCreationChangesNothing) {
  operator_answer = false;

  EXPECT_EQ(run_with({"--disk", "/dev/sdb"}), 0);
  EXPECT_EQ(prompts.size(), 1u);
  EXPECT_FALSE(tools.mutated());
}

TEST_F(SetupPersistence, NoFreeSpaceOnDisk) {
  tools.layouts["/dev/sdb"].free_regions.clear();

  EXPECT_EQ(run_with({"--disk", "/dev/sdb", "--yes"}), 1);
  EXPECT_FALSE(tools.called("create_partition"));
  EXPECT_FALSE(tools.mutated());
}

TEST_F(SetupPersistence, UnprivilegedRunTouchesNoDevice) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");

  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({}, false), 1);
  const auto errors = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(errors.find("Insufficient privilege"), std::string::npos) << errors;
  EXPECT_TRUE(tools.calls.empty());
}

TEST_F(SetupPersistence, HelpAndBadArgumentsTouchNoDevice) {
  EXPECT_EQ(run_with({"--help"}), 0);
  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({"--force"}), 1);
  EXPECT_NE(::testing::internal::GetCapturedStderr().find("--force"), std::string::npos);
  EXPECT_TRUE(tools.calls.empty());
}

TEST_F(SetupPersistence, FailedUnmountIsOnlyAWarning) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");
  tools.failures["unmount"] = {Provision_errc::unmount, "target is busy"};

  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({}), 0);
  const auto errors = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(errors.find("target is busy"), std::string::npos) << errors;
  EXPECT_EQ(read_file(mountpoint() / "persistence.conf"), "/ union\n");
}

TEST_F(SetupPersistence, FailedWriteStillUnmounts) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");
  tools.create_directories = false;

  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({}), 1);
  const auto errors = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(errors.find("Write error"), std::string::npos) << errors;
  EXPECT_LT(tools.call_index("mount /dev/sdb3"), tools.call_index("unmount"));
  EXPECT_TRUE(tools.mounts.empty());
}

TEST_F(SetupPersistence, MarkerIsFlushedBeforeUnmount) {
  tools.add_partition("sdb", 3, 4704, 59668, "persistence", "ext4");

  EXPECT_EQ(run_with({}), 0);
  ASSERT_GE(tools.call_index("flush"), 0);
  EXPECT_LT(tools.call_index("flush"), tools.call_index("unmount"));
}

TEST_F(SetupPersistence, LabelNotFound) {
  ::testing::internal::CaptureStderr();
  EXPECT_EQ(run_with({}), 1);
  const auto errors = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(errors.find("Not found"), std::string::npos) << errors;
  EXPECT_FALSE(tools.mutated());
}

}  // namespace
}  // namespace persistor
