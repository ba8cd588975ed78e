#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <persistor/device_inventory.hpp>
#include <sstream>
#include <tests/fake_disk_tools.hpp>
#include <tests/temp_directory.hpp>

namespace fs = std::filesystem;

namespace persistor {
namespace {

TEST(QueryByLabel, PicksSmallestPathAmongDuplicates) {
  testing::Fake_disk_tools tools;
  tools.add_disk("sdc", "msdos", 8000);
  tools.add_disk("sdb", "msdos", 8000);
  tools.add_partition("sdc", 1, 1, 4000, "persistence", "ext4");
  tools.add_partition("sdb", 3, 4000, 8000, "persistence", "ext4");
  tools.add_partition("sdb", 1, 1, 4000, "Kali Live", "iso9660");

  const auto match = query_by_label(tools, "persistence");
  ASSERT_TRUE(match) << match.error().message;
  EXPECT_EQ(match->device.path, "/dev/sdb3");
  ASSERT_EQ(match->ignored.size(), 1u);
  EXPECT_EQ(match->ignored.front(), "/dev/sdc1");
}

TEST(QueryByLabel, PrefersExt4OverSmallerPath) {
  testing::Fake_disk_tools tools;
  tools.add_disk("sda", "msdos", 8000);
  tools.add_disk("sdb", "msdos", 8000);
  tools.add_partition("sda", 1, 1, 4000, "persistence", "vfat");
  tools.add_partition("sdb", 3, 4000, 8000, "persistence", "ext4");

  const auto match = query_by_label(tools, "persistence");
  ASSERT_TRUE(match) << match.error().message;
  EXPECT_EQ(match->device.path, "/dev/sdb3");
  EXPECT_EQ(match->ignored, (std::vector<fs::path>{"/dev/sda1"}));
}

TEST(QueryByLabel, ReportsNotFound) {
  testing::Fake_disk_tools tools;
  tools.add_disk("sdb", "msdos", 8000);
  tools.add_partition("sdb", 1, 1, 4000, "Kali Live", "iso9660");

  const auto match = query_by_label(tools, "persistence");
  ASSERT_FALSE(match);
  EXPECT_EQ(match.error().code, Provision_errc::not_found);
}

TEST(QueryByLabel, PropagatesEnumerationFailure) {
  testing::Fake_disk_tools tools;
  tools.failures["enumerate"] = {Provision_errc::tool_failure, "lsblk is missing"};

  const auto match = query_by_label(tools, "persistence");
  ASSERT_FALSE(match);
  EXPECT_EQ(match.error().code, Provision_errc::tool_failure);
}

TEST(DiskPartitions, KeepsOnlyPartitionsOfTheDisk) {
  testing::Fake_disk_tools tools;
  tools.add_disk("sdb", "msdos", 8000);
  tools.add_disk("sdc", "msdos", 8000);
  tools.add_partition("sdb", 2, 4000, 8000, {}, {});
  tools.add_partition("sdc", 1, 1, 4000, {}, {});
  tools.add_partition("sdb", 1, 1, 4000, {}, {});

  const auto partitions = disk_partitions(tools.devices, "/dev/sdb");
  ASSERT_EQ(partitions.size(), 2u);
  EXPECT_EQ(partitions[0].path, "/dev/sdb1");
  EXPECT_EQ(partitions[1].path, "/dev/sdb2");
}

TEST(PartitionPath, AddsSeparatorAfterTrailingDigit) {
  EXPECT_EQ(partition_path("/dev/sdb", 3), "/dev/sdb3");
  EXPECT_EQ(partition_path("/dev/nvme0n1", 3), "/dev/nvme0n1p3");
  EXPECT_EQ(partition_path("/dev/mmcblk0", 1), "/dev/mmcblk0p1");
}

TEST(ParseMountTable, DecodesEscapedMountPoints) {
  std::istringstream mtab(
      "/dev/sda2 / ext4 rw,relatime 0 0\n"
      "proc /proc proc rw,nosuid 0 0\n"
      "/dev/sdb3 /media/my\\040usb ext4 rw,nosuid 0 0\n");
  const auto entries = parse_mount_table(mtab);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].device, "/dev/sda2");
  EXPECT_EQ(entries[0].mounting.mount_point, "/");
  EXPECT_EQ(entries[0].mounting.fs_name, "ext4");
  EXPECT_EQ(entries[1].device, "proc");
  EXPECT_EQ(entries[2].mounting.mount_point, "/media/my usb");
}

TEST(ReadMounting, MatchesDeviceThroughAliases) {
  const testing::Temp_directory sandbox;
  const auto device = sandbox.path() / "sdb3";
  std::ofstream(device).put('\0');
  fs::create_symlink(device, sandbox.path() / "by-label-persistence");

  const auto mtab_path = sandbox.path() / "mounts";
  std::ofstream(mtab_path) << (sandbox.path() / "by-label-persistence").string()
                           << " /media/persistence ext4 rw 0 0\n"
                           << "/dev/sda2 / ext4 rw 0 0\n"
                           << device.string() << " /mnt/second ext4 rw 0 0\n";

  const auto mountings = read_mounting(device, mtab_path);
  ASSERT_TRUE(mountings) << mountings.error().message();
  EXPECT_EQ(mountings->size(), 2u);
  EXPECT_EQ(mountings->count(fs::canonical(device)), 2u);
}

TEST(ReadMounting, FailsForMissingTable) {
  const testing::Temp_directory sandbox;
  const auto device = sandbox.path() / "sdb3";
  std::ofstream(device).put('\0');

  EXPECT_FALSE(read_mounting(device, sandbox.path() / "no-such-mounts"));
}

TEST(ReadKernelPartitions, ReadsNamesAfterHeader) {
  const testing::Temp_directory sandbox;
  const auto partitions_path = sandbox.path() / "partitions";
  std::ofstream(partitions_path) << "major minor  #blocks  name\n"
                                 << "\n"
                                 << "   8        0  500107608 sda\n"
                                 << "   8        1     524288 sda1\n"
                                 << " 259        0 1000204632 nvme0n1\n";

  const auto names = read_kernel_partitions(partitions_path);
  ASSERT_TRUE(names) << names.error().message();
  EXPECT_EQ(*names, (std::vector<std::string>{"sda", "sda1", "nvme0n1"}));
}

}  // namespace
}  // namespace persistor
