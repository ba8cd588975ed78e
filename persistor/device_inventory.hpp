#pragma once

#include <filesystem>
#include <istream>
#include <persistor/block_device.hpp>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <tl/expected.hpp>
#include <vector>

namespace persistor {

struct Label_match {
  Block_device device{};
  // other devices carrying the same label, in preference order
  std::vector<std::filesystem::path> ignored{};
};

[[nodiscard]] Provision_result<std::vector<Block_device>> list_block_devices(Disk_tools&);

// When several devices carry the label, ext4 devices are preferred, and among
// those the one with the lexicographically smallest path is chosen.
[[nodiscard]] Provision_result<Label_match> query_by_label(Disk_tools&,
                                                           std::string_view label);

[[nodiscard]] Provision_result<Fs_attributes> query_attributes(
    Disk_tools&, const std::filesystem::path& device);

// partitions of the whole disk, ordered by path
[[nodiscard]] std::vector<Block_device> disk_partitions(
    const std::vector<Block_device>& devices, const std::filesystem::path& disk);

// /dev/sdb, 3 -> /dev/sdb3 and /dev/nvme0n1, 3 -> /dev/nvme0n1p3
[[nodiscard]] std::filesystem::path partition_path(const std::filesystem::path& disk,
                                                   int number);

// reads every entry of a mount table in the /proc/self/mounts layout
[[nodiscard]] Mount_table parse_mount_table(std::istream& mtab);

// mountings of the block device, read from the mount table at mtab_path
[[nodiscard]] tl::expected<Mountings, std::error_code> read_mounting(
    const std::filesystem::path& block_device, const std::filesystem::path& mtab_path);

// names of the block devices the kernel currently knows, from /proc/partitions
[[nodiscard]] tl::expected<std::vector<std::string>, std::error_code>
read_kernel_partitions(const std::filesystem::path& partitions_path);

}  // namespace persistor
