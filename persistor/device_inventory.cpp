#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <persistor/device_inventory.hpp>
#include <persistor/try.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <tl/expected.hpp>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace rgs = std::ranges;

namespace persistor {

namespace {
const constexpr char delim = ' ';

// mount tables escape space, tab, newline and backslash as \ooo
[[nodiscard]] std::string decode_octal_escapes(const std::string_view field) {
  std::string decoded;
  decoded.reserve(field.size());
  const auto is_octal = [](const char c) { return c >= '0' && c <= '7'; };
  for (std::size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() && is_octal(field[i + 1]) &&
        is_octal(field[i + 2]) && is_octal(field[i + 3])) {
      decoded.push_back(static_cast<char>((field[i + 1] - '0') * 64 +
                                          (field[i + 2] - '0') * 8 + (field[i + 3] - '0')));
      i += 3;
      continue;
    }
    decoded.push_back(field[i]);
  }
  return decoded;
}

// canonical form of a device path where it exists, the path itself otherwise
[[nodiscard]] fs::path comparable_device(const fs::path& device) {
  std::error_code ec;
  auto canonical_path = fs::canonical(device, ec);
  if (ec) {
    return device;
  }
  return canonical_path;
}

}  // namespace

Provision_result<std::vector<Block_device>> list_block_devices(Disk_tools& tools) {
  return tools.enumerate();
}

Provision_result<Label_match> query_by_label(Disk_tools& tools,
                                             const std::string_view label) {
  auto devices = TRY(tools.enumerate());

  std::vector<Block_device> labelled;
  rgs::copy_if(devices, std::back_inserter(labelled),
               [&](const auto& device) { return device.label && *device.label == label; });
  if (labelled.empty()) {
    return make_error(Provision_errc::not_found,
                      fmt::format("No block device carries the label '{}'.", label));
  }

  // ext4 devices first, each group in path order
  rgs::sort(labelled, [](const auto& lhs, const auto& rhs) {
    const auto lhs_ext4 = lhs.fs_type.value_or("") == required_fs_type;
    const auto rhs_ext4 = rhs.fs_type.value_or("") == required_fs_type;
    if (lhs_ext4 != rhs_ext4) {
      return lhs_ext4;
    }
    return lhs.path < rhs.path;
  });
  Label_match match{.device = labelled.front(), .ignored = {}};
  for (auto it = labelled.begin() + 1; it != labelled.end(); ++it) {
    match.ignored.push_back(it->path);
  }
  return match;
}

Provision_result<Fs_attributes> query_attributes(Disk_tools& tools,
                                                 const fs::path& device) {
  return tools.query_attributes(device);
}

std::vector<Block_device> disk_partitions(const std::vector<Block_device>& devices,
                                          const fs::path& disk) {
  const auto disk_name = disk.filename().string();
  std::vector<Block_device> partitions;
  rgs::copy_if(devices, std::back_inserter(partitions), [&](const auto& device) {
    return device.role == Device_role::partition && device.parent &&
           *device.parent == disk_name;
  });
  rgs::sort(partitions, {}, &Block_device::path);
  return partitions;
}

fs::path partition_path(const fs::path& disk, const int number) {
  // kernel names ending in a digit take a 'p' before the partition number
  const auto disk_str = disk.string();
  if (!disk_str.empty() && std::isdigit(static_cast<unsigned char>(disk_str.back()))) {
    return fmt::format("{}p{}", disk_str, number);
  }
  return fmt::format("{}{}", disk_str, number);
}

Mount_table parse_mount_table(std::istream& mtab) {
  Mount_table entries{};
  std::string mtab_line;
  while (std::getline(mtab, mtab_line)) {
    const auto device_end = rgs::find(mtab_line, delim);
    if (device_end == mtab_line.end()) {
      continue;
    }
    const auto mnt_point_end = std::find(device_end + 1, mtab_line.end(), delim);
    const auto fs_name_end =
        mnt_point_end == mtab_line.end() ? mtab_line.end()
                                         : std::find(mnt_point_end + 1, mtab_line.end(), delim);

    const fs::path mounted_device = decode_octal_escapes({mtab_line.begin(), device_end});
    Mounting mounting{
        .mount_point = decode_octal_escapes({device_end + 1, mnt_point_end}),
        .fs_name = mnt_point_end == mtab_line.end()
                       ? std::string{}
                       : std::string(mnt_point_end + 1, fs_name_end)};
    entries.push_back({.device = mounted_device, .mounting = std::move(mounting)});
  }
  return entries;
}

tl::expected<Mountings, std::error_code> read_mounting(const fs::path& block_device,
                                                       const fs::path& mtab_path) {
  std::fstream mtab(mtab_path, std::ios_base::in);
  if (!mtab.good()) {
    return tl::make_unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  // convert provided block device path to canonical path
  std::error_code ec;
  const fs::path canonical_path = fs::canonical(block_device, ec);
  if (ec) {
    return tl::make_unexpected(ec);
  }

  // keep the mount points of the device, whichever alias it was mounted by
  Mountings device_mounts{};
  for (auto& [mounted_device, mounting] : parse_mount_table(mtab)) {
    if (mounted_device.is_absolute() && comparable_device(mounted_device) == canonical_path) {
      device_mounts.emplace(canonical_path, std::move(mounting));
    }
  }
  return device_mounts;
}

tl::expected<std::vector<std::string>, std::error_code> read_kernel_partitions(
    const fs::path& partitions_path) {
  std::fstream partitions(partitions_path, std::ios_base::in);
  if (!partitions.good()) {
    return tl::make_unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  std::vector<std::string> names{};
  std::string partition_line;
  for (int i = 0; i < 2; ++i) {
    // skip header & break line
    std::getline(partitions, partition_line);
  }

  while (std::getline(partitions, partition_line)) {
    const auto name_end = partition_line.find_last_not_of(delim);
    if (name_end == std::string::npos) {
      continue;
    }
    const auto name_start = partition_line.find_last_of(delim, name_end);
    names.push_back(name_start == std::string::npos
                        ? partition_line.substr(0, name_end + 1)
                        : partition_line.substr(name_start + 1, name_end - name_start));
  }
  return names;
}

}  // namespace persistor
