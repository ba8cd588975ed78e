#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace persistor {

constexpr const char* const required_fs_type{"ext4"};

enum class Device_role { disk, partition, other };

// snapshot of a single block device as reported by the enumeration tool
struct Block_device {
  std::filesystem::path path{};
  std::string name{};
  Device_role role{Device_role::other};
  std::optional<std::string> label{};
  std::optional<std::string> fs_type{};
  bool removable{false};
  std::optional<std::string> parent{};  // kernel name of the owning disk or holder
};

struct Fs_attributes {
  std::optional<std::string> label{};
  std::optional<std::string> fs_type{};
};

// offsets are in MiB, as reported by the partition table editor
struct Partition_extent {
  int number{0};
  double start_mib{0};
  double end_mib{0};
};

struct Free_region {
  double start_mib{0};
  double end_mib{0};

  [[nodiscard]] double size_mib() const noexcept { return end_mib - start_mib; }
};

struct Disk_layout {
  std::string table_type{};  // "msdos", "gpt", "loop", "unknown"...
  double size_mib{0};
  std::vector<Partition_extent> partitions{};
  std::vector<Free_region> free_regions{};
};

struct Mounting {
  std::filesystem::path mount_point{};
  std::string fs_name{};
};

// device -> mountings, a device may be mounted at several places
using Mountings = std::multimap<std::filesystem::path, Mounting>;

struct Mount_entry {
  std::filesystem::path device{};
  Mounting mounting{};
};

// mount table entries in the order they were mounted
using Mount_table = std::vector<Mount_entry>;

}  // namespace persistor
