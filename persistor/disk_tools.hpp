#pragma once

#include <filesystem>
#include <optional>
#include <persistor/block_device.hpp>
#include <persistor/errors.hpp>
#include <string_view>
#include <vector>

namespace persistor {

// The external disk utilities the provisioning core drives. Every call blocks
// until the underlying tool finishes. Implementations report failures with the
// error kind of the step they belong to.
class Disk_tools {
 public:
  Disk_tools() = default;
  Disk_tools(const Disk_tools&) = delete;
  Disk_tools& operator=(const Disk_tools&) = delete;
  virtual ~Disk_tools() = default;

  // fresh snapshot of every block device on the host
  [[nodiscard]] virtual Provision_result<std::vector<Block_device>> enumerate() = 0;

  // device_unavailable if the device doesn't exist or cannot be probed
  [[nodiscard]] virtual Provision_result<Fs_attributes> query_attributes(
      const std::filesystem::path& device) = 0;

  [[nodiscard]] virtual Provision_result<Disk_layout> read_layout(
      const std::filesystem::path& disk) = 0;

  // appends a primary partition covering region
  [[nodiscard]] virtual Provision_result<void> create_partition(
      const std::filesystem::path& disk, const Free_region& region) = 0;

  // asks the kernel to re-read the partition table of disk and waits for the
  // device nodes to settle
  [[nodiscard]] virtual Provision_result<void> refresh_partitions(
      const std::filesystem::path& disk) = 0;

  // whether the kernel lists the device and its node exists
  [[nodiscard]] virtual bool is_visible(const std::filesystem::path& device) = 0;

  [[nodiscard]] virtual Provision_result<void> format(const std::filesystem::path& partition,
                                                      std::string_view label,
                                                      std::string_view fs_type) = 0;

  // creates the directory and its parents if missing
  [[nodiscard]] virtual Provision_result<void> make_mountpoint(
      const std::filesystem::path& mountpoint) = 0;

  [[nodiscard]] virtual Provision_result<void> mount(
      const std::filesystem::path& device, const std::filesystem::path& mountpoint) = 0;

  // first place the device is mounted at, if any
  [[nodiscard]] virtual Provision_result<std::optional<std::filesystem::path>>
  query_mount_target(const std::filesystem::path& device) = 0;

  [[nodiscard]] virtual Provision_result<void> unmount(
      const std::filesystem::path& mountpoint) = 0;

  // flushes all filesystem buffers to stable storage
  [[nodiscard]] virtual Provision_result<void> flush() = 0;

  // source device of the running root filesystem
  [[nodiscard]] virtual Provision_result<std::optional<std::filesystem::path>>
  root_source() = 0;
};

}  // namespace persistor
