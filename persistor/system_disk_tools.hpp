#pragma once

#include <filesystem>
#include <optional>
#include <persistor/disk_tools.hpp>
#include <string_view>
#include <vector>

namespace persistor {

// Disk_tools backed by util-linux, parted and e2fsprogs running on this host.
class System_disk_tools final : public Disk_tools {
 private:
  std::filesystem::path _mtab_path{"/proc/self/mounts"};
  std::filesystem::path _partitions_path{"/proc/partitions"};

 public:
  System_disk_tools() = default;

  [[nodiscard]] Provision_result<std::vector<Block_device>> enumerate() override;

  [[nodiscard]] Provision_result<Fs_attributes> query_attributes(
      const std::filesystem::path& device) override;

  [[nodiscard]] Provision_result<Disk_layout> read_layout(
      const std::filesystem::path& disk) override;

  [[nodiscard]] Provision_result<void> create_partition(const std::filesystem::path& disk,
                                                        const Free_region& region) override;

  [[nodiscard]] Provision_result<void> refresh_partitions(
      const std::filesystem::path& disk) override;

  [[nodiscard]] bool is_visible(const std::filesystem::path& device) override;

  [[nodiscard]] Provision_result<void> format(const std::filesystem::path& partition,
                                              std::string_view label,
                                              std::string_view fs_type) override;

  [[nodiscard]] Provision_result<void> make_mountpoint(
      const std::filesystem::path& mountpoint) override;

  [[nodiscard]] Provision_result<void> mount(
      const std::filesystem::path& device,
      const std::filesystem::path& mountpoint) override;

  [[nodiscard]] Provision_result<std::optional<std::filesystem::path>> query_mount_target(
      const std::filesystem::path& device) override;

  [[nodiscard]] Provision_result<void> unmount(
      const std::filesystem::path& mountpoint) override;

  [[nodiscard]] Provision_result<void> flush() override;

  [[nodiscard]] Provision_result<std::optional<std::filesystem::path>> root_source()
      override;
};

}  // namespace persistor
