#pragma once

#include <chrono>
#include <filesystem>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>
#include <persistor/target_resolver.hpp>
#include <string_view>

namespace persistor {

// how long to wait for the kernel to pick up a changed partition table
struct Refresh_policy {
  int attempts{5};
  std::chrono::milliseconds interval{1000};
};

// Appends a partition covering the planned region and waits until the kernel
// exposes it. Returns the new partition's device path.
[[nodiscard]] Provision_result<std::filesystem::path> create_partition(
    const Creation_plan& plan, Disk_tools& tools, const Refresh_policy& policy = {});

// Formats the partition and checks that the result reports the requested type
// and label.
[[nodiscard]] Provision_result<void> format_filesystem(
    const std::filesystem::path& disk, const std::filesystem::path& partition,
    std::string_view label, std::string_view fs_type, Disk_tools& tools,
    const Refresh_policy& policy = {});

// Creation mode: create, then format. Neither step is retried or rolled back;
// a failure leaves the disk as the failed step left it.
[[nodiscard]] Provision_result<Target> provision(const Creation_plan& plan,
                                                 std::string_view label, Disk_tools& tools,
                                                 const Refresh_policy& policy = {});

}  // namespace persistor
