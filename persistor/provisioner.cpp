#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <persistor/device_inventory.hpp>
#include <persistor/provisioner.hpp>
#include <persistor/try.hpp>
#include <string>
#include <thread>
#include <tl/expected.hpp>
#include <utility>

namespace fs = std::filesystem;
namespace rgs = std::ranges;

namespace persistor {

namespace {

// Re-reads the partition table until the kernel lists the device, at most
// policy.attempts times.
[[nodiscard]] Provision_result<void> await_visibility(const fs::path& disk,
                                                      const fs::path& device,
                                                      Disk_tools& tools,
                                                      const Refresh_policy& policy) {
  std::optional<Provision_error> last_refresh_error{};
  for (int attempt = 0; attempt < policy.attempts; ++attempt) {
    if (attempt > 0) {
      std::this_thread::sleep_for(policy.interval);
    }
    if (auto refreshed = tools.refresh_partitions(disk); !refreshed) {
      last_refresh_error = std::move(refreshed.error());
    }
    if (tools.is_visible(device)) {
      return {};
    }
  }

  auto message = fmt::format("{} is still not visible after {} partition table refreshes.",
                             device, policy.attempts);
  if (last_refresh_error) {
    message += fmt::format(" Last refresh failure: {}", last_refresh_error->message);
  }
  return make_error(Provision_errc::device_unavailable, std::move(message));
}

[[nodiscard]] Provision_error with_disk_state_note(Provision_error error,
                                                  const fs::path& disk) {
  error.message += fmt::format(
      "\nThe disk {} may have been left partially modified. Inspect it with "
      "'parted {} print free' before running again.",
      disk, disk.string());
  return error;
}

}  // namespace

Provision_result<fs::path> create_partition(const Creation_plan& plan, Disk_tools& tools,
                                            const Refresh_policy& policy) {
  REQ(tools.create_partition(plan.disk, plan.region))

  // the partition table itself names the partition that was added
  const auto layout = TRY(tools.read_layout(plan.disk));
  const auto added = rgs::find_if(layout.partitions, [&](const auto& partition) {
    return rgs::find(plan.existing_numbers, partition.number) == plan.existing_numbers.end();
  });
  if (added == layout.partitions.end()) {
    return make_error(Provision_errc::partition_table,
                      fmt::format("The partition table of {} lists no new partition after "
                                  "the partition was created.",
                                  plan.disk));
  }

  const auto partition = partition_path(plan.disk, added->number);
  REQ(await_visibility(plan.disk, partition, tools, policy))
  return partition;
}

Provision_result<void> format_filesystem(const fs::path& disk, const fs::path& partition,
                                         const std::string_view label,
                                         const std::string_view fs_type, Disk_tools& tools,
                                         const Refresh_policy& policy) {
  REQ(tools.format(partition, label, fs_type))
  REQ(await_visibility(disk, partition, tools, policy))

  const auto attributes = TRY(tools.query_attributes(partition));
  if (attributes.fs_type.value_or("") != fs_type || attributes.label.value_or("") != label) {
    return make_error(Provision_errc::format,
                      fmt::format("After formatting, {} reports type '{}' and label '{}' "
                                  "instead of '{}' and '{}'.",
                                  partition, attributes.fs_type.value_or(""),
                                  attributes.label.value_or(""), fs_type, label));
  }
  return {};
}

Provision_result<Target> provision(const Creation_plan& plan, const std::string_view label,
                                   Disk_tools& tools, const Refresh_policy& policy) {
  const auto note = [&](auto&& error) { return with_disk_state_note(std::move(error), plan.disk); };

  const auto partition = TRY(create_partition(plan, tools, policy).map_error(note));
  REQ(format_filesystem(plan.disk, partition, label, required_fs_type, tools, policy)
          .map_error(note))
  return Target{.device = partition, .provenance = Provenance::newly_created};
}

}  // namespace persistor
