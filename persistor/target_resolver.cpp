#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <optional>
#include <persistor/device_inventory.hpp>
#include <persistor/target_resolver.hpp>
#include <persistor/try.hpp>
#include <set>
#include <string>
#include <system_error>
#include <tl/expected.hpp>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace rgs = std::ranges;

namespace persistor {

namespace {

[[nodiscard]] std::string fs_description(const Fs_attributes& attributes) {
  return attributes.fs_type ? fmt::format("a {} filesystem", *attributes.fs_type)
                            : std::string("no recognizable filesystem");
}

[[nodiscard]] bool has_required_fs(const Fs_attributes& attributes) {
  return attributes.fs_type && *attributes.fs_type == required_fs_type;
}

[[nodiscard]] fs::path comparable(const fs::path& device) {
  std::error_code ec;
  auto canonical_path = fs::canonical(device, ec);
  return ec ? device : canonical_path;
}

[[nodiscard]] Provision_result<Resolution> resolve_explicit(const fs::path& device,
                                                            const std::string& label,
                                                            Disk_tools& tools) {
  const auto attributes = TRY(query_attributes(tools, device));
  if (!has_required_fs(attributes)) {
    return make_error(Provision_errc::wrong_filesystem,
                      fmt::format("The device {} holds {}, a {} filesystem is required.",
                                  device, fs_description(attributes), required_fs_type));
  }

  Resolution resolution{
      .outcome = Target{.device = device, .provenance = Provenance::explicit_device},
      .warnings = {}};
  // the operator's choice of device wins over label matching
  if (attributes.label.value_or("") != label) {
    resolution.warnings.push_back(
        fmt::format("The device {} is labelled '{}' rather than '{}'; using it as requested.",
                    device, attributes.label.value_or(""), label));
  }
  return resolution;
}

[[nodiscard]] Provision_result<Resolution> resolve_by_label(const std::string& label,
                                                            Disk_tools& tools) {
  const auto match = TRY(query_by_label(tools, label));
  std::vector<fs::path> candidates{match.device.path};
  candidates.insert(candidates.end(), match.ignored.begin(), match.ignored.end());

  // the enumeration's filesystem type only orders the candidates, the probe
  // decides
  std::optional<std::string> first_mismatch{};
  for (const auto& candidate : candidates) {
    const auto attributes = TRY(query_attributes(tools, candidate));
    if (!has_required_fs(attributes)) {
      if (!first_mismatch) {
        first_mismatch = fmt::format("The device {} labelled '{}' holds {}", candidate, label,
                                     fs_description(attributes));
      }
      continue;
    }

    Resolution resolution{
        .outcome = Target{.device = candidate, .provenance = Provenance::found_by_label},
        .warnings = {}};
    if (candidates.size() > 1) {
      std::vector<fs::path> ignored;
      rgs::copy_if(candidates, std::back_inserter(ignored),
                   [&](const auto& other) { return other != candidate; });
      resolution.warnings.push_back(
          fmt::format("Several devices are labelled '{}'. Using {} and ignoring {}.", label,
                      candidate, fmt::join(ignored, ", ")));
    }
    return resolution;
  }

  return make_error(Provision_errc::wrong_filesystem,
                    fmt::format("{}, a {} filesystem is required.{}", *first_mismatch,
                                required_fs_type,
                                candidates.size() > 1
                                    ? fmt::format(" None of the {} devices labelled '{}' "
                                                  "holds one.",
                                                  candidates.size(), label)
                                    : std::string{}));
}

// Whether device sits on the disk named disk_name, directly or through holders
// such as dm-crypt or LVM. lsblk lists a holder once per parent, so every
// entry of a name is followed.
[[nodiscard]] bool stacked_on(const fs::path& device, const std::string& disk_name,
                              const std::vector<Block_device>& devices) {
  std::vector<std::string> pending;
  for (const auto& entry : devices) {
    if (comparable(entry.path) == device) {
      pending.push_back(entry.name);
    }
  }

  std::set<std::string> visited;
  while (!pending.empty()) {
    auto name = std::move(pending.back());
    pending.pop_back();
    if (name == disk_name) {
      return true;
    }
    if (!visited.insert(name).second) {
      continue;
    }
    for (const auto& entry : devices) {
      if (entry.name == name && entry.parent) {
        pending.push_back(*entry.parent);
      }
    }
  }
  return false;
}

// refuses the disk holding the running system
[[nodiscard]] Provision_result<void> check_not_root_disk(
    const Block_device& disk, const std::vector<Block_device>& devices, Disk_tools& tools) {
  const auto root = TRY(tools.root_source());
  if (!root) {
    return {};
  }

  const auto root_device = comparable(*root);
  const auto on_disk = root_device.string().starts_with(comparable(disk.path).string()) ||
                       stacked_on(root_device, disk.name, devices);
  if (on_disk) {
    return make_error(Provision_errc::unsafe_target,
                      fmt::format("Refusing {}: it holds the running root filesystem ({}).",
                                  disk.path, *root));
  }
  return {};
}

[[nodiscard]] Provision_result<void> check_partition_slots(const fs::path& disk,
                                                           const Disk_layout& layout) {
  if (layout.table_type == "msdos") {
    const auto primaries = rgs::count_if(layout.partitions, [](const auto& part) {
      return part.number <= msdos_max_primary_partitions;
    });
    if (primaries >= msdos_max_primary_partitions) {
      return make_error(Provision_errc::partition_table,
                        fmt::format("The MBR partition table of {} already holds {} primary "
                                    "partitions, no further one can be added.",
                                    disk, primaries));
    }
  } else if (layout.table_type == "gpt") {
    if (std::ssize(layout.partitions) >= gpt_max_partitions) {
      return make_error(Provision_errc::partition_table,
                        fmt::format("The GPT partition table of {} is full ({} entries).",
                                    disk, gpt_max_partitions));
    }
  } else {
    return make_error(Provision_errc::partition_table,
                      fmt::format("The disk {} has a '{}' partition table. Only msdos (MBR) "
                                  "and gpt tables are supported.",
                                  disk, layout.table_type));
  }
  return {};
}

[[nodiscard]] Provision_result<Resolution> resolve_on_disk(const fs::path& disk,
                                                           const std::string& label,
                                                           Disk_tools& tools) {
  const auto devices = TRY(list_block_devices(tools));
  const auto disk_it = rgs::find_if(devices, [&](const auto& device) {
    return device.path == disk || comparable(device.path) == comparable(disk);
  });
  if (disk_it == devices.end()) {
    return make_error(Provision_errc::device_unavailable,
                      fmt::format("The disk {} is not a known block device.", disk));
  }
  if (disk_it->role != Device_role::disk) {
    return make_error(Provision_errc::partition_table,
                      fmt::format("{} is not a whole disk. Name the disk holding it, for "
                                  "example /dev/{}.",
                                  disk, disk_it->parent.value_or("sdX")));
  }
  const auto& disk_path = disk_it->path;

  REQ(check_not_root_disk(*disk_it, devices, tools))

  // a persistence partition from an earlier run is reused as is
  for (const auto& partition : disk_partitions(devices, disk_path)) {
    if (partition.label.value_or("") != label) {
      continue;
    }
    const auto attributes = TRY(query_attributes(tools, partition.path));
    if (!has_required_fs(attributes)) {
      return make_error(Provision_errc::wrong_filesystem,
                        fmt::format("The partition {} is already labelled '{}' but holds {}.",
                                    partition.path, label, fs_description(attributes)));
    }
    return Resolution{
        .outcome = Target{.device = partition.path, .provenance = Provenance::found_by_label},
        .warnings = {}};
  }

  const auto layout = TRY(tools.read_layout(disk_path));
  const auto region = usable_free_region(layout);
  if (!region) {
    return make_error(Provision_errc::insufficient_space,
                      fmt::format("No unallocated region of at least {} MiB remains on {}.",
                                  min_partition_mib, disk_path));
  }
  REQ(check_partition_slots(disk_path, layout))

  Creation_plan plan{.disk = disk_path,
                     .region = *region,
                     .table_type = layout.table_type,
                     .existing_numbers = {}};
  rgs::transform(layout.partitions, std::back_inserter(plan.existing_numbers),
                 &Partition_extent::number);
  Resolution resolution{.outcome = std::move(plan), .warnings = {}};
  if (!disk_it->removable) {
    resolution.warnings.push_back(
        fmt::format("The disk {} is not a removable device. Make sure it is the live USB "
                    "stick before confirming.",
                    disk_path));
  }
  return resolution;
}

}  // namespace

const char* provenance_name(const Provenance provenance) noexcept {
  switch (provenance) {
    case Provenance::explicit_device:
      return "explicit device";
    case Provenance::newly_created:
      return "newly created";
    case Provenance::found_by_label:
    default:
      return "found by label";
  }
}

std::optional<Free_region> usable_free_region(const Disk_layout& layout) {
  std::optional<Free_region> chosen{};
  for (const auto& region : layout.free_regions) {
    const Free_region aligned{.start_mib = region.start_mib + partition_alignment_mib,
                              .end_mib = region.end_mib};
    if (aligned.size_mib() < min_partition_mib) {
      continue;
    }
    if (!chosen || aligned.end_mib > chosen->end_mib) {
      chosen = aligned;
    }
  }
  return chosen;
}

Provision_result<Resolution> resolve_target(const Resolve_request& request,
                                            Disk_tools& tools) {
  if (request.device) {
    return resolve_explicit(*request.device, request.label, tools);
  } else if (request.disk) {
    return resolve_on_disk(*request.disk, request.label, tools);
  }
  return resolve_by_label(request.label, tools);
}

}  // namespace persistor
