#include <fmt/format.h>
#include <fmt/std.h>

#include <cstdio>
#include <optional>
#include <persistor/marker_writer.hpp>
#include <persistor/mount_lifecycle.hpp>
#include <persistor/provisioner.hpp>
#include <persistor/setup_persistence.hpp>
#include <persistor/target_resolver.hpp>
#include <persistor/try.hpp>
#include <string>
#include <tl/expected.hpp>
#include <utility>
#include <variant>

namespace fs = std::filesystem;

namespace persistor {

namespace {

[[nodiscard]] Provision_result<std::optional<Target>> create_target(
    const Creation_plan& plan, const Parsed_arguments& args, Disk_tools& tools,
    const Confirm_fn& confirm, const Refresh_policy& refresh) {
  fmt::print("A new partition of {:.0f} MiB would be created on {} ({} table, {:.2f} to "
             "{:.2f} MiB) and formatted {} with the label '{}'.\n",
             plan.region.size_mib(), plan.disk, plan.table_type, plan.region.start_mib,
             plan.region.end_mib, required_fs_type, args.label);

  // prompt user before touching the partition table
  if (!args.assume_yes &&
      !confirm(fmt::format("Would you like to proceed to partition {}?", plan.disk))) {
    return std::optional<Target>{};
  }

  fmt::print("Creating and formatting the persistence partition... ");
  std::fflush(stdout);
  auto target = TRY(provision(plan, args.label, tools, refresh));
  fmt::print("✔\n");
  return std::optional<Target>{std::move(target)};
}

}  // namespace

Provision_result<std::optional<Setup_report>> setup_persistence(
    const Parsed_arguments& args, Disk_tools& tools, const Confirm_fn& confirm,
    const Refresh_policy& refresh) {
  fmt::print("Resolving the persistence partition... ");
  std::fflush(stdout);
  const auto resolution = TRY(resolve_target(
      Resolve_request{.device = args.device, .label = args.label, .disk = args.disk}, tools));
  fmt::print("✔\n");
  for (const auto& warning : resolution.warnings) {
    fmt::print("Warning: {}\n", warning);
  }

  Setup_report report{};
  if (const auto* plan = std::get_if<Creation_plan>(&resolution.outcome)) {
    auto created = TRY(create_target(*plan, args, tools, confirm, refresh));
    if (!created) {
      return std::optional<Setup_report>{};
    }
    report.target = std::move(*created);
  } else {
    report.target = std::get<Target>(resolution.outcome);
  }
  fmt::print("\t✔ using {} ({})\n", report.target.device,
             provenance_name(report.target.provenance));

  Mount_manager mounts(tools);
  report.mount = TRY(mounts.acquire(report.target.device, args.mountpoint));
  if (report.mount.owned) {
    fmt::print("\t✔ mounted {} at {}\n", report.target.device, report.mount.mountpoint);
  } else {
    fmt::print("\t✔ {} is already mounted at {}, the mount is left in place\n",
               report.target.device, report.mount.mountpoint);
  }

  auto marker = write_marker(report.mount.mountpoint, tools);
  if (!marker) {
    // the mount made by this run is undone before reporting the failure
    if (auto released = mounts.release(report.mount); !released) {
      fmt::print(stderr, "Warning: {} could not be unmounted either: {}\n",
                 report.mount.mountpoint, describe(released.error()));
    }
    return tl::make_unexpected(std::move(marker.error()));
  }
  report.marker = std::move(*marker);
  fmt::print("\t✔ wrote {}\n", report.marker);

  if (auto released = mounts.release(report.mount); !released) {
    report.release_warning = std::move(released.error());
  } else if (report.mount.owned) {
    fmt::print("\t✔ unmounted {}\n", report.mount.mountpoint);
  }

  return std::optional<Setup_report>{std::move(report)};
}

}  // namespace persistor
