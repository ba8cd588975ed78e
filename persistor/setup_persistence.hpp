#pragma once

#include <filesystem>
#include <optional>
#include <persistor/cli.hpp>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>
#include <persistor/mount_lifecycle.hpp>
#include <persistor/persistor_main.hpp>
#include <persistor/provisioner.hpp>
#include <persistor/target_resolver.hpp>

namespace persistor {

struct Setup_report {
  Target target{};
  Mount_state mount{};
  std::filesystem::path marker{};
  // the marker is in place, but the partition could not be unmounted again
  std::optional<Provision_error> release_warning{};
};

// Resolves the target, creates it when asked to, mounts it, writes the marker
// and restores the mount state. Returns nullopt when the operator declined
// the partition creation, in which case nothing was changed.
[[nodiscard]] Provision_result<std::optional<Setup_report>> setup_persistence(
    const Parsed_arguments& args, Disk_tools& tools, const Confirm_fn& confirm,
    const Refresh_policy& refresh = {});

}  // namespace persistor
