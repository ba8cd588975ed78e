#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <persistor/command.hpp>
#include <persistor/device_inventory.hpp>
#include <persistor/system_disk_tools.hpp>
#include <persistor/tool_output.hpp>
#include <persistor/try.hpp>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace persistor {

namespace {

// blkid exits with 2 when the device holds no recognizable signature
constexpr const int blkid_nothing_found{2};

[[nodiscard]] std::string trimmed(std::string text) {
  text.erase(text.find_last_not_of(" \t\n\r") + 1);
  return text;
}

// runs the command, failing with errc when it can't be run or exits non-zero
[[nodiscard]] Provision_result<Command_output> run_step(
    const Provision_errc errc, const std::vector<std::string>& argv) {
  auto output = TRY(run_command(argv).map_error([&](auto&& err_msg) {
    return Provision_error{.code = Provision_errc::tool_failure, .message = std::move(err_msg)};
  }));
  if (!output.succeeded()) {
    return make_error(errc, fmt::format("'{}' exited with status {}: {}", command_line(argv),
                                        output.exit_status, trimmed(output.err)));
  }
  return output;
}

[[nodiscard]] std::string mib_arg(const double mib) { return fmt::format("{:.2f}MiB", mib); }

}  // namespace

Provision_result<std::vector<Block_device>> System_disk_tools::enumerate() {
  const auto output = TRY(run_step(
      Provision_errc::tool_failure,
      {"lsblk", "-bnP", "-o", "NAME,PATH,TYPE,RM,FSTYPE,LABEL,PKNAME"}));
  return parse_lsblk_pairs(output.out).map_error([](auto&& err_msg) {
    return Provision_error{.code = Provision_errc::tool_failure,
                           .message = fmt::format("Unreadable lsblk output: {}", err_msg)};
  });
}

Provision_result<Fs_attributes> System_disk_tools::query_attributes(const fs::path& device) {
  if (!fs::exists(device)) {
    return make_error(Provision_errc::device_unavailable,
                      fmt::format("The device {} does not exist.", device));
  }
  if (!fs::is_block_file(device)) {
    return make_error(Provision_errc::device_unavailable,
                      fmt::format("The file {} is not a block device.", device));
  }

  const std::vector<std::string> argv{"blkid", "-o", "export", device.string()};
  const auto output = TRY(run_command(argv).map_error([](auto&& err_msg) {
    return Provision_error{.code = Provision_errc::tool_failure, .message = std::move(err_msg)};
  }));
  if (output.exit_status == blkid_nothing_found) {
    return Fs_attributes{};
  } else if (!output.succeeded()) {
    return make_error(Provision_errc::device_unavailable,
                      fmt::format("Could not probe {}: {}", device, trimmed(output.err)));
  }
  return parse_blkid_export(output.out);
}

Provision_result<Disk_layout> System_disk_tools::read_layout(const fs::path& disk) {
  const auto output = TRY(run_step(Provision_errc::partition_table,
                                   {"parted", "-sm", disk.string(), "unit", "MiB", "print",
                                    "free"}));
  return parse_parted_machine(output.out).map_error([&](auto&& err_msg) {
    return Provision_error{
        .code = Provision_errc::partition_table,
        .message = fmt::format("Could not read the partition table of {}: {}", disk, err_msg)};
  });
}

Provision_result<void> System_disk_tools::create_partition(const fs::path& disk,
                                                           const Free_region& region) {
  REQ(run_step(Provision_errc::partition_table,
               {"parted", "-s", disk.string(), "mkpart", "primary", required_fs_type,
                mib_arg(region.start_mib), mib_arg(region.end_mib)}))
  return {};
}

Provision_result<void> System_disk_tools::refresh_partitions(const fs::path& disk) {
  REQ(run_step(Provision_errc::device_unavailable, {"partprobe", disk.string()}))
  REQ(run_step(Provision_errc::device_unavailable, {"udevadm", "settle"}))
  return {};
}

bool System_disk_tools::is_visible(const fs::path& device) {
  const auto kernel_names = read_kernel_partitions(_partitions_path);
  if (!kernel_names) {
    return false;
  }
  const auto name = device.filename().string();
  return std::ranges::find(*kernel_names, name) != kernel_names->end() &&
         fs::is_block_file(device);
}

Provision_result<void> System_disk_tools::format(const fs::path& partition,
                                                 const std::string_view label,
                                                 const std::string_view fs_type) {
  REQ(run_step(Provision_errc::format, {fmt::format("mkfs.{}", fs_type), "-F", "-L",
                                        std::string(label), partition.string()}))
  return {};
}

Provision_result<void> System_disk_tools::make_mountpoint(const fs::path& mountpoint) {
  std::error_code ec;
  fs::create_directories(mountpoint, ec);
  if (ec) {
    return make_error(Provision_errc::mount,
                      fmt::format("Could not create the mount point {}: {}", mountpoint,
                                  ec.message()));
  }
  return {};
}

Provision_result<void> System_disk_tools::mount(const fs::path& device,
                                                const fs::path& mountpoint) {
  REQ(run_step(Provision_errc::mount, {"mount", device.string(), mountpoint.string()}))
  return {};
}

Provision_result<std::optional<fs::path>> System_disk_tools::query_mount_target(
    const fs::path& device) {
  const auto mountings = TRY(read_mounting(device, _mtab_path).map_error([&](const auto& ec) {
    return Provision_error{
        .code = Provision_errc::device_unavailable,
        .message = fmt::format("Could not read the mounts of {}: {}", device, ec.message())};
  }));
  if (mountings.empty()) {
    return std::optional<fs::path>{};
  }
  return std::optional<fs::path>{mountings.begin()->second.mount_point};
}

Provision_result<void> System_disk_tools::unmount(const fs::path& mountpoint) {
  REQ(run_step(Provision_errc::unmount, {"umount", mountpoint.string()}))
  return {};
}

Provision_result<void> System_disk_tools::flush() {
  ::sync();
  return {};
}

Provision_result<std::optional<fs::path>> System_disk_tools::root_source() {
  std::fstream mtab(_mtab_path, std::ios_base::in);
  if (!mtab.good()) {
    return make_error(Provision_errc::tool_failure,
                      fmt::format("The file {} could not be opened and is required to read "
                                  "device mounts",
                                  _mtab_path));
  }

  // the last entry for / is the one visible to this process
  std::optional<fs::path> source{};
  for (const auto& [device, mounting] : parse_mount_table(mtab)) {
    if (mounting.mount_point == "/" && device.is_absolute()) {
      source = device;
    }
  }
  return source;
}

}  // namespace persistor
