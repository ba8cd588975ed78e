#pragma once

#include <filesystem>
#include <optional>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>

namespace persistor {

struct Mount_state {
  std::filesystem::path device{};
  std::filesystem::path mountpoint{};
  // true iff this run performed the mount, and with it owns the unmount
  bool owned{false};
};

// Mounts the target for the duration of a run without disturbing a mount that
// already existed. At most one mount is outstanding at a time, and only a
// mount established here is ever unmounted.
class Mount_manager {
 private:
  Disk_tools& _tools;
  std::optional<Mount_state> _outstanding{};

 public:
  explicit Mount_manager(Disk_tools& tools) noexcept;
  Mount_manager(const Mount_manager&) = delete;
  Mount_manager& operator=(const Mount_manager&) = delete;

  // Reuses an existing mount of device (owned = false), or mounts it at
  // preferred_mountpoint, creating the directory if needed (owned = true).
  [[nodiscard]] Provision_result<Mount_state> acquire(
      const std::filesystem::path& device,
      const std::filesystem::path& preferred_mountpoint);

  // Unmounts if the state is owned. The outstanding state is consumed even when
  // the unmount fails, so a second release is a no-op.
  [[nodiscard]] Provision_result<void> release(const Mount_state& state);
};

}  // namespace persistor
