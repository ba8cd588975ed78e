#include <fmt/format.h>
#include <fmt/std.h>

#include <optional>
#include <persistor/mount_lifecycle.hpp>
#include <persistor/try.hpp>
#include <tl/expected.hpp>
#include <utility>

namespace fs = std::filesystem;

namespace persistor {

Mount_manager::Mount_manager(Disk_tools& tools) noexcept : _tools(tools) {}

Provision_result<Mount_state> Mount_manager::acquire(const fs::path& device,
                                                     const fs::path& preferred_mountpoint) {
  if (_outstanding) {
    return make_error(Provision_errc::mount,
                      fmt::format("{} is still held at {}; it must be released before "
                                  "mounting {}.",
                                  _outstanding->device, _outstanding->mountpoint, device));
  }

  if (const auto existing = TRY(_tools.query_mount_target(device)); existing) {
    _outstanding = Mount_state{.device = device, .mountpoint = *existing, .owned = false};
    return *_outstanding;
  }

  REQ(_tools.make_mountpoint(preferred_mountpoint))
  REQ(_tools.mount(device, preferred_mountpoint))
  _outstanding =
      Mount_state{.device = device, .mountpoint = preferred_mountpoint, .owned = true};
  return *_outstanding;
}

Provision_result<void> Mount_manager::release(const Mount_state& state) {
  if (!_outstanding || _outstanding->device != state.device ||
      _outstanding->mountpoint != state.mountpoint) {
    // already released, or never acquired here
    return {};
  }
  const auto outstanding = *std::exchange(_outstanding, std::nullopt);
  if (!outstanding.owned) {
    return {};
  }
  return _tools.unmount(outstanding.mountpoint);
}

}  // namespace persistor
