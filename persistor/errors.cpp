#include <fmt/format.h>

#include <persistor/errors.hpp>
#include <utility>

namespace persistor {

const char* error_name(const Provision_errc errc) noexcept {
  const char* name;
  switch (errc) {
    case Provision_errc::insufficient_privilege:
      name = "Insufficient privilege";
      break;
    case Provision_errc::not_found:
      name = "Not found";
      break;
    case Provision_errc::wrong_filesystem:
      name = "Wrong filesystem";
      break;
    case Provision_errc::device_unavailable:
      name = "Device unavailable";
      break;
    case Provision_errc::insufficient_space:
      name = "Insufficient space";
      break;
    case Provision_errc::partition_table:
      name = "Partition table error";
      break;
    case Provision_errc::format:
      name = "Format error";
      break;
    case Provision_errc::mount:
      name = "Mount error";
      break;
    case Provision_errc::unmount:
      name = "Unmount error";
      break;
    case Provision_errc::write:
      name = "Write error";
      break;
    case Provision_errc::unsafe_target:
      name = "Unsafe target";
      break;
    case Provision_errc::tool_failure:
    default:
      name = "Tool failure";
  }
  return name;
}

tl::unexpected<Provision_error> make_error(const Provision_errc errc,
                                           std::string message) {
  return tl::make_unexpected(Provision_error{.code = errc, .message = std::move(message)});
}

std::string describe(const Provision_error& error) {
  return fmt::format("{}: {}", error_name(error.code), error.message);
}

}  // namespace persistor
