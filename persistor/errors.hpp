#pragma once

#include <string>
#include <string_view>
#include <tl/expected.hpp>

namespace persistor {

enum class Provision_errc : int {
  insufficient_privilege,
  not_found,
  wrong_filesystem,
  device_unavailable,
  insufficient_space,
  partition_table,
  format,
  mount,
  unmount,
  write,
  unsafe_target,
  tool_failure
};

[[nodiscard]] const char* error_name(Provision_errc errc) noexcept;

struct Provision_error {
  Provision_errc code{Provision_errc::tool_failure};
  std::string message{};
};

template <typename T>
using Provision_result = tl::expected<T, Provision_error>;

[[nodiscard]] tl::unexpected<Provision_error> make_error(Provision_errc errc,
                                                         std::string message);

// "<error name>: <message>", as shown to the operator
[[nodiscard]] std::string describe(const Provision_error& error);

}  // namespace persistor
