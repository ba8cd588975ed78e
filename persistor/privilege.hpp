#pragma once

namespace persistor {

// Partitioning, formatting and mounting all need root. Consulted once, before
// any device is touched.
[[nodiscard]] bool has_required_privilege() noexcept;

}  // namespace persistor
