#include <persistor/privilege.hpp>
#include <unistd.h>

namespace persistor {

bool has_required_privilege() noexcept { return ::geteuid() == 0; }

}  // namespace persistor
