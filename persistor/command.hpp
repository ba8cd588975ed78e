#pragma once

#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace persistor {

struct Command_output {
  int exit_status{-1};
  std::string out{};
  std::string err{};

  [[nodiscard]] bool succeeded() const noexcept { return exit_status == 0; }
};

// Runs argv[0] found through PATH with the remaining arguments, without a
// shell, and waits for it to terminate. Fails only when the process could not
// be started; a non-zero exit status is reported in the output.
[[nodiscard]] tl::expected<Command_output, std::string> run_command(
    const std::vector<std::string>& argv);

// "parted -s /dev/sdb print"
[[nodiscard]] std::string command_line(const std::vector<std::string>& argv);

}  // namespace persistor
