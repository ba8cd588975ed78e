#pragma once

#include <functional>
#include <span>
#include <string_view>

namespace persistor {

class Disk_tools;
struct Refresh_policy;

using Program_arguments = std::span<const std::string_view>;
using Program_argument = Program_arguments::value_type;

// asks the operator to approve a destructive step
using Confirm_fn = std::function<bool(std::string_view)>;

struct Run_environment {
  Disk_tools& tools;
  bool privileged{false};
  Confirm_fn confirm{};
  const Refresh_policy* refresh{nullptr};  // defaults when null
};

int cmain(Program_arguments args);

// cmain against the given host capabilities; returns the exit code
int run(Program_arguments args, const Run_environment& env);

}  // namespace persistor
