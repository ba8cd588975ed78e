#include <fmt/core.h>
#include <fmt/std.h>

#include <persistor/cli.hpp>
#include <persistor/errors.hpp>
#include <persistor/persistor_main.hpp>
#include <persistor/privilege.hpp>
#include <persistor/provisioner.hpp>
#include <persistor/setup_persistence.hpp>
#include <persistor/system_disk_tools.hpp>

namespace persistor {

int run(const Program_arguments prog_args, const Run_environment& env) {
  const auto parsed =
      persistor::parse_arguments(prog_args).map_error([](const auto& err_msg) {
        fmt::print(stderr, "{}\n", err_msg);
        return 1;
      });
  if (!parsed) {
    return parsed.error();
  }
  const auto& parsed_args = parsed.value();
  if (parsed_args.help) {
    fmt::print("\n{}", persistor::help_message());
    return 0;
  }

  // checked before any device is looked at
  if (!env.privileged) {
    fmt::print(stderr, "{}\n",
               describe({.code = Provision_errc::insufficient_privilege,
                         .message = "persistor partitions, formats and mounts disks and "
                                    "must run as root. Try again with sudo."}));
    return 1;
  }

  const auto refresh = env.refresh ? *env.refresh : Refresh_policy{};
  const auto report = setup_persistence(parsed_args, env.tools, env.confirm, refresh);
  if (!report) {
    fmt::print(stderr, "{}\n", describe(report.error()));
    return 1;
  }
  if (!report.value()) {
    fmt::print("Nothing was changed.\n");
    return 0;
  }

  const auto& done = *report.value();
  if (done.release_warning) {
    fmt::print(stderr,
               "Warning: {} was written, but {} remains mounted at {}: {}\n",
               done.marker, done.target.device, done.mount.mountpoint,
               describe(*done.release_warning));
  }
  fmt::print("Done. Reboot and choose: Live system (persistence)\n");
  return 0;
}

int cmain(const Program_arguments prog_args) {
  System_disk_tools tools;
  const Run_environment env{.tools = tools,
                            .privileged = has_required_privilege(),
                            .confirm = [](const auto message) {
                              return user_accept_dialog(message);
                            },
                            .refresh = nullptr};
  return run(prog_args, env);
}

}  // namespace persistor
