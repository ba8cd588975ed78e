#include <fmt/format.h>

#include <iostream>
#include <persistor/cli.hpp>
#include <persistor/try.hpp>
#include <string>
#include <tl/expected.hpp>
#include <utility>

namespace persistor {

namespace {

struct Flags_t {
  const char* const flag{nullptr};
  const char* const long_flag{nullptr};
};
constexpr Flags_t help_flags{"-h", "--help"};
constexpr Flags_t device_flags{"-d", "--device"};
constexpr Flags_t label_flags{"-l", "--label"};
constexpr Flags_t mount_flags{"-m", "--mount"};
constexpr Flags_t disk_flags{"-k", "--disk"};
constexpr Flags_t yes_flags{"-y", "--yes"};

// clang-format off
constexpr const char* const help_message_fmt =
    "Usage: persistor [options]\n"
    " Prepare an ext4 partition for Kali Live persistence: find or create it, then\n"
    " write {marker} containing '/ union' to its root\n"
    "\n"
    "Ex. 1: persistor\n"
    "Ex. 2: persistor {device_long} /dev/sdb3\n"
    "Ex. 3: persistor {disk_long} /dev/sdb\n"
    "\n"
    "Optional Arguments:\n"
    "{help} {help_long}     \t\tShow this help message and exit\n"
    "{device} {device_long} <path>\tUse this partition instead of searching by label\n"
    "{label} {label_long} <name>\tLabel of the persistence partition [Default {label_default}]\n"
    "{mount} {mount_long} <path>\tWhere to mount the partition if it isn't mounted [Default {mount_default}]\n"
    "{disk} {disk_long} <path>\tWhole disk to create the partition on, in its free space\n"
    "{yes} {yes_long}      \t\tDon't ask before creating the partition\n";
// clang-format on


[[nodiscard]] bool is_flag(const Flags_t flags, const Program_argument arg) noexcept {
  return arg == flags.flag || arg == flags.long_flag;
}


[[nodiscard]] tl::expected<std::string, std::string> next_arg_value(
    const Program_arguments prog_args, const std::string_view option_name) {
  if (prog_args.size() < 2) {
    return tl::make_unexpected(
        fmt::format("Expected a value following the provided {} flag, {}.", option_name,
                    prog_args.front()));
  }
  const auto value = *(prog_args.begin() + 1);
  if (value.empty()) {
    return tl::make_unexpected(fmt::format("The {} value must not be empty.", option_name));
  }
  return std::string(value);
}


struct Parse_context {
  Program_arguments prog_args{};
  Parsed_arguments parsed_args{};
};


[[nodiscard]] tl::expected<Parse_context, std::string> strip_exec_name(
    const Parse_context& ctx) {
  if (ctx.prog_args.empty()) {
    return ctx;
  }
  return Parse_context{.prog_args = {ctx.prog_args.begin() + 1, ctx.prog_args.end()},
                       .parsed_args = ctx.parsed_args};
}


[[nodiscard]] tl::expected<Parse_context, std::string> parse_options(Parse_context ctx) {
  auto& parsed_opts = ctx.parsed_args;
  auto prog_arg_it = ctx.prog_args.begin();
  const auto last = ctx.prog_args.end();
  for (; prog_arg_it < last; ++prog_arg_it) {
    if (is_flag(help_flags, *prog_arg_it)) {
      parsed_opts.help = true;
      break;
    } else if (is_flag(device_flags, *prog_arg_it)) {
      parsed_opts.device = TRY(next_arg_value({prog_arg_it, last}, "device"));
      ++prog_arg_it;
    } else if (is_flag(label_flags, *prog_arg_it)) {
      parsed_opts.label = TRY(next_arg_value({prog_arg_it, last}, "label"));
      ++prog_arg_it;
    } else if (is_flag(mount_flags, *prog_arg_it)) {
      parsed_opts.mountpoint = TRY(next_arg_value({prog_arg_it, last}, "mount"));
      ++prog_arg_it;
    } else if (is_flag(disk_flags, *prog_arg_it)) {
      parsed_opts.disk = TRY(next_arg_value({prog_arg_it, last}, "disk"));
      ++prog_arg_it;
    } else if (is_flag(yes_flags, *prog_arg_it)) {
      parsed_opts.assume_yes = true;
    } else if (prog_arg_it->starts_with('-')) {
      return tl::make_unexpected(
          fmt::format("Unrecognized optional argument provided: {}", *prog_arg_it));
    } else {
      return tl::make_unexpected(
          fmt::format("Unexpected positional argument provided: {}", *prog_arg_it));
    }
  }
  return Parse_context{.prog_args = {prog_arg_it, last}, .parsed_args = parsed_opts};
}


[[nodiscard]] tl::expected<Parse_context, std::string> verify_options(
    const Parse_context& ctx) {
  const auto& parsed = ctx.parsed_args;

  // an explicit partition and a disk to partition contradict each other
  if (parsed.device && parsed.disk) {
    return tl::make_unexpected(fmt::format(
        "The {} and {} options cannot be combined: name either the persistence partition "
        "or the disk to create it on.",
        device_flags.long_flag, disk_flags.long_flag));
  }

  if (parsed.label.size() > max_label_length) {
    return tl::make_unexpected(
        fmt::format("The label '{}' is {} bytes long, ext4 labels hold at most {}.",
                    parsed.label, parsed.label.size(), max_label_length));
  }

  if (!parsed.mountpoint.is_absolute()) {
    return tl::make_unexpected(fmt::format("The mount point {} must be an absolute path.",
                                           parsed.mountpoint.string()));
  }

  return ctx;
}


}  // namespace

std::string help_message() {
  using namespace fmt::literals;
  return fmt::format(
      help_message_fmt, "marker"_a = "persistence.conf", "help"_a = help_flags.flag,
      "help_long"_a = help_flags.long_flag, "device"_a = device_flags.flag,
      "device_long"_a = device_flags.long_flag, "label"_a = label_flags.flag,
      "label_long"_a = label_flags.long_flag, "label_default"_a = default_label,
      "mount"_a = mount_flags.flag, "mount_long"_a = mount_flags.long_flag,
      "mount_default"_a = default_mountpoint, "disk"_a = disk_flags.flag,
      "disk_long"_a = disk_flags.long_flag, "yes"_a = yes_flags.flag,
      "yes_long"_a = yes_flags.long_flag);
}

tl::expected<Parsed_arguments, std::string> parse_arguments(
    const Program_arguments prog_args) {
  return strip_exec_name({prog_args, Parsed_arguments{}})
      .and_then(parse_options)
      .and_then([](auto ctx) {
        if (ctx.parsed_args.help) {
          return tl::expected<Parse_context, std::string>(ctx);
        }
        return verify_options(ctx);
      })
      .map([](const auto c) { return c.parsed_args; });
}

bool user_accept_dialog(const std::string_view message, std::string_view accept_option,
                        std::string_view decline_option) {
  static const constexpr char* const trim_chars = " \t\n\r";
  std::string user_input;
  while (true) {
    fmt::print("{}: [{}/{}]: ", message, accept_option, decline_option);
    if (!std::getline(std::cin, user_input)) {
      // no answer can come from a closed input
      return false;
    }
    user_input.erase(user_input.find_last_not_of(trim_chars) + 1);  // suffixing spaces
    user_input.erase(0, user_input.find_first_not_of(trim_chars));  // prefixing spaces
    if (user_input == accept_option) {
      return true;
    } else if (user_input == decline_option) {
      return false;
    } else {
      fmt::print("Selection '{}' doesn't conform to options of '{}' or '{}'\n",
                 user_input, accept_option, decline_option);
    }
  }
}


}  // namespace persistor
