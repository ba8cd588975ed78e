#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <persistor/persistor_main.hpp>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

namespace persistor {

constexpr const char* const default_label{"persistence"};
constexpr const char* const default_mountpoint{"/mnt/kali_persistence"};
// ext4 volume names hold at most 16 bytes
constexpr const std::size_t max_label_length{16};

struct Parsed_arguments {
  std::optional<std::filesystem::path> device{};
  std::string label{default_label};
  std::filesystem::path mountpoint{default_mountpoint};
  std::optional<std::filesystem::path> disk{};
  bool assume_yes{false};
  bool help{false};
};

std::string help_message();

[[nodiscard]] tl::expected<Parsed_arguments, std::string> parse_arguments(
    Program_arguments prog_args);

[[nodiscard]] bool user_accept_dialog(std::string_view,
                                      std::string_view accept_option = "y",
                                      std::string_view decline_option = "n");

}  // namespace persistor
