#pragma once

#include <filesystem>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>
#include <string_view>

namespace persistor {

constexpr const char* const marker_filename{"persistence.conf"};
// overlay the whole live root filesystem with the persistence partition
constexpr std::string_view marker_content{"/ union\n"};

// Writes the marker into the root of the mounted filesystem, replacing any
// previous content, and flushes it to stable storage before returning.
// Returns the path of the written file.
[[nodiscard]] Provision_result<std::filesystem::path> write_marker(
    const std::filesystem::path& mountpoint, Disk_tools& tools);

}  // namespace persistor
