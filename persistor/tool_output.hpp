#pragma once

#include <persistor/block_device.hpp>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <vector>

namespace persistor {

// Parsers for the machine readable output of the disk utilities. Only the
// fields the provisioning core needs are extracted.

// lsblk -bnP -o NAME,PATH,TYPE,RM,FSTYPE,LABEL,PKNAME
[[nodiscard]] tl::expected<std::vector<Block_device>, std::string> parse_lsblk_pairs(
    std::string_view output);

// blkid -o export <device>
[[nodiscard]] Fs_attributes parse_blkid_export(std::string_view output);

// parted -sm <disk> unit MiB print free
[[nodiscard]] tl::expected<Disk_layout, std::string> parse_parted_machine(
    std::string_view output);

// decodes lsblk's "\x20" style escapes
[[nodiscard]] std::string unescape_hex(std::string_view escaped);

}  // namespace persistor
