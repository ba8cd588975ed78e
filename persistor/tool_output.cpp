#include <fmt/format.h>

#include <charconv>
#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <persistor/try.hpp>
#include <persistor/tool_output.hpp>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <utility>
#include <vector>

namespace persistor {

namespace {

using Pairs = std::map<std::string, std::string, std::less<>>;

template <typename T>
  requires std::integral<T> || std::floating_point<T>
[[nodiscard]] tl::expected<T, std::string> parse_number(const std::string_view str) {
  T parsed{};
  if (const auto result = std::from_chars(str.data(), str.data() + str.size(), parsed);
      result.ec != std::errc{} || result.ptr != str.data() + str.size()) {
    return tl::make_unexpected(fmt::format("'{}' is not a number", str));
  }
  return parsed;
}

[[nodiscard]] std::vector<std::string_view> split(const std::string_view str,
                                                  const char delim) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto end = str.find(delim, start);
    if (end == std::string_view::npos) {
      fields.push_back(str.substr(start));
      return fields;
    }
    fields.push_back(str.substr(start, end - start));
    start = end + 1;
  }
}

[[nodiscard]] std::string_view trim_line(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.remove_suffix(1);
  }
  while (!line.empty() && line.front() == ' ') {
    line.remove_prefix(1);
  }
  return line;
}

[[nodiscard]] int hex_value(const char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  } else if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  } else if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// KEY="value" KEY="value" ...
[[nodiscard]] tl::expected<Pairs, std::string> parse_pairs(const std::string_view line) {
  Pairs pairs;
  std::size_t pos = 0;
  while (pos < line.size()) {
    if (line[pos] == ' ') {
      ++pos;
      continue;
    }
    const auto equals = line.find('=', pos);
    if (equals == std::string_view::npos || equals + 1 >= line.size() ||
        line[equals + 1] != '"') {
      return tl::make_unexpected(fmt::format("Malformed key/value pair in '{}'", line));
    }
    const auto value_end = line.find('"', equals + 2);
    if (value_end == std::string_view::npos) {
      return tl::make_unexpected(fmt::format("Unterminated value in '{}'", line));
    }
    pairs.insert_or_assign(std::string(line.substr(pos, equals - pos)),
                           unescape_hex(line.substr(equals + 2, value_end - equals - 2)));
    pos = value_end + 1;
  }
  return pairs;
}

[[nodiscard]] std::string pair_value(const Pairs& pairs, const std::string_view key) {
  if (const auto it = pairs.find(key); it != pairs.end()) {
    return it->second;
  }
  return {};
}

[[nodiscard]] std::optional<std::string> non_empty(std::string value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] Device_role to_role(const std::string_view type) noexcept {
  if (type == "disk") {
    return Device_role::disk;
  } else if (type == "part") {
    return Device_role::partition;
  }
  return Device_role::other;
}

[[nodiscard]] tl::expected<double, std::string> parse_mib(std::string_view field) {
  if (field.ends_with("MiB")) {
    field.remove_suffix(3);
  }
  return parse_number<double>(field);
}

}  // namespace

std::string unescape_hex(const std::string_view escaped) {
  std::string result;
  result.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] == '\\' && i + 3 < escaped.size() && escaped[i + 1] == 'x') {
      const auto high = hex_value(escaped[i + 2]);
      const auto low = hex_value(escaped[i + 3]);
      if (high >= 0 && low >= 0) {
        result.push_back(static_cast<char>(high * 16 + low));
        i += 3;
        continue;
      }
    }
    result.push_back(escaped[i]);
  }
  return result;
}

tl::expected<std::vector<Block_device>, std::string> parse_lsblk_pairs(
    const std::string_view output) {
  std::vector<Block_device> devices;
  for (const auto raw_line : split(output, '\n')) {
    const auto line = trim_line(raw_line);
    if (line.empty()) {
      continue;
    }

    const auto pairs = TRY(parse_pairs(line));
    Block_device device{.path = pair_value(pairs, "PATH"),
                        .name = pair_value(pairs, "NAME"),
                        .role = to_role(pair_value(pairs, "TYPE")),
                        .label = non_empty(pair_value(pairs, "LABEL")),
                        .fs_type = non_empty(pair_value(pairs, "FSTYPE")),
                        .removable = pair_value(pairs, "RM") == "1",
                        .parent = non_empty(pair_value(pairs, "PKNAME"))};
    if (device.path.empty()) {
      if (device.name.empty()) {
        return tl::make_unexpected(fmt::format("No device named in lsblk line '{}'", line));
      }
      device.path = "/dev" / std::filesystem::path(device.name);
    }
    devices.push_back(std::move(device));
  }
  return devices;
}

Fs_attributes parse_blkid_export(const std::string_view output) {
  Fs_attributes attributes;
  for (const auto raw_line : split(output, '\n')) {
    const auto line = trim_line(raw_line);
    const auto equals = line.find('=');
    if (equals == std::string_view::npos) {
      continue;
    }
    const auto key = line.substr(0, equals);
    // blkid escapes shell specials with a backslash in export mode
    std::string value;
    for (std::size_t i = equals + 1; i < line.size(); ++i) {
      if (line[i] == '\\' && i + 1 < line.size()) {
        ++i;
      }
      value.push_back(line[i]);
    }
    if (key == "LABEL") {
      attributes.label = non_empty(std::move(value));
    } else if (key == "TYPE") {
      attributes.fs_type = non_empty(std::move(value));
    }
  }
  return attributes;
}

tl::expected<Disk_layout, std::string> parse_parted_machine(const std::string_view output) {
  Disk_layout layout;
  bool seen_unit = false;
  bool seen_disk = false;

  for (const auto raw_line : split(output, '\n')) {
    auto line = trim_line(raw_line);
    if (line.empty()) {
      continue;
    }
    if (line.ends_with(';')) {
      line.remove_suffix(1);
    }

    if (!seen_unit) {
      if (line != "BYT") {
        return tl::make_unexpected(
            fmt::format("Unexpected parted machine output header '{}'", line));
      }
      seen_unit = true;
      continue;
    }

    const auto fields = split(line, ':');
    if (!seen_disk) {
      // path:size:transport:logical-sector:physical-sector:table:model:flags
      if (fields.size() < 6) {
        return tl::make_unexpected(fmt::format("Malformed parted disk line '{}'", line));
      }
      layout.size_mib = TRY(parse_mib(fields[1]));
      layout.table_type = std::string(fields[5]);
      seen_disk = true;
      continue;
    }

    // number:start:end:size:free
    // number:start:end:size:filesystem:name-or-type:flags
    if (fields.size() < 4) {
      return tl::make_unexpected(fmt::format("Malformed parted partition line '{}'", line));
    }
    const auto start = TRY(parse_mib(fields[1]));
    const auto end = TRY(parse_mib(fields[2]));
    if (fields.back() == "free") {
      layout.free_regions.push_back({.start_mib = start, .end_mib = end});
    } else {
      const auto number = TRY(parse_number<int>(fields[0]));
      layout.partitions.push_back({.number = number, .start_mib = start, .end_mib = end});
    }
  }

  if (!seen_disk) {
    return tl::make_unexpected("parted reported no disk information");
  }
  return layout;
}

}  // namespace persistor
