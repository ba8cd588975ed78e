#pragma once

#include <filesystem>
#include <optional>
#include <persistor/block_device.hpp>
#include <persistor/disk_tools.hpp>
#include <persistor/errors.hpp>
#include <string>
#include <variant>
#include <vector>

namespace persistor {

// smallest free region worth a persistence partition, after alignment
constexpr const double min_partition_mib{32.0};
// gap left before the new partition's start
constexpr const double partition_alignment_mib{1.0};
constexpr const int msdos_max_primary_partitions{4};
constexpr const int gpt_max_partitions{128};

enum class Provenance { found_by_label, explicit_device, newly_created };

[[nodiscard]] const char* provenance_name(Provenance) noexcept;

struct Target {
  std::filesystem::path device{};
  Provenance provenance{Provenance::found_by_label};
};

// a partition still to be created by the provisioner
struct Creation_plan {
  std::filesystem::path disk{};
  Free_region region{};
  std::string table_type{};
  std::vector<int> existing_numbers{};
};

struct Resolve_request {
  std::optional<std::filesystem::path> device{};
  std::string label{};
  std::optional<std::filesystem::path> disk{};
};

struct Resolution {
  std::variant<Target, Creation_plan> outcome{};
  // non-fatal findings the operator should see
  std::vector<std::string> warnings{};
};

// Decides what the run operates on. Only inspects device state, never
// changes it.
[[nodiscard]] Provision_result<Resolution> resolve_target(const Resolve_request& request,
                                                          Disk_tools& tools);

// The free region a new partition would occupy: the usable region closest to
// the end of the disk, its start moved past the alignment gap.
[[nodiscard]] std::optional<Free_region> usable_free_region(const Disk_layout& layout);

}  // namespace persistor
