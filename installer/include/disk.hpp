#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include "config.hpp"
#include "system.hpp"

namespace fortress {
namespace disk {

constexpr uint64_t KiB = 1024ULL;
constexpr uint64_t MiB = 1024ULL * KiB;
constexpr uint64_t GiB = 1024ULL * MiB;

// Space that fixed-size regions may never claim
constexpr uint64_t kSafetyMargin = 2 * GiB;

enum class RegionKind {
    Efi,
    Boot,
    Swap,
    Root,
    Home
};

enum class SizeTier {
    Small,     // < 30 GiB
    Medium,    // < 60 GiB
    Large,
    Custom     // operator-supplied sizes
};

struct Region {
    RegionKind kind;
    std::string label;
    std::optional<uint64_t> size_bytes;   // empty = remainder of disk
};

// Regions are consumed from the start of the disk in order
struct PartitionPlan {
    SizeTier tier = SizeTier::Large;
    std::vector<Region> regions;

    uint64_t fixed_total() const;

    // Empty when the plan fits a disk of this capacity
    std::optional<std::string> validate(uint64_t capacity_bytes) const;
};

// Immutable once selected for a run
struct TargetDisk {
    std::string device;
    uint64_t capacity_bytes = 0;
    std::string separator;       // "p" for /dev/nvme0n1p1 style names

    static TargetDisk from_device(const std::string& device, uint64_t capacity_bytes);

    // Path of the 1-based partition index
    std::string partition(int index) const;
};

bool needs_separator(const std::string& device);

std::string tier_name(SizeTier tier);

// Tier-based plan. Drops to a smaller tier when the capacity tier does not
// fit; fails closed when the disk cannot hold the smallest plan.
std::optional<PartitionPlan> plan_for_capacity(uint64_t capacity_bytes,
                                               std::string* reason = nullptr);

// Operator override: set sizes are taken as-is, unset ones fall back to the
// capacity tier's values. Still fails closed on the capacity invariant.
std::optional<PartitionPlan> plan_custom(uint64_t capacity_bytes,
                                         const PartitionSizes& sizes,
                                         std::string* reason = nullptr);

// "512M", "20G", "1T", "4096" (bytes). Binary units.
std::optional<uint64_t> parse_size(const std::string& text);

std::string format_size(uint64_t bytes);

// Partition tool tuples with GPT type GUIDs
std::vector<PartitionSpec> to_partition_specs(const PartitionPlan& plan);

// Human-readable lines for summaries
std::vector<std::string> describe(const PartitionPlan& plan, uint64_t capacity_bytes);

// Keep `preferred` if it is a block device, else the first of
// /dev/vda, /dev/sda, /dev/nvme0n1 that exists
std::optional<std::string> auto_select_disk(const System& sys, const std::string& preferred);

}  // namespace disk
}  // namespace fortress
