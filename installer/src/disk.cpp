#include "disk.hpp"
#include <cctype>
#include <cstdio>

namespace fortress {
namespace disk {

namespace {

constexpr const char* kEspGuid   = "C12A7328-F81F-11D2-BA4B-00A0C93EC93B";
constexpr const char* kLinuxGuid = "0FC63DAF-8483-4772-8E79-3D69D8477DE4";
constexpr const char* kSwapGuid  = "0657FD6D-A4AB-43C4-84E5-0933C84B4F4F";

struct TierSizes {
    uint64_t efi;
    uint64_t boot;
    uint64_t swap;
    uint64_t root;
};

constexpr TierSizes kSmall  = {512 * MiB, 512 * MiB, 2 * GiB, 10 * GiB};
constexpr TierSizes kMedium = {512 * MiB, 1 * GiB,   4 * GiB, 20 * GiB};
constexpr TierSizes kLarge  = {512 * MiB, 1 * GiB,   8 * GiB, 50 * GiB};

SizeTier tier_for(uint64_t capacity_bytes) {
    uint64_t gib = capacity_bytes / GiB;
    if (gib < 30) return SizeTier::Small;
    if (gib < 60) return SizeTier::Medium;
    return SizeTier::Large;
}

const TierSizes& sizes_for(SizeTier tier) {
    switch (tier) {
        case SizeTier::Small:  return kSmall;
        case SizeTier::Medium: return kMedium;
        case SizeTier::Large:
        case SizeTier::Custom: return kLarge;
    }
    return kLarge;
}

PartitionPlan make_plan(SizeTier tier, const TierSizes& sizes) {
    PartitionPlan plan;
    plan.tier = tier;
    plan.regions = {
        {RegionKind::Efi,  "EFI",  sizes.efi},
        {RegionKind::Boot, "BOOT", sizes.boot},
        {RegionKind::Swap, "SWAP", sizes.swap},
        {RegionKind::Root, "ROOT", sizes.root},
        {RegionKind::Home, "HOME", std::nullopt},
    };
    return plan;
}

std::optional<PartitionPlan> checked(PartitionPlan plan, uint64_t capacity_bytes,
                                     std::string* reason) {
    if (auto problem = plan.validate(capacity_bytes)) {
        if (reason) *reason = *problem;
        return std::nullopt;
    }
    return plan;
}

}  // namespace

uint64_t PartitionPlan::fixed_total() const {
    uint64_t total = 0;
    for (const auto& region : regions) {
        if (region.size_bytes) total += *region.size_bytes;
    }
    return total;
}

std::optional<std::string> PartitionPlan::validate(uint64_t capacity_bytes) const {
    if (regions.empty()) {
        return "plan has no regions";
    }
    for (size_t i = 0; i < regions.size(); ++i) {
        const auto& region = regions[i];
        bool last = (i + 1 == regions.size());
        if (!region.size_bytes && !last) {
            return "only the last region may be unsized (" + region.label + ")";
        }
        if (region.size_bytes && *region.size_bytes == 0) {
            return "region " + region.label + " has zero size";
        }
    }
    if (capacity_bytes <= kSafetyMargin) {
        return "disk of " + format_size(capacity_bytes) + " is smaller than the safety margin";
    }
    uint64_t usable = capacity_bytes - kSafetyMargin;
    if (fixed_total() > usable) {
        return "fixed regions need " + format_size(fixed_total()) + " but only " +
               format_size(usable) + " is usable on a " + format_size(capacity_bytes) + " disk";
    }
    return std::nullopt;
}

TargetDisk TargetDisk::from_device(const std::string& device, uint64_t capacity_bytes) {
    TargetDisk target;
    target.device = device;
    target.capacity_bytes = capacity_bytes;
    target.separator = needs_separator(device) ? "p" : "";
    return target;
}

std::string TargetDisk::partition(int index) const {
    return device + separator + std::to_string(index);
}

bool needs_separator(const std::string& device) {
    return device.find("nvme") != std::string::npos ||
           device.find("mmcblk") != std::string::npos ||
           device.find("loop") != std::string::npos;
}

std::string tier_name(SizeTier tier) {
    switch (tier) {
        case SizeTier::Small:  return "small";
        case SizeTier::Medium: return "medium";
        case SizeTier::Large:  return "large";
        case SizeTier::Custom: return "custom";
    }
    return "unknown";
}

std::optional<PartitionPlan> plan_for_capacity(uint64_t capacity_bytes, std::string* reason) {
    SizeTier tier = tier_for(capacity_bytes);

    // Just above a tier boundary the tier's own sizes may not fit; step down
    while (tier != SizeTier::Small) {
        PartitionPlan plan = make_plan(tier, sizes_for(tier));
        if (!plan.validate(capacity_bytes)) return plan;
        tier = (tier == SizeTier::Large) ? SizeTier::Medium : SizeTier::Small;
    }
    return checked(make_plan(SizeTier::Small, kSmall), capacity_bytes, reason);
}

std::optional<PartitionPlan> plan_custom(uint64_t capacity_bytes, const PartitionSizes& sizes,
                                         std::string* reason) {
    TierSizes chosen = sizes_for(tier_for(capacity_bytes));

    auto take = [&](const std::optional<std::string>& text, uint64_t& out,
                    const char* name) -> bool {
        if (!text) return true;
        auto parsed = parse_size(*text);
        if (!parsed) {
            if (reason) *reason = std::string("invalid ") + name + " size: " + *text;
            return false;
        }
        out = *parsed;
        return true;
    };

    if (!take(sizes.efi, chosen.efi, "EFI") ||
        !take(sizes.boot, chosen.boot, "BOOT") ||
        !take(sizes.swap, chosen.swap, "SWAP") ||
        !take(sizes.root, chosen.root, "ROOT")) {
        return std::nullopt;
    }

    return checked(make_plan(SizeTier::Custom, chosen), capacity_bytes, reason);
}

std::optional<uint64_t> parse_size(const std::string& text) {
    if (text.empty()) return std::nullopt;

    size_t pos = 0;
    uint64_t value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
        if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == 0) return std::nullopt;

    uint64_t unit = 1;
    if (pos < text.size()) {
        switch (std::toupper(static_cast<unsigned char>(text[pos]))) {
            case 'K': unit = KiB; break;
            case 'M': unit = MiB; break;
            case 'G': unit = GiB; break;
            case 'T': unit = 1024ULL * GiB; break;
            default: return std::nullopt;
        }
        ++pos;
        // Accept "G", "GB", "GiB"
        std::string rest = text.substr(pos);
        if (!rest.empty() && rest != "B" && rest != "iB" && rest != "b") return std::nullopt;
    }

    if (value == 0 || value > UINT64_MAX / unit) return std::nullopt;
    return value * unit;
}

std::string format_size(uint64_t bytes) {
    char buffer[32];
    if (bytes >= GiB && bytes % GiB == 0) {
        std::snprintf(buffer, sizeof(buffer), "%lluG", static_cast<unsigned long long>(bytes / GiB));
    } else if (bytes >= GiB) {
        std::snprintf(buffer, sizeof(buffer), "%.1fG", static_cast<double>(bytes) / GiB);
    } else if (bytes >= MiB) {
        std::snprintf(buffer, sizeof(buffer), "%lluM", static_cast<unsigned long long>(bytes / MiB));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lluB", static_cast<unsigned long long>(bytes));
    }
    return buffer;
}

std::vector<PartitionSpec> to_partition_specs(const PartitionPlan& plan) {
    std::vector<PartitionSpec> specs;
    for (const auto& region : plan.regions) {
        PartitionSpec spec;
        spec.size_bytes = region.size_bytes;
        spec.label = region.label;
        switch (region.kind) {
            case RegionKind::Efi:  spec.type_guid = kEspGuid; break;
            case RegionKind::Swap: spec.type_guid = kSwapGuid; break;
            case RegionKind::Boot:
            case RegionKind::Root:
            case RegionKind::Home: spec.type_guid = kLinuxGuid; break;
        }
        specs.push_back(spec);
    }
    return specs;
}

std::vector<std::string> describe(const PartitionPlan& plan, uint64_t capacity_bytes) {
    std::vector<std::string> lines;
    lines.push_back("Layout (" + tier_name(plan.tier) + " tier, disk " +
                    format_size(capacity_bytes) + "):");
    for (const auto& region : plan.regions) {
        std::string size = region.size_bytes
            ? format_size(*region.size_bytes)
            : "remainder (~" + format_size(capacity_bytes > plan.fixed_total()
                                               ? capacity_bytes - plan.fixed_total()
                                               : 0) + ")";
        lines.push_back("  • " + region.label + ": " + size);
    }
    return lines;
}

std::optional<std::string> auto_select_disk(const System& sys, const std::string& preferred) {
    if (!preferred.empty() && sys.block_device_exists(preferred)) {
        return preferred;
    }
    for (const char* candidate : {"/dev/vda", "/dev/sda", "/dev/nvme0n1"}) {
        if (sys.block_device_exists(candidate)) return std::string(candidate);
    }
    return std::nullopt;
}

}  // namespace disk
}  // namespace fortress
