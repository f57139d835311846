#pragma once

#include <string>
#include <vector>
#include "disk.hpp"
#include "system.hpp"

namespace fortress {
namespace layout {

// Partition indices of the fixed GPT layout
constexpr int kEfiIndex  = 1;
constexpr int kBootIndex = 2;
constexpr int kSwapIndex = 3;
constexpr int kRootIndex = 4;
constexpr int kHomeIndex = 5;
constexpr int kLastIndex = kHomeIndex;

// Stable names of the opened encrypted volumes
constexpr const char* kRootMapping = "root_crypt";
constexpr const char* kHomeMapping = "home_crypt";

// Key file that unlocks HOME at boot. It lives on the encrypted root, never
// on the plain boot partition. Relative to the target root.
constexpr const char* kKeyDir = "/etc/keys";
constexpr const char* kKeyFile = "/etc/keys/home.key";
constexpr std::size_t kKeyFileBytes = 64;

std::string mapper_path(const std::string& mapping);

// An encrypted volume and the partition backing it
struct VolumeSpec {
    std::string name;           // "ROOT" / "HOME"
    std::string mapping;        // root_crypt / home_crypt
    std::string partition;      // /dev/sda4
    std::string label;          // filesystem label inside the mapping
};

VolumeSpec root_volume(const disk::TargetDisk& target);
VolumeSpec home_volume(const disk::TargetDisk& target);

// One entry of the mount plan; entries are listed in mount order
struct MountEntry {
    std::string source;         // device path
    std::string target;         // relative to the target root, "/" for root
    std::string fstype;
    std::string options;        // fstab options
    int pass;                   // fstab fsck pass
};

// root, boot, EFI, home in filesystem-hierarchy order
std::vector<MountEntry> mount_plan(const disk::TargetDisk& target);

// Joins the target root with a path relative to it
std::string under(const std::string& root, const std::string& relative);

// Pseudo filesystems for the chroot, mounted only after root
struct PseudoMount {
    PseudoFs kind;
    std::string target;         // relative to the target root
};

std::vector<PseudoMount> pseudo_mounts();

}  // namespace layout
}  // namespace fortress
