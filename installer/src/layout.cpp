#include "layout.hpp"

namespace fortress {
namespace layout {

std::string mapper_path(const std::string& mapping) {
    return "/dev/mapper/" + mapping;
}

VolumeSpec root_volume(const disk::TargetDisk& target) {
    return {"ROOT", kRootMapping, target.partition(kRootIndex), "ROOT"};
}

VolumeSpec home_volume(const disk::TargetDisk& target) {
    return {"HOME", kHomeMapping, target.partition(kHomeIndex), "HOME"};
}

std::vector<MountEntry> mount_plan(const disk::TargetDisk& target) {
    return {
        {mapper_path(kRootMapping),        "/",         "ext4", "defaults,noatime",       1},
        {target.partition(kBootIndex),     "/boot",     "ext4", "defaults,noatime,nodev", 2},
        {target.partition(kEfiIndex),      "/boot/efi", "vfat", "defaults,umask=0077",    2},
        {mapper_path(kHomeMapping),        "/home",     "ext4", "defaults,noatime,nodev", 2},
    };
}

std::string under(const std::string& root, const std::string& relative) {
    if (relative.empty() || relative == "/") return root;
    if (!root.empty() && root.back() == '/') {
        return root + (relative.front() == '/' ? relative.substr(1) : relative);
    }
    return root + (relative.front() == '/' ? relative : "/" + relative);
}

std::vector<PseudoMount> pseudo_mounts() {
    return {
        {PseudoFs::Dev,  "/dev"},
        {PseudoFs::Proc, "/proc"},
        {PseudoFs::Sys,  "/sys"},
        {PseudoFs::Run,  "/run"},
    };
}

}  // namespace layout
}  // namespace fortress
