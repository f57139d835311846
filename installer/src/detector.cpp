#include "detector.hpp"
#include "layout.hpp"

namespace fortress {

StateDetector::StateDetector(const System& sys, const disk::TargetDisk& target,
                             const std::string& mount_point)
    : sys_(sys), target_(target), mount_point_(mount_point) {}

Detection StateDetector::detect() const {
    const auto root = layout::root_volume(target_);
    const auto home = layout::home_volume(target_);
    const std::string last_partition = target_.partition(layout::kLastIndex);

    // Each check runs only when every check above it passed
    if (!sys_.block_device_exists(target_.device)) {
        return {Phase::NoDisk, "Disk " + target_.device + " not found"};
    }
    if (!sys_.block_device_exists(last_partition)) {
        return {Phase::NoPartitions, "Partitions not created (" + last_partition + " missing)"};
    }
    if (!sys_.is_luks(root.partition)) {
        return {Phase::NotEncrypted, "Root partition " + root.partition + " not LUKS formatted"};
    }
    if (!sys_.is_luks(home.partition)) {
        return {Phase::PartialEncrypted, "Home partition " + home.partition + " not LUKS formatted"};
    }
    if (!sys_.mapping_exists(root.mapping)) {
        return {Phase::VolumesClosed, "Encrypted volumes not opened"};
    }
    if (!sys_.mapping_exists(home.mapping)) {
        return {Phase::RootOpenHomeClosed, "Home volume " + home.mapping + " not opened"};
    }
    if (!sys_.has_filesystem(layout::mapper_path(root.mapping))) {
        return {Phase::NoRootFilesystem, "Root filesystem not created"};
    }
    if (!sys_.has_filesystem(layout::mapper_path(home.mapping))) {
        return {Phase::NoHomeFilesystem, "Home filesystem not created"};
    }
    if (!sys_.is_mounted(mount_point_)) {
        return {Phase::NotMounted, "Filesystems not mounted at " + mount_point_};
    }
    if (!sys_.is_mounted(layout::under(mount_point_, "/boot"))) {
        return {Phase::PartialMount, "Boot not mounted under " + mount_point_};
    }
    if (!base_system_present(sys_, mount_point_)) {
        return {Phase::NoSystem, "Base system not installed"};
    }
    if (!sys_.path_exists(layout::under(mount_point_, "/etc/fstab"))) {
        return {Phase::NotConfigured, "System not configured"};
    }
    return {Phase::Ready, "Installation complete"};
}

bool base_system_present(const System& sys, const std::string& root) {
    return sys.directory_populated(layout::under(root, "/usr/bin")) &&
           sys.path_exists(layout::under(root, "/etc"));
}

}  // namespace fortress
