#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include "config.hpp"
#include "tui.hpp"

namespace fortress {

// One partition-tool tuple; size_bytes empty = remainder of the disk
struct PartitionSpec {
    std::optional<uint64_t> size_bytes;
    std::string type_guid;
    std::string label;
};

enum class FsType {
    Ext4,
    Vfat,
    Swap
};

enum class PseudoFs {
    Dev,
    Proc,
    Sys,
    Run
};

enum class BootloaderMode {
    Primary,    // registers an NVRAM boot entry
    Fallback    // removable-media path, no NVRAM write
};

// Every external operation the installer depends on. Queries are const and
// must tolerate missing dependencies by answering "not present".
class System {
public:
    virtual ~System() = default;

    // Environment facts
    virtual bool is_root() const = 0;
    virtual bool is_uefi() const = 0;
    virtual bool has_tool(const std::string& name) const = 0;
    virtual std::vector<tui::DiskInfo> list_disks() const = 0;
    virtual std::optional<uint64_t> disk_capacity(const std::string& device) const = 0;
    virtual std::optional<uint64_t> memory_total_kib() const = 0;
    virtual std::string kernel_release() const = 0;
    virtual std::string machine_arch() const = 0;
    virtual bool is_musl() const = 0;
    virtual bool is_live_environment() const = 0;

    // Block devices
    virtual bool block_device_exists(const std::string& path) const = 0;

    // Partition tool
    virtual bool wipe_signatures(const std::string& device) = 0;
    virtual bool create_partitions(const std::string& device,
                                   const std::vector<PartitionSpec>& specs) = 0;

    // Encryption tool
    virtual bool is_luks(const std::string& partition) const = 0;
    virtual bool luks_format(const std::string& partition, const LuksParams& params,
                             const std::string& passphrase) = 0;
    virtual bool luks_open(const std::string& partition, const std::string& name,
                           const std::string& passphrase) = 0;
    virtual bool luks_close(const std::string& name) = 0;
    virtual bool mapping_exists(const std::string& name) const = 0;
    virtual bool luks_add_key(const std::string& partition, const std::string& key_file,
                              const std::string& passphrase) = 0;
    // True when the key file already unlocks a slot of the header
    virtual bool luks_has_key(const std::string& partition,
                              const std::string& key_file) const = 0;

    // Filesystem tool
    virtual bool has_filesystem(const std::string& device) const = 0;
    virtual bool make_filesystem(const std::string& device, FsType type,
                                 const std::string& label) = 0;
    virtual std::optional<std::string> filesystem_uuid(const std::string& device) const = 0;

    // Mount tool
    virtual bool is_mounted(const std::string& path) const = 0;
    virtual bool mount(const std::string& source, const std::string& target) = 0;
    virtual bool mount_pseudo(PseudoFs kind, const std::string& target) = 0;
    virtual bool unmount(const std::string& path, bool lazy) = 0;
    virtual bool unmount_recursive(const std::string& path) = 0;
    virtual bool swap_active(const std::string& device) const = 0;
    virtual bool swap_on(const std::string& device) = 0;
    virtual bool swap_off(const std::string& device) = 0;
    virtual void kill_users(const std::string& path) = 0;

    // Files on the host or under the target root
    virtual bool path_exists(const std::string& path) const = 0;
    virtual bool directory_populated(const std::string& path) const = 0;
    virtual bool create_directories(const std::string& path) = 0;
    virtual bool write_file(const std::string& path, const std::string& content,
                            unsigned mode) = 0;
    virtual bool write_random_key(const std::string& path, std::size_t bytes) = 0;
    virtual bool remove_file(const std::string& path) = 0;
    // Copies a file (following symlinks) or a directory tree, overwriting
    virtual bool copy_path(const std::string& from, const std::string& to) = 0;

    // Package bootstrap tool
    virtual bool install_base_packages(const std::string& root, const std::string& repository,
                                       const std::vector<std::string>& packages) = 0;

    // Chroot
    virtual bool run_in_chroot(const std::string& root, const std::string& command) = 0;

    // Boot configuration tool
    virtual bool install_bootloader(const std::string& root, BootloaderMode mode,
                                    const std::string& bootloader_id) = 0;
    virtual bool generate_boot_config(const std::string& root) = 0;
};

// Single-quote a word for /bin/sh
std::string shell_quote(const std::string& word);

// cryptsetup flags for one volume generation, each prefixed by a space
std::string luks_format_options(const LuksParams& params);

// luksFormat invocation; without a passphrase cryptsetup prompts and verifies
std::string luks_format_command(const std::string& partition, const LuksParams& params,
                                bool interactive);

// Appends --key-file=- when the secret is fed on stdin. The secret itself
// never becomes part of the command line.
std::string with_secret_input(const std::string& cmd, const std::string& passphrase);

// sfdisk input: GPT label, sizes in MiB, the last unsized entry takes the rest
std::string sfdisk_script(const std::vector<PartitionSpec>& specs);

// Decodes the octal escapes (\040 for a space) of /proc/self/mounts fields
std::string unescape_mount_path(const std::string& field);

// Implementation backed by the live machine's tools
class HostSystem : public System {
public:
    bool is_root() const override;
    bool is_uefi() const override;
    bool has_tool(const std::string& name) const override;
    std::vector<tui::DiskInfo> list_disks() const override;
    std::optional<uint64_t> disk_capacity(const std::string& device) const override;
    std::optional<uint64_t> memory_total_kib() const override;
    std::string kernel_release() const override;
    std::string machine_arch() const override;
    bool is_musl() const override;
    bool is_live_environment() const override;

    bool block_device_exists(const std::string& path) const override;

    bool wipe_signatures(const std::string& device) override;
    bool create_partitions(const std::string& device,
                           const std::vector<PartitionSpec>& specs) override;

    bool is_luks(const std::string& partition) const override;
    bool luks_format(const std::string& partition, const LuksParams& params,
                     const std::string& passphrase) override;
    bool luks_open(const std::string& partition, const std::string& name,
                   const std::string& passphrase) override;
    bool luks_close(const std::string& name) override;
    bool mapping_exists(const std::string& name) const override;
    bool luks_add_key(const std::string& partition, const std::string& key_file,
                      const std::string& passphrase) override;
    bool luks_has_key(const std::string& partition,
                      const std::string& key_file) const override;

    bool has_filesystem(const std::string& device) const override;
    bool make_filesystem(const std::string& device, FsType type,
                         const std::string& label) override;
    std::optional<std::string> filesystem_uuid(const std::string& device) const override;

    bool is_mounted(const std::string& path) const override;
    bool mount(const std::string& source, const std::string& target) override;
    bool mount_pseudo(PseudoFs kind, const std::string& target) override;
    bool unmount(const std::string& path, bool lazy) override;
    bool unmount_recursive(const std::string& path) override;
    bool swap_active(const std::string& device) const override;
    bool swap_on(const std::string& device) override;
    bool swap_off(const std::string& device) override;
    void kill_users(const std::string& path) override;

    bool path_exists(const std::string& path) const override;
    bool directory_populated(const std::string& path) const override;
    bool create_directories(const std::string& path) override;
    bool write_file(const std::string& path, const std::string& content,
                    unsigned mode) override;
    bool write_random_key(const std::string& path, std::size_t bytes) override;
    bool remove_file(const std::string& path) override;
    bool copy_path(const std::string& from, const std::string& to) override;

    bool install_base_packages(const std::string& root, const std::string& repository,
                               const std::vector<std::string>& packages) override;

    bool run_in_chroot(const std::string& root, const std::string& command) override;

    bool install_bootloader(const std::string& root, BootloaderMode mode,
                            const std::string& bootloader_id) override;
    bool generate_boot_config(const std::string& root) override;
};

}  // namespace fortress
