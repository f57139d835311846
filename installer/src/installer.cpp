#include "installer.hpp"
#include "layout.hpp"
#include "teardown.hpp"
#include "tui.hpp"
#include <algorithm>
#include <sstream>

namespace fortress {

namespace {

constexpr const char* kScriptPath = "/configure.sh";
constexpr uint64_t kArgon2MinKib = 1024ULL * 1024ULL;
constexpr uint64_t kArgon2MaxKib = 4ULL * 1024ULL * 1024ULL;

// Release stages: swap before mounts, mounts before HOME, HOME before ROOT
constexpr int kRootStage = 0;
constexpr int kHomeStage = 1;
constexpr int kMountStage = 2;
constexpr int kSwapStage = 3;

// The "configure" tail shared by every row that reaches configuration.
// The fstab goes last: its presence is what marks a finished install.
const std::vector<Action> kConfigure = {
    Action::GenerateConfiguration,
    Action::RunChrootConfiguration,
    Action::EnrollKeyFile,
    Action::InstallBootloader,
    Action::GenerateBootConfig,
    Action::WriteFstab
};

std::vector<Action> then_configure(std::vector<Action> head) {
    head.insert(head.end(), kConfigure.begin(), kConfigure.end());
    return head;
}

}  // namespace

std::string to_string(Action action) {
    switch (action) {
        case Action::CreatePartitions:       return "Create partitions";
        case Action::FormatVolumes:          return "Format encrypted volumes";
        case Action::OpenVolumes:            return "Open encrypted volumes";
        case Action::CreateFilesystems:      return "Create filesystems";
        case Action::MountFilesystems:       return "Mount filesystems";
        case Action::BootstrapSystem:        return "Bootstrap base system";
        case Action::BootstrapIfAbsent:      return "Bootstrap base system (if absent)";
        case Action::GenerateConfiguration:  return "Generate configuration";
        case Action::RunChrootConfiguration: return "Run chroot configuration";
        case Action::EnrollKeyFile:          return "Enroll key file";
        case Action::InstallBootloader:      return "Install bootloader";
        case Action::GenerateBootConfig:     return "Generate boot configuration";
        case Action::WriteFstab:             return "Write fstab";
    }
    return "Unknown action";
}

bool is_destructive(Action action) {
    return action == Action::CreatePartitions || action == Action::FormatVolumes;
}

std::vector<Action> plan_for(Phase phase) {
    // No default: a phase without a row must not compile
    switch (phase) {
        case Phase::NoDisk:
            return {};
        case Phase::NoPartitions:
            return then_configure({Action::CreatePartitions, Action::FormatVolumes,
                                   Action::OpenVolumes, Action::CreateFilesystems,
                                   Action::MountFilesystems, Action::BootstrapSystem});
        case Phase::NotEncrypted:
        case Phase::PartialEncrypted:
            return then_configure({Action::FormatVolumes, Action::OpenVolumes,
                                   Action::CreateFilesystems, Action::MountFilesystems,
                                   Action::BootstrapSystem});
        case Phase::VolumesClosed:
        case Phase::RootOpenHomeClosed:
            return then_configure({Action::OpenVolumes, Action::CreateFilesystems,
                                   Action::MountFilesystems, Action::BootstrapIfAbsent});
        case Phase::NoRootFilesystem:
        case Phase::NoHomeFilesystem:
            return then_configure({Action::OpenVolumes, Action::CreateFilesystems,
                                   Action::MountFilesystems, Action::BootstrapSystem});
        case Phase::NotMounted:
        case Phase::PartialMount:
            return then_configure({Action::MountFilesystems, Action::BootstrapIfAbsent});
        case Phase::NoSystem:
            return then_configure({Action::BootstrapSystem});
        case Phase::NotConfigured:
            return kConfigure;
        case Phase::Ready:
            return {};
        case Phase::Error:
            return {};
    }
    return {};
}

uint64_t argon2_memory_kib(uint64_t total_memory_kib) {
    uint64_t memory = total_memory_kib / 4 * 3;
    return std::min(std::max(memory, kArgon2MinKib), kArgon2MaxKib);
}

Installer::Installer(const Config& config, System& sys, const disk::TargetDisk& target,
                     const disk::PartitionPlan& plan, const Environment& env,
                     CheckpointStore& checkpoints)
    : config_(config),
      sys_(sys),
      target_(target),
      plan_(plan),
      env_(env),
      checkpoints_(checkpoints),
      mount_point_(config.paths.mount_point) {}

Detection Installer::detect() const {
    return StateDetector(sys_, target_, mount_point_).detect();
}

std::string Installer::in_target(const std::string& path) const {
    return layout::under(mount_point_, path);
}

bool Installer::fail(const std::string& message) {
    error_message_ = message;
    return false;
}

RunResult Installer::finish(Outcome outcome, Phase phase, const std::string& detail) {
    if (!checkpoints_.record(phase, target_.device, detail)) {
        tui::print_warning("Could not write checkpoint: " + checkpoints_.get_error());
    }
    return {outcome, phase, detail, last_detected_};
}

RunResult Installer::run(Phase phase, const RunOptions& options, RunContext& ctx) {
    error_message_.clear();
    last_detected_ = phase;

    if (is_fatal(phase)) {
        std::string detail = (phase == Phase::NoDisk)
            ? "Disk " + target_.device + " not found"
            : "Unknown phase";
        error_message_ = detail;
        return finish(Outcome::Failed, Phase::Error, detail);
    }

    const std::vector<Action> actions = plan_for(phase);
    if (actions.empty()) {
        tui::print_success("System is ready, nothing to do");
        return finish(Outcome::Success, phase, "Installation complete");
    }

    for (Action action : actions) {
        if (is_destructive(action) && !options.confirmed) {
            error_message_ = to_string(action) + " on " + target_.device +
                             " requires confirmation";
            return finish(Outcome::Failed, Phase::Error, error_message_);
        }
    }

    const int total = static_cast<int>(actions.size());
    for (int i = 0; i < total; ++i) {
        const Action action = actions[i];

        if (ctx.cancelled()) {
            Detection now = detect();
            last_detected_ = now.phase;
            return finish(Outcome::Cancelled, now.phase,
                          "Interrupted before " + to_string(action) + ": " + now.detail);
        }

        tui::print_step(i + 1, total, to_string(action));
        bool ok = perform(action, ctx);

        if (ctx.cancelled()) {
            Detection now = detect();
            last_detected_ = now.phase;
            return finish(Outcome::Cancelled, now.phase,
                          "Interrupted during " + to_string(action) + ": " + now.detail);
        }
        if (!ok) {
            if (error_message_.empty()) {
                error_message_ = to_string(action) + " failed";
            }
            return finish(Outcome::Failed, Phase::Error,
                          to_string(action) + ": " + error_message_);
        }

        Detection now = detect();
        last_detected_ = now.phase;
        if (!checkpoints_.record(now.phase, target_.device, now.detail)) {
            tui::print_warning("Could not write checkpoint: " + checkpoints_.get_error());
        }
    }

    Detection final_state = detect();
    last_detected_ = final_state.phase;
    if (final_state.phase != Phase::Ready) {
        error_message_ = "All actions succeeded but the system is at " +
                         to_string(final_state.phase) + ": " + final_state.detail;
        return finish(Outcome::Failed, Phase::Error, error_message_);
    }
    return finish(Outcome::Success, final_state.phase, final_state.detail);
}

RunResult Installer::bring_up(Access level, RunContext& ctx) {
    error_message_.clear();
    auto stop = [&](Outcome outcome, const std::string& detail) {
        Detection now = detect();
        return RunResult{outcome, outcome == Outcome::Failed ? Phase::Error : now.phase,
                         detail, now.phase};
    };

    Detection start = detect();
    if (rank(start.phase) < rank(Phase::VolumesClosed)) {
        return stop(Outcome::Failed, "Nothing to open: " + start.detail);
    }

    bool ok = open_volumes(ctx);
    if (ctx.cancelled()) return stop(Outcome::Cancelled, "Interrupted while opening volumes");
    if (!ok) return stop(Outcome::Failed, error_message_);
    if (level == Access::Open) return stop(Outcome::Success, "Volumes open");

    Detection opened = detect();
    if (rank(opened.phase) < rank(Phase::NotMounted)) {
        return stop(Outcome::Failed, "Cannot mount: " + opened.detail);
    }
    ok = mount_filesystems(ctx);
    if (ctx.cancelled()) return stop(Outcome::Cancelled, "Interrupted while mounting");
    if (!ok) return stop(Outcome::Failed, error_message_);
    if (level == Access::Mount) return stop(Outcome::Success, "Mounted at " + mount_point_);

    if (!base_system_present(sys_, mount_point_)) {
        return stop(Outcome::Failed, "No system installed under " + mount_point_);
    }
    ok = prepare_chroot();
    if (ctx.cancelled()) {
        cleanup_chroot();
        return stop(Outcome::Cancelled, "Interrupted while preparing the chroot");
    }
    if (!ok) return stop(Outcome::Failed, error_message_);
    return stop(Outcome::Success, "Chroot ready under " + mount_point_);
}

bool Installer::perform(Action action, RunContext& ctx) {
    switch (action) {
        case Action::CreatePartitions:       return create_partitions();
        case Action::FormatVolumes:          return format_volumes();
        case Action::OpenVolumes:            return open_volumes(ctx);
        case Action::CreateFilesystems:      return create_filesystems();
        case Action::MountFilesystems:       return mount_filesystems(ctx);
        case Action::BootstrapSystem:        return bootstrap_system();
        case Action::BootstrapIfAbsent:
            if (base_system_present(sys_, mount_point_)) {
                tui::print_info("Base system already present, skipping bootstrap");
                return true;
            }
            return bootstrap_system();
        case Action::GenerateConfiguration:  return generate_configuration();
        case Action::RunChrootConfiguration: return run_chroot_configuration();
        case Action::EnrollKeyFile:          return enroll_key_file();
        case Action::InstallBootloader:      return install_bootloader();
        case Action::GenerateBootConfig:     return generate_boot_config();
        case Action::WriteFstab:             return write_fstab();
    }
    return fail("Unknown action");
}

void Installer::hold_volume(RunContext& ctx, const std::string& mapping) {
    int stage = mapping == layout::kRootMapping ? kRootStage : kHomeStage;
    ctx.hold("volume " + mapping, [&sys = sys_, target = target_, mp = mount_point_, mapping]() {
        return TeardownReconciler(sys, target, mp).close_volume(mapping) != StepResult::Failed;
    }, stage);
}

void Installer::hold_mounts(RunContext& ctx) {
    ctx.hold("mounts " + mount_point_, [&sys = sys_, target = target_, mp = mount_point_]() {
        return TeardownReconciler(sys, target, mp).unmount_all() != StepResult::Failed;
    }, kMountStage);
}

void Installer::hold_swap(RunContext& ctx) {
    ctx.hold("swap " + target_.partition(layout::kSwapIndex),
             [&sys = sys_, target = target_, mp = mount_point_]() {
        return TeardownReconciler(sys, target, mp).deactivate_swap() != StepResult::Failed;
    }, kSwapStage);
}

void Installer::adopt_existing(RunContext& ctx) {
    // Registration order mirrors the order a fresh run opens them in
    for (const char* mapping : {layout::kRootMapping, layout::kHomeMapping}) {
        if (sys_.mapping_exists(mapping)) {
            hold_volume(ctx, mapping);
        }
    }
    bool any_mount = sys_.is_mounted(mount_point_);
    for (const auto& entry : layout::mount_plan(target_)) {
        any_mount = any_mount || sys_.is_mounted(in_target(entry.target));
    }
    if (any_mount) {
        hold_mounts(ctx);
    }
    if (sys_.swap_active(target_.partition(layout::kSwapIndex))) {
        hold_swap(ctx);
    }
}

LuksParams Installer::root_params() const {
    LuksParams params = config_.encryption.root;
    params.generation = LuksGeneration::Luks1;
    return params;
}

LuksParams Installer::home_params() const {
    LuksParams params = config_.encryption.home;
    params.generation = LuksGeneration::Luks2;
    if (params.memory_kib == 0) {
        params.memory_kib = argon2_memory_kib(env_.memory_kib);
    }
    return params;
}

bool Installer::create_partitions() {
    const std::string last = target_.partition(layout::kLastIndex);
    if (sys_.block_device_exists(last)) {
        tui::print_info("Partition table already present (" + last + "), skipping");
        return true;
    }

    if (auto problem = plan_.validate(target_.capacity_bytes)) {
        return fail("Refusing invalid partition plan: " + *problem);
    }

    for (const auto& line : disk::describe(plan_, target_.capacity_bytes)) {
        tui::print_info(line);
    }

    if (!sys_.wipe_signatures(target_.device)) {
        tui::print_warning("Could not wipe old signatures on " + target_.device);
    }
    if (!sys_.create_partitions(target_.device, disk::to_partition_specs(plan_))) {
        return fail("Partitioning " + target_.device + " failed");
    }
    if (!sys_.block_device_exists(last)) {
        return fail("Partition table written but " + last + " did not appear");
    }

    tui::print_success("Partitioning complete");
    return true;
}

bool Installer::format_volumes() {
    const std::string efi = target_.partition(layout::kEfiIndex);
    const std::string boot = target_.partition(layout::kBootIndex);

    if (!sys_.has_filesystem(efi)) {
        if (!sys_.make_filesystem(efi, FsType::Vfat, "EFI")) {
            return fail("Could not create the EFI filesystem on " + efi);
        }
    }
    if (!sys_.has_filesystem(boot)) {
        if (!sys_.make_filesystem(boot, FsType::Ext4, "BOOT")) {
            return fail("Could not create the boot filesystem on " + boot);
        }
    }

    struct Pending {
        layout::VolumeSpec volume;
        LuksParams params;
        const char* generation;
    };
    const Pending volumes[] = {
        {layout::root_volume(target_), root_params(), "LUKS1"},
        {layout::home_volume(target_), home_params(), "LUKS2"},
    };

    for (const auto& pending : volumes) {
        const auto& volume = pending.volume;
        if (sys_.is_luks(volume.partition)) {
            tui::print_info(volume.name + " already LUKS formatted, skipping");
            continue;
        }
        tui::print_info("Formatting " + volume.name + " (" + volume.partition + ") with " +
                        pending.generation);
        if (!sys_.luks_format(volume.partition, pending.params, config_.encryption.passphrase)) {
            return fail("LUKS format of " + volume.partition + " failed");
        }
    }

    tui::print_success("Encrypted volumes formatted");
    return true;
}

bool Installer::open_volumes(RunContext& ctx) {
    for (const auto& volume : {layout::root_volume(target_), layout::home_volume(target_)}) {
        if (sys_.mapping_exists(volume.mapping)) {
            tui::print_info(volume.name + " already open");
        } else if (!sys_.luks_open(volume.partition, volume.mapping,
                                   config_.encryption.passphrase)) {
            return fail("Could not open " + volume.partition + " as " + volume.mapping);
        }
        hold_volume(ctx, volume.mapping);
    }
    tui::print_success("Encrypted volumes open");
    return true;
}

bool Installer::create_filesystems() {
    for (const auto& volume : {layout::root_volume(target_), layout::home_volume(target_)}) {
        const std::string device = layout::mapper_path(volume.mapping);
        if (sys_.has_filesystem(device)) continue;
        if (!sys_.make_filesystem(device, FsType::Ext4, volume.label)) {
            return fail("Could not create the " + volume.name + " filesystem on " + device);
        }
    }

    const std::string swap = target_.partition(layout::kSwapIndex);
    if (!sys_.has_filesystem(swap) && !sys_.make_filesystem(swap, FsType::Swap, "SWAP")) {
        tui::print_warning("Could not initialize swap on " + swap);
    }
    return true;
}

bool Installer::mount_filesystems(RunContext& ctx) {
    for (const auto& entry : layout::mount_plan(target_)) {
        const std::string path = in_target(entry.target);
        if (sys_.is_mounted(path)) {
            hold_mounts(ctx);
            continue;
        }
        if (!sys_.create_directories(path)) {
            return fail("Could not create mount point " + path);
        }
        if (!sys_.mount(entry.source, path)) {
            return fail("Failed to mount " + entry.source + " on " + path);
        }
        hold_mounts(ctx);
    }

    for (const char* dir : {"/dev", "/proc", "/sys", "/run", "/tmp"}) {
        if (!sys_.create_directories(in_target(dir))) {
            tui::print_warning("Could not create " + in_target(dir));
        }
    }

    const std::string swap = target_.partition(layout::kSwapIndex);
    if (sys_.swap_active(swap)) {
        hold_swap(ctx);
    } else if (sys_.swap_on(swap)) {
        hold_swap(ctx);
    } else {
        tui::print_warning("Failed to activate swap on " + swap);
    }

    tui::print_success("All filesystems mounted");
    return true;
}

bool Installer::bootstrap_system() {
    const std::string keys = in_target("/var/db/xbps/keys");
    if (!sys_.create_directories(keys) || !sys_.copy_path("/var/db/xbps/keys", keys)) {
        tui::print_warning("Could not copy XBPS keys");
    }

    std::vector<std::string> packages = config_.packages.base;
    packages.push_back(env_.musl ? "musl-locales" : "glibc-locales");
    packages.insert(packages.end(), config_.packages.extra.begin(), config_.packages.extra.end());

    tui::print_info("Installing " + std::to_string(packages.size()) + " packages from " +
                    env_.repository);
    if (!sys_.install_base_packages(mount_point_, env_.repository, packages)) {
        return fail("Bootstrap failed");
    }

    if (!sys_.copy_path("/etc/resolv.conf", in_target("/etc/resolv.conf"))) {
        tui::print_warning("Could not copy resolv.conf");
    }

    tui::print_success("Base system installed");
    return true;
}

std::string Installer::crypttab(const std::string& root_uuid, const std::string& home_uuid) const {
    std::ostringstream out;
    out << layout::kRootMapping << "  UUID=" << root_uuid << "  none  luks\n"
        << layout::kHomeMapping << "  UUID=" << home_uuid << "  " << layout::kKeyFile << "  luks\n"
        << "swap_crypt  " << target_.partition(layout::kSwapIndex)
        << "  /dev/urandom  swap,cipher=aes-xts-plain64,size=512\n";
    return out.str();
}

std::string Installer::grub_defaults(const std::string& root_uuid) const {
    std::ostringstream out;
    out << "GRUB_DEFAULT=0\n"
        << "GRUB_TIMEOUT=5\n"
        << "GRUB_DISTRIBUTOR=\"Void\"\n"
        << "GRUB_CMDLINE_LINUX_DEFAULT=\"loglevel=4 init_on_alloc=1 init_on_free=1 "
           "page_poison=1 slab_nomerge vsyscall=none pti=on\"\n"
        << "GRUB_CMDLINE_LINUX=\"rd.luks.uuid=" << root_uuid
        << " root=" << layout::mapper_path(layout::kRootMapping) << "\"\n"
        << "GRUB_ENABLE_CRYPTODISK=y\n";
    return out.str();
}

std::string Installer::chroot_script() const {
    const auto& install = config_.install;
    const std::string user = shell_quote(install.username);

    std::ostringstream out;
    out << "#!/bin/sh\n"
        << "set -eu\n"
        << "log() { printf '\\033[32m[CONFIG]\\033[0m %s\\n' \"$*\"; }\n\n"

        << "log 'Preparing account databases'\n"
        << "touch /etc/passwd /etc/shadow\n"
        << "chmod 644 /etc/passwd\n"
        << "chmod 600 /etc/shadow\n"
        << "pwconv\n\n"

        << "log 'Setting timezone'\n"
        << "ln -sf " << shell_quote("/usr/share/zoneinfo/" + install.timezone)
        << " /etc/localtime\n\n";

    if (!env_.musl) {
        out << "log 'Generating locales'\n"
            << "xbps-reconfigure -f glibc-locales\n\n";
    }

    out << "log 'Creating user'\n"
        << "id -u " << user << " >/dev/null 2>&1 || "
        << "useradd -m -G wheel,audio,video,input,kvm -s /bin/bash " << user << "\n\n";

    auto set_password = [&](const std::string& account, const std::string& password) {
        if (!password.empty()) {
            out << "printf '%s\\n' " << shell_quote(account + ":" + password) << " | chpasswd\n";
        } else {
            out << "echo " << shell_quote("Please set the password for " + account + ":") << "\n"
                << "until passwd " << shell_quote(account) << "; do sleep 1; done\n";
        }
    };
    out << "log 'Setting passwords'\n";
    set_password("root", install.root_password);
    set_password(install.username, install.user_password);

    out << "\nchmod 440 /etc/sudoers.d/wheel\n"
        << "chmod 700 " << layout::kKeyDir << "\n"
        << "chmod 000 " << layout::kKeyFile << "\n"
        << "log 'System configuration complete'\n";
    return out.str();
}

bool Installer::generate_configuration() {
    const auto root_uuid = sys_.filesystem_uuid(target_.partition(layout::kRootIndex));
    const auto home_uuid = sys_.filesystem_uuid(target_.partition(layout::kHomeIndex));
    if (!root_uuid || !home_uuid) {
        return fail("Could not read the LUKS header UUIDs");
    }

    const auto& install = config_.install;

    struct File {
        std::string path;
        std::string content;
        unsigned mode;
    };
    std::vector<File> files = {
        {"/etc/hostname", install.hostname + "\n", 0644},
        {"/etc/hosts",
         "127.0.0.1   localhost\n"
         "::1         localhost\n"
         "127.0.1.1   " + install.hostname + ".localdomain " + install.hostname + "\n", 0644},
        {"/etc/locale.conf", "LANG=" + install.locale + "\n", 0644},
        {"/etc/crypttab", crypttab(*root_uuid, *home_uuid), 0600},
        {"/etc/dracut.conf.d/10-crypt.conf",
         "hostonly=yes\n"
         "hostonly_cmdline=no\n"
         "compress=\"zstd\"\n"
         "add_dracutmodules+=\" crypt rootfs-block \"\n"
         "install_items+=\" /etc/crypttab \"\n", 0644},
        {"/etc/default/grub", grub_defaults(*root_uuid), 0644},
        {"/etc/sudoers.d/wheel",
         "%wheel ALL=(ALL:ALL) ALL\n"
         "Defaults timestamp_timeout=0\n", 0440},
        {kScriptPath, chroot_script(), 0700},
    };
    if (!env_.musl) {
        // Only the configured locale is generated
        std::string charset = "UTF-8";
        auto dot = install.locale.find('.');
        if (dot != std::string::npos) charset = install.locale.substr(dot + 1);
        files.push_back({"/etc/default/libc-locales", install.locale + " " + charset + "\n", 0644});
    }

    for (const auto& file : files) {
        const std::string path = in_target(file.path);
        auto slash = path.rfind('/');
        if (slash != std::string::npos && slash > 0 &&
            !sys_.create_directories(path.substr(0, slash))) {
            return fail("Could not create directory for " + path);
        }
        if (!sys_.write_file(path, file.content, file.mode)) {
            return fail("Failed to write " + path);
        }
    }

    const std::string key = in_target(layout::kKeyFile);
    if (sys_.path_exists(key)) {
        tui::print_info("Reusing existing key file " + key);
    } else if (!sys_.create_directories(in_target(layout::kKeyDir)) ||
               !sys_.write_random_key(key, layout::kKeyFileBytes)) {
        return fail("Could not create key file " + key);
    }

    tui::print_success("Configuration generated");
    return true;
}

bool Installer::prepare_chroot() {
    for (const auto& pseudo : layout::pseudo_mounts()) {
        const std::string path = in_target(pseudo.target);
        if (sys_.is_mounted(path)) continue;
        if (!sys_.create_directories(path) || !sys_.mount_pseudo(pseudo.kind, path)) {
            return fail("Could not prepare " + path + " for the chroot");
        }
    }

    if (!sys_.copy_path("/etc/resolv.conf", in_target("/etc/resolv.conf"))) {
        tui::print_warning("Could not copy resolv.conf");
    }
    return true;
}

void Installer::cleanup_chroot() {
    auto pseudo = layout::pseudo_mounts();
    for (auto it = pseudo.rbegin(); it != pseudo.rend(); ++it) {
        const std::string path = in_target(it->target);
        if (sys_.is_mounted(path) && !sys_.unmount(path, true)) {
            tui::print_warning("Could not unmount " + path);
        }
    }
}

bool Installer::run_chroot_configuration() {
    if (!prepare_chroot()) {
        return false;
    }

    bool ok = sys_.run_in_chroot(mount_point_, std::string("/bin/sh ") + kScriptPath);

    // The script may hold passwords
    if (!sys_.remove_file(in_target(kScriptPath))) {
        tui::print_warning("Could not remove " + in_target(kScriptPath));
    }
    cleanup_chroot();

    if (!ok) {
        return fail("Configuration script failed inside the chroot");
    }
    tui::print_success("System configured");
    return true;
}

bool Installer::enroll_key_file() {
    const std::string partition = target_.partition(layout::kHomeIndex);
    const std::string key = in_target(layout::kKeyFile);

    if (sys_.luks_has_key(partition, key)) {
        tui::print_info("Key file already enrolled");
        return true;
    }
    if (!sys_.luks_add_key(partition, key, config_.encryption.passphrase)) {
        tui::print_warning("Failed to add the key file to " + partition +
                           "; boot will prompt for the passphrase");
        return true;
    }
    tui::print_success("Key file enrolled");
    return true;
}

bool Installer::install_bootloader() {
    const std::string& id = config_.install.bootloader_id;
    if (sys_.install_bootloader(mount_point_, BootloaderMode::Primary, id)) {
        tui::print_success("GRUB installed");
        return true;
    }

    tui::print_warning("GRUB install failed, retrying with the removable fallback path");
    if (sys_.install_bootloader(mount_point_, BootloaderMode::Fallback, id)) {
        tui::print_success("GRUB installed to the fallback path");
        return true;
    }
    return fail("GRUB installation failed in both modes");
}

bool Installer::generate_boot_config() {
    if (!sys_.generate_boot_config(mount_point_)) {
        return fail("Could not generate the GRUB configuration and initramfs");
    }
    return true;
}

bool Installer::write_fstab() {
    std::ostringstream fstab;
    fstab << "# <device>  <dir>  <type>  <options>  <dump>  <pass>\n";

    for (const auto& entry : layout::mount_plan(target_)) {
        auto uuid = sys_.filesystem_uuid(entry.source);
        if (!uuid) {
            return fail("Could not read the UUID of " + entry.source);
        }
        fstab << "UUID=" << *uuid << "  " << entry.target << "  " << entry.fstype << "  "
              << entry.options << "  0  " << entry.pass << "\n";
    }
    fstab << "/dev/mapper/swap_crypt  none  swap  sw  0  0\n"
          << "tmpfs  /tmp  tmpfs  defaults,nosuid,nodev  0  0\n";

    if (!sys_.write_file(in_target("/etc/fstab"), fstab.str(), 0644)) {
        return fail("Failed to write " + in_target("/etc/fstab"));
    }
    tui::print_success("fstab generated");
    return true;
}

}  // namespace fortress
