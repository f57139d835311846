#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "checkpoint.hpp"
#include "config.hpp"
#include "context.hpp"
#include "detector.hpp"
#include "disk.hpp"
#include "phase.hpp"
#include "probe.hpp"
#include "system.hpp"

namespace fortress {

// One idempotent step toward a bootable system. Every body checks the live
// state before acting, so any action may run again after an interruption.
enum class Action {
    CreatePartitions,
    FormatVolumes,
    OpenVolumes,
    CreateFilesystems,
    MountFilesystems,
    BootstrapSystem,
    BootstrapIfAbsent,
    GenerateConfiguration,
    RunChrootConfiguration,
    EnrollKeyFile,
    InstallBootloader,
    GenerateBootConfig,
    WriteFstab
};

std::string to_string(Action action);

// Actions that destroy data if pointed at the wrong disk
bool is_destructive(Action action);

// Ordered actions that take a system in `phase` to Ready. Empty for Ready
// and for the phases no action can fix (see is_fatal()).
std::vector<Action> plan_for(Phase phase);

struct RunOptions {
    bool confirmed = false;      // operator approved destructive actions
};

enum class Outcome {
    Success,
    Failed,
    Cancelled
};

struct RunResult {
    Outcome outcome = Outcome::Failed;
    Phase phase = Phase::Error;  // last detected phase, Error on failure
    std::string detail;
    Phase last_detected = Phase::Error;  // what the detector last saw, also on failure
};

// How far `open`, `mount` and `shell` bring an existing installation up
enum class Access {
    Open,
    Mount,
    Chroot
};

// 3/4 of RAM clamped to [1 GiB, 4 GiB], in KiB
uint64_t argon2_memory_kib(uint64_t total_memory_kib);

// Drives a detected phase to Ready. After every action the detector is
// re-run and its result recorded as the checkpoint.
class Installer {
public:
    Installer(const Config& config, System& sys, const disk::TargetDisk& target,
              const disk::PartitionPlan& plan, const Environment& env,
              CheckpointStore& checkpoints);

    Detection detect() const;

    RunResult run(Phase phase, const RunOptions& options, RunContext& ctx);

    // Non-destructive: opens, mounts and prepares the chroot as far as
    // `level` asks, stopping between steps once the context is cancelled
    RunResult bring_up(Access level, RunContext& ctx);

    // Register release callbacks for mappings, mounts and swap that are
    // already active, so a cancelled run also releases them
    void adopt_existing(RunContext& ctx);

    // Individual actions
    bool perform(Action action, RunContext& ctx);
    bool create_partitions();
    bool format_volumes();
    bool open_volumes(RunContext& ctx);
    bool create_filesystems();
    bool mount_filesystems(RunContext& ctx);
    bool bootstrap_system();
    bool generate_configuration();
    bool run_chroot_configuration();
    bool enroll_key_file();
    bool install_bootloader();
    bool generate_boot_config();
    bool write_fstab();

    // Pseudo filesystems and resolv.conf for commands run inside the target
    bool prepare_chroot();
    void cleanup_chroot();

    LuksParams root_params() const;
    LuksParams home_params() const;

    // Get error message if an action failed
    std::string get_error() const { return error_message_; }

private:
    const Config& config_;
    System& sys_;
    disk::TargetDisk target_;
    disk::PartitionPlan plan_;
    Environment env_;
    CheckpointStore& checkpoints_;
    std::string mount_point_;
    std::string error_message_;
    Phase last_detected_ = Phase::Error;

    std::string in_target(const std::string& path) const;
    bool fail(const std::string& message);
    void hold_volume(RunContext& ctx, const std::string& mapping);
    void hold_mounts(RunContext& ctx);
    void hold_swap(RunContext& ctx);
    RunResult finish(Outcome outcome, Phase phase, const std::string& detail);

    std::string chroot_script() const;
    std::string crypttab(const std::string& root_uuid, const std::string& home_uuid) const;
    std::string grub_defaults(const std::string& root_uuid) const;
};

}  // namespace fortress
