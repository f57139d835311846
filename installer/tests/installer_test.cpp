#include "checkpoint.hpp"
#include "context.hpp"
#include "detector.hpp"
#include "installer.hpp"
#include "layout.hpp"
#include "probe.hpp"

#include "fakes/FakeSystem.hpp"
#include "fakes/Scenarios.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>

using namespace fortress;
using namespace fortress::test;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

const std::vector<Action> kConfigureTail = {
    Action::GenerateConfiguration, Action::RunChrootConfiguration, Action::EnrollKeyFile,
    Action::InstallBootloader, Action::GenerateBootConfig, Action::WriteFstab
};

bool contains(const std::vector<Action>& actions, Action action) {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

class InstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        checkpoint_path_ = ::testing::TempDir() + "fortress-installer-" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".state";
        std::remove(checkpoint_path_.c_str());
        checkpoints_ = CheckpointStore(checkpoint_path_);
        config_.install.root_password = "root-secret";
        config_.install.user_password = "user-secret";
    }

    void TearDown() override {
        std::remove(checkpoint_path_.c_str());
    }

    Installer make_installer(uint64_t capacity = kDiskSize) {
        auto plan = disk::plan_for_capacity(capacity);
        env_ = probe(sys_, config_).environment;
        return Installer(config_, sys_, sda(capacity), plan.value_or(disk::PartitionPlan{}), env_,
                         checkpoints_);
    }

    RunResult run_detected(Installer& installer, RunContext& ctx, bool confirmed = false) {
        RunOptions options;
        options.confirmed = confirmed;
        return installer.run(installer.detect().phase, options, ctx);
    }

    Phase detect() {
        return StateDetector(sys_, sda(), kMountPoint).detect().phase;
    }

    static RunContext::CancelQuery never() {
        return [] { return false; };
    }

    FakeSystem sys_;
    Config config_;
    Environment env_;
    std::string checkpoint_path_;
    CheckpointStore checkpoints_{"unused"};
};

}  // namespace

TEST(plan_table, ready_and_fatal_phases_have_no_actions) {
    EXPECT_TRUE(plan_for(Phase::Ready).empty());
    EXPECT_TRUE(plan_for(Phase::NoDisk).empty());
    EXPECT_TRUE(plan_for(Phase::Error).empty());
}

TEST(plan_table, not_configured_runs_only_the_configure_tail) {
    EXPECT_EQ(plan_for(Phase::NotConfigured), kConfigureTail);
}

TEST(plan_table, every_working_row_ends_with_configuration) {
    for (int i = rank(Phase::NoPartitions); i <= rank(Phase::NotConfigured); ++i) {
        auto actions = plan_for(static_cast<Phase>(i));
        SCOPED_TRACE(to_string(static_cast<Phase>(i)));
        ASSERT_GE(actions.size(), kConfigureTail.size());
        EXPECT_TRUE(std::equal(kConfigureTail.begin(), kConfigureTail.end(),
                               actions.end() - kConfigureTail.size()));
        EXPECT_EQ(actions.back(), Action::WriteFstab);
    }
}

TEST(plan_table, destructive_actions_only_where_their_target_is_missing) {
    for (int i = rank(Phase::NoDisk); i <= rank(Phase::Ready); ++i) {
        Phase phase = static_cast<Phase>(i);
        auto actions = plan_for(phase);
        SCOPED_TRACE(to_string(phase));
        EXPECT_EQ(contains(actions, Action::CreatePartitions), phase == Phase::NoPartitions);
        EXPECT_EQ(contains(actions, Action::FormatVolumes),
                  phase == Phase::NoPartitions || phase == Phase::NotEncrypted ||
                  phase == Phase::PartialEncrypted);
    }
}

TEST(plan_table, rows_follow_the_dispatch_table) {
    EXPECT_THAT(plan_for(Phase::NoPartitions),
                ::testing::IsSupersetOf({Action::CreatePartitions, Action::FormatVolumes,
                                         Action::OpenVolumes, Action::CreateFilesystems,
                                         Action::MountFilesystems, Action::BootstrapSystem}));
    EXPECT_EQ(plan_for(Phase::VolumesClosed), plan_for(Phase::RootOpenHomeClosed));
    EXPECT_THAT(plan_for(Phase::VolumesClosed), Contains(Action::BootstrapIfAbsent));
    EXPECT_THAT(plan_for(Phase::VolumesClosed), Contains(Action::CreateFilesystems));
    EXPECT_THAT(plan_for(Phase::NoRootFilesystem), Contains(Action::BootstrapSystem));
    EXPECT_THAT(plan_for(Phase::NotMounted),
                ElementsAre(Action::MountFilesystems, Action::BootstrapIfAbsent,
                            Action::GenerateConfiguration, Action::RunChrootConfiguration,
                            Action::EnrollKeyFile, Action::InstallBootloader,
                            Action::GenerateBootConfig, Action::WriteFstab));
    EXPECT_EQ(plan_for(Phase::NotMounted), plan_for(Phase::PartialMount));
    EXPECT_THAT(plan_for(Phase::NoSystem), Not(Contains(Action::MountFilesystems)));
}

TEST(argon2, memory_is_three_quarters_of_ram_clamped) {
    const uint64_t gib_kib = 1024 * 1024;
    EXPECT_EQ(argon2_memory_kib(2 * gib_kib), 1536 * 1024u);
    EXPECT_EQ(argon2_memory_kib(8 * gib_kib), 4 * gib_kib);
    EXPECT_EQ(argon2_memory_kib(512 * 1024), gib_kib);
    EXPECT_EQ(argon2_memory_kib(0), gib_kib);
}

TEST_F(InstallerTest, fresh_disk_reaches_ready) {
    blank_disk(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx, true);

    ASSERT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_EQ(result.phase, Phase::Ready);
    EXPECT_EQ(detect(), Phase::Ready);

    ASSERT_EQ(sys_.last_specs.size(), 5u);
    EXPECT_FALSE(sys_.last_specs.back().size_bytes.has_value());
    EXPECT_EQ(sys_.last_specs.back().label, "HOME");

    EXPECT_EQ(sys_.formatted_with[part(layout::kRootIndex)].generation, LuksGeneration::Luks1);
    EXPECT_EQ(sys_.formatted_with[part(layout::kHomeIndex)].generation, LuksGeneration::Luks2);
    EXPECT_EQ(sys_.formatted_with[part(layout::kHomeIndex)].memory_kib, 4ULL * 1024 * 1024);

    EXPECT_THAT(sys_.installed_packages, Contains("base-system"));
    EXPECT_THAT(sys_.installed_packages, Contains("glibc-locales"));
    EXPECT_THAT(sys_.chroot_commands, ElementsAre("/bin/sh /configure.sh"));
    EXPECT_EQ(sys_.files.count("/mnt/configure.sh"), 0u);
    EXPECT_EQ(sys_.files["/mnt/etc/keys/home.key"].size(), layout::kKeyFileBytes);
    EXPECT_EQ(sys_.modes["/mnt/etc/keys/home.key"], 0u);
    EXPECT_EQ(sys_.enrolled.count(part(layout::kHomeIndex)), 1u);
    EXPECT_EQ(sys_.enrolled.count(part(layout::kRootIndex)), 0u);
    EXPECT_TRUE(sys_.swap_active(part(layout::kSwapIndex)));

    auto saved = checkpoints_.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->phase, Phase::Ready);
    EXPECT_EQ(saved->disk, kDisk);

    ctx.disarm();
}

TEST_F(InstallerTest, fstab_is_written_last_with_uuids) {
    blank_disk(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    ASSERT_EQ(run_detected(installer, ctx, true).outcome, Outcome::Success);

    const std::string& fstab = sys_.files["/mnt/etc/fstab"];
    EXPECT_THAT(fstab, HasSubstr("  /  ext4  defaults,noatime  0  1"));
    EXPECT_THAT(fstab, HasSubstr("/boot/efi  vfat"));
    EXPECT_THAT(fstab, HasSubstr("/dev/mapper/swap_crypt  none  swap"));
    EXPECT_EQ(sys_.calls.back(), "write_file /mnt/etc/fstab");
    ctx.disarm();
}

TEST_F(InstallerTest, destructive_run_requires_confirmation) {
    blank_disk(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx, false);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_THAT(installer.get_error(), HasSubstr("confirmation"));
    EXPECT_EQ(sys_.count_calls("create_partitions"), 0);
    EXPECT_EQ(sys_.count_calls("wipe_signatures"), 0);
    EXPECT_EQ(detect(), Phase::NoPartitions);

    auto saved = checkpoints_.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->phase, Phase::Error);
}

TEST_F(InstallerTest, missing_disk_is_fatal) {
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx, true);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_EQ(result.phase, Phase::Error);
    EXPECT_THAT(result.detail, HasSubstr("not found"));
    EXPECT_TRUE(sys_.calls.empty());
}

TEST_F(InstallerTest, too_small_disk_fails_closed) {
    sys_.add_disk(kDisk, 10 * disk::GiB);
    Installer installer = make_installer(10 * disk::GiB);
    RunContext ctx(never());

    RunResult result = installer.run(Phase::NoPartitions, RunOptions{true}, ctx);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_EQ(sys_.count_calls("create_partitions"), 0);
}

TEST_F(InstallerTest, ready_needs_no_action) {
    configured(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Success);
    EXPECT_EQ(result.phase, Phase::Ready);
    EXPECT_TRUE(sys_.calls.empty());
    ctx.disarm();
}

// Volumes open with filesystems, nothing mounted
TEST_F(InstallerTest, not_mounted_mounts_bootstraps_and_configures) {
    with_filesystems(sys_);
    ASSERT_EQ(detect(), Phase::NotMounted);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx, false);

    ASSERT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_EQ(detect(), Phase::Ready);
    EXPECT_EQ(sys_.count_calls("create_partitions"), 0);
    EXPECT_EQ(sys_.count_calls("luks_format"), 0);
    EXPECT_EQ(sys_.count_calls("make_filesystem"), 0);
    EXPECT_EQ(sys_.count_calls("install_base_packages"), 1);
    ctx.disarm();
}

TEST_F(InstallerTest, not_mounted_fails_when_mount_fails) {
    with_filesystems(sys_);
    sys_.failing.insert("mount");
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_EQ(sys_.count_calls("install_base_packages"), 0);
    EXPECT_EQ(detect(), Phase::NotMounted);
    ctx.disarm();
}

// ROOT formatted, open and with a filesystem; HOME never formatted
TEST_F(InstallerTest, partial_encryption_formats_only_home) {
    partitioned(sys_);
    sys_.seed_luks(part(layout::kRootIndex));
    sys_.seed_open(part(layout::kRootIndex), layout::kRootMapping);
    sys_.seed_filesystem(mapper(layout::kRootMapping), "ext4");
    ASSERT_EQ(detect(), Phase::PartialEncrypted);

    Installer installer = make_installer();
    RunContext ctx(never());
    RunResult result = run_detected(installer, ctx, true);

    ASSERT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_EQ(sys_.count_calls("luks_format " + part(layout::kRootIndex)), 0);
    EXPECT_EQ(sys_.count_calls("luks_format " + part(layout::kHomeIndex)), 1);
    EXPECT_EQ(sys_.count_calls("make_filesystem " + mapper(layout::kRootMapping)), 0);
    EXPECT_EQ(sys_.count_calls("make_filesystem " + mapper(layout::kHomeMapping)), 1);
    EXPECT_EQ(sys_.count_calls("make_filesystem " + part(layout::kEfiIndex)), 0);
    EXPECT_EQ(detect(), Phase::Ready);
    ctx.disarm();
}

TEST_F(InstallerTest, existing_base_system_is_not_bootstrapped_again) {
    encrypted(sys_);
    sys_.seed_filesystem(mapper(layout::kRootMapping), "ext4");
    sys_.seed_filesystem(mapper(layout::kHomeMapping), "ext4");
    sys_.seed_file("/mnt/usr/bin/sh");
    sys_.directories.insert("/mnt/etc");
    ASSERT_EQ(detect(), Phase::VolumesClosed);

    Installer installer = make_installer();
    RunContext ctx(never());
    RunResult result = run_detected(installer, ctx);

    ASSERT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_EQ(sys_.count_calls("luks_open"), 2);
    EXPECT_EQ(sys_.count_calls("install_base_packages"), 0);
    ctx.disarm();
}

TEST_F(InstallerTest, runs_are_monotone) {
    void (*stages[])(FakeSystem&) = {
        blank_disk, partitioned, encrypted, opened, with_filesystems, mounted, installed, configured
    };

    for (auto seed : stages) {
        FakeSystem sys;
        seed(sys);
        Phase before = StateDetector(sys, sda(), kMountPoint).detect().phase;
        SCOPED_TRACE(to_string(before));

        Environment env = probe(sys, config_).environment;
        CheckpointStore checkpoints(checkpoint_path_);
        Installer installer(config_, sys, sda(), *disk::plan_for_capacity(kDiskSize), env,
                            checkpoints);
        RunContext ctx(never());
        RunResult result = installer.run(before, RunOptions{true}, ctx);
        ctx.disarm();

        Phase after = StateDetector(sys, sda(), kMountPoint).detect().phase;
        EXPECT_EQ(result.outcome, Outcome::Success) << result.detail;
        EXPECT_GE(rank(after), rank(before));
        EXPECT_EQ(after, Phase::Ready);
    }
}

TEST_F(InstallerTest, rerunning_configuration_is_idempotent) {
    installed(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    ASSERT_EQ(installer.run(Phase::NotConfigured, RunOptions{}, ctx).outcome, Outcome::Success);
    std::string key = sys_.files["/mnt/etc/keys/home.key"];
    ASSERT_EQ(installer.run(Phase::NotConfigured, RunOptions{}, ctx).outcome, Outcome::Success);

    EXPECT_EQ(sys_.files["/mnt/etc/keys/home.key"], key);
    EXPECT_EQ(sys_.count_calls("write_random_key"), 1);
    EXPECT_EQ(sys_.count_calls("luks_add_key"), 1);
    ctx.disarm();
}

TEST_F(InstallerTest, bootloader_falls_back_to_removable_path) {
    installed(sys_);
    sys_.failing.insert("install_bootloader:primary");
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_EQ(sys_.count_calls("install_bootloader:fallback"), 1);
    ctx.disarm();
}

TEST_F(InstallerTest, bootloader_failing_in_both_modes_aborts_before_fstab) {
    installed(sys_);
    sys_.failing.insert("install_bootloader:primary");
    sys_.failing.insert("install_bootloader:fallback");
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    EXPECT_THAT(result.detail, HasSubstr("GRUB"));
    EXPECT_EQ(sys_.count_calls("generate_boot_config"), 0);
    EXPECT_EQ(detect(), Phase::NotConfigured);
    EXPECT_EQ(result.phase, Phase::Error);
    EXPECT_EQ(result.last_detected, Phase::NotConfigured);

    auto saved = checkpoints_.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->phase, Phase::Error);
    EXPECT_THAT(saved->detail, HasSubstr("Install bootloader"));
    ctx.disarm();
}

TEST_F(InstallerTest, swap_activation_failure_is_soft) {
    with_filesystems(sys_);
    sys_.failing.insert("swap_on");
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_FALSE(sys_.swap_active(part(layout::kSwapIndex)));
    ctx.disarm();
}

TEST_F(InstallerTest, key_enrollment_failure_is_soft) {
    installed(sys_);
    sys_.failing.insert("luks_add_key");
    Installer installer = make_installer();
    RunContext ctx(never());

    EXPECT_EQ(run_detected(installer, ctx).outcome, Outcome::Success);
    EXPECT_EQ(detect(), Phase::Ready);
    ctx.disarm();
}

TEST_F(InstallerTest, failed_chroot_still_cleans_up_pseudo_mounts) {
    installed(sys_);
    sys_.failing.insert("run_in_chroot");
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Failed);
    for (const char* path : {"/mnt/dev", "/mnt/proc", "/mnt/sys", "/mnt/run"}) {
        EXPECT_FALSE(sys_.is_mounted(path)) << path;
    }
    EXPECT_EQ(sys_.files.count("/mnt/configure.sh"), 0u);
    ctx.disarm();
}

TEST_F(InstallerTest, cancellation_between_actions_releases_everything) {
    encrypted(sys_);
    sys_.seed_filesystem(mapper(layout::kRootMapping), "ext4");
    sys_.seed_filesystem(mapper(layout::kHomeMapping), "ext4");

    bool cancel = false;
    sys_.on_call = [&](const std::string& call) {
        if (call == "swap_on " + part(layout::kSwapIndex)) cancel = true;
    };

    Installer installer = make_installer();
    RunContext ctx([&] { return cancel; });
    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_EQ(sys_.count_calls("install_base_packages"), 0);
    EXPECT_THAT(ctx.held(), Contains("swap " + part(layout::kSwapIndex)));

    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_TRUE(sys_.mounts.empty());
    EXPECT_TRUE(sys_.mappings.empty());
    EXPECT_TRUE(sys_.swaps.empty());

    auto saved = checkpoints_.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->phase, Phase::NoSystem);
    EXPECT_THAT(saved->detail, HasSubstr("Interrupted"));
}

TEST_F(InstallerTest, adopted_mounts_come_down_before_the_volumes_under_them) {
    with_filesystems(sys_);
    sys_.mappings.clear();
    sys_.seed_mount(part(layout::kBootIndex), "/mnt/boot");

    bool cancel = false;
    sys_.on_call = [&](const std::string& call) {
        if (call == "swap_on " + part(layout::kSwapIndex)) cancel = true;
    };

    Installer installer = make_installer();
    RunContext ctx([&] { return cancel; });
    installer.adopt_existing(ctx);
    ASSERT_THAT(ctx.held(), ElementsAre("mounts /mnt"));

    RunResult result = run_detected(installer, ctx);

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_THAT(ctx.held(), ElementsAre("mounts /mnt", "volume root_crypt", "volume home_crypt",
                                        "swap " + part(layout::kSwapIndex)));
    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_TRUE(sys_.mounts.empty());
    EXPECT_TRUE(sys_.mappings.empty());
    EXPECT_TRUE(sys_.swaps.empty());
}

TEST_F(InstallerTest, bring_up_mounts_without_formatting) {
    with_filesystems(sys_);
    sys_.mappings.clear();
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = installer.bring_up(Access::Mount, ctx);

    EXPECT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_TRUE(sys_.is_mounted(kMountPoint));
    EXPECT_EQ(sys_.count_calls("luks_format"), 0);
    EXPECT_EQ(sys_.count_calls("make_filesystem"), 0);
    EXPECT_EQ(sys_.count_calls("mount_pseudo"), 0);
    EXPECT_EQ(result.last_detected, result.phase);
    ctx.release_all();
}

TEST_F(InstallerTest, bring_up_stops_between_steps_when_interrupted) {
    encrypted(sys_);
    sys_.seed_filesystem(mapper(layout::kRootMapping), "ext4");
    sys_.seed_filesystem(mapper(layout::kHomeMapping), "ext4");

    bool cancel = false;
    sys_.on_call = [&](const std::string& call) {
        if (call == std::string("luks_open ") + layout::kHomeMapping) cancel = true;
    };

    Installer installer = make_installer();
    RunContext ctx([&] { return cancel; });
    RunResult result = installer.bring_up(Access::Chroot, ctx);

    EXPECT_EQ(result.outcome, Outcome::Cancelled);
    EXPECT_THAT(result.detail, HasSubstr("Interrupted"));
    EXPECT_EQ(sys_.count_calls("mount "), 0);
    EXPECT_EQ(sys_.count_calls("mount_pseudo"), 0);
    EXPECT_THAT(ctx.held(), ElementsAre("volume root_crypt", "volume home_crypt"));

    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_TRUE(sys_.mappings.empty());
}

TEST_F(InstallerTest, bring_up_needs_encrypted_volumes_and_a_system) {
    partitioned(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult nothing = installer.bring_up(Access::Open, ctx);
    EXPECT_EQ(nothing.outcome, Outcome::Failed);
    EXPECT_THAT(nothing.detail, HasSubstr("Nothing to open"));
    EXPECT_EQ(nothing.last_detected, Phase::NotEncrypted);
    EXPECT_EQ(sys_.count_calls("luks_open"), 0);

    FakeSystem empty;
    with_filesystems(empty);
    Installer bare(config_, empty, sda(), disk::PartitionPlan{}, env_, checkpoints_);
    RunResult no_system = bare.bring_up(Access::Chroot, ctx);
    EXPECT_EQ(no_system.outcome, Outcome::Failed);
    EXPECT_THAT(no_system.detail, HasSubstr("No system installed"));
    EXPECT_EQ(empty.count_calls("mount_pseudo"), 0);
    ctx.disarm();
}

TEST_F(InstallerTest, bring_up_prepares_the_chroot) {
    installed(sys_);
    Installer installer = make_installer();
    RunContext ctx(never());

    RunResult result = installer.bring_up(Access::Chroot, ctx);

    EXPECT_EQ(result.outcome, Outcome::Success) << result.detail;
    EXPECT_TRUE(sys_.is_mounted("/mnt/proc"));
    installer.cleanup_chroot();
    EXPECT_FALSE(sys_.is_mounted("/mnt/proc"));
    ctx.disarm();
}

TEST_F(InstallerTest, adopts_resources_that_are_already_active) {
    mounted(sys_);
    sys_.swaps.insert(part(layout::kSwapIndex));
    Installer installer = make_installer();
    RunContext ctx(never());

    installer.adopt_existing(ctx);

    EXPECT_THAT(ctx.held(), ElementsAre("volume root_crypt", "volume home_crypt",
                                        "mounts /mnt", "swap /dev/sda3"));
    EXPECT_EQ(ctx.release_all(), 0);
    EXPECT_TRUE(sys_.mounts.empty());
    EXPECT_TRUE(sys_.mappings.empty());
    EXPECT_TRUE(sys_.swaps.empty());
}

TEST_F(InstallerTest, context_destructor_releases_unless_disarmed) {
    with_filesystems(sys_);
    Installer installer = make_installer();
    {
        RunContext ctx(never());
        ASSERT_TRUE(installer.mount_filesystems(ctx));
        ctx.disarm();
    }
    EXPECT_TRUE(sys_.is_mounted(kMountPoint));
    {
        RunContext ctx(never());
        installer.adopt_existing(ctx);
    }
    EXPECT_FALSE(sys_.is_mounted(kMountPoint));
    EXPECT_TRUE(sys_.mappings.empty());
}

TEST_F(InstallerTest, generated_configuration_describes_the_volumes) {
    installed(sys_);
    config_.install.hostname = "vault";
    config_.install.user_password.clear();
    Installer installer = make_installer();

    ASSERT_TRUE(installer.generate_configuration()) << installer.get_error();

    const std::string root_uuid = *sys_.filesystem_uuid(part(layout::kRootIndex));
    const std::string home_uuid = *sys_.filesystem_uuid(part(layout::kHomeIndex));
    EXPECT_THAT(sys_.files["/mnt/etc/crypttab"],
                HasSubstr("root_crypt  UUID=" + root_uuid + "  none  luks"));
    EXPECT_THAT(sys_.files["/mnt/etc/crypttab"],
                HasSubstr("home_crypt  UUID=" + home_uuid + "  /etc/keys/home.key  luks"));
    EXPECT_THAT(sys_.files["/mnt/etc/dracut.conf.d/10-crypt.conf"], Not(HasSubstr(".key")));
    for (const auto& file : sys_.files) {
        EXPECT_THAT(file.first, Not(HasSubstr("/mnt/boot/"))) << "secret material on /boot";
    }
    EXPECT_THAT(sys_.files["/mnt/etc/default/grub"], HasSubstr("rd.luks.uuid=" + root_uuid));
    EXPECT_THAT(sys_.files["/mnt/etc/default/grub"], HasSubstr("GRUB_ENABLE_CRYPTODISK=y"));
    EXPECT_EQ(sys_.files["/mnt/etc/hostname"], "vault\n");
    EXPECT_EQ(sys_.modes["/mnt/etc/sudoers.d/wheel"], 0440u);

    const std::string& script = sys_.files["/mnt/configure.sh"];
    EXPECT_THAT(script, HasSubstr("printf '%s\\n' 'root:root-secret' | chpasswd"));
    EXPECT_THAT(script, HasSubstr("until passwd 'nx'"));
    EXPECT_THAT(script, HasSubstr("xbps-reconfigure -f glibc-locales"));
}

TEST_F(InstallerTest, musl_hosts_use_musl_repository_and_locales) {
    installed(sys_);
    sys_.musl = true;
    sys_.files.erase("/mnt/usr/bin/sh");
    Installer installer = make_installer();
    RunContext ctx(never());

    ASSERT_EQ(run_detected(installer, ctx).outcome, Outcome::Success);

    EXPECT_EQ(sys_.last_repository, config_.packages.repository_musl);
    EXPECT_THAT(sys_.installed_packages, Contains("musl-locales"));
    EXPECT_THAT(sys_.installed_packages, Not(Contains("glibc-locales")));
    ctx.disarm();
}
