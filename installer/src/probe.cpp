#include "probe.hpp"
#include "disk.hpp"
#include "tui.hpp"
#include <algorithm>
#include <iterator>

namespace fortress {

namespace {

// Argon2 memory is clamped to at least this much
constexpr uint64_t kMinMemoryKib = 1024 * 1024;

}  // namespace

bool CapabilityReport::ok() const {
    return std::none_of(checks.begin(), checks.end(),
        [](const Check& check) { return check.status == CheckStatus::Fail; });
}

std::vector<Check> CapabilityReport::failures() const {
    std::vector<Check> failed;
    std::copy_if(checks.begin(), checks.end(), std::back_inserter(failed),
        [](const Check& check) { return check.status == CheckStatus::Fail; });
    return failed;
}

const std::vector<std::string>& required_tools() {
    static const std::vector<std::string> tools = {
        "sfdisk", "wipefs", "cryptsetup", "mkfs.ext4", "mkfs.vfat", "mkswap",
        "blkid", "mount", "umount", "swapon", "swapoff", "xbps-install", "chroot"
    };
    return tools;
}

CapabilityReport probe(const System& sys, const Config& config) {
    CapabilityReport report;
    Environment& env = report.environment;

    env.root = sys.is_root();
    env.uefi = sys.is_uefi();
    env.musl = sys.is_musl();
    env.live = sys.is_live_environment();
    env.arch = sys.machine_arch();
    env.kernel = sys.kernel_release();
    env.memory_kib = sys.memory_total_kib().value_or(0);
    env.repository = env.musl ? config.packages.repository_musl : config.packages.repository;

    auto add = [&](const std::string& name, CheckStatus status, const std::string& detail) {
        report.checks.push_back({name, status, detail});
    };

    add("Privileges", env.root ? CheckStatus::Pass : CheckStatus::Fail,
        env.root ? "running as root" : "must be run as root");
    add("Firmware", env.uefi ? CheckStatus::Pass : CheckStatus::Fail,
        env.uefi ? "UEFI" : "UEFI mode not detected (BIOS boot is not supported)");

    for (const auto& tool : required_tools()) {
        if (!sys.has_tool(tool)) {
            add("Tool " + tool, CheckStatus::Fail, "not found in PATH");
        }
    }
    if (!sys.has_tool("partprobe")) {
        add("Tool partprobe", CheckStatus::Warn, "falling back to blockdev --rereadpt");
    }

    if (env.memory_kib == 0) {
        add("Memory", CheckStatus::Warn, "could not read total memory");
    } else if (env.memory_kib < kMinMemoryKib) {
        add("Memory", CheckStatus::Warn,
            disk::format_size(env.memory_kib * disk::KiB) +
            " is below the 1G argon2 floor, unlocking home may be slow");
    } else {
        add("Memory", CheckStatus::Pass, disk::format_size(env.memory_kib * disk::KiB));
    }

    add("Kernel", CheckStatus::Pass, env.kernel);
    add("Architecture", CheckStatus::Pass, env.arch);
    add("C library", CheckStatus::Pass, env.libc());
    add("Live environment", CheckStatus::Pass, env.live ? "yes" : "no");
    add("Repository", CheckStatus::Pass, env.repository);

    return report;
}

bool print_report(const CapabilityReport& report) {
    std::vector<std::string> lines;
    for (const auto& check : report.checks) {
        lines.push_back("[" + to_string(check.status) + "] " + check.name + ": " + check.detail);
    }
    tui::draw_box("System Check", lines);

    for (const auto& check : report.checks) {
        if (check.status == CheckStatus::Warn) {
            tui::print_warning(check.name + ": " + check.detail);
        } else if (check.status == CheckStatus::Fail) {
            tui::print_error(check.name + ": " + check.detail);
        }
    }
    return report.ok();
}

std::string to_string(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass: return "PASS";
        case CheckStatus::Warn: return "WARN";
        case CheckStatus::Fail: return "FAIL";
    }
    return "????";
}

}  // namespace fortress
