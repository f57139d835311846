#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <csignal>
#include <ctime>
#include <toml.hpp>

#include "checkpoint.hpp"
#include "config.hpp"
#include "context.hpp"
#include "disk.hpp"
#include "installer.hpp"
#include "layout.hpp"
#include "probe.hpp"
#include "signals.hpp"
#include "system.hpp"
#include "teardown.hpp"
#include "tui.hpp"

using namespace fortress;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitInterrupted = 130;

struct Options {
    std::string command = "install";
    std::string config_path;
    std::string disk;
    bool yes = false;
    bool custom = false;
};

void print_usage(const char* program) {
    std::cout << "\n";
    std::cout << tui::colors::BOLD << "Usage:" << tui::colors::RESET << "\n";
    std::cout << "  " << program << " [options] [command]\n\n";
    std::cout << tui::colors::BOLD << "Commands:" << tui::colors::RESET << "\n";
    std::cout << "  install        Detect the current state and run to completion (default)\n";
    std::cout << "  resume         Same as install\n";
    std::cout << "  status         Show the checkpoint and the detected state\n";
    std::cout << "  debug          System check, detected state and status\n";
    std::cout << "  plan           Show the partition layout for the target disk\n";
    std::cout << "  open           Open the encrypted volumes\n";
    std::cout << "  mount          Open the volumes and mount the target\n";
    std::cout << "  shell, chroot  Interactive shell inside the target\n";
    std::cout << "  clean          Unmount everything and close the volumes\n\n";
    std::cout << tui::colors::BOLD << "Options:" << tui::colors::RESET << "\n";
    std::cout << "  --config PATH  Configuration file\n";
    std::cout << "  --disk DEV     Target disk (overrides config and DISK)\n";
    std::cout << "  --yes, -y      Confirm destructive steps without asking\n";
    std::cout << "  --custom       Enter partition sizes interactively\n";
    std::cout << "  --help, -h     Show this help message\n";
    std::cout << "  --version, -v  Show version information\n\n";
    std::cout << tui::colors::BOLD << "Examples:" << tui::colors::RESET << "\n";
    std::cout << "  " << program << "                          # Install with defaults\n";
    std::cout << "  " << program << " --config fortress.toml   # Use config file\n";
    std::cout << "  " << program << " status                   # Where did we stop?\n";
    std::cout << "\n";
}

std::string select_config_file() {
    std::vector<std::string> config_paths = {
        "/etc/fortress/config.toml",
        "/root/fortress.toml",
        "./fortress.toml"
    };

    for (const auto& path : config_paths) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }

    return "";
}

bool is_command(const std::string& arg) {
    static const std::vector<std::string> commands = {
        "install", "resume", "status", "debug", "plan", "open", "mount", "shell", "chroot", "clean"
    };
    for (const auto& command : commands) {
        if (arg == command) return true;
    }
    return false;
}

std::string format_time(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm local{};
    localtime_r(&time, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

// Configured disk, else the first well-known device, else ask
std::optional<disk::TargetDisk> resolve_target(const System& sys, const Config& config,
                                               bool interactive) {
    std::string device = config.install.disk;
    if (device.empty()) {
        if (auto found = disk::auto_select_disk(sys, "")) {
            device = *found;
        } else if (interactive) {
            auto selected = tui::select_disk(sys.list_disks());
            if (!selected) return std::nullopt;
            device = selected->device;
        } else {
            return std::nullopt;
        }
    }
    return disk::TargetDisk::from_device(device, sys.disk_capacity(device).value_or(0));
}

void ask_custom_sizes(Config& config, const disk::PartitionPlan& defaults) {
    tui::print_info("Custom partition sizes (HOME takes the rest)");
    auto ask = [&](const char* name, std::size_t index, std::optional<std::string>& out) {
        std::string current = out.value_or(disk::format_size(*defaults.regions[index].size_bytes));
        out = tui::input(std::string(name) + " size", current);
    };
    ask("EFI", 0, config.partitions.efi);
    ask("BOOT", 1, config.partitions.boot);
    ask("SWAP", 2, config.partitions.swap);
    ask("ROOT", 3, config.partitions.root);
}

std::optional<disk::PartitionPlan> make_plan(Config& config, const disk::TargetDisk& target,
                                             bool custom) {
    std::string reason;
    auto plan = disk::plan_for_capacity(target.capacity_bytes, &reason);
    if (!plan) {
        tui::print_error("Cannot plan " + target.device + ": " + reason);
        return std::nullopt;
    }

    if (custom) {
        ask_custom_sizes(config, *plan);
    }
    if (config.partitions.any()) {
        plan = disk::plan_custom(target.capacity_bytes, config.partitions, &reason);
        if (!plan) {
            tui::print_error("Custom sizes rejected: " + reason);
            return std::nullopt;
        }
    }
    return plan;
}

void show_detection(const Detection& detection) {
    tui::print_info("Current state: " + to_string(detection.phase));
    tui::print_info("Details: " + detection.detail);
}

int show_status(const System& sys, const Config& config, const disk::TargetDisk& target) {
    CheckpointStore checkpoints(config.paths.checkpoint);
    StateDetector detector(sys, target, config.paths.mount_point);
    Detection detection = detector.detect();

    std::vector<std::string> lines = {
        "Disk:       " + target.device + " (" + disk::format_size(target.capacity_bytes) + ")",
        "Detected:   " + to_string(detection.phase),
        "            " + detection.detail,
    };

    auto checkpoint = checkpoints.load();
    if (checkpoint) {
        lines.push_back("Checkpoint: " + to_string(checkpoint->phase) + " at " +
                        format_time(checkpoint->timestamp));
        if (!checkpoint->detail.empty()) {
            lines.push_back("            " + checkpoint->detail);
        }
    } else {
        lines.push_back("Checkpoint: none (" + checkpoints.path() + ")");
    }

    lines.push_back(std::string("Volumes:    ") +
                    (sys.mapping_exists(layout::kRootMapping) ? "root open" : "root closed") + ", " +
                    (sys.mapping_exists(layout::kHomeMapping) ? "home open" : "home closed"));
    lines.push_back(std::string("Mounted:    ") +
                    (sys.is_mounted(config.paths.mount_point) ? "yes" : "no"));

    tui::draw_box("Status", lines);

    // The checkpoint is only a log; the detector is authoritative
    if (checkpoint && checkpoint->phase != Phase::Error && checkpoint->phase != detection.phase) {
        tui::print_warning("Checkpoint (" + to_string(checkpoint->phase) +
                           ") disagrees with the live state (" + to_string(detection.phase) + ")");
    }
    return kExitOk;
}

int run_debug(const System& sys, Config& config, const disk::TargetDisk& target) {
    auto report = probe(sys, config);
    print_report(report);

    show_detection(StateDetector(sys, target, config.paths.mount_point).detect());

    std::string reason;
    if (auto plan = disk::plan_for_capacity(target.capacity_bytes, &reason)) {
        tui::draw_box("Partition Plan", disk::describe(*plan, target.capacity_bytes));
    } else {
        tui::print_warning("No valid plan: " + reason);
    }

    show_status(sys, config, target);
    return report.ok() ? kExitOk : kExitFatal;
}

int run_plan(Config& config, const disk::TargetDisk& target, bool custom) {
    auto plan = make_plan(config, target, custom);
    if (!plan) return kExitFatal;
    tui::draw_box("Partition Plan", disk::describe(*plan, target.capacity_bytes));
    return kExitOk;
}

int run_clean(System& sys, const Config& config, const disk::TargetDisk& target,
              const Options& options) {
    if (!options.yes &&
        !tui::confirm("Unmount " + config.paths.mount_point + " and close the encrypted volumes?",
                      false)) {
        tui::print_info("Cleanup cancelled");
        return kExitOk;
    }

    tui::print_info("Running cleanup...");
    TeardownReconciler teardown(sys, target, config.paths.mount_point);
    auto report = teardown.run();
    if (!report.ok()) {
        tui::print_error("Cleanup incomplete");
        return kExitFatal;
    }
    tui::print_success("Cleanup complete (" + std::to_string(report.effective_operations()) +
                       " operations)");
    return kExitOk;
}

// open, mount and shell: bring the existing installation up without
// touching anything destructive
int run_access(const std::string& command, System& sys, const Config& config,
               const disk::TargetDisk& target, const Environment& env) {
    CheckpointStore checkpoints(config.paths.checkpoint);
    Installer installer(config, sys, target, disk::PartitionPlan{}, env, checkpoints);
    RunContext ctx;
    // What was brought up stays up unless interrupted
    ctx.disarm();

    Access level = Access::Chroot;
    if (command == "open") level = Access::Open;
    else if (command == "mount") level = Access::Mount;

    RunResult result = installer.bring_up(level, ctx);
    switch (result.outcome) {
        case Outcome::Success:
            tui::print_success(result.detail);
            break;
        case Outcome::Failed:
            tui::print_error(result.detail);
            return kExitFatal;
        case Outcome::Cancelled:
            tui::print_warning(result.detail + ", releasing resources...");
            ctx.release_all();
            return kExitInterrupted;
    }
    if (level != Access::Chroot) return kExitOk;

    tui::print_info("You are now in an interactive shell; type 'exit' to return");
    if (!sys.run_in_chroot(config.paths.mount_point, "/bin/bash -i")) {
        tui::print_warning("Shell exited with an error");
    }
    installer.cleanup_chroot();
    // Ctrl-C typed inside the shell was meant for the shell
    if (signals::last_signal() == SIGINT) {
        signals::reset();
    }
    return kExitOk;
}

int run_install(System& sys, Config& config, const disk::TargetDisk& target, const Options& options) {
    auto report = probe(sys, config);
    if (!print_report(report)) {
        tui::print_error("System check failed, nothing was changed");
        return kExitFatal;
    }

    CheckpointStore checkpoints(config.paths.checkpoint);
    Detection detection = StateDetector(sys, target, config.paths.mount_point).detect();
    show_detection(detection);

    // The disk is only planned on a first run
    disk::PartitionPlan plan;
    if (detection.phase == Phase::NoPartitions) {
        auto planned = make_plan(config, target, options.custom);
        if (!planned) return kExitFatal;
        plan = *planned;
    }

    Installer installer(config, sys, target, plan, report.environment, checkpoints);

    RunOptions run_options;
    run_options.confirmed = options.yes;

    bool destructive = false;
    for (Action action : plan_for(detection.phase)) {
        destructive = destructive || is_destructive(action);
    }

    if (destructive) {
        std::vector<std::string> lines = {
            "Disk:      " + target.device + " (" + disk::format_size(target.capacity_bytes) + ")",
            "Hostname:  " + config.install.hostname,
            "Username:  " + config.install.username,
            "Timezone:  " + config.install.timezone,
            "Libc:      " + report.environment.libc(),
            "",
        };
        if (detection.phase == Phase::NoPartitions) {
            for (const auto& line : disk::describe(plan, target.capacity_bytes)) {
                lines.push_back(line);
            }
        }
        tui::draw_box("Installation Summary", lines);

        if (!run_options.confirmed) {
            std::cout << "\n";
            run_options.confirmed = tui::confirm_typed(
                "ALL DATA on " + target.device + " will be DESTROYED!");
            if (!run_options.confirmed) {
                tui::print_info("Installation cancelled.");
                return kExitOk;
            }
        }
    }

    RunContext ctx;
    installer.adopt_existing(ctx);
    RunResult result = installer.run(detection.phase, run_options, ctx);

    std::cout << "\n";
    switch (result.outcome) {
        case Outcome::Success:
            if (!config.behavior.teardown_on_success) {
                ctx.disarm();
            }
            tui::draw_box("Installation Complete!", {
                "",
                "  Void Linux has been installed on " + target.device,
                "",
                "  Next steps:",
                "  1. Run 'fortress-installer clean' or reboot",
                "  2. Remove the installation media",
                "  3. Unlock the disk with your passphrase on first boot",
                ""
            });
            return kExitOk;

        case Outcome::Failed:
            if (!config.behavior.teardown_on_error) {
                ctx.disarm();
            }
            tui::print_error("Installation failed");
            tui::print_error("Phase: " + to_string(result.phase) + " (last detected: " +
                             to_string(result.last_detected) + ")");
            tui::print_error("Detail: " + result.detail);
            tui::print_info("Checkpoint: " + checkpoints.path());
            tui::print_info("Fix the problem and run 'fortress-installer resume'");
            return kExitFatal;

        case Outcome::Cancelled:
            break;
    }

    const int sig = signals::last_signal();
    tui::print_warning(sig != 0 ? "Interrupted by signal " + std::to_string(sig) +
                                      ", releasing resources..."
                                : std::string("Interrupted, releasing resources..."));
    ctx.release_all();
    TeardownReconciler(sys, target, config.paths.mount_point).run();
    return kExitInterrupted;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << "Fortress Installer v1.0.0\n";
            return kExitOk;
        }
        if ((arg == "--config" || arg == "--disk") && i + 1 < argc) {
            (arg == "--config" ? options.config_path : options.disk) = argv[++i];
        } else if (arg == "--yes" || arg == "-y") {
            options.yes = true;
        } else if (arg == "--custom") {
            options.custom = true;
        } else if (is_command(arg)) {
            options.command = arg;
        } else {
            tui::print_error("Unknown argument: " + arg);
            print_usage(argv[0]);
            return kExitFatal;
        }
    }

    // Load configuration
    Config config;

    if (options.config_path.empty()) {
        options.config_path = select_config_file();
    } else if (!std::filesystem::exists(options.config_path)) {
        tui::print_error("Config file not found: " + options.config_path);
        return kExitFatal;
    }

    if (!options.config_path.empty()) {
        try {
            config = Config::load(options.config_path);
        } catch (const toml::parse_error& err) {
            tui::print_error("Failed to load config " + options.config_path + ": " +
                             std::string(err.description()));
            return kExitFatal;
        }
    }
    config.apply_environment();
    if (!options.disk.empty()) {
        config.install.disk = options.disk;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            tui::print_error("Config: " + problem);
        }
        return kExitFatal;
    }

    if (!tui::open_log(config.paths.log)) {
        tui::print_warning("Could not open log file " + config.paths.log);
    }

    const std::string& command = options.command;
    const bool installing = (command == "install" || command == "resume");

    if (installing) {
        tui::clear_screen();
        tui::print_banner();
    }
    if (config.loaded_from_file) {
        tui::print_info("Configuration: " + options.config_path);
    }

    signals::install_handlers();

    HostSystem sys;
    auto target = resolve_target(sys, config, installing);
    if (!target) {
        tui::print_error("No target disk found; set --disk or DISK");
        return kExitFatal;
    }
    config.install.disk = target->device;

    int code = kExitOk;
    bool torn_down = false;
    if (command == "status") {
        code = show_status(sys, config, *target);
    } else if (command == "debug") {
        code = run_debug(sys, config, *target);
    } else if (command == "plan") {
        code = run_plan(config, *target, options.custom);
    } else if (command == "clean") {
        code = run_clean(sys, config, *target, options);
    } else if (command == "open" || command == "mount" || command == "shell" ||
               command == "chroot") {
        if (!sys.is_root()) {
            tui::print_error("This command must be run as root!");
            code = kExitFatal;
        } else {
            code = run_access(command, sys, config, *target, probe(sys, config).environment);
        }
    } else {
        code = run_install(sys, config, *target, options);
        torn_down = code == kExitInterrupted;
    }

    // Nothing stays open or mounted after an interrupt, whichever command
    // it arrived in. An interrupted install has already torn down.
    if (signals::cancel_requested() && !torn_down) {
        tui::print_warning("Interrupted, tearing down " + target->device + "...");
        if (sys.is_root()) {
            TeardownReport report = TeardownReconciler(sys, *target, config.paths.mount_point).run();
            if (!report.ok()) {
                tui::print_error("Teardown left resources behind; run 'fortress-installer clean'");
            }
        }
        code = kExitInterrupted;
    }

    signals::restore_handlers();
    tui::close_log();
    return code;
}
