#include "system.hpp"
#include "signals.hpp"
#include <array>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fortress {

namespace fs = std::filesystem;

namespace {

std::string exec(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        return "";
    }
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }
    return result;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// A child killed by the terminal's interrupt counts as a cancellation
bool check_status(int status) {
    if (status == -1) return false;
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        if (sig == SIGINT || sig == SIGTERM || sig == SIGHUP) {
            signals::request_cancel();
        }
        return false;
    }
    if (!WIFEXITED(status)) return false;
    int code = WEXITSTATUS(status);
    if (code == 128 + SIGINT || code == 128 + SIGTERM) {
        signals::request_cancel();
    }
    return code == 0;
}

bool run_cmd(const std::string& cmd) {
    return check_status(system(cmd.c_str()));
}

// Feeds `input` to the command's stdin (secrets, sfdisk scripts)
bool run_with_input(const std::string& cmd, const std::string& input) {
    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) {
        return false;
    }
    size_t written = fwrite(input.data(), 1, input.size(), pipe);
    int status = pclose(pipe);
    return written == input.size() && check_status(status);
}

bool run_secret(const std::string& cmd, const std::string& passphrase) {
    if (passphrase.empty()) {
        return run_cmd(cmd);    // cryptsetup asks on the terminal
    }
    return run_with_input(with_secret_input(cmd, passphrase), passphrase);
}

bool is_octal(char c) {
    return c >= '0' && c <= '7';
}

// Owner-only while the content is written, `mode` once it is complete
bool write_private(const std::string& path, const std::string& data, unsigned mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return false;
    bool ok = ::fchmod(fd, 0600) == 0;
    size_t done = 0;
    while (ok && done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        done += static_cast<size_t>(n);
    }
    ok = ok && ::fsync(fd) == 0 && ::fchmod(fd, static_cast<mode_t>(mode)) == 0;
    return ::close(fd) == 0 && ok;
}

std::string normalize(const std::string& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    std::string result = ec ? path : canonical.string();
    while (result.size() > 1 && result.back() == '/') result.pop_back();
    return result;
}

}  // namespace

std::string shell_quote(const std::string& word) {
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

std::string luks_format_options(const LuksParams& params) {
    std::ostringstream cmd;
    cmd << " --type " << (params.generation == LuksGeneration::Luks1 ? "luks1" : "luks2")
        << " --cipher " << shell_quote(params.cipher)
        << " --key-size " << params.key_size
        << " --hash " << shell_quote(params.hash);
    if (!params.pbkdf.empty()) {
        cmd << " --pbkdf " << shell_quote(params.pbkdf);
    }
    if (params.iter_time_ms > 0) {
        cmd << " --iter-time " << params.iter_time_ms;
    }
    if (params.memory_kib > 0) {
        cmd << " --pbkdf-memory " << params.memory_kib;
    }
    if (params.parallel > 0) {
        cmd << " --pbkdf-parallel " << params.parallel;
    }
    if (params.time_cost > 0) {
        cmd << " --pbkdf-force-iterations " << params.time_cost;
    }
    return cmd.str();
}

std::string luks_format_command(const std::string& partition, const LuksParams& params,
                                bool interactive) {
    std::string cmd = "cryptsetup luksFormat --batch-mode" + luks_format_options(params);
    if (interactive) {
        cmd += " --verify-passphrase";
    }
    return cmd + " " + shell_quote(partition);
}

std::string with_secret_input(const std::string& cmd, const std::string& passphrase) {
    if (passphrase.empty()) return cmd;
    return cmd + " --key-file=-";
}

std::string sfdisk_script(const std::vector<PartitionSpec>& specs) {
    std::ostringstream script;
    script << "label: gpt\n";
    for (const auto& spec : specs) {
        if (spec.size_bytes) {
            uint64_t mib = *spec.size_bytes / (1024ULL * 1024ULL);
            if (mib == 0) mib = 1;
            script << "size=" << mib << "MiB, ";
        }
        script << "type=" << spec.type_guid << ", name=\"" << spec.label << "\"\n";
    }
    return script.str();
}

std::string unescape_mount_path(const std::string& field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            is_octal(field[i + 1]) && is_octal(field[i + 2]) && is_octal(field[i + 3])) {
            out += static_cast<char>((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                                     (field[i + 3] - '0'));
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

bool HostSystem::is_root() const {
    return getuid() == 0;
}

bool HostSystem::is_uefi() const {
    std::error_code ec;
    return fs::exists("/sys/firmware/efi", ec);
}

bool HostSystem::has_tool(const std::string& name) const {
    return run_cmd("command -v " + shell_quote(name) + " >/dev/null 2>&1");
}

std::vector<tui::DiskInfo> HostSystem::list_disks() const {
    std::vector<tui::DiskInfo> disks;

    std::string output = exec("lsblk -d -n -o NAME,SIZE,MODEL,TYPE 2>/dev/null");

    std::istringstream iss(output);
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        // NAME SIZE MODEL... TYPE
        std::istringstream line_stream(line);
        std::string name, size, type;
        std::string model;

        line_stream >> name >> size;

        std::string rest;
        std::getline(line_stream, rest);

        size_t last_space = rest.rfind(' ');
        if (last_space != std::string::npos) {
            type = rest.substr(last_space + 1);
            model = trim(rest.substr(0, last_space));
        } else {
            type = trim(rest);
        }

        // Whole disks only (no partitions, loop devices, ...)
        if (type == "disk") {
            tui::DiskInfo info;
            info.device = "/dev/" + name;
            info.size = size;
            info.model = model.empty() ? "Unknown" : model;
            info.type = type;
            disks.push_back(info);
        }
    }

    return disks;
}

std::optional<uint64_t> HostSystem::disk_capacity(const std::string& device) const {
    std::string output = trim(exec("blockdev --getsize64 " + shell_quote(device) + " 2>/dev/null"));
    if (output.empty()) {
        output = trim(exec("lsblk -bdn -o SIZE " + shell_quote(device) + " 2>/dev/null"));
    }
    if (output.empty()) return std::nullopt;
    try {
        return static_cast<uint64_t>(std::stoull(output));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> HostSystem::memory_total_kib() const {
    std::ifstream meminfo("/proc/meminfo");
    std::string key;
    uint64_t value = 0;
    std::string unit;
    while (meminfo >> key >> value >> unit) {
        if (key == "MemTotal:") return value;
    }
    return std::nullopt;
}

std::string HostSystem::kernel_release() const {
    struct utsname info {};
    if (uname(&info) != 0) return "unknown";
    return info.release;
}

std::string HostSystem::machine_arch() const {
    struct utsname info {};
    if (uname(&info) != 0) return "unknown";
    return info.machine;
}

bool HostSystem::is_musl() const {
    return exec("ldd --version 2>&1").find("musl") != std::string::npos;
}

bool HostSystem::is_live_environment() const {
    std::error_code ec;
    if (fs::exists("/run/void-live", ec)) return true;

    std::ifstream cmdline("/proc/cmdline");
    std::string content((std::istreambuf_iterator<char>(cmdline)), std::istreambuf_iterator<char>());
    return content.find("void-live") != std::string::npos;
}

bool HostSystem::block_device_exists(const std::string& path) const {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISBLK(st.st_mode);
}

bool HostSystem::wipe_signatures(const std::string& device) {
    return run_cmd("wipefs -af " + shell_quote(device) + " >/dev/null 2>&1");
}

bool HostSystem::create_partitions(const std::string& device,
                                   const std::vector<PartitionSpec>& specs) {
    if (!run_with_input("sfdisk --wipe always --wipe-partitions always " + shell_quote(device),
                        sfdisk_script(specs))) {
        return false;
    }

    // Make the kernel re-read the new table
    if (has_tool("partprobe")) {
        if (!run_cmd("partprobe " + shell_quote(device))) {
            return false;
        }
    } else if (!run_cmd("blockdev --rereadpt " + shell_quote(device) + " 2>/dev/null")) {
        return false;
    }
    if (has_tool("udevadm") && !run_cmd("udevadm settle")) {
        std::this_thread::sleep_for(std::chrono::seconds(2));
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
    return true;
}

bool HostSystem::is_luks(const std::string& partition) const {
    return run_cmd("cryptsetup isLuks " + shell_quote(partition) + " 2>/dev/null");
}

bool HostSystem::luks_format(const std::string& partition, const LuksParams& params,
                             const std::string& passphrase) {
    return run_secret(luks_format_command(partition, params, passphrase.empty()), passphrase);
}

bool HostSystem::luks_open(const std::string& partition, const std::string& name,
                           const std::string& passphrase) {
    return run_secret("cryptsetup open " + shell_quote(partition) + " " + shell_quote(name), passphrase);
}

bool HostSystem::luks_close(const std::string& name) {
    return run_cmd("cryptsetup close " + shell_quote(name));
}

bool HostSystem::mapping_exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists("/dev/mapper/" + name, ec);
}

bool HostSystem::luks_add_key(const std::string& partition, const std::string& key_file,
                              const std::string& passphrase) {
    return run_secret("cryptsetup luksAddKey " + shell_quote(partition) + " " + shell_quote(key_file),
                      passphrase);
}

bool HostSystem::luks_has_key(const std::string& partition, const std::string& key_file) const {
    return run_cmd("cryptsetup open --test-passphrase --key-file " + shell_quote(key_file) + " " +
                   shell_quote(partition) + " >/dev/null 2>&1");
}

bool HostSystem::has_filesystem(const std::string& device) const {
    return !trim(exec("blkid -o value -s TYPE " + shell_quote(device) + " 2>/dev/null")).empty();
}

bool HostSystem::make_filesystem(const std::string& device, FsType type,
                                 const std::string& label) {
    switch (type) {
        case FsType::Ext4:
            return run_cmd("mkfs.ext4 -F -L " + shell_quote(label) + " " + shell_quote(device));
        case FsType::Vfat:
            return run_cmd("mkfs.vfat -F32 -n " + shell_quote(label) + " " + shell_quote(device));
        case FsType::Swap:
            return run_cmd("mkswap -L " + shell_quote(label) + " " + shell_quote(device));
    }
    return false;
}

std::optional<std::string> HostSystem::filesystem_uuid(const std::string& device) const {
    std::string uuid = trim(exec("blkid -s UUID -o value " + shell_quote(device) + " 2>/dev/null"));
    if (uuid.empty()) return std::nullopt;
    return uuid;
}

bool HostSystem::is_mounted(const std::string& path) const {
    const std::string wanted = normalize(path);
    std::ifstream mounts("/proc/self/mounts");
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string source, target;
        if (fields >> source >> target && unescape_mount_path(target) == wanted) {
            return true;
        }
    }
    return false;
}

bool HostSystem::mount(const std::string& source, const std::string& target) {
    return run_cmd("mount " + shell_quote(source) + " " + shell_quote(target));
}

bool HostSystem::mount_pseudo(PseudoFs kind, const std::string& target) {
    switch (kind) {
        case PseudoFs::Dev:
            return run_cmd("mount --rbind /dev " + shell_quote(target)) &&
                   run_cmd("mount --make-rslave " + shell_quote(target));
        case PseudoFs::Proc:
            return run_cmd("mount --rbind /proc " + shell_quote(target)) &&
                   run_cmd("mount --make-rslave " + shell_quote(target));
        case PseudoFs::Sys:
            return run_cmd("mount --rbind /sys " + shell_quote(target)) &&
                   run_cmd("mount --make-rslave " + shell_quote(target));
        case PseudoFs::Run:
            return run_cmd("mount -t tmpfs tmpfs " + shell_quote(target));
    }
    return false;
}

bool HostSystem::unmount(const std::string& path, bool lazy) {
    return run_cmd(std::string("umount ") + (lazy ? "-l " : "") + shell_quote(path) + " 2>/dev/null");
}

bool HostSystem::unmount_recursive(const std::string& path) {
    return run_cmd("umount -R " + shell_quote(path));
}

bool HostSystem::swap_active(const std::string& device) const {
    const std::string wanted = normalize(device);
    std::ifstream swaps("/proc/swaps");
    std::string line;
    std::getline(swaps, line);  // header
    while (std::getline(swaps, line)) {
        std::istringstream fields(line);
        std::string name;
        if (fields >> name && normalize(unescape_mount_path(name)) == wanted) {
            return true;
        }
    }
    return false;
}

bool HostSystem::swap_on(const std::string& device) {
    return run_cmd("swapon " + shell_quote(device));
}

bool HostSystem::swap_off(const std::string& device) {
    return run_cmd("swapoff " + shell_quote(device));
}

void HostSystem::kill_users(const std::string& path) {
    // fuser exits non-zero when nothing was using the path
    if (run_cmd("fuser -km " + shell_quote(path) + " >/dev/null 2>&1")) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

bool HostSystem::path_exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool HostSystem::directory_populated(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return false;
    fs::directory_iterator it(path, ec);
    return !ec && it != fs::directory_iterator();
}

bool HostSystem::create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool HostSystem::write_file(const std::string& path, const std::string& content, unsigned mode) {
    return write_private(path, content, mode);
}

bool HostSystem::write_random_key(const std::string& path, std::size_t bytes) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;

    std::string key(bytes, '\0');
    if (!urandom.read(&key[0], static_cast<std::streamsize>(bytes))) return false;

    return write_private(path, key, 0);
}

bool HostSystem::remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

bool HostSystem::copy_path(const std::string& from, const std::string& to) {
    std::error_code ec;
    if (fs::is_directory(from, ec)) {
        fs::create_directories(to, ec);
        fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        return !ec;
    }
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    return !ec;
}

bool HostSystem::install_base_packages(const std::string& root, const std::string& repository,
                                       const std::vector<std::string>& packages) {
    std::string cmd = "xbps-install -Sy -r " + shell_quote(root) + " -R " + shell_quote(repository);
    for (const auto& pkg : packages) {
        cmd += " " + shell_quote(pkg);
    }
    return run_cmd(cmd);
}

bool HostSystem::run_in_chroot(const std::string& root, const std::string& command) {
    return run_cmd("chroot " + shell_quote(root) + " " + command);
}

bool HostSystem::install_bootloader(const std::string& root, BootloaderMode mode,
                                    const std::string& bootloader_id) {
    std::string cmd = "grub-install --target=x86_64-efi --efi-directory=/boot/efi"
                      " --bootloader-id=" + shell_quote(bootloader_id);
    if (mode == BootloaderMode::Fallback) {
        cmd += " --removable";
    }
    return run_in_chroot(root, cmd);
}

bool HostSystem::generate_boot_config(const std::string& root) {
    return run_in_chroot(root, "grub-mkconfig -o /boot/grub/grub.cfg") &&
           run_in_chroot(root, "xbps-reconfigure -fa");
}

}  // namespace fortress
