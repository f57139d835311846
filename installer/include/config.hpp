#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace fortress {

enum class LuksGeneration {
    Luks1,   // system volume, readable by GRUB
    Luks2    // user-data volume
};

// Parameters for one encrypted-volume generation
struct LuksParams {
    LuksGeneration generation = LuksGeneration::Luks2;
    std::string cipher = "aes-xts-plain64";
    int key_size = 512;
    std::string hash = "sha512";
    std::string pbkdf;           // empty = cryptsetup default for the generation
    int iter_time_ms = 0;        // pbkdf2 only
    uint64_t memory_kib = 0;     // argon2 only, 0 = derive from RAM
    int parallel = 0;            // argon2 only
    int time_cost = 0;           // argon2 only
};

struct InstallConfig {
    std::string disk;            // empty = auto-select
    std::string hostname = "void-fortress";
    std::string username = "nx";
    std::string timezone = "America/Sao_Paulo";
    std::string locale = "en_US.UTF-8";
    std::string root_password;   // empty = ask inside the chroot
    std::string user_password;
    std::string bootloader_id = "void";
};

// Operator overrides; any value set switches the planner to custom sizes
struct PartitionSizes {
    std::optional<std::string> efi;
    std::optional<std::string> boot;
    std::optional<std::string> swap;
    std::optional<std::string> root;

    bool any() const { return efi || boot || swap || root; }
};

struct EncryptionConfig {
    std::string passphrase;      // empty = cryptsetup prompts on the terminal
    LuksParams root;
    LuksParams home;
};

struct PackagesConfig {
    std::vector<std::string> base = {
        "base-system",
        "cryptsetup",
        "grub-x86_64-efi",
        "efibootmgr",
        "dracut",
        "void-repo-nonfree",
        "arch-install-scripts"
    };
    std::vector<std::string> extra;
    std::string repository = "https://repo-default.voidlinux.org/current";
    std::string repository_musl = "https://repo-default.voidlinux.org/current/musl";
};

struct PathsConfig {
    std::string mount_point = "/mnt";
    std::string checkpoint = "/tmp/fortress.state";
    std::string log = "/tmp/fortress.log";
};

struct BehaviorConfig {
    bool teardown_on_error = false;
    bool teardown_on_success = false;
};

struct Config {
    InstallConfig install;
    PartitionSizes partitions;
    EncryptionConfig encryption;
    PackagesConfig packages;
    PathsConfig paths;
    BehaviorConfig behavior;

    // True when values were read from a TOML file
    bool loaded_from_file = false;

    Config();

    // Load config from TOML file (throws toml::parse_error)
    static Config load(const std::string& path);

    // DISK, HOSTNAME, USERNAME, TIMEZONE, LUKS_PASS
    void apply_environment();

    // Empty when the configuration is usable
    std::vector<std::string> validate() const;
};

}  // namespace fortress
