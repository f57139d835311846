#include "config.hpp"
#include "disk.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <iostream>

namespace fortress {

namespace {

void read_string_list(const toml::node_view<toml::node>& node, std::vector<std::string>& out) {
    if (auto arr = node.as_array()) {
        out.clear();
        for (const auto& item : *arr) {
            if (auto v = item.value<std::string>())
                out.push_back(*v);
        }
    }
}

void read_luks(const toml::node_view<toml::node>& node, LuksParams& params) {
    auto table = node.as_table();
    if (!table) return;

    if (auto v = (*table)["cipher"].value<std::string>())
        params.cipher = *v;
    if (auto v = (*table)["key_size"].value<int64_t>())
        params.key_size = static_cast<int>(*v);
    if (auto v = (*table)["hash"].value<std::string>())
        params.hash = *v;
    if (auto v = (*table)["pbkdf"].value<std::string>())
        params.pbkdf = *v;
    if (auto v = (*table)["iter_time_ms"].value<int64_t>())
        params.iter_time_ms = static_cast<int>(*v);
    if (auto v = (*table)["memory_kib"].value<int64_t>())
        params.memory_kib = static_cast<uint64_t>(*v);
    if (auto v = (*table)["parallel"].value<int64_t>())
        params.parallel = static_cast<int>(*v);
    if (auto v = (*table)["time_cost"].value<int64_t>())
        params.time_cost = static_cast<int>(*v);
}

}  // namespace

Config::Config() {
    encryption.root.generation = LuksGeneration::Luks1;
    encryption.root.pbkdf = "pbkdf2";
    encryption.root.iter_time_ms = 5000;

    encryption.home.generation = LuksGeneration::Luks2;
    encryption.home.pbkdf = "argon2id";
    encryption.home.parallel = 4;
    encryption.home.time_cost = 4;
}

Config Config::load(const std::string& path) {
    Config cfg;

    try {
        auto data = toml::parse_file(path);

        // [install] section
        if (auto install = data["install"].as_table()) {
            if (auto v = (*install)["disk"].value<std::string>())
                cfg.install.disk = *v;
            if (auto v = (*install)["hostname"].value<std::string>())
                cfg.install.hostname = *v;
            if (auto v = (*install)["username"].value<std::string>())
                cfg.install.username = *v;
            if (auto v = (*install)["timezone"].value<std::string>())
                cfg.install.timezone = *v;
            if (auto v = (*install)["locale"].value<std::string>())
                cfg.install.locale = *v;
            if (auto v = (*install)["root_password"].value<std::string>())
                cfg.install.root_password = *v;
            if (auto v = (*install)["user_password"].value<std::string>())
                cfg.install.user_password = *v;
            if (auto v = (*install)["bootloader_id"].value<std::string>())
                cfg.install.bootloader_id = *v;
        }

        // [partitions] section
        if (auto parts = data["partitions"].as_table()) {
            if (auto v = (*parts)["efi"].value<std::string>())
                cfg.partitions.efi = *v;
            if (auto v = (*parts)["boot"].value<std::string>())
                cfg.partitions.boot = *v;
            if (auto v = (*parts)["swap"].value<std::string>())
                cfg.partitions.swap = *v;
            if (auto v = (*parts)["root"].value<std::string>())
                cfg.partitions.root = *v;
        }

        // [encryption], [encryption.root], [encryption.home]
        if (auto enc = data["encryption"].as_table()) {
            if (auto v = (*enc)["passphrase"].value<std::string>())
                cfg.encryption.passphrase = *v;
        }
        read_luks(data["encryption"]["root"], cfg.encryption.root);
        read_luks(data["encryption"]["home"], cfg.encryption.home);

        // [packages] section
        if (auto pkgs = data["packages"].as_table()) {
            read_string_list(data["packages"]["base"], cfg.packages.base);
            read_string_list(data["packages"]["extra"], cfg.packages.extra);
            if (auto v = (*pkgs)["repository"].value<std::string>())
                cfg.packages.repository = *v;
            if (auto v = (*pkgs)["repository_musl"].value<std::string>())
                cfg.packages.repository_musl = *v;
        }

        // [paths] section
        if (auto paths = data["paths"].as_table()) {
            if (auto v = (*paths)["mount_point"].value<std::string>())
                cfg.paths.mount_point = *v;
            if (auto v = (*paths)["checkpoint"].value<std::string>())
                cfg.paths.checkpoint = *v;
            if (auto v = (*paths)["log"].value<std::string>())
                cfg.paths.log = *v;
        }

        // [behavior] section
        if (auto behavior = data["behavior"].as_table()) {
            if (auto v = (*behavior)["teardown_on_error"].value<bool>())
                cfg.behavior.teardown_on_error = *v;
            if (auto v = (*behavior)["teardown_on_success"].value<bool>())
                cfg.behavior.teardown_on_success = *v;
        }

    } catch (const toml::parse_error& err) {
        std::cerr << "Error parsing config file: " << err << std::endl;
        throw;
    }

    cfg.loaded_from_file = true;
    return cfg;
}

void Config::apply_environment() {
    auto env = [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };

    if (auto v = env("DISK")) install.disk = *v;
    if (auto v = env("HOSTNAME")) install.hostname = *v;
    if (auto v = env("USERNAME")) install.username = *v;
    if (auto v = env("TIMEZONE")) install.timezone = *v;
    if (auto v = env("LUKS_PASS")) encryption.passphrase = *v;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (install.hostname.empty()) problems.push_back("hostname is empty");
    if (install.username.empty()) problems.push_back("username is empty");
    if (install.timezone.empty()) problems.push_back("timezone is empty");
    if (install.bootloader_id.empty()) problems.push_back("bootloader_id is empty");

    if (paths.mount_point.empty() || paths.mount_point.front() != '/') {
        problems.push_back("mount_point must be an absolute path");
    } else if (paths.mount_point == "/") {
        problems.push_back("mount_point must not be the live root");
    }
    if (paths.checkpoint.empty()) problems.push_back("checkpoint path is empty");

    auto check_size = [&](const char* name, const std::optional<std::string>& value) {
        if (value && !disk::parse_size(*value)) {
            problems.push_back(std::string("invalid ") + name + " size: " + *value);
        }
    };
    check_size("efi", partitions.efi);
    check_size("boot", partitions.boot);
    check_size("swap", partitions.swap);
    check_size("root", partitions.root);

    if (encryption.root.generation != LuksGeneration::Luks1)
        problems.push_back("root volume must use LUKS1 so GRUB can unlock it");
    if (encryption.root.key_size <= 0 || encryption.home.key_size <= 0)
        problems.push_back("key_size must be positive");
    for (const LuksParams* params : {&encryption.root, &encryption.home}) {
        // cryptsetup refuses fewer than 4 Argon2 passes
        if (params->pbkdf.rfind("argon2", 0) == 0 && params->time_cost > 0 && params->time_cost < 4) {
            problems.push_back("argon2 time_cost must be at least 4, got " +
                               std::to_string(params->time_cost));
        }
    }

    return problems;
}

}  // namespace fortress
