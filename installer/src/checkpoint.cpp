#include "checkpoint.hpp"
#include <toml.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fortress {

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

bool CheckpointStore::save(const Checkpoint& checkpoint) {
    toml::table record{
        {"phase", to_string(checkpoint.phase)},
        {"timestamp", checkpoint.timestamp},
        {"disk", checkpoint.disk},
        {"detail", checkpoint.detail},
    };

    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    // Write beside the record, then swap it in
    const std::string temp = path_ + ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            error_message_ = "Failed to write checkpoint: " + temp;
            return false;
        }
        file << record << "\n";
        if (!file.flush()) {
            error_message_ = "Failed to write checkpoint: " + temp;
            return false;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        error_message_ = "Failed to replace checkpoint " + path_ + ": " + ec.message();
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

bool CheckpointStore::record(Phase phase, const std::string& disk, const std::string& detail) {
    Checkpoint checkpoint;
    checkpoint.phase = phase;
    checkpoint.timestamp = static_cast<int64_t>(std::time(nullptr));
    checkpoint.disk = disk;
    checkpoint.detail = detail;
    return save(checkpoint);
}

std::optional<Checkpoint> CheckpointStore::load() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return std::nullopt;
    }

    try {
        auto data = toml::parse_file(path_);

        auto phase_name = data["phase"].value<std::string>();
        if (!phase_name) return std::nullopt;
        auto phase = phase_from_string(*phase_name);
        if (!phase) return std::nullopt;

        Checkpoint checkpoint;
        checkpoint.phase = *phase;
        checkpoint.timestamp = data["timestamp"].value_or(int64_t{0});
        checkpoint.disk = data["disk"].value_or(std::string{});
        checkpoint.detail = data["detail"].value_or(std::string{});
        return checkpoint;
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

}  // namespace fortress
