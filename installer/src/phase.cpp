#include "phase.hpp"

#include <array>
#include <utility>

namespace fortress {

namespace {

constexpr std::array<std::pair<Phase, const char*>, 14> kPhaseNames = {{
    {Phase::NoDisk,             "NoDisk"},
    {Phase::NoPartitions,       "NoPartitions"},
    {Phase::NotEncrypted,       "NotEncrypted"},
    {Phase::PartialEncrypted,   "PartialEncrypted"},
    {Phase::VolumesClosed,      "VolumesClosed"},
    {Phase::RootOpenHomeClosed, "RootOpenHomeClosed"},
    {Phase::NoRootFilesystem,   "NoRootFilesystem"},
    {Phase::NoHomeFilesystem,   "NoHomeFilesystem"},
    {Phase::NotMounted,         "NotMounted"},
    {Phase::PartialMount,       "PartialMount"},
    {Phase::NoSystem,           "NoSystem"},
    {Phase::NotConfigured,      "NotConfigured"},
    {Phase::Ready,              "Ready"},
    {Phase::Error,              "Error"},
}};

}  // namespace

std::string to_string(Phase phase) {
    for (const auto& [value, name] : kPhaseNames) {
        if (value == phase) return name;
    }
    return "Unknown";
}

std::optional<Phase> phase_from_string(const std::string& name) {
    for (const auto& [value, text] : kPhaseNames) {
        if (name == text) return value;
    }
    return std::nullopt;
}

int rank(Phase phase) {
    if (phase == Phase::Error) return -1;
    return static_cast<int>(phase);
}

bool is_fatal(Phase phase) {
    return phase == Phase::NoDisk || phase == Phase::Error;
}

}  // namespace fortress
