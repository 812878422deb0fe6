#pragma once

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "io/fs_utils.hpp"
#include "model/events.hpp"
#include "model/rules.hpp"

namespace begone::io {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

using ListFn = std::function<std::vector<std::filesystem::directory_entry>(const std::filesystem::path &, std::error_code &)>;
using RemoveFn = std::function<bool(const std::filesystem::path &, std::error_code &)>;

struct WalkConfig {
    std::filesystem::path root;
    model::RuleSet rules;
    bool dryRun = false;
    bool verbose = false;
    bool requireMarkers = false;

    // Filesystem operations used by the walk; tests substitute failing ones.
    ListFn list = listEntries;
    RemoveFn remove = removePath;
};

using EventSink = std::function<void(const model::MatchEvent &)>;

// Depth-first walk from config.root. Every matched directory produces exactly
// one event and is never descended. Per-entry failures are reported through
// the sink; only an invalid root throws ConfigError, before anything is
// touched.
model::WalkSummary walkTree(const WalkConfig &config, const EventSink &sink);

} // namespace begone::io
