#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace begone::model {

enum class MatchAction {
    Visited,
    WouldDelete,
    Deleted,
    Failed,
};

struct MatchEvent {
    std::filesystem::path path;
    MatchAction action = MatchAction::Visited;
    std::string reason;
};

struct WalkSummary {
    std::size_t visited = 0;
    std::size_t matched = 0;
    std::size_t deleted = 0;
    std::size_t wouldDelete = 0;
    std::size_t failed = 0;
};

std::string actionKey(MatchAction action);

} // namespace begone::model
