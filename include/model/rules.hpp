#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace begone::model {

enum class Ecosystem {
    Rust,
    Python,
    JavaScript,
    Java,
    Go,
    DotNet,
    All,
};

// Directory names to remove, each mapped to the project marker files that
// identify its owning ecosystem(s). Immutable once built by rulesFor().
class RuleSet {
public:
    RuleSet() = default;

    bool contains(const std::string &name) const;
    const std::vector<std::string> &markersFor(const std::string &name) const;
    std::vector<std::string> names() const;
    bool empty() const { return targets_.empty(); }
    std::size_t size() const { return targets_.size(); }

    void add(const std::string &name, const std::vector<std::string> &markers);

private:
    std::unordered_map<std::string, std::vector<std::string>> targets_;
};

RuleSet rulesFor(Ecosystem kind);

std::optional<Ecosystem> parseEcosystem(const std::string &value);
std::string ecosystemName(Ecosystem kind);
std::string ecosystemLabel(Ecosystem kind);
const std::vector<Ecosystem> &concreteEcosystems();

// Markers are exact file names or "*suffix" patterns.
bool hasProjectMarker(const std::filesystem::path &dir, const std::vector<std::string> &markers);

} // namespace begone::model
