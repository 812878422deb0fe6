#include "io/walker.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace begone::io
{
    namespace
    {

        fs::path resolveRoot(const fs::path &root)
        {
            std::error_code ec;
            fs::path out = root.empty() ? fs::current_path(ec) : fs::absolute(root, ec);
            if (ec)
            {
                throw ConfigError("Cannot resolve root path " + root.string() + ": " + ec.message());
            }

            const fs::file_status status = fs::status(out, ec);
            if (ec || !fs::exists(status))
            {
                throw ConfigError("Root path does not exist: " + out.string());
            }
            if (!fs::is_directory(status))
            {
                throw ConfigError("Root path is not a directory: " + out.string());
            }
            return out.lexically_normal();
        }

        void emit(const EventSink &sink, const fs::path &path, model::MatchAction action, const std::string &reason = {})
        {
            if (!sink)
            {
                return;
            }
            model::MatchEvent event;
            event.path = path;
            event.action = action;
            event.reason = reason;
            sink(event);
        }

        void handleMatch(const WalkConfig &config, const EventSink &sink, const fs::path &path, model::WalkSummary &summary)
        {
            ++summary.matched;
            if (config.dryRun)
            {
                ++summary.wouldDelete;
                emit(sink, path, model::MatchAction::WouldDelete);
                return;
            }

            std::error_code ec;
            if (config.remove(path, ec))
            {
                ++summary.deleted;
                emit(sink, path, model::MatchAction::Deleted);
                return;
            }

            // Part of the subtree may already be gone; there is no rollback.
            ++summary.failed;
            emit(sink, path, model::MatchAction::Failed, ec ? ec.message() : "remove failed");
        }

    } // namespace

    model::WalkSummary walkTree(const WalkConfig &config, const EventSink &sink)
    {
        const fs::path root = resolveRoot(config.root);
        model::WalkSummary summary;

        std::vector<fs::path> pending;
        pending.push_back(root);

        while (!pending.empty())
        {
            const fs::path dir = pending.back();
            pending.pop_back();

            ++summary.visited;
            if (config.verbose)
            {
                emit(sink, dir, model::MatchAction::Visited);
            }

            std::error_code ec;
            const auto entries = config.list(dir, ec);
            if (ec)
            {
                ++summary.failed;
                emit(sink, dir, model::MatchAction::Failed, ec.message());
                continue;
            }

            std::vector<fs::path> children;
            for (const auto &entry : entries)
            {
                bool isLink = false;
                const bool isDir = isDirectoryEntry(entry, isLink, ec);
                if (ec)
                {
                    ++summary.failed;
                    emit(sink, entry.path(), model::MatchAction::Failed, ec.message());
                    continue;
                }
                if (!isDir)
                {
                    continue;
                }

                const std::string name = entry.path().filename().string();
                const bool matched = config.rules.contains(name) &&
                                     (!config.requireMarkers || model::hasProjectMarker(dir, config.rules.markersFor(name)));
                if (matched)
                {
                    handleMatch(config, sink, entry.path(), summary);
                    continue;
                }

                // Linked directories are never followed.
                if (isLink)
                {
                    continue;
                }
                children.push_back(entry.path());
            }

            // Reverse so the stack pops children in name order.
            for (auto it = children.rbegin(); it != children.rend(); ++it)
            {
                pending.push_back(*it);
            }
        }

        return summary;
    }

} // namespace begone::io
