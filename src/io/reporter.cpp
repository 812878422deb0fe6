#include "io/reporter.hpp"

#include <cstdio>
#include <cstdlib>

#include "nlohmann/json.hpp"

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace begone::io
{
    namespace
    {

        constexpr const char *kReset = "\033[0m";
        constexpr const char *kBoldGreen = "\033[32;1m";
        constexpr const char *kBoldYellow = "\033[33;1m";
        constexpr const char *kBoldRed = "\033[31;1m";
        constexpr const char *kDim = "\033[2m";

        std::string paint(const std::string &text, const char *color, bool enabled)
        {
            if (!enabled)
            {
                return text;
            }
            return std::string(color) + text + kReset;
        }

        // Non-UTF-8 path bytes are replaced rather than thrown on.
        std::string dumpLine(const nlohmann::json &line)
        {
            return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string plural(std::size_t count)
        {
            return count == 1 ? " directory" : " directories";
        }

    } // namespace

    Reporter::Reporter(std::ostream &out, const ReportOptions &options) : out_(out), options_(options)
    {
    }

    std::string Reporter::formatEvent(const model::MatchEvent &event) const
    {
        if (options_.format == ReportFormat::Json)
        {
            nlohmann::json line = {
                {"event", model::actionKey(event.action)},
                {"path", event.path.string()},
            };
            if (event.action == model::MatchAction::Failed)
            {
                line["reason"] = event.reason;
            }
            return dumpLine(line);
        }

        const bool color = options_.color;
        switch (event.action)
        {
        case model::MatchAction::Deleted:
            return paint("Removed:", kBoldGreen, color) + " " + event.path.string();
        case model::MatchAction::WouldDelete:
            return paint("Would remove:", kBoldYellow, color) + " " + event.path.string() + " " +
                   paint("(" + model::ecosystemLabel(options_.ecosystem) + ")", kDim, color);
        case model::MatchAction::Failed:
            return paint("Failed:", kBoldRed, color) + " " + event.path.string() + " (" + event.reason + ")";
        case model::MatchAction::Visited:
            return paint("Visited:", kDim, color) + " " + event.path.string();
        }
        return event.path.string();
    }

    void Reporter::onEvent(const model::MatchEvent &event)
    {
        out_ << formatEvent(event) << '\n';
        out_.flush();
    }

    void Reporter::finish(const model::WalkSummary &summary, const begone::Context &ctx)
    {
        if (options_.format == ReportFormat::Json)
        {
            const nlohmann::json line = {
                {"event", "summary"},
                {"ecosystem", model::ecosystemName(options_.ecosystem)},
                {"dry_run", options_.dryRun},
                {"visited", summary.visited},
                {"matched", summary.matched},
                {"deleted", summary.deleted},
                {"would_delete", summary.wouldDelete},
                {"failed", summary.failed},
            };
            out_ << dumpLine(line) << '\n';
            out_.flush();
            return;
        }

        ctx.debug("Visited ", summary.visited, plural(summary.visited));
        if (summary.matched == 0 && summary.failed == 0)
        {
            out_ << "Nothing to clean (" << model::ecosystemLabel(options_.ecosystem) << ")\n";
        }
        else if (options_.dryRun)
        {
            out_ << "Would remove " << summary.wouldDelete << plural(summary.wouldDelete) << '\n';
        }
        else
        {
            out_ << "Removed " << summary.deleted << plural(summary.deleted) << '\n';
        }
        out_.flush();

        if (summary.failed > 0)
        {
            ctx.warn("Failed on ", summary.failed, plural(summary.failed), " (permission denied or in use)");
        }
    }

    bool colorSupported(bool disabledByFlag)
    {
        if (disabledByFlag || std::getenv("NO_COLOR") != nullptr)
        {
            return false;
        }
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(STDOUT_FILENO) != 0;
#endif
    }

} // namespace begone::io
