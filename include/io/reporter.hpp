#pragma once

#include <ostream>
#include <string>

#include "core/context.hpp"
#include "model/events.hpp"
#include "model/rules.hpp"

namespace begone::io {

enum class ReportFormat {
    Text,
    Json,
};

struct ReportOptions {
    ReportFormat format = ReportFormat::Text;
    bool color = false;
    bool dryRun = false;
    model::Ecosystem ecosystem = model::Ecosystem::All;
};

class Reporter {
public:
    Reporter(std::ostream &out, const ReportOptions &options);

    void onEvent(const model::MatchEvent &event);
    void finish(const model::WalkSummary &summary, const begone::Context &ctx);

    std::string formatEvent(const model::MatchEvent &event) const;

private:
    std::ostream &out_;
    ReportOptions options_;
};

// Colors only when stdout is a terminal and NO_COLOR is unset.
bool colorSupported(bool disabledByFlag);

} // namespace begone::io
