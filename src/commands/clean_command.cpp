#include "commands/clean_command.hpp"

#include <string>
#include <vector>

#include "io/reporter.hpp"
#include "io/walker.hpp"
#include "model/rules.hpp"

namespace fs = std::filesystem;

namespace begone::commands
{
    namespace
    {

        struct CleanOptions
        {
            model::Ecosystem ecosystem = model::Ecosystem::All;
            fs::path root;
            bool dryRun = false;
            bool verbose = false;
            bool requireMarkers = false;
            bool json = false;
            bool noColor = false;
        };

        bool parseOptions(const std::vector<std::string> &args, CleanOptions &opt, const begone::Context &ctx)
        {
            std::vector<std::string> positionals;

            for (const auto &arg : args)
            {
                if (arg == "--dry-run" || arg == "-d")
                {
                    opt.dryRun = true;
                    continue;
                }
                if (arg == "--verbose" || arg == "-v")
                {
                    opt.verbose = true;
                    continue;
                }
                if (arg == "--markers" || arg == "-m")
                {
                    opt.requireMarkers = true;
                    continue;
                }
                if (arg == "--json")
                {
                    opt.json = true;
                    continue;
                }
                if (arg == "--no-color")
                {
                    opt.noColor = true;
                    continue;
                }
                if (arg.size() > 1 && arg[0] == '-')
                {
                    ctx.error("Unknown option: ", arg);
                    return false;
                }
                positionals.push_back(arg);
            }

            if (positionals.empty())
            {
                ctx.error("Missing ecosystem (use rust|python|js|java|go|dotnet|all)");
                return false;
            }

            const auto kind = model::parseEcosystem(positionals[0]);
            if (!kind.has_value())
            {
                ctx.error("Unknown ecosystem: ", positionals[0], " (use rust|python|js|java|go|dotnet|all)");
                return false;
            }
            opt.ecosystem = kind.value();

            if (positionals.size() > 2)
            {
                ctx.error("Unexpected argument: ", positionals[2]);
                return false;
            }
            if (positionals.size() == 2)
            {
                opt.root = positionals[1];
            }
            return true;
        }

        std::string joinNames(const std::vector<std::string> &names)
        {
            std::string out;
            for (size_t i = 0; i < names.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += names[i];
            }
            return out;
        }

    } // namespace

    int runCleanCommand(const begone::Context &ctx, const fs::path &workDir, const std::vector<std::string> &args, std::ostream &out)
    {
        CleanOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return 1;
        }

        const begone::Context runCtx(opt.verbose || ctx.verbose());

        io::WalkConfig config;
        config.root = opt.root.empty() ? workDir : (opt.root.is_absolute() ? opt.root : workDir / opt.root);
        config.rules = model::rulesFor(opt.ecosystem);
        config.dryRun = opt.dryRun;
        config.verbose = opt.verbose;
        config.requireMarkers = opt.requireMarkers;

        runCtx.debug("Root: ", config.root.string());
        runCtx.debug("Ecosystem: ", model::ecosystemLabel(opt.ecosystem));
        runCtx.debug("Targets: ", joinNames(config.rules.names()));
        if (opt.requireMarkers)
        {
            runCtx.debug("Only directories next to a project marker are removed");
        }

        io::ReportOptions reportOptions;
        reportOptions.format = opt.json ? io::ReportFormat::Json : io::ReportFormat::Text;
        reportOptions.color = !opt.json && &out == &std::cout && io::colorSupported(opt.noColor);
        reportOptions.dryRun = opt.dryRun;
        reportOptions.ecosystem = opt.ecosystem;
        io::Reporter reporter(out, reportOptions);

        model::WalkSummary summary;
        try
        {
            summary = io::walkTree(config, [&reporter](const model::MatchEvent &event)
                                   { reporter.onEvent(event); });
        }
        catch (const io::ConfigError &e)
        {
            ctx.error(e.what());
            return 1;
        }

        reporter.finish(summary, runCtx);
        return 0;
    }

} // namespace begone::commands
