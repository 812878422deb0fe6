#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "commands/clean_command.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "begone";
    constexpr const char *kVersionLine = "0.1.0";

    void printHelp()
    {
        std::cout << kAppName << " - remove build artifacts and dependency caches\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " [options] <command> [path]\n"
                  << "\n"
                  << "Commands:\n"
                  << "  rust      Clean Rust project directories (target/)\n"
                  << "  python    Clean Python project directories (.venv/, venv/, __pycache__/, ...)\n"
                  << "  js        Clean JavaScript/TypeScript project directories (node_modules/, dist/, ...)\n"
                  << "  java      Clean Java project directories (target/, build/, .gradle/)\n"
                  << "  go        Clean Go project directories (bin/, pkg/)\n"
                  << "  dotnet    Clean .NET project directories (bin/, obj/)\n"
                  << "  all       Clean all supported project directories\n"
                  << "\n"
                  << "Options:\n"
                  << "  -d, --dry-run   Show what would be removed without deleting anything\n"
                  << "  -v, --verbose   Also report every directory visited\n"
                  << "  -m, --markers   Only remove directories next to a project file (Cargo.toml, package.json, ...)\n"
                  << "      --json      Print one JSON object per line\n"
                  << "      --no-color  Disable colored output\n"
                  << "  -h, --help      Show this help\n"
                  << "  -V, --version   Show version\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " rust --dry-run\n"
                  << "  " << kAppName << " -v js ~/projects\n"
                  << "  " << kAppName << " all --markers\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::vector<std::string> args = collectArgs(argc, argv, 1);
    const std::string command = args.front();
    if (command == "help")
    {
        printHelp();
        return 0;
    }
    if (command == "version")
    {
        std::cout << kAppName << " " << kVersionLine << '\n';
        return 0;
    }
    for (const auto &arg : args)
    {
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return 0;
        }
        if (arg == "--version" || arg == "-V")
        {
            std::cout << kAppName << " " << kVersionLine << '\n';
            return 0;
        }
    }

    const begone::Context ctx(false);

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec)
    {
        ctx.error("Cannot read current directory: ", ec.message());
        return 1;
    }

    const int code = begone::commands::runCleanCommand(ctx, cwd, args);
    if (code != 0)
    {
        std::cerr << "Run '" << kAppName << " --help' for usage.\n";
    }
    return code;
}
