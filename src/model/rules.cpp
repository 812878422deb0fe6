#include "model/rules.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace begone::model
{
    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool endsWith(const std::string &value, const std::string &suffix)
        {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        void addAll(RuleSet &rules, const std::vector<std::string> &names, const std::vector<std::string> &markers)
        {
            for (const auto &name : names)
            {
                rules.add(name, markers);
            }
        }

    } // namespace

    bool RuleSet::contains(const std::string &name) const
    {
        return targets_.find(name) != targets_.end();
    }

    const std::vector<std::string> &RuleSet::markersFor(const std::string &name) const
    {
        static const std::vector<std::string> kNone;
        auto it = targets_.find(name);
        return it == targets_.end() ? kNone : it->second;
    }

    std::vector<std::string> RuleSet::names() const
    {
        std::vector<std::string> out;
        out.reserve(targets_.size());
        for (const auto &[name, _] : targets_)
        {
            (void)_;
            out.push_back(name);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    void RuleSet::add(const std::string &name, const std::vector<std::string> &markers)
    {
        auto &owned = targets_[name];
        for (const auto &marker : markers)
        {
            if (std::find(owned.begin(), owned.end(), marker) == owned.end())
            {
                owned.push_back(marker);
            }
        }
    }

    RuleSet rulesFor(Ecosystem kind)
    {
        RuleSet rules;
        switch (kind)
        {
        case Ecosystem::Rust:
            addAll(rules, {"target"}, {"Cargo.toml"});
            break;
        case Ecosystem::Python:
            addAll(rules,
                   {".venv", "venv", "__pycache__", ".pytest_cache", ".mypy_cache"},
                   {"requirements.txt", "pyproject.toml", "setup.py", "Pipfile"});
            break;
        case Ecosystem::JavaScript:
            addAll(rules, {"node_modules", ".next", ".nuxt", ".cache", "dist", "build"}, {"package.json"});
            break;
        case Ecosystem::Java:
            addAll(rules, {"target", "build", ".gradle"}, {"pom.xml", "build.gradle", "build.gradle.kts"});
            break;
        case Ecosystem::Go:
            addAll(rules, {"bin", "pkg"}, {"go.mod", "go.sum"});
            break;
        case Ecosystem::DotNet:
            addAll(rules, {"bin", "obj"}, {"*.csproj", "*.fsproj", "*.sln"});
            break;
        case Ecosystem::All:
            for (Ecosystem each : concreteEcosystems())
            {
                const RuleSet part = rulesFor(each);
                for (const auto &name : part.names())
                {
                    rules.add(name, part.markersFor(name));
                }
            }
            break;
        }
        return rules;
    }

    std::optional<Ecosystem> parseEcosystem(const std::string &value)
    {
        const std::string key = lower(value);
        if (key == "rust")
        {
            return Ecosystem::Rust;
        }
        if (key == "python" || key == "py")
        {
            return Ecosystem::Python;
        }
        if (key == "js" || key == "javascript" || key == "ts" || key == "typescript")
        {
            return Ecosystem::JavaScript;
        }
        if (key == "java")
        {
            return Ecosystem::Java;
        }
        if (key == "go")
        {
            return Ecosystem::Go;
        }
        if (key == "dotnet" || key == "net" || key == ".net" || key == "csharp")
        {
            return Ecosystem::DotNet;
        }
        if (key == "all" || key == "*")
        {
            return Ecosystem::All;
        }
        return std::nullopt;
    }

    std::string ecosystemName(Ecosystem kind)
    {
        switch (kind)
        {
        case Ecosystem::Rust:
            return "rust";
        case Ecosystem::Python:
            return "python";
        case Ecosystem::JavaScript:
            return "js";
        case Ecosystem::Java:
            return "java";
        case Ecosystem::Go:
            return "go";
        case Ecosystem::DotNet:
            return "dotnet";
        case Ecosystem::All:
            return "all";
        }
        return "all";
    }

    std::string ecosystemLabel(Ecosystem kind)
    {
        switch (kind)
        {
        case Ecosystem::Rust:
            return "Rust";
        case Ecosystem::Python:
            return "Python";
        case Ecosystem::JavaScript:
            return "JavaScript/TypeScript";
        case Ecosystem::Java:
            return "Java";
        case Ecosystem::Go:
            return "Go";
        case Ecosystem::DotNet:
            return ".NET";
        case Ecosystem::All:
            return "all";
        }
        return "all";
    }

    const std::vector<Ecosystem> &concreteEcosystems()
    {
        static const std::vector<Ecosystem> kinds = {
            Ecosystem::Rust,
            Ecosystem::Python,
            Ecosystem::JavaScript,
            Ecosystem::Java,
            Ecosystem::Go,
            Ecosystem::DotNet,
        };
        return kinds;
    }

    bool hasProjectMarker(const fs::path &dir, const std::vector<std::string> &markers)
    {
        std::vector<std::string> suffixes;
        for (const auto &marker : markers)
        {
            if (!marker.empty() && marker[0] == '*')
            {
                suffixes.push_back(marker.substr(1));
                continue;
            }
            std::error_code ec;
            if (fs::exists(dir / marker, ec))
            {
                return true;
            }
        }

        if (suffixes.empty())
        {
            return false;
        }

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        const fs::directory_iterator end;
        while (!ec && it != end)
        {
            const std::string name = it->path().filename().string();
            for (const auto &suffix : suffixes)
            {
                if (endsWith(name, suffix))
                {
                    return true;
                }
            }
            it.increment(ec);
        }
        return false;
    }

} // namespace begone::model
