#pragma once

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace begone::commands {

// args: <ecosystem> [path] plus options. Relative paths resolve against
// workDir. Returns the process exit code.
int runCleanCommand(
    const begone::Context &ctx,
    const std::filesystem::path &workDir,
    const std::vector<std::string> &args,
    std::ostream &out = std::cout
);

} // namespace begone::commands
