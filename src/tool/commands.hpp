#pragma once

#include "../common/table_registry.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace en {

enum class ExitCode : int {
    Ok = 0,
    Error = 1,
    Usage = 2,
    NotFound = 3
};

std::string usage();

// Runs one tool command (args[0] is the command name) against the
// registry. Results go to out, usage text to err, failures to the log.
ExitCode run_command(const TableRegistry& registry, const std::vector<std::string>& args,
                     std::ostream& out, std::ostream& err);

} // namespace en
