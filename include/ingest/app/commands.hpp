#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ingest::app {

/**
 * @brief The `organize` command
 *
 * Writes the report to `out` and usage/validation messages to `err`;
 * returns one of the ExitCode values. `args` excludes the program name.
 */
int run_organize(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

/**
 * @brief The `repair_structure` command
 *
 * The script goes to `out`; warnings and status comments go to `err`.
 */
int run_repair(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace ingest::app
