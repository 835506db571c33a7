#include "ingest/app/commands.hpp"
#include "ingest/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    ingest::init_logging(spdlog::level::warn);

    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return ingest::app::run_repair(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        spdlog::critical("repair_structure failed: {}", e.what());
        return 1;
    }
}
