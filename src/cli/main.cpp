/**
 * @file main.cpp
 * @brief drsid-uuid - Deterministic UUIDs for Git-DRS files
 *
 * Computes UUIDv5(UUIDv3(DNS, "aced-idp.org"),
 *                 "did:gen3:calypr.org:<path>:<sha256>:<size>")
 * so that independent tools agree on a file's identifier.
 *
 * Usage:
 *   ./drsid-uuid /data/file.bam <sha256> 1024000 [--show-canonical] [--verify UUID]
 *   ./drsid-uuid --batch manifest.json
 *
 * @date 2026-10-19
 */

#include "cli_runner.h"

#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    int exitCode = drsid::cli::EXIT_FAILED;
    try {
        exitCode = drsid::cli::runCli("drsid-uuid", args, std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    }

    std::cout.flush();
    spdlog::shutdown();
    return exitCode;
}
