/**
 * @file main.cpp
 * @brief cloud_backup_cli entry point
 */

#include <kcenon/cloud_backup/cli/backup_cli.h>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    // Broken connections are reported as errors, not signals
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv, argv + argc);
    return kcenon::cloud_backup::run_cli(
        args, kcenon::cloud_backup::process_environment(), std::cout, std::cerr);
}
