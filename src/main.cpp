//
// Created by Sanger Steel on 10/19/26.
//

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <unistd.h>
#include "cli.hpp"
#include "logger.hpp"

const std::string filename = "stderr";

#ifdef NDEBUG
LoggingContext Logger(filename, INFO);
#else
LoggingContext Logger(filename, DEBUG);
#endif


int main(int argc, char* argv[]) {
    signal(SIGABRT, [](int) {
        void* trace[64];
        int n = backtrace(trace, 64);
        backtrace_symbols_fd(trace, n, STDERR_FILENO);
        _exit(1);
    });

    std::vector<std::string> args(argv + 1, argv + argc);
    return run_analyzer(args, std::cout, std::cerr);
}
