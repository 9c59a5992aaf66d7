#include <iostream>
#include <string>
#include <llvm/Support/InitLLVM.h>
#include "expanse/checker.h"
#include "expanse/error_reporter.h"

void printUsage(const char* programName) {
    std::cout << "Expanse Parameter Expansion Checker\n";
    std::cout << "Usage: " << programName << " [options] <source_file.xp>\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --jobs N, -jN       Resolve calls on N threads (default: hardware concurrency)\n";
    std::cout << "  --first-violation   Report only the first violation per signature\n";
    std::cout << "  --version, -v       Print version information\n";
    std::cout << "  --help, -h          Print this help message\n";
    std::cout << "  --verbose           Enable verbose output\n";
    std::cout << "\n";
}

void printVersion() {
    std::cout << "expansec version 0.1.0\n";
    std::cout << "Expanse Parameter Expansion Checker\n";
}

int main(int argc, char* argv[]) {
    // Handle --version and --help before InitLLVM to avoid LLVM/ANTLR init on Linux
    // where library initialization can segfault (static init order, aarch64).
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "--version" || arg == "-v") {
            printVersion();
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    llvm::InitLLVM init(argc, argv);
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string sourceFile;
    expanse::CheckerOptions options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            printVersion();
            return 0;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--first-violation") {
            options.stopAtFirstViolation = true;
        } else if (arg == "--jobs" && i + 1 < argc) {
            if (!expanse::parseJobCount(argv[++i], options.jobs)) {
                std::cerr << "Invalid job count: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg.size() > 2 && arg.compare(0, 2, "-j") == 0) {
            if (!expanse::parseJobCount(arg.substr(2), options.jobs)) {
                std::cerr << "Invalid job count: " << arg.substr(2) << "\n";
                return 1;
            }
        } else if (arg[0] != '-') {
            sourceFile = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (sourceFile.empty()) {
        std::cerr << "Error: No source file specified\n";
        printUsage(argv[0]);
        return 1;
    }

    expanse::Checker checker(options);

    if (options.verbose) {
        std::cout << "Checking: " << sourceFile << "\n";
    }

    bool success = checker.check(sourceFile);

    // Warnings are printed even when the check succeeds
    if (checker.getErrorReporter().getErrorCount() > 0 ||
        checker.getErrorReporter().getWarningCount() > 0) {
        checker.getErrorReporter().print(std::cerr);
    }

    if (success && !checker.getErrorReporter().hasErrors()) {
        if (options.verbose) {
            std::cout << "Check successful!\n";
        }
        return 0;
    }
    return 1;
}
