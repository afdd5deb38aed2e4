#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <stdexcept>

#include <readline/readline.h>
#include <readline/history.h>

#include "stackpp/vm.hpp"
#include "stackpp/vm/printer.hpp"
#include "stackpp/syntax/parser.hpp"

using namespace stackpp;

static constexpr const char* kVersion = "0.2.0";

static void printUsage(std::ostream& os) {
    os << "Usage: stackpp [options] [file]\n";
    os << "Runs the script file, or starts an interactive session without one.\n";
    os << "Options:\n";
    os << "  --trace      Log every executed value to stderr\n";
    os << "  --stats      Print VM statistics to stderr when finished\n";
    os << "  --version    Show version\n";
    os << "  --help       Show this help\n";
}

// Reads one chunk: lines up to and including the first empty one.
// Returns false once the terminal is closed and nothing was read.
static bool readChunk(std::string& code) {
    code.clear();
    while (true) {
        char* line = readline("> ");
        if (!line) {
            return !code.empty();
        }
        std::string enter(line);
        if (!enter.empty()) add_history(line);
        std::free(line);

        code += enter;
        code += '\n';
        if (enter.empty()) return true;
    }
}

static int runInteractive(vm::Machine& machine) {
    std::cout << "Stack++\n";
    vm::VM interp(machine);
    std::string code;
    while (readChunk(code)) {
        vm::Program program = syntax::parse(code);
        std::cout << "AST    : " << vm::describe(program) << "\n";
        interp.eval(program);
        std::cout << "Result : " << vm::describe(machine) << "\n";
    }
    return 0;
}

static int runFile(vm::Machine& machine, const std::string& path) {
    vm::Program program;
    try {
        program = syntax::loadProgramFromFile(path);
    } catch (const std::exception& e) {
        std::cerr << "Error! " << e.what() << "\n";
        return 1;
    }
    vm::evaluate(program, machine);
    return 0;
}

int main(int argc, char** argv) {
    std::string path;
    bool trace = false;
    bool showStats = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0) {
            printUsage(std::cout);
            return 0;
        } else if (strcmp(argv[i], "--version") == 0) {
            std::cout << "Stack++ " << kVersion << "\n";
            return 0;
        } else if (strcmp(argv[i], "--trace") == 0) {
            trace = true;
        } else if (strcmp(argv[i], "--stats") == 0) {
            showStats = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option " << argv[i] << "\n";
            printUsage(std::cerr);
            return 2;
        } else if (path.empty()) {
            path = argv[i];
        } else {
            std::cerr << "Error: more than one input file\n";
            printUsage(std::cerr);
            return 2;
        }
    }

    try {
        vm::Machine machine;
        machine.setTraceEnabled(trace);

        int rc = path.empty() ? runInteractive(machine) : runFile(machine, path);

        if (showStats) {
            machine.stats.print(std::cerr);
        }
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "VM error: " << e.what() << "\n";
        return 1;
    }
}
