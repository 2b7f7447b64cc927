#include <cstring>
#include <iostream>
#include <string>

#include "api/reconcile.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <ledger_a.csv> <ledger_b.csv> [options]\n"
              << "Rows are date,department,amount,counterpart (date as YYYY-MM-DD).\n"
              << "Options:\n"
              << "  --out <path>          Write the report to a file instead of stdout\n"
              << "  --delimiter <char>    Field delimiter (default ',')\n"
              << "  --summary             Log match counters after the run\n"
              << "  --quiet               Suppress non-error logs\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help                Show this message\n";
}

} // namespace

int main(int argc, char** argv) {
    api::ReconcileConfig cfg;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return api::kExitSuccess;
        } else if (arg == "--out" && i + 1 < argc) {
            cfg.output_path = argv[++i];
        } else if (arg == "--delimiter" && i + 1 < argc) {
            const char* val = argv[++i];
            if (std::strlen(val) != 1) {
                std::cerr << "--delimiter expects a single character\n";
                return api::kExitUsage;
            }
            cfg.delimiter = val[0];
        } else if (arg == "--summary") {
            cfg.summary = true;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && positional < 2) {
            if (positional == 0) {
                cfg.ledger_a = arg;
            } else {
                cfg.ledger_b = arg;
            }
            ++positional;
        } else {
            print_usage(argv[0]);
            return api::kExitUsage;
        }
    }

    if (positional != 2) {
        print_usage(argv[0]);
        return api::kExitUsage;
    }

    return api::run_reconcile(cfg, std::cout);
}
