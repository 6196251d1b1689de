#include "cli_common.hpp"
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Computes and compares bicycle frame geometry.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  layout <bike.json> [-o out.json]    Export the computed frame layout\n";
    std::cerr << "  report [-j bike.json]...             Print dimensional reports\n";
    std::cerr << "  compare -j a.json -j b.json [-o f]   Compare measurements side by side\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -j, --json <file>   Bike file (repeat to compare several bikes)\n";
    std::cerr << "  -o, --output <file> Output file (defaults to stdout)\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  -h, --help          Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BIKEFIT_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "layout") {
        return bikefit::cli::command_layout(argc, argv);
    } else if (command == "report") {
        return bikefit::cli::command_report(argc, argv);
    } else if (command == "compare") {
        return bikefit::cli::command_compare(argc, argv);
    } else if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
