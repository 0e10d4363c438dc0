#include "analysis/run_summary.hpp"
#include "common/logging.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
    os << "Usage: ramm_summary [options]\n"
       << "  --file <jsonl>   Print statistics for one step log and export it as CSV\n"
       << "  --dir <dir>      Directory of step logs (default: data/raw)\n"
       << "  --output <csv>   Summary report path (default: data/processed/summary_report.csv)\n"
       << "  --help           Show this help\n";
}

int process_file(const std::string& path) {
    auto records = ramm::load_jsonl(path);
    std::cout << "Loaded " << records.size() << " records from " << path << "\n";

    auto summary = ramm::summarize(records);
    summary.source_file = std::filesystem::path(path).filename().string();
    ramm::print_summary(summary, std::cout);

    std::filesystem::path csv_path =
        std::filesystem::path("data/processed") /
        std::filesystem::path(path).filename().replace_extension(".csv");
    std::filesystem::create_directories(csv_path.parent_path());
    ramm::write_flat_csv(records, csv_path.string());
    std::cout << "\nExported CSV: " << csv_path.string() << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string file;
    std::string dir    = "data/raw";
    std::string output = "data/processed/summary_report.csv";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--dir" && i + 1 < argc) {
            dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--help") {
            print_usage(std::cout);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(std::cerr);
            return 1;
        }
    }

    try {
        ramm::init_logging("info");
        if (!file.empty()) {
            return process_file(file);
        }

        size_t n = ramm::write_directory_summary(dir, output);
        std::cout << "Summary report written to: " << output << "\n"
                  << "Total experiments: " << n << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
