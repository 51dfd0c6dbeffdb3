/**
 * Batch TRH quantification from exported GC-MS integration reports.
 *
 * Usage:
 *   trh_quant --method METHOD.xml --blank BLANK.csv [--blank ...]
 *             --output RESULTS.csv [--quiet] SAMPLE.csv [SAMPLE.csv ...]
 *
 * Exit status is 0 when every sample/fraction was quantified, 1 when some
 * failed (results for the others are still written) and 2 on usage,
 * input or blank errors.
 */

#include <iostream>
#include <string>
#include <vector>

#include "trh/trh.hpp"

using namespace trh;

namespace {

struct CommandLine {
    std::string method_file;
    std::string output_file;
    std::vector<std::string> blank_files;
    std::vector<std::string> sample_files;
    bool quiet = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " --method METHOD.xml --blank BLANK.csv [--blank ...]\n"
              << "       --output RESULTS.csv [--quiet] SAMPLE.csv [SAMPLE.csv ...]\n";
}

bool parseCommandLine(int argc, char** argv, CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--method") {
            if (!value(cmd.method_file)) return false;
        } else if (arg == "--output") {
            if (!value(cmd.output_file)) return false;
        } else if (arg == "--blank") {
            std::string blank;
            if (!value(blank)) return false;
            cmd.blank_files.push_back(blank);
        } else if (arg == "--quiet") {
            cmd.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        } else {
            cmd.sample_files.push_back(arg);
        }
    }

    if (cmd.method_file.empty() || cmd.output_file.empty() ||
        cmd.blank_files.empty() || cmd.sample_files.empty()) {
        std::cerr << "--method, --output, at least one --blank and one sample "
                     "report are required\n";
        return false;
    }
    return true;
}

std::vector<SampleRun> loadReports(const std::vector<std::string>& files) {
    io::ReportReader reader;
    std::vector<SampleRun> runs;
    runs.reserve(files.size());
    for (const auto& file : files) {
        runs.push_back(reader.read(file));
    }
    return runs;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        MethodConfig method = io::loadMethod(cmd.method_file);
        std::vector<SampleRun> blanks = loadReports(cmd.blank_files);
        std::vector<SampleRun> samples = loadReports(cmd.sample_files);

        BatchOptions options;
        if (!cmd.quiet) {
            options.progress_callback = [](int current, int total) {
                std::cerr << "Processed sample " << current << " of " << total << "\n";
                return true;
            };
        }

        BatchProcessor processor(method, options);
        BatchResult result = processor.run(blanks, samples);

        io::CsvWriter writer;
        writer.write(result.records, cmd.output_file, io::standardFieldnames());

        for (const auto& failure : result.failures) {
            std::cerr << "FAILED: " << failure.describe() << "\n";
        }

        if (!cmd.quiet) {
            const auto& blank = *result.blank_average;
            std::cout << "Method: " << method.name << " (" << toString(method.mode)
                      << " mode)\n";
            std::cout << "Blank runs averaged: " << blank.runCount()
                      << ", mean ISTD area " << blank.istd() << "\n";
            for (const auto& [fraction, area] : blank.fractionAreas()) {
                std::cout << "  Blank " << toString(fraction) << " area: " << area << "\n";
            }
            std::cout << "Samples: " << result.samples_processed
                      << ", results: " << result.records.size()
                      << ", failures: " << result.failures.size() << "\n";
            std::cout << "Results written to " << cmd.output_file << "\n";
        }

        return result.hasFailures() ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
