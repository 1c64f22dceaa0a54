#pragma once

#include <CLI/CLI.hpp>

#include <string>

#include "core/Config.hpp"
#include "utils/Logger.hpp"

namespace AgpAssembler {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"agp2fasta - Build sequences in FASTA format from an AGP v2.1 file"};

        // Input/Output
        app.add_option("agp", config.agp_path, "AGP v2.1 file (<scaffolds.agp>)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("components", config.components_path,
                       "FASTA file with component sequences to be scaffolded; must not be gzipped")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output", config.output_path, "Output FASTA, '-' for stdout (Default: -)");

        // Formatting
        app.add_option("-w,--line-width", config.line_width, "Bases per output line, 0 = unwrapped (Default: 0)")
            ->check(CLI::NonNegativeNumber);

        app.add_flag("--slice-components", config.slice_components,
                     "Emit only the component_beg..component_end range of each component");

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Append log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help (ret=0) and errors (ret>0) both stop execution
            app.exit(e);
            return false;
        }

        auto level = parse_log_level(log_level_str);
        if (level) {
            config.log_level = *level;
        }

        return true;
    }
};

}  // namespace Utils
}  // namespace AgpAssembler
