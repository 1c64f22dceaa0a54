#pragma once

#include <string>

#include "core/AssemblyBuilder.hpp"
#include "core/Types.hpp"

namespace AgpAssembler {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated by Utils::ArgParser (CLI11 handles existence checks) and
 * checked further by validate().
 */
struct Config {
    // Input/Output
    std::string agp_path;         ///< AGP v2.1 file (Required)
    std::string components_path;  ///< FASTA with component sequences (Required, plain or BGZF)
    std::string output_path = "-";  ///< FASTA output, "-" for stdout

    // Output formatting
    int line_width = 0;             ///< Bases per output line, 0 = no wrapping
    bool slice_components = false;  ///< Emit component_begin..component_end instead of the full component

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional log file (appended)

    /**
     * @brief Validates configuration values and input formats.
     *
     * Performs checks that CLI11 cannot handle:
     * - the component file must be a FASTA readable by htslib and not plain gzip
     * - the line width must not be negative
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Logs the current configuration at info level.
     */
    void print() const;

    bool writes_to_stdout() const { return output_path.empty() || output_path == "-"; }

    BuilderOptions builder_options() const {
        BuilderOptions options;
        options.slice_components = slice_components;
        options.line_width = line_width;
        return options;
    }
};

}  // namespace AgpAssembler
