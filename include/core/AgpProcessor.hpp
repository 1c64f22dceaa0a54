#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "core/AgpError.hpp"
#include "core/AssemblyBuilder.hpp"
#include "core/SequenceSource.hpp"

namespace AgpAssembler {

/**
 * @brief Outcome of converting one AGP file.
 */
struct ProcessResult {
    bool success = false;
    std::optional<AgpError> error;
    AssemblySummary summary;
    size_t lines_read = 0;
    size_t comment_lines = 0;
};

/**
 * @brief Drives a single forward pass over an AGP stream.
 *
 * Each line is validated, folded into the AssemblyBuilder and written out
 * before the next line is read. The first error stops the pass; text already
 * written stays on the output stream.
 */
class AgpProcessor {
public:
    AgpProcessor(SequenceSource& source, const BuilderOptions& options = {});

    /**
     * @brief Converts an AGP stream to FASTA.
     */
    ProcessResult process(std::istream& agp, std::ostream& out);

    /**
     * @brief Opens the AGP file and converts it.
     * @return IO error if the file cannot be opened or read.
     */
    ProcessResult process_file(const std::string& agp_path, std::ostream& out);

    /**
     * @brief Logs the counters of a finished run.
     */
    static void print_summary(const ProcessResult& result);

private:
    SequenceSource& source_;
    BuilderOptions options_;
};

}  // namespace AgpAssembler
