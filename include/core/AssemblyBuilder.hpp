#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/AgpError.hpp"
#include "core/AgpRecord.hpp"
#include "core/CoverageState.hpp"
#include "core/SequenceSource.hpp"
#include "io/FastaWriter.hpp"

namespace AgpAssembler {

/**
 * @brief Options controlling how component records are materialised.
 */
struct BuilderOptions {
    /// Emit only component_begin..component_end of each component instead of the
    /// whole stored sequence.
    bool slice_components = false;
    /// Bases per output line, 0 disables wrapping.
    int line_width = 0;
};

/**
 * @brief Counters reported after a run.
 */
struct AssemblySummary {
    int64_t num_objects = 0;
    int64_t num_component_records = 0;
    int64_t num_gap_records = 0;
    int64_t sequence_bases = 0;  ///< Bases copied from components
    int64_t gap_bases = 0;       ///< Gap characters synthesised
    int64_t length_mismatches = 0;  ///< Components whose stored length differs from the AGP span
};

/**
 * @brief Folds validated AGP records into a FASTA stream.
 *
 * For each record the coverage state is advanced (see apply_record) and the
 * record's text is appended: a header when a new object starts, then either
 * the component sequence (reverse complemented for "-") or a run of 'N'.
 *
 * By default the full stored component is emitted regardless of the
 * component_begin/component_end columns. With slice_components the declared
 * range is cut out instead.
 *
 * Usage:
 *   FastaReader components("contigs.fa");
 *   AssemblyBuilder builder(components, std::cout);
 *   for (...) { if (auto err = builder.add(record, line_no)) { ... } }
 *   if (auto err = builder.finish(last_line)) { ... }
 */
class AssemblyBuilder {
public:
    AssemblyBuilder(SequenceSource& source, std::ostream& out, const BuilderOptions& options = {});

    /**
     * @brief Adds one record in file order.
     * @return The first violation found, or std::nullopt.
     */
    std::optional<AgpError> add(const AgpRecord& record, size_t line_number);

    /**
     * @brief Checks the last object and terminates the output stream.
     * @param line_number Line used to tag a final coverage failure.
     */
    std::optional<AgpError> finish(size_t line_number);

    const AssemblySummary& summary() const { return summary_; }

private:
    std::optional<AgpError> emit_component(const AgpRecord& record, size_t line_number);

    SequenceSource& source_;
    FastaWriter writer_;
    BuilderOptions options_;
    BuilderState state_;
    AssemblySummary summary_;
};

}  // namespace AgpAssembler
