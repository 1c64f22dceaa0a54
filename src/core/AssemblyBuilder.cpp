#include "core/AssemblyBuilder.hpp"

#include <utility>

#include "utils/Logger.hpp"
#include "utils/SequenceUtils.hpp"

namespace AgpAssembler {

AssemblyBuilder::AssemblyBuilder(SequenceSource& source, std::ostream& out, const BuilderOptions& options)
    : source_(source), writer_(out, options.line_width), options_(options) {
}

std::optional<AgpError> AssemblyBuilder::add(const AgpRecord& record, size_t line_number) {
    FoldResult fold = apply_record(std::move(state_), record, line_number);
    state_ = std::move(fold.state);

    // A header is written as soon as the object is accepted, so a later
    // part-number failure still leaves the header on the stream.
    if (fold.starts_object) {
        writer_.begin_record(record.object_id);
        ++summary_.num_objects;
        LOG_DEBUG("Object " + record.object_id + " started at line " + std::to_string(line_number));
    }
    if (fold.error) {
        return fold.error;
    }

    if (record.is_gap()) {
        const GapPart& gap = record.gap();
        writer_.write_run(kGapChar, gap.gap_length);
        ++summary_.num_gap_records;
        summary_.gap_bases += gap.gap_length;
        return std::nullopt;
    }

    return emit_component(record, line_number);
}

std::optional<AgpError> AssemblyBuilder::emit_component(const AgpRecord& record, size_t line_number) {
    const ComponentPart& comp = record.component();

    int64_t stored_length = source_.sequence_length(comp.component_id);
    if (stored_length < 0) {
        return AgpError(ErrorKind::RETRIEVAL, line_number,
                        "component " + comp.component_id + " not found in the component FASTA");
    }

    std::string seq;
    if (options_.slice_components) {
        if (comp.component_end > stored_length) {
            return AgpError(ErrorKind::RETRIEVAL, line_number,
                            "component " + comp.component_id + " is " + std::to_string(stored_length) +
                                " bp but the AGP line ends at " + std::to_string(comp.component_end));
        }
        seq = source_.fetch_sequence(comp.component_id, comp.component_begin - 1, comp.component_end);
    } else {
        seq = source_.fetch_sequence(comp.component_id);
        if (static_cast<int64_t>(seq.size()) != comp.length()) {
            ++summary_.length_mismatches;
            LOG_WARNING("line " + std::to_string(line_number) + ": component " + comp.component_id + " is " +
                        std::to_string(seq.size()) + " bp but the AGP line spans " +
                        std::to_string(comp.length()) + " bp; emitting the full component");
        }
    }

    if (seq.empty() && stored_length > 0) {
        return AgpError(ErrorKind::RETRIEVAL, line_number,
                        "failed to fetch sequence for component " + comp.component_id);
    }

    if (is_reverse(comp.orientation)) {
        writer_.write_sequence(Utils::reverse_complement(seq));
    } else {
        writer_.write_sequence(seq);
    }

    ++summary_.num_component_records;
    summary_.sequence_bases += static_cast<int64_t>(seq.size());
    return std::nullopt;
}

std::optional<AgpError> AssemblyBuilder::finish(size_t line_number) {
    if (auto err = finish_state(state_, line_number)) {
        return err;
    }
    writer_.finish();
    return std::nullopt;
}

}  // namespace AgpAssembler
