#include "core/AgpProcessor.hpp"

#include <fstream>

#include "core/RecordValidator.hpp"
#include "utils/Logger.hpp"

namespace AgpAssembler {

AgpProcessor::AgpProcessor(SequenceSource& source, const BuilderOptions& options)
    : source_(source), options_(options) {
}

ProcessResult AgpProcessor::process(std::istream& agp, std::ostream& out) {
    ProcessResult result;
    RecordValidator validator;
    AssemblyBuilder builder(source_, out, options_);

    std::string line;
    size_t line_number = 0;
    while (std::getline(agp, line)) {
        ++line_number;

        LineResult parsed = validator.validate(line, line_number);
        if (!parsed.ok()) {
            result.error = parsed.error;
            break;
        }
        if (parsed.is_comment) {
            ++result.comment_lines;
            continue;
        }

        if (auto err = builder.add(*parsed.record, line_number)) {
            result.error = err;
            break;
        }
    }
    result.lines_read = line_number;

    if (!result.error && agp.bad()) {
        result.error = AgpError(ErrorKind::IO, line_number, "read error in AGP input");
    }

    // Coverage of the last object is reported against the last line read
    if (!result.error) {
        if (auto err = builder.finish(line_number)) {
            result.error = err;
        }
    }

    if (!result.error && !out) {
        result.error = AgpError(ErrorKind::IO, 0, "failed to write FASTA output");
    }

    out.flush();
    result.summary = builder.summary();
    result.success = !result.error.has_value();
    return result;
}

ProcessResult AgpProcessor::process_file(const std::string& agp_path, std::ostream& out) {
    std::ifstream in(agp_path);
    if (!in.is_open()) {
        ProcessResult result;
        result.error = AgpError(ErrorKind::IO, 0, "cannot open AGP file: " + agp_path);
        return result;
    }
    return process(in, out);
}

void AgpProcessor::print_summary(const ProcessResult& result) {
    const AssemblySummary& s = result.summary;
    LOG_INFO("Lines read: " + std::to_string(result.lines_read) + " (" + std::to_string(result.comment_lines) +
             " comments)");
    LOG_INFO("Objects written: " + std::to_string(s.num_objects));
    LOG_INFO("Component records: " + std::to_string(s.num_component_records) + " (" +
             std::to_string(s.sequence_bases) + " bp)");
    LOG_INFO("Gap records: " + std::to_string(s.num_gap_records) + " (" + std::to_string(s.gap_bases) + " bp)");
    if (s.length_mismatches > 0) {
        LOG_WARNING(std::to_string(s.length_mismatches) +
                    " component(s) differ in length from their AGP span");
    }
}

}  // namespace AgpAssembler
