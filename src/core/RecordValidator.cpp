#include "core/RecordValidator.hpp"

#include <charconv>

namespace AgpAssembler {

namespace {

bool is_trailing_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

}  // namespace

std::vector<std::string_view> RecordValidator::split_fields(std::string_view line) {
    while (!line.empty() && is_trailing_space(line.back())) {
        line.remove_suffix(1);
    }

    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::optional<int64_t> RecordValidator::parse_integer(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    int64_t value = 0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

LineResult RecordValidator::validate(std::string_view line, size_t line_number) {
    // Header comments
    if (!line.empty() && line.front() == '#') {
        if (in_body_) {
            return LineResult::failure(ErrorKind::STRUCTURAL, line_number, "illegal comment in AGP body");
        }
        return LineResult::comment();
    }
    in_body_ = true;

    auto fields = split_fields(line);
    if (fields.size() != kFieldCount) {
        return LineResult::failure(ErrorKind::STRUCTURAL, line_number,
                                   "lines should have 9 tab delimited fields (found " +
                                       std::to_string(fields.size()) + ")");
    }

    for (const auto& f : fields) {
        if (f.empty()) {
            return LineResult::failure(ErrorKind::STRUCTURAL, line_number, "detected empty field");
        }
    }

    AgpRecord rec;
    rec.object_id = std::string(fields[0]);

    auto obj_beg = parse_integer(fields[1]);
    auto obj_end = parse_integer(fields[2]);
    if (!obj_beg || !obj_end) {
        return LineResult::failure(ErrorKind::COORDINATE, line_number, "object coordinates should be integers");
    }
    if (*obj_beg < 1 || *obj_end < 1) {
        return LineResult::failure(ErrorKind::COORDINATE, line_number,
                                   "object coordinates should be 1-indexed and positive");
    }
    if (*obj_beg > *obj_end) {
        return LineResult::failure(ErrorKind::COORDINATE, line_number,
                                   "beginning object coordinate should be <= the end coordinate");
    }
    rec.object_begin = *obj_beg;
    rec.object_end = *obj_end;

    auto pid = parse_integer(fields[3]);
    if (!pid) {
        // Sign and continuity are checked by the coverage fold
        return LineResult::failure(ErrorKind::COORDINATE, line_number, "part_number should be an integer");
    }
    rec.part_number = *pid;

    auto comp_type = parse_component_type(fields[4]);
    if (!comp_type) {
        return LineResult::failure(ErrorKind::ENUM, line_number,
                                   "invalid component type: " + std::string(fields[4]));
    }
    rec.component_type = *comp_type;

    auto part_error = is_gap_type(rec.component_type) ? parse_gap(rec, fields, line_number)
                                                      : parse_component(rec, fields, line_number);
    if (part_error) {
        LineResult r;
        r.error = std::move(part_error);
        return r;
    }

    if (rec.part_length() != rec.object_length()) {
        return LineResult::failure(ErrorKind::CONSISTENCY, line_number,
                                   "object and component coordinates have inconsistent lengths (" +
                                       std::to_string(rec.object_length()) + " vs " +
                                       std::to_string(rec.part_length()) + ")");
    }

    return LineResult::success(std::move(rec));
}

std::optional<AgpError> RecordValidator::parse_component(AgpRecord& rec,
                                                         const std::vector<std::string_view>& fields,
                                                         size_t line_number) const {
    ComponentPart part;
    part.component_id = std::string(fields[5]);

    auto comp_beg = parse_integer(fields[6]);
    auto comp_end = parse_integer(fields[7]);
    if (!comp_beg || !comp_end) {
        return AgpError(ErrorKind::COORDINATE, line_number, "component coordinates should be integers");
    }
    if (*comp_beg < 1 || *comp_end < 1) {
        return AgpError(ErrorKind::COORDINATE, line_number,
                        "component coordinates should be 1-indexed and positive");
    }
    if (*comp_beg > *comp_end) {
        return AgpError(ErrorKind::COORDINATE, line_number,
                        "beginning component coordinate should be less than or equal to the end coordinate");
    }
    part.component_begin = *comp_beg;
    part.component_end = *comp_end;

    auto orientation = parse_orientation(fields[8]);
    if (!orientation) {
        return AgpError(ErrorKind::ENUM, line_number, "invalid orientation: " + std::string(fields[8]));
    }
    part.orientation = *orientation;

    rec.part = std::move(part);
    return std::nullopt;
}

std::optional<AgpError> RecordValidator::parse_gap(AgpRecord& rec, const std::vector<std::string_view>& fields,
                                                   size_t line_number) const {
    GapPart part;

    auto gap_len = parse_integer(fields[5]);
    if (!gap_len) {
        return AgpError(ErrorKind::COORDINATE, line_number, "gap length should be an integer");
    }

    auto gap_type = parse_gap_type(fields[6]);
    if (!gap_type) {
        return AgpError(ErrorKind::ENUM, line_number, "invalid gap type: " + std::string(fields[6]));
    }

    auto linkage = parse_linkage(fields[7]);
    if (!linkage) {
        return AgpError(ErrorKind::ENUM, line_number, "invalid linkage field: " + std::string(fields[7]));
    }

    if (*gap_len < 1) {
        return AgpError(ErrorKind::COORDINATE, line_number, "gap length must be >0");
    }
    if (rec.component_type == ComponentType::U && *gap_len != kUnknownGapLength) {
        return AgpError(ErrorKind::COORDINATE, line_number, "gaps of type 'U' must be 100 bp");
    }

    // Evidence is a ';' separated list; an empty token is invalid
    std::string_view evidence = fields[8];
    size_t start = 0;
    while (true) {
        size_t semi = evidence.find(';', start);
        std::string_view token =
            evidence.substr(start, semi == std::string_view::npos ? std::string_view::npos : semi - start);
        auto parsed = parse_linkage_evidence(token);
        if (!parsed) {
            return AgpError(ErrorKind::ENUM, line_number, "invalid linkage evidence: " + std::string(token));
        }
        part.evidence.push_back(*parsed);
        if (semi == std::string_view::npos) {
            break;
        }
        start = semi + 1;
    }

    part.gap_length = *gap_len;
    part.gap_type = *gap_type;
    part.linkage = *linkage;
    rec.part = std::move(part);
    return std::nullopt;
}

}  // namespace AgpAssembler
