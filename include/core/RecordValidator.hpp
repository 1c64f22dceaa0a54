#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/AgpError.hpp"
#include "core/AgpRecord.hpp"

namespace AgpAssembler {

/**
 * @brief Outcome of validating one AGP line.
 *
 * Exactly one of the following holds:
 * - is_comment: a header comment, nothing to fold
 * - record has a value: a valid body line
 * - error has a value: the line is malformed and processing must stop
 */
struct LineResult {
    bool is_comment = false;
    std::optional<AgpRecord> record;
    std::optional<AgpError> error;

    bool ok() const { return !error.has_value(); }

    static LineResult comment() {
        LineResult r;
        r.is_comment = true;
        return r;
    }
    static LineResult success(AgpRecord rec) {
        LineResult r;
        r.record = std::move(rec);
        return r;
    }
    static LineResult failure(ErrorKind kind, size_t line_number, std::string reason) {
        LineResult r;
        r.error = AgpError(kind, line_number, std::move(reason));
        return r;
    }
};

/**
 * @brief Parses AGP v2.1 lines into typed records.
 *
 * All checks are local to the line. The only state carried between calls
 * is whether a body line has been seen, which makes any later '#' line
 * illegal.
 *
 * Checks run in a fixed order and the first failure is reported:
 *   comment placement, field count, empty fields, object coordinates,
 *   part number, component type, columns 6-9, span consistency.
 *
 * Usage:
 *   RecordValidator validator;
 *   LineResult r = validator.validate(line, line_number);
 *   if (!r.ok()) { ... r.error->message() ... }
 */
class RecordValidator {
public:
    static constexpr size_t kFieldCount = 9;

    RecordValidator() = default;

    /**
     * @brief Validates one raw line (trailing newline allowed).
     * @param line Raw text of the line.
     * @param line_number 1-based line number used to tag errors.
     */
    LineResult validate(std::string_view line, size_t line_number);

    bool in_body() const { return in_body_; }

    /**
     * @brief Splits on tabs after stripping trailing whitespace.
     */
    static std::vector<std::string_view> split_fields(std::string_view line);

    /**
     * @brief Parses a base-10 integer that must use the whole token.
     * @return std::nullopt on any non-digit character or overflow.
     */
    static std::optional<int64_t> parse_integer(std::string_view token);

private:
    std::optional<AgpError> parse_component(AgpRecord& rec, const std::vector<std::string_view>& fields,
                                            size_t line_number) const;
    std::optional<AgpError> parse_gap(AgpRecord& rec, const std::vector<std::string_view>& fields,
                                      size_t line_number) const;

    bool in_body_ = false;
};

}  // namespace AgpAssembler
