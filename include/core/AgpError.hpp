#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace AgpAssembler {

/**
 * @brief Classes of fatal AGP failures.
 *
 * Every error aborts the run; the kind exists so callers and tests can
 * tell failures apart without inspecting the message text.
 */
enum class ErrorKind {
    STRUCTURAL,   ///< Field count, empty field, comment after body start
    COORDINATE,   ///< Non-integer, non-positive or inverted coordinates, bad gap length
    ENUM,         ///< Value outside a fixed vocabulary
    ORDERING,     ///< Object order, part numbering, object start
    COVERAGE,     ///< Object intervals do not tile the object exactly
    CONSISTENCY,  ///< Object span differs from component/gap span
    RETRIEVAL,    ///< Component missing from the component FASTA or range outside it
    IO            ///< Input or output file cannot be used
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::STRUCTURAL: return "StructuralError";
        case ErrorKind::COORDINATE: return "CoordinateError";
        case ErrorKind::ENUM: return "EnumError";
        case ErrorKind::ORDERING: return "OrderingError";
        case ErrorKind::COVERAGE: return "CoverageError";
        case ErrorKind::CONSISTENCY: return "ConsistencyError";
        case ErrorKind::RETRIEVAL: return "RetrievalError";
        case ErrorKind::IO: return "IOError";
        default: return "UnknownError";
    }
}

/**
 * @brief A single fatal error tagged with the 1-based AGP line it came from.
 *
 * line_number is 0 when the failure is not tied to an input line
 * (e.g. the AGP file could not be opened).
 */
struct AgpError {
    ErrorKind kind;
    size_t line_number;
    std::string reason;

    AgpError(ErrorKind k, size_t line, std::string r)
        : kind(k), line_number(line), reason(std::move(r)) {}

    /**
     * @brief Renders "line N: reason", or just the reason when no line applies.
     */
    std::string message() const {
        if (line_number == 0) {
            return reason;
        }
        return "line " + std::to_string(line_number) + ": " + reason;
    }
};

}  // namespace AgpAssembler
