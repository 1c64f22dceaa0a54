#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/AgpError.hpp"
#include "core/AgpRecord.hpp"

namespace AgpAssembler {

/**
 * @brief Half-open 0-based interval [begin, end) on an object.
 */
struct Interval {
    int64_t begin;
    int64_t end;

    bool operator<(const Interval& other) const {
        return begin < other.begin || (begin == other.begin && end < other.end);
    }
};

/**
 * @brief True iff the intervals tile [0, max_end) exactly once.
 *
 * Intervals are sorted by start; the first must begin at 0 and every
 * interval must end where the next one begins. An empty set is covered.
 */
bool is_covered(std::vector<Interval> intervals);

/**
 * @brief Rolling state for the object whose records are being read.
 */
struct ObjectCoverageState {
    std::string object_id;
    int64_t previous_part_number = 0;
    std::vector<Interval> intervals;

    explicit ObjectCoverageState(std::string id) : object_id(std::move(id)) {}
};

/**
 * @brief Everything the assembly fold remembers between records.
 */
struct BuilderState {
    std::optional<ObjectCoverageState> current;  ///< Empty before the first record
    std::unordered_set<std::string> seen_objects;
};

/**
 * @brief Result of folding one record into a BuilderState.
 */
struct FoldResult {
    BuilderState state;
    bool starts_object = false;  ///< The record opened a new object block
    std::optional<AgpError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Folds a validated record into the state.
 *
 * On an object change the new object must start at 1 and must not have been
 * seen before, and the previous object must be fully covered. Part numbers
 * must then step by exactly one. The record's interval is appended last.
 *
 * The state is taken by value; pass it with std::move to avoid copying the
 * seen-object set.
 */
FoldResult apply_record(BuilderState state, const AgpRecord& record, size_t line_number);

/**
 * @brief End-of-input check: the last object must be fully covered.
 */
std::optional<AgpError> finish_state(const BuilderState& state, size_t line_number);

}  // namespace AgpAssembler
