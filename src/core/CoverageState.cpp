#include "core/CoverageState.hpp"

#include <algorithm>

namespace AgpAssembler {

bool is_covered(std::vector<Interval> intervals) {
    if (intervals.empty()) {
        return true;
    }
    std::sort(intervals.begin(), intervals.end());
    if (intervals.front().begin != 0) {
        return false;
    }
    for (size_t j = 1; j < intervals.size(); ++j) {
        if (intervals[j - 1].end != intervals[j].begin) {
            return false;
        }
    }
    return true;
}

namespace {

AgpError coverage_error(const ObjectCoverageState& obj, size_t line_number) {
    return AgpError(ErrorKind::COVERAGE, line_number,
                    "some positions in " + obj.object_id + " are not accounted for or overlap");
}

}  // namespace

FoldResult apply_record(BuilderState state, const AgpRecord& record, size_t line_number) {
    FoldResult result;

    bool transition = !state.current || state.current->object_id != record.object_id;
    if (transition) {
        if (record.object_begin != 1) {
            result.error = AgpError(ErrorKind::ORDERING, line_number, "all objects should start with '1'");
        } else if (state.seen_objects.count(record.object_id) > 0) {
            result.error = AgpError(ErrorKind::ORDERING, line_number,
                                    "object identifier out of order: " + record.object_id);
        } else if (state.current && !is_covered(state.current->intervals)) {
            result.error = coverage_error(*state.current, line_number);
        }

        if (result.error) {
            result.state = std::move(state);
            return result;
        }

        state.seen_objects.insert(record.object_id);
        state.current.emplace(record.object_id);
        result.starts_object = true;
    }

    ObjectCoverageState& obj = *state.current;
    if (record.part_number - obj.previous_part_number != 1) {
        result.error = AgpError(ErrorKind::ORDERING, line_number,
                                "non-sequential part_numbers (" + std::to_string(obj.previous_part_number) +
                                    " followed by " + std::to_string(record.part_number) + ")");
        result.state = std::move(state);
        return result;
    }
    obj.previous_part_number = record.part_number;
    obj.intervals.push_back({record.object_begin - 1, record.object_end});

    result.state = std::move(state);
    return result;
}

std::optional<AgpError> finish_state(const BuilderState& state, size_t line_number) {
    if (state.current && !is_covered(state.current->intervals)) {
        return coverage_error(*state.current, line_number);
    }
    return std::nullopt;
}

}  // namespace AgpAssembler
