#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "core/Types.hpp"

namespace AgpAssembler {

/**
 * @brief Fields 6-9 of a line placing a component sequence.
 */
struct ComponentPart {
    std::string component_id;
    int64_t component_begin = 0;  ///< 1-based inclusive
    int64_t component_end = 0;    ///< 1-based inclusive
    Orientation orientation = Orientation::PLUS;

    int64_t length() const { return component_end - component_begin + 1; }
};

/**
 * @brief Fields 6-9 of a gap line (component type N or U).
 */
struct GapPart {
    int64_t gap_length = 0;
    GapType gap_type = GapType::SCAFFOLD;
    Linkage linkage = Linkage::NO;
    std::vector<LinkageEvidence> evidence;

    int64_t length() const { return gap_length; }
};

/**
 * @brief One validated AGP body line.
 *
 * The common columns are stored directly; columns 6-9 live in `part`,
 * which holds a GapPart exactly when component_type is N or U.
 */
struct AgpRecord {
    std::string object_id;
    int64_t object_begin = 0;  ///< 1-based inclusive
    int64_t object_end = 0;    ///< 1-based inclusive
    int64_t part_number = 0;
    ComponentType component_type = ComponentType::W;
    std::variant<ComponentPart, GapPart> part;

    int64_t object_length() const { return object_end - object_begin + 1; }

    bool is_gap() const { return std::holds_alternative<GapPart>(part); }

    const ComponentPart& component() const { return std::get<ComponentPart>(part); }
    const GapPart& gap() const { return std::get<GapPart>(part); }

    /**
     * @brief Length claimed by columns 6-9 (component span or gap length).
     */
    int64_t part_length() const {
        return std::visit([](const auto& p) { return p.length(); }, part);
    }
};

}  // namespace AgpAssembler
