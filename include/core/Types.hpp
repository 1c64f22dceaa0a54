#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace AgpAssembler {

/**
 * @brief AGP v2.1 component type (column 5).
 *
 * A, D, F, G, O, P and W place a component sequence. N and U describe gaps.
 */
enum class ComponentType : uint8_t {
    A,  ///< Active finishing
    D,  ///< Draft HTG
    F,  ///< Finished HTG
    G,  ///< Whole genome finishing
    O,  ///< Other sequence
    P,  ///< Pre draft
    W,  ///< WGS contig
    N,  ///< Gap with specified size
    U   ///< Gap of unknown size (always 100 bp)
};

/**
 * @brief Component orientation (column 9 of component lines).
 */
enum class Orientation : uint8_t {
    PLUS,     ///< "+"
    MINUS,    ///< "-"
    UNKNOWN,  ///< "?"
    ZERO,     ///< "0"
    NA        ///< "na"
};

/**
 * @brief Gap type (column 7 of gap lines).
 */
enum class GapType : uint8_t {
    SCAFFOLD,
    CONTIG,
    CENTROMERE,
    SHORT_ARM,
    HETEROCHROMATIN,
    TELOMERE,
    REPEAT,
    CONTAMINATION
};

enum class Linkage : uint8_t {
    YES,
    NO
};

/**
 * @brief Linkage evidence vocabulary (column 9 of gap lines, ';' separated).
 */
enum class LinkageEvidence : uint8_t {
    NA,
    PAIRED_ENDS,
    ALIGN_GENUS,
    ALIGN_XGENUS,
    ALIGN_TRNSCPT,
    WITHIN_CLONE,
    CLONE_CONTIG,
    MAP,
    PCR,
    PROXIMITY_LIGATION,
    STROBE,
    UNSPECIFIED
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Per-record details
};

// ==================================================
// Rule tables
// ==================================================

namespace Tables {

inline constexpr std::array<std::pair<std::string_view, ComponentType>, 9> kComponentTypes = {{
    {"A", ComponentType::A},
    {"D", ComponentType::D},
    {"F", ComponentType::F},
    {"G", ComponentType::G},
    {"O", ComponentType::O},
    {"P", ComponentType::P},
    {"W", ComponentType::W},
    {"N", ComponentType::N},
    {"U", ComponentType::U},
}};

inline constexpr std::array<std::pair<std::string_view, Orientation>, 5> kOrientations = {{
    {"+", Orientation::PLUS},
    {"-", Orientation::MINUS},
    {"?", Orientation::UNKNOWN},
    {"0", Orientation::ZERO},
    {"na", Orientation::NA},
}};

inline constexpr std::array<std::pair<std::string_view, GapType>, 8> kGapTypes = {{
    {"scaffold", GapType::SCAFFOLD},
    {"contig", GapType::CONTIG},
    {"centromere", GapType::CENTROMERE},
    {"short_arm", GapType::SHORT_ARM},
    {"heterochromatin", GapType::HETEROCHROMATIN},
    {"telomere", GapType::TELOMERE},
    {"repeat", GapType::REPEAT},
    {"contamination", GapType::CONTAMINATION},
}};

inline constexpr std::array<std::pair<std::string_view, Linkage>, 2> kLinkages = {{
    {"yes", Linkage::YES},
    {"no", Linkage::NO},
}};

inline constexpr std::array<std::pair<std::string_view, LinkageEvidence>, 12> kLinkageEvidence = {{
    {"na", LinkageEvidence::NA},
    {"paired-ends", LinkageEvidence::PAIRED_ENDS},
    {"align_genus", LinkageEvidence::ALIGN_GENUS},
    {"align_xgenus", LinkageEvidence::ALIGN_XGENUS},
    {"align_trnscpt", LinkageEvidence::ALIGN_TRNSCPT},
    {"within_clone", LinkageEvidence::WITHIN_CLONE},
    {"clone_contig", LinkageEvidence::CLONE_CONTIG},
    {"map", LinkageEvidence::MAP},
    {"pcr", LinkageEvidence::PCR},
    {"proximity_ligation", LinkageEvidence::PROXIMITY_LIGATION},
    {"strobe", LinkageEvidence::STROBE},
    {"unspecified", LinkageEvidence::UNSPECIFIED},
}};

/// Exact-match lookup of a token in one of the tables above.
template <typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::array<std::pair<std::string_view, Enum>, N>& table, std::string_view token) {
    for (const auto& entry : table) {
        if (entry.first == token) {
            return entry.second;
        }
    }
    return std::nullopt;
}

/// Reverse lookup, returns "?" for values missing from the table.
template <typename Enum, std::size_t N>
std::string_view name_of(const std::array<std::pair<std::string_view, Enum>, N>& table, Enum value) {
    for (const auto& entry : table) {
        if (entry.second == value) {
            return entry.first;
        }
    }
    return "?";
}

}  // namespace Tables

inline std::optional<ComponentType> parse_component_type(std::string_view s) {
    return Tables::lookup(Tables::kComponentTypes, s);
}

inline std::optional<Orientation> parse_orientation(std::string_view s) {
    return Tables::lookup(Tables::kOrientations, s);
}

inline std::optional<GapType> parse_gap_type(std::string_view s) {
    return Tables::lookup(Tables::kGapTypes, s);
}

inline std::optional<Linkage> parse_linkage(std::string_view s) {
    return Tables::lookup(Tables::kLinkages, s);
}

inline std::optional<LinkageEvidence> parse_linkage_evidence(std::string_view s) {
    return Tables::lookup(Tables::kLinkageEvidence, s);
}

inline std::string component_type_to_string(ComponentType t) {
    return std::string(Tables::name_of(Tables::kComponentTypes, t));
}

inline std::string orientation_to_string(Orientation o) {
    return std::string(Tables::name_of(Tables::kOrientations, o));
}

inline std::string gap_type_to_string(GapType g) {
    return std::string(Tables::name_of(Tables::kGapTypes, g));
}

inline std::string linkage_to_string(Linkage l) {
    return std::string(Tables::name_of(Tables::kLinkages, l));
}

inline std::string linkage_evidence_to_string(LinkageEvidence e) {
    return std::string(Tables::name_of(Tables::kLinkageEvidence, e));
}

/**
 * @brief True for the gap component types (N and U).
 */
inline bool is_gap_type(ComponentType t) {
    return t == ComponentType::N || t == ComponentType::U;
}

/**
 * @brief True when the component must be reverse complemented.
 *
 * Only "-" flips the strand; "?", "0" and "na" are emitted as stored.
 */
inline bool is_reverse(Orientation o) {
    return o == Orientation::MINUS;
}

/// Gaps of type U have a fixed size.
inline constexpr int64_t kUnknownGapLength = 100;

/// Character used to materialise gap runs.
inline constexpr char kGapChar = 'N';

}  // namespace AgpAssembler
