#pragma once

#include <cstdint>
#include <string>

namespace AgpAssembler {

/**
 * @brief Random-access lookup of component sequences by identifier.
 *
 * The assembly builder only depends on this interface. FastaReader
 * provides it over an indexed FASTA file; tests provide in-memory sources.
 */
class SequenceSource {
public:
    virtual ~SequenceSource() = default;

    virtual bool has_sequence(const std::string& id) const = 0;

    /**
     * @brief Length of the named sequence, or -1 if it is absent.
     */
    virtual int64_t sequence_length(const std::string& id) const = 0;

    /**
     * @brief Full sequence, or an empty string if it is absent.
     */
    virtual std::string fetch_sequence(const std::string& id) = 0;

    /**
     * @brief Subsequence [start, end) in 0-based coordinates.
     * @return Empty string if the id is absent or the range is invalid.
     */
    virtual std::string fetch_sequence(const std::string& id, int64_t start, int64_t end) = 0;
};

}  // namespace AgpAssembler
