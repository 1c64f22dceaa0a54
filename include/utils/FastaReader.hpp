#pragma once

#include <htslib/faidx.h>

#include <string>

#include "core/SequenceSource.hpp"

namespace AgpAssembler {

/**
 * @brief RAII wrapper for component FASTA access with HTSlib.
 *
 * Sequences are fetched on demand through faidx so only the component
 * being emitted is held in memory. A missing .fai index is built on open.
 * Bases are returned exactly as stored (case is preserved).
 *
 * Usage:
 *   FastaReader fasta("contigs.fa");
 *   std::string seq = fasta.fetch_sequence("ctg1");
 */
class FastaReader : public SequenceSource {
public:
    /**
     * @brief Opens the FASTA file and loads (or builds) its index.
     * @param fasta_path Plain or BGZF-compressed FASTA.
     * @throws std::runtime_error if the file cannot be opened or indexed.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader() override;

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    bool has_sequence(const std::string& id) const override;

    int64_t sequence_length(const std::string& id) const override;

    std::string fetch_sequence(const std::string& id) override;

    /**
     * @param start 0-based inclusive start position.
     * @param end 0-based exclusive end position.
     */
    std::string fetch_sequence(const std::string& id, int64_t start, int64_t end) override;

    /**
     * @brief Number of sequences in the index.
     */
    int num_sequences() const;

    bool is_loaded() const { return fai_ != nullptr; }

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

}  // namespace AgpAssembler
