#include "utils/FastaReader.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace AgpAssembler {

FastaReader::FastaReader(const std::string& fasta_path)
    : fasta_path_(fasta_path), fai_(nullptr) {
    // fai_load builds the .fai next to the FASTA when it does not exist yet
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw std::runtime_error("Failed to load FASTA index: " + fasta_path + ".fai");
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

bool FastaReader::has_sequence(const std::string& id) const {
    if (!fai_) {
        return false;
    }
    return faidx_has_seq(fai_, id.c_str()) != 0;
}

int64_t FastaReader::sequence_length(const std::string& id) const {
    if (!has_sequence(id)) {
        return -1;
    }
    return faidx_seq_len(fai_, id.c_str());
}

std::string FastaReader::fetch_sequence(const std::string& id) {
    int64_t len = sequence_length(id);
    if (len <= 0) {
        return "";
    }
    return fetch_sequence(id, 0, len);
}

std::string FastaReader::fetch_sequence(const std::string& id, int64_t start, int64_t end) {
    if (!fai_) {
        return "";
    }

    if (start < 0 || end <= start) {
        return "";
    }

    // faidx_fetch_seq64 takes a 0-based inclusive end
    hts_pos_t len = 0;
    char* seq = faidx_fetch_seq64(fai_, id.c_str(), start, end - 1, &len);

    if (!seq || len <= 0) {
        if (seq) free(seq);
        return "";  // Sequence not found or invalid region
    }

    std::string result(seq, static_cast<size_t>(len));
    free(seq);
    return result;
}

int FastaReader::num_sequences() const {
    if (!fai_) {
        return 0;
    }
    return faidx_nseq(fai_);
}

}  // namespace AgpAssembler
