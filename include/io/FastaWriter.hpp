#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace AgpAssembler {

/**
 * @brief Streams assembled objects as FASTA.
 *
 * Output layout:
 * ```
 * >object1
 * ACGT...NNNN...ACGT
 *
 * >object2
 * ...
 * ```
 * Object blocks are separated by a blank line and the stream ends with a
 * single newline. Sequence text is unwrapped unless line_width > 0.
 *
 * Text is appended as records arrive, so a failure midway leaves a valid
 * FASTA prefix on the stream.
 */
class FastaWriter {
public:
    /**
     * @param out Destination stream (not owned).
     * @param line_width Bases per line, 0 for a single line per object.
     */
    explicit FastaWriter(std::ostream& out, int line_width = 0);

    /**
     * @brief Starts a new object block with its header line.
     */
    void begin_record(const std::string& name);

    /**
     * @brief Appends bases to the current object.
     */
    void write_sequence(std::string_view seq);

    /**
     * @brief Appends `length` copies of `c` without building the run in memory.
     */
    void write_run(char c, int64_t length);

    /**
     * @brief Terminates the stream with a newline. Further writes are invalid.
     */
    void finish();

    int64_t records_written() const { return records_; }
    int64_t bases_written() const { return bases_; }

private:
    void write_wrapped(const char* data, size_t n);

    std::ostream& out_;
    int line_width_;
    int64_t column_ = 0;
    int64_t records_ = 0;
    int64_t bases_ = 0;
};

}  // namespace AgpAssembler
