#include "io/FastaWriter.hpp"

#include <algorithm>

namespace AgpAssembler {

namespace {

constexpr size_t kRunChunk = 4096;

}  // namespace

FastaWriter::FastaWriter(std::ostream& out, int line_width)
    : out_(out), line_width_(line_width > 0 ? line_width : 0) {
}

void FastaWriter::begin_record(const std::string& name) {
    if (records_ > 0) {
        // End the previous sequence line, then the blank separator line
        out_ << "\n\n";
    }
    out_ << '>' << name << '\n';
    column_ = 0;
    ++records_;
}

void FastaWriter::write_sequence(std::string_view seq) {
    write_wrapped(seq.data(), seq.size());
}

void FastaWriter::write_run(char c, int64_t length) {
    if (length <= 0) {
        return;
    }
    std::string chunk(static_cast<size_t>(std::min<int64_t>(length, kRunChunk)), c);
    int64_t remaining = length;
    while (remaining > 0) {
        size_t n = static_cast<size_t>(std::min<int64_t>(remaining, static_cast<int64_t>(chunk.size())));
        write_wrapped(chunk.data(), n);
        remaining -= static_cast<int64_t>(n);
    }
}

void FastaWriter::finish() {
    out_ << '\n';
    out_.flush();
}

void FastaWriter::write_wrapped(const char* data, size_t n) {
    bases_ += static_cast<int64_t>(n);
    if (line_width_ == 0) {
        out_.write(data, static_cast<std::streamsize>(n));
        return;
    }

    // Line breaks are written lazily so an object never ends with an empty line
    size_t pos = 0;
    while (pos < n) {
        if (column_ == line_width_) {
            out_ << '\n';
            column_ = 0;
        }
        size_t take = std::min(n - pos, static_cast<size_t>(line_width_ - column_));
        out_.write(data + pos, static_cast<std::streamsize>(take));
        column_ += static_cast<int64_t>(take);
        pos += take;
    }
}

}  // namespace AgpAssembler
