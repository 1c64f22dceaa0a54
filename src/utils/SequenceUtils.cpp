#include "utils/SequenceUtils.hpp"

#include <array>

namespace AgpAssembler {
namespace Utils {

namespace {

std::array<unsigned char, 256> make_complement_table() {
    std::array<unsigned char, 256> t{};
    for (int i = 0; i < 256; ++i) {
        t[i] = static_cast<unsigned char>(i);
    }

    static const char* const kPairs[] = {"AT", "CG", "RY", "KM", "BV", "DH"};
    for (const char* pair : kPairs) {
        unsigned char a = static_cast<unsigned char>(pair[0]);
        unsigned char b = static_cast<unsigned char>(pair[1]);
        t[a] = b;
        t[b] = a;
        // lower case
        t[a + 32] = static_cast<unsigned char>(b + 32);
        t[b + 32] = static_cast<unsigned char>(a + 32);
    }
    return t;
}

const unsigned char* complement_table() {
    static const auto table = make_complement_table();
    return table.data();
}

}  // namespace

std::string reverse_complement(std::string_view seq) {
    const unsigned char* table = complement_table();
    std::string out(seq.size(), 'N');
    for (size_t i = 0, n = seq.size(); i < n; ++i) {
        out[n - 1 - i] = static_cast<char>(table[static_cast<unsigned char>(seq[i])]);
    }
    return out;
}

}  // namespace Utils
}  // namespace AgpAssembler
