#pragma once

#include <string>
#include <string_view>

namespace AgpAssembler {
namespace Utils {

/**
 * @brief Reverse complement of a nucleotide sequence, case preserved.
 *
 * A/T, C/G, R/Y, K/M, B/V and D/H are swapped in both cases.
 * S, W, N and every other byte map to themselves.
 */
std::string reverse_complement(std::string_view seq);

}  // namespace Utils
}  // namespace AgpAssembler
