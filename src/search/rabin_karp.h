#pragma once
#ifndef MOBILITYKIT_RABIN_KARP_H
#define MOBILITYKIT_RABIN_KARP_H

#include <string>
#include <vector>
#include <cstddef>

namespace mobilitykit {

// Rolling hash parameters. The modulus is small so every intermediate value
// fits comfortably in a machine word.
constexpr int kRabinKarpBase = 256;
constexpr int kRabinKarpModulus = 101;

// Starting index of every (possibly overlapping) occurrence of pattern in text.
// Empty when pattern or text is empty, or the pattern is longer than the text.
std::vector<size_t> rabin_karp_search(const std::string& text, const std::string& pattern);

bool rabin_karp_contains(const std::string& text, const std::string& pattern);

}  // namespace mobilitykit

#endif  // MOBILITYKIT_RABIN_KARP_H
