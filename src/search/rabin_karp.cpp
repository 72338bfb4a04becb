#include "search/rabin_karp.h"

namespace mobilitykit {

namespace {

int char_code(char c) {
    return static_cast<unsigned char>(c);
}

}  // namespace

std::vector<size_t> rabin_karp_search(const std::string& text, const std::string& pattern) {
    std::vector<size_t> matches;
    if (pattern.empty() || text.empty() || pattern.size() > text.size()) {
        return matches;
    }

    const size_t m = pattern.size();
    const size_t n = text.size();

    // Weight of the leading character: base^(m-1) mod q.
    int lead_weight = 1;
    for (size_t i = 0; i + 1 < m; ++i) {
        lead_weight = (lead_weight * kRabinKarpBase) % kRabinKarpModulus;
    }

    int pattern_hash = 0;
    int window_hash = 0;
    for (size_t i = 0; i < m; ++i) {
        pattern_hash = (kRabinKarpBase * pattern_hash + char_code(pattern[i])) % kRabinKarpModulus;
        window_hash = (kRabinKarpBase * window_hash + char_code(text[i])) % kRabinKarpModulus;
    }

    for (size_t i = 0; i + m <= n; ++i) {
        if (pattern_hash == window_hash && text.compare(i, m, pattern) == 0) {
            matches.push_back(i);
        }

        if (i + m < n) {
            window_hash = (kRabinKarpBase * (window_hash - char_code(text[i]) * lead_weight) +
                           char_code(text[i + m])) % kRabinKarpModulus;
            if (window_hash < 0) {
                window_hash += kRabinKarpModulus;
            }
        }
    }
    return matches;
}

bool rabin_karp_contains(const std::string& text, const std::string& pattern) {
    return !rabin_karp_search(text, pattern).empty();
}

}  // namespace mobilitykit
