/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: similarity.cpp
 * ============================================================================
 */

#include "similarity.hpp"
#include <cctype>

namespace assets {

namespace {

// Bytes of multi-byte UTF-8 sequences count as word characters so accented
// descriptions ("PRÉLÈVEMENT") are not split mid-word.
bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

void add_word(std::set<std::string>& out, const std::string& word) {
    std::string padded = "  " + word + " ";
    for (size_t i = 0; i + 3 <= padded.size(); ++i) {
        out.insert(padded.substr(i, 3));
    }
}

} // namespace

std::set<std::string> trigrams(const std::string& text) {
    std::set<std::string> out;
    std::string word;
    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            word += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else if (!word.empty()) {
            add_word(out, word);
            word.clear();
        }
    }
    if (!word.empty()) add_word(out, word);
    return out;
}

double trigram_similarity(const std::string& a, const std::string& b) {
    std::set<std::string> ta = trigrams(a);
    std::set<std::string> tb = trigrams(b);
    if (ta.empty() || tb.empty()) return 0.0;

    size_t shared = 0;
    for (const auto& t : ta) {
        if (tb.count(t)) ++shared;
    }
    size_t total = ta.size() + tb.size() - shared;
    return static_cast<double>(shared) / static_cast<double>(total);
}

} // namespace assets
