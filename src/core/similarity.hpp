/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: similarity.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Trigram text similarity for transaction descriptions.
 *
 * Text is split into words of letters and digits, lowercased, and every word
 * is padded with two leading blanks and one trailing blank ("  vir "). The
 * distinct three-character windows of the padded words form the trigram set.
 * Similarity is |A intersect B| / |A union B|, in [0, 1].
 *
 * Bank exports and payslips describe the same transfer with reordered
 * words ("VIR SALAIRE" vs "SALAIRE VIREMENT"); trigram sets are insensitive
 * to word order, which plain edit distance is not.
 * ============================================================================
 */

#ifndef ASSETS_SIMILARITY_HPP
#define ASSETS_SIMILARITY_HPP

#include <set>
#include <string>

namespace assets {

    std::set<std::string> trigrams(const std::string& text);

    double trigram_similarity(const std::string& a, const std::string& b);

} // namespace assets

#endif // ASSETS_SIMILARITY_HPP
