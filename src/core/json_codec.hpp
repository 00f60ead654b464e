/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_codec.hpp
 * ============================================================================
 * * DESCRIPTION:
 * nlohmann::json mappings of the ledger models used by the HTTP engine.
 * Amounts travel as decimal strings ("45.00") so no client ever rounds
 * through a double; amount inputs also accept plain JSON numbers.
 * ============================================================================
 */

#ifndef ASSETS_JSON_CODEC_HPP
#define ASSETS_JSON_CODEC_HPP

#include "DuplicateMatcher.hpp"
#include "PostingEngine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "models.hpp"

namespace assets {

    money_micro amount_from_json(const json& node);

    void to_json(json& j, const Date& d);
    void to_json(json& j, const Account& a);
    void to_json(json& j, const User& u);
    void to_json(json& j, const OwnershipShare& s);
    void to_json(json& j, const Transaction& t);
    void to_json(json& j, const JournalEntry& e);
    void to_json(json& j, const TransactionWithEntries& t);
    void to_json(json& j, const MatchCriteria& c);
    void to_json(json& j, const TransactionMatch& m);
    void to_json(json& j, const MatchCandidate& c);
    void to_json(json& j, const ImportedFile& f);
    void to_json(json& j, const UnbalancedRecord& r);

    void from_json(const json& j, NewAccount& a);
    void from_json(const json& j, EntryInput& e);
    void from_json(const json& j, NewTransaction& t);
    void from_json(const json& j, MatchCriteria& c);
    void from_json(const json& j, ImportedFile& f);

    // {"error": "<kind>", "message": "..."}
    json error_body(const LedgerError& error);

} // namespace assets

#endif // ASSETS_JSON_CODEC_HPP
