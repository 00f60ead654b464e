/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include "errors.hpp"
#include <limits>

namespace assets {

money_micro parse_money(const std::string& text) {
    if (text.empty()) {
        throw LedgerError(ErrorKind::InvalidAmount, "Amount is empty.");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = (text[pos] == '-');
        ++pos;
    }

    const money_micro max_micros = std::numeric_limits<money_micro>::max();
    money_micro units = 0;
    size_t int_digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        // Keeps units * 10 + digit representable; the full bound is checked below.
        if (units > max_micros / MICROS_PER_UNIT) {
            throw LedgerError(ErrorKind::InvalidAmount, "Amount out of range: " + text);
        }
        units = units * 10 + (text[pos] - '0');
        ++pos;
        ++int_digits;
    }

    money_micro fraction = 0;
    size_t frac_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (frac_digits == 6) {
                throw LedgerError(ErrorKind::InvalidAmount,
                                  "Amount has more than six decimal places: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++pos;
            ++frac_digits;
        }
    }

    if (pos != text.size() || (int_digits == 0 && frac_digits == 0)) {
        throw LedgerError(ErrorKind::InvalidAmount, "Malformed amount: " + text);
    }

    for (size_t i = frac_digits; i < 6; ++i) fraction *= 10;

    if (units > (max_micros - fraction) / MICROS_PER_UNIT) {
        throw LedgerError(ErrorKind::InvalidAmount, "Amount out of range: " + text);
    }
    money_micro micros = units * MICROS_PER_UNIT + fraction;
    return negative ? -micros : micros;
}

std::string format_money(money_micro micros) {
    bool negative = micros < 0;
    // Work in unsigned space so INT64_MIN does not overflow on negation.
    uint64_t magnitude = negative ? (~static_cast<uint64_t>(micros) + 1) : static_cast<uint64_t>(micros);

    uint64_t units = magnitude / MICROS_PER_UNIT;
    uint64_t fraction = magnitude % MICROS_PER_UNIT;

    std::string frac = std::to_string(fraction);
    frac.insert(0, 6 - frac.size(), '0');
    while (frac.size() > 2 && frac.back() == '0') frac.pop_back();

    return (negative ? "-" : "") + std::to_string(units) + "." + frac;
}

money_micro add_money(money_micro a, money_micro b) {
    money_micro sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw LedgerError(ErrorKind::InvalidAmount,
                          "Amount overflow: " + format_money(a) + " + " + format_money(b) + ".");
    }
    return sum;
}

} // namespace assets
