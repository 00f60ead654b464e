/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Fixed-point money used by every ledger amount. Amounts are signed micros
 * (1.00 = 1,000,000) so that the zero-sum check is an exact integer test.
 * ============================================================================
 */

#ifndef ASSETS_MONEY_HPP
#define ASSETS_MONEY_HPP

#include <cstdint>
#include <string>

namespace assets {

    // money_micro: 1.00 = 1,000,000.
    // int64_t keeps accounting arithmetic free of floating-point rounding.
    typedef int64_t money_micro;

    constexpr money_micro MICROS_PER_UNIT = 1000000;

    /**
     * @brief Parses a decimal amount such as "45.00", "-0.001" or "+3000".
     * At most six fractional digits are accepted.
     * @throws LedgerError(InvalidAmount) on malformed or overflowing input.
     */
    money_micro parse_money(const std::string& text);

    /**
     * @brief Renders micros as a decimal string with at least two
     * fractional digits ("12.34", "0.001", "-5.00").
     */
    std::string format_money(money_micro micros);

    /**
     * @brief Exact sum of two amounts.
     * @throws LedgerError(InvalidAmount) when the result leaves the int64 range.
     */
    money_micro add_money(money_micro a, money_micro b);

    inline money_micro abs_money(money_micro m) { return m < 0 ? -m : m; }

} // namespace assets

#endif // ASSETS_MONEY_HPP
