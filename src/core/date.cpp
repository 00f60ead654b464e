/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: date.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Calendar dates over boost::gregorian. Out-of-range days and months are
 * reported by Boost as std::out_of_range and surface as InvalidDate.
 * ============================================================================
 */

#include "date.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace assets {

namespace {

using GDate = boost::gregorian::date;

const GDate& epoch() {
    static const GDate value(1970, boost::gregorian::Jan, 1);
    return value;
}

GDate checked(const GDate& d, const std::string& what) {
    if (d.is_special()) {
        throw LedgerError(ErrorKind::InvalidDate, "Date out of range: " + what);
    }
    return d;
}

} // namespace

Date::Date() : date_(epoch()) {}

Date Date::from_ymd(int year, unsigned month, unsigned day) {
    try {
        return Date(GDate(static_cast<unsigned short>(year), static_cast<unsigned short>(month),
                          static_cast<unsigned short>(day)));
    } catch (const std::out_of_range& e) {
        throw LedgerError(ErrorKind::InvalidDate,
                          "Invalid calendar date: " + std::to_string(year) + "-" +
                          std::to_string(month) + "-" + std::to_string(day) + " (" + e.what() + ")");
    }
}

Date Date::from_days(int32_t days) {
    try {
        return Date(checked(epoch() + boost::gregorian::date_duration(days), std::to_string(days) + " days"));
    } catch (const std::out_of_range& e) {
        throw LedgerError(ErrorKind::InvalidDate, std::string("Date out of range: ") + e.what());
    }
}

Date Date::parse(const std::string& text) {
    // Strict YYYY-MM-DD, optionally followed by a time part which is ignored
    // ("2025-06-14T10:00:00Z" from timestamp-producing importers).
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw LedgerError(ErrorKind::InvalidDate, "Expected YYYY-MM-DD, got: " + text);
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (text[i] < '0' || text[i] > '9') {
            throw LedgerError(ErrorKind::InvalidDate, "Expected YYYY-MM-DD, got: " + text);
        }
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        throw LedgerError(ErrorKind::InvalidDate, "Expected YYYY-MM-DD, got: " + text);
    }

    try {
        return Date(checked(boost::gregorian::from_simple_string(text.substr(0, 10)), text));
    } catch (const std::out_of_range& e) {
        throw LedgerError(ErrorKind::InvalidDate, "Invalid calendar date: " + text + " (" + e.what() + ")");
    }
}

Date Date::today() {
    return Date(boost::gregorian::day_clock::local_day());
}

std::string Date::to_string() const {
    return boost::gregorian::to_iso_extended_string(date_);
}

int32_t Date::days_since_epoch() const {
    return static_cast<int32_t>((date_ - epoch()).days());
}

Date Date::add_days(int32_t n) const {
    try {
        return Date(checked(date_ + boost::gregorian::date_duration(n), to_string() + " + " + std::to_string(n)));
    } catch (const std::out_of_range& e) {
        throw LedgerError(ErrorKind::InvalidDate, std::string("Date out of range: ") + e.what());
    }
}

int32_t days_between(const Date& a, const Date& b) {
    boost::gregorian::date_duration diff = a.date_ - b.date_;
    return static_cast<int32_t>(diff.is_negative() ? -diff.days() : diff.days());
}

} // namespace assets
