/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: date.hpp
 * ============================================================================
 */

#ifndef ASSETS_DATE_HPP
#define ASSETS_DATE_HPP

#include <cstdint>
#include <string>
#include <boost/date_time/gregorian/gregorian_types.hpp>

namespace assets {

    /**
     * @brief A civil calendar date with no time of day, backed by
     * boost::gregorian::date. The default value is 1970-01-01.
     */
    class Date {
    public:
        Date();

        // Throws LedgerError(InvalidDate) for days that do not exist.
        static Date from_ymd(int year, unsigned month, unsigned day);
        static Date from_days(int32_t days);

        // Accepts "YYYY-MM-DD". Throws LedgerError(InvalidDate).
        static Date parse(const std::string& text);
        static Date today();

        std::string to_string() const;
        int32_t days_since_epoch() const;

        int year() const { return date_.year(); }
        unsigned month() const { return date_.month(); }
        unsigned day() const { return date_.day(); }

        Date add_days(int32_t n) const;

        bool operator==(const Date& o) const { return date_ == o.date_; }
        bool operator!=(const Date& o) const { return date_ != o.date_; }
        bool operator<(const Date& o) const { return date_ < o.date_; }
        bool operator<=(const Date& o) const { return date_ <= o.date_; }
        bool operator>(const Date& o) const { return date_ > o.date_; }
        bool operator>=(const Date& o) const { return date_ >= o.date_; }

    private:
        explicit Date(const boost::gregorian::date& d) : date_(d) {}

        boost::gregorian::date date_;

        friend int32_t days_between(const Date& a, const Date& b);
    };

    // Absolute number of days between two dates.
    int32_t days_between(const Date& a, const Date& b);

} // namespace assets

#endif // ASSETS_DATE_HPP
