/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Every failure of the core is reported as a LedgerError. The kind tells the
 * caller exactly what went wrong; the category tells it what to do about it:
 *
 *  - Validation: input rejected before anything was persisted. Fix the input.
 *  - Invariant:  rejected at commit time, the unit of work was rolled back.
 *                Reformulate the request.
 *  - NotFound:   a referenced row does not exist.
 *  - Integrity:  the stored ledger already violates an invariant. Fatal.
 *  - Storage:    the store could not complete the unit of work. Nothing was
 *                applied; StoreConflict may be retried.
 * ============================================================================
 */

#ifndef ASSETS_ERRORS_HPP
#define ASSETS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace assets {

    enum class ErrorKind {
        // Validation
        InvalidPath,
        InvalidAccountName,
        InvalidUserName,
        InvalidSubtype,
        InvalidInvestmentFields,
        InvalidCurrency,
        InvalidSymbol,
        InvalidHierarchy,
        InvalidAmount,
        InvalidDate,
        InvalidPercentage,
        InvalidConfidence,
        InvalidConfig,
        EmptyTransaction,
        SelfMatch,
        CircularReference,
        // Invariant
        UnbalancedTransaction,
        OwnershipExceeded,
        DuplicateAccountName,
        DuplicateUserName,
        AccountInactive,
        AccountHasActiveChildren,
        SelfMerge,
        AlreadyMerged,
        NotMerged,
        InvalidStatusTransition,
        TransactionHasMergedDuplicates,
        FileAlreadyImported,
        // NotFound
        AccountNotFound,
        UserNotFound,
        TransactionNotFound,
        MatchNotFound,
        // Integrity
        IntegrityViolation,
        // Storage
        StoreConflict,
        StoreUnavailable,
        StoreFailure
    };

    enum class ErrorCategory {
        Validation,
        Invariant,
        NotFound,
        Integrity,
        Storage
    };

    const char* error_kind_name(ErrorKind kind);
    ErrorCategory category_of(ErrorKind kind);

    /**
     * @brief The single exception type thrown by the ledger core.
     */
    class LedgerError : public std::runtime_error {
    public:
        LedgerError(ErrorKind kind, const std::string& message);

        ErrorKind kind() const { return kind_; }
        ErrorCategory category() const { return category_of(kind_); }

    private:
        ErrorKind kind_;
    };

} // namespace assets

#endif // ASSETS_ERRORS_HPP
