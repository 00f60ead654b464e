/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.cpp
 * ============================================================================
 */

#include "errors.hpp"

namespace assets {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::InvalidAccountName: return "InvalidAccountName";
        case ErrorKind::InvalidUserName: return "InvalidUserName";
        case ErrorKind::InvalidSubtype: return "InvalidSubtype";
        case ErrorKind::InvalidInvestmentFields: return "InvalidInvestmentFields";
        case ErrorKind::InvalidCurrency: return "InvalidCurrency";
        case ErrorKind::InvalidSymbol: return "InvalidSymbol";
        case ErrorKind::InvalidHierarchy: return "InvalidHierarchy";
        case ErrorKind::InvalidAmount: return "InvalidAmount";
        case ErrorKind::InvalidDate: return "InvalidDate";
        case ErrorKind::InvalidPercentage: return "InvalidPercentage";
        case ErrorKind::InvalidConfidence: return "InvalidConfidence";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::EmptyTransaction: return "EmptyTransaction";
        case ErrorKind::SelfMatch: return "SelfMatch";
        case ErrorKind::CircularReference: return "CircularReference";
        case ErrorKind::UnbalancedTransaction: return "UnbalancedTransaction";
        case ErrorKind::OwnershipExceeded: return "OwnershipExceeded";
        case ErrorKind::DuplicateAccountName: return "DuplicateAccountName";
        case ErrorKind::DuplicateUserName: return "DuplicateUserName";
        case ErrorKind::AccountInactive: return "AccountInactive";
        case ErrorKind::AccountHasActiveChildren: return "AccountHasActiveChildren";
        case ErrorKind::SelfMerge: return "SelfMerge";
        case ErrorKind::AlreadyMerged: return "AlreadyMerged";
        case ErrorKind::NotMerged: return "NotMerged";
        case ErrorKind::InvalidStatusTransition: return "InvalidStatusTransition";
        case ErrorKind::TransactionHasMergedDuplicates: return "TransactionHasMergedDuplicates";
        case ErrorKind::FileAlreadyImported: return "FileAlreadyImported";
        case ErrorKind::AccountNotFound: return "AccountNotFound";
        case ErrorKind::UserNotFound: return "UserNotFound";
        case ErrorKind::TransactionNotFound: return "TransactionNotFound";
        case ErrorKind::MatchNotFound: return "MatchNotFound";
        case ErrorKind::IntegrityViolation: return "IntegrityViolation";
        case ErrorKind::StoreConflict: return "StoreConflict";
        case ErrorKind::StoreUnavailable: return "StoreUnavailable";
        case ErrorKind::StoreFailure: return "StoreFailure";
    }
    return "Unknown";
}

ErrorCategory category_of(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath:
        case ErrorKind::InvalidAccountName:
        case ErrorKind::InvalidUserName:
        case ErrorKind::InvalidSubtype:
        case ErrorKind::InvalidInvestmentFields:
        case ErrorKind::InvalidCurrency:
        case ErrorKind::InvalidSymbol:
        case ErrorKind::InvalidHierarchy:
        case ErrorKind::InvalidAmount:
        case ErrorKind::InvalidDate:
        case ErrorKind::InvalidPercentage:
        case ErrorKind::InvalidConfidence:
        case ErrorKind::InvalidConfig:
        case ErrorKind::EmptyTransaction:
        case ErrorKind::SelfMatch:
        case ErrorKind::CircularReference:
            return ErrorCategory::Validation;

        case ErrorKind::AccountNotFound:
        case ErrorKind::UserNotFound:
        case ErrorKind::TransactionNotFound:
        case ErrorKind::MatchNotFound:
            return ErrorCategory::NotFound;

        case ErrorKind::IntegrityViolation:
            return ErrorCategory::Integrity;

        case ErrorKind::StoreConflict:
        case ErrorKind::StoreUnavailable:
        case ErrorKind::StoreFailure:
            return ErrorCategory::Storage;

        default:
            return ErrorCategory::Invariant;
    }
}

LedgerError::LedgerError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

} // namespace assets
