#pragma once

#include "spendguard/types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace spendguard {

class SpendGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ==================== Budgeting and reservation ====================

class BillingDeniedException : public SpendGuardException {
public:
    BillingDeniedException(DenialReason reason, const std::string& message)
        : SpendGuardException(message)
        , reason_(reason) {}

    DenialReason reason() const noexcept { return reason_; }

private:
    DenialReason reason_;
};

// Genuine shortfall: the account cannot cover the minimum cost of the call
class InsufficientBalanceException : public BillingDeniedException {
public:
    explicit InsufficientBalanceException(DenialReason reason = DenialReason::InsufficientBalance)
        : BillingDeniedException(reason, std::string("Insufficient balance: ") + to_string(reason)) {}

    InsufficientBalanceException(DenialReason reason, const std::string& message)
        : BillingDeniedException(reason, message) {}
};

class PremiumRequiresBalanceException : public BillingDeniedException {
public:
    explicit PremiumRequiresBalanceException(const std::string& model_id)
        : BillingDeniedException(DenialReason::PremiumRequiresBalance,
                                 "Premium model requires a positive balance: " + model_id)
        , model_id_(model_id) {}

    const std::string& model_id() const noexcept { return model_id_; }

private:
    std::string model_id_;
};

// Guest or trial caller asked for a premium model
class PremiumRequiresAccountException : public BillingDeniedException {
public:
    explicit PremiumRequiresAccountException(const std::string& model_id)
        : BillingDeniedException(DenialReason::PremiumRequiresBalance,
                                 "Premium model requires an account: " + model_id)
        , model_id_(model_id) {}

    const std::string& model_id() const noexcept { return model_id_; }

private:
    std::string model_id_;
};

// Transient shortfall caused by concurrent in-flight reservations
class BalanceReservedException : public SpendGuardException {
public:
    BalanceReservedException(Cents new_total_cents, Cents ceiling_cents)
        : SpendGuardException(
            "Balance reserved by in-flight requests: total " +
            std::to_string(new_total_cents) + " exceeds ceiling " +
            std::to_string(ceiling_cents) + " cents")
        , new_total_cents_(new_total_cents)
        , ceiling_cents_(ceiling_cents) {}

    Cents new_total_cents() const noexcept { return new_total_cents_; }
    Cents ceiling_cents() const noexcept { return ceiling_cents_; }

private:
    Cents new_total_cents_;
    Cents ceiling_cents_;
};

class BillingMismatchException : public SpendGuardException {
public:
    BillingMismatchException(FundingSource declared, FundingSource resolved)
        : SpendGuardException(
            std::string("Billing mismatch: requested ") + to_string(declared) +
            " but resolved " + to_string(resolved))
        , declared_(declared)
        , resolved_(resolved) {}

    FundingSource declared() const noexcept { return declared_; }
    FundingSource resolved() const noexcept { return resolved_; }

private:
    FundingSource declared_;
    FundingSource resolved_;
};

class ContextCapacityTooLowException : public SpendGuardException {
public:
    ContextCapacityTooLowException(std::int64_t max_context,
                                   std::int64_t input_tokens,
                                   std::int64_t corrected_output)
        : SpendGuardException(
            "Context capacity too low: model allows " + std::to_string(max_context) +
            " tokens, input uses " + std::to_string(input_tokens) +
            ", leaving " + std::to_string(corrected_output) + " for output")
        , max_context_(max_context)
        , input_tokens_(input_tokens)
        , corrected_output_(corrected_output) {}

    std::int64_t max_context() const noexcept { return max_context_; }
    std::int64_t input_tokens() const noexcept { return input_tokens_; }
    std::int64_t corrected_output() const noexcept { return corrected_output_; }

private:
    std::int64_t max_context_;
    std::int64_t input_tokens_;
    std::int64_t corrected_output_;
};

class GuestQuotaExceededException : public SpendGuardException {
public:
    GuestQuotaExceededException(std::int64_t message_count, std::int64_t limit)
        : SpendGuardException(
            "Guest message limit reached: " + std::to_string(message_count) +
            " of " + std::to_string(limit))
        , message_count_(message_count)
        , limit_(limit) {}

    std::int64_t message_count() const noexcept { return message_count_; }
    std::int64_t limit() const noexcept { return limit_; }

private:
    std::int64_t message_count_;
    std::int64_t limit_;
};

// ==================== Referential integrity ====================

class ConversationNotFoundException : public SpendGuardException {
public:
    explicit ConversationNotFoundException(const ConversationId& id)
        : SpendGuardException("Conversation not found: " + id)
        , conversation_id_(id) {}

    const ConversationId& conversation_id() const noexcept { return conversation_id_; }

private:
    ConversationId conversation_id_;
};

class EpochNotFoundException : public SpendGuardException {
public:
    EpochNotFoundException(const ConversationId& id, std::int64_t epoch)
        : SpendGuardException("Epoch not found: " + id + "#" + std::to_string(epoch))
        , conversation_id_(id)
        , epoch_(epoch) {}

    const ConversationId& conversation_id() const noexcept { return conversation_id_; }
    std::int64_t epoch() const noexcept { return epoch_; }

private:
    ConversationId conversation_id_;
    std::int64_t epoch_;
};

class MemberNotFoundException : public SpendGuardException {
public:
    explicit MemberNotFoundException(const MemberId& id)
        : SpendGuardException("Member not found: " + id)
        , member_id_(id) {}

    const MemberId& member_id() const noexcept { return member_id_; }

private:
    MemberId member_id_;
};

class DuplicateIdException : public SpendGuardException {
public:
    DuplicateIdException(const std::string& table, const std::string& id)
        : SpendGuardException("Duplicate id in " + table + ": " + id)
        , table_(table)
        , id_(id) {}

    const std::string& table() const noexcept { return table_; }
    const std::string& id() const noexcept { return id_; }

private:
    std::string table_;
    std::string id_;
};

class ConstraintViolationException : public SpendGuardException {
public:
    using SpendGuardException::SpendGuardException;
};

} // namespace spendguard
