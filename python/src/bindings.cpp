#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <spendguard/spendguard.hpp>

using namespace spendguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_spendguard, m) {
    m.doc() = "SpendGuard: Budget and reservation engine for pay-per-use AI chat";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_pricing(m);
    bind_monitors(m);
    bind_core(m);
    bind_provider(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<UserTier>(m, "UserTier")
        .value("Guest", UserTier::Guest)
        .value("Trial", UserTier::Trial)
        .value("Free",  UserTier::Free)
        .value("Paid",  UserTier::Paid)
        .export_values();

    py::enum_<FundingSource>(m, "FundingSource")
        .value("PersonalBalance", FundingSource::PersonalBalance)
        .value("FreeAllowance",   FundingSource::FreeAllowance)
        .value("OwnerBalance",    FundingSource::OwnerBalance)
        .value("GuestFixed",      FundingSource::GuestFixed)
        .export_values();

    py::enum_<DenialReason>(m, "DenialReason")
        .value("PremiumRequiresBalance",    DenialReason::PremiumRequiresBalance)
        .value("InsufficientBalance",       DenialReason::InsufficientBalance)
        .value("InsufficientFreeAllowance", DenialReason::InsufficientFreeAllowance)
        .value("GuestLimitExceeded",        DenialReason::GuestLimitExceeded)
        .export_values();

    py::enum_<WalletType>(m, "WalletType")
        .value("Purchased", WalletType::Purchased)
        .value("FreeTier",  WalletType::FreeTier)
        .export_values();

    py::enum_<LedgerEntryType>(m, "LedgerEntryType")
        .value("Deposit",     LedgerEntryType::Deposit)
        .value("UsageCharge", LedgerEntryType::UsageCharge)
        .value("Renewal",     LedgerEntryType::Renewal)
        .export_values();

    py::enum_<SenderType>(m, "SenderType")
        .value("User", SenderType::User)
        .value("Ai",   SenderType::Ai)
        .export_values();

    py::enum_<UsageStatus>(m, "UsageStatus")
        .value("Pending",   UsageStatus::Pending)
        .value("Completed", UsageStatus::Completed)
        .export_values();

    py::enum_<NoticeSeverity>(m, "NoticeSeverity")
        .value("Error",   NoticeSeverity::Error)
        .value("Warning", NoticeSeverity::Warning)
        .value("Info",    NoticeSeverity::Info)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("BudgetCalculated",     EventType::BudgetCalculated)
        .value("BillingDenied",        EventType::BillingDenied)
        .value("ReservationCreated",   EventType::ReservationCreated)
        .value("ReservationRejected",  EventType::ReservationRejected)
        .value("ReservationReleased",  EventType::ReservationReleased)
        .value("ReleaseFailed",        EventType::ReleaseFailed)
        .value("SettlementCommitted",  EventType::SettlementCommitted)
        .value("SettlementRolledBack", EventType::SettlementRolledBack)
        .value("UserMessageSaved",     EventType::UserMessageSaved)
        .value("FreeAllowanceRenewed", EventType::FreeAllowanceRenewed)
        .value("CapacityRetry",        EventType::CapacityRetry)
        .value("CapacityTooLow",       EventType::CapacityTooLow)
        .value("InferenceFailed",      EventType::InferenceFailed)
        .value("GuestMessageCounted",  EventType::GuestMessageCounted)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<PricingConfig>(m, "PricingConfig")
        .def(py::init<>())
        .def_readwrite("fee_rate",                   &PricingConfig::fee_rate)
        .def_readwrite("storage_cost_per_character", &PricingConfig::storage_cost_per_character);

    py::class_<BudgetConfig>(m, "BudgetConfig")
        .def(py::init<>())
        .def_readwrite("minimum_output_tokens",              &BudgetConfig::minimum_output_tokens)
        .def_readwrite("paid_cushion_cents",                 &BudgetConfig::paid_cushion_cents)
        .def_readwrite("guest_fixed_cents",                  &BudgetConfig::guest_fixed_cents)
        .def_readwrite("low_balance_output_token_threshold", &BudgetConfig::low_balance_output_token_threshold)
        .def_readwrite("capacity_red_threshold",             &BudgetConfig::capacity_red_threshold)
        .def_readwrite("capacity_yellow_threshold",          &BudgetConfig::capacity_yellow_threshold)
        .def_readwrite("free_tier_float_tolerance_cents",    &BudgetConfig::free_tier_float_tolerance_cents);

    py::class_<ReservationConfig>(m, "ReservationConfig")
        .def(py::init<>())
        .def_readwrite("key_ttl",                    &ReservationConfig::key_ttl)
        .def_readwrite("key_prefix",                 &ReservationConfig::key_prefix)
        .def_readwrite("race_check_tolerance_cents", &ReservationConfig::race_check_tolerance_cents);

    py::class_<AllowanceConfig>(m, "AllowanceConfig")
        .def(py::init<>())
        .def_readwrite("daily_free_allowance",      &AllowanceConfig::daily_free_allowance)
        .def_readwrite("guest_daily_message_limit", &AllowanceConfig::guest_daily_message_limit);

    // Config (top-level, embeds the four sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("pricing",       &Config::pricing)
        .def_readwrite("budget",        &Config::budget)
        .def_readwrite("reservation",   &Config::reservation)
        .def_readwrite("allowance",     &Config::allowance)
        .def_readwrite("provider_name", &Config::provider_name);

    // ---- Structs ----------------------------------------------------------

    // ModelPricing
    py::class_<ModelPricing>(m, "ModelPricing")
        .def(py::init<>())
        .def_readwrite("model_id",               &ModelPricing::model_id)
        .def_readwrite("input_price_per_token",  &ModelPricing::input_price_per_token)
        .def_readwrite("output_price_per_token", &ModelPricing::output_price_per_token)
        .def_readwrite("context_length",         &ModelPricing::context_length)
        .def_readwrite("is_premium",             &ModelPricing::is_premium);

    // LedgerSnapshot
    py::class_<LedgerSnapshot>(m, "LedgerSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",         &LedgerSnapshot::timestamp)
        .def_readwrite("outstanding",       &LedgerSnapshot::outstanding)
        .def_readwrite("total_outstanding", &LedgerSnapshot::total_outstanding);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",            &MonitorEvent::type)
        .def_readwrite("timestamp",       &MonitorEvent::timestamp)
        .def_readwrite("message",         &MonitorEvent::message)
        .def_readwrite("user_id",         &MonitorEvent::user_id)
        .def_readwrite("conversation_id", &MonitorEvent::conversation_id)
        .def_readwrite("member_id",       &MonitorEvent::member_id)
        .def_readwrite("funding_source",  &MonitorEvent::funding_source)
        .def_readwrite("amount_cents",    &MonitorEvent::amount_cents)
        .def_readwrite("tokens",          &MonitorEvent::tokens);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("budgets_calculated",     &MetricsMonitor::Metrics::budgets_calculated)
        .def_readwrite("denials",                &MetricsMonitor::Metrics::denials)
        .def_readwrite("reservations",           &MetricsMonitor::Metrics::reservations)
        .def_readwrite("releases",               &MetricsMonitor::Metrics::releases)
        .def_readwrite("race_rejections",        &MetricsMonitor::Metrics::race_rejections)
        .def_readwrite("settlements",            &MetricsMonitor::Metrics::settlements)
        .def_readwrite("rollbacks",              &MetricsMonitor::Metrics::rollbacks)
        .def_readwrite("capacity_retries",       &MetricsMonitor::Metrics::capacity_retries)
        .def_readwrite("capacity_failures",      &MetricsMonitor::Metrics::capacity_failures)
        .def_readwrite("renewals",               &MetricsMonitor::Metrics::renewals)
        .def_readwrite("total_settled_cents",    &MetricsMonitor::Metrics::total_settled_cents)
        .def_readwrite("outstanding_cents",      &MetricsMonitor::Metrics::outstanding_cents)
        .def_readwrite("peak_outstanding_cents", &MetricsMonitor::Metrics::peak_outstanding_cents);

    // ---- Store rows -------------------------------------------------------

    py::class_<Wallet>(m, "Wallet")
        .def(py::init<>())
        .def_readwrite("id",       &Wallet::id)
        .def_readwrite("user_id",  &Wallet::user_id)
        .def_readwrite("type",     &Wallet::type)
        .def_readwrite("priority", &Wallet::priority)
        .def_readwrite("balance",  &Wallet::balance);

    py::class_<ConversationRow>(m, "ConversationRow")
        .def(py::init<>())
        .def_readwrite("id",                  &ConversationRow::id)
        .def_readwrite("owner_id",            &ConversationRow::owner_id)
        .def_readwrite("next_sequence",       &ConversationRow::next_sequence)
        .def_readwrite("current_epoch",       &ConversationRow::current_epoch)
        .def_readwrite("conversation_budget", &ConversationRow::conversation_budget);

    py::class_<EpochRow>(m, "EpochRow")
        .def(py::init<>())
        .def_readwrite("conversation_id", &EpochRow::conversation_id)
        .def_readwrite("epoch_number",    &EpochRow::epoch_number)
        .def_readwrite("public_key",      &EpochRow::public_key);

    py::class_<MemberRow>(m, "MemberRow")
        .def(py::init<>())
        .def_readwrite("id",              &MemberRow::id)
        .def_readwrite("conversation_id", &MemberRow::conversation_id)
        .def_readwrite("user_id",         &MemberRow::user_id)
        .def_readwrite("active",          &MemberRow::active);

    py::class_<MemberBudgetRow>(m, "MemberBudgetRow")
        .def(py::init<>())
        .def_readwrite("member_id", &MemberBudgetRow::member_id)
        .def_readwrite("budget",    &MemberBudgetRow::budget)
        .def_readwrite("spent",     &MemberBudgetRow::spent);

    py::class_<MessageRow>(m, "MessageRow")
        .def(py::init<>())
        .def_readwrite("id",              &MessageRow::id)
        .def_readwrite("conversation_id", &MessageRow::conversation_id)
        .def_readwrite("encrypted_blob",  &MessageRow::encrypted_blob)
        .def_readwrite("sender_type",     &MessageRow::sender_type)
        .def_readwrite("sender_id",       &MessageRow::sender_id)
        .def_readwrite("payer_id",        &MessageRow::payer_id)
        .def_readwrite("cost",            &MessageRow::cost)
        .def_readwrite("epoch_number",    &MessageRow::epoch_number)
        .def_readwrite("sequence_number", &MessageRow::sequence_number);

    py::class_<UsageRecord>(m, "UsageRecord")
        .def(py::init<>())
        .def_readwrite("id",          &UsageRecord::id)
        .def_readwrite("user_id",     &UsageRecord::user_id)
        .def_readwrite("cost",        &UsageRecord::cost)
        .def_readwrite("status",      &UsageRecord::status)
        .def_readwrite("source_type", &UsageRecord::source_type)
        .def_readwrite("source_id",   &UsageRecord::source_id)
        .def_readwrite("created_at",  &UsageRecord::created_at);

    py::class_<LedgerEntry>(m, "LedgerEntry")
        .def(py::init<>())
        .def_readwrite("id",               &LedgerEntry::id)
        .def_readwrite("wallet_id",        &LedgerEntry::wallet_id)
        .def_readwrite("amount",           &LedgerEntry::amount)
        .def_readwrite("balance_after",    &LedgerEntry::balance_after)
        .def_readwrite("entry_type",       &LedgerEntry::entry_type)
        .def_readwrite("payment_id",       &LedgerEntry::payment_id)
        .def_readwrite("usage_record_id",  &LedgerEntry::usage_record_id)
        .def_readwrite("source_wallet_id", &LedgerEntry::source_wallet_id)
        .def_readwrite("created_at",       &LedgerEntry::created_at);

    py::class_<LlmCompletion>(m, "LlmCompletion")
        .def(py::init<>())
        .def_readwrite("id",              &LlmCompletion::id)
        .def_readwrite("usage_record_id", &LlmCompletion::usage_record_id)
        .def_readwrite("provider",        &LlmCompletion::provider)
        .def_readwrite("model",           &LlmCompletion::model)
        .def_readwrite("input_tokens",    &LlmCompletion::input_tokens)
        .def_readwrite("output_tokens",   &LlmCompletion::output_tokens)
        .def_readwrite("cached_tokens",   &LlmCompletion::cached_tokens);

    // ---- Money constants and helpers --------------------------------------

    m.attr("MONEY_UNITS_PER_DOLLAR") = MONEY_UNITS_PER_DOLLAR;
    m.attr("MONEY_UNITS_PER_CENT")   = MONEY_UNITS_PER_CENT;

    m.def("dollars_to_units", &dollars_to_units, py::arg("dollars"));
    m.def("units_to_dollars", &units_to_dollars, py::arg("units"));
    m.def("units_to_cents",   &units_to_cents,   py::arg("units"));
    m.def("cents_to_units",   &cents_to_units,   py::arg("cents"));
    m.def("format_dollars",   &format_dollars,   py::arg("units"));
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_SpendGuardError =
        py::register_exception<SpendGuardException>(m, "SpendGuardError", PyExc_RuntimeError);

    // Funding denials
    static auto py_BillingDeniedError =
        py::register_exception<BillingDeniedException>(m, "BillingDeniedError", py_SpendGuardError.ptr());
    static auto py_InsufficientBalanceError =
        py::register_exception<InsufficientBalanceException>(m, "InsufficientBalanceError", py_BillingDeniedError.ptr());
    static auto py_PremiumRequiresBalanceError =
        py::register_exception<PremiumRequiresBalanceException>(m, "PremiumRequiresBalanceError", py_BillingDeniedError.ptr());
    static auto py_PremiumRequiresAccountError =
        py::register_exception<PremiumRequiresAccountException>(m, "PremiumRequiresAccountError", py_BillingDeniedError.ptr());

    // Derived from SpendGuardError
    static auto py_BalanceReservedError =
        py::register_exception<BalanceReservedException>(m, "BalanceReservedError", py_SpendGuardError.ptr());
    static auto py_BillingMismatchError =
        py::register_exception<BillingMismatchException>(m, "BillingMismatchError", py_SpendGuardError.ptr());
    static auto py_ContextCapacityTooLowError =
        py::register_exception<ContextCapacityTooLowException>(m, "ContextCapacityTooLowError", py_SpendGuardError.ptr());
    static auto py_GuestQuotaExceededError =
        py::register_exception<GuestQuotaExceededException>(m, "GuestQuotaExceededError", py_SpendGuardError.ptr());

    // Store integrity
    static auto py_ConversationNotFoundError =
        py::register_exception<ConversationNotFoundException>(m, "ConversationNotFoundError", py_SpendGuardError.ptr());
    static auto py_EpochNotFoundError =
        py::register_exception<EpochNotFoundException>(m, "EpochNotFoundError", py_SpendGuardError.ptr());
    static auto py_MemberNotFoundError =
        py::register_exception<MemberNotFoundException>(m, "MemberNotFoundError", py_SpendGuardError.ptr());
    static auto py_DuplicateIdError =
        py::register_exception<DuplicateIdException>(m, "DuplicateIdError", py_SpendGuardError.ptr());
    static auto py_ConstraintViolationError =
        py::register_exception<ConstraintViolationException>(m, "ConstraintViolationError", py_SpendGuardError.ptr());

    // Provider failures
    static auto py_ProviderError =
        py::register_exception<provider::ProviderException>(m, "ProviderError", py_SpendGuardError.ptr());
}
