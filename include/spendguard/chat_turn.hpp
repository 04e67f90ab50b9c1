#pragma once

#include "spendguard/billing_store.hpp"
#include "spendguard/budget_calculator.hpp"
#include "spendguard/charge_settlement.hpp"
#include "spendguard/config.hpp"
#include "spendguard/funding_resolver.hpp"
#include "spendguard/guest_quota.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/reservation_ledger.hpp"
#include "spendguard/types.hpp"
#include "spendguard/provider/capacity_guard.hpp"
#include "spendguard/provider/inference_client.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spendguard {

struct ChatTurnRequest {
    // Guest or Trial for anonymous sessions; ignored when user_id is set,
    // since an account's tier follows from its wallets
    UserTier session_tier{UserTier::Guest};
    std::optional<UserId> user_id;

    // What the client expects to be charged against
    FundingSource declared_funding_source{FundingSource::PersonalBalance};

    ConversationId conversation_id;
    std::optional<GroupContext> group;

    ModelPricing model;

    // System prompt, history and the new user message, in order
    std::vector<provider::ChatMessage> messages;

    MessageId user_message_id;
    std::string user_content;
    MessageId assistant_message_id;

    // Anonymous quota identity
    std::optional<std::string> guest_token;
    std::string ip_hash;
};

struct ChatTurnResult {
    MoneyUnits cost{0};
    std::optional<RecordId> usage_record_id;
    std::int64_t max_output_tokens{0};
    Cents worst_case_cents{0.0};
    FundingSource funding_source{FundingSource::PersonalBalance};
    std::optional<std::int64_t> user_sequence;
    std::optional<std::int64_t> ai_sequence;
    std::string content;
    std::vector<BudgetNotice> notices;
};

// Callbacks for the stream; unset members are skipped
struct StreamOutcomeHandler {
    provider::TokenCallback on_token;
    std::function<void(const ChatTurnResult&)> on_complete;   // after commit
    std::function<void(const std::exception&)> on_error;      // before the error propagates
};

// Runs one billable chat turn:
// guest quota -> funding -> budget -> reserve + race check ->
// capacity-guarded inference -> settlement -> release.
// The reservation is released on every exit path, after commit or rollback.
class ChatTurnPipeline {
public:
    ChatTurnPipeline(std::shared_ptr<BillingStore> store,
                     std::shared_ptr<ReservationLedger> ledger,
                     std::shared_ptr<MessageSealer> sealer,
                     Config config = Config{});

    ChatTurnPipeline(const ChatTurnPipeline&) = delete;
    ChatTurnPipeline& operator=(const ChatTurnPipeline&) = delete;

    ChatTurnResult run(const ChatTurnRequest& request,
                       provider::InferenceClient& client,
                       const StreamOutcomeHandler& handler = StreamOutcomeHandler{});

    // Budget for a prospective turn without reserving anything
    BudgetResult preview_budget(const ChatTurnRequest& request);

    FundingResolver& resolver() noexcept { return resolver_; }
    ChargeSettlement& settlement() noexcept { return settlement_; }
    GuestQuota& guest_quota() noexcept { return guest_quota_; }
    ReservationLedger& ledger() noexcept { return *ledger_; }

    void set_monitor(std::shared_ptr<Monitor> monitor);

    const Config& config() const noexcept { return config_; }

private:
    Config config_;
    std::shared_ptr<BillingStore> store_;
    std::shared_ptr<ReservationLedger> ledger_;

    FundingResolver resolver_;
    ChargeSettlement settlement_;
    GuestQuota guest_quota_;
    provider::CapacityGuard capacity_guard_;
    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    ChatTurnResult run_turn(const ChatTurnRequest& request, provider::InferenceClient& client,
                            const StreamOutcomeHandler& handler);

    BillingContext build_context(const ChatTurnRequest& request);
    BudgetInput budget_input(const ChatTurnRequest& request, const BillingContext& context,
                             std::optional<FundingSource> source) const;
    void throw_denial(DenialReason reason, const ChatTurnRequest& request) const;

    void emit_event(EventType type, const std::string& message,
                    const ChatTurnRequest& request,
                    std::optional<FundingSource> source = std::nullopt,
                    std::optional<Cents> amount_cents = std::nullopt,
                    std::optional<std::int64_t> tokens = std::nullopt);
};

} // namespace spendguard
