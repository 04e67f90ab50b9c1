#include "spendguard/chat_turn.hpp"
#include "spendguard/exceptions.hpp"
#include "spendguard/pricing.hpp"

#include <algorithm>
#include <utility>

namespace spendguard {

namespace {

std::int64_t prompt_characters(const std::vector<provider::ChatMessage>& messages) {
    std::int64_t total = 0;
    for (auto& m : messages) {
        total += static_cast<std::int64_t>(m.content.size());
    }
    return total;
}

// Denial raised when the chosen source cannot afford the minimum output
DenialReason shortfall_reason(FundingSource source) {
    switch (source) {
        case FundingSource::FreeAllowance: return DenialReason::InsufficientFreeAllowance;
        case FundingSource::GuestFixed:    return DenialReason::GuestLimitExceeded;
        case FundingSource::PersonalBalance:
        case FundingSource::OwnerBalance:
            break;
    }
    return DenialReason::InsufficientBalance;
}

} // anonymous namespace

ChatTurnPipeline::ChatTurnPipeline(std::shared_ptr<BillingStore> store,
                                   std::shared_ptr<ReservationLedger> ledger,
                                   std::shared_ptr<MessageSealer> sealer,
                                   Config config)
    : config_(std::move(config))
    , store_(std::move(store))
    , ledger_(std::move(ledger))
    , resolver_(store_, ledger_, config_)
    , settlement_(store_, std::move(sealer), config_)
    , guest_quota_(config_.allowance)
    , capacity_guard_(config_.budget)
{}

// ========== Turn ==========

ChatTurnResult ChatTurnPipeline::run(const ChatTurnRequest& request,
                                     provider::InferenceClient& client,
                                     const StreamOutcomeHandler& handler) {
    try {
        return run_turn(request, client, handler);
    } catch (const std::exception& e) {
        if (handler.on_error) handler.on_error(e);
        throw;
    }
}

ChatTurnResult ChatTurnPipeline::run_turn(const ChatTurnRequest& request,
                                          provider::InferenceClient& client,
                                          const StreamOutcomeHandler& handler) {
    const bool anonymous = !request.user_id.has_value();
    const auto& budget_cfg = config_.budget;

    // 1. Anonymous sessions: account gate and daily quota
    if (anonymous) {
        if (request.model.is_premium) {
            throw PremiumRequiresAccountException(request.model.model_id);
        }
        guest_quota_.require_available(request.guest_token, request.ip_hash);
    }

    // 2. Funding source, against balances net of in-flight reservations
    const BillingContext context = build_context(request);
    const BudgetResult estimate = calculate_budget(budget_input(request, context, std::nullopt), config_);
    const BillingDecision decision =
        resolver_.resolve(context, request.model.is_premium, estimate.estimated_minimum_cost * 100.0);
    if (decision.denied()) {
        throw_denial(decision.denial.value(), request);
    }
    const FundingSource source = decision.funding_source.value();
    if (source != request.declared_funding_source) {
        throw BillingMismatchException(request.declared_funding_source, source);
    }

    // 3. Budget for the chosen source
    const BudgetResult budget = calculate_budget(budget_input(request, context, source), config_);
    emit_event(EventType::BudgetCalculated, "Budget calculated", request, source,
               budget.effective_balance * 100.0, budget.max_output_tokens);
    if (!budget.can_afford || budget.max_output_tokens < budget_cfg.minimum_output_tokens) {
        throw_denial(shortfall_reason(source), request);
    }

    const auto safe_max_tokens = compute_safe_max_tokens(
        budget.max_output_tokens, request.model.context_length, budget.estimated_input_tokens);
    const std::int64_t context_room =
        std::max<std::int64_t>(0, request.model.context_length - budget.estimated_input_tokens);
    const std::int64_t effective_max_tokens = safe_max_tokens.value_or(context_room);
    if (effective_max_tokens < budget_cfg.minimum_output_tokens) {
        emit_event(EventType::CapacityTooLow, "Prompt leaves too little room for output",
                   request, source, std::nullopt, effective_max_tokens);
        throw ContextCapacityTooLowException(request.model.context_length,
                                             budget.estimated_input_tokens, effective_max_tokens);
    }
    const Cents worst_case_cents = compute_worst_case_cents(
        budget.estimated_input_cost, effective_max_tokens, budget.output_cost_per_token);

    // 4. Reserve, then re-check the returned total. Released on every exit path.
    ReservationGuard reservation;
    if (source == FundingSource::OwnerBalance) {
        reservation = ledger_->reserve_group_checked(context.group->scope, worst_case_cents,
                                                     context.group->ceilings);
    } else if (!anonymous) {
        reservation = ledger_->reserve_checked(request.user_id.value(), worst_case_cents,
                                               personal_ceiling_cents(context, source, budget_cfg));
    }

    // 5. Inference
    provider::InferenceRequest inference;
    inference.model = request.model.model_id;
    inference.messages = request.messages;
    inference.max_tokens = safe_max_tokens;

    provider::InferenceResult completion;
    try {
        completion = capacity_guard_.stream(client, inference, handler.on_token);
    } catch (const std::exception& e) {
        emit_event(EventType::InferenceFailed, e.what(), request, source, worst_case_cents);
        throw;
    }

    // 6. Actual cost from real usage
    MessageCostParams cost_params;
    cost_params.input_tokens = completion.input_tokens;
    cost_params.output_tokens = completion.output_tokens;
    cost_params.input_characters = static_cast<std::int64_t>(request.user_content.size());
    cost_params.output_characters = static_cast<std::int64_t>(completion.content.size());
    cost_params.price_per_input_token = request.model.input_price_per_token;
    cost_params.price_per_output_token = request.model.output_price_per_token;

    ChatTurnResult result;
    result.cost = dollars_to_units(calculate_message_cost(cost_params, config_.pricing));
    result.max_output_tokens = effective_max_tokens;
    result.worst_case_cents = worst_case_cents;
    result.funding_source = source;
    result.content = completion.content;
    result.notices = generate_notifications(decision, budget.capacity_percent,
                                            budget.max_output_tokens, budget_cfg);

    // 7. Anonymous turns have no wallet: count the message, persist nothing
    if (anonymous) {
        guest_quota_.record_message(request.guest_token, request.ip_hash);
        if (handler.on_complete) handler.on_complete(result);
        return result;
    }

    SaveChatTurnParams save;
    save.conversation_id = request.conversation_id;
    save.user_id = request.user_id.value();
    save.user_message_id = request.user_message_id;
    save.user_content = request.user_content;
    save.assistant_message_id = request.assistant_message_id;
    save.assistant_content = completion.content;
    save.model = request.model.model_id;
    save.cost = result.cost;
    save.input_tokens = completion.input_tokens;
    save.output_tokens = completion.output_tokens;
    save.cached_tokens = completion.cached_tokens;
    if (source == FundingSource::OwnerBalance) {
        save.payer_id = context.group->scope.payer_id;
        save.group_member_id = context.group->scope.member_id;
    }

    const SaveChatTurnResult saved = settlement_.save_chat_turn(save);
    reservation.release();

    result.usage_record_id = saved.usage_record_id;
    result.user_sequence = saved.user_sequence;
    result.ai_sequence = saved.ai_sequence;

    if (handler.on_complete) handler.on_complete(result);
    return result;
}

BudgetResult ChatTurnPipeline::preview_budget(const ChatTurnRequest& request) {
    const BillingContext context = build_context(request);
    const BudgetResult estimate = calculate_budget(budget_input(request, context, std::nullopt), config_);
    const BillingDecision decision = resolve_billing(
        to_resolve_input(context, request.model.is_premium, estimate.estimated_minimum_cost * 100.0),
        config_.budget);
    if (decision.denied()) return estimate;
    return calculate_budget(budget_input(request, context, decision.funding_source), config_);
}

// ========== Helpers ==========

BillingContext ChatTurnPipeline::build_context(const ChatTurnRequest& request) {
    BillingContext context = resolver_.build_context(request.user_id, request.group);
    if (!request.user_id.has_value()) {
        context.user.tier = (request.session_tier == UserTier::Trial) ? UserTier::Trial : UserTier::Guest;
    }
    return context;
}

BudgetInput ChatTurnPipeline::budget_input(const ChatTurnRequest& request,
                                           const BillingContext& context,
                                           std::optional<FundingSource> source) const {
    BudgetInput input;
    input.tier = context.user.tier;
    input.balance_cents = context.available_balance_cents;
    input.free_allowance_cents = context.available_free_allowance_cents;
    if (source == FundingSource::OwnerBalance && context.group.has_value()) {
        input.group_effective_cents = context.group->effective_cents;
    }
    input.prompt_character_count = prompt_characters(request.messages);
    input.input_price_per_token = apply_fees(request.model.input_price_per_token, config_.pricing);
    input.output_price_per_token = apply_fees(request.model.output_price_per_token, config_.pricing);
    input.context_length = request.model.context_length;
    return input;
}

void ChatTurnPipeline::throw_denial(DenialReason reason, const ChatTurnRequest& request) const {
    switch (reason) {
        case DenialReason::PremiumRequiresBalance:
            if (!request.user_id.has_value()) {
                throw PremiumRequiresAccountException(request.model.model_id);
            }
            throw PremiumRequiresBalanceException(request.model.model_id);
        case DenialReason::InsufficientBalance:
        case DenialReason::InsufficientFreeAllowance:
        case DenialReason::GuestLimitExceeded:
            break;
    }
    throw InsufficientBalanceException(reason);
}

// ========== Monitoring ==========

void ChatTurnPipeline::set_monitor(std::shared_ptr<Monitor> monitor) {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_ = monitor;
    }
    ledger_->set_monitor(monitor);
    resolver_.set_monitor(monitor);
    settlement_.set_monitor(monitor);
    guest_quota_.set_monitor(monitor);
    capacity_guard_.set_monitor(std::move(monitor));
}

void ChatTurnPipeline::emit_event(EventType type, const std::string& message,
                                  const ChatTurnRequest& request,
                                  std::optional<FundingSource> source,
                                  std::optional<Cents> amount_cents,
                                  std::optional<std::int64_t> tokens) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.user_id = request.user_id;
    event.conversation_id = request.conversation_id;
    if (request.group.has_value()) event.member_id = request.group->member_id;
    event.funding_source = source;
    event.amount_cents = amount_cents;
    event.tokens = tokens;

    monitor->on_event(event);
}

} // namespace spendguard
