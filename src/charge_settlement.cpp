#include "spendguard/charge_settlement.hpp"
#include "spendguard/exceptions.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace spendguard {

ChargeSettlement::ChargeSettlement(std::shared_ptr<BillingStore> store,
                                   std::shared_ptr<MessageSealer> sealer,
                                   Config config)
    : store_(std::move(store))
    , sealer_(std::move(sealer))
    , config_(std::move(config))
{
    if (!store_ || !sealer_) {
        throw std::invalid_argument("ChargeSettlement requires a billing store and a message sealer");
    }
}

// ========== Sealing ==========

namespace {

// Thrown inside a transaction when the epoch key changed after sealing
struct EpochKeyChanged {};

constexpr int MAX_SEAL_ATTEMPTS = 3;

} // anonymous namespace

EpochRow ChargeSettlement::current_epoch(const ConversationId& conversation_id) const {
    const auto conversation = store_->conversation(conversation_id);
    if (!conversation.has_value()) {
        throw ConversationNotFoundException(conversation_id);
    }
    auto epoch = store_->epoch(conversation_id, conversation->current_epoch);
    if (!epoch.has_value()) {
        throw EpochNotFoundException(conversation_id, conversation->current_epoch);
    }
    return std::move(epoch.value());
}

void ChargeSettlement::require_sealing_epoch(BillingStore::Transaction& tx, const EpochRow& sealed_with,
                                             const SequenceClaim& claim) {
    const auto epoch = tx.find_epoch(sealed_with.conversation_id, claim.current_epoch);
    if (!epoch.has_value()) {
        throw EpochNotFoundException(sealed_with.conversation_id, claim.current_epoch);
    }
    if (epoch->epoch_number != sealed_with.epoch_number || epoch->public_key != sealed_with.public_key) {
        throw EpochKeyChanged{};
    }
}

// ========== Chat turns ==========

SaveChatTurnResult ChargeSettlement::save_chat_turn(const SaveChatTurnParams& params) {
    const UserId payer = params.payer_id.value_or(params.user_id);
    const WallTime now = WallClock::now();

    SaveChatTurnResult result;
    try {
        for (int attempt = 1;; ++attempt) {
            // Sealing happens before the store lock is taken
            const EpochRow epoch = current_epoch(params.conversation_id);
            std::string user_blob = sealer_->seal(epoch.public_key, params.user_content);
            std::string ai_blob = sealer_->seal(epoch.public_key, params.assistant_content);

            try {
                result = store_->transaction([&](BillingStore::Transaction& tx) {
                    // 1. Claim two sequence numbers; this update serializes concurrent turns
                    const auto claim = tx.claim_sequences(params.conversation_id, 2);
                    if (!claim.has_value()) {
                        throw ConversationNotFoundException(params.conversation_id);
                    }

                    // 2. The epoch the blobs were sealed for must still be current
                    require_sealing_epoch(tx, epoch, claim.value());

                    // 3. Messages
                    MessageRow user_message;
                    user_message.id = params.user_message_id;
                    user_message.conversation_id = params.conversation_id;
                    user_message.encrypted_blob = std::move(user_blob);
                    user_message.sender_type = SenderType::User;
                    user_message.sender_id = params.user_id;
                    user_message.epoch_number = epoch.epoch_number;
                    user_message.sequence_number = claim->first_sequence;
                    tx.insert_message(std::move(user_message));

                    MessageRow ai_message;
                    ai_message.id = params.assistant_message_id;
                    ai_message.conversation_id = params.conversation_id;
                    ai_message.encrypted_blob = std::move(ai_blob);
                    ai_message.sender_type = SenderType::Ai;
                    ai_message.payer_id = payer;
                    ai_message.cost = params.cost;
                    ai_message.epoch_number = epoch.epoch_number;
                    ai_message.sequence_number = claim->first_sequence + 1;
                    tx.insert_message(std::move(ai_message));

                    // 4. Charge
                    UsageChargeParams charge;
                    charge.user_id = payer;
                    charge.cost = params.cost;
                    charge.model = params.model;
                    charge.provider = config_.provider_name;
                    charge.input_tokens = params.input_tokens;
                    charge.output_tokens = params.output_tokens;
                    charge.cached_tokens = params.cached_tokens;
                    charge.source_type = "message";
                    charge.source_id = params.assistant_message_id;
                    const UsageChargeResult charged = charge_for_usage(tx, charge, now);

                    // 5. Group spending, only when a member spends the owner's balance
                    if (params.group_member_id.has_value()) {
                        tx.add_conversation_spending(params.conversation_id, params.cost);
                        tx.add_member_spending(params.conversation_id, params.group_member_id.value(),
                                               params.cost);
                    }

                    SaveChatTurnResult r;
                    r.user_sequence = claim->first_sequence;
                    r.ai_sequence = claim->first_sequence + 1;
                    r.epoch_number = epoch.epoch_number;
                    r.cost = format_dollars(params.cost);
                    r.usage_record_id = charged.usage_record_id;
                    return r;
                });
                break;
            } catch (const EpochKeyChanged&) {
                if (attempt == MAX_SEAL_ATTEMPTS) {
                    throw ConstraintViolationException("conversation " + params.conversation_id +
                                                       ": epoch key kept changing while sealing");
                }
            }
        }
    } catch (const std::exception& e) {
        emit_event(EventType::SettlementRolledBack, e.what(), payer, params.conversation_id,
                   params.group_member_id, units_to_cents(params.cost));
        throw;
    }

    emit_event(EventType::SettlementCommitted, "Chat turn settled at $" + result.cost, payer,
               params.conversation_id, params.group_member_id, units_to_cents(params.cost));
    return result;
}

SaveUserOnlyMessageResult ChargeSettlement::save_user_only_message(const SaveUserOnlyMessageParams& params) {
    SaveUserOnlyMessageResult result;
    for (int attempt = 1;; ++attempt) {
        const EpochRow epoch = current_epoch(params.conversation_id);
        std::string blob = sealer_->seal(epoch.public_key, params.content);

        try {
            result = store_->transaction([&](BillingStore::Transaction& tx) {
                const auto claim = tx.claim_sequences(params.conversation_id, 1);
                if (!claim.has_value()) {
                    throw ConversationNotFoundException(params.conversation_id);
                }
                require_sealing_epoch(tx, epoch, claim.value());

                MessageRow message;
                message.id = params.message_id;
                message.conversation_id = params.conversation_id;
                message.encrypted_blob = std::move(blob);
                message.sender_type = SenderType::User;
                message.sender_id = params.user_id;
                message.epoch_number = epoch.epoch_number;
                message.sequence_number = claim->first_sequence;
                tx.insert_message(std::move(message));

                return SaveUserOnlyMessageResult{claim->first_sequence, epoch.epoch_number};
            });
            break;
        } catch (const EpochKeyChanged&) {
            if (attempt == MAX_SEAL_ATTEMPTS) {
                throw ConstraintViolationException("conversation " + params.conversation_id +
                                                   ": epoch key kept changing while sealing");
            }
        }
    }

    emit_event(EventType::UserMessageSaved, "User message saved without billing",
               params.user_id, params.conversation_id);
    return result;
}

// ========== Usage charge ==========

std::vector<WalletDebit> ChargeSettlement::debit_wallets(BillingStore::Transaction& tx,
                                                         const UserId& user_id, MoneyUnits cost) {
    const std::vector<Wallet> wallets = tx.wallets_for_user(user_id);
    if (wallets.empty()) {
        throw InsufficientBalanceException(DenialReason::InsufficientBalance,
                                           "No wallet to charge for user " + user_id);
    }

    std::vector<WalletDebit> debits;
    MoneyUnits remaining = cost;

    // Lowest priority first, each wallet down to zero at most
    for (auto& w : wallets) {
        if (remaining <= 0) break;
        const MoneyUnits take = std::min(std::max<MoneyUnits>(w.balance, 0), remaining);
        if (take <= 0) continue;
        const MoneyUnits after = w.balance - take;
        tx.set_wallet_balance(w.id, after);
        debits.push_back(WalletDebit{w.id, take, after});
        remaining -= take;
    }

    if (remaining > 0) {
        // The deepest purchased wallet absorbs the rest, within the paid cushion
        auto deepest = std::find_if(wallets.rbegin(), wallets.rend(), [](const Wallet& w) {
            return w.type == WalletType::Purchased;
        });
        if (deepest == wallets.rend()) {
            throw InsufficientBalanceException(DenialReason::InsufficientBalance,
                                               "All wallets exhausted, " + format_dollars(remaining) +
                                               " still owed by " + user_id);
        }

        const auto current = tx.find_wallet(deepest->id);
        const MoneyUnits balance = current.has_value() ? current->balance : deepest->balance;
        const MoneyUnits floor = -cents_to_units(config_.budget.paid_cushion_cents);
        if (balance - remaining < floor) {
            throw InsufficientBalanceException(DenialReason::InsufficientBalance,
                                               "Charge of " + format_dollars(cost) +
                                               " exceeds balance and cushion for " + user_id);
        }

        const MoneyUnits after = balance - remaining;
        tx.set_wallet_balance(deepest->id, after);
        auto existing = std::find_if(debits.begin(), debits.end(), [&](const WalletDebit& d) {
            return d.wallet_id == deepest->id;
        });
        if (existing != debits.end()) {
            existing->amount += remaining;
            existing->balance_after = after;
        } else {
            debits.push_back(WalletDebit{deepest->id, remaining, after});
        }
    }

    // A zero-cost turn still books against the first wallet
    if (debits.empty()) {
        debits.push_back(WalletDebit{wallets.front().id, 0, wallets.front().balance});
    }
    return debits;
}

UsageChargeResult ChargeSettlement::charge_for_usage(BillingStore::Transaction& tx,
                                                     const UsageChargeParams& params,
                                                     WallTime now) {
    if (params.cost < 0) {
        throw ConstraintViolationException("usage cost must not be negative");
    }

    UsageChargeResult result;
    result.debits = debit_wallets(tx, params.user_id, params.cost);

    UsageRecord usage;
    usage.user_id = params.user_id;
    usage.cost = params.cost;
    usage.status = UsageStatus::Completed;
    usage.source_type = params.source_type;
    usage.source_id = params.source_id;
    usage.created_at = now;
    result.usage_record_id = tx.insert_usage_record(std::move(usage));

    const WalletDebit& primary = result.debits.front();
    LedgerEntry entry;
    entry.wallet_id = primary.wallet_id;
    entry.amount = -params.cost;
    entry.balance_after = primary.balance_after;
    entry.entry_type = LedgerEntryType::UsageCharge;
    entry.usage_record_id = result.usage_record_id;
    entry.created_at = now;
    result.ledger_entry_id = tx.insert_ledger_entry(std::move(entry));

    LlmCompletion completion;
    completion.usage_record_id = result.usage_record_id;
    completion.provider = params.provider;
    completion.model = params.model;
    completion.input_tokens = params.input_tokens;
    completion.output_tokens = params.output_tokens;
    completion.cached_tokens = params.cached_tokens;
    result.llm_completion_id = tx.insert_llm_completion(std::move(completion));

    return result;
}

// ========== Monitoring ==========

void ChargeSettlement::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void ChargeSettlement::emit_event(EventType type, const std::string& message,
                                  const std::optional<UserId>& user_id,
                                  const std::optional<ConversationId>& conversation_id,
                                  const std::optional<MemberId>& member_id,
                                  std::optional<Cents> amount_cents) {
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
    event.user_id = user_id;
    event.conversation_id = conversation_id;
    event.member_id = member_id;
    event.amount_cents = amount_cents;
    if (member_id.has_value()) event.funding_source = FundingSource::OwnerBalance;

    monitor->on_event(event);
}

} // namespace spendguard
