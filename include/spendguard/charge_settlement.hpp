#pragma once

#include "spendguard/billing_store.hpp"
#include "spendguard/config.hpp"
#include "spendguard/monitor.hpp"
#include "spendguard/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spendguard {

// Encrypts message plaintext for storage under an epoch public key.
// Implemented by the conversation key service; billing never decrypts.
class MessageSealer {
public:
    virtual ~MessageSealer() = default;
    virtual std::string seal(const std::string& epoch_public_key, const std::string& plaintext) = 0;
};

struct SaveChatTurnParams {
    ConversationId conversation_id;

    // Sender of the user message
    UserId user_id;

    // Charged account; the sender when unset. The conversation owner for group billing.
    std::optional<UserId> payer_id;

    MessageId user_message_id;
    std::string user_content;
    MessageId assistant_message_id;
    std::string assistant_content;

    std::string model;
    MoneyUnits cost{0};
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::int64_t cached_tokens{0};

    // Set only when a member spends the owner's balance
    std::optional<MemberId> group_member_id;
};

struct SaveChatTurnResult {
    std::int64_t user_sequence{0};
    std::int64_t ai_sequence{0};
    std::int64_t epoch_number{0};
    std::string cost;   // 8-decimal dollar string
    RecordId usage_record_id;
};

struct SaveUserOnlyMessageParams {
    ConversationId conversation_id;
    UserId user_id;
    MessageId message_id;
    std::string content;
};

struct SaveUserOnlyMessageResult {
    std::int64_t sequence_number{0};
    std::int64_t epoch_number{0};
};

struct UsageChargeParams {
    UserId user_id;
    MoneyUnits cost{0};
    std::string model;
    std::string provider;
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::int64_t cached_tokens{0};
    std::string source_type;
    std::string source_id;
};

// One wallet touched by a usage charge
struct WalletDebit {
    WalletId wallet_id;
    MoneyUnits amount{0};
    MoneyUnits balance_after{0};
};

struct UsageChargeResult {
    RecordId usage_record_id;
    RecordId ledger_entry_id;
    RecordId llm_completion_id;
    std::vector<WalletDebit> debits;
};

// Persists a finished chat turn and its charge in one transaction.
// Every failure rolls back all rows and balances touched by the call.
class ChargeSettlement {
public:
    ChargeSettlement(std::shared_ptr<BillingStore> store,
                     std::shared_ptr<MessageSealer> sealer,
                     Config config = Config{});

    ChargeSettlement(const ChargeSettlement&) = delete;
    ChargeSettlement& operator=(const ChargeSettlement&) = delete;

    // User + assistant messages, wallet debit, usage/ledger/completion rows,
    // and group spending when group_member_id is set
    SaveChatTurnResult save_chat_turn(const SaveChatTurnParams& params);

    // A single user message, no billing (group chat with the AI switched off)
    SaveUserOnlyMessageResult save_user_only_message(const SaveUserOnlyMessageParams& params);

    // Debit + usage rows inside an open transaction
    UsageChargeResult charge_for_usage(BillingStore::Transaction& tx, const UsageChargeParams& params,
                                       WallTime now);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::shared_ptr<BillingStore> store_;
    std::shared_ptr<MessageSealer> sealer_;
    Config config_;
    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    // Conversation's current epoch row, read before any transaction opens
    EpochRow current_epoch(const ConversationId& conversation_id) const;
    // Throws when the claimed epoch is not the one the payloads were sealed for
    static void require_sealing_epoch(BillingStore::Transaction& tx, const EpochRow& sealed_with,
                                      const SequenceClaim& claim);

    std::vector<WalletDebit> debit_wallets(BillingStore::Transaction& tx, const UserId& user_id,
                                           MoneyUnits cost);

    void emit_event(EventType type, const std::string& message,
                    const std::optional<UserId>& user_id = std::nullopt,
                    const std::optional<ConversationId>& conversation_id = std::nullopt,
                    const std::optional<MemberId>& member_id = std::nullopt,
                    std::optional<Cents> amount_cents = std::nullopt);
};

} // namespace spendguard
