#pragma once

#include "spendguard/exceptions.hpp"
#include "spendguard/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spendguard {

// ==================== Rows ====================

struct Wallet {
    WalletId id;
    UserId user_id;
    WalletType type{WalletType::Purchased};
    int priority{0};          // lower is charged first
    MoneyUnits balance{0};    // may go negative
};

struct ConversationRow {
    ConversationId id;
    UserId owner_id;
    std::int64_t next_sequence{1};
    std::int64_t current_epoch{1};
    MoneyUnits conversation_budget{0};
};

struct EpochRow {
    ConversationId conversation_id;
    std::int64_t epoch_number{1};
    std::string public_key;
};

struct MemberRow {
    MemberId id;
    ConversationId conversation_id;
    std::optional<UserId> user_id;
    bool active{true};
};

struct MemberBudgetRow {
    MemberId member_id;
    MoneyUnits budget{0};
    MoneyUnits spent{0};
};

struct MessageRow {
    MessageId id;
    ConversationId conversation_id;
    std::string encrypted_blob;
    SenderType sender_type{SenderType::User};
    std::optional<UserId> sender_id;
    std::optional<UserId> payer_id;
    std::optional<MoneyUnits> cost;
    std::int64_t epoch_number{0};
    std::int64_t sequence_number{0};
};

struct UsageRecord {
    RecordId id;
    UserId user_id;
    MoneyUnits cost{0};
    UsageStatus status{UsageStatus::Completed};
    std::string source_type;
    std::string source_id;
    WallTime created_at{};
};

// Exactly one of payment_id / usage_record_id / source_wallet_id is set
struct LedgerEntry {
    RecordId id;
    WalletId wallet_id;
    MoneyUnits amount{0};
    MoneyUnits balance_after{0};
    LedgerEntryType entry_type{LedgerEntryType::UsageCharge};
    std::optional<RecordId> payment_id;
    std::optional<RecordId> usage_record_id;
    std::optional<WalletId> source_wallet_id;
    WallTime created_at{};
};

struct LlmCompletion {
    RecordId id;
    RecordId usage_record_id;
    std::string provider;
    std::string model;
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::int64_t cached_tokens{0};
};

struct SequenceClaim {
    std::int64_t first_sequence{0};
    std::int64_t current_epoch{0};
};

// In-memory relational store with serializable, all-or-nothing transactions.
class BillingStore {
public:
    struct Tables {
        std::map<WalletId, Wallet> wallets;
        std::map<ConversationId, ConversationRow> conversations;
        std::map<std::pair<ConversationId, std::int64_t>, EpochRow> epochs;
        std::map<MemberId, MemberRow> members;
        std::map<MemberId, MemberBudgetRow> member_budgets;
        std::map<ConversationId, MoneyUnits> conversation_spending;
        std::map<MessageId, MessageRow> messages;
        std::map<RecordId, UsageRecord> usage_records;
        std::vector<LedgerEntry> ledger_entries;
        std::map<RecordId, LlmCompletion> llm_completions;
        std::uint64_t next_record_id{1};

        // Indexes
        std::map<std::pair<std::string, std::string>, RecordId> usage_by_source;
        std::map<RecordId, RecordId> completion_by_usage;
        std::map<WalletId, WallTime> last_renewal;
    };

    // Mutating view handed to transaction bodies
    class Transaction {
    public:
        // UPDATE conversations SET next_sequence += count RETURNING the claimed range
        std::optional<SequenceClaim> claim_sequences(const ConversationId& id, std::int64_t count);
        std::optional<EpochRow> find_epoch(const ConversationId& id, std::int64_t epoch) const;

        void insert_message(MessageRow row);

        // Wallets of the user sorted by priority, then id
        std::vector<Wallet> wallets_for_user(const UserId& user_id) const;
        std::optional<Wallet> find_wallet(const WalletId& id) const;
        void set_wallet_balance(const WalletId& id, MoneyUnits balance);

        // UPDATE ... SET balance = target WHERE type = free_tier AND balance < target
        bool raise_free_wallet_to(const WalletId& id, MoneyUnits target);
        std::optional<WallTime> last_renewal_at(const WalletId& id) const;

        RecordId insert_usage_record(UsageRecord row);
        RecordId insert_ledger_entry(LedgerEntry row);
        RecordId insert_llm_completion(LlmCompletion row);

        // Upserts; the member must exist in the conversation
        void add_conversation_spending(const ConversationId& id, MoneyUnits amount);
        void add_member_spending(const ConversationId& conversation_id,
                                 const MemberId& member_id, MoneyUnits amount);

    private:
        friend class BillingStore;
        explicit Transaction(Tables& tables)
            : t_(tables), saved_next_record_id_(tables.next_record_id) {}

        RecordId next_id(const char* prefix);

        // Undoes every change made through this transaction, newest first
        void rollback();

        Tables& t_;
        std::uint64_t saved_next_record_id_;
        std::vector<std::function<void()>> undo_log_;
    };

    BillingStore() = default;

    BillingStore(const BillingStore&) = delete;
    BillingStore& operator=(const BillingStore&) = delete;

    // Runs fn against the live tables under an exclusive lock. Each change is
    // recorded in an undo log; any exception replays the log in reverse, which
    // restores every table to its state before the call, and is rethrown.
    template <typename Fn>
    auto transaction(Fn&& fn) -> decltype(fn(std::declval<Transaction&>())) {
        std::unique_lock lock(mutex_);
        Transaction tx(tables_);
        try {
            if constexpr (std::is_void_v<decltype(fn(tx))>) {
                fn(tx);
            } else {
                return fn(tx);
            }
        } catch (...) {
            tx.rollback();
            throw;
        }
    }

    // ==================== Seeding ====================

    void add_wallet(Wallet wallet);
    void add_conversation(ConversationRow conversation);
    // Inserts or replaces the public key of an epoch
    void add_epoch(EpochRow epoch);
    void add_member(MemberRow member);
    void set_member_budget(const MemberId& member_id, MoneyUnits budget);
    void set_conversation_budget(const ConversationId& id, MoneyUnits budget);
    void remove_conversation(const ConversationId& id);

    // Appends an entry (e.g. a back-dated renewal); reference exclusivity is enforced
    RecordId add_ledger_entry(LedgerEntry entry);

    // ==================== Queries ====================

    std::vector<Wallet> wallets(const UserId& user_id) const;
    std::optional<Wallet> wallet(const WalletId& id) const;
    std::optional<ConversationRow> conversation(const ConversationId& id) const;
    std::optional<EpochRow> epoch(const ConversationId& id, std::int64_t epoch_number) const;
    std::optional<MemberRow> member(const MemberId& id) const;
    std::optional<MemberBudgetRow> member_budget(const MemberId& id) const;
    MoneyUnits conversation_spending(const ConversationId& id) const;

    std::optional<MessageRow> message(const MessageId& id) const;
    std::vector<MessageRow> messages(const ConversationId& id) const;
    std::vector<UsageRecord> usage_records() const;
    std::vector<LedgerEntry> ledger_entries() const;
    std::vector<LlmCompletion> llm_completions() const;

private:
    mutable std::shared_mutex mutex_;
    Tables tables_;
};

} // namespace spendguard
