#include "spendguard/billing_store.hpp"

#include <algorithm>

namespace spendguard {

namespace {

void check_reference_exclusivity(const LedgerEntry& entry) {
    const int refs = (entry.payment_id.has_value() ? 1 : 0) +
                     (entry.usage_record_id.has_value() ? 1 : 0) +
                     (entry.source_wallet_id.has_value() ? 1 : 0);
    if (refs != 1) {
        throw ConstraintViolationException(
            "ledger_entries: exactly one of payment_id, usage_record_id, source_wallet_id must be set");
    }
}

std::vector<Wallet> sorted_wallets(const std::map<WalletId, Wallet>& wallets, const UserId& user_id) {
    std::vector<Wallet> result;
    for (auto& [_, w] : wallets) {
        if (w.user_id == user_id) result.push_back(w);
    }
    std::stable_sort(result.begin(), result.end(), [](const Wallet& a, const Wallet& b) {
        return a.priority < b.priority;
    });
    return result;
}

} // anonymous namespace

// ========== Transaction ==========

RecordId BillingStore::Transaction::next_id(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(t_.next_record_id++);
}

void BillingStore::Transaction::rollback() {
    for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
        (*it)();
    }
    undo_log_.clear();
    t_.next_record_id = saved_next_record_id_;
}

std::optional<SequenceClaim> BillingStore::Transaction::claim_sequences(const ConversationId& id,
                                                                        std::int64_t count) {
    auto it = t_.conversations.find(id);
    if (it == t_.conversations.end()) return std::nullopt;

    const std::int64_t previous = it->second.next_sequence;
    undo_log_.push_back([this, id, previous] { t_.conversations[id].next_sequence = previous; });
    it->second.next_sequence += count;
    return SequenceClaim{previous, it->second.current_epoch};
}

std::optional<EpochRow> BillingStore::Transaction::find_epoch(const ConversationId& id,
                                                              std::int64_t epoch) const {
    auto it = t_.epochs.find({id, epoch});
    if (it == t_.epochs.end()) return std::nullopt;
    return it->second;
}

void BillingStore::Transaction::insert_message(MessageRow row) {
    if (t_.messages.count(row.id) > 0) {
        throw DuplicateIdException("messages", row.id);
    }
    MessageId id = row.id;
    t_.messages.emplace(id, std::move(row));
    undo_log_.push_back([this, id] { t_.messages.erase(id); });
}

std::vector<Wallet> BillingStore::Transaction::wallets_for_user(const UserId& user_id) const {
    return sorted_wallets(t_.wallets, user_id);
}

std::optional<Wallet> BillingStore::Transaction::find_wallet(const WalletId& id) const {
    auto it = t_.wallets.find(id);
    if (it == t_.wallets.end()) return std::nullopt;
    return it->second;
}

void BillingStore::Transaction::set_wallet_balance(const WalletId& id, MoneyUnits balance) {
    auto it = t_.wallets.find(id);
    if (it == t_.wallets.end()) {
        throw ConstraintViolationException("wallets: no row with id " + id);
    }
    const MoneyUnits previous = it->second.balance;
    undo_log_.push_back([this, id, previous] { t_.wallets[id].balance = previous; });
    it->second.balance = balance;
}

bool BillingStore::Transaction::raise_free_wallet_to(const WalletId& id, MoneyUnits target) {
    auto it = t_.wallets.find(id);
    if (it == t_.wallets.end()) return false;
    if (it->second.type != WalletType::FreeTier) return false;
    if (it->second.balance >= target) return false;
    const MoneyUnits previous = it->second.balance;
    undo_log_.push_back([this, id, previous] { t_.wallets[id].balance = previous; });
    it->second.balance = target;
    return true;
}

std::optional<WallTime> BillingStore::Transaction::last_renewal_at(const WalletId& id) const {
    auto it = t_.last_renewal.find(id);
    if (it == t_.last_renewal.end()) return std::nullopt;
    return it->second;
}

RecordId BillingStore::Transaction::insert_usage_record(UsageRecord row) {
    if (row.id.empty()) row.id = next_id("usage");
    if (t_.usage_records.count(row.id) > 0) {
        throw DuplicateIdException("usage_records", row.id);
    }
    // One usage record per source (the assistant message)
    auto source = std::make_pair(row.source_type, row.source_id);
    if (t_.usage_by_source.count(source) > 0) {
        throw DuplicateIdException("usage_records", row.source_type + ":" + row.source_id);
    }
    RecordId id = row.id;
    t_.usage_records.emplace(id, std::move(row));
    t_.usage_by_source.emplace(source, id);
    undo_log_.push_back([this, id, source] {
        t_.usage_by_source.erase(source);
        t_.usage_records.erase(id);
    });
    return id;
}

RecordId BillingStore::Transaction::insert_ledger_entry(LedgerEntry row) {
    check_reference_exclusivity(row);
    if (t_.wallets.count(row.wallet_id) == 0) {
        throw ConstraintViolationException("ledger_entries: unknown wallet " + row.wallet_id);
    }
    if (row.usage_record_id.has_value() && t_.usage_records.count(row.usage_record_id.value()) == 0) {
        throw ConstraintViolationException("ledger_entries: unknown usage record " +
                                           row.usage_record_id.value());
    }
    if (row.id.empty()) row.id = next_id("ledger");

    if (row.entry_type == LedgerEntryType::Renewal) {
        std::optional<WallTime> previous;
        auto it = t_.last_renewal.find(row.wallet_id);
        if (it != t_.last_renewal.end()) previous = it->second;
        if (!previous.has_value() || row.created_at > previous.value()) {
            t_.last_renewal[row.wallet_id] = row.created_at;
            undo_log_.push_back([this, wallet_id = row.wallet_id, previous] {
                if (previous.has_value()) {
                    t_.last_renewal[wallet_id] = previous.value();
                } else {
                    t_.last_renewal.erase(wallet_id);
                }
            });
        }
    }

    RecordId id = row.id;
    t_.ledger_entries.push_back(std::move(row));
    // Undo runs newest first, so the entry is still at the back
    undo_log_.push_back([this] { t_.ledger_entries.pop_back(); });
    return id;
}

RecordId BillingStore::Transaction::insert_llm_completion(LlmCompletion row) {
    if (t_.usage_records.count(row.usage_record_id) == 0) {
        throw ConstraintViolationException("llm_completions: unknown usage record " + row.usage_record_id);
    }
    if (t_.completion_by_usage.count(row.usage_record_id) > 0) {
        throw DuplicateIdException("llm_completions", row.usage_record_id);
    }
    if (row.id.empty()) row.id = next_id("completion");
    RecordId id = row.id;
    RecordId usage_id = row.usage_record_id;
    t_.llm_completions.emplace(id, std::move(row));
    t_.completion_by_usage.emplace(usage_id, id);
    undo_log_.push_back([this, id, usage_id] {
        t_.completion_by_usage.erase(usage_id);
        t_.llm_completions.erase(id);
    });
    return id;
}

void BillingStore::Transaction::add_conversation_spending(const ConversationId& id, MoneyUnits amount) {
    if (t_.conversations.count(id) == 0) {
        throw ConversationNotFoundException(id);
    }
    auto it = t_.conversation_spending.find(id);
    if (it == t_.conversation_spending.end()) {
        undo_log_.push_back([this, id] { t_.conversation_spending.erase(id); });
    } else {
        const MoneyUnits previous = it->second;
        undo_log_.push_back([this, id, previous] { t_.conversation_spending[id] = previous; });
    }
    t_.conversation_spending[id] += amount;
}

void BillingStore::Transaction::add_member_spending(const ConversationId& conversation_id,
                                                    const MemberId& member_id, MoneyUnits amount) {
    auto it = t_.members.find(member_id);
    if (it == t_.members.end() || it->second.conversation_id != conversation_id) {
        throw MemberNotFoundException(member_id);
    }
    auto existing = t_.member_budgets.find(member_id);
    if (existing == t_.member_budgets.end()) {
        undo_log_.push_back([this, member_id] { t_.member_budgets.erase(member_id); });
    } else {
        const MoneyUnits previous = existing->second.spent;
        undo_log_.push_back([this, member_id, previous] { t_.member_budgets[member_id].spent = previous; });
    }
    auto& budget = t_.member_budgets[member_id];
    budget.member_id = member_id;
    budget.spent += amount;
}

// ========== Seeding ==========

void BillingStore::add_wallet(Wallet wallet) {
    std::unique_lock lock(mutex_);
    if (tables_.wallets.count(wallet.id) > 0) {
        throw DuplicateIdException("wallets", wallet.id);
    }
    tables_.wallets.emplace(wallet.id, std::move(wallet));
}

void BillingStore::add_conversation(ConversationRow conversation) {
    std::unique_lock lock(mutex_);
    if (tables_.conversations.count(conversation.id) > 0) {
        throw DuplicateIdException("conversations", conversation.id);
    }
    tables_.conversations.emplace(conversation.id, std::move(conversation));
}

void BillingStore::add_epoch(EpochRow epoch) {
    std::unique_lock lock(mutex_);
    auto key = std::make_pair(epoch.conversation_id, epoch.epoch_number);
    tables_.epochs[key] = std::move(epoch);
}

void BillingStore::add_member(MemberRow member) {
    std::unique_lock lock(mutex_);
    if (tables_.conversations.count(member.conversation_id) == 0) {
        throw ConversationNotFoundException(member.conversation_id);
    }
    tables_.members[member.id] = std::move(member);
}

void BillingStore::set_member_budget(const MemberId& member_id, MoneyUnits budget) {
    std::unique_lock lock(mutex_);
    if (tables_.members.count(member_id) == 0) {
        throw MemberNotFoundException(member_id);
    }
    auto& row = tables_.member_budgets[member_id];
    row.member_id = member_id;
    row.budget = budget;
}

void BillingStore::set_conversation_budget(const ConversationId& id, MoneyUnits budget) {
    std::unique_lock lock(mutex_);
    auto it = tables_.conversations.find(id);
    if (it == tables_.conversations.end()) {
        throw ConversationNotFoundException(id);
    }
    it->second.conversation_budget = budget;
}

void BillingStore::remove_conversation(const ConversationId& id) {
    std::unique_lock lock(mutex_);
    tables_.conversations.erase(id);
}

RecordId BillingStore::add_ledger_entry(LedgerEntry entry) {
    return transaction([&](Transaction& tx) {
        return tx.insert_ledger_entry(std::move(entry));
    });
}

// ========== Queries ==========

std::vector<Wallet> BillingStore::wallets(const UserId& user_id) const {
    std::shared_lock lock(mutex_);
    return sorted_wallets(tables_.wallets, user_id);
}

std::optional<Wallet> BillingStore::wallet(const WalletId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.wallets.find(id);
    if (it == tables_.wallets.end()) return std::nullopt;
    return it->second;
}

std::optional<ConversationRow> BillingStore::conversation(const ConversationId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.conversations.find(id);
    if (it == tables_.conversations.end()) return std::nullopt;
    return it->second;
}

std::optional<EpochRow> BillingStore::epoch(const ConversationId& id, std::int64_t epoch_number) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.epochs.find({id, epoch_number});
    if (it == tables_.epochs.end()) return std::nullopt;
    return it->second;
}

std::optional<MemberRow> BillingStore::member(const MemberId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.members.find(id);
    if (it == tables_.members.end()) return std::nullopt;
    return it->second;
}

std::optional<MemberBudgetRow> BillingStore::member_budget(const MemberId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.member_budgets.find(id);
    if (it == tables_.member_budgets.end()) return std::nullopt;
    return it->second;
}

MoneyUnits BillingStore::conversation_spending(const ConversationId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.conversation_spending.find(id);
    return (it != tables_.conversation_spending.end()) ? it->second : 0;
}

std::optional<MessageRow> BillingStore::message(const MessageId& id) const {
    std::shared_lock lock(mutex_);
    auto it = tables_.messages.find(id);
    if (it == tables_.messages.end()) return std::nullopt;
    return it->second;
}

std::vector<MessageRow> BillingStore::messages(const ConversationId& id) const {
    std::shared_lock lock(mutex_);
    std::vector<MessageRow> result;
    for (auto& [_, m] : tables_.messages) {
        if (m.conversation_id == id) result.push_back(m);
    }
    std::sort(result.begin(), result.end(), [](const MessageRow& a, const MessageRow& b) {
        return a.sequence_number < b.sequence_number;
    });
    return result;
}

std::vector<UsageRecord> BillingStore::usage_records() const {
    std::shared_lock lock(mutex_);
    std::vector<UsageRecord> result;
    for (auto& [_, r] : tables_.usage_records) result.push_back(r);
    return result;
}

std::vector<LedgerEntry> BillingStore::ledger_entries() const {
    std::shared_lock lock(mutex_);
    return tables_.ledger_entries;
}

std::vector<LlmCompletion> BillingStore::llm_completions() const {
    std::shared_lock lock(mutex_);
    std::vector<LlmCompletion> result;
    for (auto& [_, c] : tables_.llm_completions) result.push_back(c);
    return result;
}

} // namespace spendguard
