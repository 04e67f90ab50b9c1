#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <spendguard/spendguard.hpp>

using namespace spendguard;

class BillingStoreTest : public ::testing::Test {
protected:
    BillingStore store;

    void SetUp() override {
        store.add_wallet(Wallet{"w-free", "u1", WalletType::FreeTier, 1, 100});
        store.add_wallet(Wallet{"w-paid", "u1", WalletType::Purchased, 0, 1000});
        store.add_wallet(Wallet{"w-other", "u2", WalletType::Purchased, 0, 5});

        ConversationRow conv;
        conv.id = "conv-1";
        conv.owner_id = "u1";
        store.add_conversation(conv);
        store.add_epoch(EpochRow{"conv-1", 1, "pk-1"});
    }

    UsageRecord usage(const std::string& source_id) const {
        UsageRecord r;
        r.user_id = "u1";
        r.cost = 10;
        r.source_type = "message";
        r.source_id = source_id;
        return r;
    }
};

// ===========================================================================
// Seeding and queries
// ===========================================================================

TEST_F(BillingStoreTest, WalletsSortedByPriority) {
    auto wallets = store.wallets("u1");
    ASSERT_EQ(wallets.size(), 2u);
    EXPECT_EQ(wallets[0].id, "w-paid");
    EXPECT_EQ(wallets[1].id, "w-free");
    EXPECT_TRUE(store.wallets("nobody").empty());
}

TEST_F(BillingStoreTest, DuplicateSeedsRejected) {
    EXPECT_THROW(store.add_wallet(Wallet{"w-paid", "u1", WalletType::Purchased, 0, 0}), DuplicateIdException);

    ConversationRow conv;
    conv.id = "conv-1";
    EXPECT_THROW(store.add_conversation(conv), DuplicateIdException);
}

TEST_F(BillingStoreTest, MemberNeedsConversation) {
    EXPECT_THROW(store.add_member(MemberRow{"m1", "missing", std::nullopt, true}),
                 ConversationNotFoundException);
    EXPECT_THROW(store.set_member_budget("m1", 100), MemberNotFoundException);

    store.add_member(MemberRow{"m1", "conv-1", std::nullopt, true});
    store.set_member_budget("m1", 100);
    EXPECT_EQ(store.member_budget("m1")->budget, 100);
    EXPECT_EQ(store.member_budget("m1")->spent, 0);
}

// ===========================================================================
// Transactions
// ===========================================================================

TEST_F(BillingStoreTest, CommittedChangesAreVisible) {
    store.transaction([](BillingStore::Transaction& tx) { tx.set_wallet_balance("w-paid", 400); });
    EXPECT_EQ(store.wallet("w-paid")->balance, 400);
}

TEST_F(BillingStoreTest, ExceptionRollsBackEveryTable) {
    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        tx.claim_sequences("conv-1", 2);
        tx.set_wallet_balance("w-paid", 0);
        tx.insert_usage_record(usage("msg-1"));
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(store.wallet("w-paid")->balance, 1000);
    EXPECT_EQ(store.conversation("conv-1")->next_sequence, 1);
    EXPECT_TRUE(store.usage_records().empty());
}

TEST_F(BillingStoreTest, TransactionReturnsValue) {
    auto claim = store.transaction([](BillingStore::Transaction& tx) {
        return tx.claim_sequences("conv-1", 2);
    });
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(claim->first_sequence, 1);
    EXPECT_EQ(claim->current_epoch, 1);
    EXPECT_EQ(store.conversation("conv-1")->next_sequence, 3);
}

TEST_F(BillingStoreTest, ClaimOnMissingConversationIsEmpty) {
    auto claim = store.transaction([](BillingStore::Transaction& tx) {
        return tx.claim_sequences("missing", 1);
    });
    EXPECT_FALSE(claim.has_value());
}

// ===========================================================================
// Constraints
// ===========================================================================

TEST_F(BillingStoreTest, UsageRecordPerSourceIsUnique) {
    store.transaction([&](BillingStore::Transaction& tx) { tx.insert_usage_record(usage("msg-1")); });

    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        tx.insert_usage_record(usage("msg-1"));
    }), DuplicateIdException);
    EXPECT_EQ(store.usage_records().size(), 1u);
}

TEST_F(BillingStoreTest, LedgerEntryNeedsExactlyOneReference) {
    LedgerEntry none;
    none.wallet_id = "w-paid";
    EXPECT_THROW(store.add_ledger_entry(none), ConstraintViolationException);

    LedgerEntry two;
    two.wallet_id = "w-paid";
    two.payment_id = "pay-1";
    two.source_wallet_id = "w-paid";
    EXPECT_THROW(store.add_ledger_entry(two), ConstraintViolationException);

    LedgerEntry deposit;
    deposit.wallet_id = "w-paid";
    deposit.entry_type = LedgerEntryType::Deposit;
    deposit.payment_id = "pay-1";
    EXPECT_FALSE(store.add_ledger_entry(deposit).empty());
    EXPECT_EQ(store.ledger_entries().size(), 1u);
}

TEST_F(BillingStoreTest, LedgerEntryReferencesMustExist) {
    LedgerEntry unknown_wallet;
    unknown_wallet.wallet_id = "ghost";
    unknown_wallet.payment_id = "pay-1";
    EXPECT_THROW(store.add_ledger_entry(unknown_wallet), ConstraintViolationException);

    LedgerEntry unknown_usage;
    unknown_usage.wallet_id = "w-paid";
    unknown_usage.usage_record_id = "usage-404";
    EXPECT_THROW(store.add_ledger_entry(unknown_usage), ConstraintViolationException);
}

TEST_F(BillingStoreTest, OneCompletionPerUsageRecord) {
    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        const RecordId id = tx.insert_usage_record(usage("msg-1"));
        LlmCompletion c;
        c.usage_record_id = id;
        tx.insert_llm_completion(c);
        tx.insert_llm_completion(c);
    }), DuplicateIdException);
    EXPECT_TRUE(store.llm_completions().empty());
}

TEST_F(BillingStoreTest, RaiseFreeWalletOnlyWhenBelowTarget) {
    store.transaction([](BillingStore::Transaction& tx) {
        EXPECT_TRUE(tx.raise_free_wallet_to("w-free", 500));
        EXPECT_FALSE(tx.raise_free_wallet_to("w-free", 500));
        EXPECT_FALSE(tx.raise_free_wallet_to("w-paid", 5000));
    });
    EXPECT_EQ(store.wallet("w-free")->balance, 500);
    EXPECT_EQ(store.wallet("w-paid")->balance, 1000);
}

TEST_F(BillingStoreTest, MemberSpendingRequiresMembership) {
    ConversationRow other;
    other.id = "conv-2";
    store.add_conversation(other);
    store.add_member(MemberRow{"m1", "conv-1", std::nullopt, true});

    EXPECT_THROW(store.transaction([](BillingStore::Transaction& tx) {
        tx.add_member_spending("conv-2", "m1", 10);
    }), MemberNotFoundException);

    store.transaction([](BillingStore::Transaction& tx) {
        tx.add_conversation_spending("conv-1", 10);
        tx.add_member_spending("conv-1", "m1", 10);
    });
    EXPECT_EQ(store.conversation_spending("conv-1"), 10);
    EXPECT_EQ(store.member_budget("m1")->spent, 10);
}

// ===========================================================================
// Rollback of indexed rows
// ===========================================================================

TEST_F(BillingStoreTest, RollbackLeavesEarlierCommitsIntact) {
    for (int i = 0; i < 50; ++i) {
        store.transaction([&](BillingStore::Transaction& tx) {
            tx.claim_sequences("conv-1", 2);
            const RecordId id = tx.insert_usage_record(usage("msg-" + std::to_string(i)));
            LedgerEntry charge;
            charge.wallet_id = "w-paid";
            charge.amount = -1;
            charge.usage_record_id = id;
            tx.insert_ledger_entry(charge);
        });
    }

    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        tx.claim_sequences("conv-1", 2);
        tx.set_wallet_balance("w-paid", 0);
        const RecordId id = tx.insert_usage_record(usage("msg-new"));
        LedgerEntry charge;
        charge.wallet_id = "w-paid";
        charge.amount = -1;
        charge.usage_record_id = id;
        tx.insert_ledger_entry(charge);
        LlmCompletion c;
        c.usage_record_id = id;
        tx.insert_llm_completion(c);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(store.usage_records().size(), 50u);
    EXPECT_EQ(store.ledger_entries().size(), 50u);
    EXPECT_TRUE(store.llm_completions().empty());
    EXPECT_EQ(store.conversation("conv-1")->next_sequence, 101);
    EXPECT_EQ(store.wallet("w-paid")->balance, 1000);
}

TEST_F(BillingStoreTest, RolledBackSourceCanBeRecordedAgain) {
    RecordId failed_id;
    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        failed_id = tx.insert_usage_record(usage("msg-1"));
        LlmCompletion c;
        c.usage_record_id = failed_id;
        tx.insert_llm_completion(c);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    RecordId id = store.transaction([&](BillingStore::Transaction& tx) {
        const RecordId usage_id = tx.insert_usage_record(usage("msg-1"));
        LlmCompletion c;
        c.usage_record_id = usage_id;
        tx.insert_llm_completion(c);
        return usage_id;
    });
    // Record ids handed out by the failed transaction are reused
    EXPECT_EQ(id, failed_id);
    EXPECT_EQ(store.usage_records().size(), 1u);
    EXPECT_EQ(store.llm_completions().size(), 1u);
}

TEST_F(BillingStoreTest, LastRenewalTracksLatestAndRollsBack) {
    const WallTime day1 = WallTime{} + std::chrono::hours(24);
    const WallTime day2 = day1 + std::chrono::hours(24);

    LedgerEntry renewal;
    renewal.wallet_id = "w-free";
    renewal.entry_type = LedgerEntryType::Renewal;
    renewal.source_wallet_id = "w-free";
    renewal.created_at = day2;
    store.add_ledger_entry(renewal);

    // An older entry does not move the latest renewal back
    renewal.created_at = day1;
    store.add_ledger_entry(renewal);

    auto latest = store.transaction([](BillingStore::Transaction& tx) {
        return tx.last_renewal_at("w-free");
    });
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest.value(), day2);

    EXPECT_THROW(store.transaction([&](BillingStore::Transaction& tx) {
        LedgerEntry later = renewal;
        later.created_at = day2 + std::chrono::hours(24);
        tx.insert_ledger_entry(later);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    latest = store.transaction([](BillingStore::Transaction& tx) {
        return tx.last_renewal_at("w-free");
    });
    EXPECT_EQ(latest.value(), day2);
    EXPECT_FALSE(store.transaction([](BillingStore::Transaction& tx) {
        return tx.last_renewal_at("w-paid");
    }).has_value());
}

TEST_F(BillingStoreTest, RollbackRestoresSpendingRows) {
    store.add_member(MemberRow{"m1", "conv-1", std::nullopt, true});
    store.transaction([](BillingStore::Transaction& tx) {
        tx.add_conversation_spending("conv-1", 10);
    });

    EXPECT_THROW(store.transaction([](BillingStore::Transaction& tx) {
        tx.add_conversation_spending("conv-1", 5);
        tx.add_member_spending("conv-1", "m1", 5);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_EQ(store.conversation_spending("conv-1"), 10);
    EXPECT_FALSE(store.member_budget("m1").has_value());
}
