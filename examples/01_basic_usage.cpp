// 01_basic_usage.cpp
//
// Minimal SpendGuard example: one paid user, one free user, one model.
// Demonstrates the budget estimate, the reservation held while the
// stream runs, and the settled charge written afterwards.
//
// Scenario:
//   - Bob has bought $2.00 of credit.
//   - Alice has only the daily free allowance (5 cents).
//   - Both ask the same question of a basic model.
//   - Alice then tries a premium model and is refused.

#include <spendguard/spendguard.hpp>

#include <iostream>
#include <string>

using namespace spendguard;
using namespace spendguard::provider;

// Stores plaintext as-is. A real deployment encrypts under the epoch key.
class PlainSealer : public MessageSealer {
public:
    std::string seal(const std::string& epoch_public_key, const std::string& plaintext) override {
        return epoch_public_key + ":" + plaintext;
    }
};

// Canned backend: streams a fixed reply and reports token usage.
class CannedClient : public InferenceClient {
public:
    InferenceResult stream_completion(const InferenceRequest& request,
                                      const TokenCallback& on_token) override {
        std::cout << "  [provider] model=" << request.model << " max_tokens="
                  << (request.max_tokens ? std::to_string(*request.max_tokens) : "provider default")
                  << "\n";

        InferenceResult r;
        for (const char* word : {"Budgets ", "are ", "reserved ", "first."}) {
            if (on_token) on_token(word);
            r.content += word;
        }
        r.input_tokens = 120;
        r.output_tokens = 240;
        return r;
    }
};

static ChatTurnRequest make_request(const UserId& user, FundingSource declared,
                                    const ModelPricing& model, int n) {
    ChatTurnRequest req;
    req.user_id = user;
    req.declared_funding_source = declared;
    req.conversation_id = "conv-" + user;
    req.model = model;
    req.user_content = "How does pay-per-use billing avoid overspending?";
    req.messages = {
        {"system", "You are a helpful assistant."},
        {"user", req.user_content},
    };
    req.user_message_id = user + "-msg-" + std::to_string(n);
    req.assistant_message_id = user + "-reply-" + std::to_string(n);
    return req;
}

static void seed_conversation(BillingStore& store, const UserId& owner) {
    ConversationRow conv;
    conv.id = "conv-" + owner;
    conv.owner_id = owner;
    store.add_conversation(conv);
    store.add_epoch(EpochRow{conv.id, 1, "epoch-key-1"});
}

int main() {
    std::cout << "=== SpendGuard: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Wire the store, the counter ledger and the pipeline.
    // ----------------------------------------------------------------
    auto store = std::make_shared<BillingStore>();
    auto ledger = std::make_shared<ReservationLedger>(std::make_shared<InMemoryCounterStore>());
    ChatTurnPipeline pipeline(store, ledger, std::make_shared<PlainSealer>());

    pipeline.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Seed wallets and conversations.
    // ----------------------------------------------------------------
    store->add_wallet(Wallet{"bob-credit", "bob", WalletType::Purchased, 0, dollars_to_units(2.00)});
    store->add_wallet(Wallet{"alice-free", "alice", WalletType::FreeTier, 0, 0});
    seed_conversation(*store, "bob");
    seed_conversation(*store, "alice");

    ModelPricing basic;
    basic.model_id = "basic-model";
    basic.input_price_per_token = 0.0000005;
    basic.output_price_per_token = 0.0000015;
    basic.context_length = 128000;

    ModelPricing premium = basic;
    premium.model_id = "premium-model";
    premium.input_price_per_token = 0.000015;
    premium.output_price_per_token = 0.000075;
    premium.is_premium = true;

    // ----------------------------------------------------------------
    // 3. Preview budgets without reserving anything.
    // ----------------------------------------------------------------
    for (const UserId user : {"bob", "alice"}) {
        auto declared = user == std::string("bob") ? FundingSource::PersonalBalance
                                                   : FundingSource::FreeAllowance;
        auto budget = pipeline.preview_budget(make_request(user, declared, basic, 0));
        std::cout << user << ": can_afford=" << (budget.can_afford ? "yes" : "no")
                  << " max_output_tokens=" << budget.max_output_tokens
                  << " effective_balance=$" << budget.effective_balance << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 4. Run one billable turn for each user.
    // ----------------------------------------------------------------
    CannedClient client;
    StreamOutcomeHandler handler;
    handler.on_token = [](const std::string& token) { std::cout << "  [token] " << token << "\n"; };

    std::cout << "--- Bob (paid) ---\n";
    auto bob = pipeline.run(make_request("bob", FundingSource::PersonalBalance, basic, 1),
                            client, handler);
    std::cout << "Charged " << format_dollars(bob.cost) << " (reserved "
              << bob.worst_case_cents << " cents worst case)\n\n";

    std::cout << "--- Alice (free allowance) ---\n";
    auto alice = pipeline.run(make_request("alice", FundingSource::FreeAllowance, basic, 1),
                              client, handler);
    std::cout << "Charged " << format_dollars(alice.cost) << "\n";
    for (const auto& notice : alice.notices) {
        std::cout << "  notice [" << to_string(notice.severity) << "] " << notice.message << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 5. Premium models need purchased credit.
    // ----------------------------------------------------------------
    std::cout << "--- Alice asks for a premium model ---\n";
    try {
        pipeline.run(make_request("alice", FundingSource::FreeAllowance, premium, 2), client);
    } catch (const BillingDeniedException& e) {
        std::cout << "Refused: " << e.what() << "\n\n";
    }

    // ----------------------------------------------------------------
    // 6. Final balances. Nothing is left reserved.
    // ----------------------------------------------------------------
    std::cout << "=== Balances ===\n";
    std::cout << "  bob-credit: $" << format_dollars(store->wallet("bob-credit")->balance) << "\n";
    std::cout << "  alice-free: $" << format_dollars(store->wallet("alice-free")->balance) << "\n";
    std::cout << "  outstanding reservations: " << ledger->snapshot().total_outstanding << " cents\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
