// 02_group_billing.cpp
//
// Owner-funded group chat: members spend the owner's balance within a
// per-conversation budget and a per-member budget.
//
// Scenario:
//   - Olivia owns a group conversation and has $3.00 of credit.
//   - The conversation may spend at most $1.00 in total.
//   - Member Carol may spend at most 40 cents of it.
//   - Carol keeps chatting; each turn reserves against all three scopes
//     (member, conversation, owner) and settles to Olivia's wallet.
//   - Once Carol's member budget cannot cover the minimum output, the
//     group no longer funds her and her own free allowance takes over.

#include <spendguard/spendguard.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>

using namespace spendguard;
using namespace spendguard::provider;

class PlainSealer : public MessageSealer {
public:
    std::string seal(const std::string& epoch_public_key, const std::string& plaintext) override {
        return epoch_public_key + ":" + plaintext;
    }
};

// Long answers, so the member budget drains quickly. Honors max_tokens
// the way a real provider does.
class VerboseClient : public InferenceClient {
public:
    InferenceResult stream_completion(const InferenceRequest& request,
                                      const TokenCallback& on_token) override {
        InferenceResult r;
        r.content = std::string(2000, '.');
        if (on_token) on_token(r.content);
        r.input_tokens = 2000;
        r.output_tokens = std::min<std::int64_t>(4000, request.max_tokens.value_or(4000));
        return r;
    }
};

static void print_budgets(const BillingStore& store) {
    auto member = store.member_budget("m-carol");
    std::cout << "  owner wallet:        $" << format_dollars(store.wallet("olivia-credit")->balance) << "\n";
    std::cout << "  conversation spent:  $" << format_dollars(store.conversation_spending("team-chat")) << "\n";
    std::cout << "  carol spent/budget:  $" << format_dollars(member->spent)
              << " / $" << format_dollars(member->budget) << "\n";
}

int main() {
    std::cout << "=== SpendGuard: Group Billing Example ===\n\n";

    auto store = std::make_shared<BillingStore>();
    auto ledger = std::make_shared<ReservationLedger>(std::make_shared<InMemoryCounterStore>());
    ChatTurnPipeline pipeline(store, ledger, std::make_shared<PlainSealer>());

    auto metrics = std::make_shared<MetricsMonitor>();
    pipeline.set_monitor(metrics);

    // ----------------------------------------------------------------
    // 1. Owner, member and the shared conversation.
    // ----------------------------------------------------------------
    store->add_wallet(Wallet{"olivia-credit", "olivia", WalletType::Purchased, 0, dollars_to_units(3.00)});
    store->add_wallet(Wallet{"carol-free", "carol", WalletType::FreeTier, 0, 0});

    ConversationRow conv;
    conv.id = "team-chat";
    conv.owner_id = "olivia";
    conv.conversation_budget = dollars_to_units(1.00);
    store->add_conversation(conv);
    store->add_epoch(EpochRow{"team-chat", 1, "team-epoch-1"});

    store->add_member(MemberRow{"m-carol", "team-chat", UserId("carol"), true});
    store->set_member_budget("m-carol", 40 * MONEY_UNITS_PER_CENT);

    ModelPricing model;
    model.model_id = "basic-model";
    model.input_price_per_token = 0.000003;
    model.output_price_per_token = 0.000015;
    model.context_length = 200000;

    std::cout << "Initial budgets:\n";
    print_budgets(*store);
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 2. Carol chats on Olivia's dime until the group stops funding her.
    // ----------------------------------------------------------------
    VerboseClient client;
    for (int turn = 1; turn <= 10; ++turn) {
        ChatTurnRequest req;
        req.user_id = UserId("carol");
        req.declared_funding_source = FundingSource::OwnerBalance;
        req.conversation_id = "team-chat";
        req.group = GroupContext{"team-chat", "m-carol", "olivia"};
        req.model = model;
        req.user_content = "Summarize the thread so far.";
        req.messages = {{"user", req.user_content}};
        req.user_message_id = "carol-" + std::to_string(turn);
        req.assistant_message_id = "reply-" + std::to_string(turn);

        try {
            auto result = pipeline.run(req, client);
            std::cout << "Turn " << turn << ": charged $" << format_dollars(result.cost)
                      << " to " << to_string(result.funding_source)
                      << " (reserved " << result.worst_case_cents << " cents)\n";
        } catch (const BillingMismatchException& e) {
            std::cout << "Turn " << turn << ": group no longer funds Carol, resolved "
                      << to_string(e.resolved()) << "\n";
            break;
        } catch (const BillingDeniedException& e) {
            std::cout << "Turn " << turn << ": denied (" << e.what() << ")\n";
            break;
        }
    }

    // ----------------------------------------------------------------
    // 3. Where the money went.
    // ----------------------------------------------------------------
    std::cout << "\nFinal budgets:\n";
    print_budgets(*store);

    auto m = metrics->get_metrics();
    std::cout << "\nSettlements: " << m.settlements
              << ", total settled: " << m.total_settled_cents << " cents"
              << ", peak outstanding: " << m.peak_outstanding_cents << " cents\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
