// 03_concurrent_reservations.cpp
//
// Several browser tabs fire chat turns at the same time against one
// balance. Each turn reserves its worst-case cost before streaming, so the
// in-flight total can never exceed what the account can pay.
//
// Scenario:
//   - Dana has $0.60 of credit (plus the 50 cent overdraft cushion).
//   - Eight threads start a turn at once; each streams slowly.
//   - Turns that would push the reserved total over the ceiling are
//     refused with BalanceReservedException and may be retried later.

#include <spendguard/spendguard.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace spendguard;
using namespace spendguard::provider;
using namespace std::chrono_literals;

class PlainSealer : public MessageSealer {
public:
    std::string seal(const std::string& epoch_public_key, const std::string& plaintext) override {
        return epoch_public_key + ":" + plaintext;
    }
};

class SlowClient : public InferenceClient {
public:
    InferenceResult stream_completion(const InferenceRequest&, const TokenCallback&) override {
        std::this_thread::sleep_for(200ms);
        InferenceResult r;
        r.content = "Done.";
        r.input_tokens = 80;
        r.output_tokens = 400;
        return r;
    }
};

int main() {
    std::cout << "=== SpendGuard: Concurrent Reservations Example ===\n\n";

    auto store = std::make_shared<BillingStore>();
    auto ledger = std::make_shared<ReservationLedger>(std::make_shared<InMemoryCounterStore>());
    ChatTurnPipeline pipeline(store, ledger, std::make_shared<PlainSealer>());

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_outstanding_alert_threshold(80.0, [](const std::string& msg) {
        std::cout << "  [alert] " << msg << "\n";
    });
    pipeline.set_monitor(metrics);

    store->add_wallet(Wallet{"dana-credit", "dana", WalletType::Purchased, 0, dollars_to_units(0.60)});
    ConversationRow conv;
    conv.id = "dana-chat";
    conv.owner_id = "dana";
    store->add_conversation(conv);
    store->add_epoch(EpochRow{"dana-chat", 1, "dana-epoch-1"});

    ModelPricing model;
    model.model_id = "basic-model";
    model.input_price_per_token = 0.0000005;
    model.output_price_per_token = 0.0000015;
    model.context_length = 128000;

    constexpr int NUM_TABS = 8;
    SlowClient client;
    std::mutex out_mutex;
    std::atomic<int> completed{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> tabs;
    for (int i = 0; i < NUM_TABS; ++i) {
        tabs.emplace_back([&, i]() {
            ChatTurnRequest req;
            req.user_id = UserId("dana");
            req.declared_funding_source = FundingSource::PersonalBalance;
            req.conversation_id = "dana-chat";
            req.model = model;
            req.user_content = "Tab " + std::to_string(i) + " says hello.";
            req.messages = {{"user", req.user_content}};
            req.user_message_id = "tab-" + std::to_string(i);
            req.assistant_message_id = "tab-reply-" + std::to_string(i);

            try {
                auto result = pipeline.run(req, client);
                completed++;
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << "Tab " << i << ": reserved " << result.worst_case_cents
                          << " cents, charged $" << format_dollars(result.cost) << "\n";
            } catch (const BalanceReservedException& e) {
                refused++;
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << "Tab " << i << ": refused, " << e.what() << "\n";
            } catch (const SpendGuardException& e) {
                refused++;
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << "Tab " << i << ": failed, " << e.what() << "\n";
            }
        });
    }
    for (auto& t : tabs) t.join();

    auto m = metrics->get_metrics();
    std::cout << "\nCompleted: " << completed.load() << ", refused: " << refused.load() << "\n";
    std::cout << "Peak outstanding: " << m.peak_outstanding_cents << " cents (ceiling 110)\n";
    std::cout << "Race rejections: " << m.race_rejections << "\n";
    std::cout << "Wallet after: $" << format_dollars(store->wallet("dana-credit")->balance) << "\n";
    ledger->publish_snapshot();
    std::cout << "Outstanding now: " << metrics->get_metrics().outstanding_cents << " cents\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
