#include "bind_forward.hpp"
#include <spendguard/spendguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace spendguard;

using CounterMap = std::unordered_map<std::string, Cents>;

// ---------------------------------------------------------------------------
// Trampolines
// ---------------------------------------------------------------------------
class PyCounterStore : public CounterStore {
public:
    using CounterStore::CounterStore;

    Cents increment(const std::string& key, Cents delta, Duration ttl) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(Cents, CounterStore, increment, key, delta, ttl);
    }

    Cents get(const std::string& key) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(Cents, CounterStore, get, key);
    }

    CounterMap entries() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(CounterMap, CounterStore, entries);
    }
};

class PyMessageSealer : public MessageSealer {
public:
    using MessageSealer::MessageSealer;

    std::string seal(const std::string& epoch_public_key, const std::string& plaintext) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, MessageSealer, seal, epoch_public_key, plaintext);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  counters, ledger, store, quota, resolver, settlement, pipeline
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Counter stores
    // ===================================================================
    py::class_<CounterStore, PyCounterStore, std::shared_ptr<CounterStore>>(m, "CounterStore")
        .def(py::init<>())
        .def("increment", &CounterStore::increment,
             py::arg("key"), py::arg("delta"), py::arg("ttl"))
        .def("get",       &CounterStore::get, py::arg("key"))
        .def("entries",   &CounterStore::entries);

    py::class_<InMemoryCounterStore, CounterStore, std::shared_ptr<InMemoryCounterStore>>(
            m, "InMemoryCounterStore")
        .def(py::init<>())
        .def("size", &InMemoryCounterStore::size);

    // ===================================================================
    // ReservationLedger
    // ===================================================================
    py::class_<GroupReservationScope>(m, "GroupReservationScope")
        .def(py::init<>())
        .def_readwrite("conversation_id", &GroupReservationScope::conversation_id)
        .def_readwrite("member_id",       &GroupReservationScope::member_id)
        .def_readwrite("payer_id",        &GroupReservationScope::payer_id);

    py::class_<GroupCeilings>(m, "GroupCeilings")
        .def(py::init<>())
        .def_readwrite("member_ceiling",       &GroupCeilings::member_ceiling)
        .def_readwrite("conversation_ceiling", &GroupCeilings::conversation_ceiling)
        .def_readwrite("payer_ceiling",        &GroupCeilings::payer_ceiling);

    // Usable as a context manager: the reservation is released on exit
    py::class_<ReservationGuard>(m, "ReservationGuard")
        .def("release", &ReservationGuard::release)
        .def("active",  &ReservationGuard::active)
        .def("amount",  &ReservationGuard::amount)
        .def("__enter__", [](ReservationGuard& g) -> ReservationGuard& { return g; },
             py::return_value_policy::reference_internal)
        .def("__exit__", [](ReservationGuard& g, py::args) { g.release(); });

    py::class_<ReservationLedger, std::shared_ptr<ReservationLedger>>(m, "ReservationLedger")
        .def(py::init<std::shared_ptr<CounterStore>, ReservationConfig>(),
             py::arg("store"), py::arg("config") = ReservationConfig{})

        // ------------- Keys -------------
        .def("user_key",         &ReservationLedger::user_key, py::arg("user_id"))
        .def("member_key",       &ReservationLedger::member_key,
             py::arg("conversation_id"), py::arg("member_id"))
        .def("conversation_key", &ReservationLedger::conversation_key,
             py::arg("conversation_id"))

        // ------------- Raw counters -------------
        .def("reserve",       &ReservationLedger::reserve,
             py::arg("user_id"), py::arg("amount_cents"))
        .def("release",       &ReservationLedger::release,
             py::arg("user_id"), py::arg("amount_cents"))
        .def("reserve_group", &ReservationLedger::reserve_group,
             py::arg("scope"), py::arg("amount_cents"))
        .def("release_group", &ReservationLedger::release_group,
             py::arg("scope"), py::arg("amount_cents"))
        .def("reserved_total",        &ReservationLedger::reserved_total,
             py::arg("user_id"))
        .def("group_reserved_totals", &ReservationLedger::group_reserved_totals,
             py::arg("scope"))

        // ------------- Race-guarded reservations -------------
        .def("reserve_checked", &ReservationLedger::reserve_checked,
             py::arg("user_id"), py::arg("amount_cents"), py::arg("ceiling_cents"),
             py::keep_alive<0, 1>())
        .def("reserve_group_checked", &ReservationLedger::reserve_group_checked,
             py::arg("scope"), py::arg("amount_cents"), py::arg("ceilings"),
             py::keep_alive<0, 1>())

        // ------------- Monitoring -------------
        .def("snapshot",    &ReservationLedger::snapshot)
        .def("publish_snapshot", &ReservationLedger::publish_snapshot)
        .def("set_monitor", &ReservationLedger::set_monitor, py::arg("monitor"))
        .def("config",      &ReservationLedger::config,
             py::return_value_policy::reference_internal);

    // ===================================================================
    // BillingStore
    // ===================================================================
    py::class_<BillingStore, std::shared_ptr<BillingStore>>(m, "BillingStore")
        .def(py::init<>())

        // ------------- Seeding -------------
        .def("add_wallet",              &BillingStore::add_wallet, py::arg("wallet"))
        .def("add_conversation",        &BillingStore::add_conversation, py::arg("conversation"))
        .def("add_epoch",               &BillingStore::add_epoch, py::arg("epoch"))
        .def("add_member",              &BillingStore::add_member, py::arg("member"))
        .def("set_member_budget",       &BillingStore::set_member_budget,
             py::arg("member_id"), py::arg("budget"))
        .def("set_conversation_budget", &BillingStore::set_conversation_budget,
             py::arg("conversation_id"), py::arg("budget"))
        .def("remove_conversation",     &BillingStore::remove_conversation,
             py::arg("conversation_id"))
        .def("add_ledger_entry",        &BillingStore::add_ledger_entry, py::arg("entry"))

        // ------------- Queries -------------
        .def("wallets",               &BillingStore::wallets, py::arg("user_id"))
        .def("wallet",                &BillingStore::wallet, py::arg("wallet_id"))
        .def("conversation",          &BillingStore::conversation, py::arg("conversation_id"))
        .def("epoch",                 &BillingStore::epoch,
             py::arg("conversation_id"), py::arg("epoch_number"))
        .def("member",                &BillingStore::member, py::arg("member_id"))
        .def("member_budget",         &BillingStore::member_budget, py::arg("member_id"))
        .def("conversation_spending", &BillingStore::conversation_spending,
             py::arg("conversation_id"))
        .def("message",               &BillingStore::message, py::arg("message_id"))
        .def("messages",              &BillingStore::messages, py::arg("conversation_id"))
        .def("usage_records",         &BillingStore::usage_records)
        .def("ledger_entries",        &BillingStore::ledger_entries)
        .def("llm_completions",       &BillingStore::llm_completions);

    // ===================================================================
    // GuestQuota
    // ===================================================================
    py::class_<GuestQuotaStatus>(m, "GuestQuotaStatus")
        .def(py::init<>())
        .def_readwrite("can_send",      &GuestQuotaStatus::can_send)
        .def_readwrite("message_count", &GuestQuotaStatus::message_count)
        .def_readwrite("limit",         &GuestQuotaStatus::limit);

    py::class_<GuestQuota>(m, "GuestQuota")
        .def(py::init<AllowanceConfig>(), py::arg("config") = AllowanceConfig{})
        .def("check",
             [](const GuestQuota& self, const std::optional<std::string>& token,
                const std::string& ip_hash, std::optional<WallTime> now) {
                 return self.check(token, ip_hash, now.value_or(WallClock::now()));
             },
             py::arg("guest_token"), py::arg("ip_hash"), py::arg("now") = py::none())
        .def("require_available",
             [](const GuestQuota& self, const std::optional<std::string>& token,
                const std::string& ip_hash, std::optional<WallTime> now) {
                 self.require_available(token, ip_hash, now.value_or(WallClock::now()));
             },
             py::arg("guest_token"), py::arg("ip_hash"), py::arg("now") = py::none())
        .def("record_message",
             [](GuestQuota& self, const std::optional<std::string>& token,
                const std::string& ip_hash, std::optional<WallTime> now) {
                 return self.record_message(token, ip_hash, now.value_or(WallClock::now()));
             },
             py::arg("guest_token"), py::arg("ip_hash"), py::arg("now") = py::none())
        .def("record_count", &GuestQuota::record_count)
        .def("set_monitor",  &GuestQuota::set_monitor, py::arg("monitor"));

    // ===================================================================
    // FundingResolver
    // ===================================================================
    py::class_<GroupContext>(m, "GroupContext")
        .def(py::init<>())
        .def_readwrite("conversation_id", &GroupContext::conversation_id)
        .def_readwrite("member_id",       &GroupContext::member_id)
        .def_readwrite("owner_id",        &GroupContext::owner_id);

    py::class_<GroupFunding>(m, "GroupFunding")
        .def(py::init<>())
        .def_readwrite("scope",           &GroupFunding::scope)
        .def_readwrite("remaining",       &GroupFunding::remaining)
        .def_readwrite("effective_cents", &GroupFunding::effective_cents)
        .def_readwrite("owner",           &GroupFunding::owner)
        .def_readwrite("ceilings",        &GroupFunding::ceilings);

    py::class_<BillingContext>(m, "BillingContext")
        .def(py::init<>())
        .def_readwrite("user_id",                        &BillingContext::user_id)
        .def_readwrite("user",                           &BillingContext::user)
        .def_readwrite("reserved_cents",                 &BillingContext::reserved_cents)
        .def_readwrite("available_balance_cents",        &BillingContext::available_balance_cents)
        .def_readwrite("available_free_allowance_cents", &BillingContext::available_free_allowance_cents)
        .def_readwrite("group",                          &BillingContext::group);

    m.def("to_resolve_input", &to_resolve_input,
          py::arg("context"), py::arg("is_premium_model"),
          py::arg("estimated_minimum_cost_cents"));
    m.def("personal_ceiling_cents", &personal_ceiling_cents,
          py::arg("context"), py::arg("source"), py::arg("config") = BudgetConfig{});

    py::class_<FundingResolver>(m, "FundingResolver")
        .def(py::init<std::shared_ptr<BillingStore>, std::shared_ptr<ReservationLedger>, Config>(),
             py::arg("store"), py::arg("ledger"), py::arg("config") = Config{})
        .def("maybe_renew_free_allowance",
             [](FundingResolver& self, const WalletId& wallet_id, std::optional<WallTime> now) {
                 return self.maybe_renew_free_allowance(wallet_id, now.value_or(WallClock::now()));
             },
             py::arg("wallet_id"), py::arg("now") = py::none())
        .def("user_tier_info",
             [](FundingResolver& self, const std::optional<UserId>& user_id,
                std::optional<WallTime> now) {
                 return self.user_tier_info(user_id, now.value_or(WallClock::now()));
             },
             py::arg("user_id"), py::arg("now") = py::none())
        .def("build_context",
             [](FundingResolver& self, const std::optional<UserId>& user_id,
                const std::optional<GroupContext>& group, std::optional<WallTime> now) {
                 return self.build_context(user_id, group, now.value_or(WallClock::now()));
             },
             py::arg("user_id"), py::arg("group") = py::none(), py::arg("now") = py::none())
        .def("resolve", &FundingResolver::resolve,
             py::arg("context"), py::arg("is_premium_model"),
             py::arg("estimated_minimum_cost_cents"))
        .def("set_monitor", &FundingResolver::set_monitor, py::arg("monitor"));

    // ===================================================================
    // ChargeSettlement
    // ===================================================================
    py::class_<MessageSealer, PyMessageSealer, std::shared_ptr<MessageSealer>>(m, "MessageSealer")
        .def(py::init<>())
        .def("seal", &MessageSealer::seal,
             py::arg("epoch_public_key"), py::arg("plaintext"));

    py::class_<SaveChatTurnParams>(m, "SaveChatTurnParams")
        .def(py::init<>())
        .def_readwrite("conversation_id",      &SaveChatTurnParams::conversation_id)
        .def_readwrite("user_id",              &SaveChatTurnParams::user_id)
        .def_readwrite("payer_id",             &SaveChatTurnParams::payer_id)
        .def_readwrite("user_message_id",      &SaveChatTurnParams::user_message_id)
        .def_readwrite("user_content",         &SaveChatTurnParams::user_content)
        .def_readwrite("assistant_message_id", &SaveChatTurnParams::assistant_message_id)
        .def_readwrite("assistant_content",    &SaveChatTurnParams::assistant_content)
        .def_readwrite("model",                &SaveChatTurnParams::model)
        .def_readwrite("cost",                 &SaveChatTurnParams::cost)
        .def_readwrite("input_tokens",         &SaveChatTurnParams::input_tokens)
        .def_readwrite("output_tokens",        &SaveChatTurnParams::output_tokens)
        .def_readwrite("cached_tokens",        &SaveChatTurnParams::cached_tokens)
        .def_readwrite("group_member_id",      &SaveChatTurnParams::group_member_id);

    py::class_<SaveChatTurnResult>(m, "SaveChatTurnResult")
        .def(py::init<>())
        .def_readwrite("user_sequence",   &SaveChatTurnResult::user_sequence)
        .def_readwrite("ai_sequence",     &SaveChatTurnResult::ai_sequence)
        .def_readwrite("epoch_number",    &SaveChatTurnResult::epoch_number)
        .def_readwrite("cost",            &SaveChatTurnResult::cost)
        .def_readwrite("usage_record_id", &SaveChatTurnResult::usage_record_id);

    py::class_<SaveUserOnlyMessageParams>(m, "SaveUserOnlyMessageParams")
        .def(py::init<>())
        .def_readwrite("conversation_id", &SaveUserOnlyMessageParams::conversation_id)
        .def_readwrite("user_id",         &SaveUserOnlyMessageParams::user_id)
        .def_readwrite("message_id",      &SaveUserOnlyMessageParams::message_id)
        .def_readwrite("content",         &SaveUserOnlyMessageParams::content);

    py::class_<SaveUserOnlyMessageResult>(m, "SaveUserOnlyMessageResult")
        .def(py::init<>())
        .def_readwrite("sequence_number", &SaveUserOnlyMessageResult::sequence_number)
        .def_readwrite("epoch_number",    &SaveUserOnlyMessageResult::epoch_number);

    py::class_<ChargeSettlement>(m, "ChargeSettlement")
        .def(py::init<std::shared_ptr<BillingStore>, std::shared_ptr<MessageSealer>, Config>(),
             py::arg("store"), py::arg("sealer"), py::arg("config") = Config{},
             py::keep_alive<1, 3>())
        .def("save_chat_turn", &ChargeSettlement::save_chat_turn,
             py::arg("params"), py::call_guard<py::gil_scoped_release>())
        .def("save_user_only_message", &ChargeSettlement::save_user_only_message,
             py::arg("params"), py::call_guard<py::gil_scoped_release>())
        .def("set_monitor", &ChargeSettlement::set_monitor, py::arg("monitor"));

    // ===================================================================
    // ChatTurnPipeline
    // ===================================================================
    py::class_<ChatTurnRequest>(m, "ChatTurnRequest")
        .def(py::init<>())
        .def_readwrite("session_tier",            &ChatTurnRequest::session_tier)
        .def_readwrite("user_id",                 &ChatTurnRequest::user_id)
        .def_readwrite("declared_funding_source", &ChatTurnRequest::declared_funding_source)
        .def_readwrite("conversation_id",         &ChatTurnRequest::conversation_id)
        .def_readwrite("group",                   &ChatTurnRequest::group)
        .def_readwrite("model",                   &ChatTurnRequest::model)
        .def_readwrite("messages",                &ChatTurnRequest::messages)
        .def_readwrite("user_message_id",         &ChatTurnRequest::user_message_id)
        .def_readwrite("user_content",            &ChatTurnRequest::user_content)
        .def_readwrite("assistant_message_id",    &ChatTurnRequest::assistant_message_id)
        .def_readwrite("guest_token",             &ChatTurnRequest::guest_token)
        .def_readwrite("ip_hash",                 &ChatTurnRequest::ip_hash);

    py::class_<ChatTurnResult>(m, "ChatTurnResult")
        .def(py::init<>())
        .def_readwrite("cost",              &ChatTurnResult::cost)
        .def_readwrite("usage_record_id",   &ChatTurnResult::usage_record_id)
        .def_readwrite("max_output_tokens", &ChatTurnResult::max_output_tokens)
        .def_readwrite("worst_case_cents",  &ChatTurnResult::worst_case_cents)
        .def_readwrite("funding_source",    &ChatTurnResult::funding_source)
        .def_readwrite("user_sequence",     &ChatTurnResult::user_sequence)
        .def_readwrite("ai_sequence",       &ChatTurnResult::ai_sequence)
        .def_readwrite("content",           &ChatTurnResult::content)
        .def_readwrite("notices",           &ChatTurnResult::notices);

    // on_error receives the exception message
    py::class_<StreamOutcomeHandler>(m, "StreamOutcomeHandler")
        .def(py::init<>())
        .def_readwrite("on_token",    &StreamOutcomeHandler::on_token)
        .def_readwrite("on_complete", &StreamOutcomeHandler::on_complete)
        .def("set_on_error",
             [](StreamOutcomeHandler& self, std::function<void(const std::string&)> cb) {
                 self.on_error = [cb = std::move(cb)](const std::exception& e) { cb(e.what()); };
             },
             py::arg("callback"));

    py::class_<ChatTurnPipeline>(m, "ChatTurnPipeline")
        .def(py::init<std::shared_ptr<BillingStore>, std::shared_ptr<ReservationLedger>,
                      std::shared_ptr<MessageSealer>, Config>(),
             py::arg("store"), py::arg("ledger"), py::arg("sealer"),
             py::arg("config") = Config{},
             py::keep_alive<1, 4>())
        .def("run", &ChatTurnPipeline::run,
             py::arg("request"), py::arg("client"),
             py::arg("handler") = StreamOutcomeHandler{},
             py::call_guard<py::gil_scoped_release>())
        .def("preview_budget", &ChatTurnPipeline::preview_budget,
             py::arg("request"), py::call_guard<py::gil_scoped_release>())
        .def("resolver",    &ChatTurnPipeline::resolver,
             py::return_value_policy::reference_internal)
        .def("settlement",  &ChatTurnPipeline::settlement,
             py::return_value_policy::reference_internal)
        .def("guest_quota", &ChatTurnPipeline::guest_quota,
             py::return_value_policy::reference_internal)
        .def("ledger",      &ChatTurnPipeline::ledger,
             py::return_value_policy::reference_internal)
        .def("config",      &ChatTurnPipeline::config,
             py::return_value_policy::reference_internal)
        .def("set_monitor", &ChatTurnPipeline::set_monitor, py::arg("monitor"));
}
