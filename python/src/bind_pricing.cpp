#include "bind_forward.hpp"
#include <spendguard/spendguard.hpp>
#include <pybind11/stl.h>

using namespace spendguard;

// ---------------------------------------------------------------------------
// bind_pricing  --  tier policy, cost math, budget calculator, funding decision
// ---------------------------------------------------------------------------
void bind_pricing(py::module_& m) {

    // ===================================================================
    // Pricing
    // ===================================================================
    py::class_<TierPolicy>(m, "TierPolicy")
        .def_readonly("tier",                   &TierPolicy::tier)
        .def_readonly("input_chars_per_token",  &TierPolicy::input_chars_per_token)
        .def_readonly("output_chars_per_token", &TierPolicy::output_chars_per_token)
        .def_readonly("has_cushion",            &TierPolicy::has_cushion)
        .def_readonly("can_access_premium",     &TierPolicy::can_access_premium);

    py::class_<MessageCostParams>(m, "MessageCostParams")
        .def(py::init<>())
        .def_readwrite("input_tokens",           &MessageCostParams::input_tokens)
        .def_readwrite("output_tokens",          &MessageCostParams::output_tokens)
        .def_readwrite("input_characters",       &MessageCostParams::input_characters)
        .def_readwrite("output_characters",      &MessageCostParams::output_characters)
        .def_readwrite("price_per_input_token",  &MessageCostParams::price_per_input_token)
        .def_readwrite("price_per_output_token", &MessageCostParams::price_per_output_token);

    py::class_<UserBalanceState>(m, "UserBalanceState")
        .def(py::init<>())
        .def_readwrite("balance_cents",        &UserBalanceState::balance_cents)
        .def_readwrite("free_allowance_cents", &UserBalanceState::free_allowance_cents);

    py::class_<UserTierInfo>(m, "UserTierInfo")
        .def(py::init<>())
        .def_readwrite("tier",                 &UserTierInfo::tier)
        .def_readwrite("can_access_premium",   &UserTierInfo::can_access_premium)
        .def_readwrite("balance_cents",        &UserTierInfo::balance_cents)
        .def_readwrite("free_allowance_cents", &UserTierInfo::free_allowance_cents);

    m.attr("CHARS_PER_TOKEN_CONSERVATIVE") = CHARS_PER_TOKEN_CONSERVATIVE;
    m.attr("CHARS_PER_TOKEN_STANDARD")     = CHARS_PER_TOKEN_STANDARD;

    m.def("tier_policy", &tier_policy, py::arg("tier"),
          py::return_value_policy::reference);
    m.def("apply_fees", &apply_fees,
          py::arg("price_per_token"), py::arg("config") = PricingConfig{});
    m.def("estimate_tokens_for_tier", &estimate_tokens_for_tier,
          py::arg("tier"), py::arg("character_count"));
    m.def("output_cost_per_token", &output_cost_per_token,
          py::arg("tier"), py::arg("output_price_with_fees"),
          py::arg("config") = PricingConfig{});
    m.def("cushion_cents", &cushion_cents,
          py::arg("tier"), py::arg("config") = BudgetConfig{});
    m.def("calculate_message_cost", &calculate_message_cost,
          py::arg("params"), py::arg("config") = PricingConfig{});
    m.def("get_user_tier", &get_user_tier, py::arg("user"));
    m.def("can_use_model", &can_use_model,
          py::arg("info"), py::arg("is_premium_model"));

    // ===================================================================
    // Budget calculator
    // ===================================================================
    py::class_<BudgetInput>(m, "BudgetInput")
        .def(py::init<>())
        .def_readwrite("tier",                   &BudgetInput::tier)
        .def_readwrite("balance_cents",          &BudgetInput::balance_cents)
        .def_readwrite("free_allowance_cents",   &BudgetInput::free_allowance_cents)
        .def_readwrite("group_effective_cents",  &BudgetInput::group_effective_cents)
        .def_readwrite("prompt_character_count", &BudgetInput::prompt_character_count)
        .def_readwrite("input_price_per_token",  &BudgetInput::input_price_per_token)
        .def_readwrite("output_price_per_token", &BudgetInput::output_price_per_token)
        .def_readwrite("context_length",         &BudgetInput::context_length);

    py::class_<BudgetResult>(m, "BudgetResult")
        .def(py::init<>())
        .def_readwrite("can_afford",             &BudgetResult::can_afford)
        .def_readwrite("max_output_tokens",      &BudgetResult::max_output_tokens)
        .def_readwrite("estimated_input_tokens", &BudgetResult::estimated_input_tokens)
        .def_readwrite("estimated_input_cost",   &BudgetResult::estimated_input_cost)
        .def_readwrite("output_cost_per_token",  &BudgetResult::output_cost_per_token)
        .def_readwrite("estimated_minimum_cost", &BudgetResult::estimated_minimum_cost)
        .def_readwrite("effective_balance",      &BudgetResult::effective_balance)
        .def_readwrite("current_usage",          &BudgetResult::current_usage)
        .def_readwrite("capacity_percent",       &BudgetResult::capacity_percent)
        .def("__repr__", [](const BudgetResult& r) {
            return "<BudgetResult can_afford=" + std::string(r.can_afford ? "True" : "False")
                 + " max_output_tokens=" + std::to_string(r.max_output_tokens) + ">";
        });

    py::class_<BudgetNotice>(m, "BudgetNotice")
        .def(py::init<>())
        .def_readwrite("id",       &BudgetNotice::id)
        .def_readwrite("severity", &BudgetNotice::severity)
        .def_readwrite("message",  &BudgetNotice::message);

    py::class_<BillingDecision>(m, "BillingDecision")
        .def(py::init<>())
        .def_readwrite("funding_source", &BillingDecision::funding_source)
        .def_readwrite("denial",         &BillingDecision::denial)
        .def("denied", &BillingDecision::denied)
        .def_static("fund", &BillingDecision::fund, py::arg("source"))
        .def_static("deny", &BillingDecision::deny, py::arg("reason"));

    m.def("effective_balance", &effective_balance,
          py::arg("tier"), py::arg("balance_cents"), py::arg("free_allowance_cents"),
          py::arg("config") = BudgetConfig{});
    m.def("calculate_budget", &calculate_budget,
          py::arg("input"), py::arg("config") = Config{});
    m.def("compute_safe_max_tokens", &compute_safe_max_tokens,
          py::arg("budget_max_tokens"), py::arg("context_length"),
          py::arg("estimated_input_tokens"));
    m.def("compute_worst_case_cents", &compute_worst_case_cents,
          py::arg("estimated_input_cost"), py::arg("effective_max_output_tokens"),
          py::arg("output_cost_per_token"));
    m.def("effective_budget_cents", &effective_budget_cents,
          py::arg("conversation_remaining_cents"), py::arg("member_remaining_cents"),
          py::arg("owner_remaining_cents"));
    m.def("generate_notifications", &generate_notifications,
          py::arg("decision"), py::arg("capacity_percent"), py::arg("max_output_tokens"),
          py::arg("config") = BudgetConfig{});

    // ===================================================================
    // Funding decision
    // ===================================================================
    py::class_<ResolveBillingInput> rbi(m, "ResolveBillingInput");

    py::class_<ResolveBillingInput::Group>(rbi, "Group")
        .def(py::init<>())
        .def_readwrite("effective_cents",     &ResolveBillingInput::Group::effective_cents)
        .def_readwrite("owner_tier",          &ResolveBillingInput::Group::owner_tier)
        .def_readwrite("owner_balance_cents", &ResolveBillingInput::Group::owner_balance_cents);

    rbi.def(py::init<>())
       .def_readwrite("tier",                         &ResolveBillingInput::tier)
       .def_readwrite("balance_cents",                &ResolveBillingInput::balance_cents)
       .def_readwrite("free_allowance_cents",         &ResolveBillingInput::free_allowance_cents)
       .def_readwrite("is_premium_model",             &ResolveBillingInput::is_premium_model)
       .def_readwrite("estimated_minimum_cost_cents", &ResolveBillingInput::estimated_minimum_cost_cents)
       .def_readwrite("group",                        &ResolveBillingInput::group);

    py::class_<GroupRemaining>(m, "GroupRemaining")
        .def(py::init<>())
        .def_readwrite("conversation_remaining_cents", &GroupRemaining::conversation_remaining_cents)
        .def_readwrite("member_remaining_cents",       &GroupRemaining::member_remaining_cents)
        .def_readwrite("owner_remaining_cents",        &GroupRemaining::owner_remaining_cents);

    py::class_<GroupReservedTotals>(m, "GroupReservedTotals")
        .def(py::init<>())
        .def_readwrite("member_total",       &GroupReservedTotals::member_total)
        .def_readwrite("conversation_total", &GroupReservedTotals::conversation_total)
        .def_readwrite("payer_total",        &GroupReservedTotals::payer_total);

    py::class_<GroupBudgetInput>(m, "GroupBudgetInput")
        .def(py::init<>())
        .def_readwrite("conversation_budget", &GroupBudgetInput::conversation_budget)
        .def_readwrite("conversation_spent",  &GroupBudgetInput::conversation_spent)
        .def_readwrite("member_budget",       &GroupBudgetInput::member_budget)
        .def_readwrite("member_spent",        &GroupBudgetInput::member_spent)
        .def_readwrite("owner_balance_cents", &GroupBudgetInput::owner_balance_cents)
        .def_readwrite("reserved",            &GroupBudgetInput::reserved);

    m.def("resolve_billing", &resolve_billing,
          py::arg("input"), py::arg("config") = BudgetConfig{});
    m.def("compute_group_remaining", &compute_group_remaining, py::arg("input"));
}
