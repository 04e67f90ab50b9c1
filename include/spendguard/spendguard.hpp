#pragma once

// SpendGuard: Budget & Reservation Engine for pay-per-use AI chat
//
// Estimates the worst-case cost of an inference call, reserves it against
// shared counters so concurrent requests cannot double-spend, and settles
// the real cost in one all-or-nothing transaction.

// Core
#include "spendguard/types.hpp"
#include "spendguard/exceptions.hpp"
#include "spendguard/config.hpp"
#include "spendguard/monitor.hpp"

// Pricing and budgeting
#include "spendguard/pricing.hpp"
#include "spendguard/budget_calculator.hpp"
#include "spendguard/funding_resolver.hpp"
#include "spendguard/guest_quota.hpp"

// Reservation and settlement
#include "spendguard/counter_store.hpp"
#include "spendguard/reservation_ledger.hpp"
#include "spendguard/billing_store.hpp"
#include "spendguard/charge_settlement.hpp"

// Inference provider seam
#include "spendguard/provider/context_error.hpp"
#include "spendguard/provider/inference_client.hpp"
#include "spendguard/provider/capacity_guard.hpp"

// Pipeline
#include "spendguard/chat_turn.hpp"
