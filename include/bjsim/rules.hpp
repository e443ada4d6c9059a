#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file rules.hpp
 * @brief Player actions, split predicate and table constants
 */

#include "card.hpp"

#include <algorithm>
#include <span>
#include <string>

namespace bjsim {

enum class Action { Hit = 1, Stand = 2, DoubleDown = 3, Split = 4 };

inline const char* action_name(Action a) {
  switch (a) {
    case Action::Hit: return "HIT";
    case Action::Stand: return "STAND";
    case Action::DoubleDown: return "DOUBLE_DOWN";
    case Action::Split: return "SPLIT";
  }
  return "UNKNOWN";
}

inline bool contains(std::span<const Action> actions, Action a) {
  return std::find(actions.begin(), actions.end(), a) != actions.end();
}

/// Which pairs may be split (process-wide choice)
enum class SplitRule { SameValue, SameRank };

inline bool can_split(const Card& a, const Card& b, SplitRule rule) {
  return rule == SplitRule::SameRank ? a.rank == b.rank : a.value == b.value;
}

/**
 * Table rules shared by the engine and the agents that simulate it
 */
struct Rules {
  /** Split predicate (default: same numeric value) */
  SplitRule split_rule = SplitRule::SameValue;

  /** Bet placed on every fresh hand, in abstract units */
  double initial_bet = 2.0;

  /** Multiplier paid on a two-card 21 */
  double blackjack_payout = 1.5;

  /** Dealer hits below this total */
  double dealer_stand_threshold = 17.0;

  /** Consecutive illegal actions tolerated on one hand before the round fails */
  int max_protocol_violations = 1000;
};

}  // namespace bjsim
