#pragma once

#include <bjsim/agent.hpp>
#include <bjsim/card.hpp>
#include <bjsim/rules.hpp>
#include <bjsim/shoe.hpp>

#include <cmath>
#include <deque>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

namespace test_helpers {

using bjsim::Action;
using bjsim::Card;
using bjsim::Cards;

// Rank label -> standard value
inline double standard_value(const std::string& rank) {
  if (rank == "Ace") return 11.0;
  if (rank == "Jack" || rank == "Queen" || rank == "King") return 10.0;
  return std::stod(rank);
}

inline Card card(const std::string& rank, const std::string& suit = "Hearts") {
  return Card{suit, rank, standard_value(rank)};
}

inline Cards cards(std::initializer_list<const char*> ranks, const std::string& suit = "Hearts") {
  Cards out;
  for (const char* r : ranks) out.push_back(card(r, suit));
  return out;
}

// Shoe dealing the given ranks in order (all Spades so they never equal
// Hearts cards built by card())
inline bjsim::Shoe stacked(std::initializer_list<const char*> ranks) {
  return bjsim::Shoe(cards(ranks, "Spades"));
}

inline bool approx_eq(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) < eps;
}

/**
 * Agent replaying a fixed script, then standing
 *
 * Records every hand and legal set it was shown.
 */
class ScriptedAgent : public bjsim::Agent {
public:
  explicit ScriptedAgent(std::initializer_list<Action> script = {})
      : script_(script) {}

  Action decide(std::span<const Card> hand, std::span<const Action> legal,
                const Card& dealer_up) override {
    hands.emplace_back(hand.begin(), hand.end());
    legal_sets.emplace_back(legal.begin(), legal.end());
    dealer_cards.push_back(dealer_up);
    if (script_.empty()) return Action::Stand;
    Action a = script_.front();
    script_.pop_front();
    return a;
  }

  void reset() override { ++resets; }

  std::string name() const override { return "Scripted"; }

  std::vector<Cards> hands;
  std::vector<std::vector<Action>> legal_sets;
  Cards dealer_cards;
  int resets = 0;

private:
  std::deque<Action> script_;
};

/// Always answers with the same action, legal or not
class StubbornAgent : public bjsim::Agent {
public:
  explicit StubbornAgent(Action a) : action_(a) {}

  Action decide(std::span<const Card>, std::span<const Action>, const Card&) override {
    ++calls;
    return action_;
  }

  std::string name() const override { return "Stubborn"; }

  int calls = 0;

private:
  Action action_;
};

}  // namespace test_helpers
