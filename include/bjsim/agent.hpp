#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file agent.hpp
 * @brief Decision-making agents
 *
 * An Agent is asked for one action at a time:
 *
 *   Action decide(hand, legal_actions, dealer_up)
 *
 * The engine validates the answer; an action outside `legal_actions` is
 * ignored and the agent is asked again. reset() is called at the start of
 * every fresh round.
 *
 * The search agent and its rollout helper live in mcts.hpp.
 */

#include "card.hpp"
#include "rules.hpp"

#include <istream>
#include <ostream>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

namespace bjsim {

// ============================================================================
// Agent interface
// ============================================================================

class Agent {
public:
  /**
   * Choose an action for the hand being played
   *
   * @param hand Cards of the hand being played, in deal order
   * @param legal Actions the engine will accept
   * @param dealer_up The dealer's single visible card
   * @return Chosen action (should be one of `legal`)
   */
  virtual Action decide(std::span<const Card> hand,
                        std::span<const Action> legal,
                        const Card& dealer_up) = 0;

  /// Called before every fresh round
  virtual void reset() {}

  /// Display name used by the narration
  virtual std::string name() const = 0;

  virtual ~Agent() = default;
};

// ============================================================================
// Simple agents
// ============================================================================

/**
 * Uniformly random choice among the legal actions
 */
class RandomAgent : public Agent {
public:
  RandomAgent(std::string name, std::mt19937& rng)
      : name_(std::move(name)), rng_(rng) {}

  Action decide(std::span<const Card> hand, std::span<const Action> legal,
                const Card& dealer_up) override {
    (void)hand;
    (void)dealer_up;
    std::uniform_int_distribution<size_t> pick(0, legal.size() - 1);
    return legal[pick(rng_)];
  }

  std::string name() const override { return name_; }

private:
  std::string name_;
  std::mt19937& rng_;
};

/**
 * Always stands, never takes another card
 */
class TimidAgent : public Agent {
public:
  explicit TimidAgent(std::string name) : name_(std::move(name)) {}

  Action decide(std::span<const Card>, std::span<const Action>,
                const Card&) override {
    return Action::Stand;
  }

  std::string name() const override { return name_; }

private:
  std::string name_;
};

/**
 * Dealer policy: hit below the stand threshold, otherwise stand
 */
class DealerAgent : public Agent {
public:
  explicit DealerAgent(double stand_threshold = 17.0)
      : stand_threshold_(stand_threshold) {}

  Action decide(std::span<const Card> hand, std::span<const Action>,
                const Card&) override {
    return hand_value(hand) < stand_threshold_ ? Action::Hit : Action::Stand;
  }

  std::string name() const override { return "Dealer"; }

private:
  double stand_threshold_;
};

/**
 * Two-threshold strategy keyed on the dealer's visible card
 *
 * A dealer showing less than 7 is likely to bust, so the agent stands from
 * 12 upward; against a strong card it keeps hitting below 17.
 */
class BasicStrategyAgent : public Agent {
public:
  explicit BasicStrategyAgent(std::string name) : name_(std::move(name)) {}

  Action decide(std::span<const Card> hand, std::span<const Action>,
                const Card& dealer_up) override {
    double points = hand_value(hand);
    double threshold = dealer_up.value < 7.0 ? 12.0 : 17.0;
    return points < threshold ? Action::Hit : Action::Stand;
  }

  std::string name() const override { return name_; }

private:
  std::string name_;
};

/**
 * Human player reading numbered choices from a stream
 *
 * Malformed or out-of-range input is answered with a hint and the prompt is
 * repeated. A closed input stream cannot be recovered from and throws.
 */
class ConsoleAgent : public Agent {
public:
  ConsoleAgent(std::string name, std::istream& in, std::ostream& out)
      : name_(std::move(name)), in_(in), out_(out) {}

  Action decide(std::span<const Card> hand, std::span<const Action> legal,
                const Card& dealer_up) override {
    out_ << "\n";
    out_ << "  Your cards: " << to_string(hand) << " ("
         << format_points(hand_value(hand)) << " points)\n";
    out_ << "  Dealer's visible card: " << to_string(dealer_up) << " ("
         << format_points(hand_value(std::span<const Card>(&dealer_up, 1)))
         << " points)\n";

    while (true) {
      out_ << "  Which action do you want to take?\n";
      for (size_t i = 0; i < legal.size(); ++i) {
        out_ << "  " << (i + 1) << " " << action_name(legal[i]) << "\n";
      }
      out_.flush();

      std::string line;
      if (!std::getline(in_, line)) {
        throw std::runtime_error("ConsoleAgent::decide - input closed");
      }
      try {
        size_t consumed = 0;
        int choice = std::stoi(line, &consumed);
        bool trailing = line.find_first_not_of(" \t\r", consumed) != std::string::npos;
        if (!trailing && choice >= 1 && static_cast<size_t>(choice) <= legal.size()) {
          return legal[static_cast<size_t>(choice) - 1];
        }
      } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range from stoi: re-prompt
      }
      out_ << " >>> Please enter a valid action number <<<\n";
    }
  }

  std::string name() const override { return name_; }

private:
  std::string name_;
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace bjsim
