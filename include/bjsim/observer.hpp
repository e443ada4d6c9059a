#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file observer.hpp
 * @brief Round event sink and console narration
 *
 * The engine reports progress through a non-owning RoundObserver pointer.
 * Simulated rounds run without one; the command line driver attaches a
 * ConsoleNarrator unless output is silenced.
 */

#include "card.hpp"
#include "rules.hpp"

#include <ostream>
#include <span>
#include <string>

namespace bjsim {

class RoundObserver {
public:
  /// A card was dealt face up (`visible`) or face down
  virtual void on_deal(const std::string& who, const Card& card, bool visible) {
    (void)who; (void)card; (void)visible;
  }

  /// An accepted (legal) action
  virtual void on_action(const std::string& who, Action action) {
    (void)who; (void)action;
  }

  virtual void on_split(const std::string& who, std::span<const Card> first,
                        std::span<const Card> second) {
    (void)who; (void)first; (void)second;
  }

  /// A hand finished; `label` is empty or " (hand N)" for split children
  virtual void on_hand_done(const std::string& who, std::span<const Card> hand,
                            const std::string& label) {
    (void)who; (void)hand; (void)label;
  }

  /// Dealer turns the hole card after the player is done
  virtual void on_dealer_reveal(std::span<const Card> dealer) { (void)dealer; }

  /// One player hand settled against the dealer
  virtual void on_settle(const std::string& who, std::span<const Card> hand,
                         std::span<const Card> dealer, double reward) {
    (void)who; (void)hand; (void)dealer; (void)reward;
  }

  /// Round finished; `bet` is the total staked across the player's hands
  virtual void on_round_done(double bet, double net) { (void)bet; (void)net; }

  virtual ~RoundObserver() = default;
};

/**
 * Plain-text narration of a round
 */
class ConsoleNarrator : public RoundObserver {
public:
  explicit ConsoleNarrator(std::ostream& out) : out_(out) {}

  void on_deal(const std::string& who, const Card& card, bool visible) override {
    if (visible) {
      out_ << who << " draws " << to_string(card) << "\n";
    }
  }

  void on_action(const std::string& who, Action action) override {
    out_ << who << " does " << action_name(action) << "\n";
  }

  void on_split(const std::string& who, std::span<const Card> first,
                std::span<const Card> second) override {
    out_ << who << " now has 2 hands\n";
    out_ << "Hand 1: " << to_string(first) << "\n";
    out_ << "Hand 2: " << to_string(second) << "\n";
  }

  void on_hand_done(const std::string& who, std::span<const Card> hand,
                    const std::string& label) override {
    out_ << who << " ends with" << label << " " << to_string(hand)
         << " with value " << format_value(hand_value(hand)) << "\n\n";
  }

  void on_dealer_reveal(std::span<const Card> dealer) override {
    if (!dealer.empty()) {
      out_ << "Dealer reveals:  " << to_string(dealer.back()) << "\n";
    }
    out_ << "Dealer has: " << to_string(dealer) << " ("
         << format_points(hand_value(dealer)) << " points)\n";
  }

  void on_settle(const std::string& who, std::span<const Card> hand,
                 std::span<const Card> dealer, double reward) override {
    out_ << who << ": " << to_string(hand) << " ("
         << format_points(hand_value(hand)) << " points)\n";
    out_ << "Dealer: " << to_string(dealer) << " ("
         << format_points(hand_value(dealer)) << " points)\n";
    (void)reward;
  }

  void on_round_done(double bet, double net) override {
    out_ << "Bet: " << bet << " won: " << net << "\n\n";
  }

private:
  std::ostream& out_;
};

}  // namespace bjsim
