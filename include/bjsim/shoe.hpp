#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file shoe.hpp
 * @brief Shuffled deal source consumed front to back
 *
 * A Shoe owns a copy of its cards and a read cursor. It is never refilled:
 * drawing past the end throws ShoeExhausted, which fails the current round
 * only.
 *
 * Usage:
 *   bjsim::Shoe shoe = bjsim::Shoe::shuffled(composition, rng);
 *   bjsim::Card c = shoe.draw();
 */

#include "card.hpp"
#include "common.hpp"

#include <algorithm>
#include <random>
#include <span>
#include <string>
#include <utility>

namespace bjsim {

class Shoe {
public:
  Shoe() = default;

  /**
   * Shoe dealing `cards` in the given order
   *
   * @param cards Cards, front is dealt first
   */
  explicit Shoe(Cards cards) : cards_(std::move(cards)) {}

  /**
   * Shuffled copy of a composition
   *
   * @param composition Template cards (not modified)
   * @param rng Injected generator
   */
  static Shoe shuffled(std::span<const Card> composition, std::mt19937& rng) {
    Cards cards(composition.begin(), composition.end());
    std::shuffle(cards.begin(), cards.end(), rng);
    return Shoe(std::move(cards));
  }

  /**
   * Deal the next card
   *
   * @throws ShoeExhausted if no card is left
   */
  Card draw() {
    if (next_ >= cards_.size()) {
      BJSIM_LOG_DEBUG("[Shoe::draw] Exhausted after %zu cards", cards_.size());
      throw ShoeExhausted("Shoe::draw - shoe exhausted after " +
                          std::to_string(cards_.size()) + " cards");
    }
    return cards_[next_++];
  }

  size_t remaining() const { return cards_.size() - next_; }
  bool empty() const { return remaining() == 0; }

  /// Undealt cards, next card first
  std::span<const Card> undealt() const {
    return std::span<const Card>(cards_).subspan(next_);
  }

private:
  Cards cards_;
  size_t next_ = 0;
};

/**
 * Remove one seen card from a composition
 *
 * Cards with an id are matched by id, so the exact physical card is removed
 * even when duplicates share suit and rank. Cards without an id fall back to
 * the first value-equal card.
 *
 * @param cards Composition to edit
 * @param seen Card known to be out of the shoe
 * @return true if a card was removed
 */
inline bool remove_card(Cards& cards, const Card& seen) {
  auto it = cards.end();
  if (seen.has_id()) {
    it = std::find_if(cards.begin(), cards.end(),
                      [&](const Card& c) { return c.id == seen.id && c == seen; });
  }
  if (it == cards.end()) {
    it = std::find(cards.begin(), cards.end(), seen);
  }
  if (it == cards.end()) {
    BJSIM_LOG_DEBUG("[remove_card] %s not in composition", to_string(seen).c_str());
    return false;
  }
  cards.erase(it);
  return true;
}

/**
 * Composition minus every card in `seen`
 *
 * @param composition Full deck
 * @param seen Cards already out of the shoe (player hand, dealer up card)
 * @return Remaining cards in composition order
 */
inline Cards unseen_cards(std::span<const Card> composition,
                          std::span<const Card> seen) {
  Cards pool(composition.begin(), composition.end());
  for (const auto& c : seen) {
    remove_card(pool, c);
  }
  return pool;
}

}  // namespace bjsim
