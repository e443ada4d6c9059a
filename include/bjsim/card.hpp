#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file card.hpp
 * @brief Card identity and hand scoring
 *
 * Cards compare equal by (suit, rank). Two physically distinct cards with the
 * same suit and rank are equal; the `id` field tells them apart when a deck
 * composition deliberately contains duplicates (see deck.hpp).
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <vector>

namespace bjsim {

// ============================================================================
// Card
// ============================================================================

struct Card {
  /** Identifier for cards that were not produced by a deck composition */
  static constexpr uint32_t NO_ID = 0xFFFFFFFFu;

  std::string suit;     ///< Suit label ("Hearts", "Swords", ...)
  std::string rank;     ///< Rank label ("2", "Jack", "Ace", ...)
  double value = 0.0;   ///< Numeric value; Aces carry 11
  uint32_t id = NO_ID;  ///< Position in the generating composition

  bool operator==(const Card& o) const {
    return suit == o.suit && rank == o.rank;
  }

  bool is_ace() const { return rank == "Ace"; }

  bool has_id() const { return id != NO_ID; }
};

using Cards = std::vector<Card>;

// ============================================================================
// Hand
// ============================================================================

/**
 * A participant's cards together with the bet riding on them
 *
 * Split children are marked so the engine never offers a second split.
 */
struct Hand {
  Cards cards;
  double bet = 0.0;
  bool from_split = false;

  size_t size() const { return cards.size(); }
};

// ============================================================================
// Scoring
// ============================================================================

/**
 * Blackjack value of a sequence of cards
 *
 * Aces count 11 and are reduced to 1, one at a time, while the total
 * exceeds 21.
 *
 * @param cards Cards in deal order
 * @return Best total under the soft/hard Ace rule
 */
inline double hand_value(std::span<const Card> cards) {
  double total = 0.0;
  int aces = 0;
  for (const auto& c : cards) {
    total += c.value;
    if (c.is_ace()) ++aces;
  }
  while (total > 21.0 && aces > 0) {
    total -= 10.0;
    --aces;
  }
  return total;
}

/// Two cards totalling exactly 21
inline bool is_natural(std::span<const Card> cards) {
  return cards.size() == 2 && hand_value(cards) == 21.0;
}

// ============================================================================
// Formatting
// ============================================================================

inline std::string to_string(const Card& c) {
  return c.rank + " of " + c.suit;
}

/// Comma separated list, "2 of Hearts, Ace of Spades"
inline std::string to_string(std::span<const Card> cards) {
  std::string out;
  for (size_t i = 0; i < cards.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_string(cards[i]);
  }
  return out;
}

/// One decimal place, matching the narration ("17.0")
inline std::string format_points(double points) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", points);
  return buf;
}

/// Shortest form: whole values without a fraction ("19"), others as needed ("3.7")
inline std::string format_value(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", value);
  return buf;
}

}  // namespace bjsim
