#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file deck.hpp
 * @brief Deck compositions
 *
 * A composition is the full list of cards a shoe is built from. Every card
 * produced here carries its index in the composition as `Card::id`, so the
 * search agent can remove the exact physical card it has seen even when a
 * composition holds duplicates (the `low` preset has two "3" ranks).
 *
 * Presets:
 * - default: 4 suits x 13 ranks
 * - high:    2, 10, Ace and a 12-valued "Fool"
 * - low:     fractional values over 7 suits
 * - even:    even-valued ranks
 * - odd:     odd-valued ranks including Ace
 * - red:     Diamonds and Hearts only
 * - random:  5..13 ranks sampled from the default ranks
 */

#include "card.hpp"
#include "common.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace bjsim::deck {

/// (rank label, value) pair
using RankSpec = std::pair<std::string, double>;

/**
 * Suits and ranks of a composition
 *
 * Cards are generated suit-major: every rank of the first suit, then every
 * rank of the second, and so on.
 */
struct DeckSpec {
  std::vector<std::string> suits;
  std::vector<RankSpec> ranks;
};

inline std::vector<std::string> standard_suits() {
  return {"Hearts", "Spades", "Clubs", "Diamonds"};
}

inline std::vector<RankSpec> standard_ranks() {
  return {{"2", 2},  {"3", 3},     {"4", 4},      {"5", 5},     {"6", 6},
          {"7", 7},  {"8", 8},     {"9", 9},      {"10", 10},   {"Jack", 10},
          {"Queen", 10}, {"King", 10}, {"Ace", 11}};
}

/**
 * Build the card list for a spec
 *
 * @param spec Suits and ranks
 * @return Cards with ids 0..n-1 in generation order
 */
inline Cards generate(const DeckSpec& spec) {
  Cards out;
  out.reserve(spec.suits.size() * spec.ranks.size());
  uint32_t next_id = 0;
  for (const auto& suit : spec.suits) {
    for (const auto& [rank, value] : spec.ranks) {
      out.push_back(Card{suit, rank, value, next_id++});
    }
  }
  return out;
}

inline Cards generate_default() {
  return generate({standard_suits(), standard_ranks()});
}

// ============================================================================
// Presets
// ============================================================================

inline DeckSpec high_spec() {
  return {standard_suits(), {{"2", 2}, {"10", 10}, {"Ace", 11}, {"Fool", 12}}};
}

inline DeckSpec low_spec() {
  return {{"Hearts", "Spades", "Clubs", "Diamonds", "Swords", "Wands", "Bows"},
          {{"1.5", 1.5}, {"2", 2}, {"2.2", 2.2}, {"3", 3}, {"3", 4}, {"Ace", 11}}};
}

inline DeckSpec even_spec() {
  return {standard_suits(),
          {{"2", 2}, {"4", 4}, {"6", 6}, {"8", 8}, {"10", 10},
           {"Jack", 10}, {"Queen", 10}, {"King", 10}}};
}

inline DeckSpec odd_spec() {
  return {standard_suits(), {{"3", 3}, {"5", 5}, {"7", 7}, {"9", 9}, {"Ace", 11}}};
}

inline DeckSpec red_spec() {
  return {{"Diamonds", "Hearts"}, standard_ranks()};
}

/**
 * Random subset of the standard ranks over the standard suits
 *
 * Draws a size in [5, 13] and samples that many distinct ranks, keeping
 * their standard order.
 */
inline DeckSpec random_spec(std::mt19937& rng) {
  auto ranks = standard_ranks();
  std::uniform_int_distribution<size_t> size_dist(5, ranks.size());
  size_t n = size_dist(rng);
  std::vector<RankSpec> picked;
  picked.reserve(n);
  std::sample(ranks.begin(), ranks.end(), std::back_inserter(picked), n, rng);
  return {standard_suits(), std::move(picked)};
}

// ============================================================================
// JSON
// ============================================================================

/**
 * Parse a deck spec from JSON
 *
 * Format:
 *   { "suits": ["Hearts", "Spades"], "ranks": [["2", 2], ["Ace", 11]] }
 *
 * @throws ConfigError if a field is missing, empty or wrongly typed
 */
inline DeckSpec spec_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("deck::spec_from_json - deck must be an object");
  }
  if (!j.contains("suits") || !j["suits"].is_array() || j["suits"].empty()) {
    throw ConfigError("deck::spec_from_json - 'suits' must be a non-empty array");
  }
  if (!j.contains("ranks") || !j["ranks"].is_array() || j["ranks"].empty()) {
    throw ConfigError("deck::spec_from_json - 'ranks' must be a non-empty array");
  }

  DeckSpec spec;
  for (const auto& s : j["suits"]) {
    if (!s.is_string()) {
      throw ConfigError("deck::spec_from_json - suit labels must be strings");
    }
    spec.suits.push_back(s.get<std::string>());
  }
  for (const auto& r : j["ranks"]) {
    if (!r.is_array() || r.size() != 2 || !r[0].is_string() || !r[1].is_number()) {
      throw ConfigError(
          "deck::spec_from_json - ranks must be [label, value] pairs");
    }
    spec.ranks.emplace_back(r[0].get<std::string>(), r[1].get<double>());
  }
  return spec;
}

inline nlohmann::json spec_to_json(const DeckSpec& spec) {
  nlohmann::json ranks = nlohmann::json::array();
  for (const auto& [label, value] : spec.ranks) {
    ranks.push_back({label, value});
  }
  return {{"suits", spec.suits}, {"ranks", ranks}};
}

}  // namespace bjsim::deck
