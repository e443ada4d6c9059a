#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file config.hpp
 * @brief Simulation configuration and JSON loading
 *
 * A configuration file is a JSON object; every key is optional and unknown
 * keys are ignored:
 *
 *   {
 *     "agent": "mcts",
 *     "deck": "short",
 *     "rounds": 500,
 *     "split": "rank",              // or "value"
 *     "verbose": false,
 *     "seed": 1234,
 *     "player_name": "Alice",
 *     "search": { "iterations": 2000, "exploration": 3.5 },
 *     "decks": {
 *       "short": { "suits": ["Hearts"], "ranks": [["10", 10], ["Ace", 11]] }
 *     }
 *   }
 *
 * Command line flags are applied on top of the loaded values.
 */

#include "common.hpp"
#include "deck.hpp"
#include "mcts.hpp"
#include "rules.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bjsim::config {

struct SimulationConfig {
  std::string agent = "default";                ///< Agent registry name
  std::string deck = "default";                 ///< Deck registry name
  int rounds = 100;                             ///< Rounds to simulate
  SplitRule split_rule = SplitRule::SameValue;  ///< Split predicate
  bool verbose = true;                          ///< Narrate every round
  std::optional<uint32_t> seed;                 ///< Generator seed (random if unset)
  std::string player_name = "Sir Gladington III, Esq.";
  mcts::SearchConfig search;                    ///< Search agent settings

  /** Custom compositions registered next to the presets */
  std::vector<std::pair<std::string, deck::DeckSpec>> decks;
};

namespace detail {

template <typename T>
T get_field(const nlohmann::json& j, const char* key, bool (nlohmann::json::*check)() const noexcept,
            const char* expected) {
  const auto& v = j.at(key);
  if (!(v.*check)()) {
    throw ConfigError(std::string("config::from_json - '") + key + "' must be " + expected);
  }
  return v.get<T>();
}

/**
 * Integer field checked against [min_value, max_value] before narrowing
 */
inline long long get_integer(const nlohmann::json& j, const char* key, long long min_value,
                             long long max_value) {
  const auto& v = j.at(key);
  if (!v.is_number_integer()) {
    throw ConfigError(std::string("config::from_json - '") + key + "' must be an integer");
  }
  bool in_range;
  long long n = 0;
  if (v.is_number_unsigned()) {
    auto u = v.get<std::uint64_t>();
    in_range = u <= static_cast<std::uint64_t>(max_value);
    if (in_range) n = static_cast<long long>(u);
  } else {
    n = v.get<std::int64_t>();
    in_range = n <= max_value;
  }
  if (!in_range || n < min_value) {
    throw ConfigError(std::string("config::from_json - '") + key + "' must be between " +
                      std::to_string(min_value) + " and " + std::to_string(max_value));
  }
  return n;
}

}  // namespace detail

/// Upper bounds shared by the JSON reader and the command line
constexpr long long MAX_ROUNDS = std::numeric_limits<int>::max();
constexpr long long MAX_ITERATIONS = std::numeric_limits<int>::max();
constexpr long long MAX_SEED = std::numeric_limits<uint32_t>::max();

/**
 * Parse a command line integer
 *
 * @param flag Option name used in the error message
 * @param text Argument text; must be an integer with nothing after it
 * @throws ConfigError if `text` is not an integer or lies outside
 *         [min_value, max_value]
 */
inline long long parse_integer(const std::string& flag, const std::string& text,
                               long long min_value, long long max_value) {
  size_t consumed = 0;
  long long v = 0;
  try {
    v = std::stoll(text, &consumed);
  } catch (const std::invalid_argument&) {
    throw ConfigError(flag + " expects an integer, got '" + text + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError(flag + " is out of range: " + text);
  }
  if (consumed != text.size()) {
    throw ConfigError(flag + " expects an integer, got '" + text + "'");
  }
  if (v < min_value || v > max_value) {
    throw ConfigError(flag + " must be between " + std::to_string(min_value) + " and " +
                      std::to_string(max_value));
  }
  return v;
}

/**
 * Overlay a JSON object on `base`
 *
 * @param j Parsed configuration object
 * @param base Values used for absent keys
 * @throws ConfigError on wrongly typed or out-of-range values
 */
inline SimulationConfig from_json(const nlohmann::json& j, SimulationConfig base = {}) {
  using json = nlohmann::json;
  if (!j.is_object()) {
    throw ConfigError("config::from_json - configuration must be a JSON object");
  }

  SimulationConfig cfg = std::move(base);
  if (j.contains("agent")) {
    cfg.agent = detail::get_field<std::string>(j, "agent", &json::is_string, "a string");
  }
  if (j.contains("deck")) {
    cfg.deck = detail::get_field<std::string>(j, "deck", &json::is_string, "a string");
  }
  if (j.contains("rounds")) {
    cfg.rounds = static_cast<int>(detail::get_integer(j, "rounds", 0, MAX_ROUNDS));
  }
  if (j.contains("split")) {
    auto split = detail::get_field<std::string>(j, "split", &json::is_string, "a string");
    if (split == "value") {
      cfg.split_rule = SplitRule::SameValue;
    } else if (split == "rank") {
      cfg.split_rule = SplitRule::SameRank;
    } else {
      throw ConfigError("config::from_json - 'split' must be \"value\" or \"rank\"");
    }
  }
  if (j.contains("verbose")) {
    cfg.verbose = detail::get_field<bool>(j, "verbose", &json::is_boolean, "a boolean");
  }
  if (j.contains("seed")) {
    cfg.seed = static_cast<uint32_t>(detail::get_integer(j, "seed", 0, MAX_SEED));
  }
  if (j.contains("player_name")) {
    cfg.player_name =
        detail::get_field<std::string>(j, "player_name", &json::is_string, "a string");
  }
  if (j.contains("search")) {
    const auto& s = j.at("search");
    if (!s.is_object()) {
      throw ConfigError("config::from_json - 'search' must be an object");
    }
    if (s.contains("iterations")) {
      cfg.search.iterations =
          static_cast<int>(detail::get_integer(s, "iterations", 1, MAX_ITERATIONS));
    }
    if (s.contains("exploration")) {
      cfg.search.exploration =
          detail::get_field<double>(s, "exploration", &json::is_number, "a number");
    }
  }
  if (j.contains("decks")) {
    const auto& d = j.at("decks");
    if (!d.is_object()) {
      throw ConfigError("config::from_json - 'decks' must be an object");
    }
    for (const auto& [name, spec] : d.items()) {
      cfg.decks.emplace_back(name, deck::spec_from_json(spec));
    }
  }
  return cfg;
}

/**
 * Parse configuration text
 *
 * @throws ConfigError if the text is not valid JSON or fails validation
 */
inline SimulationConfig parse(const std::string& text, SimulationConfig base = {}) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("config::parse - ") + e.what());
  }
  return from_json(j, std::move(base));
}

/**
 * Read and parse a configuration file
 *
 * @throws ConfigError if the file cannot be read or fails validation
 */
inline SimulationConfig load(const std::string& path, SimulationConfig base = {}) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("config::load - cannot open " + path);
  }
  std::stringstream buf;
  buf << in.rdbuf();
  BJSIM_LOG_DEBUG("[config::load] Read %zu bytes from %s", buf.str().size(), path.c_str());
  return parse(buf.str(), std::move(base));
}

/**
 * Serialize a configuration (custom decks included)
 */
inline nlohmann::json to_json(const SimulationConfig& cfg) {
  nlohmann::json j = {
    {"agent", cfg.agent},
    {"deck", cfg.deck},
    {"rounds", cfg.rounds},
    {"split", cfg.split_rule == SplitRule::SameRank ? "rank" : "value"},
    {"verbose", cfg.verbose},
    {"player_name", cfg.player_name},
    {"search", {{"iterations", cfg.search.iterations},
                {"exploration", cfg.search.exploration}}},
  };
  if (cfg.seed) {
    j["seed"] = *cfg.seed;
  }
  if (!cfg.decks.empty()) {
    nlohmann::json decks = nlohmann::json::object();
    for (const auto& [name, spec] : cfg.decks) {
      decks[name] = deck::spec_to_json(spec);
    }
    j["decks"] = decks;
  }
  return j;
}

}  // namespace bjsim::config
