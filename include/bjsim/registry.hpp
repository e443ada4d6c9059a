#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file registry.hpp
 * @brief Name -> factory maps for agents and deck compositions
 *
 * Registries are plain values built at startup (with_defaults()) and handed
 * to whoever needs them; there is no global registry state. Names are listed
 * in registration order so error messages are stable.
 *
 * Usage:
 *   auto agents = bjsim::AgentRegistry::with_defaults();
 *   auto decks = bjsim::DeckRegistry::with_defaults();
 *   bjsim::Cards deck = decks.create("red", rng);
 *   auto agent = agents.create("basic", {deck, rules, rng});
 */

#include "agent.hpp"
#include "card.hpp"
#include "common.hpp"
#include "deck.hpp"
#include "mcts.hpp"
#include "rules.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bjsim {

namespace detail {

inline std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += ", ";
    out += names[i];
  }
  return out;
}

/**
 * Insertion-ordered factory map
 */
template <typename Factory>
class FactoryMap {
public:
  void add(const std::string& name, Factory factory) {
    if (factories_.find(name) == factories_.end()) {
      order_.push_back(name);
    }
    factories_[name] = std::move(factory);
  }

  bool contains(const std::string& name) const {
    return factories_.find(name) != factories_.end();
  }

  const Factory* find(const std::string& name) const {
    auto it = factories_.find(name);
    return it == factories_.end() ? nullptr : &it->second;
  }

  const std::vector<std::string>& names() const { return order_; }

private:
  std::unordered_map<std::string, Factory> factories_;
  std::vector<std::string> order_;
};

}  // namespace detail

// ============================================================================
// Agents
// ============================================================================

/**
 * Everything an agent factory may need
 */
struct AgentContext {
  const Cards& deck;                ///< Composition the engine deals from
  const Rules& rules;               ///< Table rules
  std::mt19937& rng;                ///< Shared generator
  mcts::SearchConfig search = {};   ///< Search agent settings
  std::string name = "Sir Gladington III, Esq.";  ///< Display name
  std::istream* in = &std::cin;     ///< Console agent input
  std::ostream* out = &std::cout;   ///< Console agent output
};

using AgentFactory = std::function<std::unique_ptr<Agent>(const AgentContext&)>;

class AgentRegistry {
public:
  /**
   * Registry with the built-in agents
   *
   * default, timid, basic, mcts, console
   */
  static AgentRegistry with_defaults() {
    AgentRegistry r;
    r.add("default", [](const AgentContext& ctx) -> std::unique_ptr<Agent> {
      return std::make_unique<RandomAgent>(ctx.name, ctx.rng);
    });
    r.add("timid", [](const AgentContext& ctx) -> std::unique_ptr<Agent> {
      return std::make_unique<TimidAgent>(ctx.name);
    });
    r.add("basic", [](const AgentContext& ctx) -> std::unique_ptr<Agent> {
      return std::make_unique<BasicStrategyAgent>(ctx.name);
    });
    r.add("mcts", [](const AgentContext& ctx) -> std::unique_ptr<Agent> {
      return std::make_unique<mcts::SearchAgent>(ctx.name, ctx.deck, ctx.rules,
                                                 ctx.rng, ctx.search);
    });
    r.add("console", [](const AgentContext& ctx) -> std::unique_ptr<Agent> {
      return std::make_unique<ConsoleAgent>(ctx.name, *ctx.in, *ctx.out);
    });
    return r;
  }

  void add(const std::string& name, AgentFactory factory) {
    map_.add(name, std::move(factory));
  }

  bool contains(const std::string& name) const { return map_.contains(name); }

  const std::vector<std::string>& names() const { return map_.names(); }

  /**
   * Build an agent by name
   *
   * @throws ConfigError naming the available agents if `name` is unknown
   */
  std::unique_ptr<Agent> create(const std::string& name, const AgentContext& ctx) const {
    validate(name);
    return (*map_.find(name))(ctx);
  }

  /**
   * Check a name without building anything
   *
   * @throws ConfigError naming the available agents if `name` is unknown
   */
  void validate(const std::string& name) const {
    if (!map_.contains(name)) {
      throw ConfigError("Invalid player type: " + name +
                        ". Available options are: \n" + detail::join_names(names()));
    }
  }

private:
  detail::FactoryMap<AgentFactory> map_;
};

// ============================================================================
// Decks
// ============================================================================

using DeckFactory = std::function<Cards(std::mt19937&)>;

class DeckRegistry {
public:
  /**
   * Registry with the built-in presets
   *
   * default, high, low, even, odd, red, random
   */
  static DeckRegistry with_defaults() {
    DeckRegistry r;
    r.add("default", [](std::mt19937&) { return deck::generate_default(); });
    r.add_spec("high", deck::high_spec());
    r.add_spec("low", deck::low_spec());
    r.add_spec("even", deck::even_spec());
    r.add_spec("odd", deck::odd_spec());
    r.add_spec("red", deck::red_spec());
    r.add("random", [](std::mt19937& rng) {
      return deck::generate(deck::random_spec(rng));
    });
    return r;
  }

  void add(const std::string& name, DeckFactory factory) {
    map_.add(name, std::move(factory));
  }

  /// Register a fixed composition
  void add_spec(const std::string& name, deck::DeckSpec spec) {
    map_.add(name, [spec = std::move(spec)](std::mt19937&) {
      return deck::generate(spec);
    });
  }

  bool contains(const std::string& name) const { return map_.contains(name); }

  const std::vector<std::string>& names() const { return map_.names(); }

  /**
   * Build a composition by name
   *
   * @throws ConfigError naming the available decks if `name` is unknown
   */
  Cards create(const std::string& name, std::mt19937& rng) const {
    validate(name);
    return (*map_.find(name))(rng);
  }

  /// @throws ConfigError naming the available decks if `name` is unknown
  void validate(const std::string& name) const {
    if (!map_.contains(name)) {
      throw ConfigError("Invalid deck type: " + name +
                        ". Available options are: \n" + detail::join_names(names()));
    }
  }

private:
  detail::FactoryMap<DeckFactory> map_;
};

}  // namespace bjsim
