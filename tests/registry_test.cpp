/**
 * Agent and deck registry tests
 */

#include <doctest/doctest.h>
#include <bjsim/registry.hpp>

#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "test_helpers.hpp"

using namespace bjsim;
using test_helpers::card;
using test_helpers::cards;

// ============================================================================
// AgentRegistry
// ============================================================================

TEST_CASE("registry: built-in agents in registration order") {
  auto agents = AgentRegistry::with_defaults();
  std::vector<std::string> expected = {"default", "timid", "basic", "mcts", "console"};
  CHECK(agents.names() == expected);
  CHECK(agents.contains("mcts"));
  CHECK_FALSE(agents.contains("Default"));
}

TEST_CASE("registry: every built-in agent can be created") {
  std::mt19937 rng(1);
  Cards deck = deck::generate_default();
  Rules rules;
  std::istringstream in("2\n");
  std::ostringstream out;

  AgentContext ctx{deck, rules, rng};
  ctx.in = &in;
  ctx.out = &out;
  ctx.search.iterations = 10;

  auto agents = AgentRegistry::with_defaults();
  for (const auto& name : agents.names()) {
    auto agent = agents.create(name, ctx);
    REQUIRE(agent != nullptr);
    CHECK(agent->name() == "Sir Gladington III, Esq.");
  }

  CHECK(dynamic_cast<RandomAgent*>(agents.create("default", ctx).get()) != nullptr);
  CHECK(dynamic_cast<TimidAgent*>(agents.create("timid", ctx).get()) != nullptr);
  CHECK(dynamic_cast<BasicStrategyAgent*>(agents.create("basic", ctx).get()) != nullptr);

  auto search = agents.create("mcts", ctx);
  auto* search_agent = dynamic_cast<mcts::SearchAgent*>(search.get());
  REQUIRE(search_agent != nullptr);
  CHECK(search_agent->config().iterations == 10);

  // Console agent reads from the context's stream
  auto console = agents.create("console", ctx);
  std::vector<Action> legal = {Action::Hit, Action::Stand};
  CHECK(console->decide(cards({"10", "6"}), legal, card("9")) == Action::Stand);
}

TEST_CASE("registry: unknown agent names list the options") {
  auto agents = AgentRegistry::with_defaults();
  CHECK_THROWS_AS(agents.validate("psychic"), ConfigError);
  try {
    agents.validate("psychic");
    FAIL("validate accepted an unknown name");
  } catch (const ConfigError& e) {
    std::string msg = e.what();
    CHECK(msg.find("Invalid player type: psychic") != std::string::npos);
    CHECK(msg.find("default, timid, basic, mcts, console") != std::string::npos);
  }
}

TEST_CASE("registry: custom agents can be added") {
  std::mt19937 rng(1);
  Cards deck = deck::generate_default();
  Rules rules;
  AgentContext ctx{deck, rules, rng};
  ctx.name = "Bot";

  auto agents = AgentRegistry::with_defaults();
  agents.add("stand", [](const AgentContext& c) -> std::unique_ptr<Agent> {
    return std::make_unique<TimidAgent>(c.name);
  });
  CHECK(agents.names().back() == "stand");
  CHECK(agents.create("stand", ctx)->name() == "Bot");
}

// ============================================================================
// DeckRegistry
// ============================================================================

TEST_CASE("registry: built-in decks in registration order") {
  auto decks = DeckRegistry::with_defaults();
  std::vector<std::string> expected = {"default", "high", "low", "even", "odd", "red", "random"};
  CHECK(decks.names() == expected);
}

TEST_CASE("registry: decks are created by name") {
  std::mt19937 rng(1);
  auto decks = DeckRegistry::with_defaults();
  CHECK(decks.create("default", rng).size() == 52);
  CHECK(decks.create("high", rng).size() == 16);
  CHECK(decks.create("low", rng).size() == 42);
  CHECK(decks.create("red", rng).size() == 26);

  size_t random_size = decks.create("random", rng).size();
  CHECK(random_size >= 20);
  CHECK(random_size <= 52);
  CHECK(random_size % 4 == 0);
}

TEST_CASE("registry: unknown deck names list the options") {
  std::mt19937 rng(1);
  auto decks = DeckRegistry::with_defaults();
  CHECK_THROWS_AS(decks.create("tarot", rng), ConfigError);
  try {
    decks.validate("tarot");
    FAIL("validate accepted an unknown name");
  } catch (const ConfigError& e) {
    CHECK(std::string(e.what()).find("Invalid deck type: tarot") != std::string::npos);
  }
}

TEST_CASE("registry: custom spec replaces a preset in place") {
  std::mt19937 rng(1);
  auto decks = DeckRegistry::with_defaults();
  deck::DeckSpec spec{{"Hearts"}, {{"10", 10}, {"Ace", 11}}};

  decks.add_spec("high", spec);
  CHECK(decks.names().size() == 7);
  CHECK(decks.names()[1] == "high");
  CHECK(decks.create("high", rng).size() == 2);

  decks.add_spec("short", spec);
  CHECK(decks.names().back() == "short");
}
