/**
 * Configuration loading tests
 */

#include <doctest/doctest.h>
#include <bjsim/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace bjsim;
using json = nlohmann::json;

TEST_CASE("config: defaults") {
  config::SimulationConfig cfg;
  CHECK(cfg.agent == "default");
  CHECK(cfg.deck == "default");
  CHECK(cfg.rounds == 100);
  CHECK(cfg.split_rule == SplitRule::SameValue);
  CHECK(cfg.verbose);
  CHECK_FALSE(cfg.seed.has_value());
  CHECK(cfg.search.iterations == 1000);
  CHECK(cfg.search.exploration == 3.5);
}

TEST_CASE("config: every key is read") {
  auto cfg = config::parse(R"({
    "agent": "mcts",
    "deck": "short",
    "rounds": 500,
    "split": "rank",
    "verbose": false,
    "seed": 1234,
    "player_name": "Alice",
    "search": { "iterations": 2000, "exploration": 1.25 },
    "decks": {
      "short": { "suits": ["Hearts"], "ranks": [["10", 10], ["Ace", 11]] }
    }
  })");

  CHECK(cfg.agent == "mcts");
  CHECK(cfg.deck == "short");
  CHECK(cfg.rounds == 500);
  CHECK(cfg.split_rule == SplitRule::SameRank);
  CHECK_FALSE(cfg.verbose);
  REQUIRE(cfg.seed.has_value());
  CHECK(*cfg.seed == 1234u);
  CHECK(cfg.player_name == "Alice");
  CHECK(cfg.search.iterations == 2000);
  CHECK(cfg.search.exploration == 1.25);
  REQUIRE(cfg.decks.size() == 1);
  CHECK(cfg.decks[0].first == "short");
  CHECK(cfg.decks[0].second.ranks.size() == 2);
}

TEST_CASE("config: absent keys keep the base values") {
  config::SimulationConfig base;
  base.agent = "basic";
  base.rounds = 7;

  auto cfg = config::parse(R"({"deck": "red", "unknown_key": [1, 2, 3]})", base);
  CHECK(cfg.agent == "basic");
  CHECK(cfg.rounds == 7);
  CHECK(cfg.deck == "red");

  auto empty = config::parse("{}", base);
  CHECK(empty.agent == "basic");
}

TEST_CASE("config: wrongly typed values are rejected") {
  CHECK_THROWS_AS(config::parse(R"({"agent": 3})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"rounds": "100"})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"rounds": 1.5})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"verbose": "yes"})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"seed": -1})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"search": 5})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"search": {"exploration": "high"}})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"decks": []})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"decks": {"bad": {"suits": []}}})"), ConfigError);
}

TEST_CASE("config: out-of-range values are rejected") {
  CHECK_THROWS_AS(config::parse(R"({"rounds": -1})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"split": "suit"})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"search": {"iterations": 0}})"), ConfigError);
  CHECK_NOTHROW(config::parse(R"({"rounds": 0})"));
}

TEST_CASE("config: integers too large for their field are rejected") {
  CHECK_THROWS_AS(config::parse(R"({"rounds": 2147483648})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"rounds": 4294967296})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"seed": 4294967296})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"search": {"iterations": 2147483648}})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"search": {"iterations": 4294967296}})"), ConfigError);
  CHECK_THROWS_AS(config::parse(R"({"rounds": 18446744073709551615})"), ConfigError);

  auto cfg = config::parse(R"({"rounds": 2147483647, "seed": 4294967295,
                              "search": {"iterations": 2147483647}})");
  CHECK(cfg.rounds == std::numeric_limits<int>::max());
  CHECK(*cfg.seed == std::numeric_limits<uint32_t>::max());
  CHECK(cfg.search.iterations == std::numeric_limits<int>::max());
}

TEST_CASE("config: parse_integer checks the text and the range") {
  CHECK(config::parse_integer("-n", "250", 0, config::MAX_ROUNDS) == 250);
  CHECK(config::parse_integer("-n", "2147483647", 0, config::MAX_ROUNDS) == 2147483647LL);
  CHECK(config::parse_integer("--seed", "4294967295", 0, config::MAX_SEED) == 4294967295LL);

  CHECK_THROWS_AS(config::parse_integer("-n", "2147483648", 0, config::MAX_ROUNDS),
                  ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-n", "4294967296", 0, config::MAX_ROUNDS),
                  ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-i", "4294967296", 1, config::MAX_ITERATIONS),
                  ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-i", "0", 1, config::MAX_ITERATIONS), ConfigError);
  CHECK_THROWS_AS(config::parse_integer("--seed", "4294967296", 0, config::MAX_SEED),
                  ConfigError);
  CHECK_THROWS_AS(config::parse_integer("--seed", "-1", 0, config::MAX_SEED), ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-n", "99999999999999999999", 0, config::MAX_ROUNDS),
                  ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-n", "12x", 0, config::MAX_ROUNDS), ConfigError);
  CHECK_THROWS_AS(config::parse_integer("-n", "", 0, config::MAX_ROUNDS), ConfigError);
}

TEST_CASE("config: non-object and malformed text are configuration errors") {
  CHECK_THROWS_AS(config::parse("[1, 2]"), ConfigError);
  CHECK_THROWS_AS(config::parse("{\"agent\": "), ConfigError);
  CHECK_THROWS_AS(config::parse("not json"), ConfigError);
}

TEST_CASE("config: missing file is a configuration error") {
  CHECK_THROWS_AS(config::load("/nonexistent/bjsim/config.json"), ConfigError);
}

TEST_CASE("config: to_json reads back to the same configuration") {
  config::SimulationConfig cfg;
  cfg.agent = "mcts";
  cfg.rounds = 42;
  cfg.split_rule = SplitRule::SameRank;
  cfg.verbose = false;
  cfg.seed = 99;
  cfg.search.iterations = 300;
  cfg.decks.emplace_back("mini", deck::DeckSpec{{"Hearts"}, {{"2", 2}}});

  json j = config::to_json(cfg);
  CHECK(j["split"] == "rank");
  CHECK(j["seed"] == 99);

  auto back = config::from_json(j);
  CHECK(back.agent == "mcts");
  CHECK(back.rounds == 42);
  CHECK(back.split_rule == SplitRule::SameRank);
  CHECK_FALSE(back.verbose);
  CHECK(*back.seed == 99u);
  CHECK(back.search.iterations == 300);
  REQUIRE(back.decks.size() == 1);
  CHECK(back.decks[0].first == "mini");
}

TEST_CASE("config: seed is omitted when unset") {
  json j = config::to_json(config::SimulationConfig{});
  CHECK_FALSE(j.contains("seed"));
  CHECK_FALSE(j.contains("decks"));
}
