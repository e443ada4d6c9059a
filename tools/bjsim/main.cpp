// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * bjsim command line driver
 *
 *   bjsim [player] [-n N] [-s] [-r] [-d DECK] [-i N] [--search-stats]
 *         [--seed S] [-c FILE] [--json]
 *
 * Run `bjsim --help` for the option list.
 */

#include <bjsim/config.hpp>
#include <bjsim/engine.hpp>
#include <bjsim/observer.hpp>
#include <bjsim/registry.hpp>
#include <bjsim/simulation.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliOptions {
  bjsim::config::SimulationConfig config;
  bool json = false;
  bool search_stats = false;
  bool help = false;
};

void print_usage(std::ostream& out, const bjsim::AgentRegistry& agents,
                 const bjsim::DeckRegistry& decks) {
  out << "Usage: bjsim [player] [options]\n"
      << "Run a simulation of a Blackjack agent.\n\n"
      << "  player                 the player type (available values: "
      << bjsim::detail::join_names(agents.names()) << ")\n"
      << "  -n, --count N          how many games to run (default 100)\n"
      << "  -s, -q, --silent, --quiet\n"
      << "                         do not print game output, only the average\n"
      << "  -r, --rank, --rank-split\n"
      << "                         only split cards of the same rank\n"
      << "                         (default: split cards of the same value)\n"
      << "  -d, --deck D           the deck type to use (available values: "
      << bjsim::detail::join_names(decks.names()) << ")\n"
      << "  -i, --iterations N     search trials per decision (default 1000)\n"
      << "      --search-stats     print root statistics after each search decision\n"
      << "      --seed S           seed the random generator\n"
      << "  -c, --config FILE      read settings from a JSON file\n"
      << "      --json             print the summary as JSON\n"
      << "  -h, --help             show this help\n";
}

/**
 * Two passes: the configuration file first, then every other flag on top
 */
CliOptions parse_args(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  CliOptions opts;

  auto value_of = [&](size_t& i) -> const std::string& {
    if (i + 1 >= args.size()) {
      throw bjsim::ConfigError(args[i] + " expects a value");
    }
    return args[++i];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-c" || args[i] == "--config") {
      opts.config = bjsim::config::load(value_of(i), opts.config);
    }
  }

  bool have_player = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-c" || a == "--config") {
      ++i;
    } else if (a == "-h" || a == "--help") {
      opts.help = true;
    } else if (a == "-n" || a == "--count") {
      opts.config.rounds = static_cast<int>(
          bjsim::config::parse_integer(a, value_of(i), 0, bjsim::config::MAX_ROUNDS));
    } else if (a == "-s" || a == "-q" || a == "--silent" || a == "--quiet") {
      opts.config.verbose = false;
    } else if (a == "-r" || a == "--rank" || a == "--rank-split") {
      opts.config.split_rule = bjsim::SplitRule::SameRank;
    } else if (a == "-d" || a == "--deck") {
      opts.config.deck = value_of(i);
    } else if (a == "-i" || a == "--iterations") {
      opts.config.search.iterations = static_cast<int>(
          bjsim::config::parse_integer(a, value_of(i), 1, bjsim::config::MAX_ITERATIONS));
    } else if (a == "--search-stats") {
      opts.search_stats = true;
    } else if (a == "--seed") {
      opts.config.seed = static_cast<uint32_t>(
          bjsim::config::parse_integer(a, value_of(i), 0, bjsim::config::MAX_SEED));
    } else if (a == "--json") {
      opts.json = true;
    } else if (!a.empty() && a[0] == '-') {
      throw bjsim::ConfigError("unknown option " + a);
    } else if (!have_player) {
      opts.config.agent = a;
      have_player = true;
    } else {
      throw bjsim::ConfigError("unexpected argument " + a);
    }
  }
  return opts;
}

int run(const CliOptions& opts, bjsim::AgentRegistry& agents, bjsim::DeckRegistry& decks) {
  const auto& cfg = opts.config;
  for (const auto& [name, spec] : cfg.decks) {
    decks.add_spec(name, spec);
  }

  // Fail on bad names before anything is dealt
  agents.validate(cfg.agent);
  decks.validate(cfg.deck);

  std::mt19937 rng(cfg.seed ? *cfg.seed : std::random_device{}());
  bjsim::Cards deck = decks.create(cfg.deck, rng);

  bjsim::Rules rules;
  rules.split_rule = cfg.split_rule;

  bjsim::AgentContext ctx{deck, rules, rng};
  ctx.search = cfg.search;
  if (opts.search_stats) {
    ctx.search.stats_out = &std::cout;
  }
  ctx.name = cfg.player_name;
  std::unique_ptr<bjsim::Agent> agent = agents.create(cfg.agent, ctx);

  bjsim::ConsoleNarrator narrator(std::cout);
  bjsim::RoundEngine engine(deck, rules, rng, cfg.verbose ? &narrator : nullptr);
  bjsim::sim::Simulator simulator(engine, *agent);

  auto summary = simulator.run(static_cast<size_t>(cfg.rounds));

  if (opts.json) {
    std::cout << summary.to_json().dump(2) << std::endl;
  } else {
    std::cout << "Average points:  " << summary.mean() << std::endl;
    if (summary.failed_rounds > 0) {
      std::cout << summary.failed_rounds << " of " << summary.rounds
                << " rounds failed and were excluded from the average" << std::endl;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  auto agents = bjsim::AgentRegistry::with_defaults();
  auto decks = bjsim::DeckRegistry::with_defaults();

  try {
    CliOptions opts = parse_args(argc, argv);
    if (opts.help) {
      print_usage(std::cout, agents, decks);
      return 0;
    }
    return run(opts, agents, decks);
  } catch (const bjsim::ConfigError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "bjsim: " << e.what() << std::endl;
    return 1;
  }
}
