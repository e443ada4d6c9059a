#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file simulation.hpp
 * @brief Batch of rounds with a running average
 *
 * A round that fails with RoundError (shoe exhausted, agent stalled) is
 * logged, counted in `failed_rounds` and left out of the rewards and the
 * mean. Any other exception propagates and ends the batch.
 */

#include "agent.hpp"
#include "common.hpp"
#include "engine.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <numeric>
#include <vector>

namespace bjsim::sim {

struct SimulationSummary {
  /** Rounds requested */
  size_t rounds = 0;

  /** Net reward of every completed round, in play order */
  std::vector<double> rewards;

  /** Rounds that failed and were excluded */
  size_t failed_rounds = 0;

  double total() const {
    return std::accumulate(rewards.begin(), rewards.end(), 0.0);
  }

  /** Mean over completed rounds (0 if none completed) */
  double mean() const {
    return rewards.empty() ? 0.0 : total() / static_cast<double>(rewards.size());
  }

  nlohmann::json to_json() const {
    return {
      {"rounds", rounds},
      {"completed", rewards.size()},
      {"failed", failed_rounds},
      {"total", total()},
      {"average", mean()},
    };
  }
};

/// Called after every completed round with (round index, net reward)
using RoundCallback = std::function<void(size_t, double)>;

class Simulator {
public:
  Simulator(RoundEngine& engine, Agent& agent) : engine_(engine), agent_(agent) {}

  /**
   * Play `rounds` fresh rounds
   *
   * @param rounds Number of rounds
   * @param on_round Optional per-round callback
   * @return Rewards, failures and mean
   */
  SimulationSummary run(size_t rounds, const RoundCallback& on_round = nullptr) {
    SimulationSummary summary;
    summary.rounds = rounds;
    summary.rewards.reserve(rounds);

    for (size_t i = 0; i < rounds; ++i) {
      double net;
      try {
        net = engine_.play_round(agent_).net;
      } catch (const RoundError& e) {
        BJSIM_LOG_DEBUG("[Simulator::run] Round %zu failed: %s", i, e.what());
        summary.failed_rounds++;
        continue;
      }
      summary.rewards.push_back(net);
      if (on_round) on_round(i, net);
    }
    return summary;
  }

private:
  RoundEngine& engine_;
  Agent& agent_;
};

}  // namespace bjsim::sim
