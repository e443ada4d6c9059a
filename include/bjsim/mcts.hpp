#pragma once

#include "agent.hpp"
#include "card.hpp"
#include "common.hpp"
#include "engine.hpp"
#include "rules.hpp"
#include "shoe.hpp"

#include <cmath>
#include <deque>
#include <limits>
#include <optional>
#include <ostream>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * MCTS (Monte Carlo Tree Search) for Blackjack decisions under hidden information
 *
 * This header provides UCB1 tree search over action sequences with:
 * - Determinization: every trial deals from a fresh shuffle of the cards the
 *   agent has not seen (the hole card and the undealt shoe stay hidden)
 * - Forced-prefix rollouts: the tree's action path is replayed first, then a
 *   random policy finishes the hand through RoundEngine::resume_round()
 * - Arena storage: nodes live in a vector and refer to each other by index,
 *   backpropagation walks parent indices without recursion
 *
 * The tree belongs to a single decision and is discarded after it.
 *
 * Example usage:
 *
 *   #include <bjsim/mcts.hpp>
 *
 *   std::mt19937 rng(7);
 *   bjsim::mcts::SearchConfig config;
 *   config.iterations = 1000;
 *   config.exploration = 3.5;
 *
 *   bjsim::mcts::SearchAgent agent("mcts", bjsim::deck::generate_default(),
 *                                  bjsim::Rules{}, rng, config);
 *   bjsim::RoundEngine engine(bjsim::deck::generate_default(), {}, rng);
 *   double net = engine.play_round(agent).net;
 */

namespace bjsim {
namespace mcts {

// ============================================================================
// Search Configuration
// ============================================================================

/**
 * Configuration for UCB1 search
 */
struct SearchConfig {
  /** Simulation trials per decision (default 1000) */
  int iterations = 1000;

  /** UCB1 exploration constant C (default 3.5) */
  double exploration = 3.5;

  /** Track detailed metrics (default true) */
  bool track_metrics = true;

  /** Print root statistics after each decision (null: off) */
  std::ostream* stats_out = nullptr;
};

/**
 * Metrics collected during one decision
 */
struct SearchMetrics {
  /** Trials run */
  size_t iterations = 0;

  /** Trials whose simulated round failed (scored as a loss) */
  size_t failed_rollouts = 0;

  /** Nodes in the tree when the decision was made */
  size_t node_count = 0;

  /** Deepest action path explored */
  size_t max_depth = 0;

  /** Average return of the chosen action */
  double best_score = 0.0;

  /** Share of trials that completed */
  float rollout_success_rate() const {
    return iterations > 0
      ? static_cast<float>(iterations - failed_rollouts) / iterations
      : 1.0f;
  }
};

// ============================================================================
// Search Node
// ============================================================================

/**
 * UCB1 tree node
 *
 * Each node represents the sequence of actions taken from the decision point.
 */
struct SearchNode {
  /** Actions from the root to this node (empty for root) */
  std::vector<Action> path;

  /** Parent node index (-1 for root) */
  int parent_idx = -1;

  /** Child node indices, one per expanded action */
  std::vector<int> children;

  /** Visit count */
  int visits = 0;

  /** Total reward accumulated (sum of all backpropagated rewards) */
  double total = 0.0;

  /**
   * Average reward
   *
   * @return total / visits, or 0.0 if unvisited
   */
  double score() const {
    return visits > 0 ? total / visits : 0.0;
  }

  /** Action that leads into this node (root has none) */
  std::optional<Action> action() const {
    if (path.empty()) return std::nullopt;
    return path.back();
  }
};

// ============================================================================
// Search Tree
// ============================================================================

/**
 * Tree of action sequences with UCB1 selection
 *
 * Nodes are created on expansion and never removed.
 */
class SearchTree {
public:
  /** Index of the root node */
  static constexpr int ROOT = 0;

  /**
   * Construct a tree holding only the root
   *
   * @param exploration UCB1 constant C
   */
  explicit SearchTree(double exploration = 3.5) : exploration_(exploration) {
    nodes_.emplace_back();
  }

  /**
   * Create one child per action
   *
   * Each child's path is the parent's path plus its action.
   *
   * @param node_idx Node to expand
   * @param actions Actions to expand, in child order
   */
  void expand(int node_idx, std::span<const Action> actions) {
    for (Action a : actions) {
      SearchNode child;
      child.parent_idx = node_idx;
      child.path = nodes_[node_idx].path;
      child.path.push_back(a);

      int child_idx = static_cast<int>(nodes_.size());
      nodes_.push_back(std::move(child));
      nodes_[node_idx].children.push_back(child_idx);
    }
  }

  /**
   * UCB1 value of a node
   *
   * score + C * sqrt(ln(n_iterations) / visits), +infinity when unvisited.
   *
   * @param node_idx Node index
   * @param n_iterations Trials run so far, counting the current one
   */
  double ucb1(int node_idx, int n_iterations) const {
    const auto& node = nodes_[node_idx];
    if (node.visits == 0) {
      return std::numeric_limits<double>::infinity();
    }
    return node.score() +
           exploration_ * std::sqrt(std::log(static_cast<double>(n_iterations)) /
                                    node.visits);
  }

  /**
   * Pick the child to descend into
   *
   * Returns the first unvisited child without computing UCB1; otherwise the
   * child with the highest UCB1 (first one on ties).
   *
   * @param node_idx Parent node index
   * @param n_iterations Trials run so far, counting the current one
   * @return Child index, or -1 if the node has no children
   */
  int select_child(int node_idx, int n_iterations) const {
    const auto& node = nodes_[node_idx];
    for (int child_idx : node.children) {
      if (nodes_[child_idx].visits == 0) {
        return child_idx;
      }
    }

    int best_child = -1;
    double best_ucb = -std::numeric_limits<double>::infinity();
    for (int child_idx : node.children) {
      double u = ucb1(child_idx, n_iterations);
      if (best_child == -1 || u > best_ucb) {
        best_ucb = u;
        best_child = child_idx;
      }
    }
    return best_child;
  }

  /**
   * Backpropagation: update statistics up the tree
   *
   * Walks parent indices from `node_idx` to the root, inclusive.
   *
   * @param node_idx Starting node index
   * @param reward Reward to add
   */
  void backpropagate(int node_idx, double reward) {
    while (node_idx >= 0) {
      nodes_[node_idx].visits++;
      nodes_[node_idx].total += reward;
      node_idx = nodes_[node_idx].parent_idx;
    }
  }

  /**
   * Get index of best root child (by average reward)
   *
   * @return Child index, or -1 if the root has no children
   */
  int best_child_index() const {
    int best_child = -1;
    double best_score = -std::numeric_limits<double>::infinity();
    for (int child_idx : nodes_[ROOT].children) {
      double s = nodes_[child_idx].score();
      if (best_child == -1 || s > best_score) {
        best_score = s;
        best_child = child_idx;
      }
    }
    return best_child;
  }

  /**
   * Action of the best root child
   *
   * @return Action, or nullopt if the root was never expanded
   */
  std::optional<Action> best_action() const {
    int idx = best_child_index();
    if (idx < 0) return std::nullopt;
    return nodes_[idx].action();
  }

  // Tree inspection

  int get_node_count() const { return static_cast<int>(nodes_.size()); }

  int get_root_visits() const { return nodes_[ROOT].visits; }

  const SearchNode& get_node(int idx) const { return nodes_[idx]; }

  size_t max_depth() const {
    size_t depth = 0;
    for (const auto& n : nodes_) {
      if (n.path.size() > depth) depth = n.path.size();
    }
    return depth;
  }

  /**
   * Print root statistics, one line per child
   */
  void print_stats(std::ostream& out) const {
    out << "Root visits: " << get_root_visits() << ", nodes: " << nodes_.size() << "\n";
    for (int child_idx : nodes_[ROOT].children) {
      const auto& c = nodes_[child_idx];
      out << "  " << action_name(c.path.back()) << ": visits=" << c.visits
          << " score=" << c.score() << "\n";
    }
  }

private:
  double exploration_;
  std::vector<SearchNode> nodes_;
};

// ============================================================================
// Rollout Agent
// ============================================================================

/**
 * Plays a forced prefix of actions, then random legal actions
 *
 * Forced actions are returned even when the engine would reject them; the
 * engine then asks again and the next forced action (or a random one) is
 * used. Every returned action is recorded in history().
 */
class RolloutAgent : public Agent {
public:
  RolloutAgent(std::string name, std::mt19937& rng)
      : name_(std::move(name)), rng_(rng) {}

  /// Append an action to replay before acting randomly
  void queue_action(Action a) { queued_.push_back(a); }

  Action decide(std::span<const Card> hand, std::span<const Action> legal,
                const Card& dealer_up) override {
    (void)hand;
    (void)dealer_up;
    Action act;
    if (!queued_.empty()) {
      act = queued_.front();
      queued_.pop_front();
    } else {
      std::uniform_int_distribution<size_t> pick(0, legal.size() - 1);
      act = legal[pick(rng_)];
    }
    history_.push_back(act);
    return act;
  }

  /// Clear the forced queue and the history
  void reset() override {
    queued_.clear();
    history_.clear();
  }

  std::string name() const override { return name_; }

  const std::vector<Action>& history() const { return history_; }
  size_t pending() const { return queued_.size(); }

private:
  std::string name_;
  std::mt19937& rng_;
  std::deque<Action> queued_;
  std::vector<Action> history_;
};

// ============================================================================
// Search Agent
// ============================================================================

/**
 * Agent that chooses each action by UCB1 search over simulated rounds
 *
 * Each decide() call:
 * 1. Removes the visible cards (own hand, dealer up card) from the deck
 * 2. Expands a fresh root with the legal actions
 * 3. Runs `iterations` trials: select a node, replay its path through a
 *    RolloutAgent in a resumed round, backpropagate the net reward
 * 4. Returns the root child with the best average reward
 *
 * The agent mirrors the engine's bet: a chosen DoubleDown doubles it, a new
 * split child (one card) starts again from the initial bet.
 */
class SearchAgent : public Agent {
public:
  /**
   * @param name Display name
   * @param deck Full deck composition the engine deals from
   * @param rules Table rules (must match the engine's)
   * @param rng Generator for shuffles and rollouts
   * @param config Search configuration
   * @throws ConfigError if `config.iterations` is below 1
   */
  SearchAgent(std::string name, Cards deck, Rules rules, std::mt19937& rng,
              const SearchConfig& config = SearchConfig{})
      : name_(std::move(name)),
        deck_(std::move(deck)),
        rules_(rules),
        rng_(rng),
        config_(config),
        bet_(rules.initial_bet) {
    if (config_.iterations < 1) {
      throw ConfigError("SearchAgent::SearchAgent - iterations must be positive, got " +
                        std::to_string(config_.iterations));
    }
  }

  Action decide(std::span<const Card> hand, std::span<const Action> legal,
                const Card& dealer_up) override;

  void reset() override { bet_ = rules_.initial_bet; }

  std::string name() const override { return name_; }

  /** Bet the agent believes is riding on the current hand */
  double bet() const { return bet_; }

  /** Metrics of the most recent decision */
  const SearchMetrics& get_metrics() const { return metrics_; }

  const SearchConfig& config() const { return config_; }

private:
  std::string name_;
  Cards deck_;
  Rules rules_;
  std::mt19937& rng_;
  SearchConfig config_;
  double bet_;
  SearchMetrics metrics_;
};

// ============================================================================
// SearchAgent Implementation
// ============================================================================

inline Action SearchAgent::decide(std::span<const Card> hand,
                                  std::span<const Action> legal,
                                  const Card& dealer_up) {
  if (legal.empty()) {
    throw std::runtime_error("SearchAgent::decide - no legal actions");
  }
  if (hand.size() == 1) {
    bet_ = rules_.initial_bet;
  }

  // Hidden information: only our own cards and the up card are known
  Cards seen(hand.begin(), hand.end());
  seen.push_back(dealer_up);
  Cards pool = unseen_cards(deck_, seen);

  RolloutAgent rollout("Rollout", rng_);
  RoundEngine simulator(std::move(pool), rules_, rng_);
  std::span<const Card> dealer_visible(&dealer_up, 1);
  bool allow_split = contains(legal, Action::Split);

  SearchTree tree(config_.exploration);
  tree.expand(SearchTree::ROOT, legal);

  SearchMetrics metrics;
  for (int i = 0; i < config_.iterations; ++i) {
    int n = i + 1;

    // 1. Selection: descend until an unvisited node, expanding on the way
    int selected = tree.select_child(SearchTree::ROOT, n);
    while (tree.get_node(selected).visits > 0) {
      int next = tree.select_child(selected, n);
      if (next < 0) {
        tree.expand(selected, legal);
      } else {
        selected = next;
      }
    }

    // 2. Rollout: replay the node's path, then play randomly
    rollout.reset();
    for (Action a : tree.get_node(selected).path) {
      rollout.queue_action(a);
    }

    double reward;
    try {
      reward = simulator.resume_round(hand, dealer_visible, bet_, rollout, allow_split).net;
    } catch (const RoundError& e) {
      BJSIM_LOG_DEBUG("[SearchAgent::decide] Rollout %d failed: %s", i, e.what());
      metrics.failed_rollouts++;
      reward = -bet_;
    }

    // 3. Backpropagation
    tree.backpropagate(selected, reward);
    metrics.iterations++;
  }

  std::optional<Action> best = tree.best_action();
  if (!best) {
    throw std::runtime_error("SearchAgent::decide - search produced no action");
  }

  if (config_.track_metrics) {
    metrics.node_count = static_cast<size_t>(tree.get_node_count());
    metrics.max_depth = tree.max_depth();
    metrics.best_score = tree.get_node(tree.best_child_index()).score();
  }
  metrics_ = metrics;

  if (config_.stats_out) {
    tree.print_stats(*config_.stats_out);
  }

  BJSIM_LOG_DEBUG("[SearchAgent::decide] %zu trials, %zu nodes, chose %s (%.3f)",
                  metrics.iterations, metrics.node_count, action_name(*best),
                  metrics.best_score);

  // Mirror the engine so the next decision simulates with the right bet
  if (*best == Action::DoubleDown) {
    bet_ *= 2.0;
  }
  return *best;
}

}  // namespace mcts
}  // namespace bjsim
