#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file engine.hpp
 * @brief Round state machine: deal, act, split, settle
 *
 * Two entry points share the same play/settle logic:
 * - play_round(): fresh deal from a shuffled copy of the composition
 * - resume_round(): continue from a partial state supplied by the caller
 *   (the search agent's simulations)
 *
 * Per-hand loop, used for the player and the dealer alike:
 *
 *   while value(hand) < 21:
 *     legal = {Hit, Stand} + DoubleDown (2 cards) + Split (2 cards, rule holds,
 *             not a split child)
 *     action = agent.decide(hand, legal, dealer_up)
 *     illegal -> ignored, ask again
 *     Stand   -> done
 *     Hit     -> deal one card
 *     Double  -> deal one card, double this hand's bet, done
 *     Split   -> play both one-card children (no further split), done
 *
 * resume_round() does not check that the shoe excludes the cards it is given;
 * a card held by the player can be dealt a second time if the caller passes a
 * shoe that still contains it.
 *
 * Usage:
 *   std::mt19937 rng(42);
 *   bjsim::RoundEngine engine(bjsim::deck::generate_default(), {}, rng);
 *   bjsim::BasicStrategyAgent agent("player");
 *   double net = engine.play_round(agent).net;
 */

#include "agent.hpp"
#include "card.hpp"
#include "common.hpp"
#include "observer.hpp"
#include "rules.hpp"
#include "shoe.hpp"

#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace bjsim {

/**
 * Outcome of one round
 */
struct RoundResult {
  /** Player's final hands: two after a split, one otherwise */
  std::vector<Hand> hands;

  /** Reward of each hand, same order as `hands` */
  std::vector<double> rewards;

  /** Dealer's final cards */
  Cards dealer;

  /** Sum of `rewards` */
  double net = 0.0;

  /** Total staked across all player hands */
  double total_bet() const {
    double sum = 0.0;
    for (const auto& h : hands) sum += h.bet;
    return sum;
  }
};

class RoundEngine {
public:
  /**
   * @param composition Cards every shoe is built from
   * @param rules Table rules
   * @param rng Generator used to shuffle each round's shoe
   * @param observer Optional event sink (not owned, may be null)
   */
  RoundEngine(Cards composition, Rules rules, std::mt19937& rng,
              RoundObserver* observer = nullptr)
      : composition_(std::move(composition)),
        rules_(rules),
        rng_(rng),
        observer_(observer),
        dealer_(rules.dealer_stand_threshold) {}

  /**
   * Play a fresh round from a newly shuffled shoe
   *
   * @param agent Player (reset before dealing)
   * @return Round outcome
   * @throws RoundError if the shoe runs out or the agent stalls
   */
  RoundResult play_round(Agent& agent) {
    return play_round(Shoe::shuffled(composition_, rng_), agent);
  }

  /**
   * Play a fresh round dealing from `shoe` in order
   *
   * Deal order: player, dealer (up), player, dealer (hole).
   */
  RoundResult play_round(Shoe shoe, Agent& agent) {
    agent.reset();
    RoundState st{std::move(shoe), {}};

    Hand player;
    player.bet = rules_.initial_bet;
    std::string who = agent.name();
    for (int i = 0; i < 2; ++i) {
      deal(st, player.cards, who, true);
      deal(st, st.dealer, dealer_.name(), i < 1);
    }
    return play_and_settle(st, std::move(player), agent);
  }

  /**
   * Continue a partially played round from a newly shuffled shoe
   *
   * @param player_cards Cards already in the player's hand
   * @param dealer_visible Dealer cards already known (usually the up card)
   * @param bet Current bet of the hand
   * @param agent Player (not reset)
   * @param allow_split false when the hand is itself a split child
   * @return Round outcome
   * @throws RoundError if the shoe runs out or the agent stalls
   */
  RoundResult resume_round(std::span<const Card> player_cards,
                           std::span<const Card> dealer_visible, double bet,
                           Agent& agent, bool allow_split = true) {
    return resume_round(Shoe::shuffled(composition_, rng_), player_cards,
                        dealer_visible, bet, agent, allow_split);
  }

  /**
   * Continue a partially played round dealing from `shoe` in order
   *
   * The dealer hand is topped up to two cards before the player acts.
   */
  RoundResult resume_round(Shoe shoe, std::span<const Card> player_cards,
                           std::span<const Card> dealer_visible, double bet,
                           Agent& agent, bool allow_split = true) {
    RoundState st{std::move(shoe),
                  Cards(dealer_visible.begin(), dealer_visible.end())};
    while (st.dealer.size() < 2) {
      deal(st, st.dealer, dealer_.name(), true);
    }

    Hand player;
    player.cards.assign(player_cards.begin(), player_cards.end());
    player.bet = bet;
    player.from_split = !allow_split;
    return play_and_settle(st, std::move(player), agent);
  }

  /**
   * Actions the engine accepts for `hand`
   *
   * Hit and Stand always; DoubleDown on two cards; Split on two cards that
   * satisfy the split rule unless the hand is a split child.
   */
  std::vector<Action> legal_actions(const Hand& hand) const {
    std::vector<Action> actions = {Action::Hit, Action::Stand};
    if (hand.size() == 2) {
      actions.push_back(Action::DoubleDown);
      if (!hand.from_split &&
          can_split(hand.cards[0], hand.cards[1], rules_.split_rule)) {
        actions.push_back(Action::Split);
      }
    }
    return actions;
  }

  /**
   * Reward of one player hand against the dealer's final cards
   *
   * The win check runs before the push check, so a natural that ties the
   * dealer is paid the blackjack bonus.
   *
   * @return -bet, 0, bet or blackjack_payout * bet
   */
  double settle(const Hand& hand, std::span<const Card> dealer) const {
    double pscore = hand_value(hand.cards);
    if (pscore > 21.0) {
      return -hand.bet;
    }
    double dscore = hand_value(dealer);
    bool natural = is_natural(hand.cards);
    if (pscore > dscore || dscore > 21.0 || (pscore == dscore && natural)) {
      return natural ? rules_.blackjack_payout * hand.bet : hand.bet;
    }
    if (pscore == dscore) {
      return 0.0;
    }
    return -hand.bet;
  }

private:
  struct RoundState {
    Shoe shoe;
    Cards dealer;
  };

  RoundResult play_and_settle(RoundState& st, Hand player, Agent& agent) {
    RoundResult result;
    std::string who = agent.name();
    play_hand(st, agent, who, std::move(player), "", result.hands);

    if (observer_) observer_->on_dealer_reveal(st.dealer);

    std::vector<Hand> dealer_hands;
    Hand dealer_hand;
    dealer_hand.cards = st.dealer;
    dealer_hand.from_split = true;
    play_hand(st, dealer_, dealer_.name(), std::move(dealer_hand), "", dealer_hands);
    result.dealer = std::move(dealer_hands.front().cards);

    for (const auto& hand : result.hands) {
      double reward = settle(hand, result.dealer);
      if (observer_) observer_->on_settle(who, hand.cards, result.dealer, reward);
      result.rewards.push_back(reward);
      result.net += reward;
    }

    if (observer_) observer_->on_round_done(result.total_bet(), result.net);
    return result;
  }

  void play_hand(RoundState& st, Agent& agent, const std::string& who, Hand hand,
                 const std::string& label, std::vector<Hand>& out) {
    int violations = 0;
    while (hand_value(hand.cards) < 21.0) {
      std::vector<Action> legal = legal_actions(hand);
      Action act = agent.decide(hand.cards, legal, st.dealer.front());

      if (!contains(legal, act)) {
        BJSIM_LOG_DEBUG("[RoundEngine::play_hand] %s chose illegal %s, asking again",
                        who.c_str(), action_name(act));
        if (++violations >= rules_.max_protocol_violations) {
          throw ProtocolError("RoundEngine::play_hand - " + who + " returned " +
                              std::to_string(violations) +
                              " illegal actions in a row");
        }
        continue;
      }
      violations = 0;

      if (observer_) observer_->on_action(who, act);

      if (act == Action::Stand) {
        break;
      }
      if (act == Action::Hit) {
        deal(st, hand.cards, who, true);
        continue;
      }
      if (act == Action::DoubleDown) {
        deal(st, hand.cards, who, true);
        hand.bet *= 2.0;
        break;
      }

      // Split: one level only, children are played in order
      Hand first;
      first.cards = {hand.cards[0]};
      first.bet = hand.bet;
      first.from_split = true;
      Hand second;
      second.cards = {hand.cards[1]};
      second.bet = hand.bet;
      second.from_split = true;

      if (observer_) observer_->on_split(who, first.cards, second.cards);
      play_hand(st, agent, who, std::move(first), " (hand 1)", out);
      play_hand(st, agent, who, std::move(second), " (hand 2)", out);
      return;
    }

    if (observer_) observer_->on_hand_done(who, hand.cards, label);
    out.push_back(std::move(hand));
  }

  void deal(RoundState& st, Cards& to, const std::string& who, bool visible) {
    Card card = st.shoe.draw();
    if (observer_) observer_->on_deal(who, card, visible);
    to.push_back(std::move(card));
  }

  Cards composition_;
  Rules rules_;
  std::mt19937& rng_;
  RoundObserver* observer_;
  DealerAgent dealer_;
};

}  // namespace bjsim
