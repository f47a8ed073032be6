#include "bj/round_engine.h"
#include "bj/game_utils.hpp"          // Pour payout, result_to_string
#include "spdlog/spdlog.h"             // Logging
#include <iomanip>                      // Standard
#include <stdexcept>                    // Standard
#include <string>                       // Standard
#include <sstream>                      // Standard

namespace bj_sim {

namespace {

Deck make_deck(const GameConfig& config) {
    return config.seed ? Deck(config.num_packs, *config.seed) : Deck(config.num_packs);
}

std::string hand_line(const std::string& owner, const Hand& hand) {
    return owner + "'s hand: " + hand.toString() + " (Total: " + std::to_string(hand.total()) + ")\n";
}

std::string draw_line(const std::string& verb, const Hand& hand) {
    return verb + ": " + hand.back().name() + " (Total: " + std::to_string(hand.total()) + ")\n";
}

} // namespace

// -----------------------------------------------------------------------------
//  Constructeur
// -----------------------------------------------------------------------------
RoundEngine::RoundEngine(const Strategy& strategy, RoundLog& round_log, const GameConfig& config)
    : strategy_   (strategy),
      round_log_  (round_log),
      config_     (config),
      deck_       (make_deck(config)),
      stats_      (config.initial_bankroll, config.bet_amount),
      phase_      (RoundPhase::IDLE)
{
    if (config.bet_amount <= 0.0) throw std::invalid_argument("Bet amount must be > 0");
    if (config.initial_bankroll < 0.0) throw std::invalid_argument("Initial bankroll must be >= 0");
    if (config.reshuffle_threshold < 4) throw std::invalid_argument("Reshuffle threshold must leave room for a deal");

    deck_.shuffle();
    spdlog::debug("RoundEngine initialisé: {} jeux ({} cartes), mise {:.2f}, bankroll {:.2f}, stratégie {}",
                  config_.num_packs, deck_.size(), config_.bet_amount, config_.initial_bankroll, strategy_.get_name());
}

// -----------------------------------------------------------------------------
//  Sessions
// -----------------------------------------------------------------------------
BatchReport RoundEngine::play_n_rounds(int num_rounds) {
    BatchReport report;
    for (int i = 0; i < num_rounds; ++i) {
        if (!can_afford_round()) {
            spdlog::info("Insufficient bankroll to continue playing ({:.2f} < {:.2f}) after {} rounds.",
                         stats_.bankroll, config_.bet_amount, report.rounds_played);
            report.stopped_insufficient_funds = true;
            break;
        }
        play_round();
        report.rounds_played++;
    }
    return report;
}

void RoundEngine::reset_session() {
    stats_.reset();
    last_trace_.clear();
    last_phases_.clear();
    phase_ = RoundPhase::IDLE;
    spdlog::info("Session réinitialisée, bankroll {:.2f}", stats_.bankroll);
}

// -----------------------------------------------------------------------------
//  play_round — Dealing -> NaturalCheck -> PlayerFirstAction -> PlayerTurn
//               -> DealerTurn -> Resolve -> Done
// -----------------------------------------------------------------------------
GameResult RoundEngine::play_round() {
    last_phases_.clear();
    std::stringstream trace;
    trace << "*** Game " << (stats_.games_played + 1) << " ***\n";

    transition_to(RoundPhase::DEALING);
    ensure_shoe();
    deal_initial_cards();

    transition_to(RoundPhase::NATURAL_CHECK);
    std::optional<GameResult> result = check_naturals(trace);

    if (!result) {
        trace << hand_line("Player", player_hand_);
        trace << "Dealer shows: " << dealer_upcard().name() << "\n";
        transition_to(RoundPhase::PLAYER_FIRST_ACTION);
        result = play_first_action(trace);
    }
    if (!result) {
        transition_to(RoundPhase::PLAYER_TURN);
        result = play_player_turn(trace);
    }
    if (!result) {
        transition_to(RoundPhase::DEALER_TURN);
        result = play_dealer_turn(trace);
    }
    if (!result) {
        transition_to(RoundPhase::RESOLVE);
        result = resolve(trace);
    }

    transition_to(RoundPhase::DONE);
    return finish_round(*result, trace);
}

void RoundEngine::transition_to(RoundPhase phase) {
    spdlog::trace("RoundEngine: {} -> {}", phase_to_string(phase_), phase_to_string(phase));
    phase_ = phase;
    last_phases_.push_back(phase);
}

// Seul déclencheur de remélange, vérifié une fois par main
void RoundEngine::ensure_shoe() {
    if (deck_.size() < static_cast<std::size_t>(config_.reshuffle_threshold)) {
        spdlog::debug("Sabot à {} cartes (< {}), nouveau sabot de {} jeux.",
                      deck_.size(), config_.reshuffle_threshold, config_.num_packs);
        deck_.reset();
    }
}

void RoundEngine::deal_initial_cards() {
    player_hand_ = Hand();
    dealer_hand_ = Hand();
    draw_to(player_hand_);
    draw_to(dealer_hand_);
    draw_to(player_hand_);
    draw_to(dealer_hand_);
    spdlog::trace("Distribution: joueur [{}], croupier [{}]", player_hand_.toString(), dealer_hand_.toString());
}

void RoundEngine::draw_to(Hand& hand) {
    hand.add_card(deck_.deal_card());
}

// -----------------------------------------------------------------------------
//  NaturalCheck
// -----------------------------------------------------------------------------
std::optional<GameResult> RoundEngine::check_naturals(std::stringstream& trace) const {
    const bool player_natural = player_hand_.is_blackjack();
    const bool dealer_natural = dealer_hand_.is_blackjack();

    if (player_natural && dealer_natural) {
        trace << hand_line("Player", player_hand_) << hand_line("Dealer", dealer_hand_);
        trace << "Both have Blackjack! Push!\n";
        return GameResult::PUSH;
    }
    if (dealer_natural) {
        trace << hand_line("Player", player_hand_) << hand_line("Dealer", dealer_hand_);
        trace << "Blackjack! Dealer wins!\n";
        return GameResult::DEALER_WIN;
    }
    if (player_natural) {
        trace << hand_line("Player", player_hand_);
        trace << "Dealer shows: " << dealer_upcard().name() << "\n";
        trace << "Blackjack! Player wins!\n";
        return GameResult::PLAYER_BLACKJACK;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
//  PlayerFirstAction
// -----------------------------------------------------------------------------
std::optional<GameResult> RoundEngine::play_first_action(std::stringstream& trace) {
    const Action action = strategy_.first_action(player_hand_, dealer_upcard());
    player_hand_.mark_first_action_done();

    switch (action) {
        case Action::DOUBLE_DOWN: {
            draw_to(player_hand_);
            player_hand_.mark_doubled();
            player_hand_.deactivate();
            trace << draw_line("Player doubles down", player_hand_);
            if (player_hand_.is_busted()) {
                trace << "Player busts on a doubled bet!\n";
                return GameResult::DOUBLED_LOSE;
            }
            break;
        }
        case Action::SURRENDER:
            trace << "Player surrenders.\n";
            return GameResult::SURRENDER;
        case Action::SPLIT:
            // Le split n'est pas joué: la main reste unique et se comporte comme un STAND
            spdlog::warn("Split recommandé pour [{}] contre {}: non supporté, le joueur reste.",
                         player_hand_.toString(), dealer_upcard().name());
            trace << "Player would split, splitting is not supported: player stands.\n";
            player_hand_.deactivate();
            break;
        case Action::HIT:
        case Action::STAND:
        default:
            break;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
//  PlayerTurn
// -----------------------------------------------------------------------------
std::optional<GameResult> RoundEngine::play_player_turn(std::stringstream& trace) {
    while (player_hand_.is_active()) {
        const Action action = strategy_.subsequent_action(player_hand_, dealer_upcard());
        if (action != Action::HIT) {
            // STAND, ou toute autre action traitée comme STAND
            player_hand_.deactivate();
            trace << "Player stands.\n";
            break;
        }
        draw_to(player_hand_);
        trace << draw_line("Player hits", player_hand_);
        if (player_hand_.is_busted()) {
            trace << "Player busts!\n";
            return GameResult::DEALER_WIN;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
//  DealerTurn — tire sous 17, sans distinction soft/hard
// -----------------------------------------------------------------------------
std::optional<GameResult> RoundEngine::play_dealer_turn(std::stringstream& trace) {
    trace << hand_line("Dealer", dealer_hand_);
    while (dealer_hand_.total() < 17) {
        draw_to(dealer_hand_);
        trace << draw_line("Dealer hits", dealer_hand_);
        if (dealer_hand_.is_busted()) {
            trace << "Dealer busts!\n";
            return GameResult::PLAYER_WIN;
        }
    }
    trace << "Dealer stands.\n";
    return std::nullopt;
}

// -----------------------------------------------------------------------------
//  Resolve
// -----------------------------------------------------------------------------
GameResult RoundEngine::resolve(std::stringstream& trace) const {
    const int player_total = player_hand_.total();
    const int dealer_total = dealer_hand_.total();
    const bool doubled = player_hand_.is_doubled();

    trace << hand_line("Player", player_hand_) << hand_line("Dealer", dealer_hand_);
    if (player_total > dealer_total) {
        trace << "Player wins!\n";
        return doubled ? GameResult::DOUBLED_WIN : GameResult::PLAYER_WIN;
    }
    if (player_total < dealer_total) {
        trace << "Dealer wins!\n";
        return doubled ? GameResult::DOUBLED_LOSE : GameResult::DEALER_WIN;
    }
    trace << "Push!\n";
    return GameResult::PUSH;
}

// -----------------------------------------------------------------------------
//  Done — stats et paiement d'abord, puis journal
// -----------------------------------------------------------------------------
GameResult RoundEngine::finish_round(GameResult result, std::stringstream& trace) {
    const double delta = payout(result, config_.bet_amount);
    stats_.record(result, delta);

    trace << std::fixed << std::setprecision(2)
          << "Payout: " << (delta >= 0.0 ? "+" : "") << delta
          << " | Bankroll: " << stats_.bankroll << "\n";
    last_trace_ = trace.str();

    spdlog::debug("Game {}: {} ({:+.2f}), bankroll {:.2f}",
                  stats_.games_played, result_to_string(result), delta, stats_.bankroll);

    round_log_.append(last_trace_);
    return result;
}

} // namespace bj_sim
