#ifndef BJ_ROUND_ENGINE_H
#define BJ_ROUND_ENGINE_H

#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "core/cards.hpp"
#include "core/deck.hpp"
#include "bj/common_types.h"
#include "bj/game_config.h"
#include "bj/hand.h"
#include "bj/round_log.h"
#include "bj/session_stats.h"
#include "bj/strategy.h"

namespace bj_sim {

// Résultat d'une série de mains
struct BatchReport {
    int  rounds_played = 0;
    bool stopped_insufficient_funds = false;
};

// Joue une main complète: distribution, blackjacks naturels, tour du joueur
// piloté par la Strategy, tour fixe du croupier, résolution et paiement.
// Possède le sabot et les statistiques de la session.
class RoundEngine {
public:
    RoundEngine(const Strategy& strategy, RoundLog& round_log, const GameConfig& config = GameConfig{});

    // Lance LogWriteError si le journal ne peut pas être écrit; stats et bankroll
    // sont déjà mises à jour à ce moment-là.
    GameResult play_round();

    // S'arrête avant une main dès que bankroll < mise
    BatchReport play_n_rounds(int num_rounds);

    // Ne touche pas au sabot
    void reset_session();

    // Getters
    const SessionStats& get_stats() const { return stats_; }
    std::optional<GameResult> get_last_result() const { return stats_.last_result; }
    double get_bankroll() const { return stats_.bankroll; }
    const GameConfig& get_config() const { return config_; }
    const Strategy& get_strategy() const { return strategy_; }
    RoundPhase get_phase() const { return phase_; }
    bool can_afford_round() const { return stats_.can_afford_bet(); }

    // Dernière main jouée
    const std::string& get_last_trace() const { return last_trace_; }
    const std::vector<RoundPhase>& get_last_phases() const { return last_phases_; }
    const Hand& get_last_player_hand() const { return player_hand_; }
    const Hand& get_last_dealer_hand() const { return dealer_hand_; }

    Deck& get_deck() { return deck_; }
    const Deck& get_deck() const { return deck_; }

private:
    const Strategy& strategy_;
    RoundLog&       round_log_;
    GameConfig      config_;
    Deck            deck_;
    SessionStats    stats_;
    RoundPhase      phase_;

    Hand                    player_hand_;
    Hand                    dealer_hand_;
    std::string             last_trace_;
    std::vector<RoundPhase> last_phases_;

    // Étapes de la machine à états; std::nullopt = la main continue
    void transition_to(RoundPhase phase);
    void ensure_shoe();
    void deal_initial_cards();
    std::optional<GameResult> check_naturals(std::stringstream& trace) const;
    std::optional<GameResult> play_first_action(std::stringstream& trace);
    std::optional<GameResult> play_player_turn(std::stringstream& trace);
    std::optional<GameResult> play_dealer_turn(std::stringstream& trace);
    GameResult resolve(std::stringstream& trace) const;
    GameResult finish_round(GameResult result, std::stringstream& trace);

    void draw_to(Hand& hand);
    const Card& dealer_upcard() const { return dealer_hand_.front(); }
};

} // namespace bj_sim

#endif // BJ_ROUND_ENGINE_H
