#ifndef BJ_SESSION_STATS_H
#define BJ_SESSION_STATS_H

#include "bj/common_types.h"
#include <optional>
#include <string>

namespace bj_sim {

// Compteurs de la session, modifiés une seule fois par main terminée.
class SessionStats {
public:
    int games_played = 0;
    int wins = 0;
    int losses = 0;
    int pushes = 0;

    double bankroll = 0.0;
    double bet_amount = 0.0;
    double initial_bankroll = 0.0;

    std::optional<GameResult> last_result;

public:
    SessionStats() = default;
    SessionStats(double initial_bankroll, double bet_amount);

    // Enregistre une main terminée: games_played +1, exactement un compteur
    // parmi wins/losses/pushes +1, bankroll += bankroll_delta.
    void record(GameResult result, double bankroll_delta);

    // Compteurs à zéro, bankroll initiale restaurée, dernière issue effacée
    void reset();

    bool can_afford_bet() const { return bankroll >= bet_amount; }

    std::string toString() const;
};

} // namespace bj_sim

#endif // BJ_SESSION_STATS_H
