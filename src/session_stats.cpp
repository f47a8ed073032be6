#include "bj/session_stats.h"
#include "bj/game_utils.hpp" // Pour is_win / is_loss
#include <iomanip>
#include <sstream>

namespace bj_sim {

SessionStats::SessionStats(double initial_bankroll, double bet_amount)
    : bankroll(initial_bankroll),
      bet_amount(bet_amount),
      initial_bankroll(initial_bankroll) {}

void SessionStats::record(GameResult result, double bankroll_delta) {
    games_played++;
    if (is_win(result)) {
        wins++;
    } else if (is_loss(result)) {
        losses++;
    } else {
        pushes++;
    }
    bankroll += bankroll_delta;
    last_result = result;
}

void SessionStats::reset() {
    games_played = 0;
    wins = 0;
    losses = 0;
    pushes = 0;
    bankroll = initial_bankroll;
    last_result.reset();
}

std::string SessionStats::toString() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "Last Game Result: " << (last_result ? result_message(*last_result) : "No games played yet.") << "\n"
       << "Bankroll: $" << bankroll << "\n"
       << "Games Played: " << games_played << "\n"
       << "Wins: " << wins << "\n"
       << "Losses: " << losses << "\n"
       << "Pushes: " << pushes;
    return ss.str();
}

} // namespace bj_sim
