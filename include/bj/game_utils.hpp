#ifndef BJ_GAME_UTILS_HPP
#define BJ_GAME_UTILS_HPP

#include "bj/common_types.h"
#include "core/cards.hpp"
#include <string>
#include <vector>

namespace bj_sim {

// Variation de bankroll pour une issue et une mise données.
// PLAYER_WIN +bet, DEALER_WIN -bet, PUSH 0, PLAYER_BLACKJACK +1.5 bet,
// SURRENDER -0.5 bet, DOUBLED_WIN +2 bet, DOUBLED_LOSE -2 bet.
double payout(GameResult result, double bet);

// Issues comptées comme gains / pertes dans les statistiques
bool is_win(GameResult result);
bool is_loss(GameResult result);

std::string action_to_string(Action action);
std::string result_to_string(GameResult result);

// Libellé affichable, ex: "Player Wins with Blackjack!"
std::string result_message(GameResult result);

std::string vec_to_string(const std::vector<Card>& cards);

} // namespace bj_sim

#endif // BJ_GAME_UTILS_HPP
