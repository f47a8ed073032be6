#include "bj/game_utils.hpp"
#include "core/cards.hpp" // Pour to_string(Card)
#include <sstream>

namespace bj_sim {

double payout(GameResult result, double bet) {
    switch (result) {
        case GameResult::PLAYER_WIN:       return bet;
        case GameResult::DEALER_WIN:       return -bet;
        case GameResult::PUSH:             return 0.0;
        case GameResult::PLAYER_BLACKJACK: return bet * 1.5;
        case GameResult::SURRENDER:        return -bet * 0.5;
        case GameResult::DOUBLED_WIN:      return bet * 2.0;
        case GameResult::DOUBLED_LOSE:     return -bet * 2.0;
        default:                           return 0.0;
    }
}

bool is_win(GameResult result) {
    return result == GameResult::PLAYER_WIN ||
           result == GameResult::PLAYER_BLACKJACK ||
           result == GameResult::DOUBLED_WIN;
}

bool is_loss(GameResult result) {
    return result == GameResult::DEALER_WIN ||
           result == GameResult::SURRENDER ||
           result == GameResult::DOUBLED_LOSE;
}

std::string action_to_string(Action action) {
    switch (action) {
        case Action::HIT:         return "HIT";
        case Action::STAND:       return "STAND";
        case Action::DOUBLE_DOWN: return "DOUBLE_DOWN";
        case Action::SPLIT:       return "SPLIT";
        case Action::SURRENDER:   return "SURRENDER";
        default:                  return "UNKNOWN_ACTION";
    }
}

std::string result_to_string(GameResult result) {
    switch (result) {
        case GameResult::PLAYER_WIN:       return "PLAYER_WIN";
        case GameResult::DEALER_WIN:       return "DEALER_WIN";
        case GameResult::PUSH:             return "PUSH";
        case GameResult::PLAYER_BLACKJACK: return "PLAYER_BLACKJACK";
        case GameResult::SURRENDER:        return "SURRENDER";
        case GameResult::DOUBLED_WIN:      return "DOUBLED_WIN";
        case GameResult::DOUBLED_LOSE:     return "DOUBLED_LOSE";
        default:                           return "UNKNOWN_RESULT";
    }
}

std::string result_message(GameResult result) {
    switch (result) {
        case GameResult::PLAYER_WIN:       return "Player Wins!";
        case GameResult::DEALER_WIN:       return "Dealer Wins!";
        case GameResult::PUSH:             return "Push!";
        case GameResult::PLAYER_BLACKJACK: return "Player Wins with Blackjack!";
        case GameResult::SURRENDER:        return "Player Surrendered.";
        case GameResult::DOUBLED_WIN:      return "Player Wins a Doubled Bet!";
        case GameResult::DOUBLED_LOSE:     return "Dealer Wins a Doubled Bet!";
        default:                           return "???";
    }
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << to_string(cards[i]);
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

} // namespace bj_sim
