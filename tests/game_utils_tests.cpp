#include <catch2/catch.hpp>
#include "bj/game_utils.hpp"
#include "bj/session_stats.h"
#include "core/cards.hpp"

#include <vector>

using namespace bj_sim;

namespace {
const std::vector<GameResult> ALL_RESULTS = {
    GameResult::PLAYER_WIN, GameResult::DEALER_WIN, GameResult::PUSH,
    GameResult::PLAYER_BLACKJACK, GameResult::SURRENDER,
    GameResult::DOUBLED_WIN, GameResult::DOUBLED_LOSE
};
} // namespace

TEST_CASE("Payout table", "[payout]") {
    REQUIRE(payout(GameResult::PLAYER_BLACKJACK, 10.0) == Catch::Detail::Approx(15.0));
    REQUIRE(payout(GameResult::SURRENDER, 10.0) == Catch::Detail::Approx(-5.0));
    REQUIRE(payout(GameResult::DOUBLED_LOSE, 10.0) == Catch::Detail::Approx(-20.0));
    REQUIRE(payout(GameResult::PUSH, 10.0) == 0.0);
    REQUIRE(payout(GameResult::PLAYER_WIN, 10.0) == Catch::Detail::Approx(10.0));
    REQUIRE(payout(GameResult::DEALER_WIN, 10.0) == Catch::Detail::Approx(-10.0));
    REQUIRE(payout(GameResult::DOUBLED_WIN, 10.0) == Catch::Detail::Approx(20.0));

    // Proportionnel à la mise
    REQUIRE(payout(GameResult::PLAYER_BLACKJACK, 25.0) == Catch::Detail::Approx(37.5));
    REQUIRE(payout(GameResult::SURRENDER, 3.0) == Catch::Detail::Approx(-1.5));
}

TEST_CASE("Results split into wins, losses and pushes", "[payout][stats]") {
    for (GameResult r : ALL_RESULTS) {
        const int categories = (is_win(r) ? 1 : 0) + (is_loss(r) ? 1 : 0) + (r == GameResult::PUSH ? 1 : 0);
        REQUIRE(categories == 1);
        // Le signe du paiement suit la catégorie
        if (is_win(r)) REQUIRE(payout(r, 10.0) > 0.0);
        if (is_loss(r)) REQUIRE(payout(r, 10.0) < 0.0);
    }
}

TEST_CASE("Text helpers", "[utils]") {
    REQUIRE(action_to_string(Action::DOUBLE_DOWN) == "DOUBLE_DOWN");
    REQUIRE(action_to_string(Action::SURRENDER) == "SURRENDER");
    REQUIRE(result_to_string(GameResult::PLAYER_BLACKJACK) == "PLAYER_BLACKJACK");
    REQUIRE(result_message(GameResult::PLAYER_BLACKJACK) == "Player Wins with Blackjack!");
    REQUIRE(result_message(GameResult::PUSH) == "Push!");
    REQUIRE(vec_to_string({card_from_string("As"), card_from_string("10h")}) == "[A♠ 10♥]");
    REQUIRE(vec_to_string({}) == "[]");
    REQUIRE(std::string(phase_to_string(RoundPhase::DEALER_TURN)) == "DealerTurn");
}

TEST_CASE("SessionStats bookkeeping", "[stats]") {
    SessionStats stats(1000.0, 10.0);
    REQUIRE(stats.bankroll == 1000.0);
    REQUIRE_FALSE(stats.last_result.has_value());
    REQUIRE(stats.toString().find("No games played yet.") != std::string::npos);

    stats.record(GameResult::PLAYER_BLACKJACK, 15.0);
    stats.record(GameResult::SURRENDER, -5.0);
    stats.record(GameResult::PUSH, 0.0);
    stats.record(GameResult::DOUBLED_LOSE, -20.0);

    REQUIRE(stats.games_played == 4);
    REQUIRE(stats.wins == 1);
    REQUIRE(stats.losses == 2);
    REQUIRE(stats.pushes == 1);
    REQUIRE(stats.bankroll == Catch::Detail::Approx(990.0));
    REQUIRE(stats.last_result == GameResult::DOUBLED_LOSE);
    REQUIRE(stats.toString().find("Bankroll: $990.00") != std::string::npos);

    SECTION("reset restores the initial state") {
        stats.reset();
        REQUIRE(stats.games_played == 0);
        REQUIRE(stats.wins == 0);
        REQUIRE(stats.losses == 0);
        REQUIRE(stats.pushes == 0);
        REQUIRE(stats.bankroll == 1000.0);
        REQUIRE(stats.bet_amount == 10.0);
        REQUIRE_FALSE(stats.last_result.has_value());
    }

    SECTION("can_afford_bet") {
        SessionStats poor(9.99, 10.0);
        REQUIRE_FALSE(poor.can_afford_bet());
        SessionStats exact(10.0, 10.0);
        REQUIRE(exact.can_afford_bet());
    }
}
