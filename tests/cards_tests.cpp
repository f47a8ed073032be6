#include <catch2/catch.hpp>
#include <stdexcept>
#include "core/cards.hpp"
#include <string>

using namespace bj_sim;

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card as = make_card(Rank::ACE, Suit::SPADES);
    Card kh = make_card(Rank::KING, Suit::HEARTS);
    Card td = make_card(Rank::TEN, Suit::DIAMONDS);
    Card _7c = make_card(7, Suit::CLUBS);

    SECTION("Blackjack values") {
        REQUIRE(as.value() == 11);
        REQUIRE(kh.value() == 10);
        REQUIRE(make_card(Rank::QUEEN, Suit::CLUBS).value() == 10);
        REQUIRE(make_card(Rank::JACK, Suit::CLUBS).value() == 10);
        REQUIRE(td.value() == 10);
        REQUIRE(_7c.value() == 7);
        REQUIRE(make_card(Rank::TWO, Suit::HEARTS).value() == 2);
    }

    SECTION("Display names") {
        REQUIRE(as.name() == "A♠");
        REQUIRE(kh.name() == "K♥");
        REQUIRE(td.name() == "10♦");
        REQUIRE(_7c.name() == "7♣");
    }

    SECTION("Integer rank must be in [1,13]") {
        REQUIRE(make_card(1, Suit::HEARTS) == make_card(Rank::ACE, Suit::HEARTS));
        REQUIRE(make_card(13, Suit::HEARTS) == make_card(Rank::KING, Suit::HEARTS));
        REQUIRE_THROWS_AS(make_card(0, Suit::HEARTS), std::invalid_argument);
        REQUIRE_THROWS_AS(make_card(14, Suit::HEARTS), std::invalid_argument);
    }
}

TEST_CASE("Card String Conversions", "[cards][string]") {
    SECTION("card_from_string conversions") {
        REQUIRE(card_from_string("As") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("Td") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("10d") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("kh") == make_card(Rank::KING, Suit::HEARTS));
        REQUIRE(card_from_string("2c") == make_card(Rank::TWO, Suit::CLUBS));
    }

    SECTION("card_from_string invalid inputs") {
        REQUIRE_THROWS_AS(card_from_string("XX"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("A"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("1c"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("11c"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("Asx"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string(""), std::invalid_argument);
    }

    SECTION("to_string round trip on the whole pack") {
        for (int s = 0; s < NUM_SUITS; ++s) {
            for (int r = 1; r <= NUM_RANKS; ++r) {
                Card c = make_card(r, static_cast<Suit>(s));
                REQUIRE(to_string(c) == c.name());
            }
        }
    }
}
