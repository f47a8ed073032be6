#ifndef BJ_CARDS_HPP
#define BJ_CARDS_HPP

#include <cstdint>
#include <string>
#include <stdexcept> // Pour std::invalid_argument

namespace bj_sim {

// Enum pour les couleurs (suits), l'ordre est celui de construction du sabot
enum class Suit : uint8_t { HEARTS = 0, DIAMONDS = 1, CLUBS = 2, SPADES = 3 };

// Enum pour les rangs (ranks), 1 = As ... 13 = Roi
enum class Rank : uint8_t {
    ACE = 1, TWO = 2, THREE = 3, FOUR = 4, FIVE = 5, SIX = 6, SEVEN = 7,
    EIGHT = 8, NINE = 9, TEN = 10, JACK = 11, QUEEN = 12, KING = 13
};

constexpr int NUM_SUITS = 4;
constexpr int NUM_RANKS = 13;

// Carte immuable (rang + couleur)
struct Card {
    Rank rank = Rank::ACE;
    Suit suit = Suit::HEARTS;

    // Valeur blackjack: As = 11, figures = 10, sinon le rang
    constexpr int value() const {
        return rank == Rank::ACE ? 11
             : (static_cast<int>(rank) >= 10 ? 10 : static_cast<int>(rank));
    }

    constexpr bool is_ace() const { return rank == Rank::ACE; }

    // Nom affichable, ex: "A♠", "10♥", "K♦"
    std::string name() const;

    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

// Fonctions pour créer une carte
constexpr Card make_card(Rank r, Suit s) {
    return Card{r, s};
}

// Lance std::invalid_argument si rank hors de [1,13]
Card make_card(int rank, Suit s);

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(const Card& c);

// Format court: "As", "Td", "10h", "Kc"
Card card_from_string(const std::string& s);
Rank rank_from_string(const std::string& r);
Suit suit_from_char(char s);

} // namespace bj_sim

#endif // BJ_CARDS_HPP
