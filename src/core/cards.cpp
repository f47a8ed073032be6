#include "core/cards.hpp"
#include <stdexcept>
#include <cctype>
#include <map> // Pour la conversion texte -> Rank/Suit

namespace bj_sim {

// Helper maps pour la conversion texte <-> Rank/Suit
const std::map<std::string, Rank> TEXT_TO_RANK = {
    {"A", Rank::ACE}, {"2", Rank::TWO}, {"3", Rank::THREE}, {"4", Rank::FOUR},
    {"5", Rank::FIVE}, {"6", Rank::SIX}, {"7", Rank::SEVEN}, {"8", Rank::EIGHT},
    {"9", Rank::NINE}, {"T", Rank::TEN}, {"10", Rank::TEN}, {"J", Rank::JACK},
    {"Q", Rank::QUEEN}, {"K", Rank::KING}
};
const std::map<char, Suit> CHAR_TO_SUIT = {
    {'h', Suit::HEARTS}, {'d', Suit::DIAMONDS}, {'c', Suit::CLUBS}, {'s', Suit::SPADES}
};
const std::map<Rank, std::string> RANK_TO_TEXT = {
    {Rank::ACE, "A"}, {Rank::TWO, "2"}, {Rank::THREE, "3"}, {Rank::FOUR, "4"},
    {Rank::FIVE, "5"}, {Rank::SIX, "6"}, {Rank::SEVEN, "7"}, {Rank::EIGHT, "8"},
    {Rank::NINE, "9"}, {Rank::TEN, "10"}, {Rank::JACK, "J"}, {Rank::QUEEN, "Q"},
    {Rank::KING, "K"}
};
const std::map<Suit, std::string> SUIT_TO_SYMBOL = {
    {Suit::HEARTS, "♥"}, {Suit::DIAMONDS, "♦"}, {Suit::CLUBS, "♣"}, {Suit::SPADES, "♠"}
};


// --- Implémentations des fonctions de conversion ---

Card make_card(int rank, Suit s) {
    if (rank < 1 || rank > NUM_RANKS) {
        throw std::invalid_argument("Invalid card rank: " + std::to_string(rank));
    }
    return Card{static_cast<Rank>(rank), s};
}

Rank rank_from_string(const std::string& r) {
    std::string upper = r;
    for (char& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto it = TEXT_TO_RANK.find(upper);
    if (it == TEXT_TO_RANK.end()) {
        throw std::invalid_argument("Invalid rank: " + r);
    }
    return it->second;
}

Suit suit_from_char(char s) {
    auto it = CHAR_TO_SUIT.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (it == CHAR_TO_SUIT.end()) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return it->second;
}

std::string to_string(Rank r) {
    auto it = RANK_TO_TEXT.find(r);
    if (it == RANK_TO_TEXT.end()) {
        return "?";
    }
    return it->second;
}

std::string to_string(Suit s) {
    auto it = SUIT_TO_SYMBOL.find(s);
    if (it == SUIT_TO_SYMBOL.end()) {
        return "?";
    }
    return it->second;
}

std::string to_string(const Card& c) {
    return to_string(c.rank) + to_string(c.suit);
}

std::string Card::name() const {
    return to_string(*this);
}

Card card_from_string(const std::string& s) {
    if (s.length() < 2 || s.length() > 3) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        Rank r = rank_from_string(s.substr(0, s.length() - 1));
        Suit su = suit_from_char(s.back());
        return make_card(r, su);
    } catch (const std::invalid_argument& e) {
        // Propage l'erreur avec plus de contexte
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

} // namespace bj_sim
