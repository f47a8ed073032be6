#include "core/deck.hpp"
#include <stdexcept>
#include <random>
#include <string>
#include <utility> // Pour std::swap

namespace bj_sim {

Deck::Deck(int num_packs)
    : num_packs_(num_packs)
{
    if (num_packs <= 0) {
        throw std::invalid_argument("Deck must contain at least one pack, got " + std::to_string(num_packs));
    }
    std::random_device rd;
    rng_.seed(rd());
    initialize();
}

Deck::Deck(int num_packs, std::uint32_t seed)
    : num_packs_(num_packs),
      rng_(seed)
{
    if (num_packs <= 0) {
        throw std::invalid_argument("Deck must contain at least one pack, got " + std::to_string(num_packs));
    }
    initialize();
}

void Deck::initialize() {
    cards_.clear();
    cards_.reserve(static_cast<std::size_t>(num_packs_) * CARDS_PER_PACK);
    for (int p = 0; p < num_packs_; ++p) {
        for (int s = 0; s < NUM_SUITS; ++s) {
            for (int r = 1; r <= NUM_RANKS; ++r) {
                cards_.push_back(make_card(static_cast<Rank>(r), static_cast<Suit>(s)));
            }
        }
    }
}

void Deck::reset() {
    initialize();
    shuffle();
}

Card Deck::deal_card() {
    if (cards_.empty()) {
        throw EmptyDeckError("Deck is empty, cannot deal card.");
    }
    Card card = cards_.back();
    cards_.pop_back();
    return card;
}

// Fisher-Yates du dernier indice jusqu'à 1, j uniforme dans [0, i]
void Deck::shuffle() {
    if (cards_.size() < 2) return;
    for (std::size_t i = cards_.size() - 1; i > 0; --i) {
        std::uniform_int_distribution<std::size_t> dist(0, i);
        std::swap(cards_[i], cards_[dist(rng_)]);
    }
}

void Deck::set_cards_for_testing(const std::vector<Card>& specific_deck) {
    cards_ = specific_deck;
}

} // namespace bj_sim
