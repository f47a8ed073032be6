#ifndef BJ_CORE_DECK_HPP
#define BJ_CORE_DECK_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <vector>
#include <random>
#include <stdexcept> // Pour std::runtime_error

namespace bj_sim {

// Tirage dans un sabot vide: invariant violé, jamais attendu en jeu normal
class EmptyDeckError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Sabot de num_packs jeux de 52 cartes. On distribue depuis la fin.
class Deck {
public:
    static constexpr int CARDS_PER_PACK = NUM_SUITS * NUM_RANKS;

    explicit Deck(int num_packs);
    Deck(int num_packs, std::uint32_t seed); // Générateur déterministe pour les tests
    ~Deck() = default;

    Card deal_card();
    void shuffle();
    void reset(); // Reconstruit le sabot complet puis mélange

    std::size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }
    int get_num_packs() const { return num_packs_; }
    const std::vector<Card>& get_cards() const { return cards_; }

    // Remplace le contenu; la dernière carte du vecteur sort en premier
    void set_cards_for_testing(const std::vector<Card>& specific_deck);

private:
    // Ordre déterministe: couleur par couleur, rangs croissants
    void initialize();

    int               num_packs_;
    std::vector<Card> cards_;
    std::mt19937      rng_;
};

} // namespace bj_sim

#endif // BJ_CORE_DECK_HPP
