#ifndef BJ_HAND_H
#define BJ_HAND_H

#include "core/cards.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace bj_sim {

// Main d'un participant pour une seule manche.
// Le total n'est jamais mis en cache: il est recalculé à chaque appel.
class Hand {
public:
    Hand() = default;
    Hand(std::initializer_list<Card> cards); // Pratique pour les tests

    void add_card(Card card);

    const std::vector<Card>& get_cards() const { return cards_; }
    std::size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }
    const Card& front() const;
    const Card& back() const;

    // Total avec réduction des As de 11 à 1 tant que > 21
    int total() const;
    bool is_busted() const;
    bool is_blackjack() const;
    // Au moins un As compte encore 11 sans dépasser 21
    bool is_soft() const;
    // Deux cartes de même rang
    bool is_pair() const;

    // Flags d'état de jeu
    bool is_doubled() const { return doubled_; }
    bool is_split() const { return split_; }
    bool is_first_action_pending() const { return first_action_pending_; }
    bool is_active() const { return active_; }
    void mark_doubled() { doubled_ = true; }
    void mark_first_action_done() { first_action_pending_ = false; }
    void deactivate() { active_ = false; }

    // "A♠, K♥"
    std::string toString() const;

private:
    struct Tally {
        int total;
        int soft_aces; // As encore comptés à 11
    };
    Tally tally() const;

    std::vector<Card> cards_;
    bool doubled_ = false;
    bool split_ = false; // Réservé, le split n'est pas joué
    bool first_action_pending_ = true;
    bool active_ = true;
};

} // namespace bj_sim

#endif // BJ_HAND_H
