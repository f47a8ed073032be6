#include "bj/hand.h"
#include <stdexcept>
#include <sstream>

namespace bj_sim {

Hand::Hand(std::initializer_list<Card> cards)
    : cards_(cards) {}

void Hand::add_card(Card card) {
    cards_.push_back(card);
}

const Card& Hand::front() const {
    if (cards_.empty()) throw std::out_of_range("Hand is empty");
    return cards_.front();
}

const Card& Hand::back() const {
    if (cards_.empty()) throw std::out_of_range("Hand is empty");
    return cards_.back();
}

// Calcul partagé par total() et is_soft()
Hand::Tally Hand::tally() const {
    int sum = 0;
    int aces = 0;
    for (const Card& card : cards_) {
        sum += card.value();
        if (card.is_ace()) aces++;
    }
    while (sum > 21 && aces > 0) {
        sum -= 10;
        aces--;
    }
    return {sum, aces};
}

int Hand::total() const {
    return tally().total;
}

bool Hand::is_busted() const {
    return total() > 21;
}

bool Hand::is_blackjack() const {
    return cards_.size() == 2 && total() == 21;
}

bool Hand::is_soft() const {
    const Tally t = tally();
    return t.soft_aces > 0 && t.total <= 21;
}

bool Hand::is_pair() const {
    return cards_.size() == 2 && cards_[0].rank == cards_[1].rank;
}

std::string Hand::toString() const {
    std::stringstream ss;
    for (size_t i = 0; i < cards_.size(); ++i) {
        ss << cards_[i].name();
        if (i < cards_.size() - 1) {
            ss << ", ";
        }
    }
    return ss.str();
}

} // namespace bj_sim
