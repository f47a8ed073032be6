#include "bj/strategy.h"
#include "bj/game_utils.hpp" // Pour action_to_string
#include "spdlog/spdlog.h"

namespace bj_sim {

namespace {

bool in_range(int value, int low, int high) {
    return value >= low && value <= high;
}

} // namespace

// -----------------------------------------------------------------------------
//  BasicStrategy — première décision
// -----------------------------------------------------------------------------
Action BasicStrategy::first_action(const Hand& hand, const Card& dealer_upcard) const {
    const int dealer = dealer_upcard.value();

    // Ordre de priorité: mains soft, paires, mains dures, puis STAND
    std::optional<Action> action = soft_first_action(hand, dealer);
    if (!action) action = pair_first_action(hand, dealer);
    if (!action) action = hard_first_action(hand, dealer);
    const Action chosen = action.value_or(Action::STAND);

    spdlog::trace("BasicStrategy::first_action: [{}] total {} vs {} -> {}",
                  hand.toString(), hand.total(), dealer, action_to_string(chosen));
    return chosen;
}

std::optional<Action> BasicStrategy::soft_first_action(const Hand& hand, int dealer) {
    if (!hand.is_soft()) return std::nullopt;

    if (hand.is_pair() && hand.front().is_ace()) return Action::SPLIT;

    switch (hand.total()) {
        case 19:
            if (dealer == 6) return Action::DOUBLE_DOWN;
            break;
        case 18:
            if (dealer <= 6) return Action::DOUBLE_DOWN;
            break;
        case 17:
            if (in_range(dealer, 3, 6)) return Action::DOUBLE_DOWN;
            break;
        case 16:
        case 15:
            if (in_range(dealer, 4, 6)) return Action::DOUBLE_DOWN;
            break;
        case 14:
        case 13:
            if (in_range(dealer, 5, 6)) return Action::DOUBLE_DOWN;
            break;
        default:
            break;
    }
    return std::nullopt;
}

std::optional<Action> BasicStrategy::pair_first_action(const Hand& hand, int dealer) {
    if (!hand.is_pair()) return std::nullopt;

    switch (hand.total()) {
        case 18: // 9-9
            if (dealer < 7 || dealer >= 10) return Action::SPLIT;
            break;
        case 16: // 8-8
            return Action::SPLIT;
        case 14: // 7-7
            if (dealer <= 7) return Action::SPLIT;
            break;
        case 12: // 6-6 (A-A est déjà traité en soft)
            if (in_range(dealer, 3, 7)) return Action::SPLIT;
            break;
        case 6:
        case 4:
            if (in_range(dealer, 4, 7)) return Action::SPLIT;
            break;
        default:
            break;
    }
    return std::nullopt;
}

// Seuils durs: ne s'appliquent pas à une main soft (A-5 contre 9 ne s'abandonne pas)
std::optional<Action> BasicStrategy::hard_first_action(const Hand& hand, int dealer) {
    if (hand.is_soft()) return std::nullopt;

    switch (hand.total()) {
        case 16:
            if (in_range(dealer, 9, 11)) return Action::SURRENDER;
            break;
        case 15:
            if (dealer == 10) return Action::SURRENDER;
            break;
        case 11:
            return Action::DOUBLE_DOWN;
        case 10:
            if (dealer < 10) return Action::DOUBLE_DOWN;
            break;
        case 9:
            if (in_range(dealer, 3, 6)) return Action::DOUBLE_DOWN;
            break;
        default:
            break;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
//  BasicStrategy — décisions suivantes (HIT ou STAND uniquement)
// -----------------------------------------------------------------------------
Action BasicStrategy::subsequent_action(const Hand& hand, const Card& dealer_upcard) const {
    const int dealer = dealer_upcard.value();
    const int total = hand.total();
    Action chosen = Action::STAND;

    if (hand.is_soft()) {
        if (total <= 17) chosen = Action::HIT;
        else if (total == 18 && dealer >= 9) chosen = Action::HIT;
    } else if (total <= 11) {
        chosen = Action::HIT;
    }

    if (chosen == Action::STAND) {
        if (total == 12 && (dealer < 4 || dealer > 6)) chosen = Action::HIT;
        else if (in_range(total, 13, 16) && dealer >= 7) chosen = Action::HIT;
    }

    spdlog::trace("BasicStrategy::subsequent_action: total {}{} vs {} -> {}",
                  total, hand.is_soft() ? " (soft)" : "", dealer, action_to_string(chosen));
    return chosen;
}

// -----------------------------------------------------------------------------
//  DealerStyleStrategy
// -----------------------------------------------------------------------------
Action DealerStyleStrategy::first_action(const Hand& /*hand*/, const Card& /*dealer_upcard*/) const {
    return Action::STAND;
}

Action DealerStyleStrategy::subsequent_action(const Hand& hand, const Card& /*dealer_upcard*/) const {
    return hand.total() < 17 ? Action::HIT : Action::STAND;
}

} // namespace bj_sim
