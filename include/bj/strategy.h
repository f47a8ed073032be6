#ifndef BJ_STRATEGY_H
#define BJ_STRATEGY_H

#include "bj/common_types.h"
#include "bj/hand.h"
#include "core/cards.hpp"
#include <optional>
#include <string>

namespace bj_sim {

// Interface de décision du joueur.
// Les implémentations doivent être des fonctions pures de (main, carte visible du croupier):
// mêmes entrées, même action.
class Strategy {
public:
    virtual ~Strategy() = default;

    // Appelée une seule fois par main, avant tout tirage.
    // HIT ou STAND signifient "continuer vers le tour du joueur".
    virtual Action first_action(const Hand& hand, const Card& dealer_upcard) const = 0;

    // Appelée tant que la main reste active après la première décision.
    virtual Action subsequent_action(const Hand& hand, const Card& dealer_upcard) const = 0;

    virtual std::string get_name() const = 0;
};

// Stratégie de base (table de décisions par seuils)
class BasicStrategy final : public Strategy {
public:
    Action first_action(const Hand& hand, const Card& dealer_upcard) const override;
    Action subsequent_action(const Hand& hand, const Card& dealer_upcard) const override;
    std::string get_name() const override { return "BasicStrategy"; }

private:
    static std::optional<Action> soft_first_action(const Hand& hand, int dealer);
    static std::optional<Action> pair_first_action(const Hand& hand, int dealer);
    static std::optional<Action> hard_first_action(const Hand& hand, int dealer);
};

// Le joueur imite le croupier: tire sous 17, ne double/abandonne/sépare jamais
class DealerStyleStrategy final : public Strategy {
public:
    Action first_action(const Hand& hand, const Card& dealer_upcard) const override;
    Action subsequent_action(const Hand& hand, const Card& dealer_upcard) const override;
    std::string get_name() const override { return "DealerStyleStrategy"; }
};

} // namespace bj_sim

#endif // BJ_STRATEGY_H
