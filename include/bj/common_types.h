#ifndef BJ_COMMON_TYPES_H
#define BJ_COMMON_TYPES_H

namespace bj_sim {

// Décision du joueur, produite par une Strategy
enum class Action {
    HIT,
    STAND,
    DOUBLE_DOWN,
    SPLIT,     // Détecté mais jamais joué (voir RoundEngine)
    SURRENDER
};

// Issue d'une main terminée
enum class GameResult {
    PLAYER_WIN,
    DEALER_WIN,
    PUSH,
    PLAYER_BLACKJACK,
    SURRENDER,
    DOUBLED_WIN,
    DOUBLED_LOSE
};

// Étapes de la machine à états d'une main
enum class RoundPhase {
    IDLE,
    DEALING,
    NATURAL_CHECK,
    PLAYER_FIRST_ACTION,
    PLAYER_TURN,
    DEALER_TURN,
    RESOLVE,
    DONE
};

// Fonction utilitaire pour convertir une phase en string
inline const char* phase_to_string(RoundPhase phase) {
    switch (phase) {
        case RoundPhase::IDLE: return "Idle";
        case RoundPhase::DEALING: return "Dealing";
        case RoundPhase::NATURAL_CHECK: return "NaturalCheck";
        case RoundPhase::PLAYER_FIRST_ACTION: return "PlayerFirstAction";
        case RoundPhase::PLAYER_TURN: return "PlayerTurn";
        case RoundPhase::DEALER_TURN: return "DealerTurn";
        case RoundPhase::RESOLVE: return "Resolve";
        case RoundPhase::DONE: return "Done";
        default: return "UnknownPhase";
    }
}

} // namespace bj_sim

#endif // BJ_COMMON_TYPES_H
