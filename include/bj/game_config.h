#ifndef BJ_GAME_CONFIG_H
#define BJ_GAME_CONFIG_H

#include <cstdint>
#include <optional>

namespace bj_sim {

// Paramètres fixés au démarrage, non modifiables pendant la session
struct GameConfig {
    int    num_packs           = 6;      // Jeux de 52 cartes dans le sabot
    int    reshuffle_threshold = 15;     // Nouveau sabot si moins de cartes au début d'une main
    double bet_amount          = 10.0;
    double initial_bankroll    = 1000.0;
    std::optional<std::uint32_t> seed;   // Mélange reproductible si défini
};

} // namespace bj_sim

#endif // BJ_GAME_CONFIG_H
