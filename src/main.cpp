#include "bj/round_engine.h"
#include "bj/round_log.h"
#include "bj/strategy.h"
#include "bj/game_config.h"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cerr
#include <string>     // std::string
#include <exception>  // std::exception
#include <sstream>    // std::stringstream

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur de blackjack…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    int         num_rounds = 1000;
    std::string log_path   = "blackjack_log.txt";
    std::string strategy_name = "basic";

    if (argc > 1) {
        try {
            std::size_t consumed = 0;
            num_rounds = std::stoi(argv[1], &consumed);
            if (consumed != std::string(argv[1]).size() || num_rounds < 0) {
                throw std::invalid_argument(argv[1]);
            }
        } catch (const std::exception&) {
            spdlog::error("Nombre de mains invalide : '{}'. Usage : {} [rounds] [log_path] [basic|dealer]", argv[1], argv[0]);
            return 1;
        }
    }
    if (argc > 2) log_path = argv[2];
    if (argc > 3) strategy_name = argv[3];
    if (strategy_name != "basic" && strategy_name != "dealer") {
        spdlog::error("Stratégie inconnue : '{}' (attendu : basic ou dealer)", strategy_name);
        return 1;
    }

    try
    {
        // 1. Configuration et collaborateurs
        const bj_sim::GameConfig config{}; // 6 jeux, mise 10, bankroll 1000
        bj_sim::BasicStrategy       basic_strategy;
        bj_sim::DealerStyleStrategy dealer_style_strategy;
        const bj_sim::Strategy& strategy = (strategy_name == "dealer")
            ? static_cast<const bj_sim::Strategy&>(dealer_style_strategy)
            : static_cast<const bj_sim::Strategy&>(basic_strategy);
        bj_sim::FileRoundLog round_log(log_path);

        // 2. Moteur
        bj_sim::RoundEngine engine(strategy, round_log, config);
        spdlog::info("Moteur initialisé ({}), journal des mains : {}", strategy.get_name(), log_path);

        // 3. Jouer les mains
        spdlog::info("Lancement de {} mains…", num_rounds);
        const bj_sim::BatchReport report = engine.play_n_rounds(num_rounds);
        if (report.stopped_insufficient_funds) {
            spdlog::warn("Insufficient bankroll to continue playing.");
        }

        // 4. Statistiques
        spdlog::info("{} mains jouées.", report.rounds_played);
        std::stringstream ss(engine.get_stats().toString());
        std::string line;
        while (std::getline(ss, line)) {
            spdlog::info("  {}", line);
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
