#include "bj/round_log.h"
#include "spdlog/spdlog.h"
#include <fstream> // Pour std::ofstream
#include <utility>

namespace bj_sim {

FileRoundLog::FileRoundLog(std::string path)
    : path_(std::move(path)) {}

void FileRoundLog::append(const std::string& block) {
    std::ofstream outfile(path_, std::ios::out | std::ios::app);
    if (!outfile.is_open()) {
        spdlog::error("Impossible d'ouvrir le journal des mains : {}", path_);
        throw LogWriteError("Cannot open round log file: " + path_);
    }

    // Ligne vide entre deux mains
    outfile << block << "\n";

    outfile.close();
    if (outfile.fail()) { // Vérifier si la fermeture ou une écriture a échoué
        spdlog::error("Erreur lors de l'écriture ou de la fermeture du fichier : {}", path_);
        throw LogWriteError("Failed to write round log file: " + path_);
    }
}

void MemoryRoundLog::append(const std::string& block) {
    blocks_.push_back(block);
}

} // namespace bj_sim
