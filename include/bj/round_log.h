#ifndef BJ_ROUND_LOG_H
#define BJ_ROUND_LOG_H

#include <stdexcept>
#include <string>
#include <vector>

namespace bj_sim {

// Échec d'écriture du journal des mains, propagé à l'appelant de la main
class LogWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Journal en ajout seul: un bloc de texte par main jouée
class RoundLog {
public:
    virtual ~RoundLog() = default;
    virtual void append(const std::string& block) = 0;
};

// Ouvre, ajoute et ferme le fichier à chaque main. Lance LogWriteError en cas d'échec.
class FileRoundLog final : public RoundLog {
public:
    explicit FileRoundLog(std::string path);

    void append(const std::string& block) override;
    const std::string& get_path() const { return path_; }

private:
    std::string path_;
};

// Garde les blocs en mémoire (tests, intégration dans une interface)
class MemoryRoundLog final : public RoundLog {
public:
    void append(const std::string& block) override;

    const std::vector<std::string>& get_blocks() const { return blocks_; }
    void clear() { blocks_.clear(); }

private:
    std::vector<std::string> blocks_;
};

} // namespace bj_sim

#endif // BJ_ROUND_LOG_H
