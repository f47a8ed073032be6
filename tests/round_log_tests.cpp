#include <catch2/catch.hpp>
#include "bj/round_log.h"

#include <cstdio> // Pour std::remove
#include <fstream>
#include <sstream>
#include <string>

using namespace bj_sim;

namespace {
std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
} // namespace

TEST_CASE("FileRoundLog appends blocks", "[round_log]") {
    const std::string path = "test_round_log_output.txt";
    std::remove(path.c_str());

    FileRoundLog log(path);
    REQUIRE(log.get_path() == path);
    log.append("*** Game 1 ***\nPush!\n");
    log.append("*** Game 2 ***\nDealer wins!\n");

    REQUIRE(read_file(path) == "*** Game 1 ***\nPush!\n\n*** Game 2 ***\nDealer wins!\n\n");

    // Un nouveau logger sur le même fichier ajoute sans écraser
    FileRoundLog again(path);
    again.append("*** Game 3 ***\n");
    REQUIRE(read_file(path).find("*** Game 1 ***") == 0);
    REQUIRE(read_file(path).find("*** Game 3 ***") != std::string::npos);

    std::remove(path.c_str());
}

TEST_CASE("FileRoundLog surfaces I/O failures", "[round_log][error]") {
    FileRoundLog log("missing_directory_for_tests/sub/blackjack_log.txt");
    REQUIRE_THROWS_AS(log.append("*** Game 1 ***\n"), LogWriteError);
}

TEST_CASE("MemoryRoundLog keeps blocks in order", "[round_log]") {
    MemoryRoundLog log;
    log.append("a");
    log.append("b");
    REQUIRE(log.get_blocks().size() == 2);
    REQUIRE(log.get_blocks()[0] == "a");
    REQUIRE(log.get_blocks()[1] == "b");
    log.clear();
    REQUIRE(log.get_blocks().empty());
}
