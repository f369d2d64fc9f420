#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "../src/util.hpp"
#include "../src/vocab.hpp"

namespace {
    // Writes contents to a fresh file in the temp directory and removes it on scope exit
    struct TempFile {
        std::filesystem::path path;

        TempFile(std::string_view name, std::string_view contents) : path{std::filesystem::temp_directory_path() / name} {
            std::ofstream file{path};
            file << contents;
        }
        ~TempFile() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    };
}

TEST_CASE("Vocab: processStream() trims, lowercases and keeps only valid words", "[vocab]") {
    std::istringstream stream{"Crane\n  slate \nab\ntoolong\nsl4te\n\nSHOUT\r\nspeed"};
    auto words = wordhint::vocab::__impl::processStream(stream);

    REQUIRE(words == wordhint::vocab::Vocab{"crane", "slate", "shout", "speed"});
    REQUIRE(std::all_of(words.begin(), words.end(), wordhint::util::isValidWord));
}

TEST_CASE("Vocab: processStream() keeps file order and duplicates", "[vocab]") {
    std::istringstream stream{"trace\ncrate\ntrace\n"};
    REQUIRE(wordhint::vocab::__impl::processStream(stream) == wordhint::vocab::Vocab{"trace", "crate", "trace"});
}

TEST_CASE("Vocab: constructVocab() reads a dictionary file", "[vocab]") {
    TempFile file{"wordhint_test_vocab.txt", "a\nable\nabide\nabode\nabout\nabsolutely\n"};
    auto words = wordhint::vocab::constructVocab(file.path.string());
    REQUIRE(words == wordhint::vocab::Vocab{"abide", "abode", "about"});
}

TEST_CASE("Vocab: constructVocab() fails loudly", "[vocab][error]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(wordhint::vocab::constructVocab("wordhint_does_not_exist.txt"), std::runtime_error);
    }

    SECTION("No usable words") {
        TempFile file{"wordhint_test_empty_vocab.txt", "a\nbe\nsee\nlonger\n"};
        REQUIRE_THROWS_AS(wordhint::vocab::constructVocab(file.path.string()), std::runtime_error);
    }
}
