#pragma once

#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "config.hpp"
#include "guard.hpp"
#include "util.hpp"

namespace wordhint::vocab {

using Vocab = std::vector<std::string>;

namespace __impl {
    // Keeps trimmed, lowercased lines that form a valid word, in file order
    inline Vocab processStream(std::istream& stream) {
        Vocab words;
        std::string buff;
        while (std::getline(stream, buff)) {
            boost::trim(buff);
            if (buff.size() != config::WORD_LENGTH) continue;
            boost::to_lower(buff);
            if (!util::isValidWord(buff)) continue;
            words.push_back(std::move(buff));
        }
        return words;
    }

    inline Vocab processFile(std::string_view fileName) {
        std::ifstream file{std::string{fileName}};
        if (!file) guard::formatError("failed to open {}", fileName);
        return processStream(file);
    }
}

// Loads the dictionary. Throws if the file is unreadable or holds no usable word
inline Vocab constructVocab(std::string_view fileName = config::DICTIONARY_FILE) {
    auto words = __impl::processFile(fileName);
    guard::runtimeGuard(!words.empty(), "{} holds no {}-letter words", fileName, config::WORD_LENGTH);
    return words;
}

}
