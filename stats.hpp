#pragma once

#include <string_view>

// Plays every dictionary word as the target and reports how many guesses the session needed
void stats(std::string_view dictionaryFile);
