#pragma once

#include <string_view>

// Interactive game loop: asks for the first letter, then suggests guesses until solved
void solve(std::string_view dictionaryFile);
