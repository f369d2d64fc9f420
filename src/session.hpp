#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "clue.hpp"
#include "config.hpp"
#include "dictionary.hpp"

namespace wordhint {

struct Suggestion {
    Status status = Status::NO_CANDIDATES;
    std::string guess;          // set for GUESS and SOLVED
    size_t remaining = 0;       // possible answers left after the call

    bool hasGuess() const noexcept {
        return status == Status::GUESS || status == Status::SOLVED;
    }
};

/*
One solving session over a shared, read-only source dictionary.

answers narrows with every clue. guessPool is copied from answers at reset and,
under PoolPolicy::FIXED, is never filtered again, so it may suggest words that are
no longer possible answers. Every public call holds the session lock until it returns.
*/
class Session {
    std::shared_ptr<const Dictionary> source;
    Dictionary answers{};
    Dictionary guessPool{};
    const config::PoolPolicy policy;
    mutable std::mutex mtx{};

    Suggestion suggest();

public:
    explicit Session(std::shared_ptr<const Dictionary> _source, config::PoolPolicy _policy = config::DEFAULT_POOL_POLICY);

    // Restarts on every source word beginning with seedLetter
    Suggestion reset(char seedLetter);

    // Applies feedback for guess. Invalid input is reported in status and leaves the session untouched
    Suggestion submitFeedback(std::string_view guess, std::string_view fbString);

    Suggestion nextGuess();

    config::PoolPolicy getPolicy() const noexcept {
        return policy;
    }

    // Snapshots for inspection
    Dictionary getAnswers() const;
    Dictionary getGuessPool() const;
};

}  // namespace wordhint
