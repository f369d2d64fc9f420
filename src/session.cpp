#include "guard.hpp"
#include "session.hpp"
#include "util.hpp"

namespace wordhint {

Session::Session(std::shared_ptr<const Dictionary> _source, config::PoolPolicy _policy)
: source{std::move(_source)},
  policy{_policy} {
    guard::hybridGuard<std::invalid_argument>(source != nullptr, "Session requires a source dictionary");
}

Suggestion Session::suggest() {
    Suggestion suggestion{Status::NO_CANDIDATES, {}, answers.size()};
    if (answers.empty()) return suggestion;

    if (answers.size() == 1) {
        suggestion.status = Status::SOLVED;
        suggestion.guess = answers.getWords().front().str();
        return suggestion;
    }

    const LetterFrequency freq = answers.charFrequency();
    Dictionary& pool = guessPool.empty() ? answers : guessPool;
    suggestion.status = Status::GUESS;
    suggestion.guess = pool.rankBest(freq).str();
    return suggestion;
}

Suggestion Session::reset(char seedLetter) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!util::isValidLetter(seedLetter)) return {Status::INVALID_CHARACTER, {}, answers.size()};

    Dictionary words{*source};
    words.filter(Clue::seed(seedLetter));

    guessPool = words;
    answers = std::move(words);
    return suggest();
}

Suggestion Session::submitFeedback(std::string_view guess, std::string_view fbString) {
    std::lock_guard<std::mutex> lock(mtx);
    if (Status flag = feedback::validate(guess, fbString); flag != Status::GUESS) {
        return {flag, {}, answers.size()};
    }

    for (const Clue& clue : feedback::decode(guess, fbString)) {
        answers.filter(clue);
        if (policy == config::PoolPolicy::NARROWING) guessPool.filter(clue);
    }
    return suggest();
}

Suggestion Session::nextGuess() {
    std::lock_guard<std::mutex> lock(mtx);
    return suggest();
}

Dictionary Session::getAnswers() const {
    std::lock_guard<std::mutex> lock(mtx);
    return answers;
}

Dictionary Session::getGuessPool() const {
    std::lock_guard<std::mutex> lock(mtx);
    return guessPool;
}

}  // namespace wordhint
