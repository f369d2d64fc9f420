#include "stats.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <numeric>
#include <vector>

#include "src/config.hpp"
#include "src/dictionary.hpp"
#include "src/feedback.hpp"
#include "src/parallelTaskQueue.hpp"
#include "src/session.hpp"
#include "src/timing.hpp"
#include "src/util.hpp"
#include "src/vocab.hpp"

namespace {

constexpr size_t FAILED = 0;

// Number of words played until target was guessed, or FAILED
size_t playGame(wordhint::Session& session, wordhint::feedback::Encoder& encoder, std::string_view target) {
    wordhint::Suggestion suggestion = session.reset(target.front());
    for (size_t guesses = 1; guesses <= wordhint::config::MAX_GUESSES; ++guesses) {
        if (!suggestion.hasGuess()) return FAILED;
        if (suggestion.guess == target) return guesses;
        if (suggestion.status == wordhint::Status::SOLVED) return FAILED;

        const std::string guess = suggestion.guess;
        suggestion = session.submitFeedback(guess, encoder(guess, target));
    }
    return FAILED;
}

}  // namespace

void stats(std::string_view dictionaryFile) {
    wordhint::timing::Timer timer;

    timer.start();
    auto source = std::make_shared<const wordhint::Dictionary>(wordhint::vocab::constructVocab(dictionaryFile));
    std::cout << "Time to load " << source->size() << " words: " << timer.end().count() << " s\n";
    timer.reset();

    const auto& targets = source->getWords();
    const size_t numTargets = targets.size();
    std::vector<size_t> games(numTargets, FAILED);
    std::atomic_size_t gamesPlayed = 0;

    auto worker = [&](size_t threadID, size_t start, size_t stop) {
        wordhint::Session session{source};
        wordhint::feedback::Encoder encoder{};
        for (size_t i = start; i < stop; ++i) {
            games[i] = playGame(session, encoder, targets[i].view());
            size_t played = gamesPlayed.fetch_add(1, std::memory_order_relaxed) + 1;
            if (threadID == 0) wordhint::util::showProgressBar(played, numTargets);
        }
    };

    timer.start();
    wordhint::parallel::TaskQueue queue{wordhint::config::HARDWARE_CONCURRENCY};
    queue.pushChunks(numTargets, wordhint::config::HARDWARE_CONCURRENCY, worker);
    wordhint::util::showProgressBar(numTargets, numTargets);
    std::cout << "\nSimulation Time: " << timer.end().count() << " s\n";

    const size_t failures = static_cast<size_t>(std::count(games.begin(), games.end(), FAILED));
    const size_t solved = numTargets - failures;
    const size_t totalGuesses = std::accumulate(games.begin(), games.end(), size_t{0});
    const size_t worst = *std::max_element(games.begin(), games.end());
    auto winPred = [](size_t guesses) noexcept -> bool { return guesses != FAILED && guesses <= 6; };
    const size_t gamesWon = static_cast<size_t>(std::count_if(games.begin(), games.end(), winPred));

    std::cout << "Mean guesses (solved games): " << (solved ? static_cast<double>(totalGuesses) / static_cast<double>(solved) : 0.0) << "\n";
    std::cout << "Most guesses: " << worst << "\n";
    std::cout << "Win Percentage (<= 6 guesses): " << static_cast<double>(gamesWon) / static_cast<double>(numTargets) * 100.0 << "%\n";
    std::cout << "Games failed: " << failures << "\n";
}
