#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>

#include <string>

#include "../src/guard.hpp"

using namespace wordhint::guard;

template<typename E = std::exception>
auto ExceptionMessageContains(std::string_view part) {
    return Catch::Matchers::Predicate<E>(
        [part](const E& e) { return std::string(e.what()).find(part) != std::string::npos; },
        "exception message contains: " + std::string(part)
    );
}

TEST_CASE("Guard: formatError formats its message", "[guard][error]") {
    REQUIRE_THROWS_MATCHES(
        formatError<std::runtime_error>("failed to open {}", "words_alpha.txt"),
        std::runtime_error,
        ExceptionMessageContains<>("failed to open words_alpha.txt")
    );
    REQUIRE_THROWS_AS(formatError<std::invalid_argument>("bad word {}", 5), std::invalid_argument);
}

TEST_CASE("Guard: hybridError throws the requested type", "[guard][error][constexpr]") {
    REQUIRE_THROWS_MATCHES(
        hybridError<std::runtime_error>("weeee"),
        std::runtime_error,
        ExceptionMessageContains<>("weeee")
    );
    REQUIRE_THROWS_MATCHES(
        hybridError<std::domain_error>("woooo"),
        std::domain_error,
        ExceptionMessageContains<>("woooo")
    );
}

TEST_CASE("Guard: hybridGuard", "[guard][constexpr]") {
    SECTION("Runtime") {
        REQUIRE_NOTHROW(hybridGuard(true, "this should be fine"));
        REQUIRE_THROWS_MATCHES(
            hybridGuard<std::out_of_range>(false, "oops"),
            std::out_of_range,
            ExceptionMessageContains<>("oops")
        );
    }

    SECTION("Compile time") {
        constexpr auto goodLambda = []() { hybridGuard(true, ""); return true; };
        STATIC_REQUIRE(goodLambda());
    }
}

TEST_CASE("Guard: runtimeGuard", "[guard]") {
    REQUIRE_NOTHROW(runtimeGuard(true, "unused {}", 1));
    REQUIRE_THROWS_MATCHES(
        runtimeGuard<std::invalid_argument>(false, "\"{}\" is not a {}-letter word", "abc", 5),
        std::invalid_argument,
        ExceptionMessageContains<>("\"abc\" is not a 5-letter word")
    );
}
