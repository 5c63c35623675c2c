/**
 * test_echo_suppressor.cpp - Word overlap echo detection and text helpers
 */

#include "sui/Config.hpp"
#include "sui/session/EchoSuppressor.hpp"
#include "sui/session/Text.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace sui;
using namespace sui::session;

void test_tokenize() {
    auto words = tokenizeWords("Bonjour, ÉTEINS la lumière du salon !");
    assert(words.size() == 6);
    assert(words[0] == "bonjour");
    assert(words[1] == "éteins");
    assert(words[3] == "lumière");

    // Apostrophes and hyphens inside words survive, guillemets split
    words = tokenizeWords("«c’est» arrête-toi 'ok'");
    assert(words.size() == 3);
    assert(words[0] == "c'est");
    assert(words[1] == "arrête-toi");
    assert(words[2] == "ok");

    assert(tokenizeWords("  ...  ").empty());
    std::cout << "[PASS] test_tokenize" << std::endl;
}

void test_text_helpers() {
    assert(stripElision("t'arrêter") == "arrêter");
    assert(stripElision("qu'il") == "il");
    assert(stripElision("aujourd'hui") == "aujourd'hui");
    assert(trim("  allume \n") == "allume");
    assert(joinFragments({" allume la", "", "lumière  "}) == "allume la lumière");
    std::cout << "[PASS] test_text_helpers" << std::endl;
}

void test_similarity() {
    assert(EchoSuppressor::similarity("Vous avez dit bonjour", "vous avez dit bonjour.") == 1.0);
    assert(EchoSuppressor::similarity("bonjour", "") == 0.0);
    assert(EchoSuppressor::similarity("", "") == 0.0);

    double s = EchoSuppressor::similarity("bonjour", "bonjour à tous");
    assert(std::abs(s - 1.0 / 3.0) < 1e-9);

    // Symmetric
    assert(EchoSuppressor::similarity("a b c", "b c d") == EchoSuppressor::similarity("b c d", "a b c"));
    std::cout << "[PASS] test_similarity" << std::endl;
}

void test_echo_within_window() {
    EchoSuppressor echo;
    const TimePoint finished = Clock::now();

    assert(!echo.isEcho("Vous avez dit bonjour", finished));

    echo.recordSpoken("Vous avez dit bonjour", finished);
    assert(echo.lastSpoken() == "Vous avez dit bonjour");

    assert(echo.isEcho("vous avez dit bonjour", addSeconds(finished, 0.8)));
    assert(echo.isEcho("vous avez dit bonjour", addSeconds(finished, 1.0)));
    assert(!echo.isEcho("vous avez dit bonjour", addSeconds(finished, 1.2)));

    // Different sentence inside the window
    assert(!echo.isEcho("allume la lumière", addSeconds(finished, 0.5)));
    std::cout << "[PASS] test_echo_within_window" << std::endl;
}

void test_threshold_is_strict() {
    EchoSuppressor echo;
    const TimePoint finished = Clock::now();
    echo.recordSpoken("allume la lumière", finished);

    // 2 shared words out of 4 distinct: exactly 0.5
    assert(EchoSuppressor::similarity("allume la cuisine", "allume la lumière") == 0.5);
    assert(!echo.isEcho("allume la cuisine", addSeconds(finished, 0.2)));
    std::cout << "[PASS] test_threshold_is_strict" << std::endl;
}

void test_clear_and_window() {
    EchoSuppressor echo;
    const TimePoint finished = Clock::now();
    echo.recordSpoken("Commande annulée.", finished);

    assert(echo.inEchoWindow(finished));
    assert(echo.inEchoWindow(addSeconds(finished, 0.99)));
    assert(!echo.inEchoWindow(addSeconds(finished, -0.5)));

    echo.clear();
    assert(echo.lastSpoken().empty());
    assert(!echo.inEchoWindow(finished));
    assert(!echo.isEcho("commande annulée", finished));
    std::cout << "[PASS] test_clear_and_window" << std::endl;
}

void test_invalid_config() {
    EchoConfig config;
    config.similarity_threshold = 1.5;

    bool threw = false;
    try {
        EchoSuppressor echo(config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] test_invalid_config" << std::endl;
}

int main() {
    std::cout << "=== EchoSuppressor Tests ===" << std::endl;

    test_tokenize();
    test_text_helpers();
    test_similarity();
    test_echo_within_window();
    test_threshold_is_strict();
    test_clear_and_window();
    test_invalid_config();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
