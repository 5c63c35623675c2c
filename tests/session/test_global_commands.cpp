/**
 * test_global_commands.cpp - Global command lookup, position policy and replies
 */

#include "sui/Config.hpp"
#include "sui/session/GlobalCommands.hpp"

#include <cassert>
#include <cstring>
#include <iostream>

using namespace sui;
using namespace sui::session;

void test_vocabulary() {
    assert(GlobalCommandParser::lookup("stop") == GlobalCommand::Stop);
    assert(GlobalCommandParser::lookup("arrête") == GlobalCommand::Stop);
    assert(GlobalCommandParser::lookup("t'arrêter") == GlobalCommand::Stop);
    assert(GlobalCommandParser::lookup("arrête-toi") == GlobalCommand::Stop);
    assert(GlobalCommandParser::lookup("annule") == GlobalCommand::Cancel);
    assert(GlobalCommandParser::lookup("attends-moi") == GlobalCommand::Pause);
    assert(GlobalCommandParser::lookup("reprends") == GlobalCommand::Resume);
    assert(GlobalCommandParser::lookup("recommence") == GlobalCommand::Restart);
    assert(GlobalCommandParser::lookup("musique") == GlobalCommand::None);
    std::cout << "[PASS] test_vocabulary" << std::endl;
}

void test_short_commands_execute() {
    GlobalCommandParser parser;

    auto match = parser.parse("Stop !");
    assert(match);
    assert(match.command == GlobalCommand::Stop);
    assert(match.word_count == 1);
    assert(match.executable);

    match = parser.parse("annule ça");
    assert(match.command == GlobalCommand::Cancel);
    assert(match.executable);

    match = parser.parse("Reprends.");
    assert(match.command == GlobalCommand::Resume);
    assert(match.executable);
    std::cout << "[PASS] test_short_commands_execute" << std::endl;
}

void test_command_at_end() {
    GlobalCommandParser parser;

    auto match = parser.parse("merci pour tout tu peux arrêter");
    assert(match.command == GlobalCommand::Stop);
    assert(match.word_index == 5);
    assert(match.word_count == 6);
    assert(match.position == CommandPosition::End);
    assert(match.executable);
    std::cout << "[PASS] test_command_at_end" << std::endl;
}

void test_command_mid_sentence() {
    GlobalCommandParser parser;

    auto match = parser.parse("arrête la musique dans le salon");
    assert(match.command == GlobalCommand::Stop);
    assert(match.position == CommandPosition::Middle);
    assert(!match.executable);

    // Four words is already a sentence
    match = parser.parse("pause s'il te plaît");
    assert(match.command == GlobalCommand::Pause);
    assert(match.word_count == 4);
    assert(!match.executable);
    std::cout << "[PASS] test_command_mid_sentence" << std::endl;
}

void test_last_command_wins() {
    GlobalCommandParser parser;

    auto match = parser.parse("annule non arrête");
    assert(match.command == GlobalCommand::Stop);
    assert(match.word_index == 2);
    assert(match.executable);
    std::cout << "[PASS] test_last_command_wins" << std::endl;
}

void test_no_command() {
    GlobalCommandParser parser;

    auto match = parser.parse("allume la lumière du salon");
    assert(!match);
    assert(match.position == CommandPosition::None);
    assert(!match.executable);

    assert(!parser.parse(""));
    std::cout << "[PASS] test_no_command" << std::endl;
}

void test_custom_policy() {
    GlobalCommandParser strict;
    auto match = strict.parse("tu peux arrêter maintenant");
    assert(match.position == CommandPosition::Middle);
    assert(!match.executable);

    CommandPolicy policy;
    policy.end_position_ratio = 0.5;
    GlobalCommandParser lenient(policy);
    match = lenient.parse("tu peux arrêter maintenant");
    assert(match.position == CommandPosition::End);
    assert(match.executable);

    policy.end_position_ratio = 0.0;
    bool threw = false;
    try {
        GlobalCommandParser invalid(policy);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] test_custom_policy" << std::endl;
}

void test_replies() {
    assert(GlobalCommandParser::classifyReply("oui") == Reply::Yes);
    assert(GlobalCommandParser::classifyReply("Ouais, vas-y") == Reply::Yes);
    assert(GlobalCommandParser::classifyReply("d'accord") == Reply::Yes);
    assert(GlobalCommandParser::classifyReply("non merci") == Reply::No);
    assert(GlobalCommandParser::classifyReply("oui enfin non") == Reply::No);
    assert(GlobalCommandParser::classifyReply("peut-être plus tard") == Reply::Unknown);
    assert(GlobalCommandParser::classifyReply("") == Reply::Unknown);
    std::cout << "[PASS] test_replies" << std::endl;
}

void test_negation_phrases() {
    // A bare "pas" does not refuse
    assert(GlobalCommandParser::classifyReply("oui, pourquoi pas") == Reply::Yes);
    assert(GlobalCommandParser::classifyReply("pas mal, d'accord") == Reply::Yes);
    assert(GlobalCommandParser::classifyReply("c'est bien ça") == Reply::Yes);

    assert(GlobalCommandParser::classifyReply("pas ça") == Reply::No);
    assert(GlobalCommandParser::classifyReply("pas du tout") == Reply::No);
    assert(GlobalCommandParser::classifyReply("ne fais pas ça") == Reply::No);
    assert(GlobalCommandParser::classifyReply("ce n'est pas ce que je veux") == Reply::No);
    assert(GlobalCommandParser::classifyReply("oui mais pas maintenant") == Reply::No);
    std::cout << "[PASS] test_negation_phrases" << std::endl;
}

void test_names() {
    assert(std::strcmp(toString(GlobalCommand::Restart), "restart") == 0);
    assert(std::strcmp(toString(CommandPosition::End), "end") == 0);
    assert(std::strcmp(toString(Reply::No), "no") == 0);
    std::cout << "[PASS] test_names" << std::endl;
}

int main() {
    std::cout << "=== GlobalCommands Tests ===" << std::endl;

    test_vocabulary();
    test_short_commands_execute();
    test_command_at_end();
    test_command_mid_sentence();
    test_last_command_wins();
    test_no_command();
    test_custom_policy();
    test_replies();
    test_negation_phrases();
    test_names();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
