/**
 * Text.hpp - Word-level helpers for transcribed French/English text
 */

#pragma once

#include <set>
#include <string>
#include <vector>

namespace sui::session {

/**
 * Lower-case (ASCII and common French accented capitals) and split on
 * whitespace and punctuation. Apostrophes and hyphens inside a word are kept.
 */
std::vector<std::string> tokenizeWords(const std::string& text);

std::set<std::string> wordSet(const std::string& text);

/**
 * Strip a French elision prefix: "t'arrêter" -> "arrêter".
 */
std::string stripElision(const std::string& word);

std::string trim(const std::string& text);

std::string joinFragments(const std::vector<std::string>& fragments);

} // namespace sui::session
