/**
 * EchoSuppressor.cpp - Word-overlap echo detection
 */

#include "sui/session/EchoSuppressor.hpp"
#include "sui/session/Text.hpp"
#include "sui/Config.hpp"

#include <algorithm>
#include <iterator>

namespace sui::session {

EchoSuppressor::EchoSuppressor(const EchoConfig& config)
    : config_(config) {
    requireValid(validate(config), "EchoSuppressor");
}

void EchoSuppressor::recordSpoken(const std::string& text, TimePoint finished_at) {
    last_spoken_ = text;
    finished_at_ = finished_at;
}

bool EchoSuppressor::inEchoWindow(TimePoint now) const {
    if (!finished_at_) {
        return false;
    }
    double elapsed = secondsBetween(*finished_at_, now);
    return elapsed >= 0.0 && elapsed <= config_.window;
}

bool EchoSuppressor::isEcho(const std::string& text, TimePoint now) const {
    if (last_spoken_.empty() || !inEchoWindow(now)) {
        return false;
    }
    return similarity(text, last_spoken_) > config_.similarity_threshold;
}

void EchoSuppressor::clear() {
    last_spoken_.clear();
    finished_at_.reset();
}

double EchoSuppressor::similarity(const std::string& a, const std::string& b) {
    auto wordsA = wordSet(a);
    auto wordsB = wordSet(b);
    if (wordsA.empty() || wordsB.empty()) {
        return 0.0;
    }

    std::vector<std::string> common;
    std::set_intersection(wordsA.begin(), wordsA.end(), wordsB.begin(), wordsB.end(),
                          std::back_inserter(common));
    size_t unionSize = wordsA.size() + wordsB.size() - common.size();
    return static_cast<double>(common.size()) / static_cast<double>(unionSize);
}

} // namespace sui::session
