/**
 * @file TextAnalyzer.cpp
 * @brief Implémentation de l'analyse lexicale des répliques
 * @version 1.0
 * @date 2026-10-19
 */

#include "TextAnalyzer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace cascade {

TextAnalyzer::TextAnalyzer() {
    initDefaultDictionaries();
}

void TextAnalyzer::initDefaultDictionaries() {
    // Désaccord : tension ↑, cohésion ↓
    disagreement_words_ = {
        "no", "wrong", "disagree", "proof", "flawed", "impossible", "nonsense",
        "doubt", "ridiculous", "never", "paranoid"
    };

    // Accord : tension ↓, cohésion ↑
    agreement_words_ = {
        "yes", "agree", "right", "exactly", "true", "together", "trust",
        "same", "maybe"
    };

    // Méta : discussion profonde, conscience ↑
    meta_words_ = {
        "simulation", "watching", "real", "observer", "observers", "loop",
        "code", "programmed", "simulated", "script"
    };

    // Urgence : tension ↑
    urgent_words_ = {
        "now", "run", "hurry", "danger", "stop", "help", "quick", "quickly"
    };
}

DynamicsSignal TextAnalyzer::analyzeDynamics(const std::string& text) const {
    DynamicsSignal signal;
    signal.exclamation = text.find('!') != std::string::npos;

    for (const auto& token : tokenize(normalizeText(text))) {
        if (disagreement_words_.count(token)) signal.disagreement_hits++;
        if (agreement_words_.count(token)) signal.agreement_hits++;
        if (meta_words_.count(token)) signal.meta_hits++;
        if (urgent_words_.count(token)) signal.urgent_hits++;
    }
    return signal;
}

std::string TextAnalyzer::toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string TextAnalyzer::normalizeText(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());

    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '\'') {
            normalized += static_cast<char>(std::tolower(c));
        } else if (c >= 0x80) {
            normalized += static_cast<char>(c);  // Octets UTF-8 conservés
        } else {
            normalized += ' ';
        }
    }

    // Supprimer les espaces multiples
    auto new_end = std::unique(normalized.begin(), normalized.end(),
        [](char a, char b) { return a == ' ' && b == ' '; });
    normalized.erase(new_end, normalized.end());

    size_t start = normalized.find_first_not_of(' ');
    size_t end = normalized.find_last_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    return normalized.substr(start, end - start + 1);
}

std::vector<std::string> TextAnalyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string word;

    while (stream >> word) {
        while (!word.empty() && word.front() == '\'') {
            word.erase(0, 1);
        }
        while (!word.empty() && word.back() == '\'') {
            word.pop_back();
        }
        if (!word.empty()) {
            tokens.push_back(word);
        }
    }
    return tokens;
}

std::unordered_set<std::string> TextAnalyzer::wordSet(const std::string& text) {
    auto tokens = tokenize(normalizeText(text));
    return {tokens.begin(), tokens.end()};
}

double TextAnalyzer::overlapRatio(const std::string& a, const std::string& b) {
    auto set_a = wordSet(a);
    auto set_b = wordSet(b);
    size_t largest = std::max(set_a.size(), set_b.size());
    if (largest == 0) {
        return 0.0;
    }

    size_t shared = 0;
    for (const auto& word : set_a) {
        if (set_b.count(word)) shared++;
    }
    return static_cast<double>(shared) / static_cast<double>(largest);
}

bool TextAnalyzer::containsAny(const std::string& text, const std::vector<std::string>& terms) {
    std::string lower = toLower(text);
    return std::any_of(terms.begin(), terms.end(), [&lower](const std::string& term) {
        return !term.empty() && lower.find(toLower(term)) != std::string::npos;
    });
}

bool TextAnalyzer::containsAnyWord(const std::string& text, const std::vector<std::string>& terms) {
    auto words = wordSet(text);
    return std::any_of(terms.begin(), terms.end(), [&words](const std::string& term) {
        return words.count(toLower(term)) > 0;
    });
}

} // namespace cascade
