/**
 * @file ReplyGenerator.cpp
 * @brief Implémentation de la synthèse des répliques
 * @version 1.0
 * @date 2026-10-19
 */

#include "ReplyGenerator.hpp"
#include "TextAnalyzer.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace cascade {

namespace {

// Vocabulaire favorisé par chaque trait
const std::vector<std::string> OPENNESS_WORDS = {
    "theory", "hypothesis", "what if", "imagine", "pattern", "maybe", "dream"
};
const std::vector<std::string> NEUROTICISM_WORDS = {
    "scared", "terrified", "afraid", "dangerous", "watching", "uneasy", "shaking"
};
const std::vector<std::string> CONSCIENTIOUSNESS_WORDS = {
    "data", "evidence", "logs", "proof", "timestamps", "facts", "precise"
};
const std::vector<std::string> AGREEABLENESS_WORDS = {
    "agree", "together", "right", "love", "welcome"
};
const std::vector<std::string> EXTRAVERSION_WORDS = {
    "!", "everyone", "hello", "great"
};

} // namespace

ReplyGenerator::ReplyGenerator(const ReplyConfig& config, const TemplateLibrary& library, Rng& rng)
    : config_(config)
    , library_(library)
    , rng_(rng)
{}

// ═══════════════════════════════════════════════════════════════════════════
// CHOIX DE L'INTENTION
// ═══════════════════════════════════════════════════════════════════════════

Intent ReplyGenerator::chooseIntent(const Persona& persona, const ConversationThread& thread,
                                    const NarrativeMemory& memory) {
    const Intent phase_intent = thread.getPhaseAppropriateIntent();
    const Mood mood = persona.mood();

    std::vector<Intent> candidates;
    std::vector<double> weights;

    for (Intent intent : ALL_INTENTS) {
        if (intent == Intent::REPLY) continue;
        if (intent == Intent::QUESTION && !config_.enable_question_intent) continue;

        double w = persona.intentAffinity(intent) + 0.02;

        // Biais de phase
        if (intent == phase_intent) w *= 2.0;

        // Biais d'humeur
        switch (mood) {
            case Mood::SCARED:
            case Mood::PARANOID:
                if (intent == Intent::FEAR) w *= 1.8;
                break;
            case Mood::SUSPICIOUS:
            case Mood::FRUSTRATED:
                if (intent == Intent::CHALLENGE) w *= 1.5;
                break;
            case Mood::CURIOUS:
            case Mood::INSPIRED:
                if (intent == Intent::THEORY) w *= 1.5;
                break;
            case Mood::PLAYFUL:
                if (intent == Intent::JOKE) w *= 1.8;
                break;
            case Mood::NEUTRAL:
                break;
        }

        // Biais narratif
        if (intent == Intent::META && memory.metaAwareness() > 0.6) w *= 1.5;
        if (intent == Intent::FEAR && memory.tension() > 0.7) w *= 1.5;

        candidates.push_back(intent);
        weights.push_back(w);
    }

    Intent chosen = candidates[rng_.weightedIndex(weights)];

    // Garde anti-boucle interrogative
    if (isQuestionLike(chosen) && interrogativeLoopRisk()) {
        chosen = persona.preferredIntent(true, config_.enable_question_intent);
    }
    return chosen;
}

bool ReplyGenerator::interrogativeLoopRisk() const {
    if (recent_intents_.size() < 2) {
        return false;
    }
    auto last = recent_intents_.rbegin();
    return isQuestionLike(*last) && isQuestionLike(*std::next(last));
}

// ═══════════════════════════════════════════════════════════════════════════
// GÉNÉRATION
// ═══════════════════════════════════════════════════════════════════════════

std::optional<GeneratedReply> ReplyGenerator::generate(const ReplyRequest& request) {
    if (!request.persona) {
        return std::nullopt;
    }
    const Persona& persona = *request.persona;

    Intent intent = request.intent;
    if (intent == Intent::QUESTION && !config_.enable_question_intent) {
        intent = persona.preferredIntent(false, false);
    }

    // 1. Réservoir
    const auto& pool = library_.resolvePool(persona.id(), intent);
    if (pool.empty()) {
        return std::nullopt;
    }

    // 2. Filtrage anti-répétition
    std::vector<size_t> candidates;
    std::vector<std::string> rendered(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) {
        rendered[i] = renderTemplate(pool[i], request.topic, request.context);
        bool duplicate = isNearDuplicate(rendered[i])
            || (request.thread
                && request.thread->containsNearDuplicate(rendered[i], config_.near_duplicate_threshold));
        if (!duplicate) {
            candidates.push_back(i);
        }
    }

    bool exhausted = candidates.empty();
    if (exhausted) {
        for (size_t i = 0; i < pool.size(); ++i) {
            candidates.push_back(i);
        }
    }

    // 3-4. Poids et loterie
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (size_t idx : candidates) {
        weights.push_back(templateWeight(persona, pool[idx]));
    }
    size_t chosen = candidates[rng_.weightedIndex(weights)];

    GeneratedReply reply;
    reply.intent = intent;
    reply.template_text = pool[chosen];
    reply.near_duplicate = exhausted;
    reply.text = rendered[chosen];

    // 5. Hésitation ou formule fétiche
    const auto& hesitations = library_.hesitations(persona.id());
    const auto& catch_phrases = library_.catchPhrases(persona.id());
    if (!hesitations.empty()
        && rng_.chance(config_.hesitation_factor * persona.traits().neuroticism)) {
        reply.text = rng_.pick(hesitations) + " " + reply.text;
        reply.hesitated = true;
    } else if (!catch_phrases.empty() && rng_.chance(config_.catch_phrase_chance)) {
        reply.text += " " + rng_.pick(catch_phrases);
        reply.catch_phrase = true;
    }
    if (!exhausted && (reply.hesitated || reply.catch_phrase) && isNearDuplicate(reply.text)) {
        // L'ornement rapproche la réplique d'une ligne récente : on le retire
        reply.text = rendered[chosen];
        reply.hesitated = false;
        reply.catch_phrase = false;
    }

    // 7. Enregistrement
    if (!reply.near_duplicate) {
        registerLine(reply.text);
        registerIntent(intent);
    }
    return reply;
}

std::optional<GeneratedReply> ReplyGenerator::pickFromPool(const std::vector<std::string>& pool,
                                                           const TopicPtr& topic,
                                                           const ReplyContext& context,
                                                           const ConversationThread* thread) {
    if (pool.empty()) {
        return std::nullopt;
    }

    std::vector<size_t> fresh;
    std::vector<std::string> rendered(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) {
        rendered[i] = renderTemplate(pool[i], topic, context);
        bool duplicate = isNearDuplicate(rendered[i])
            || (thread && thread->containsNearDuplicate(rendered[i], config_.near_duplicate_threshold));
        if (!duplicate) {
            fresh.push_back(i);
        }
    }

    GeneratedReply reply;
    reply.intent = Intent::REPLY;
    reply.near_duplicate = fresh.empty();

    size_t chosen = fresh.empty() ? rng_.index(pool.size()) : fresh[rng_.index(fresh.size())];
    reply.template_text = pool[chosen];
    reply.text = rendered[chosen];
    return reply;
}

std::string ReplyGenerator::renderTemplate(const std::string& text, const TopicPtr& topic,
                                           const ReplyContext& context) const {
    std::string out;
    out.reserve(text.size() + 32);

    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '}') {
            throw std::invalid_argument("Gabarit mal formé (accolade fermante isolée): " + text);
        }
        if (c != '{') {
            out += c;
            ++pos;
            continue;
        }

        size_t close = text.find('}', pos + 1);
        size_t reopen = text.find('{', pos + 1);
        if (close == std::string::npos || (reopen != std::string::npos && reopen < close)) {
            throw std::invalid_argument("Gabarit mal formé (accolade non fermée): " + text);
        }

        std::string token = text.substr(pos + 1, close - pos - 1);
        if (token == "topic") {
            out += topic ? topic->displayName() : "this";
        } else if (token == "from") {
            out += context.last_speaker.empty() ? DEFAULT_FROM : context.last_speaker;
        } else if (token == "event") {
            out += context.notable_event ? *context.notable_event : DEFAULT_EVENT;
        } else if (token == "related") {
            out += context.related_topic ? context.related_topic->displayName() : DEFAULT_RELATED;
        } else {
            throw std::invalid_argument("Jeton inconnu {" + token + "} dans: " + text);
        }
        pos = close + 1;
    }
    return out;
}

double ReplyGenerator::templateWeight(const Persona& persona, const std::string& text) const {
    const auto& t = persona.traits();
    double weight = 1.0;

    if (TextAnalyzer::containsAny(text, OPENNESS_WORDS)) weight *= 1.0 + 0.5 * t.openness;
    if (TextAnalyzer::containsAny(text, NEUROTICISM_WORDS)) weight *= 1.0 + 0.5 * t.neuroticism;
    if (TextAnalyzer::containsAny(text, CONSCIENTIOUSNESS_WORDS)) weight *= 1.0 + 0.5 * t.conscientiousness;
    if (TextAnalyzer::containsAny(text, AGREEABLENESS_WORDS)) weight *= 1.0 + 0.5 * t.agreeableness;
    if (TextAnalyzer::containsAny(text, EXTRAVERSION_WORDS)) weight *= 1.0 + 0.5 * t.extraversion;

    weight *= 1.0 + persona.keywordBonus(text);
    return weight;
}

// ═══════════════════════════════════════════════════════════════════════════
// TAMPONS RÉCENTS
// ═══════════════════════════════════════════════════════════════════════════

bool ReplyGenerator::isNearDuplicate(const std::string& text) const {
    return std::any_of(recent_lines_.begin(), recent_lines_.end(),
        [&](const std::string& previous) {
            return TextAnalyzer::overlapRatio(previous, text) > config_.near_duplicate_threshold;
        });
}

void ReplyGenerator::registerLine(const std::string& text) {
    recent_lines_.push_back(text);
    while (recent_lines_.size() > config_.recent_lines_size) {
        recent_lines_.pop_front();
    }
}

void ReplyGenerator::registerIntent(Intent intent) {
    recent_intents_.push_back(intent);
    while (recent_intents_.size() > config_.recent_intents_size) {
        recent_intents_.pop_front();
    }
}

void ReplyGenerator::clearHistory() {
    recent_lines_.clear();
    recent_intents_.clear();
}

} // namespace cascade
