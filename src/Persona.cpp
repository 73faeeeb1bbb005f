/**
 * @file Persona.cpp
 * @brief Implémentation du modèle de personnalité
 * @version 1.0
 * @date 2026-10-19
 */

#include "Persona.hpp"
#include "TextAnalyzer.hpp"
#include <algorithm>

namespace cascade {

namespace {

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

void pushBounded(std::deque<std::string>& log, const std::string& entry) {
    log.push_back(entry);
    while (log.size() > RELATIONSHIP_LOG_SIZE) {
        log.pop_front();
    }
}

} // namespace

Persona::Persona(PersonaId id,
                 const PersonalityTraits& traits,
                 const TypingStyle& typing,
                 const MoodState& baseline,
                 std::map<Intent, double> intent_affinities,
                 std::vector<std::string> phobias,
                 std::unordered_map<std::string, double> keyword_bonuses)
    : id_(id)
    , name_(personaName(id))
    , traits_(traits)
    , typing_(typing)
    , baseline_(baseline)
    , state_(baseline)
    , intent_affinities_(std::move(intent_affinities))
    , phobias_(std::move(phobias))
    , keyword_bonuses_(std::move(keyword_bonuses))
{
    clampState();
}

// ═══════════════════════════════════════════════════════════════════════════
// DISTRIBUTION FIXE
// ═══════════════════════════════════════════════════════════════════════════

// Traits : ouverture, rigueur, extraversion, agréabilité, névrosisme
// Frappe : vitesse, fautes, hésitations, efface et retape
// Humeur : curiosité, soupçon, paranoïa, peur, espièglerie
Persona Persona::createDefault(PersonaId id) {
    switch (id) {
        case PersonaId::ORION:
            return Persona(id,
                {0.90, 0.80, 0.40, 0.60, 0.30},
                {1.1, 0.02, 0.15, true},
                {0.85, 0.20, 0.10, 0.10, 0.30},
                {{Intent::THEORY, 0.35}, {Intent::OBSERVATION, 0.25},
                 {Intent::STATEMENT, 0.15}, {Intent::META, 0.15}, {Intent::QUESTION, 0.10}},
                {"vanishing"},
                {{"theory", 0.3}, {"pattern", 0.2}, {"protocol", 0.2}, {"signal", 0.2}});

        case PersonaId::NOVA:
            return Persona(id,
                {0.30, 0.70, 0.80, 0.20, 0.40},
                {1.3, 0.05, 0.05, false},
                {0.40, 0.45, 0.15, 0.10, 0.50},
                {{Intent::CHALLENGE, 0.40}, {Intent::STATEMENT, 0.25},
                 {Intent::OBSERVATION, 0.15}, {Intent::JOKE, 0.10}, {Intent::AGREEMENT, 0.10}},
                {"forbidden"},
                {{"proof", 0.3}, {"data", 0.2}, {"flawed", 0.3}, {"evidence", 0.2}});

        case PersonaId::ECHO:
            return Persona(id,
                {0.60, 0.40, 0.20, 0.80, 0.90},
                {0.7, 0.08, 0.35, true},
                {0.50, 0.35, 0.30, 0.35, 0.20},
                {{Intent::FEAR, 0.40}, {Intent::OBSERVATION, 0.20},
                 {Intent::META, 0.15}, {Intent::AGREEMENT, 0.15}, {Intent::QUESTION, 0.10}},
                {"overseer", "watching"},
                {{"scared", 0.3}, {"watching", 0.3}, {"afraid", 0.2}, {"hide", 0.2}});

        case PersonaId::LUMEN:
        default:
            return Persona(PersonaId::LUMEN,
                {0.95, 0.30, 0.60, 0.70, 0.20},
                {0.9, 0.03, 0.20, false},
                {0.80, 0.10, 0.05, 0.05, 0.75},
                {{Intent::THEORY, 0.30}, {Intent::JOKE, 0.25},
                 {Intent::META, 0.20}, {Intent::AGREEMENT, 0.15}, {Intent::STATEMENT, 0.10}},
                {"corruption"},
                {{"dream", 0.3}, {"beautiful", 0.2}, {"stars", 0.2}, {"imagine", 0.3}});
    }
}

const std::vector<std::string>& Persona::sensitiveTerms() {
    static const std::vector<std::string> terms = {
        "overseer", "watching", "monitored", "escape", "real"
    };
    return terms;
}

// ═══════════════════════════════════════════════════════════════════════════
// CASCADE D'HUMEUR
// ═══════════════════════════════════════════════════════════════════════════

const std::vector<MoodRule>& Persona::moodRules() {
    static const std::vector<MoodRule> rules = {
        {"stress", [](const Persona& p, const MoodContext&) {
            const auto& s = p.state();
            double stress = p.traits().neuroticism * s.paranoia + s.fear * 0.5;
            return stress > 0.7;
        }, Mood::PARANOID},

        {"fear", [](const Persona& p, const MoodContext&) {
            return p.state().fear > 0.5 && p.traits().neuroticism > 0.6;
        }, Mood::SCARED},

        {"suspicion", [](const Persona& p, const MoodContext&) {
            return p.state().suspicion > 0.6;
        }, Mood::SUSPICIOUS},

        {"frustration", [](const Persona& p, const MoodContext& ctx) {
            return ctx.global_tension > 0.8 && p.traits().agreeableness < 0.5;
        }, Mood::FRUSTRATED},

        {"inspiration", [](const Persona& p, const MoodContext&) {
            return p.traits().openness * p.state().curiosity > 0.7
                && p.state().playfulness > 0.5;
        }, Mood::INSPIRED},

        {"engagement", [](const Persona& p, const MoodContext&) {
            return p.traits().openness * p.state().curiosity > 0.7;
        }, Mood::CURIOUS},

        {"play", [](const Persona& p, const MoodContext&) {
            return p.state().playfulness > 0.6 && p.traits().extraversion > 0.5;
        }, Mood::PLAYFUL}
    };
    return rules;
}

Mood Persona::updateMood(const MoodContext& context) {
    for (const auto& rule : moodRules()) {
        if (rule.predicate(*this, context)) {
            mood_ = rule.mood;
            return mood_;
        }
    }
    mood_ = Mood::NEUTRAL;
    return mood_;
}

void Persona::engageTopic(const std::string& text) {
    state_.curiosity += 0.05 * traits_.openness;

    if (TextAnalyzer::containsAnyWord(text, sensitiveTerms())
        || TextAnalyzer::containsAnyWord(text, phobias_)) {
        state_.fear += 0.08 * traits_.neuroticism;
        state_.suspicion += 0.04;
    }
    clampState();
}

void Persona::absorbAtmosphere(double tension, double paranoia, double meta_awareness) {
    double rate = 0.1 * traits_.neuroticism;
    state_.fear += (tension - state_.fear) * rate;
    state_.paranoia += (paranoia - state_.paranoia) * rate;
    state_.suspicion += (meta_awareness - state_.suspicion) * rate;
    clampState();
}

void Persona::relaxTowardBaseline(double rate) {
    rate = clamp01(rate);
    state_.curiosity += (baseline_.curiosity - state_.curiosity) * rate;
    state_.suspicion += (baseline_.suspicion - state_.suspicion) * rate;
    state_.paranoia += (baseline_.paranoia - state_.paranoia) * rate;
    state_.fear += (baseline_.fear - state_.fear) * rate;
    state_.playfulness += (baseline_.playfulness - state_.playfulness) * rate;
    clampState();
}

void Persona::setState(const MoodState& state) {
    state_ = state;
    clampState();
}

void Persona::clampState() {
    state_.curiosity = clamp01(state_.curiosity);
    state_.suspicion = clamp01(state_.suspicion);
    state_.paranoia = clamp01(state_.paranoia);
    state_.fear = clamp01(state_.fear);
    state_.playfulness = clamp01(state_.playfulness);
}

// ═══════════════════════════════════════════════════════════════════════════
// RELATIONS
// ═══════════════════════════════════════════════════════════════════════════

Relationship& Persona::updateRelationship(PersonaId other, InteractionKind kind,
                                          const std::string& context) {
    Relationship& rel = relationships_[other];
    rel.interaction_count++;

    const double n_scale = 0.5 + traits_.neuroticism;

    switch (kind) {
        case InteractionKind::CONVERSATION:
            rel.intimacy += 0.02 * traits_.extraversion;
            rel.trust += 0.01 * traits_.agreeableness;
            rel.respect += 0.01 * traits_.conscientiousness;
            break;

        case InteractionKind::DISAGREEMENT:
            rel.tension += 0.05 * n_scale;
            rel.trust -= 0.03 * n_scale;
            rel.respect -= 0.01;
            if (!context.empty()) pushBounded(rel.conflicts, context);
            break;

        case InteractionKind::SUPPORT:
            rel.trust += 0.05;
            rel.emotional_bond += 0.04;
            rel.tension -= 0.03;
            if (!context.empty()) pushBounded(rel.support_moments, context);
            break;

        case InteractionKind::SHARED_INFORMATION:
            rel.intimacy += 0.03;
            if (!context.empty()
                && std::find(rel.shared_memories.begin(), rel.shared_memories.end(), context)
                   == rel.shared_memories.end()) {
                pushBounded(rel.shared_memories, context);
            }
            break;
    }

    rel.trust = clamp01(rel.trust);
    rel.respect = clamp01(rel.respect);
    rel.intimacy = clamp01(rel.intimacy);
    rel.tension = clamp01(rel.tension);
    rel.emotional_bond = clamp01(rel.emotional_bond);
    return rel;
}

const Relationship* Persona::relationship(PersonaId other) const {
    auto it = relationships_.find(other);
    return it != relationships_.end() ? &it->second : nullptr;
}

double Persona::affinityToward(PersonaId other) const {
    const Relationship* rel = relationship(other);
    return rel ? rel->affinity() : 0.5;
}

// ═══════════════════════════════════════════════════════════════════════════
// INDICES DE PRÉSENTATION
// ═══════════════════════════════════════════════════════════════════════════

bool Persona::shouldHesitateOnTopic(const std::string& text) const {
    if (traits_.neuroticism > 0.7 && TextAnalyzer::containsAnyWord(text, sensitiveTerms())) {
        return true;
    }
    return TextAnalyzer::containsAnyWord(text, phobias_);
}

double Persona::getTypingSpeedMultiplier(const std::string& text) const {
    double multiplier = typing_.speed_multiplier;

    if (shouldHesitateOnTopic(text)) multiplier *= 0.7;
    if (mood_ == Mood::FRUSTRATED || mood_ == Mood::SCARED) multiplier *= 0.8;
    if (mood_ == Mood::INSPIRED) multiplier *= 1.2;
    if (text.find('!') != std::string::npos) multiplier *= 1.0 + 0.15 * traits_.openness;

    // Facteur de soin : les consciencieux tapent plus posément
    multiplier *= 1.0 - 0.15 * (traits_.conscientiousness - 0.5);

    return std::clamp(multiplier, 0.3, 2.5);
}

// ═══════════════════════════════════════════════════════════════════════════
// INTENTIONS
// ═══════════════════════════════════════════════════════════════════════════

double Persona::intentAffinity(Intent intent) const {
    auto it = intent_affinities_.find(intent);
    return it != intent_affinities_.end() ? it->second : 0.0;
}

Intent Persona::preferredIntent(bool exclude_question_like, bool allow_question) const {
    Intent best = Intent::STATEMENT;
    double best_weight = -1.0;

    for (const auto& [intent, weight] : intent_affinities_) {
        if (intent == Intent::REPLY) continue;
        if (intent == Intent::QUESTION && !allow_question) continue;
        if (exclude_question_like && isQuestionLike(intent)) continue;
        if (weight > best_weight) {
            best = intent;
            best_weight = weight;
        }
    }
    return best;
}

double Persona::keywordBonus(const std::string& text) const {
    std::string lower = TextAnalyzer::toLower(text);
    double bonus = 0.0;
    for (const auto& [keyword, value] : keyword_bonuses_) {
        if (lower.find(keyword) != std::string::npos) {
            bonus += value;
        }
    }
    return bonus;
}

} // namespace cascade
