/**
 * @file NarrativeMemory.cpp
 * @brief Implémentation de la mémoire narrative globale
 * @version 1.0
 * @date 2026-10-19
 */

#include "NarrativeMemory.hpp"
#include "TextAnalyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace cascade {

using json = nlohmann::json;

namespace {

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

} // namespace

NarrativeMemory::NarrativeMemory(const MemoryConfig& config, Rng& rng, TimeSource clock)
    : config_(config)
    , rng_(rng)
    , clock_(std::move(clock))
{
    threats_.fill(0.0);
    threat_responded_.fill(false);
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉVÉNEMENTS
// ═══════════════════════════════════════════════════════════════════════════

void NarrativeMemory::addNarrativeEvent(const std::string& type, double value,
                                        const std::string& actor,
                                        const std::string& description) {
    NarrativeEvent event;
    event.type = type;
    event.value = value;
    event.actor = actor;
    event.description = description;
    event.timestamp = clock_();
    event.loop = loop_count_;

    history_.push_back(std::move(event));
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }
}

void NarrativeMemory::addGlitchEvent(const std::string& type, const std::string& description,
                                     double severity) {
    glitch_count_++;
    addNarrativeEvent("glitch", severity, type, description);

    tension_ = clamp01(tension_ + config_.glitch_tension_factor * severity);
    updateThreatLevel(ThreatKind::SYSTEM_INSTABILITY, 0.03 * severity);

    bool is_red = TextAnalyzer::toLower(type).find("red") != std::string::npos
               || severity > config_.red_severity_threshold;
    if (is_red) {
        flags_.rare_red_glitch = true;
        paranoia_ = clamp01(paranoia_ + config_.red_paranoia_bump);
        if (!quiet_mode_) {
            std::cout << "[NarrativeMemory] ⚠ Glitch rouge: " << type
                      << " (sévérité " << severity << ")\n";
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// MENACES
// ═══════════════════════════════════════════════════════════════════════════

void NarrativeMemory::updateThreatLevel(ThreatKind kind, double delta) {
    size_t idx = threatIndex(kind);
    threats_[idx] = clamp01(threats_[idx] + delta);

    if (threats_[idx] >= config_.threat_response_threshold && !threat_responded_[idx]) {
        threat_responded_[idx] = true;
        applyThreatResponse(kind);
    }
}

void NarrativeMemory::applyThreatResponse(ThreatKind kind) {
    switch (kind) {
        case ThreatKind::OVERSEER:
            flags_.overseer_direct_ping = true;
            break;
        case ThreatKind::REALITY_QUESTIONING:
            flags_.characters_suspect_simulation = true;
            break;
        case ThreatKind::SYSTEM_INSTABILITY:
            flags_.system_compromised = true;
            break;
        case ThreatKind::OBSERVER_EXPOSURE:
            flags_.observer_detected = true;
            break;
        case ThreatKind::PROTOCOL_LEAK:
            flags_.protocol_leaked = true;
            break;
        case ThreatKind::MEMORY_CORRUPTION:
            meta_awareness_ = clamp01(meta_awareness_ + 0.1);
            break;
    }

    addNarrativeEvent("threat_response", threats_[threatIndex(kind)], threatKindToString(kind));
    if (!quiet_mode_) {
        std::cout << "[NarrativeMemory] Seuil de menace franchi: "
                  << threatKindToString(kind) << "\n";
    }
}

double NarrativeMemory::threatLevel(ThreatKind kind) const {
    return threats_[threatIndex(kind)];
}

double NarrativeMemory::threatSum() const {
    return std::accumulate(threats_.begin(), threats_.end(), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// OVERSEER
// ═══════════════════════════════════════════════════════════════════════════

double NarrativeMemory::overseerChance() const {
    double escalation = static_cast<double>(loop_count_ + glitch_count_ + overseer_warnings_);
    double chance = config_.overseer_base_chance
                  * (1.0 + threatSum())
                  * (1.0 + config_.overseer_escalation * escalation);

    if (flags_.rare_red_glitch) chance += config_.red_glitch_bonus;
    if (meta_awareness_ > config_.high_meta_threshold) chance += config_.high_meta_bonus;
    if (flags_.observer_detected) chance += config_.observer_bonus;

    return clamp01(chance);
}

bool NarrativeMemory::overseerCooldownElapsed() const {
    if (!last_overseer_) {
        return true;
    }
    return secondsBetween(*last_overseer_, clock_()) >= config_.overseer_cooldown_s;
}

double NarrativeMemory::overseerChanceOver(double exposure_s) const {
    double chance = overseerChance();
    if (chance >= 1.0) {
        return 1.0;
    }
    if (exposure_s <= 0.0 || config_.overseer_trial_s <= 0.0) {
        return 0.0;
    }
    return 1.0 - std::pow(1.0 - chance, exposure_s / config_.overseer_trial_s);
}

bool NarrativeMemory::shouldInjectOverseer() {
    if (!overseerCooldownElapsed()) {
        return false;
    }

    const TimePoint now = clock_();
    double exposure = config_.overseer_trial_s;
    if (last_overseer_roll_ || last_overseer_) {
        TimePoint start = last_overseer_roll_ ? *last_overseer_roll_ : *last_overseer_;
        if (last_overseer_) {
            start = std::max(start, *last_overseer_ + std::chrono::duration_cast<SteadyClock::duration>(
                std::chrono::duration<double>(config_.overseer_cooldown_s)));
        }
        exposure = std::max(secondsBetween(start, now), 0.0);
    }
    last_overseer_roll_ = now;

    double chance = overseerChanceOver(exposure);
    if (rng_.uniform() >= chance) {
        return false;
    }

    last_overseer_ = now;
    overseer_warnings_++;
    if (overseer_warnings_ > config_.direct_ping_warnings) {
        flags_.overseer_direct_ping = true;
    }
    addNarrativeEvent("overseer", chance, OVERSEER_SPEAKER, "overseer interruption");

    if (!quiet_mode_) {
        std::cout << "[NarrativeMemory] Overseer déclenché (p=" << std::fixed
                  << std::setprecision(3) << chance << ", avertissements="
                  << overseer_warnings_ << ")\n";
    }
    return true;
}

void NarrativeMemory::resetOverseerCooldown() {
    last_overseer_ = clock_();
}

// ═══════════════════════════════════════════════════════════════════════════
// BOUCLE
// ═══════════════════════════════════════════════════════════════════════════

void NarrativeMemory::reset() {
    loop_count_++;
    glitch_count_ = 0;
    overseer_warnings_ = 0;

    // Résidu « déjà-vu »
    tension_ = clamp01(tension_ * config_.reset_tension_factor);
    paranoia_ = clamp01(paranoia_ * config_.reset_paranoia_factor);
    meta_awareness_ = clamp01(meta_awareness_ * config_.reset_meta_factor
                              + config_.reset_meta_residue);
    for (double& level : threats_) {
        level = clamp01(level * config_.reset_threat_factor);
    }
    threat_responded_.fill(false);

    // Drapeaux de boucle (la suspicion de simulation persiste)
    bool suspects = flags_.characters_suspect_simulation;
    flags_ = NarrativeFlags{};
    flags_.characters_suspect_simulation = suspects;

    rumors_.clear();

    // Seuls les concepts importants survivent
    for (auto it = concepts_.begin(); it != concepts_.end();) {
        if (it->second.importance < config_.concept_keep_importance) {
            it = concepts_.erase(it);
        } else {
            ++it;
        }
    }
    concept_order_.erase(
        std::remove_if(concept_order_.begin(), concept_order_.end(),
            [this](const std::string& name) { return concepts_.count(name) == 0; }),
        concept_order_.end());

    addNarrativeEvent("loop_reset", static_cast<double>(loop_count_));

    if (!quiet_mode_) {
        std::cout << "[NarrativeMemory] Nouvelle boucle #" << loop_count_
                  << " (concepts conservés: " << concepts_.size() << ")\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CONCEPTS ET RUMEURS
// ═══════════════════════════════════════════════════════════════════════════

void NarrativeMemory::rememberConcept(const std::string& name, double importance,
                                      const std::string& introducer) {
    auto it = concepts_.find(name);
    if (it != concepts_.end()) {
        it->second.mentions++;
        it->second.importance = std::max(it->second.importance, clamp01(importance));
        return;
    }

    Concept entry;
    entry.name = name;
    entry.mentions = 1;
    entry.importance = clamp01(importance);
    entry.introducer = introducer;
    concepts_.emplace(name, entry);
    concept_order_.push_back(name);

    while (concepts_.size() > config_.max_concepts && !concept_order_.empty()) {
        concepts_.erase(concept_order_.front());
        concept_order_.pop_front();
    }
}

bool NarrativeMemory::hasConcept(const std::string& name) const {
    return concepts_.count(name) > 0;
}

std::optional<Concept> NarrativeMemory::findConcept(const std::string& name) const {
    auto it = concepts_.find(name);
    if (it == concepts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void NarrativeMemory::addRumor(const std::string& text, const std::string& source,
                               double strength, double credibility) {
    for (auto& rumor : rumors_) {
        if (rumor.text == text) {
            rumor.strength = clamp01(rumor.strength + 0.5 * strength);
            return;
        }
    }

    rumors_.push_back({text, clamp01(strength), clamp01(credibility), source});
    while (rumors_.size() > config_.max_rumors) {
        rumors_.pop_front();
    }
    addNarrativeEvent("rumor", strength, source, text);
}

void NarrativeMemory::decayRumors() {
    for (auto& rumor : rumors_) {
        rumor.strength = clamp01(rumor.strength - config_.rumor_decay);
    }
    rumors_.erase(
        std::remove_if(rumors_.begin(), rumors_.end(),
            [](const Rumor& r) { return r.strength <= 0.0; }),
        rumors_.end());
}

bool NarrativeMemory::hasActiveRumor(const std::string& fragment) const {
    std::string needle = TextAnalyzer::toLower(fragment);
    return std::any_of(rumors_.begin(), rumors_.end(), [&](const Rumor& r) {
        return r.strength >= config_.rumor_active_strength
            && TextAnalyzer::toLower(r.text).find(needle) != std::string::npos;
    });
}

bool NarrativeMemory::protocolRumorActive() const {
    return hasActiveRumor("protocol");
}

// ═══════════════════════════════════════════════════════════════════════════
// OBSERVATEURS ET SCALAIRES
// ═══════════════════════════════════════════════════════════════════════════

void NarrativeMemory::registerObserver(const std::string& name) {
    observer_count_++;
    flags_.observer_detected = true;
    updateThreatLevel(ThreatKind::OBSERVER_EXPOSURE, 0.1);
    addNarrativeEvent("observer", static_cast<double>(observer_count_), name);
}

void NarrativeMemory::adjustTension(double delta) { tension_ = clamp01(tension_ + delta); }
void NarrativeMemory::adjustParanoia(double delta) { paranoia_ = clamp01(paranoia_ + delta); }
void NarrativeMemory::adjustMetaAwareness(double delta) { meta_awareness_ = clamp01(meta_awareness_ + delta); }
void NarrativeMemory::adjustCohesion(double delta) { cohesion_ = clamp01(cohesion_ + delta); }
void NarrativeMemory::setTension(double value) { tension_ = clamp01(value); }
void NarrativeMemory::setParanoia(double value) { paranoia_ = clamp01(value); }
void NarrativeMemory::setMetaAwareness(double value) { meta_awareness_ = clamp01(value); }
void NarrativeMemory::setCohesion(double value) { cohesion_ = clamp01(value); }

void NarrativeMemory::decayTowardBaseline(double rate, double tension_baseline,
                                          double cohesion_baseline) {
    tension_ = clamp01(tension_ + (tension_baseline - tension_) * rate);
    cohesion_ = clamp01(cohesion_ + (cohesion_baseline - cohesion_) * rate);
}

// ═══════════════════════════════════════════════════════════════════════════
// ACCESSEURS
// ═══════════════════════════════════════════════════════════════════════════

std::vector<NarrativeEvent> NarrativeMemory::recentEvents(size_t count) const {
    size_t n = std::min(count, history_.size());
    return std::vector<NarrativeEvent>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

std::optional<std::string> NarrativeMemory::latestNotableEvent() const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->type == "glitch" || it->type == "overseer" || it->type == "threat_response") {
            if (it->type == "glitch") {
                return "the " + it->actor;
            }
            if (it->type == "overseer") {
                return "the overseer's warning";
            }
            return "the " + TextAnalyzer::toLower(it->actor) + " alert";
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// DIAGNOSTIC
// ═══════════════════════════════════════════════════════════════════════════

std::string NarrativeMemory::debugSnapshot() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "═══ MÉMOIRE NARRATIVE ═══\n"
        << "  Boucle: " << loop_count_
        << " | Glitches: " << glitch_count_
        << " | Avertissements: " << overseer_warnings_
        << " | Observateurs: " << observer_count_ << "\n"
        << "  Tension: " << tension_
        << " | Paranoïa: " << paranoia_
        << " | Méta: " << meta_awareness_
        << " | Cohésion: " << cohesion_ << "\n"
        << "  Menaces:";
    for (ThreatKind kind : ALL_THREAT_KINDS) {
        oss << " " << threatKindToString(kind) << "=" << threatLevel(kind);
    }
    oss << " (Σ=" << threatSum() << ")\n"
        << "  Drapeaux:"
        << (flags_.observer_detected ? " OBSERVER" : "")
        << (flags_.system_compromised ? " COMPROMISED" : "")
        << (flags_.rare_red_glitch ? " RED_GLITCH" : "")
        << (flags_.characters_suspect_simulation ? " SUSPECT_SIM" : "")
        << (flags_.overseer_direct_ping ? " DIRECT_PING" : "")
        << (flags_.protocol_leaked ? " PROTOCOL_LEAK" : "")
        << (flags_.deep_discussion ? " DEEP" : "") << "\n"
        << "  Risque Overseer: " << overseerChance()
        << (overseerCooldownElapsed() ? "" : " (délai actif)") << "\n"
        << "  Concepts: " << concepts_.size()
        << " | Rumeurs: " << rumors_.size()
        << " | Historique: " << history_.size() << "\n";
    return oss.str();
}

json NarrativeMemory::toJson() const {
    json threats = json::object();
    for (ThreatKind kind : ALL_THREAT_KINDS) {
        threats[threatKindToString(kind)] = threatLevel(kind);
    }

    json rumors = json::array();
    for (const auto& r : rumors_) {
        rumors.push_back({{"text", r.text}, {"strength", r.strength},
                          {"credibility", r.credibility}, {"source", r.source}});
    }

    json concepts = json::array();
    for (const auto& [name, c] : concepts_) {
        concepts.push_back({{"name", name}, {"mentions", c.mentions},
                            {"importance", c.importance}, {"introducer", c.introducer}});
    }

    return json{
        {"loop_count", loop_count_},
        {"glitch_count", glitch_count_},
        {"overseer_warnings", overseer_warnings_},
        {"observer_count", observer_count_},
        {"tension", tension_},
        {"paranoia", paranoia_},
        {"meta_awareness", meta_awareness_},
        {"cohesion", cohesion_},
        {"flags", {
            {"observer_detected", flags_.observer_detected},
            {"system_compromised", flags_.system_compromised},
            {"rare_red_glitch", flags_.rare_red_glitch},
            {"characters_suspect_simulation", flags_.characters_suspect_simulation},
            {"overseer_direct_ping", flags_.overseer_direct_ping},
            {"protocol_leaked", flags_.protocol_leaked},
            {"deep_discussion", flags_.deep_discussion}
        }},
        {"threats", threats},
        {"overseer_chance", overseerChance()},
        {"rumors", rumors},
        {"concepts", concepts},
        {"history_size", history_.size()}
    };
}

} // namespace cascade
