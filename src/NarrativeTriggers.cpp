/**
 * @file NarrativeTriggers.cpp
 * @brief Implémentation du registre des déclencheurs narratifs
 * @version 1.0
 * @date 2026-10-19
 */

#include "NarrativeTriggers.hpp"
#include "TextAnalyzer.hpp"
#include <iostream>

namespace cascade {

namespace {

const std::string VIEWER_QUESTION = "Are you really real?";

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

NarrativeTriggers::NarrativeTriggers(NarrativeMemory& memory, Rng& rng)
    : memory_(memory)
    , rng_(rng)
{
    initEventRegistry();
}

void NarrativeTriggers::initEventRegistry() {
    // Déclenchés par les spectateurs
    registry_["ViewerGlitchRequest"] = [this](const std::string& source) {
        memory_.addGlitchEvent("viewer glitch", "requested by " + source, rng_.range(0.5, 1.5));
    };
    registry_["ViewerTensionUp"] = [this](const std::string& source) {
        memory_.adjustTension(0.2);
        memory_.addNarrativeEvent("viewer_tension", memory_.tension(), source);
    };
    registry_["ViewerObserve"] = [this](const std::string& source) {
        memory_.registerObserver(source);
        refreshEnvironment();
    };
    registry_["ViewerMessage"] = [this](const std::string& source) {
        memory_.setObserverDetected(true);
        memory_.addNarrativeEvent("viewer_message", 1.0, source);
    };

    // Déclenchés par l'état de la simulation
    registry_["HighTension"] = [this](const std::string& source) {
        memory_.addGlitchEvent("tension spike", "triggered by " + source, 1.0);
    };
    registry_["HighAwareness"] = [this](const std::string&) {
        memory_.updateThreatLevel(ThreatKind::REALITY_QUESTIONING, 0.1);
        refreshEnvironment();
    };

    viewer_commands_ = {
        {"!glitch", "ViewerGlitchRequest"},
        {"!tension", "ViewerTensionUp"},
        {"!observe", "ViewerObserve"}
    };
}

void NarrativeTriggers::registerTrigger(const std::string& name, TriggerAction action) {
    registry_[name] = std::move(action);
}

bool NarrativeTriggers::trigger(const std::string& name, const std::string& source) {
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        if (!quiet_mode_) {
            std::cerr << "[NarrativeTriggers] Déclencheur inconnu: " << name << "\n";
        }
        return false;
    }

    if (!quiet_mode_) {
        std::cout << "[NarrativeTriggers] Événement '" << name << "' déclenché par '"
                  << source << "'\n";
    }
    it->second(source);
    fired_count_++;
    return true;
}

bool NarrativeTriggers::hasTrigger(const std::string& name) const {
    return registry_.count(name) > 0;
}

std::vector<std::string> NarrativeTriggers::checkStateTriggers() {
    std::vector<std::string> fired;
    if (memory_.tension() > HIGH_TENSION && trigger("HighTension", "GlobalTensionCheck")) {
        fired.push_back("HighTension");
    }
    if (memory_.metaAwareness() > HIGH_AWARENESS && trigger("HighAwareness", "MetaAwarenessCheck")) {
        fired.push_back("HighAwareness");
    }
    return fired;
}

ViewerCommandResult NarrativeTriggers::handleViewerCommand(const std::string& user,
                                                           const std::string& text) {
    ViewerCommandResult result;
    std::string command = TextAnalyzer::toLower(trim(text));

    if (command == "!question") {
        result.is_command = true;
        result.injected_text = VIEWER_QUESTION;
        trigger("ViewerMessage", user);
        return result;
    }

    auto it = viewer_commands_.find(command);
    if (it != viewer_commands_.end()) {
        result.is_command = trigger(it->second, user);
        return result;
    }

    // Message libre : traité comme une réplique adressée aux personnages
    result.injected_text = text;
    trigger("ViewerMessage", user);
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENVIRONNEMENT
// ═══════════════════════════════════════════════════════════════════════════

EnvironmentCue NarrativeTriggers::cueForMood(Mood mood) {
    switch (mood) {
        case Mood::CURIOUS:
        case Mood::INSPIRED:
            return EnvironmentCue::CURIOUS;
        case Mood::PARANOID:
        case Mood::SCARED:
        case Mood::FRUSTRATED:
            return EnvironmentCue::PARANOID;
        default:
            return EnvironmentCue::CALM;
    }
}

EnvironmentCue NarrativeTriggers::refreshEnvironment() {
    if (!lead_mood_) {
        return cue_;
    }
    EnvironmentCue next = cueForMood(lead_mood_());
    if (next != cue_) {
        cue_ = next;
        if (!quiet_mode_) {
            std::cout << "[NarrativeTriggers] Ambiance → " << environmentCueToString(cue_) << "\n";
        }
        if (on_cue_change_) {
            on_cue_change_(cue_);
        }
    }
    return cue_;
}

} // namespace cascade
