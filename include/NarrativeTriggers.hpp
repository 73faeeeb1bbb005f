/**
 * @file NarrativeTriggers.hpp
 * @brief Registre des déclencheurs narratifs (cause → effet)
 * @version 1.0
 * @date 2026-10-19
 *
 * Sources d'événements :
 * - Commandes des spectateurs (!glitch, !tension, !observe, !question)
 * - Contrôles périodiques de l'état (HighTension, HighAwareness)
 *
 * Expose aussi l'ambiance d'environnement (CALM, CURIOUS, PARANOID)
 * dérivée de l'humeur du personnage meneur.
 */

#ifndef CASCADE_NARRATIVE_TRIGGERS_HPP
#define CASCADE_NARRATIVE_TRIGGERS_HPP

#include "Types.hpp"
#include "Random.hpp"
#include "NarrativeMemory.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Ambiance d'arrière-plan pour la couche de présentation
 */
enum class EnvironmentCue : uint8_t {
    CALM,
    CURIOUS,
    PARANOID
};

inline std::string environmentCueToString(EnvironmentCue cue) {
    switch (cue) {
        case EnvironmentCue::CALM:     return "CALM";
        case EnvironmentCue::CURIOUS:  return "CURIOUS";
        case EnvironmentCue::PARANOID: return "PARANOID";
        default:                       return "UNKNOWN";
    }
}

/**
 * @brief Résultat du traitement d'un message spectateur
 */
struct ViewerCommandResult {
    bool is_command = false;                    // Commande reconnue et exécutée
    std::optional<std::string> injected_text;   // Texte à traiter comme message
};

class NarrativeTriggers {
public:
    using TriggerAction = std::function<void(const std::string& source)>;
    using MoodSource = std::function<Mood()>;
    using CueCallback = std::function<void(EnvironmentCue)>;

    // Seuils des contrôles d'état
    static constexpr double HIGH_TENSION = 0.8;
    static constexpr double HIGH_AWARENESS = 0.7;

    NarrativeTriggers(NarrativeMemory& memory, Rng& rng);

    void registerTrigger(const std::string& name, TriggerAction action);

    /**
     * @return false si aucun déclencheur ne porte ce nom
     */
    bool trigger(const std::string& name, const std::string& source);

    [[nodiscard]] bool hasTrigger(const std::string& name) const;

    /**
     * @brief Évalue les seuils d'état et déclenche les événements associés
     * @return Noms des déclencheurs exécutés
     */
    std::vector<std::string> checkStateTriggers();

    /**
     * @brief Interprète un message spectateur (commande « ! » ou texte libre)
     */
    ViewerCommandResult handleViewerCommand(const std::string& user, const std::string& text);

    // ═══════════════════════════════════════════════════════════════════════
    // ENVIRONNEMENT
    // ═══════════════════════════════════════════════════════════════════════

    static EnvironmentCue cueForMood(Mood mood);

    /// Recalcule l'ambiance depuis l'humeur du meneur
    EnvironmentCue refreshEnvironment();

    [[nodiscard]] EnvironmentCue environmentCue() const { return cue_; }

    void setLeadMoodSource(MoodSource source) { lead_mood_ = std::move(source); }
    void setCueCallback(CueCallback callback) { on_cue_change_ = std::move(callback); }

    [[nodiscard]] size_t firedCount() const { return fired_count_; }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    void initEventRegistry();

    NarrativeMemory& memory_;
    Rng& rng_;
    bool quiet_mode_ = false;

    std::map<std::string, TriggerAction> registry_;
    std::map<std::string, std::string> viewer_commands_;   // commande → déclencheur

    MoodSource lead_mood_;
    CueCallback on_cue_change_;
    EnvironmentCue cue_ = EnvironmentCue::CALM;
    size_t fired_count_ = 0;
};

} // namespace cascade

#endif // CASCADE_NARRATIVE_TRIGGERS_HPP
