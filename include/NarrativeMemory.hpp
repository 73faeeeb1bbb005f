/**
 * @file NarrativeMemory.hpp
 * @brief Mémoire narrative globale : tension, menaces, rumeurs, concepts
 * @version 1.0
 * @date 2026-10-19
 *
 * Objet de contexte partagé unique, injecté par référence dans chaque
 * composant. Porte :
 * - Les compteurs de boucle (boucle, glitches, avertissements, observateurs)
 * - Les scalaires atmosphériques bornés dans [0, 1]
 * - La carte des niveaux de menace et leurs réponses uniques par boucle
 * - Le risque d'interruption « Overseer » (hasard multiplicatif, avec délai)
 * - L'historique borné des événements, les concepts et les rumeurs
 *
 * reset() avance la boucle et atténue (sans effacer) l'état émotionnel :
 * un résidu « déjà-vu » subsiste d'une boucle à l'autre.
 */

#ifndef CASCADE_NARRATIVE_MEMORY_HPP
#define CASCADE_NARRATIVE_MEMORY_HPP

#include "Types.hpp"
#include "Config.hpp"
#include "Random.hpp"
#include <array>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cascade {

/**
 * @brief Entrée de l'historique narratif
 */
struct NarrativeEvent {
    std::string type;
    double value = 0.0;
    std::string actor;
    std::string description;
    TimePoint timestamp;
    int loop = 1;
};

/**
 * @brief Concept mémorisé (survit aux boucles si important)
 */
struct Concept {
    std::string name;
    int mentions = 0;
    double importance = 0.0;
    std::string introducer;
};

/**
 * @brief Rumeur active
 */
struct Rumor {
    std::string text;
    double strength = 0.6;
    double credibility = 0.5;
    std::string source;
};

/**
 * @brief Drapeaux narratifs
 */
struct NarrativeFlags {
    bool observer_detected = false;
    bool system_compromised = false;
    bool rare_red_glitch = false;
    bool characters_suspect_simulation = false;
    bool overseer_direct_ping = false;
    bool protocol_leaked = false;
    bool deep_discussion = false;
};

class NarrativeMemory {
public:
    NarrativeMemory(const MemoryConfig& config, Rng& rng,
                    TimeSource clock = systemTimeSource());

    // ═══════════════════════════════════════════════════════════════════════
    // ÉVÉNEMENTS
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Ajoute une entrée à l'historique borné
     */
    void addNarrativeEvent(const std::string& type, double value,
                           const std::string& actor = "",
                           const std::string& description = "");

    /**
     * @brief Glitch : compteur ↑, tension ↑ ∝ sévérité ; rouge si le type
     *        contient « red » ou si la sévérité dépasse le seuil
     */
    void addGlitchEvent(const std::string& type, const std::string& description,
                        double severity);

    // ═══════════════════════════════════════════════════════════════════════
    // MENACES
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Accumulation bornée ; le franchissement du seuil déclenche
     *        une réponse unique pour la boucle en cours
     */
    void updateThreatLevel(ThreatKind kind, double delta);

    [[nodiscard]] double threatLevel(ThreatKind kind) const;
    [[nodiscard]] double threatSum() const;

    // ═══════════════════════════════════════════════════════════════════════
    // OVERSEER
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Probabilité d'injection au prochain tirage (calcul pur)
     *
     * chance = base × (1 + Σmenaces) × (1 + k·(boucle + glitches + avertissements))
     *          + bonus (glitch rouge, méta-conscience élevée, observateur)
     */
    [[nodiscard]] double overseerChance() const;

    /// true si le délai minimal depuis la dernière injection est écoulé
    [[nodiscard]] bool overseerCooldownElapsed() const;

    /**
     * @brief Probabilité d'injection pour une exposition donnée
     *
     * p = 1 - (1 - chance)^(exposition / durée d'une épreuve)
     */
    [[nodiscard]] double overseerChanceOver(double exposure_s) const;

    /**
     * @brief Épreuve de Bernoulli soumise au délai
     *
     * L'exposition couvre le temps écoulé depuis le tirage précédent (ou
     * depuis la fin du délai) : le risque par seconde ne dépend pas de la
     * fréquence d'appel. Le premier tirage vaut une épreuve entière.
     *
     * @return true si l'Overseer intervient (délai réarmé, avertissement compté)
     */
    bool shouldInjectOverseer();

    /// Réarme le délai à l'instant présent
    void resetOverseerCooldown();

    // ═══════════════════════════════════════════════════════════════════════
    // BOUCLE
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Boucle suivante : atténuation, nettoyage des drapeaux de boucle
     */
    void reset();

    // ═══════════════════════════════════════════════════════════════════════
    // CONCEPTS ET RUMEURS
    // ═══════════════════════════════════════════════════════════════════════

    void rememberConcept(const std::string& name, double importance,
                         const std::string& introducer = "");
    [[nodiscard]] bool hasConcept(const std::string& name) const;
    [[nodiscard]] std::optional<Concept> findConcept(const std::string& name) const;

    void addRumor(const std::string& text, const std::string& source,
                  double strength = 0.6, double credibility = 0.5);
    void decayRumors();
    [[nodiscard]] bool hasActiveRumor(const std::string& fragment) const;
    [[nodiscard]] bool protocolRumorActive() const;

    // ═══════════════════════════════════════════════════════════════════════
    // OBSERVATEURS ET SCALAIRES
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Un spectateur se manifeste : compteur ↑, observateur détecté
     */
    void registerObserver(const std::string& name);

    void adjustTension(double delta);
    void adjustParanoia(double delta);
    void adjustMetaAwareness(double delta);
    void adjustCohesion(double delta);
    void setTension(double value);
    void setParanoia(double value);
    void setMetaAwareness(double value);
    void setCohesion(double value);

    void setDeepDiscussion(bool value) { flags_.deep_discussion = value; }
    void setObserverDetected(bool value) { flags_.observer_detected = value; }

    /**
     * @brief Retour doux de la tension et de la cohésion vers leur ligne de base
     */
    void decayTowardBaseline(double rate, double tension_baseline, double cohesion_baseline);

    // ═══════════════════════════════════════════════════════════════════════
    // ACCESSEURS
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] int loopCount() const { return loop_count_; }
    [[nodiscard]] int glitchCount() const { return glitch_count_; }
    [[nodiscard]] int overseerWarnings() const { return overseer_warnings_; }
    [[nodiscard]] int observerCount() const { return observer_count_; }
    [[nodiscard]] double tension() const { return tension_; }
    [[nodiscard]] double paranoia() const { return paranoia_; }
    [[nodiscard]] double metaAwareness() const { return meta_awareness_; }
    [[nodiscard]] double cohesion() const { return cohesion_; }
    [[nodiscard]] const NarrativeFlags& flags() const { return flags_; }
    [[nodiscard]] bool rareRedGlitchOccurred() const { return flags_.rare_red_glitch; }

    [[nodiscard]] const std::deque<NarrativeEvent>& history() const { return history_; }
    [[nodiscard]] std::vector<NarrativeEvent> recentEvents(size_t count) const;

    /// Dernier événement marquant (glitch, overseer...) pour le jeton {event}
    [[nodiscard]] std::optional<std::string> latestNotableEvent() const;

    [[nodiscard]] const std::map<std::string, Concept>& concepts() const { return concepts_; }
    [[nodiscard]] const std::deque<Rumor>& rumors() const { return rumors_; }

    // ═══════════════════════════════════════════════════════════════════════
    // DIAGNOSTIC
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] std::string debugSnapshot() const;
    [[nodiscard]] nlohmann::json toJson() const;

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    void applyThreatResponse(ThreatKind kind);
    static size_t threatIndex(ThreatKind kind) { return static_cast<size_t>(kind); }

    MemoryConfig config_;
    Rng& rng_;
    TimeSource clock_;
    bool quiet_mode_ = false;

    // Compteurs
    int loop_count_ = 1;
    int glitch_count_ = 0;
    int overseer_warnings_ = 0;
    int observer_count_ = 0;

    // Scalaires [0, 1]
    double tension_ = 0.3;
    double paranoia_ = 0.1;
    double meta_awareness_ = 0.1;
    double cohesion_ = 0.5;

    NarrativeFlags flags_;

    // Menaces et réponses déjà déclenchées cette boucle
    std::array<double, NUM_THREAT_KINDS> threats_{};
    std::array<bool, NUM_THREAT_KINDS> threat_responded_{};

    std::optional<TimePoint> last_overseer_;
    std::optional<TimePoint> last_overseer_roll_;

    std::deque<NarrativeEvent> history_;
    std::map<std::string, Concept> concepts_;
    std::deque<std::string> concept_order_;   // Ordre d'insertion (éviction)
    std::deque<Rumor> rumors_;
};

} // namespace cascade

#endif // CASCADE_NARRATIVE_MEMORY_HPP
