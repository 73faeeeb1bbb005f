/**
 * @file Config.hpp
 * @brief Configuration numérique compilée du moteur narratif
 * @version 1.0
 * @date 2026-10-19
 *
 * Toutes les valeurs par défaut sont compilées. Un fichier JSON peut les
 * surcharger au lancement (loadConfig), clé par clé.
 */

#ifndef CASCADE_CONFIG_HPP
#define CASCADE_CONFIG_HPP

#include <array>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace cascade {

// ═══════════════════════════════════════════════════════════════════════════
// FILS DE CONVERSATION
// ═══════════════════════════════════════════════════════════════════════════

struct ThreadConfig {
    size_t phase_message_threshold = 5;      // Avance au 6e message d'une phase
    size_t text_history_size = 20;           // Historique local des répliques
    double idle_prune_seconds = 120.0;       // Fermeture des fils inactifs
};

// ═══════════════════════════════════════════════════════════════════════════
// MÉMOIRE NARRATIVE
// ═══════════════════════════════════════════════════════════════════════════

struct MemoryConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Bornes
    // ─────────────────────────────────────────────────────────────────────────
    size_t history_size = 100;
    size_t max_concepts = 50;
    size_t max_rumors = 20;

    // ─────────────────────────────────────────────────────────────────────────
    // Glitches et menaces
    // ─────────────────────────────────────────────────────────────────────────
    double glitch_tension_factor = 0.05;     // tension += facteur × sévérité
    double red_severity_threshold = 2.5;
    double red_paranoia_bump = 0.10;
    double threat_response_threshold = 0.70; // Réponse unique par boucle

    // ─────────────────────────────────────────────────────────────────────────
    // Risque Overseer (hasard multiplicatif)
    // ─────────────────────────────────────────────────────────────────────────
    double overseer_cooldown_s = 45.0;
    double overseer_trial_s = 4.0;           // Exposition valant une épreuve
    double overseer_base_chance = 0.02;
    double overseer_escalation = 0.05;       // × (loop + glitches + warnings)
    double red_glitch_bonus = 0.05;
    double high_meta_bonus = 0.03;
    double high_meta_threshold = 0.70;
    double observer_bonus = 0.02;
    int direct_ping_warnings = 4;            // Au-delà : ping direct

    // ─────────────────────────────────────────────────────────────────────────
    // Réinitialisation de boucle (résidu « déjà-vu »)
    // ─────────────────────────────────────────────────────────────────────────
    double reset_tension_factor = 0.30;
    double reset_paranoia_factor = 0.50;
    double reset_meta_factor = 0.90;
    double reset_meta_residue = 0.05;
    double reset_threat_factor = 0.50;
    double concept_keep_importance = 0.70;

    // ─────────────────────────────────────────────────────────────────────────
    // Rumeurs
    // ─────────────────────────────────────────────────────────────────────────
    double rumor_decay = 0.05;
    double rumor_active_strength = 0.20;
};

// ═══════════════════════════════════════════════════════════════════════════
// GÉNÉRATION DES RÉPLIQUES
// ═══════════════════════════════════════════════════════════════════════════

struct ReplyConfig {
    size_t recent_lines_size = 30;
    size_t recent_intents_size = 8;
    double near_duplicate_threshold = 0.70;
    double hesitation_factor = 0.30;         // p = facteur × névrosisme
    double catch_phrase_chance = 0.06;
    size_t max_retries = 5;
    bool enable_question_intent = false;     // Taxonomie sans QUESTION par défaut
};

// ═══════════════════════════════════════════════════════════════════════════
// RYTHME
// ═══════════════════════════════════════════════════════════════════════════

struct PacingConfig {
    double base_interval_s = 4.0;
    double min_interval_s = 1.5;
    double max_interval_s = 9.0;
    double jitter = 0.15;                    // ± 15 %
    double hard_ceiling_s = 12.0;
    double high_tension = 0.70;
    double high_tension_factor = 0.75;
    double low_tension = 0.30;
    double low_tension_factor = 1.25;
    double crisis_factor = 0.50;
    double force_tension = 0.90;
    // Introduction, Développement, Complication, Climax, Résolution
    std::array<double, 5> phase_multipliers = {1.1, 1.0, 0.8, 0.5, 1.0};
};

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE DES FILS
// ═══════════════════════════════════════════════════════════════════════════

struct LifecycleConfig {
    size_t resolution_messages = 2;
    size_t turn_ceiling = 40;
    double resolving_tension = 0.25;
    double lead_inclusion_chance = 0.95;
    double third_participant_chance = 0.20;
    double topic_mutation_chance = 0.08;     // Par message enregistré
    size_t state_trigger_interval = 5;       // Ticks entre deux évaluations
    size_t anxious_warning_count = 2;        // Avertissements → biais anxieux
    size_t max_pending_user_messages = 20;   // Au-delà : le plus ancien est écarté
};

// ═══════════════════════════════════════════════════════════════════════════
// SÉLECTION DU LOCUTEUR
// ═══════════════════════════════════════════════════════════════════════════

struct SpeakerConfig {
    double recency_window_s = 3.0;
    double recency_relax_s = 15.0;
    double recency_penalty = 0.05;
    // Orion, Nova, Echo, Lumen
    std::array<double, 4> persona_bias = {1.2, 1.0, 0.9, 1.0};
    double repeat_penalty = 0.30;
    double strict_repeat_penalty = 0.05;     // Fil sans interruption
    double engagement_constant = 0.50;
};

// ═══════════════════════════════════════════════════════════════════════════
// DYNAMIQUE DE CONVERSATION
// ═══════════════════════════════════════════════════════════════════════════

struct DynamicsConfig {
    double blend = 0.20;
    double decay = 0.02;
    double tension_baseline = 0.30;
    double cohesion_baseline = 0.50;
};

/**
 * @brief Configuration complète du moteur
 */
struct CascadeConfig {
    ThreadConfig thread;
    MemoryConfig memory;
    ReplyConfig reply;
    PacingConfig pacing;
    LifecycleConfig lifecycle;
    SpeakerConfig speaker;
    DynamicsConfig dynamics;

    uint64_t seed = 0;                       // 0 = non déterministe
    bool quiet = false;

    /**
     * @brief Surcharge les valeurs présentes dans le JSON, garde les autres
     */
    void fromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Charge un fichier JSON de surcharge
     * @return false (valeurs par défaut conservées) si le fichier est illisible
     */
    bool loadConfig(const std::string& path);
};

} // namespace cascade

#endif // CASCADE_CONFIG_HPP
