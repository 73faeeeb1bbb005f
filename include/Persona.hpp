/**
 * @file Persona.hpp
 * @brief Modèle de personnalité d'un personnage autonome
 * @version 1.0
 * @date 2026-10-19
 *
 * Chaque personnage porte :
 * - Cinq traits stables (ouverture, conscienciosité, extraversion,
 *   agréabilité, névrosisme)
 * - Un état dynamique (curiosité, suspicion, paranoïa, peur, espièglerie)
 *   qui revient vers une ligne de base
 * - Une humeur discrète recalculée par une cascade ordonnée de règles
 * - Un registre de relations envers les autres personnages
 */

#ifndef CASCADE_PERSONA_HPP
#define CASCADE_PERSONA_HPP

#include "Types.hpp"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cascade {

// Bornes des journaux de relation
constexpr size_t RELATIONSHIP_LOG_SIZE = 20;

/**
 * @brief Traits de personnalité (Big Five), tous dans [0, 1]
 */
struct PersonalityTraits {
    double openness = 0.5;
    double conscientiousness = 0.5;
    double extraversion = 0.5;
    double agreeableness = 0.5;
    double neuroticism = 0.5;
};

/**
 * @brief Scalaires dynamiques proches de l'humeur, dans [0, 1]
 */
struct MoodState {
    double curiosity = 0.5;
    double suspicion = 0.2;
    double paranoia = 0.1;
    double fear = 0.1;
    double playfulness = 0.3;
};

/**
 * @brief Indices de frappe pour la couche de présentation
 */
struct TypingStyle {
    double speed_multiplier = 1.0;
    double typo_rate = 0.02;
    double hesitation_rate = 0.10;
    bool deletes_and_retypes = false;
};

/**
 * @brief Relation orientée envers un autre personnage
 */
struct Relationship {
    double trust = 0.5;
    double respect = 0.5;
    double intimacy = 0.3;
    double tension = 0.0;
    double emotional_bond = 0.3;
    int interaction_count = 0;

    std::deque<std::string> shared_memories;
    std::deque<std::string> conflicts;
    std::deque<std::string> support_moments;

    /// Score synthétique utilisé pour choisir un partenaire de fil
    [[nodiscard]] double affinity() const {
        return ((trust + intimacy + emotional_bond) / 3.0) * (1.0 - 0.5 * tension);
    }
};

/**
 * @brief Contexte global lu par la cascade d'humeur
 */
struct MoodContext {
    double global_tension = 0.0;
    double paranoia = 0.0;
    double meta_awareness = 0.0;
};

class Persona;

/**
 * @brief Règle (prédicat, humeur) ; la première qui s'applique l'emporte
 */
struct MoodRule {
    std::string name;
    std::function<bool(const Persona&, const MoodContext&)> predicate;
    Mood mood;
};

class Persona {
public:
    Persona(PersonaId id,
            const PersonalityTraits& traits,
            const TypingStyle& typing,
            const MoodState& baseline,
            std::map<Intent, double> intent_affinities,
            std::vector<std::string> phobias,
            std::unordered_map<std::string, double> keyword_bonuses);

    /**
     * @brief Construit un membre de la distribution fixe
     */
    static Persona createDefault(PersonaId id);

    /**
     * @brief Cascade ordonnée de règles d'humeur (partagée par tous)
     */
    static const std::vector<MoodRule>& moodRules();

    // ═══════════════════════════════════════════════════════════════════════
    // HUMEUR ET ÉTAT
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Recalcule l'humeur discrète
     * @return Nouvelle humeur
     */
    Mood updateMood(const MoodContext& context);

    /**
     * @brief Le personnage s'empare d'un sujet : curiosité ↑, peur sur termes sensibles
     */
    void engageTopic(const std::string& text);

    /**
     * @brief Dérive de la peur/suspicion/paranoïa vers l'atmosphère globale
     */
    void absorbAtmosphere(double tension, double paranoia, double meta_awareness);

    /**
     * @brief Retour des scalaires dynamiques vers la ligne de base
     * @param rate Fraction de l'écart résorbée [0, 1]
     */
    void relaxTowardBaseline(double rate);

    void setState(const MoodState& state);

    // ═══════════════════════════════════════════════════════════════════════
    // RELATIONS
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Applique une interaction (création paresseuse de la relation)
     */
    Relationship& updateRelationship(PersonaId other, InteractionKind kind,
                                     const std::string& context = "");

    /**
     * @return nullptr si aucune interaction n'a encore eu lieu
     */
    [[nodiscard]] const Relationship* relationship(PersonaId other) const;

    /// Affinité envers un autre personnage (0.5 si inconnu)
    [[nodiscard]] double affinityToward(PersonaId other) const;

    // ═══════════════════════════════════════════════════════════════════════
    // INDICES DE PRÉSENTATION
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] bool shouldHesitateOnTopic(const std::string& text) const;

    [[nodiscard]] double getTypingSpeedMultiplier(const std::string& text) const;

    // ═══════════════════════════════════════════════════════════════════════
    // INTENTIONS ET VOCABULAIRE
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] double intentAffinity(Intent intent) const;

    /**
     * @brief Intention d'affinité maximale
     * @param exclude_question_like Exclut la classe interrogative (QUESTION, META)
     * @param allow_question Autorise QUESTION dans la taxonomie
     */
    [[nodiscard]] Intent preferredIntent(bool exclude_question_like, bool allow_question) const;

    /// Somme des bonus des mots-clés présents dans le texte
    [[nodiscard]] double keywordBonus(const std::string& text) const;

    // ═══════════════════════════════════════════════════════════════════════
    // ACCESSEURS
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] PersonaId id() const { return id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const PersonalityTraits& traits() const { return traits_; }
    [[nodiscard]] const TypingStyle& typing() const { return typing_; }
    [[nodiscard]] const MoodState& state() const { return state_; }
    [[nodiscard]] const MoodState& baseline() const { return baseline_; }
    [[nodiscard]] Mood mood() const { return mood_; }
    [[nodiscard]] const std::vector<std::string>& phobias() const { return phobias_; }
    [[nodiscard]] const std::map<Intent, double>& intentAffinities() const { return intent_affinities_; }

    /// Termes sensibles communs (déclenchent l'hésitation si névrosisme élevé)
    static const std::vector<std::string>& sensitiveTerms();

private:
    void clampState();

    PersonaId id_;
    std::string name_;
    PersonalityTraits traits_;
    TypingStyle typing_;
    MoodState baseline_;
    MoodState state_;
    Mood mood_ = Mood::NEUTRAL;

    std::map<Intent, double> intent_affinities_;
    std::vector<std::string> phobias_;
    std::unordered_map<std::string, double> keyword_bonuses_;

    std::map<PersonaId, Relationship> relationships_;
};

} // namespace cascade

#endif // CASCADE_PERSONA_HPP
