/**
 * @file ReplyGenerator.hpp
 * @brief Synthèse des répliques : intention, loterie de gabarits, anti-répétition
 * @version 1.0
 * @date 2026-10-19
 *
 * Algorithme :
 * 1. Réservoir de l'intention (personnage → partagé → générique)
 * 2. Filtrage des quasi-doublons des répliques récentes
 *    (réservoir complet si le filtrage vide tout)
 * 3. Poids par gabarit : affinités de traits + bonus de mots-clés
 * 4. Loterie à poids cumulés
 * 5. Hésitation (∝ névrosisme) ou formule fétiche (rare)
 * 6. Substitution des jetons {topic} {from} {event} {related}
 * 7. Enregistrement de la réplique et de l'intention (tampons bornés)
 */

#ifndef CASCADE_REPLY_GENERATOR_HPP
#define CASCADE_REPLY_GENERATOR_HPP

#include "Types.hpp"
#include "Config.hpp"
#include "Random.hpp"
#include "Persona.hpp"
#include "TopicGraph.hpp"
#include "ConversationThread.hpp"
#include "NarrativeMemory.hpp"
#include "TemplateLibrary.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace cascade {

// Valeurs par défaut des jetons absents
inline const std::string DEFAULT_FROM = "someone";
inline const std::string DEFAULT_EVENT = "the last glitch";
inline const std::string DEFAULT_RELATED = "the old logs";

/**
 * @brief Contexte ambiant d'une réplique
 */
struct ReplyContext {
    std::string last_speaker;                   // {from}
    std::optional<std::string> notable_event;   // {event}
    TopicPtr related_topic;                     // {related}
};

/**
 * @brief Demande de génération
 */
struct ReplyRequest {
    const Persona* persona = nullptr;
    Intent intent = Intent::STATEMENT;
    TopicPtr topic;
    const ConversationThread* thread = nullptr;
    ReplyContext context;
};

/**
 * @brief Réplique produite
 */
struct GeneratedReply {
    std::string text;
    std::string template_text;
    Intent intent = Intent::STATEMENT;
    bool near_duplicate = false;    // Réservoir épuisé : doublon inévitable
    bool hesitated = false;
    bool catch_phrase = false;
};

class ReplyGenerator {
public:
    ReplyGenerator(const ReplyConfig& config, const TemplateLibrary& library, Rng& rng);

    /**
     * @brief Choix de l'intention : affinité × phase × humeur × état narratif,
     *        puis garde anti-boucle interrogative
     */
    Intent chooseIntent(const Persona& persona, const ConversationThread& thread,
                        const NarrativeMemory& memory);

    /**
     * @brief Génère une réplique
     * @return std::nullopt si la demande est incomplète (personnage absent)
     * @throws std::invalid_argument si un gabarit est mal formé
     *
     * Une réplique marquée near_duplicate n'est pas enregistrée : l'appelant
     * peut retenter avec une autre intention.
     */
    std::optional<GeneratedReply> generate(const ReplyRequest& request);

    /**
     * @brief Tire une ligne d'un réservoir hors génération par intention
     *        (réponses aux spectateurs, Overseer)
     *
     * Tous les gabarits sont rendus ; le tirage se fait parmi ceux qui ne
     * rappellent ni une réplique récente ni l'historique du fil. Si aucun
     * ne convient, tirage dans tout le réservoir et near_duplicate levé.
     * La ligne n'est pas enregistrée.
     *
     * @return std::nullopt si le réservoir est vide
     * @throws std::invalid_argument si un gabarit est mal formé
     */
    std::optional<GeneratedReply> pickFromPool(const std::vector<std::string>& pool,
                                               const TopicPtr& topic,
                                               const ReplyContext& context,
                                               const ConversationThread* thread = nullptr);

    /**
     * @brief Substitution des jetons
     * @throws std::invalid_argument accolade non appariée ou jeton inconnu
     */
    [[nodiscard]] std::string renderTemplate(const std::string& text, const TopicPtr& topic,
                                             const ReplyContext& context) const;

    [[nodiscard]] bool isNearDuplicate(const std::string& text) const;

    /// Poids d'un gabarit pour un personnage (≥ 0)
    [[nodiscard]] double templateWeight(const Persona& persona, const std::string& text) const;

    void registerLine(const std::string& text);
    void registerIntent(Intent intent);
    void clearHistory();

    [[nodiscard]] const std::deque<std::string>& recentLines() const { return recent_lines_; }
    [[nodiscard]] const std::deque<Intent>& recentIntents() const { return recent_intents_; }
    [[nodiscard]] bool questionIntentEnabled() const { return config_.enable_question_intent; }

private:
    [[nodiscard]] bool interrogativeLoopRisk() const;

    ReplyConfig config_;
    const TemplateLibrary& library_;
    Rng& rng_;

    std::deque<std::string> recent_lines_;
    std::deque<Intent> recent_intents_;
};

} // namespace cascade

#endif // CASCADE_REPLY_GENERATOR_HPP
