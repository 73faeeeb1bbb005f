/**
 * @file DialogueDirector.hpp
 * @brief Orchestrateur du dialogue : rythme, fils, locuteurs, dynamique
 * @version 1.0
 * @date 2026-10-19
 *
 * Pipeline d'un tick (produceNextMessage) :
 * 1. Message spectateur en attente → réponse prioritaire
 * 2. Injection Overseer (épreuve de hasard de la mémoire narrative)
 * 3. Rythme : intervalle écoulé, ou message forcé
 * 4. Fil actif vivant (création si nécessaire)
 * 5. Loterie du locuteur
 * 6. Génération de la réplique (reprises anti-doublon)
 * 7. Enregistrement dans le fil et la mémoire, dynamique tension/cohésion
 *
 * Un tick complet est la frontière d'exclusion mutuelle. Le rappel de
 * message est invoqué après libération du verrou : il peut appeler
 * n'importe quelle méthode publique du directeur.
 */

#ifndef CASCADE_DIALOGUE_DIRECTOR_HPP
#define CASCADE_DIALOGUE_DIRECTOR_HPP

#include "Types.hpp"
#include "Config.hpp"
#include "Random.hpp"
#include "TextAnalyzer.hpp"
#include "Persona.hpp"
#include "TopicGraph.hpp"
#include "NarrativeMemory.hpp"
#include "ConversationThread.hpp"
#include "TemplateLibrary.hpp"
#include "ReplyGenerator.hpp"
#include "NarrativeTriggers.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cascade {

/**
 * @brief Statistiques du directeur
 */
struct DirectorStats {
    uint64_t ticks = 0;
    uint64_t messages_emitted = 0;
    uint64_t overseer_messages = 0;
    uint64_t user_responses = 0;
    uint64_t threads_started = 0;
    uint64_t fallback_lines = 0;
    uint64_t stale_exhaustions = 0;
    uint64_t paced_ticks = 0;
    uint64_t triggers_fired = 0;
    uint64_t dropped_user_messages = 0;
};

/**
 * @brief Message spectateur en file d'attente
 */
struct UserMessage {
    std::string user;
    std::string text;
};

class DialogueDirector {
public:
    using MessageCallback = std::function<void(const Message&)>;

    explicit DialogueDirector(const CascadeConfig& config = CascadeConfig{},
                              TimeSource clock = systemTimeSource());

    // Non-copyable
    DialogueDirector(const DialogueDirector&) = delete;
    DialogueDirector& operator=(const DialogueDirector&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // INTERFACE DE PRÉSENTATION
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Tick principal
     * @return La réplique du tick, ou std::nullopt (rythme, rien à dire)
     */
    std::optional<Message> produceNextMessage();

    /**
     * @brief Fait parler un personnage nommé sur le fil actif
     * @return std::nullopt si le nom est inconnu
     */
    std::optional<Message> produceMessageFrom(const std::string& persona_name);

    /**
     * @brief Message exogène : commande spectateur ou texte prioritaire
     */
    void enqueueUserMessage(const std::string& user, const std::string& text);

    /**
     * @brief Activité extérieure : réarme les minuteries d'inactivité et d'Overseer
     */
    void reportExternalActivity();

    void notifyCrisisMode(bool active);

    /// Instant à partir duquel un message non forcé peut être émis
    [[nodiscard]] TimePoint nextEligibleTime() const;

    /**
     * @brief Nouvelle session : fils fermés, mémoire passée à la boucle suivante
     */
    void resetSession();

    [[nodiscard]] std::string debugSnapshot() const;
    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] std::vector<NarrativeEvent> getNarrativeHistory(size_t count = 20) const;
    [[nodiscard]] EnvironmentCue environmentCue() const;
    [[nodiscard]] DirectorStats getStats() const;

    void setMessageCallback(MessageCallback callback);
    void setQuietMode(bool quiet);

    // ═══════════════════════════════════════════════════════════════════════
    // ACCÈS AUX COMPOSANTS (usage mono-flux : tests, diagnostic)
    // ═══════════════════════════════════════════════════════════════════════

    /// nullptr si le nom ne désigne aucun personnage
    [[nodiscard]] Persona* findPersona(const std::string& name);
    [[nodiscard]] Persona& persona(PersonaId id) { return personas_.at(id); }

    [[nodiscard]] NarrativeMemory& memory() { return memory_; }
    [[nodiscard]] TopicGraph& topics() { return topics_; }
    [[nodiscard]] ThreadManager& threads() { return threads_; }
    [[nodiscard]] ReplyGenerator& replies() { return replies_; }
    [[nodiscard]] NarrativeTriggers& triggers() { return triggers_; }
    [[nodiscard]] TemplateLibrary& templates() { return library_; }
    [[nodiscard]] ThreadPtr activeThread() const { return threads_.getActiveThread(); }
    [[nodiscard]] const CascadeConfig& config() const { return config_; }
    [[nodiscard]] bool crisisMode() const { return crisis_mode_; }
    [[nodiscard]] size_t pendingUserMessages() const { return user_queue_.size(); }

    /**
     * @brief Poids du locuteur dans la loterie : récence × biais × affinité
     *        × bonus narratifs × pénalité de répétition × engagement
     */
    [[nodiscard]] double speakerWeight(PersonaId id, const ConversationThread& thread, TimePoint now) const;

private:
    // Corps des ticks, verrou tenu
    std::optional<Message> nextMessage();
    std::optional<Message> messageFrom(const std::string& persona_name);

    // Rythme
    [[nodiscard]] bool isForced(TimePoint now, const ThreadPtr& thread) const;
    double computeInterval(const ThreadPtr& thread);

    // Cycle de vie des fils
    [[nodiscard]] bool threadNeedsReplacement(const ConversationThread& thread) const;
    ThreadPtr ensureThread(TimePoint now);
    std::vector<PersonaId> chooseParticipants();
    PersonaId choosePartner(PersonaId anchor, const std::vector<PersonaId>& taken);
    TopicPtr chooseThreadTopic();
    bool claimTheme(const std::string& theme);

    // Locuteur
    std::optional<PersonaId> selectSpeaker(const ConversationThread& thread, TimePoint now);

    // Production
    std::optional<Message> speakAsPersona(PersonaId id, const ThreadPtr& thread, TimePoint now);
    std::optional<Message> respondToUser(const UserMessage& user_message, TimePoint now);
    Message makeOverseerMessage(TimePoint now);
    Message makeFallbackMessage(PersonaId id, const ThreadPtr& thread, TimePoint now);
    Intent alternateIntent(const Persona& persona, const std::set<Intent>& tried);

    // Enregistrement
    void registerPersonaMessage(const Message& message, PersonaId speaker,
                                const ThreadPtr& thread, TimePoint now);
    void updateRelationships(PersonaId speaker, const std::string& previous_speaker,
                             Intent intent, const TopicPtr& topic);
    void applyThreatNudges(Intent intent, const TopicPtr& topic);
    void applyConversationDynamics(const std::string& text);
    void updatePersonaMoods();
    void emit(const Message& message, TimePoint now);
    static void notify(const std::optional<Message>& message, const MessageCallback& callback);

    [[nodiscard]] MoodContext moodContext() const;

    CascadeConfig config_;
    TimeSource clock_;
    bool quiet_mode_ = false;

    // Ordre de construction : la source aléatoire et la mémoire d'abord
    Rng rng_;
    NarrativeMemory memory_;
    TopicGraph topics_;
    ThreadManager threads_;
    TemplateLibrary library_;
    ReplyGenerator replies_;
    NarrativeTriggers triggers_;
    TextAnalyzer analyzer_;

    std::map<PersonaId, Persona> personas_;
    std::map<PersonaId, TimePoint> last_spoke_;

    std::deque<UserMessage> user_queue_;
    mutable std::mutex mutex_;

    bool crisis_mode_ = false;
    TimePoint last_message_time_;
    TimePoint last_activity_;
    double next_interval_s_;

    // Dynamique locale du fil courant
    double thread_tension_ = 0.3;
    double thread_cohesion_ = 0.5;

    // Branches thématiques consommées dans la boucle courante
    std::set<std::string> used_themes_;
    int theme_loop_ = 0;
    int theme_observer_count_ = 0;

    uint64_t tick_count_ = 0;
    DirectorStats stats_;
    MessageCallback on_message_;
};

} // namespace cascade

#endif // CASCADE_DIALOGUE_DIRECTOR_HPP
