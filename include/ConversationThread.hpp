/**
 * @file ConversationThread.hpp
 * @brief Fil de conversation : machine à états de phase + registre des fils
 * @version 1.0
 * @date 2026-10-19
 *
 * Phases : INTRODUCTION → DEVELOPMENT → COMPLICATION → CLIMAX → RESOLUTION
 * La phase ne recule jamais. Le statut, une fois sorti d'ACTIVE, n'y
 * revient jamais : un nouveau fil doit être créé.
 */

#ifndef CASCADE_CONVERSATION_THREAD_HPP
#define CASCADE_CONVERSATION_THREAD_HPP

#include "Types.hpp"
#include "Config.hpp"
#include "TopicGraph.hpp"
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cascade {

class ConversationThread {
public:
    ConversationThread(std::string id, TopicPtr topic,
                       std::vector<PersonaId> participants,
                       const ThreadConfig& config, TimePoint now,
                       bool question_intent_enabled = false);

    /**
     * @brief Enregistre une réplique et fait avancer la phase si le seuil
     *        de messages par phase est dépassé (RÉSOLUTION saturée → STALE)
     */
    void registerMessage(const Message& message);

    /**
     * @brief Intention par défaut de la phase (biais, pas contrainte)
     */
    [[nodiscard]] Intent getPhaseAppropriateIntent() const;

    // ═══════════════════════════════════════════════════════════════════════
    // TRANSITIONS DE STATUT (à sens unique)
    // ═══════════════════════════════════════════════════════════════════════

    bool markStale();
    bool close();
    bool escalate();
    bool interrupt();

    // ═══════════════════════════════════════════════════════════════════════
    // REQUÊTES
    // ═══════════════════════════════════════════════════════════════════════

    /// Deux premiers messages du CLIMAX, ou fil en ESCALATING
    [[nodiscard]] bool demandsUrgentPacing() const;

    [[nodiscard]] bool containsNearDuplicate(const std::string& text, double threshold) const;

    [[nodiscard]] bool isParticipant(PersonaId id) const;
    [[nodiscard]] bool isLive() const {
        return status_ == ThreadStatus::ACTIVE || status_ == ThreadStatus::ESCALATING;
    }

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const TopicPtr& topic() const { return topic_; }
    [[nodiscard]] const std::vector<PersonaId>& participants() const { return participants_; }
    [[nodiscard]] const std::string& lastSpeaker() const { return last_speaker_; }
    [[nodiscard]] size_t turnCount() const { return turn_count_; }
    [[nodiscard]] size_t messagesInPhase() const { return messages_in_phase_; }
    [[nodiscard]] size_t resolutionMessages() const { return resolution_messages_; }
    [[nodiscard]] ConversationPhase phase() const { return phase_; }
    [[nodiscard]] ThreadStatus status() const { return status_; }
    [[nodiscard]] TimePoint lastActivity() const { return last_activity_; }
    [[nodiscard]] const std::deque<std::string>& textHistory() const { return text_history_; }
    [[nodiscard]] bool allowsInterruption() const { return allow_interruption_; }
    [[nodiscard]] const TopicPtr& relatedTopic() const { return related_topic_; }

    void setAllowInterruption(bool allow) { allow_interruption_ = allow; }
    void setRelatedTopic(TopicPtr related) { related_topic_ = std::move(related); }

    [[nodiscard]] nlohmann::json toJson() const;

private:
    void advancePhase();

    std::string id_;
    TopicPtr topic_;
    std::vector<PersonaId> participants_;
    ThreadConfig config_;
    bool question_intent_enabled_;

    std::string last_speaker_;
    size_t turn_count_ = 0;
    size_t messages_in_phase_ = 0;
    size_t resolution_messages_ = 0;
    ConversationPhase phase_ = ConversationPhase::INTRODUCTION;
    ThreadStatus status_ = ThreadStatus::ACTIVE;
    TimePoint last_activity_;
    std::deque<std::string> text_history_;
    bool allow_interruption_ = true;
    TopicPtr related_topic_;
};

using ThreadPtr = std::shared_ptr<ConversationThread>;

/**
 * @brief Registre des fils (identifiants « thread_N »)
 */
class ThreadManager {
public:
    explicit ThreadManager(const ThreadConfig& config, bool question_intent_enabled = false);

    /**
     * @brief Crée un fil et en fait le fil actif (l'ancien est fermé)
     */
    ThreadPtr startThread(TopicPtr topic, std::vector<PersonaId> participants, TimePoint now);

    bool closeThread(const std::string& id);

    /**
     * @brief Ferme les fils inactifs depuis trop longtemps, purge les fermés
     * @return Nombre de fils fermés
     */
    size_t pruneStaleThreads(TimePoint now);

    /// Ferme tous les fils (nouvelle session)
    void closeAll();

    /// nullptr si aucun fil actif
    [[nodiscard]] ThreadPtr getActiveThread() const;
    [[nodiscard]] ThreadPtr getThread(const std::string& id) const;
    [[nodiscard]] size_t threadCount() const { return threads_.size(); }
    [[nodiscard]] size_t totalStarted() const { return next_id_ - 1; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    ThreadConfig config_;
    bool question_intent_enabled_;
    bool quiet_mode_ = false;

    std::map<std::string, ThreadPtr> threads_;
    std::string active_id_;
    size_t next_id_ = 1;
};

} // namespace cascade

#endif // CASCADE_CONVERSATION_THREAD_HPP
