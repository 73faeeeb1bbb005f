/**
 * @file Types.hpp
 * @brief Types et énumérations partagés du moteur narratif Cascade
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef CASCADE_TYPES_HPP
#define CASCADE_TYPES_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace cascade {

// Horloge du moteur (injectable pour les tests)
using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using TimeSource = std::function<TimePoint()>;

/**
 * @brief Source de temps par défaut (horloge monotone)
 */
inline TimeSource systemTimeSource() {
    return [] { return SteadyClock::now(); };
}

/**
 * @brief Secondes écoulées entre deux instants
 */
inline double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// PERSONNAGES
// ═══════════════════════════════════════════════════════════════════════════

constexpr size_t NUM_PERSONAS = 4;

/**
 * @brief Distribution fixe des personnages
 */
enum class PersonaId : uint8_t {
    ORION,   // Meneur, théoricien
    NOVA,    // Sceptique
    ECHO,    // Anxieux
    LUMEN    // Rêveur
};

inline const std::array<PersonaId, NUM_PERSONAS> ALL_PERSONAS = {
    PersonaId::ORION, PersonaId::NOVA, PersonaId::ECHO, PersonaId::LUMEN
};

inline std::string personaName(PersonaId id) {
    switch (id) {
        case PersonaId::ORION: return "Orion";
        case PersonaId::NOVA:  return "Nova";
        case PersonaId::ECHO:  return "Echo";
        case PersonaId::LUMEN: return "Lumen";
        default:               return "UNKNOWN";
    }
}

/**
 * @brief Nom → identifiant. Un nom inconnu ne correspond à aucun personnage.
 */
inline std::optional<PersonaId> parsePersonaId(const std::string& name) {
    static const std::unordered_map<std::string, PersonaId> personaMap = {
        {"Orion", PersonaId::ORION},
        {"Nova", PersonaId::NOVA},
        {"Echo", PersonaId::ECHO},
        {"Lumen", PersonaId::LUMEN}
    };
    auto it = personaMap.find(name);
    if (it == personaMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Rôles narratifs
constexpr PersonaId LEAD_PERSONA = PersonaId::ORION;
constexpr PersonaId ANXIOUS_PERSONA = PersonaId::ECHO;
constexpr PersonaId SKEPTIC_PERSONA = PersonaId::NOVA;
constexpr PersonaId DREAMER_PERSONA = PersonaId::LUMEN;

// Locuteur réservé aux interruptions de l'autorité
inline const std::string OVERSEER_SPEAKER = "OVERSEER";

/**
 * @brief Humeur discrète d'un personnage
 */
enum class Mood : uint8_t {
    NEUTRAL,
    CURIOUS,
    SUSPICIOUS,
    PARANOID,
    PLAYFUL,
    FRUSTRATED,
    INSPIRED,
    SCARED
};

inline std::string moodToString(Mood mood) {
    switch (mood) {
        case Mood::NEUTRAL:    return "NEUTRAL";
        case Mood::CURIOUS:    return "CURIOUS";
        case Mood::SUSPICIOUS: return "SUSPICIOUS";
        case Mood::PARANOID:   return "PARANOID";
        case Mood::PLAYFUL:    return "PLAYFUL";
        case Mood::FRUSTRATED: return "FRUSTRATED";
        case Mood::INSPIRED:   return "INSPIRED";
        case Mood::SCARED:     return "SCARED";
        default:               return "UNKNOWN";
    }
}

/**
 * @brief Nature d'une interaction entre deux personnages
 */
enum class InteractionKind : uint8_t {
    CONVERSATION,
    DISAGREEMENT,
    SUPPORT,
    SHARED_INFORMATION
};

inline std::string interactionToString(InteractionKind kind) {
    switch (kind) {
        case InteractionKind::CONVERSATION:       return "CONVERSATION";
        case InteractionKind::DISAGREEMENT:       return "DISAGREEMENT";
        case InteractionKind::SUPPORT:            return "SUPPORT";
        case InteractionKind::SHARED_INFORMATION: return "SHARED_INFORMATION";
        default:                                  return "UNKNOWN";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// INTENTIONS
// ═══════════════════════════════════════════════════════════════════════════

constexpr size_t NUM_INTENTS = 10;

/**
 * @brief But rhétorique d'une réplique
 *
 * REPLY est le réservoir générique de repli, jamais choisi directement.
 * QUESTION n'est actif que si la taxonomie l'autorise (voir ReplyConfig).
 */
enum class Intent : uint8_t {
    STATEMENT,
    THEORY,
    CHALLENGE,
    FEAR,
    OBSERVATION,
    META,
    AGREEMENT,
    JOKE,
    QUESTION,
    REPLY
};

inline const std::array<Intent, NUM_INTENTS> ALL_INTENTS = {
    Intent::STATEMENT, Intent::THEORY, Intent::CHALLENGE, Intent::FEAR,
    Intent::OBSERVATION, Intent::META, Intent::AGREEMENT, Intent::JOKE,
    Intent::QUESTION, Intent::REPLY
};

inline std::string intentToString(Intent intent) {
    switch (intent) {
        case Intent::STATEMENT:   return "STATEMENT";
        case Intent::THEORY:      return "THEORY";
        case Intent::CHALLENGE:   return "CHALLENGE";
        case Intent::FEAR:        return "FEAR";
        case Intent::OBSERVATION: return "OBSERVATION";
        case Intent::META:        return "META";
        case Intent::AGREEMENT:   return "AGREEMENT";
        case Intent::JOKE:        return "JOKE";
        case Intent::QUESTION:    return "QUESTION";
        case Intent::REPLY:       return "REPLY";
        default:                  return "UNKNOWN";
    }
}

/**
 * @brief Classe « interrogative » surveillée contre les boucles de questions
 */
inline bool isQuestionLike(Intent intent) {
    return intent == Intent::QUESTION || intent == Intent::META;
}

// ═══════════════════════════════════════════════════════════════════════════
// SUJETS ET FILS
// ═══════════════════════════════════════════════════════════════════════════

enum class TopicStatus : uint8_t {
    NEUTRAL,
    CONTROVERSIAL,
    FORBIDDEN,
    SOLVED,
    MUTATING
};

inline std::string topicStatusToString(TopicStatus status) {
    switch (status) {
        case TopicStatus::NEUTRAL:       return "NEUTRAL";
        case TopicStatus::CONTROVERSIAL: return "CONTROVERSIAL";
        case TopicStatus::FORBIDDEN:     return "FORBIDDEN";
        case TopicStatus::SOLVED:        return "SOLVED";
        case TopicStatus::MUTATING:      return "MUTATING";
        default:                         return "UNKNOWN";
    }
}

/**
 * @brief Étapes d'un fil de conversation (ordonnées, jamais en arrière)
 */
enum class ConversationPhase : uint8_t {
    INTRODUCTION,
    DEVELOPMENT,
    COMPLICATION,
    CLIMAX,
    RESOLUTION
};

inline std::string conversationPhaseToString(ConversationPhase phase) {
    switch (phase) {
        case ConversationPhase::INTRODUCTION: return "INTRODUCTION";
        case ConversationPhase::DEVELOPMENT:  return "DEVELOPMENT";
        case ConversationPhase::COMPLICATION: return "COMPLICATION";
        case ConversationPhase::CLIMAX:       return "CLIMAX";
        case ConversationPhase::RESOLUTION:   return "RESOLUTION";
        default:                              return "UNKNOWN";
    }
}

/**
 * @brief Statut orthogonal d'un fil. CLOSED est terminal.
 */
enum class ThreadStatus : uint8_t {
    ACTIVE,
    STALE,
    CLOSED,
    ESCALATING,
    INTERRUPTED
};

inline std::string threadStatusToString(ThreadStatus status) {
    switch (status) {
        case ThreadStatus::ACTIVE:      return "ACTIVE";
        case ThreadStatus::STALE:       return "STALE";
        case ThreadStatus::CLOSED:      return "CLOSED";
        case ThreadStatus::ESCALATING:  return "ESCALATING";
        case ThreadStatus::INTERRUPTED: return "INTERRUPTED";
        default:                        return "UNKNOWN";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// MENACES
// ═══════════════════════════════════════════════════════════════════════════

constexpr size_t NUM_THREAT_KINDS = 6;

enum class ThreatKind : uint8_t {
    OVERSEER,
    REALITY_QUESTIONING,
    SYSTEM_INSTABILITY,
    OBSERVER_EXPOSURE,
    PROTOCOL_LEAK,
    MEMORY_CORRUPTION
};

inline const std::array<ThreatKind, NUM_THREAT_KINDS> ALL_THREAT_KINDS = {
    ThreatKind::OVERSEER, ThreatKind::REALITY_QUESTIONING,
    ThreatKind::SYSTEM_INSTABILITY, ThreatKind::OBSERVER_EXPOSURE,
    ThreatKind::PROTOCOL_LEAK, ThreatKind::MEMORY_CORRUPTION
};

inline std::string threatKindToString(ThreatKind kind) {
    switch (kind) {
        case ThreatKind::OVERSEER:            return "OVERSEER";
        case ThreatKind::REALITY_QUESTIONING: return "REALITY_QUESTIONING";
        case ThreatKind::SYSTEM_INSTABILITY:  return "SYSTEM_INSTABILITY";
        case ThreatKind::OBSERVER_EXPOSURE:   return "OBSERVER_EXPOSURE";
        case ThreatKind::PROTOCOL_LEAK:       return "PROTOCOL_LEAK";
        case ThreatKind::MEMORY_CORRUPTION:   return "MEMORY_CORRUPTION";
        default:                              return "UNKNOWN";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// MESSAGE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Réplique rendue, consommée par la couche de présentation
 */
struct Message {
    std::string speaker;
    std::string text;
    Intent intent = Intent::STATEMENT;
    std::string thread_id;
    std::string topic_core;
    bool is_overseer = false;
    bool is_response_to_user = false;
    TimePoint timestamp;

    Message() : timestamp(SteadyClock::now()) {}
    Message(std::string who, std::string what)
        : speaker(std::move(who)), text(std::move(what)), timestamp(SteadyClock::now()) {}
};

} // namespace cascade

#endif // CASCADE_TYPES_HPP
