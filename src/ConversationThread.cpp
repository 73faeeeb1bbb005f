/**
 * @file ConversationThread.cpp
 * @brief Implémentation des fils de conversation et de leur registre
 * @version 1.0
 * @date 2026-10-19
 */

#include "ConversationThread.hpp"
#include "TextAnalyzer.hpp"
#include <algorithm>
#include <iostream>

namespace cascade {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// CONVERSATION THREAD
// ═══════════════════════════════════════════════════════════════════════════

ConversationThread::ConversationThread(std::string id, TopicPtr topic,
                                       std::vector<PersonaId> participants,
                                       const ThreadConfig& config, TimePoint now,
                                       bool question_intent_enabled)
    : id_(std::move(id))
    , topic_(std::move(topic))
    , participants_(std::move(participants))
    , config_(config)
    , question_intent_enabled_(question_intent_enabled)
    , last_activity_(now)
{}

void ConversationThread::registerMessage(const Message& message) {
    if (status_ == ThreadStatus::CLOSED) {
        return;
    }

    last_speaker_ = message.speaker;
    last_activity_ = message.timestamp;
    turn_count_++;

    text_history_.push_back(message.text);
    while (text_history_.size() > config_.text_history_size) {
        text_history_.pop_front();
    }

    if (phase_ == ConversationPhase::RESOLUTION) {
        resolution_messages_++;
    }

    messages_in_phase_++;
    if (messages_in_phase_ > config_.phase_message_threshold) {
        if (phase_ == ConversationPhase::RESOLUTION) {
            markStale();
        } else {
            advancePhase();
        }
    }
}

void ConversationThread::advancePhase() {
    phase_ = static_cast<ConversationPhase>(static_cast<int>(phase_) + 1);
    messages_in_phase_ = 0;
}

Intent ConversationThread::getPhaseAppropriateIntent() const {
    switch (phase_) {
        case ConversationPhase::INTRODUCTION:
            return question_intent_enabled_ ? Intent::QUESTION : Intent::STATEMENT;
        case ConversationPhase::DEVELOPMENT:  return Intent::THEORY;
        case ConversationPhase::COMPLICATION: return Intent::CHALLENGE;
        case ConversationPhase::CLIMAX:       return Intent::FEAR;
        case ConversationPhase::RESOLUTION:   return Intent::STATEMENT;
        default:                              return Intent::STATEMENT;
    }
}

bool ConversationThread::markStale() {
    if (status_ == ThreadStatus::CLOSED || status_ == ThreadStatus::STALE) {
        return false;
    }
    status_ = ThreadStatus::STALE;
    return true;
}

bool ConversationThread::close() {
    if (status_ == ThreadStatus::CLOSED) {
        return false;
    }
    status_ = ThreadStatus::CLOSED;
    return true;
}

bool ConversationThread::escalate() {
    if (status_ != ThreadStatus::ACTIVE) {
        return false;
    }
    status_ = ThreadStatus::ESCALATING;
    return true;
}

bool ConversationThread::interrupt() {
    if (status_ != ThreadStatus::ACTIVE && status_ != ThreadStatus::ESCALATING) {
        return false;
    }
    status_ = ThreadStatus::INTERRUPTED;
    return true;
}

bool ConversationThread::demandsUrgentPacing() const {
    if (status_ == ThreadStatus::ESCALATING) {
        return true;
    }
    return phase_ == ConversationPhase::CLIMAX && messages_in_phase_ < 2;
}

bool ConversationThread::containsNearDuplicate(const std::string& text, double threshold) const {
    return std::any_of(text_history_.begin(), text_history_.end(),
        [&](const std::string& previous) {
            return TextAnalyzer::overlapRatio(previous, text) > threshold;
        });
}

bool ConversationThread::isParticipant(PersonaId id) const {
    return std::find(participants_.begin(), participants_.end(), id) != participants_.end();
}

json ConversationThread::toJson() const {
    json participants = json::array();
    for (PersonaId p : participants_) {
        participants.push_back(personaName(p));
    }
    return json{
        {"id", id_},
        {"topic", topic_ ? topic_->displayName() : ""},
        {"participants", participants},
        {"last_speaker", last_speaker_},
        {"turn_count", turn_count_},
        {"phase", conversationPhaseToString(phase_)},
        {"status", threadStatusToString(status_)},
        {"messages_in_phase", messages_in_phase_},
        {"resolution_messages", resolution_messages_},
        {"allow_interruption", allow_interruption_},
        {"related_topic", related_topic_ ? related_topic_->displayName() : ""}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// THREAD MANAGER
// ═══════════════════════════════════════════════════════════════════════════

ThreadManager::ThreadManager(const ThreadConfig& config, bool question_intent_enabled)
    : config_(config)
    , question_intent_enabled_(question_intent_enabled)
{}

ThreadPtr ThreadManager::startThread(TopicPtr topic, std::vector<PersonaId> participants,
                                     TimePoint now) {
    if (auto previous = getActiveThread()) {
        previous->close();
    }

    std::string id = "thread_" + std::to_string(next_id_++);
    auto thread = std::make_shared<ConversationThread>(
        id, std::move(topic), std::move(participants), config_, now, question_intent_enabled_);
    threads_[id] = thread;
    active_id_ = id;

    if (!quiet_mode_) {
        std::cout << "[ThreadManager] Nouveau fil " << id << " sur « "
                  << (thread->topic() ? thread->topic()->displayName() : "?") << " » (";
        for (size_t i = 0; i < thread->participants().size(); ++i) {
            std::cout << (i ? ", " : "") << personaName(thread->participants()[i]);
        }
        std::cout << ")\n";
    }
    return thread;
}

bool ThreadManager::closeThread(const std::string& id) {
    auto it = threads_.find(id);
    if (it == threads_.end()) {
        return false;
    }
    bool changed = it->second->close();
    if (id == active_id_) {
        active_id_.clear();
    }
    return changed;
}

size_t ThreadManager::pruneStaleThreads(TimePoint now) {
    size_t closed = 0;
    for (auto it = threads_.begin(); it != threads_.end();) {
        ThreadPtr thread = it->second;
        if (thread->status() != ThreadStatus::CLOSED
            && secondsBetween(thread->lastActivity(), now) > config_.idle_prune_seconds) {
            thread->close();
            closed++;
        }

        if (thread->status() == ThreadStatus::CLOSED) {
            if (it->first == active_id_) {
                active_id_.clear();
            }
            it = threads_.erase(it);
        } else {
            ++it;
        }
    }

    if (closed > 0 && !quiet_mode_) {
        std::cout << "[ThreadManager] " << closed << " fil(s) inactif(s) fermé(s)\n";
    }
    return closed;
}

void ThreadManager::closeAll() {
    for (auto& [id, thread] : threads_) {
        thread->close();
    }
    threads_.clear();
    active_id_.clear();
}

ThreadPtr ThreadManager::getActiveThread() const {
    if (active_id_.empty()) {
        return nullptr;
    }
    return getThread(active_id_);
}

ThreadPtr ThreadManager::getThread(const std::string& id) const {
    auto it = threads_.find(id);
    return it != threads_.end() ? it->second : nullptr;
}

} // namespace cascade
