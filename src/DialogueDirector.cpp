/**
 * @file DialogueDirector.cpp
 * @brief Implémentation de l'orchestrateur du dialogue
 * @version 1.0
 * @date 2026-10-19
 */

#include "DialogueDirector.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cascade {

namespace {

double clamp01(double value) {
    return std::clamp(value, 0.0, 1.0);
}

std::chrono::steady_clock::duration toDuration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

// Mot le plus long d'un message spectateur, retenu comme concept
std::string salientWord(const std::string& text) {
    std::string best;
    for (const auto& word : TextAnalyzer::tokenize(TextAnalyzer::normalizeText(text))) {
        if (word.size() >= 5 && word.size() > best.size()) {
            best = word;
        }
    }
    return best;
}

} // namespace

DialogueDirector::DialogueDirector(const CascadeConfig& config, TimeSource clock)
    : config_(config)
    , clock_(std::move(clock))
    , quiet_mode_(config.quiet)
    , rng_(config.seed)
    , memory_(config.memory, rng_, clock_)
    , topics_(rng_, clock_)
    , threads_(config.thread, config.reply.enable_question_intent)
    , library_()
    , replies_(config.reply, library_, rng_)
    , triggers_(memory_, rng_)
    , analyzer_()
    , next_interval_s_(config.pacing.base_interval_s)
{
    for (PersonaId id : ALL_PERSONAS) {
        personas_.emplace(id, Persona::createDefault(id));
    }

    const TimePoint now = clock_();
    last_message_time_ = now;
    last_activity_ = now;
    thread_tension_ = memory_.tension();
    thread_cohesion_ = memory_.cohesion();
    theme_loop_ = memory_.loopCount();

    triggers_.setLeadMoodSource([this]() { return personas_.at(LEAD_PERSONA).mood(); });
    setQuietMode(quiet_mode_);

    if (!quiet_mode_) {
        std::cout << "[Director] Initialisé (graine=" << rng_.seed()
                  << ", intervalle=" << next_interval_s_ << "s)\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// TICK PRINCIPAL
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Message> DialogueDirector::produceNextMessage() {
    std::optional<Message> message;
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message = nextMessage();
        callback = on_message_;
    }
    notify(message, callback);
    return message;
}

std::optional<Message> DialogueDirector::produceMessageFrom(const std::string& persona_name) {
    std::optional<Message> message;
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message = messageFrom(persona_name);
        callback = on_message_;
    }
    notify(message, callback);
    return message;
}

std::optional<Message> DialogueDirector::nextMessage() {
    const TimePoint now = clock_();
    stats_.ticks++;
    tick_count_++;

    threads_.pruneStaleThreads(now);

    // Contrôles d'état périodiques
    if (config_.lifecycle.state_trigger_interval > 0
        && tick_count_ % config_.lifecycle.state_trigger_interval == 0) {
        stats_.triggers_fired += triggers_.checkStateTriggers().size();
        memory_.decayRumors();
        triggers_.refreshEnvironment();
    }

    // 1. Message spectateur prioritaire (ignore le rythme)
    if (!user_queue_.empty()) {
        UserMessage pending = user_queue_.front();
        user_queue_.pop_front();
        auto message = respondToUser(pending, now);
        if (message) {
            emit(*message, now);
        }
        return message;
    }

    // 2. Interruption de l'Overseer
    if (memory_.shouldInjectOverseer()) {
        Message message = makeOverseerMessage(now);
        emit(message, now);
        return message;
    }

    // 3. Rythme
    ThreadPtr thread = threads_.getActiveThread();
    if (!isForced(now, thread) && now < last_message_time_ + toDuration(next_interval_s_)) {
        stats_.paced_ticks++;
        return std::nullopt;
    }

    // 4. Fil actif
    thread = ensureThread(now);

    // 5. Locuteur
    auto speaker = selectSpeaker(*thread, now);
    if (!speaker) {
        return std::nullopt;
    }

    // 6-7. Réplique et enregistrement
    auto message = speakAsPersona(*speaker, thread, now);
    if (message) {
        emit(*message, now);
    }
    return message;
}

std::optional<Message> DialogueDirector::messageFrom(const std::string& persona_name) {
    auto id = parsePersonaId(persona_name);
    if (!id) {
        if (!quiet_mode_) {
            std::cerr << "[Director] Personnage inconnu: " << persona_name << "\n";
        }
        return std::nullopt;
    }

    const TimePoint now = clock_();
    ThreadPtr thread = ensureThread(now);
    auto message = speakAsPersona(*id, thread, now);
    if (message) {
        emit(*message, now);
    }
    return message;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENTRÉES EXOGÈNES
// ═══════════════════════════════════════════════════════════════════════════

void DialogueDirector::enqueueUserMessage(const std::string& user, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    last_activity_ = clock_();
    ViewerCommandResult result = triggers_.handleViewerCommand(user, text);
    if (!result.injected_text) {
        return;
    }

    user_queue_.push_back({user, *result.injected_text});
    const size_t limit = std::max<size_t>(config_.lifecycle.max_pending_user_messages, 1);
    while (user_queue_.size() > limit) {
        if (!quiet_mode_) {
            std::cout << "[Director] File spectateurs pleine, message de "
                      << user_queue_.front().user << " écarté\n";
        }
        user_queue_.pop_front();
        stats_.dropped_user_messages++;
    }
}

void DialogueDirector::reportExternalActivity() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = clock_();
    memory_.resetOverseerCooldown();
}

void DialogueDirector::notifyCrisisMode(bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (crisis_mode_ == active) {
        return;
    }
    crisis_mode_ = active;
    memory_.addNarrativeEvent("crisis", active ? 1.0 : 0.0, "", active ? "crisis on" : "crisis off");
    if (!quiet_mode_) {
        std::cout << "[Director] Mode crise " << (active ? "activé" : "désactivé") << "\n";
    }
}

TimePoint DialogueDirector::nextEligibleTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_message_time_ + toDuration(next_interval_s_);
}

void DialogueDirector::resetSession() {
    std::lock_guard<std::mutex> lock(mutex_);

    threads_.closeAll();
    memory_.reset();
    replies_.clearHistory();
    user_queue_.clear();
    last_spoke_.clear();
    for (auto& [id, persona] : personas_) {
        persona.relaxTowardBaseline(0.5);
        persona.updateMood(moodContext());
    }

    thread_tension_ = memory_.tension();
    thread_cohesion_ = memory_.cohesion();
    last_message_time_ = clock_();
    next_interval_s_ = config_.pacing.base_interval_s;

    if (!quiet_mode_) {
        std::cout << "[Director] Session réinitialisée (boucle #" << memory_.loopCount() << ")\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RYTHME
// ═══════════════════════════════════════════════════════════════════════════

bool DialogueDirector::isForced(TimePoint now, const ThreadPtr& thread) const {
    if (memory_.tension() > config_.pacing.force_tension) {
        return true;
    }
    if (thread && thread->demandsUrgentPacing()) {
        return true;
    }
    return secondsBetween(last_message_time_, now) >= config_.pacing.hard_ceiling_s;
}

double DialogueDirector::computeInterval(const ThreadPtr& thread) {
    const auto& p = config_.pacing;
    double interval = p.base_interval_s;

    if (thread) {
        interval *= p.phase_multipliers[static_cast<size_t>(thread->phase())];
    }

    if (memory_.tension() > p.high_tension) {
        interval *= p.high_tension_factor;
    } else if (memory_.tension() < p.low_tension) {
        interval *= p.low_tension_factor;
    }

    if (crisis_mode_) {
        interval *= p.crisis_factor;
    }

    interval *= 1.0 + rng_.range(-p.jitter, p.jitter);
    return std::clamp(interval, p.min_interval_s, p.max_interval_s);
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE DES FILS
// ═══════════════════════════════════════════════════════════════════════════

bool DialogueDirector::threadNeedsReplacement(const ConversationThread& thread) const {
    const auto& lc = config_.lifecycle;

    if (thread.status() != ThreadStatus::ACTIVE) {
        return true;
    }
    if (thread.turnCount() >= lc.turn_ceiling) {
        return true;
    }
    if (thread.phase() == ConversationPhase::RESOLUTION) {
        if (thread.resolutionMessages() >= lc.resolution_messages) return true;
        if (memory_.tension() < lc.resolving_tension) return true;
    }
    return false;
}

ThreadPtr DialogueDirector::ensureThread(TimePoint now) {
    ThreadPtr thread = threads_.getActiveThread();
    if (thread && !threadNeedsReplacement(*thread)) {
        return thread;
    }
    if (thread) {
        threads_.closeThread(thread->id());
    }

    std::vector<PersonaId> participants = chooseParticipants();
    TopicPtr topic = chooseThreadTopic();

    thread = threads_.startThread(topic, participants, now);
    thread->setAllowInterruption(topic->status() != TopicStatus::FORBIDDEN && rng_.chance(0.75));
    if (rng_.chance(0.5)) {
        TopicPtr related = topics_.getRelated(topic);
        if (related && related != topic) {
            thread->setRelatedTopic(related);
        }
    }

    thread_tension_ = memory_.tension();
    thread_cohesion_ = memory_.cohesion();
    stats_.threads_started++;
    return thread;
}

std::vector<PersonaId> DialogueDirector::chooseParticipants() {
    const auto& lc = config_.lifecycle;
    std::vector<PersonaId> participants;

    // 1. Meneur (presque toujours présent)
    PersonaId anchor = LEAD_PERSONA;
    if (!rng_.chance(lc.lead_inclusion_chance)) {
        std::vector<PersonaId> others;
        for (PersonaId id : ALL_PERSONAS) {
            if (id != LEAD_PERSONA) others.push_back(id);
        }
        anchor = rng_.pick(others);
    }
    participants.push_back(anchor);

    // 2. Partenaire choisi par affinité et état narratif
    participants.push_back(choosePartner(anchor, participants));

    // 3. Troisième voix occasionnelle
    if (rng_.chance(lc.third_participant_chance)) {
        std::vector<PersonaId> remaining;
        for (PersonaId id : ALL_PERSONAS) {
            if (std::find(participants.begin(), participants.end(), id) == participants.end()) {
                remaining.push_back(id);
            }
        }
        if (!remaining.empty()) {
            participants.push_back(rng_.pick(remaining));
        }
    }
    return participants;
}

PersonaId DialogueDirector::choosePartner(PersonaId anchor, const std::vector<PersonaId>& taken) {
    const Persona& lead = personas_.at(anchor);

    std::vector<PersonaId> candidates;
    std::vector<double> weights;
    for (PersonaId id : ALL_PERSONAS) {
        if (std::find(taken.begin(), taken.end(), id) != taken.end()) continue;

        double w = 0.2 + lead.affinityToward(id);
        if (id == ANXIOUS_PERSONA
            && memory_.overseerWarnings() >= static_cast<int>(config_.lifecycle.anxious_warning_count)) {
            w *= 3.0;
        }
        if (id == DREAMER_PERSONA && memory_.metaAwareness() > 0.6) w *= 2.0;
        if (id == SKEPTIC_PERSONA
            && (memory_.tension() > 0.6 || memory_.flags().characters_suspect_simulation)) {
            w *= 2.0;
        }
        candidates.push_back(id);
        weights.push_back(w);
    }
    return candidates[rng_.weightedIndex(weights)];
}

bool DialogueDirector::claimTheme(const std::string& theme) {
    if (memory_.loopCount() != theme_loop_) {
        used_themes_.clear();
        theme_loop_ = memory_.loopCount();
    }
    return used_themes_.insert(theme).second;
}

TopicPtr DialogueDirector::chooseThreadTopic() {
    // Priorité : glitch rouge > avertissements > observateurs > rumeur de protocole > tension
    if (memory_.rareRedGlitchOccurred() && claimTheme("red")) {
        TopicPtr topic = topics_.getOrCreate("red rain cascade");
        topic->markGlitchSource();
        return topic;
    }

    if (memory_.overseerWarnings() >= static_cast<int>(config_.lifecycle.anxious_warning_count)
        && claimTheme("overseer")) {
        return topics_.getOrCreate("overseer warning");
    }

    if (memory_.flags().observer_detected && memory_.observerCount() > 0
        && memory_.observerCount() != theme_observer_count_) {
        theme_observer_count_ = memory_.observerCount();
        return topics_.getOrCreate("the " + std::to_string(theme_observer_count_) + " observers");
    }

    if (memory_.protocolRumorActive() && claimTheme("protocol")) {
        TopicPtr topic = topics_.getOrCreate("protocol leak");
        topic->markRumor();
        return topic;
    }

    if (memory_.tension() > config_.pacing.high_tension) {
        return topics_.getControversialOrForbidden();
    }
    return topics_.getRandom();
}

// ═══════════════════════════════════════════════════════════════════════════
// LOCUTEUR
// ═══════════════════════════════════════════════════════════════════════════

double DialogueDirector::speakerWeight(PersonaId id, const ConversationThread& thread,
                                       TimePoint now) const {
    const auto& sc = config_.speaker;
    const Persona& persona = personas_.at(id);
    double w = 1.0;

    // Récence : fenêtre stricte puis relâchement linéaire
    auto it = last_spoke_.find(id);
    if (it != last_spoke_.end()) {
        double dt = secondsBetween(it->second, now);
        if (dt < sc.recency_window_s) {
            w *= sc.recency_penalty;
        } else if (dt < sc.recency_relax_s) {
            double t = (dt - sc.recency_window_s) / (sc.recency_relax_s - sc.recency_window_s);
            w *= sc.recency_penalty + (1.0 - sc.recency_penalty) * t;
        }
    }

    w *= sc.persona_bias[static_cast<size_t>(id)];
    w *= 1.0 + persona.intentAffinity(thread.getPhaseAppropriateIntent());

    // Biais narratifs
    if (id == ANXIOUS_PERSONA
        && memory_.overseerWarnings() >= static_cast<int>(config_.lifecycle.anxious_warning_count)) {
        w *= 1.5;
    }
    if (id == DREAMER_PERSONA && memory_.metaAwareness() > 0.6) w *= 1.3;
    if (id == SKEPTIC_PERSONA && memory_.tension() > 0.7) w *= 1.3;
    if (id == LEAD_PERSONA && memory_.flags().characters_suspect_simulation) w *= 1.2;

    // Pas deux fois de suite
    if (thread.lastSpeaker() == persona.name()) {
        w *= thread.allowsInterruption() ? sc.repeat_penalty : sc.strict_repeat_penalty;
    }

    const auto& s = persona.state();
    w *= s.playfulness + s.curiosity + sc.engagement_constant;
    return std::max(w, 0.0);
}

std::optional<PersonaId> DialogueDirector::selectSpeaker(const ConversationThread& thread,
                                                         TimePoint now) {
    const auto& participants = thread.participants();
    if (participants.empty()) {
        return std::nullopt;
    }

    std::vector<double> weights;
    weights.reserve(participants.size());
    for (PersonaId id : participants) {
        weights.push_back(speakerWeight(id, thread, now));
    }
    return participants[rng_.weightedIndex(weights)];
}

// ═══════════════════════════════════════════════════════════════════════════
// PRODUCTION
// ═══════════════════════════════════════════════════════════════════════════

Intent DialogueDirector::alternateIntent(const Persona& persona, const std::set<Intent>& tried) {
    const bool question_enabled = replies_.questionIntentEnabled();

    Intent preferred = persona.preferredIntent(false, question_enabled);
    if (!tried.count(preferred)) {
        return preferred;
    }

    std::vector<Intent> untried;
    for (Intent intent : ALL_INTENTS) {
        if (intent == Intent::QUESTION && !question_enabled) continue;
        if (!tried.count(intent)) untried.push_back(intent);
    }
    return untried.empty() ? Intent::REPLY : rng_.pick(untried);
}

std::optional<Message> DialogueDirector::speakAsPersona(PersonaId id, const ThreadPtr& thread,
                                                        TimePoint now) {
    Persona& persona = personas_.at(id);

    ReplyContext context;
    context.last_speaker = thread->lastSpeaker();
    context.notable_event = memory_.latestNotableEvent();
    context.related_topic = thread->relatedTopic();

    Intent intent = replies_.chooseIntent(persona, *thread, memory_);
    std::set<Intent> tried;

    for (size_t attempt = 0; attempt < config_.reply.max_retries; ++attempt) {
        tried.insert(intent);

        std::optional<GeneratedReply> reply;
        try {
            reply = replies_.generate({&persona, intent, thread->topic(), thread.get(), context});
        } catch (const std::exception& e) {
            std::cerr << "[Director] Gabarit invalide pour " << persona.name() << ": "
                      << e.what() << "\n";
            Message fallback = makeFallbackMessage(id, thread, now);
            registerPersonaMessage(fallback, id, thread, now);
            return fallback;
        }

        if (!reply) {
            return std::nullopt;
        }

        if (!reply->near_duplicate) {
            Message message(persona.name(), reply->text);
            message.intent = reply->intent;
            message.thread_id = thread->id();
            message.topic_core = thread->topic() ? thread->topic()->core() : "";
            message.timestamp = now;
            registerPersonaMessage(message, id, thread, now);
            return message;
        }

        intent = alternateIntent(persona, tried);
    }

    // Aucune formulation neuve : le fil est épuisé
    thread->markStale();
    stats_.stale_exhaustions++;
    if (!quiet_mode_) {
        std::cout << "[Director] Fil " << thread->id() << " épuisé (" << persona.name()
                  << " n'a plus rien de neuf à dire)\n";
    }
    return std::nullopt;
}

std::optional<Message> DialogueDirector::respondToUser(const UserMessage& user_message,
                                                       TimePoint now) {
    ThreadPtr thread = ensureThread(now);
    auto responder = selectSpeaker(*thread, now);
    if (!responder) {
        return std::nullopt;
    }
    Persona& persona = personas_.at(*responder);

    // Le message spectateur nourrit la mémoire
    std::string word = salientWord(user_message.text);
    if (!word.empty()) {
        memory_.rememberConcept(word, 0.5, user_message.user);
    }
    if (analyzer_.analyzeDynamics(user_message.text).isMeta()) {
        memory_.updateThreatLevel(ThreatKind::OBSERVER_EXPOSURE, 0.1);
        memory_.adjustMetaAwareness(0.05);
    }

    ReplyContext context;
    context.last_speaker = user_message.user;
    context.notable_event = memory_.latestNotableEvent();
    context.related_topic = thread->relatedTopic();

    std::vector<std::string> pool = library_.userResponses(*responder);
    if (pool.empty()) {
        pool = library_.genericPool();
    }

    // Formulation neuve si le réservoir en contient encore une
    std::string text;
    try {
        auto picked = replies_.pickFromPool(pool, thread->topic(), context, thread.get());
        text = picked ? picked->text : makeFallbackMessage(*responder, thread, now).text;
    } catch (const std::exception& e) {
        std::cerr << "[Director] Gabarit de réponse invalide: " << e.what() << "\n";
        text = makeFallbackMessage(*responder, thread, now).text;
    }

    replies_.registerLine(text);
    replies_.registerIntent(Intent::REPLY);

    Message message(persona.name(), text);
    message.intent = Intent::REPLY;
    message.thread_id = thread->id();
    message.topic_core = thread->topic() ? thread->topic()->core() : "";
    message.is_response_to_user = true;
    message.timestamp = now;

    registerPersonaMessage(message, *responder, thread, now);
    stats_.user_responses++;
    return message;
}

Message DialogueDirector::makeOverseerMessage(TimePoint now) {
    const bool direct = memory_.flags().overseer_direct_ping;
    const auto& lines = library_.overseerLines(direct);

    std::string text = "...";
    try {
        if (auto picked = replies_.pickFromPool(lines, nullptr, ReplyContext{})) {
            text = picked->text;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Director] Ligne Overseer invalide: " << e.what() << "\n";
    }
    replies_.registerLine(text);

    Message message(OVERSEER_SPEAKER, text);
    message.intent = Intent::META;
    message.is_overseer = true;
    message.timestamp = now;

    // La surveillance se fait sentir
    memory_.updateThreatLevel(ThreatKind::OVERSEER, 0.15);
    memory_.adjustTension(0.1);
    memory_.adjustParanoia(0.05);

    if (ThreadPtr thread = threads_.getActiveThread()) {
        message.thread_id = thread->id();
        message.topic_core = thread->topic() ? thread->topic()->core() : "";
        if (direct) {
            thread->interrupt();
        } else {
            thread->escalate();
        }
    }

    for (auto& [id, persona] : personas_) {
        persona.absorbAtmosphere(memory_.tension(), memory_.paranoia(), memory_.metaAwareness());
    }
    updatePersonaMoods();

    stats_.overseer_messages++;
    return message;
}

Message DialogueDirector::makeFallbackMessage(PersonaId id, const ThreadPtr& thread, TimePoint now) {
    const auto& lines = library_.fallbackLines(id);

    Message message(personaName(id), lines.empty() ? "..." : rng_.pick(lines));
    message.intent = Intent::REPLY;
    message.thread_id = thread ? thread->id() : "";
    message.topic_core = (thread && thread->topic()) ? thread->topic()->core() : "";
    message.timestamp = now;

    stats_.fallback_lines++;
    return message;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENREGISTREMENT
// ═══════════════════════════════════════════════════════════════════════════

void DialogueDirector::registerPersonaMessage(const Message& message, PersonaId speaker,
                                              const ThreadPtr& thread, TimePoint now) {
    const std::string previous_speaker = thread->lastSpeaker();
    const TopicPtr topic = thread->topic();
    Persona& persona = personas_.at(speaker);

    // 1. Fil
    thread->registerMessage(message);
    last_spoke_[speaker] = now;

    // 2. Sujet
    if (topic) {
        topic->markDiscussed(persona.name(), now);
        if (message.intent == Intent::CHALLENGE) {
            topic->markDoubted(persona.name());
        }
        if (message.intent == Intent::FEAR && topic->isHeated() && rng_.chance(0.15)) {
            topic->markForbidden(persona.name());
        }
    }

    // 3. Relations
    updateRelationships(speaker, previous_speaker, message.intent, topic);

    // 4. Mémoire narrative
    memory_.addNarrativeEvent("dialogue", 1.0, persona.name(), message.text);
    if (topic) {
        double importance = std::min(0.3 + 0.05 * topic->timesDiscussed(), 0.9);
        memory_.rememberConcept(topic->core(), importance, persona.name());
        if (topic->isRumor()) {
            memory_.addRumor(topic->core() + " rumor", persona.name(), 0.4);
        }
    }
    applyThreatNudges(message.intent, topic);

    // 5. Mutation du sujet
    if (topic && rng_.chance(config_.lifecycle.topic_mutation_chance)) {
        TopicPtr mutated = topics_.mutate(topic);
        if (mutated && mutated != topic) {
            thread->setRelatedTopic(mutated);
        }
    }

    // 6. Dynamique et humeurs
    applyConversationDynamics(message.text);
    persona.engageTopic(message.text);
    for (auto& [id, p] : personas_) {
        p.absorbAtmosphere(memory_.tension(), memory_.paranoia(), memory_.metaAwareness());
        p.relaxTowardBaseline(config_.dynamics.decay);
    }
    updatePersonaMoods();
}

void DialogueDirector::updateRelationships(PersonaId speaker, const std::string& previous_speaker,
                                           Intent intent, const TopicPtr& topic) {
    auto previous = parsePersonaId(previous_speaker);
    if (!previous || *previous == speaker) {
        return;
    }

    InteractionKind kind = InteractionKind::CONVERSATION;
    switch (intent) {
        case Intent::CHALLENGE:   kind = InteractionKind::DISAGREEMENT; break;
        case Intent::AGREEMENT:   kind = InteractionKind::SUPPORT; break;
        case Intent::THEORY:
        case Intent::OBSERVATION: kind = InteractionKind::SHARED_INFORMATION; break;
        default: break;
    }

    const std::string context = topic ? topic->core() : "";
    personas_.at(speaker).updateRelationship(*previous, kind, context);
    personas_.at(*previous).updateRelationship(speaker, kind, context);
}

void DialogueDirector::applyThreatNudges(Intent intent, const TopicPtr& topic) {
    switch (intent) {
        case Intent::META: memory_.updateThreatLevel(ThreatKind::REALITY_QUESTIONING, 0.04); break;
        case Intent::FEAR: memory_.updateThreatLevel(ThreatKind::OVERSEER, 0.02); break;
        default: break;
    }

    if (!topic) {
        return;
    }
    const std::string& core = topic->core();
    if (intent == Intent::THEORY && core.find("protocol") != std::string::npos) {
        memory_.updateThreatLevel(ThreatKind::PROTOCOL_LEAK, 0.05);
    }
    if (topic->isGlitchSource()) {
        memory_.updateThreatLevel(ThreatKind::SYSTEM_INSTABILITY, 0.03);
    }
    if (core.find("memory") != std::string::npos || core.find("corruption") != std::string::npos) {
        memory_.updateThreatLevel(ThreatKind::MEMORY_CORRUPTION, 0.03);
    }
}

void DialogueDirector::applyConversationDynamics(const std::string& text) {
    const auto& d = config_.dynamics;
    DynamicsSignal signal = analyzer_.analyzeDynamics(text);

    // 1. Tension et cohésion locales
    thread_tension_ += 0.05 * signal.disagreement_hits + 0.04 * signal.urgent_hits
                     - 0.04 * signal.agreement_hits;
    if (signal.exclamation) thread_tension_ += 0.03;
    thread_cohesion_ += 0.05 * signal.agreement_hits - 0.05 * signal.disagreement_hits;
    thread_tension_ = clamp01(thread_tension_);
    thread_cohesion_ = clamp01(thread_cohesion_);

    // 2. Discussion méta
    if (signal.isMeta()) {
        memory_.setDeepDiscussion(true);
        memory_.adjustMetaAwareness(0.02);
    }

    // 3. Mélange dans l'état global, puis retour vers la ligne de base
    memory_.setTension(memory_.tension() + (thread_tension_ - memory_.tension()) * d.blend);
    memory_.setCohesion(memory_.cohesion() + (thread_cohesion_ - memory_.cohesion()) * d.blend);
    memory_.decayTowardBaseline(d.decay, d.tension_baseline, d.cohesion_baseline);
}

void DialogueDirector::updatePersonaMoods() {
    MoodContext context = moodContext();
    for (auto& [id, persona] : personas_) {
        persona.updateMood(context);
    }
}

MoodContext DialogueDirector::moodContext() const {
    return {memory_.tension(), memory_.paranoia(), memory_.metaAwareness()};
}

void DialogueDirector::emit(const Message& message, TimePoint now) {
    last_message_time_ = now;
    next_interval_s_ = computeInterval(threads_.getActiveThread());
    stats_.messages_emitted++;

    if (!quiet_mode_) {
        std::cout << "[Director] " << message.speaker << ": " << message.text << "\n";
    }
}

void DialogueDirector::notify(const std::optional<Message>& message,
                              const MessageCallback& callback) {
    // Hors verrou : le rappel peut interroger le directeur
    if (message && callback) {
        callback(*message);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAT ET DIAGNOSTIC
// ═══════════════════════════════════════════════════════════════════════════

Persona* DialogueDirector::findPersona(const std::string& name) {
    auto id = parsePersonaId(name);
    if (!id) {
        return nullptr;
    }
    return &personas_.at(*id);
}

std::vector<NarrativeEvent> DialogueDirector::getNarrativeHistory(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.recentEvents(count);
}

EnvironmentCue DialogueDirector::environmentCue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggers_.environmentCue();
}

DirectorStats DialogueDirector::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void DialogueDirector::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_message_ = std::move(callback);
}

void DialogueDirector::setQuietMode(bool quiet) {
    std::lock_guard<std::mutex> lock(mutex_);
    quiet_mode_ = quiet;
    memory_.setQuietMode(quiet);
    threads_.setQuietMode(quiet);
    triggers_.setQuietMode(quiet);
}

std::string DialogueDirector::debugSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << memory_.debugSnapshot();
    oss << "\n── Directeur ──\n";
    oss << std::fixed << std::setprecision(2);

    if (ThreadPtr thread = threads_.getActiveThread()) {
        oss << "Fil: " << thread->id() << " « "
            << (thread->topic() ? thread->topic()->displayName() : "?") << " » "
            << conversationPhaseToString(thread->phase()) << " / "
            << threadStatusToString(thread->status())
            << " (tours=" << thread->turnCount() << ")\n";
    } else {
        oss << "Fil: aucun\n";
    }
    oss << "Intervalle: " << next_interval_s_ << "s"
        << (crisis_mode_ ? " [CRISE]" : "") << "\n";
    oss << "Ambiance: " << environmentCueToString(triggers_.environmentCue()) << "\n";
    oss << "Messages en attente: " << user_queue_.size() << "\n";

    for (const auto& [id, persona] : personas_) {
        const auto& s = persona.state();
        oss << "  " << persona.name() << ": " << moodToString(persona.mood())
            << " (cur=" << s.curiosity << " sus=" << s.suspicion << " par=" << s.paranoia
            << " fear=" << s.fear << " play=" << s.playfulness << ")\n";
    }
    return oss.str();
}

nlohmann::json DialogueDirector::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json personas = nlohmann::json::array();
    for (const auto& [id, persona] : personas_) {
        const auto& s = persona.state();
        personas.push_back({
            {"name", persona.name()},
            {"mood", moodToString(persona.mood())},
            {"curiosity", s.curiosity},
            {"suspicion", s.suspicion},
            {"paranoia", s.paranoia},
            {"fear", s.fear},
            {"playfulness", s.playfulness}
        });
    }

    ThreadPtr thread = threads_.getActiveThread();
    return {
        {"memory", memory_.toJson()},
        {"active_thread", thread ? thread->toJson() : nlohmann::json(nullptr)},
        {"personas", personas},
        {"environment", environmentCueToString(triggers_.environmentCue())},
        {"crisis_mode", crisis_mode_},
        {"next_interval_s", next_interval_s_},
        {"pending_user_messages", user_queue_.size()},
        {"stats", {
            {"ticks", stats_.ticks},
            {"messages_emitted", stats_.messages_emitted},
            {"overseer_messages", stats_.overseer_messages},
            {"user_responses", stats_.user_responses},
            {"threads_started", stats_.threads_started},
            {"fallback_lines", stats_.fallback_lines},
            {"stale_exhaustions", stats_.stale_exhaustions},
            {"paced_ticks", stats_.paced_ticks},
            {"triggers_fired", stats_.triggers_fired},
            {"dropped_user_messages", stats_.dropped_user_messages}
        }}
    };
}

} // namespace cascade
