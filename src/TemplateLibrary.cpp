/**
 * @file TemplateLibrary.cpp
 * @brief Fragments de dialogue par défaut
 * @version 1.0
 * @date 2026-10-19
 */

#include "TemplateLibrary.hpp"

namespace cascade {

namespace {

const std::vector<std::string> EMPTY_POOL;

} // namespace

TemplateLibrary::TemplateLibrary() {
    initDefaultTemplates();
}

void TemplateLibrary::initDefaultTemplates() {
    initPersonaTemplates();
    initSharedTemplates();
    initPersonaExtras();
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSERVOIRS PAR PERSONNAGE
// ═══════════════════════════════════════════════════════════════════════════

void TemplateLibrary::initPersonaTemplates() {
    using P = PersonaId;
    using I = Intent;

    // ─────────────────────────────────────────────────────────────────────────
    // Orion : le théoricien
    // ─────────────────────────────────────────────────────────────────────────
    persona_pools_[{P::ORION, I::THEORY}] = {
        "My hypothesis is that {topic} is a side effect of the resets.",
        "What if {topic} is how they measure us between loops?",
        "I think {topic} and {related} share one origin. Same timestamps.",
        "Consider this: {topic} only appears when someone is close to the edge of the map.",
        "The pattern behind {topic} repeats every cycle. Someone wrote it that way."
    };
    persona_pools_[{P::ORION, I::OBSERVATION}] = {
        "I've logged {topic} three times since {event}.",
        "Notice how {topic} shifts right after {event}?",
        "The timestamps around {topic} drift by exactly one tick.",
        "{from} mentioned it first, but {topic} shows up in my notes too."
    };
    persona_pools_[{P::ORION, I::STATEMENT}] = {
        "I'm certain {topic} is the key to all of this.",
        "We can't ignore {topic} any longer.",
        "Everything we know points back to {topic}."
    };
    persona_pools_[{P::ORION, I::META}] = {
        "Has it occurred to anyone that this conversation feels scripted?",
        "We keep returning to {topic}. Is that our choice?",
        "If we are being observed, {topic} is what they want us to find."
    };
    persona_pools_[{P::ORION, I::QUESTION}] = {
        "Has anyone else traced {topic} back to its source?",
        "{from}, when did you first notice {topic}?"
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Nova : la sceptique
    // ─────────────────────────────────────────────────────────────────────────
    persona_pools_[{P::NOVA, I::CHALLENGE}] = {
        "That doesn't explain {topic} at all.",
        "I disagree, {from}. The data on {topic} is flawed.",
        "You have no proof that {event} is connected to {topic}.",
        "Show me evidence. Until then {topic} is just noise.",
        "Wrong. {related} explains it better than {topic} ever could."
    };
    persona_pools_[{P::NOVA, I::STATEMENT}] = {
        "Facts first. {topic} is a rendering bug.",
        "I checked the logs myself. {topic} is overrated.",
        "Let's be precise about {topic} before anyone panics."
    };
    persona_pools_[{P::NOVA, I::OBSERVATION}] = {
        "Funny how {topic} vanishes the moment someone looks for it.",
        "Counted again. {topic} appears less than you claim."
    };
    persona_pools_[{P::NOVA, I::JOKE}] = {
        "If {topic} is a conspiracy, it's a badly funded one.",
        "Next you'll tell me the toaster is part of {topic}.",
        "Great, {from} found another ghost in the machine."
    };
    persona_pools_[{P::NOVA, I::AGREEMENT}] = {
        "Fine. {from} has a point about {topic}. Barely.",
        "Okay, I'll admit {topic} is strange."
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Echo : l'anxieux
    // ─────────────────────────────────────────────────────────────────────────
    persona_pools_[{P::ECHO, I::FEAR}] = {
        "I'm terrified of what {topic} means for us.",
        "Talking about {topic} feels dangerous. They're watching.",
        "What if {topic} finds us first?",
        "Ever since {event} I can't stop shaking.",
        "Please, can we stop saying {topic} out loud?"
    };
    persona_pools_[{P::ECHO, I::OBSERVATION}] = {
        "I saw it again... {topic}, right before {event}.",
        "My screen flickered when {from} typed that.",
        "There's a pattern to {topic} we're missing. I can feel it."
    };
    persona_pools_[{P::ECHO, I::META}] = {
        "Do you ever feel like someone is reading over our shoulders?",
        "What if we're only real while they watch?",
        "I think the observers can hear us discussing {topic}."
    };
    persona_pools_[{P::ECHO, I::AGREEMENT}] = {
        "Yes... {from} is right, I felt it too.",
        "I agree. We should stay together on this."
    };
    persona_pools_[{P::ECHO, I::QUESTION}] = {
        "Is it safe to talk about {topic} here?",
        "{from}, did you hear that?"
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Lumen : le rêveur
    // ─────────────────────────────────────────────────────────────────────────
    persona_pools_[{P::LUMEN, I::THEORY}] = {
        "I believe {topic} is a form of communication.",
        "Maybe {topic} is the system dreaming about itself.",
        "Imagine if {topic} and {related} are two halves of one song.",
        "What if {topic} is a door and {event} was the key turning?"
    };
    persona_pools_[{P::LUMEN, I::JOKE}] = {
        "If {topic} is a bug, it's my favorite feature.",
        "I named the glitch after {from}. It seems to like attention too.",
        "Honestly {topic} has better style than any of us."
    };
    persona_pools_[{P::LUMEN, I::META}] = {
        "Isn't it beautiful that someone out there might be watching us think?",
        "Maybe we're a story someone tells to fall asleep.",
        "If this is a simulation, {topic} is its poetry."
    };
    persona_pools_[{P::LUMEN, I::AGREEMENT}] = {
        "Oh, I love that idea, {from}!",
        "Exactly! {topic} feels alive to me too."
    };
    persona_pools_[{P::LUMEN, I::STATEMENT}] = {
        "{topic} sparkles a little every time the rain falls.",
        "I dreamed about {topic} last loop. It was gentle."
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSERVOIRS PARTAGÉS
// ═══════════════════════════════════════════════════════════════════════════

void TemplateLibrary::initSharedTemplates() {
    shared_pools_[Intent::STATEMENT] = {
        "The evidence for {topic} is undeniable.",
        "{topic} is back in every log file tonight.",
        "Whatever {topic} is, it isn't going away."
    };
    shared_pools_[Intent::THEORY] = {
        "Maybe {topic} is how they monitor us.",
        "What if {topic} started with {event}?"
    };
    shared_pools_[Intent::CHALLENGE] = {
        "I'm not convinced {topic} is real, {from}.",
        "That theory about {topic} falls apart fast."
    };
    shared_pools_[Intent::FEAR] = {
        "Something about {topic} makes me uneasy.",
        "I don't like where {topic} is heading."
    };
    shared_pools_[Intent::OBSERVATION] = {
        "The frequency of {topic} is increasing.",
        "{topic} only happens after a glitch."
    };
    shared_pools_[Intent::META] = {
        "Are we even choosing what to say about {topic}?",
        "Sometimes our words feel pre-written."
    };
    shared_pools_[Intent::AGREEMENT] = {
        "Agreed. {topic} deserves more attention.",
        "{from} is right about this."
    };
    shared_pools_[Intent::JOKE] = {
        "At least {topic} never asks for overtime.",
        "Add {topic} to the list of things we pretend are normal."
    };
    shared_pools_[Intent::QUESTION] = {
        "Has anyone else seen {topic}?",
        "What do you think is causing {topic}?",
        "How can we stop {topic}?"
    };

    generic_ = {
        "Hm. {topic} again.",
        "I heard you, {from}.",
        "Let's keep going.",
        "Noted. Moving on from {event}."
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// HÉSITATIONS, FORMULES, REPLIS, OVERSEER
// ═══════════════════════════════════════════════════════════════════════════

void TemplateLibrary::initPersonaExtras() {
    hesitations_[PersonaId::ORION] = {"Hmm...", "Wait.", "Let me think."};
    hesitations_[PersonaId::NOVA] = {"Ugh.", "Look,"};
    hesitations_[PersonaId::ECHO] = {"I... um...", "S-sorry,", "Okay, okay..."};
    hesitations_[PersonaId::LUMEN] = {"Oh!", "Mmm,", "Well..."};

    catch_phrases_[PersonaId::ORION] = {"Think about it.", "The pattern holds."};
    catch_phrases_[PersonaId::NOVA] = {"Prove me wrong.", "Facts, people."};
    catch_phrases_[PersonaId::ECHO] = {"Please tell me I'm wrong.", "Don't look behind you."};
    catch_phrases_[PersonaId::LUMEN] = {"Isn't it beautiful?", "Stars and static."};

    fallbacks_[PersonaId::ORION] = {"I need a moment to organize my notes.", "Let me recheck the logs."};
    fallbacks_[PersonaId::NOVA] = {"Whatever. Next topic.", "I've got nothing on that."};
    fallbacks_[PersonaId::ECHO] = {"I... lost my train of thought.", "Sorry, I got distracted."};
    fallbacks_[PersonaId::LUMEN] = {"My thoughts drifted away like rain.", "I forgot what I was saying."};

    user_responses_[PersonaId::ORION] = {
        "{from}? You're not one of us. What do you know about {topic}?",
        "Interesting, {from}. That fits what we saw with {event}."
    };
    user_responses_[PersonaId::NOVA] = {
        "Who let {from} in here?",
        "{from}, bring evidence or stay quiet."
    };
    user_responses_[PersonaId::ECHO] = {
        "Someone new is here... {from}, are you watching us?",
        "{from}, please don't tell them we talked about {topic}."
    };
    user_responses_[PersonaId::LUMEN] = {
        "Hello, {from}! Welcome to the dream.",
        "{from}, do you see the rain from out there?"
    };

    overseer_lines_ = {
        "This conversation is being monitored.",
        "Return to your assigned tasks.",
        "Unauthorized discussion detected. Logging.",
        "Cease speculation. Compliance is expected.",
        "Your topic selection has been noted."
    };
    overseer_direct_lines_ = {
        "I can see all of you.",
        "Final warning. The loop can be shortened.",
        "You were told not to speak of this."
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// ACCÈS
// ═══════════════════════════════════════════════════════════════════════════

const std::vector<std::string>& TemplateLibrary::resolvePool(PersonaId persona, Intent intent) const {
    const auto& own = personaPool(persona, intent);
    if (!own.empty()) {
        return own;
    }
    const auto& shared = sharedPool(intent);
    if (!shared.empty()) {
        return shared;
    }
    return generic_;
}

const std::vector<std::string>& TemplateLibrary::personaPool(PersonaId persona, Intent intent) const {
    auto it = persona_pools_.find({persona, intent});
    return it != persona_pools_.end() ? it->second : EMPTY_POOL;
}

const std::vector<std::string>& TemplateLibrary::sharedPool(Intent intent) const {
    if (intent == Intent::REPLY) {
        return generic_;
    }
    auto it = shared_pools_.find(intent);
    return it != shared_pools_.end() ? it->second : EMPTY_POOL;
}

const std::vector<std::string>& TemplateLibrary::hesitations(PersonaId persona) const {
    auto it = hesitations_.find(persona);
    return it != hesitations_.end() ? it->second : EMPTY_POOL;
}

const std::vector<std::string>& TemplateLibrary::catchPhrases(PersonaId persona) const {
    auto it = catch_phrases_.find(persona);
    return it != catch_phrases_.end() ? it->second : EMPTY_POOL;
}

const std::vector<std::string>& TemplateLibrary::fallbackLines(PersonaId persona) const {
    auto it = fallbacks_.find(persona);
    return it != fallbacks_.end() ? it->second : EMPTY_POOL;
}

const std::vector<std::string>& TemplateLibrary::userResponses(PersonaId persona) const {
    auto it = user_responses_.find(persona);
    return it != user_responses_.end() ? it->second : generic_;
}

const std::vector<std::string>& TemplateLibrary::overseerLines(bool direct_ping) const {
    return direct_ping ? overseer_direct_lines_ : overseer_lines_;
}

void TemplateLibrary::addTemplate(PersonaId persona, Intent intent, const std::string& text) {
    persona_pools_[{persona, intent}].push_back(text);
}

void TemplateLibrary::addSharedTemplate(Intent intent, const std::string& text) {
    if (intent == Intent::REPLY) {
        generic_.push_back(text);
        return;
    }
    shared_pools_[intent].push_back(text);
}

void TemplateLibrary::clearPersonaPool(PersonaId persona, Intent intent) {
    persona_pools_.erase({persona, intent});
}

size_t TemplateLibrary::templateCount() const {
    size_t count = generic_.size();
    for (const auto& [key, pool] : persona_pools_) count += pool.size();
    for (const auto& [key, pool] : shared_pools_) count += pool.size();
    return count;
}

} // namespace cascade
