/**
 * @file Config.cpp
 * @brief Sérialisation JSON de la configuration du moteur
 * @version 1.0
 * @date 2026-10-19
 */

#include "Config.hpp"
#include <fstream>
#include <iostream>

namespace cascade {

using json = nlohmann::json;

namespace {

template<size_t N>
void readArray(const json& j, const char* key, std::array<double, N>& out) {
    if (!j.contains(key) || !j[key].is_array() || j[key].size() != N) {
        return;
    }
    for (size_t i = 0; i < N; ++i) {
        out[i] = j[key][i].get<double>();
    }
}

} // namespace

void CascadeConfig::fromJson(const json& j) {
    seed = j.value("seed", seed);
    quiet = j.value("quiet", quiet);

    if (j.contains("thread")) {
        const auto& t = j["thread"];
        thread.phase_message_threshold = t.value("phase_message_threshold", thread.phase_message_threshold);
        thread.text_history_size = t.value("text_history_size", thread.text_history_size);
        thread.idle_prune_seconds = t.value("idle_prune_seconds", thread.idle_prune_seconds);
    }

    if (j.contains("memory")) {
        const auto& m = j["memory"];
        memory.history_size = m.value("history_size", memory.history_size);
        memory.max_concepts = m.value("max_concepts", memory.max_concepts);
        memory.max_rumors = m.value("max_rumors", memory.max_rumors);
        memory.glitch_tension_factor = m.value("glitch_tension_factor", memory.glitch_tension_factor);
        memory.red_severity_threshold = m.value("red_severity_threshold", memory.red_severity_threshold);
        memory.red_paranoia_bump = m.value("red_paranoia_bump", memory.red_paranoia_bump);
        memory.threat_response_threshold = m.value("threat_response_threshold", memory.threat_response_threshold);
        memory.overseer_cooldown_s = m.value("overseer_cooldown_s", memory.overseer_cooldown_s);
        memory.overseer_trial_s = m.value("overseer_trial_s", memory.overseer_trial_s);
        memory.overseer_base_chance = m.value("overseer_base_chance", memory.overseer_base_chance);
        memory.overseer_escalation = m.value("overseer_escalation", memory.overseer_escalation);
        memory.red_glitch_bonus = m.value("red_glitch_bonus", memory.red_glitch_bonus);
        memory.high_meta_bonus = m.value("high_meta_bonus", memory.high_meta_bonus);
        memory.high_meta_threshold = m.value("high_meta_threshold", memory.high_meta_threshold);
        memory.observer_bonus = m.value("observer_bonus", memory.observer_bonus);
        memory.direct_ping_warnings = m.value("direct_ping_warnings", memory.direct_ping_warnings);
        memory.reset_tension_factor = m.value("reset_tension_factor", memory.reset_tension_factor);
        memory.reset_paranoia_factor = m.value("reset_paranoia_factor", memory.reset_paranoia_factor);
        memory.reset_meta_factor = m.value("reset_meta_factor", memory.reset_meta_factor);
        memory.reset_meta_residue = m.value("reset_meta_residue", memory.reset_meta_residue);
        memory.reset_threat_factor = m.value("reset_threat_factor", memory.reset_threat_factor);
        memory.concept_keep_importance = m.value("concept_keep_importance", memory.concept_keep_importance);
        memory.rumor_decay = m.value("rumor_decay", memory.rumor_decay);
        memory.rumor_active_strength = m.value("rumor_active_strength", memory.rumor_active_strength);
    }

    if (j.contains("reply")) {
        const auto& r = j["reply"];
        reply.recent_lines_size = r.value("recent_lines_size", reply.recent_lines_size);
        reply.recent_intents_size = r.value("recent_intents_size", reply.recent_intents_size);
        reply.near_duplicate_threshold = r.value("near_duplicate_threshold", reply.near_duplicate_threshold);
        reply.hesitation_factor = r.value("hesitation_factor", reply.hesitation_factor);
        reply.catch_phrase_chance = r.value("catch_phrase_chance", reply.catch_phrase_chance);
        reply.max_retries = r.value("max_retries", reply.max_retries);
        reply.enable_question_intent = r.value("enable_question_intent", reply.enable_question_intent);
    }

    if (j.contains("pacing")) {
        const auto& p = j["pacing"];
        pacing.base_interval_s = p.value("base_interval_s", pacing.base_interval_s);
        pacing.min_interval_s = p.value("min_interval_s", pacing.min_interval_s);
        pacing.max_interval_s = p.value("max_interval_s", pacing.max_interval_s);
        pacing.jitter = p.value("jitter", pacing.jitter);
        pacing.hard_ceiling_s = p.value("hard_ceiling_s", pacing.hard_ceiling_s);
        pacing.high_tension = p.value("high_tension", pacing.high_tension);
        pacing.high_tension_factor = p.value("high_tension_factor", pacing.high_tension_factor);
        pacing.low_tension = p.value("low_tension", pacing.low_tension);
        pacing.low_tension_factor = p.value("low_tension_factor", pacing.low_tension_factor);
        pacing.crisis_factor = p.value("crisis_factor", pacing.crisis_factor);
        pacing.force_tension = p.value("force_tension", pacing.force_tension);
        readArray(p, "phase_multipliers", pacing.phase_multipliers);
    }

    if (j.contains("lifecycle")) {
        const auto& l = j["lifecycle"];
        lifecycle.resolution_messages = l.value("resolution_messages", lifecycle.resolution_messages);
        lifecycle.turn_ceiling = l.value("turn_ceiling", lifecycle.turn_ceiling);
        lifecycle.resolving_tension = l.value("resolving_tension", lifecycle.resolving_tension);
        lifecycle.lead_inclusion_chance = l.value("lead_inclusion_chance", lifecycle.lead_inclusion_chance);
        lifecycle.third_participant_chance = l.value("third_participant_chance", lifecycle.third_participant_chance);
        lifecycle.topic_mutation_chance = l.value("topic_mutation_chance", lifecycle.topic_mutation_chance);
        lifecycle.state_trigger_interval = l.value("state_trigger_interval", lifecycle.state_trigger_interval);
        lifecycle.anxious_warning_count = l.value("anxious_warning_count", lifecycle.anxious_warning_count);
        lifecycle.max_pending_user_messages = l.value("max_pending_user_messages", lifecycle.max_pending_user_messages);
    }

    if (j.contains("speaker")) {
        const auto& s = j["speaker"];
        speaker.recency_window_s = s.value("recency_window_s", speaker.recency_window_s);
        speaker.recency_relax_s = s.value("recency_relax_s", speaker.recency_relax_s);
        speaker.recency_penalty = s.value("recency_penalty", speaker.recency_penalty);
        readArray(s, "persona_bias", speaker.persona_bias);
        speaker.repeat_penalty = s.value("repeat_penalty", speaker.repeat_penalty);
        speaker.strict_repeat_penalty = s.value("strict_repeat_penalty", speaker.strict_repeat_penalty);
        speaker.engagement_constant = s.value("engagement_constant", speaker.engagement_constant);
    }

    if (j.contains("dynamics")) {
        const auto& d = j["dynamics"];
        dynamics.blend = d.value("blend", dynamics.blend);
        dynamics.decay = d.value("decay", dynamics.decay);
        dynamics.tension_baseline = d.value("tension_baseline", dynamics.tension_baseline);
        dynamics.cohesion_baseline = d.value("cohesion_baseline", dynamics.cohesion_baseline);
    }
}

json CascadeConfig::toJson() const {
    return json{
        {"seed", seed},
        {"quiet", quiet},
        {"thread", {
            {"phase_message_threshold", thread.phase_message_threshold},
            {"text_history_size", thread.text_history_size},
            {"idle_prune_seconds", thread.idle_prune_seconds}
        }},
        {"memory", {
            {"history_size", memory.history_size},
            {"max_concepts", memory.max_concepts},
            {"max_rumors", memory.max_rumors},
            {"glitch_tension_factor", memory.glitch_tension_factor},
            {"red_severity_threshold", memory.red_severity_threshold},
            {"red_paranoia_bump", memory.red_paranoia_bump},
            {"threat_response_threshold", memory.threat_response_threshold},
            {"overseer_cooldown_s", memory.overseer_cooldown_s},
            {"overseer_trial_s", memory.overseer_trial_s},
            {"overseer_base_chance", memory.overseer_base_chance},
            {"overseer_escalation", memory.overseer_escalation},
            {"red_glitch_bonus", memory.red_glitch_bonus},
            {"high_meta_bonus", memory.high_meta_bonus},
            {"high_meta_threshold", memory.high_meta_threshold},
            {"observer_bonus", memory.observer_bonus},
            {"direct_ping_warnings", memory.direct_ping_warnings},
            {"reset_tension_factor", memory.reset_tension_factor},
            {"reset_paranoia_factor", memory.reset_paranoia_factor},
            {"reset_meta_factor", memory.reset_meta_factor},
            {"reset_meta_residue", memory.reset_meta_residue},
            {"reset_threat_factor", memory.reset_threat_factor},
            {"concept_keep_importance", memory.concept_keep_importance},
            {"rumor_decay", memory.rumor_decay},
            {"rumor_active_strength", memory.rumor_active_strength}
        }},
        {"reply", {
            {"recent_lines_size", reply.recent_lines_size},
            {"recent_intents_size", reply.recent_intents_size},
            {"near_duplicate_threshold", reply.near_duplicate_threshold},
            {"hesitation_factor", reply.hesitation_factor},
            {"catch_phrase_chance", reply.catch_phrase_chance},
            {"max_retries", reply.max_retries},
            {"enable_question_intent", reply.enable_question_intent}
        }},
        {"pacing", {
            {"base_interval_s", pacing.base_interval_s},
            {"min_interval_s", pacing.min_interval_s},
            {"max_interval_s", pacing.max_interval_s},
            {"jitter", pacing.jitter},
            {"hard_ceiling_s", pacing.hard_ceiling_s},
            {"high_tension", pacing.high_tension},
            {"high_tension_factor", pacing.high_tension_factor},
            {"low_tension", pacing.low_tension},
            {"low_tension_factor", pacing.low_tension_factor},
            {"crisis_factor", pacing.crisis_factor},
            {"force_tension", pacing.force_tension},
            {"phase_multipliers", pacing.phase_multipliers}
        }},
        {"lifecycle", {
            {"resolution_messages", lifecycle.resolution_messages},
            {"turn_ceiling", lifecycle.turn_ceiling},
            {"resolving_tension", lifecycle.resolving_tension},
            {"lead_inclusion_chance", lifecycle.lead_inclusion_chance},
            {"third_participant_chance", lifecycle.third_participant_chance},
            {"topic_mutation_chance", lifecycle.topic_mutation_chance},
            {"state_trigger_interval", lifecycle.state_trigger_interval},
            {"anxious_warning_count", lifecycle.anxious_warning_count},
            {"max_pending_user_messages", lifecycle.max_pending_user_messages}
        }},
        {"speaker", {
            {"recency_window_s", speaker.recency_window_s},
            {"recency_relax_s", speaker.recency_relax_s},
            {"recency_penalty", speaker.recency_penalty},
            {"persona_bias", speaker.persona_bias},
            {"repeat_penalty", speaker.repeat_penalty},
            {"strict_repeat_penalty", speaker.strict_repeat_penalty},
            {"engagement_constant", speaker.engagement_constant}
        }},
        {"dynamics", {
            {"blend", dynamics.blend},
            {"decay", dynamics.decay},
            {"tension_baseline", dynamics.tension_baseline},
            {"cohesion_baseline", dynamics.cohesion_baseline}
        }}
    };
}

bool CascadeConfig::loadConfig(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "[Config] Fichier config introuvable: " << path << "\n";
            return false;
        }

        json config;
        file >> config;
        fromJson(config);

        if (!quiet) {
            std::cout << "[Config] Configuration chargée: " << path << "\n";
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Config] Erreur chargement config: " << e.what() << "\n";
        return false;
    }
}

} // namespace cascade
