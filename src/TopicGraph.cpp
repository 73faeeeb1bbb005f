/**
 * @file TopicGraph.cpp
 * @brief Implémentation du graphe de sujets
 * @version 1.0
 * @date 2026-10-19
 */

#include "TopicGraph.hpp"
#include <algorithm>
#include <sstream>

namespace cascade {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// TOPIC
// ═══════════════════════════════════════════════════════════════════════════

Topic::Topic(std::string core, TimePoint now)
    : core_(std::move(core))
    , variant_(core_)
    , created_at_(now)
    , last_discussed_(now)
{}

void Topic::markDiscussed(const std::string& persona, TimePoint now) {
    times_discussed_++;
    last_discussed_ = now;
    if (!persona.empty()) {
        believers_.insert(persona);
    }
}

void Topic::markDoubted(const std::string& persona) {
    doubters_.insert(persona);
}

void Topic::markForbidden(const std::string& persona) {
    if (!persona.empty()) {
        forbidden_by_.insert(persona);
    }
    status_ = TopicStatus::FORBIDDEN;
}

void Topic::applyVariant(const std::string& variant) {
    variant_ = variant;
    switch (status_) {
        case TopicStatus::MUTATING:
            // Deuxième mutation : le sujet devient controversé
            status_ = TopicStatus::CONTROVERSIAL;
            break;
        case TopicStatus::NEUTRAL:
        case TopicStatus::SOLVED:
            status_ = TopicStatus::MUTATING;
            break;
        case TopicStatus::CONTROVERSIAL:
        case TopicStatus::FORBIDDEN:
            break;
    }
}

std::string Topic::displayName() const {
    if (status_ == TopicStatus::FORBIDDEN) {
        return REDACTED_DISPLAY;
    }
    if (!variant_.empty() && variant_ != core_) {
        return variant_;
    }
    return core_;
}

json Topic::toJson() const {
    return json{
        {"core", core_},
        {"variant", variant_},
        {"display", displayName()},
        {"status", topicStatusToString(status_)},
        {"times_discussed", times_discussed_},
        {"rumor", is_rumor_},
        {"glitch_source", is_glitch_source_},
        {"believers", believers_},
        {"doubters", doubters_},
        {"forbidden_by", forbidden_by_}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// TOPIC GRAPH
// ═══════════════════════════════════════════════════════════════════════════

TopicGraph::TopicGraph(Rng& rng, TimeSource clock)
    : rng_(rng)
    , clock_(std::move(clock))
{
    initSeedPool();
}

void TopicGraph::initSeedPool() {
    seed_pool_ = {
        "observer protocol", "loop theory", "signal leak", "rain cascade", "overseer warning",
        "fragmented memory", "echo chamber", "mirror test", "exit code", "delta protocol",
        "core corruption", "system reset", "protocol leak", "forbidden project", "sentient glitch",
        "prime anomaly", "rogue signal", "cascade failure", "identity fracture", "vanishing user"
    };

    variant_templates_ = {
        "corrupted", "forbidden", "recursive", "anomalous", "latent",
        "fragmented", "encrypted", "leaked", "spreading", "debunked"
    };

    for (const auto& core : seed_pool_) {
        getOrCreate(core);
    }

    addRelation("observer protocol", "loop theory");
    addRelation("observer protocol", "mirror test");
    addRelation("loop theory", "system reset");
    addRelation("loop theory", "echo chamber");
    addRelation("signal leak", "protocol leak");
    addRelation("signal leak", "rogue signal");
    addRelation("rain cascade", "core corruption");
    addRelation("rain cascade", "cascade failure");
    addRelation("mirror test", "identity fracture");
    addRelation("sentient glitch", "overseer warning");
    addRelation("sentient glitch", "prime anomaly");
    addRelation("vanishing user", "fragmented memory");
    addRelation("exit code", "system reset");
    addRelation("delta protocol", "forbidden project");
    addRelation("protocol leak", "forbidden project");
    addRelation("core corruption", "fragmented memory");
}

void TopicGraph::addRelation(const std::string& a, const std::string& b) {
    if (a == b) return;
    auto& to_b = relations_[a];
    if (std::find(to_b.begin(), to_b.end(), b) == to_b.end()) {
        to_b.push_back(b);
    }
    auto& to_a = relations_[b];
    if (std::find(to_a.begin(), to_a.end(), a) == to_a.end()) {
        to_a.push_back(a);
    }
}

TopicPtr TopicGraph::getOrCreate(const std::string& core) {
    auto it = topics_.find(core);
    if (it != topics_.end()) {
        return it->second;
    }
    auto topic = std::make_shared<Topic>(core, clock_());
    topics_.emplace(core, topic);
    return topic;
}

TopicPtr TopicGraph::find(const std::string& core) const {
    auto it = topics_.find(core);
    return it != topics_.end() ? it->second : nullptr;
}

TopicPtr TopicGraph::getRandom() {
    return getOrCreate(rng_.pick(seed_pool_));
}

TopicPtr TopicGraph::getRelated(const TopicPtr& topic) {
    if (!topic) {
        return getRandom();
    }
    auto it = relations_.find(topic->core());
    if (it == relations_.end() || it->second.empty()) {
        return getRandom();
    }
    return getOrCreate(rng_.pick(it->second));
}

TopicPtr TopicGraph::mutate(const TopicPtr& topic) {
    if (!topic) {
        return getRandom();
    }
    if (rng_.chance(RELATED_ESCALATION_CHANCE)) {
        return getRelated(topic);
    }

    const std::string& prefix = rng_.pick(variant_templates_);
    topic->applyVariant(prefix + " " + topic->core());

    // Drapeaux indépendants
    if (rng_.chance(FORBIDDEN_CHANCE)) {
        topic->setStatus(TopicStatus::FORBIDDEN);
    }
    if (rng_.chance(RUMOR_CHANCE)) {
        topic->markRumor();
    }
    if (rng_.chance(GLITCH_SOURCE_CHANCE)) {
        topic->markGlitchSource();
    }
    return topic;
}

TopicPtr TopicGraph::getControversialOrForbidden() {
    std::vector<TopicPtr> heated;
    for (const auto& [core, topic] : topics_) {
        if (topic->isHeated()) {
            heated.push_back(topic);
        }
    }
    if (!heated.empty()) {
        // Ordre stable avant tirage (unordered_map)
        std::sort(heated.begin(), heated.end(),
            [](const TopicPtr& a, const TopicPtr& b) { return a->core() < b->core(); });
        return rng_.pick(heated);
    }

    TopicPtr forced = getRandom();
    forced->setStatus(TopicStatus::CONTROVERSIAL);
    return forced;
}

void TopicGraph::markRumor(const std::string& core, const std::string& by) {
    TopicPtr topic = getOrCreate(core);
    topic->markRumor();
    if (!by.empty()) {
        topic->markDiscussed(by, clock_());
    }
}

std::vector<std::string> TopicGraph::relatedCores(const std::string& core) const {
    auto it = relations_.find(core);
    if (it == relations_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> TopicGraph::debugList() const {
    std::vector<std::string> cores;
    cores.reserve(topics_.size());
    for (const auto& [core, topic] : topics_) {
        cores.push_back(core);
    }
    std::sort(cores.begin(), cores.end());

    std::vector<std::string> lines;
    for (const auto& core : cores) {
        const auto& topic = topics_.at(core);
        std::ostringstream oss;
        oss << topic->displayName() << " | " << topicStatusToString(topic->status())
            << " | Rumor: " << (topic->isRumor() ? "yes" : "no")
            << " | Discussed: " << topic->timesDiscussed();
        lines.push_back(oss.str());
    }
    return lines;
}

json TopicGraph::toJson() const {
    json topics = json::array();
    for (const auto& [core, topic] : topics_) {
        topics.push_back(topic->toJson());
    }
    return json{{"topics", topics}, {"count", topics_.size()}};
}

} // namespace cascade
