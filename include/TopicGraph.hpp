/**
 * @file TopicGraph.hpp
 * @brief Réservoir de sujets de discussion, graphe de relations et mutations
 * @version 1.0
 * @date 2026-10-19
 *
 * Invariant : un identifiant de cœur correspond à exactement une instance
 * vivante de Topic (propriété partagée, adresse stable). Les mutations
 * modifient l'instance en place, jamais de duplication.
 */

#ifndef CASCADE_TOPIC_GRAPH_HPP
#define CASCADE_TOPIC_GRAPH_HPP

#include "Types.hpp"
#include "Random.hpp"
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace cascade {

inline const std::string REDACTED_DISPLAY = "[REDACTED]";

/**
 * @brief Sujet de discussion
 */
class Topic {
public:
    Topic(std::string core, TimePoint now);

    void markDiscussed(const std::string& persona, TimePoint now);
    void markDoubted(const std::string& persona);
    void markForbidden(const std::string& persona);
    void markRumor(bool rumor = true) { is_rumor_ = rumor; }
    void markGlitchSource(bool source = true) { is_glitch_source_ = source; }
    void setStatus(TopicStatus status) { status_ = status; }

    /**
     * @brief Nouvelle variante d'affichage ; FORBIDDEN reste FORBIDDEN
     */
    void applyVariant(const std::string& variant);

    /// [REDACTED] si interdit, sinon variante ou cœur
    [[nodiscard]] std::string displayName() const;

    [[nodiscard]] const std::string& core() const { return core_; }
    [[nodiscard]] const std::string& variant() const { return variant_; }
    [[nodiscard]] TopicStatus status() const { return status_; }
    [[nodiscard]] int timesDiscussed() const { return times_discussed_; }
    [[nodiscard]] bool isRumor() const { return is_rumor_; }
    [[nodiscard]] bool isGlitchSource() const { return is_glitch_source_; }
    [[nodiscard]] bool isHeated() const {
        return status_ == TopicStatus::CONTROVERSIAL || status_ == TopicStatus::FORBIDDEN;
    }
    [[nodiscard]] TimePoint createdAt() const { return created_at_; }
    [[nodiscard]] TimePoint lastDiscussed() const { return last_discussed_; }
    [[nodiscard]] const std::set<std::string>& believers() const { return believers_; }
    [[nodiscard]] const std::set<std::string>& doubters() const { return doubters_; }
    [[nodiscard]] const std::set<std::string>& forbiddenBy() const { return forbidden_by_; }

    [[nodiscard]] nlohmann::json toJson() const;

private:
    std::string core_;
    std::string variant_;
    TopicStatus status_ = TopicStatus::NEUTRAL;
    int times_discussed_ = 0;
    bool is_rumor_ = false;
    bool is_glitch_source_ = false;
    TimePoint created_at_;
    TimePoint last_discussed_;

    std::set<std::string> believers_;
    std::set<std::string> doubters_;
    std::set<std::string> forbidden_by_;
};

using TopicPtr = std::shared_ptr<Topic>;

/**
 * @brief Pool de sujets + graphe symétrique de relations
 */
class TopicGraph {
public:
    // Probabilités de mutation
    static constexpr double RELATED_ESCALATION_CHANCE = 0.30;
    static constexpr double FORBIDDEN_CHANCE = 0.10;
    static constexpr double RUMOR_CHANCE = 0.13;
    static constexpr double GLITCH_SOURCE_CHANCE = 0.08;

    explicit TopicGraph(Rng& rng, TimeSource clock = systemTimeSource());

    /**
     * @brief Recherche ou insertion ; toujours la même instance pour un cœur
     */
    TopicPtr getOrCreate(const std::string& core);

    /**
     * @return nullptr si le cœur n'a jamais été référencé
     */
    [[nodiscard]] TopicPtr find(const std::string& core) const;

    /// Tirage uniforme dans le réservoir de départ
    TopicPtr getRandom();

    /// Voisin uniforme dans le graphe ; getRandom() si aucun voisin
    TopicPtr getRelated(const TopicPtr& topic);

    /**
     * @brief Mutation : 30 % escalade vers un voisin, sinon nouvelle variante
     * @return Le sujet résultant (voisin ou sujet muté en place)
     */
    TopicPtr mutate(const TopicPtr& topic);

    /**
     * @brief Sujet controversé ou interdit ; en force un si aucun n'existe
     */
    TopicPtr getControversialOrForbidden();

    void markRumor(const std::string& core, const std::string& by = "");

    void addRelation(const std::string& a, const std::string& b);

    [[nodiscard]] std::vector<std::string> relatedCores(const std::string& core) const;
    [[nodiscard]] const std::vector<std::string>& seedPool() const { return seed_pool_; }
    [[nodiscard]] size_t size() const { return topics_.size(); }

    /// Une ligne par sujet : affichage | statut | rumeur | discussions
    [[nodiscard]] std::vector<std::string> debugList() const;

    [[nodiscard]] nlohmann::json toJson() const;

private:
    void initSeedPool();

    Rng& rng_;
    TimeSource clock_;

    std::unordered_map<std::string, TopicPtr> topics_;
    std::unordered_map<std::string, std::vector<std::string>> relations_;
    std::vector<std::string> seed_pool_;
    std::vector<std::string> variant_templates_;
};

} // namespace cascade

#endif // CASCADE_TOPIC_GRAPH_HPP
