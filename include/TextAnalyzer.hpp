/**
 * @file TextAnalyzer.hpp
 * @brief Analyse lexicale légère des répliques (sac de mots, familles de mots-clés)
 * @version 1.0
 * @date 2026-10-19
 *
 * Sert à trois usages :
 * - Détection des quasi-doublons (recouvrement de sacs de mots)
 * - Familles de mots-clés pour la dynamique de conversation
 * - Recherche de termes sensibles / phobies
 */

#ifndef CASCADE_TEXT_ANALYZER_HPP
#define CASCADE_TEXT_ANALYZER_HPP

#include <string>
#include <unordered_set>
#include <vector>

namespace cascade {

/**
 * @brief Signal de dynamique extrait d'une réplique
 */
struct DynamicsSignal {
    size_t disagreement_hits = 0;
    size_t agreement_hits = 0;
    size_t meta_hits = 0;
    size_t urgent_hits = 0;
    bool exclamation = false;

    [[nodiscard]] bool isMeta() const { return meta_hits > 0; }
    [[nodiscard]] bool isUrgent() const { return urgent_hits > 0 || exclamation; }
};

class TextAnalyzer {
public:
    TextAnalyzer();

    /**
     * @brief Familles de mots-clés sur une réplique
     */
    [[nodiscard]] DynamicsSignal analyzeDynamics(const std::string& text) const;

    // ═══════════════════════════════════════════════════════════════════════
    // UTILITAIRES
    // ═══════════════════════════════════════════════════════════════════════

    /// Minuscules, ponctuation retirée, espaces compactés
    static std::string normalizeText(const std::string& text);

    static std::vector<std::string> tokenize(const std::string& text);

    static std::unordered_set<std::string> wordSet(const std::string& text);

    /**
     * @brief |A∩B| / max(|A|, |B|) sur les ensembles de mots en minuscules
     */
    static double overlapRatio(const std::string& a, const std::string& b);

    /// Recherche de sous-chaîne insensible à la casse
    static bool containsAny(const std::string& text, const std::vector<std::string>& terms);

    /// Recherche de mots entiers (« real » ne reconnaît pas « already »)
    static bool containsAnyWord(const std::string& text, const std::vector<std::string>& terms);

    static std::string toLower(const std::string& text);

private:
    void initDefaultDictionaries();

    std::unordered_set<std::string> disagreement_words_;
    std::unordered_set<std::string> agreement_words_;
    std::unordered_set<std::string> meta_words_;
    std::unordered_set<std::string> urgent_words_;
};

} // namespace cascade

#endif // CASCADE_TEXT_ANALYZER_HPP
