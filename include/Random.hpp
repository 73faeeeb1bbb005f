/**
 * @file Random.hpp
 * @brief Source aléatoire partagée et ensemençable du moteur
 * @version 1.0
 * @date 2026-10-19
 *
 * Une seule instance est détenue par le DialogueDirector et passée par
 * référence aux composants : une graine fixe rend une session reproductible.
 */

#ifndef CASCADE_RANDOM_HPP
#define CASCADE_RANDOM_HPP

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

namespace cascade {

class Rng {
public:
    /**
     * @param seed Graine ; 0 = graine non déterministe (std::random_device)
     */
    explicit Rng(uint64_t seed = 0) { reseed(seed); }

    void reseed(uint64_t seed) {
        seed_ = seed != 0 ? seed : static_cast<uint64_t>(std::random_device{}());
        engine_.seed(seed_);
    }

    [[nodiscard]] uint64_t seed() const { return seed_; }

    /// Tirage uniforme dans [0, 1)
    double uniform() {
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
    }

    /// Tirage uniforme dans [lo, hi)
    double range(double lo, double hi) {
        return std::uniform_real_distribution<double>(lo, hi)(engine_);
    }

    /// Indice uniforme dans [0, n)
    size_t index(size_t n) {
        if (n == 0) {
            throw std::out_of_range("Rng::index sur un ensemble vide");
        }
        return std::uniform_int_distribution<size_t>(0, n - 1)(engine_);
    }

    /// Épreuve de Bernoulli
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return uniform() < p;
    }

    template<typename T>
    const T& pick(const std::vector<T>& items) {
        return items[index(items.size())];
    }

    /**
     * @brief Loterie à poids cumulés
     * @return Indice tiré ; si tous les poids sont nuls, tirage uniforme
     */
    size_t weightedIndex(const std::vector<double>& weights) {
        double total = 0.0;
        for (double w : weights) {
            if (w > 0.0) total += w;
        }
        if (total <= 0.0) {
            return index(weights.size());
        }

        double roll = uniform() * total;
        double cumulative = 0.0;
        for (size_t i = 0; i < weights.size(); ++i) {
            if (weights[i] <= 0.0) continue;
            cumulative += weights[i];
            if (roll < cumulative) {
                return i;
            }
        }
        // Arrondi flottant : dernier poids positif
        for (size_t i = weights.size(); i > 0; --i) {
            if (weights[i - 1] > 0.0) return i - 1;
        }
        return 0;
    }

    std::mt19937_64& engine() { return engine_; }

private:
    uint64_t seed_ = 0;
    std::mt19937_64 engine_;
};

} // namespace cascade

#endif // CASCADE_RANDOM_HPP
