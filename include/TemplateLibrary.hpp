/**
 * @file TemplateLibrary.hpp
 * @brief Bibliothèque des fragments de dialogue écrits à la main
 * @version 1.0
 * @date 2026-10-19
 *
 * Résolution d'un réservoir pour (personnage, intention) :
 *   1. réservoir propre au personnage
 *   2. réservoir partagé de l'intention
 *   3. réservoir générique REPLY
 *
 * Jetons reconnus : {topic}, {from}, {event}, {related}
 */

#ifndef CASCADE_TEMPLATE_LIBRARY_HPP
#define CASCADE_TEMPLATE_LIBRARY_HPP

#include "Types.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cascade {

class TemplateLibrary {
public:
    TemplateLibrary();

    /**
     * @brief Réservoir effectif (personnage → partagé → générique)
     */
    [[nodiscard]] const std::vector<std::string>& resolvePool(PersonaId persona, Intent intent) const;

    [[nodiscard]] const std::vector<std::string>& personaPool(PersonaId persona, Intent intent) const;
    [[nodiscard]] const std::vector<std::string>& sharedPool(Intent intent) const;
    [[nodiscard]] const std::vector<std::string>& genericPool() const { return generic_; }

    [[nodiscard]] const std::vector<std::string>& hesitations(PersonaId persona) const;
    [[nodiscard]] const std::vector<std::string>& catchPhrases(PersonaId persona) const;
    [[nodiscard]] const std::vector<std::string>& fallbackLines(PersonaId persona) const;
    [[nodiscard]] const std::vector<std::string>& userResponses(PersonaId persona) const;
    [[nodiscard]] const std::vector<std::string>& overseerLines(bool direct_ping) const;

    void addTemplate(PersonaId persona, Intent intent, const std::string& text);
    void addSharedTemplate(Intent intent, const std::string& text);
    void clearPersonaPool(PersonaId persona, Intent intent);

    [[nodiscard]] size_t templateCount() const;

private:
    void initDefaultTemplates();
    void initPersonaTemplates();
    void initSharedTemplates();
    void initPersonaExtras();

    std::map<std::pair<PersonaId, Intent>, std::vector<std::string>> persona_pools_;
    std::map<Intent, std::vector<std::string>> shared_pools_;
    std::vector<std::string> generic_;

    std::map<PersonaId, std::vector<std::string>> hesitations_;
    std::map<PersonaId, std::vector<std::string>> catch_phrases_;
    std::map<PersonaId, std::vector<std::string>> fallbacks_;
    std::map<PersonaId, std::vector<std::string>> user_responses_;
    std::vector<std::string> overseer_lines_;
    std::vector<std::string> overseer_direct_lines_;
};

} // namespace cascade

#endif // CASCADE_TEMPLATE_LIBRARY_HPP
