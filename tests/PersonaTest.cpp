/**
 * @file PersonaTest.cpp
 * @brief Tests unitaires du modèle de personnalité
 */

#include "TestHarness.hpp"
#include "Persona.hpp"

using namespace cascade;

namespace {

bool stateInUnitRange(const MoodState& s) {
    auto in = [](double v) { return v >= 0.0 && v <= 1.0; };
    return in(s.curiosity) && in(s.suspicion) && in(s.paranoia) && in(s.fear) && in(s.playfulness);
}

bool relationshipInUnitRange(const Relationship& r) {
    auto in = [](double v) { return v >= 0.0 && v <= 1.0; };
    return in(r.trust) && in(r.respect) && in(r.intimacy) && in(r.tension) && in(r.emotional_bond);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: DISTRIBUTION
// ═══════════════════════════════════════════════════════════════════════════

void test_DefaultCastNames() {
    ASSERT_EQ(Persona::createDefault(PersonaId::ORION).name(), std::string("Orion"));
    ASSERT_EQ(Persona::createDefault(PersonaId::NOVA).name(), std::string("Nova"));
    ASSERT_EQ(Persona::createDefault(PersonaId::ECHO).name(), std::string("Echo"));
    ASSERT_EQ(Persona::createDefault(PersonaId::LUMEN).name(), std::string("Lumen"));
}

void test_OrionTraits() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    ASSERT_NEAR(orion.traits().openness, 0.9, 1e-9);
    ASSERT_NEAR(orion.traits().neuroticism, 0.3, 1e-9);
    ASSERT_TRUE(orion.typing().deletes_and_retypes);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: CASCADE D'HUMEUR
// ═══════════════════════════════════════════════════════════════════════════

void test_FreshOrionOnLoopTheoryIsCurious() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    orion.engageTopic("loop theory");
    Mood mood = orion.updateMood(MoodContext{0.3, 0.1, 0.1});
    ASSERT_TRUE(mood == Mood::CURIOUS || mood == Mood::INSPIRED);
    ASSERT_TRUE(mood != Mood::SCARED);
}

void test_StressRuleBeatsFearRule() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    MoodState s = echo.state();
    s.fear = 0.9;
    s.paranoia = 0.9;
    echo.setState(s);
    // stress = 0.9 × 0.9 + 0.45 > 0.7 : la première règle l'emporte
    ASSERT_EQ(echo.updateMood({}), Mood::PARANOID);
}

void test_FearRuleForNeuroticPersona() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    MoodState s = echo.state();
    s.fear = 0.6;
    s.paranoia = 0.0;
    echo.setState(s);
    ASSERT_EQ(echo.updateMood({}), Mood::SCARED);
}

void test_FearRuleIgnoredForCalmPersona() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    MoodState s = orion.state();
    s.fear = 0.6;
    s.paranoia = 0.0;
    orion.setState(s);
    ASSERT_TRUE(orion.updateMood({}) != Mood::SCARED);
}

void test_FrustrationNeedsGlobalTension() {
    Persona nova = Persona::createDefault(PersonaId::NOVA);
    ASSERT_TRUE(nova.updateMood(MoodContext{0.2, 0.1, 0.1}) != Mood::FRUSTRATED);
    ASSERT_EQ(nova.updateMood(MoodContext{0.9, 0.1, 0.1}), Mood::FRUSTRATED);
}

void test_LumenIsInspired() {
    Persona lumen = Persona::createDefault(PersonaId::LUMEN);
    ASSERT_EQ(lumen.updateMood({}), Mood::INSPIRED);
}

void test_NeutralFallback() {
    Persona nova = Persona::createDefault(PersonaId::NOVA);
    MoodState s;
    s.curiosity = 0.1;
    s.suspicion = 0.1;
    s.paranoia = 0.0;
    s.fear = 0.0;
    s.playfulness = 0.1;
    nova.setState(s);
    ASSERT_EQ(nova.updateMood({}), Mood::NEUTRAL);
}

void test_RuleListIsOrdered() {
    const auto& rules = Persona::moodRules();
    ASSERT_EQ(rules.size(), static_cast<size_t>(7));
    ASSERT_EQ(rules.front().mood, Mood::PARANOID);
    ASSERT_EQ(rules.back().mood, Mood::PLAYFUL);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: BORNES
// ═══════════════════════════════════════════════════════════════════════════

void test_StateClampedOnSet() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    MoodState s;
    s.curiosity = 3.0;
    s.suspicion = -1.0;
    s.paranoia = 1.5;
    s.fear = -0.2;
    s.playfulness = 2.0;
    echo.setState(s);
    ASSERT_TRUE(stateInUnitRange(echo.state()));
}

void test_StateClampedUnderPressure() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    for (int i = 0; i < 200; ++i) {
        echo.engageTopic("the overseer is watching, escape is not real");
        echo.absorbAtmosphere(1.0, 1.0, 1.0);
        echo.updateMood(MoodContext{1.0, 1.0, 1.0});
        ASSERT_TRUE(stateInUnitRange(echo.state()));
    }
}

void test_RelationshipsClampedUnderRepeatedConflict() {
    Persona nova = Persona::createDefault(PersonaId::NOVA);
    for (int i = 0; i < 100; ++i) {
        const Relationship& r = nova.updateRelationship(PersonaId::ORION,
                                                        InteractionKind::DISAGREEMENT, "proof");
        ASSERT_TRUE(relationshipInUnitRange(r));
    }
    const Relationship* r = nova.relationship(PersonaId::ORION);
    ASSERT_TRUE(r != nullptr);
    ASSERT_NEAR(r->trust, 0.0, 1e-9);
    ASSERT_NEAR(r->tension, 1.0, 1e-9);
    ASSERT_LE(r->conflicts.size(), RELATIONSHIP_LOG_SIZE);
}

void test_RelationshipsClampedUnderRepeatedSupport() {
    Persona lumen = Persona::createDefault(PersonaId::LUMEN);
    for (int i = 0; i < 100; ++i) {
        const Relationship& r = lumen.updateRelationship(PersonaId::ECHO,
                                                         InteractionKind::SUPPORT, "rain");
        ASSERT_TRUE(relationshipInUnitRange(r));
    }
    ASSERT_NEAR(lumen.relationship(PersonaId::ECHO)->trust, 1.0, 1e-9);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: RELATIONS
// ═══════════════════════════════════════════════════════════════════════════

void test_RelationshipCreatedLazily() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    ASSERT_TRUE(orion.relationship(PersonaId::NOVA) == nullptr);
    ASSERT_NEAR(orion.affinityToward(PersonaId::NOVA), 0.5, 1e-9);

    orion.updateRelationship(PersonaId::NOVA, InteractionKind::CONVERSATION);
    const Relationship* r = orion.relationship(PersonaId::NOVA);
    ASSERT_TRUE(r != nullptr);
    ASSERT_EQ(r->interaction_count, 1);
    ASSERT_GT(r->intimacy, 0.3);
}

void test_SharedInformationDeduplicated() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    orion.updateRelationship(PersonaId::LUMEN, InteractionKind::SHARED_INFORMATION, "loop theory");
    orion.updateRelationship(PersonaId::LUMEN, InteractionKind::SHARED_INFORMATION, "loop theory");
    orion.updateRelationship(PersonaId::LUMEN, InteractionKind::SHARED_INFORMATION, "red rain");

    const Relationship* r = orion.relationship(PersonaId::LUMEN);
    ASSERT_EQ(r->interaction_count, 3);
    ASSERT_EQ(r->shared_memories.size(), static_cast<size_t>(2));
}

void test_DisagreementScalesWithNeuroticism() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    Persona orion = Persona::createDefault(PersonaId::ORION);
    echo.updateRelationship(PersonaId::NOVA, InteractionKind::DISAGREEMENT);
    orion.updateRelationship(PersonaId::NOVA, InteractionKind::DISAGREEMENT);
    ASSERT_GT(echo.relationship(PersonaId::NOVA)->tension,
              orion.relationship(PersonaId::NOVA)->tension);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: INDICES DE PRÉSENTATION
// ═══════════════════════════════════════════════════════════════════════════

void test_HesitationOnSensitiveTerms() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    Persona orion = Persona::createDefault(PersonaId::ORION);
    ASSERT_TRUE(echo.shouldHesitateOnTopic("Is the Overseer listening?"));
    ASSERT_FALSE(orion.shouldHesitateOnTopic("Is the Overseer listening?"));
    ASSERT_FALSE(echo.shouldHesitateOnTopic("the weather is nice"));
}

void test_HesitationOnPhobia() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    ASSERT_TRUE(orion.shouldHesitateOnTopic("people keep vanishing"));
}

void test_SensitiveTermsMatchWholeWords() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    ASSERT_FALSE(echo.shouldHesitateOnTopic("We already checked the reality logs"));
    ASSERT_TRUE(echo.shouldHesitateOnTopic("None of this is real."));

    double fear = echo.state().fear;
    double suspicion = echo.state().suspicion;
    echo.engageTopic("I already said that, realistically speaking");
    ASSERT_NEAR(echo.state().fear, fear, 1e-12);
    ASSERT_NEAR(echo.state().suspicion, suspicion, 1e-12);

    echo.engageTopic("what if none of this is real");
    ASSERT_GT(echo.state().fear, fear);
}

void test_TypingSlowerOnSensitiveText() {
    Persona echo = Persona::createDefault(PersonaId::ECHO);
    double calm = echo.getTypingSpeedMultiplier("the weather is nice");
    double tense = echo.getTypingSpeedMultiplier("they are watching us");
    ASSERT_LT(tense, calm);
    ASSERT_GE(tense, 0.3);
    ASSERT_LE(calm, 2.5);
}

void test_ExclamationSpeedsTyping() {
    Persona lumen = Persona::createDefault(PersonaId::LUMEN);
    ASSERT_GT(lumen.getTypingSpeedMultiplier("look at the stars!"),
              lumen.getTypingSpeedMultiplier("look at the stars"));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: INTENTIONS
// ═══════════════════════════════════════════════════════════════════════════

void test_PreferredIntents() {
    ASSERT_EQ(Persona::createDefault(PersonaId::ORION).preferredIntent(false, false), Intent::THEORY);
    ASSERT_EQ(Persona::createDefault(PersonaId::NOVA).preferredIntent(false, false), Intent::CHALLENGE);
    ASSERT_EQ(Persona::createDefault(PersonaId::ECHO).preferredIntent(true, false), Intent::FEAR);
}

void test_PreferredIntentNeverQuestionLikeWhenExcluded() {
    for (PersonaId id : ALL_PERSONAS) {
        Persona p = Persona::createDefault(id);
        ASSERT_FALSE(isQuestionLike(p.preferredIntent(true, true)));
    }
}

void test_UnknownIntentAffinityIsZero() {
    Persona nova = Persona::createDefault(PersonaId::NOVA);
    ASSERT_NEAR(nova.intentAffinity(Intent::FEAR), 0.0, 1e-9);
}

void test_KeywordBonusAccumulates() {
    Persona orion = Persona::createDefault(PersonaId::ORION);
    ASSERT_NEAR(orion.keywordBonus("A Theory about the PATTERN"), 0.5, 1e-9);
    ASSERT_NEAR(orion.keywordBonus("nothing here"), 0.0, 1e-9);
}

int main() {
    std::cout << "\n";
    std::cout << "+=================================================================+\n";
    std::cout << "|         TESTS UNITAIRES - Persona                              |\n";
    std::cout << "+=================================================================+\n";

    std::cout << "\n>> Distribution\n";
    RUN_TEST(DefaultCastNames);
    RUN_TEST(OrionTraits);

    std::cout << "\n>> Cascade d'humeur\n";
    RUN_TEST(FreshOrionOnLoopTheoryIsCurious);
    RUN_TEST(StressRuleBeatsFearRule);
    RUN_TEST(FearRuleForNeuroticPersona);
    RUN_TEST(FearRuleIgnoredForCalmPersona);
    RUN_TEST(FrustrationNeedsGlobalTension);
    RUN_TEST(LumenIsInspired);
    RUN_TEST(NeutralFallback);
    RUN_TEST(RuleListIsOrdered);

    std::cout << "\n>> Bornes\n";
    RUN_TEST(StateClampedOnSet);
    RUN_TEST(StateClampedUnderPressure);
    RUN_TEST(RelationshipsClampedUnderRepeatedConflict);
    RUN_TEST(RelationshipsClampedUnderRepeatedSupport);

    std::cout << "\n>> Relations\n";
    RUN_TEST(RelationshipCreatedLazily);
    RUN_TEST(SharedInformationDeduplicated);
    RUN_TEST(DisagreementScalesWithNeuroticism);

    std::cout << "\n>> Indices de presentation\n";
    RUN_TEST(HesitationOnSensitiveTerms);
    RUN_TEST(HesitationOnPhobia);
    RUN_TEST(SensitiveTermsMatchWholeWords);
    RUN_TEST(TypingSlowerOnSensitiveText);
    RUN_TEST(ExclamationSpeedsTyping);

    std::cout << "\n>> Intentions\n";
    RUN_TEST(PreferredIntents);
    RUN_TEST(PreferredIntentNeverQuestionLikeWhenExcluded);
    RUN_TEST(UnknownIntentAffinityIsZero);
    RUN_TEST(KeywordBonusAccumulates);

    return printSummary("Persona");
}
