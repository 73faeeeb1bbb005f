/**
 * @file NarrativeTriggersTest.cpp
 * @brief Tests unitaires des déclencheurs narratifs
 */

#include "TestHarness.hpp"
#include "NarrativeTriggers.hpp"
#include <vector>

using namespace cascade;

namespace {

struct Fixture {
    Rng rng{17};
    NarrativeMemory memory{MemoryConfig{}, rng};
    NarrativeTriggers triggers{memory, rng};

    Fixture() {
        memory.setQuietMode(true);
        triggers.setQuietMode(true);
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: REGISTRE
// ═══════════════════════════════════════════════════════════════════════════

void test_UnknownTriggerReturnsFalse() {
    Fixture f;
    ASSERT_FALSE(f.triggers.trigger("DoesNotExist", "test"));
    ASSERT_EQ(f.triggers.firedCount(), static_cast<size_t>(0));
}

void test_BuiltinTriggersRegistered() {
    Fixture f;
    ASSERT_TRUE(f.triggers.hasTrigger("ViewerGlitchRequest"));
    ASSERT_TRUE(f.triggers.hasTrigger("ViewerTensionUp"));
    ASSERT_TRUE(f.triggers.hasTrigger("ViewerObserve"));
    ASSERT_TRUE(f.triggers.hasTrigger("ViewerMessage"));
    ASSERT_TRUE(f.triggers.hasTrigger("HighTension"));
    ASSERT_TRUE(f.triggers.hasTrigger("HighAwareness"));
}

void test_CustomTriggerReceivesSource() {
    Fixture f;
    std::string received;
    f.triggers.registerTrigger("Custom", [&](const std::string& source) { received = source; });
    ASSERT_TRUE(f.triggers.trigger("Custom", "unit"));
    ASSERT_EQ(received, std::string("unit"));
    ASSERT_EQ(f.triggers.firedCount(), static_cast<size_t>(1));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: COMMANDES SPECTATEURS
// ═══════════════════════════════════════════════════════════════════════════

void test_GlitchCommand() {
    Fixture f;
    auto result = f.triggers.handleViewerCommand("viewer42", "!glitch");
    ASSERT_TRUE(result.is_command);
    ASSERT_FALSE(result.injected_text.has_value());
    ASSERT_EQ(f.memory.glitchCount(), 1);
    ASSERT_EQ(f.memory.history().back().type, std::string("glitch"));
}

void test_TensionCommand() {
    Fixture f;
    double before = f.memory.tension();
    auto result = f.triggers.handleViewerCommand("viewer42", "  !TENSION ");
    ASSERT_TRUE(result.is_command);
    ASSERT_NEAR(f.memory.tension(), before + 0.2, 1e-9);
}

void test_ObserveCommand() {
    Fixture f;
    auto result = f.triggers.handleViewerCommand("viewer42", "!observe");
    ASSERT_TRUE(result.is_command);
    ASSERT_EQ(f.memory.observerCount(), 1);
    ASSERT_TRUE(f.memory.flags().observer_detected);
}

void test_QuestionCommandInjectsFixedText() {
    Fixture f;
    auto result = f.triggers.handleViewerCommand("viewer42", "!question");
    ASSERT_TRUE(result.is_command);
    ASSERT_TRUE(result.injected_text.has_value());
    ASSERT_EQ(*result.injected_text, std::string("Are you really real?"));
    ASSERT_TRUE(f.memory.flags().observer_detected);
}

void test_FreeTextIsInjected() {
    Fixture f;
    auto result = f.triggers.handleViewerCommand("viewer42", "hello, is anyone there?");
    ASSERT_FALSE(result.is_command);
    ASSERT_TRUE(result.injected_text.has_value());
    ASSERT_EQ(*result.injected_text, std::string("hello, is anyone there?"));
    ASSERT_TRUE(f.memory.flags().observer_detected);
    ASSERT_EQ(f.memory.history().back().type, std::string("viewer_message"));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: CONTRÔLES D'ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

void test_StateTriggersQuietBelowThresholds() {
    Fixture f;
    f.memory.setTension(0.8);
    f.memory.setMetaAwareness(0.7);
    ASSERT_TRUE(f.triggers.checkStateTriggers().empty());
}

void test_HighTensionFiresGlitch() {
    Fixture f;
    f.memory.setTension(0.85);
    auto fired = f.triggers.checkStateTriggers();
    ASSERT_EQ(fired.size(), static_cast<size_t>(1));
    ASSERT_EQ(fired.front(), std::string("HighTension"));
    ASSERT_EQ(f.memory.glitchCount(), 1);
}

void test_HighAwarenessRaisesRealityThreat() {
    Fixture f;
    f.memory.setMetaAwareness(0.75);
    double before = f.memory.threatLevel(ThreatKind::REALITY_QUESTIONING);
    auto fired = f.triggers.checkStateTriggers();
    ASSERT_EQ(fired.size(), static_cast<size_t>(1));
    ASSERT_EQ(fired.front(), std::string("HighAwareness"));
    ASSERT_NEAR(f.memory.threatLevel(ThreatKind::REALITY_QUESTIONING), before + 0.1, 1e-9);
}

void test_BothStateTriggersFire() {
    Fixture f;
    f.memory.setTension(0.95);
    f.memory.setMetaAwareness(0.95);
    auto fired = f.triggers.checkStateTriggers();
    ASSERT_EQ(fired.size(), static_cast<size_t>(2));
    ASSERT_EQ(f.triggers.firedCount(), static_cast<size_t>(2));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: ENVIRONNEMENT
// ═══════════════════════════════════════════════════════════════════════════

void test_CueForMood() {
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::CURIOUS), EnvironmentCue::CURIOUS);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::INSPIRED), EnvironmentCue::CURIOUS);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::PARANOID), EnvironmentCue::PARANOID);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::SCARED), EnvironmentCue::PARANOID);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::FRUSTRATED), EnvironmentCue::PARANOID);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::NEUTRAL), EnvironmentCue::CALM);
    ASSERT_EQ(NarrativeTriggers::cueForMood(Mood::PLAYFUL), EnvironmentCue::CALM);
}

void test_RefreshWithoutSourceKeepsCalm() {
    Fixture f;
    ASSERT_EQ(f.triggers.refreshEnvironment(), EnvironmentCue::CALM);
}

void test_CueCallbackOnChangeOnly() {
    Fixture f;
    Mood lead = Mood::NEUTRAL;
    std::vector<EnvironmentCue> changes;
    f.triggers.setLeadMoodSource([&]() { return lead; });
    f.triggers.setCueCallback([&](EnvironmentCue cue) { changes.push_back(cue); });

    f.triggers.refreshEnvironment();
    ASSERT_TRUE(changes.empty());

    lead = Mood::SCARED;
    ASSERT_EQ(f.triggers.refreshEnvironment(), EnvironmentCue::PARANOID);
    f.triggers.refreshEnvironment();
    ASSERT_EQ(changes.size(), static_cast<size_t>(1));

    lead = Mood::CURIOUS;
    f.triggers.refreshEnvironment();
    ASSERT_EQ(changes.size(), static_cast<size_t>(2));
    ASSERT_EQ(f.triggers.environmentCue(), EnvironmentCue::CURIOUS);
}

int main() {
    std::cout << "\n";
    std::cout << "+=================================================================+\n";
    std::cout << "|         TESTS UNITAIRES - NarrativeTriggers                    |\n";
    std::cout << "+=================================================================+\n";

    std::cout << "\n>> Registre\n";
    RUN_TEST(UnknownTriggerReturnsFalse);
    RUN_TEST(BuiltinTriggersRegistered);
    RUN_TEST(CustomTriggerReceivesSource);

    std::cout << "\n>> Commandes spectateurs\n";
    RUN_TEST(GlitchCommand);
    RUN_TEST(TensionCommand);
    RUN_TEST(ObserveCommand);
    RUN_TEST(QuestionCommandInjectsFixedText);
    RUN_TEST(FreeTextIsInjected);

    std::cout << "\n>> Controles d'etat\n";
    RUN_TEST(StateTriggersQuietBelowThresholds);
    RUN_TEST(HighTensionFiresGlitch);
    RUN_TEST(HighAwarenessRaisesRealityThreat);
    RUN_TEST(BothStateTriggersFire);

    std::cout << "\n>> Environnement\n";
    RUN_TEST(CueForMood);
    RUN_TEST(RefreshWithoutSourceKeepsCalm);
    RUN_TEST(CueCallbackOnChangeOnly);

    return printSummary("NarrativeTriggers");
}
