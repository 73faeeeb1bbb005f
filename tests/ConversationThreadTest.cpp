/**
 * @file ConversationThreadTest.cpp
 * @brief Tests unitaires des fils de conversation
 */

#include "TestHarness.hpp"
#include "ConversationThread.hpp"

using namespace cascade;

namespace {

Message makeMessage(const std::string& speaker, const std::string& text, TimePoint when) {
    Message m(speaker, text);
    m.timestamp = when;
    return m;
}

ConversationThread makeThread(TimePoint now, bool question_enabled = false) {
    return ConversationThread("thread_test",
                              std::make_shared<Topic>("loop theory", now),
                              {PersonaId::ORION, PersonaId::NOVA},
                              ThreadConfig{}, now, question_enabled);
}

void feed(ConversationThread& thread, int count, TimePoint when) {
    for (int i = 0; i < count; ++i) {
        thread.registerMessage(makeMessage(i % 2 ? "Nova" : "Orion",
                                           "line number " + std::to_string(i), when));
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: PHASES
// ═══════════════════════════════════════════════════════════════════════════

void test_InitialState() {
    auto thread = makeThread(SteadyClock::now());
    ASSERT_EQ(thread.phase(), ConversationPhase::INTRODUCTION);
    ASSERT_EQ(thread.status(), ThreadStatus::ACTIVE);
    ASSERT_EQ(thread.turnCount(), static_cast<size_t>(0));
    ASSERT_TRUE(thread.isLive());
    ASSERT_TRUE(thread.isParticipant(PersonaId::NOVA));
    ASSERT_FALSE(thread.isParticipant(PersonaId::ECHO));
}

void test_PhaseIntentWithoutQuestion() {
    auto thread = makeThread(SteadyClock::now(), false);
    ASSERT_EQ(thread.getPhaseAppropriateIntent(), Intent::STATEMENT);
}

void test_PhaseIntentWithQuestion() {
    auto thread = makeThread(SteadyClock::now(), true);
    ASSERT_EQ(thread.getPhaseAppropriateIntent(), Intent::QUESTION);
}

void test_PhaseAdvancesOnSixthMessage() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    feed(thread, 5, now);
    ASSERT_EQ(thread.phase(), ConversationPhase::INTRODUCTION);
    feed(thread, 1, now);
    ASSERT_EQ(thread.phase(), ConversationPhase::DEVELOPMENT);
    ASSERT_EQ(thread.messagesInPhase(), static_cast<size_t>(0));
    ASSERT_EQ(thread.getPhaseAppropriateIntent(), Intent::THEORY);
}

void test_PhaseNeverDecreases() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    int previous = static_cast<int>(thread.phase());
    for (int i = 0; i < 40; ++i) {
        feed(thread, 1, now);
        int current = static_cast<int>(thread.phase());
        ASSERT_GE(current, previous);
        previous = current;
    }
}

void test_ResolutionCountsAndGoesStale() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    feed(thread, 24, now);
    ASSERT_EQ(thread.phase(), ConversationPhase::RESOLUTION);
    ASSERT_EQ(thread.resolutionMessages(), static_cast<size_t>(0));

    feed(thread, 2, now);
    ASSERT_EQ(thread.resolutionMessages(), static_cast<size_t>(2));
    ASSERT_EQ(thread.status(), ThreadStatus::ACTIVE);

    feed(thread, 4, now);
    ASSERT_EQ(thread.phase(), ConversationPhase::RESOLUTION);
    ASSERT_EQ(thread.status(), ThreadStatus::STALE);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: STATUTS
// ═══════════════════════════════════════════════════════════════════════════

void test_StatusTransitionsOneWay() {
    auto thread = makeThread(SteadyClock::now());
    ASSERT_TRUE(thread.escalate());
    ASSERT_FALSE(thread.escalate());
    ASSERT_EQ(thread.status(), ThreadStatus::ESCALATING);
    ASSERT_TRUE(thread.isLive());

    ASSERT_TRUE(thread.interrupt());
    ASSERT_EQ(thread.status(), ThreadStatus::INTERRUPTED);
    ASSERT_FALSE(thread.escalate());
    ASSERT_FALSE(thread.interrupt());
    ASSERT_FALSE(thread.isLive());

    ASSERT_TRUE(thread.markStale());
    ASSERT_FALSE(thread.markStale());
    ASSERT_TRUE(thread.close());
    ASSERT_FALSE(thread.close());
    ASSERT_FALSE(thread.markStale());
    ASSERT_EQ(thread.status(), ThreadStatus::CLOSED);
}

void test_StaleNeverReturnsToActive() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    thread.markStale();
    ASSERT_FALSE(thread.escalate());
    feed(thread, 10, now);
    ASSERT_EQ(thread.status(), ThreadStatus::STALE);
}

void test_ClosedThreadIgnoresMessages() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    feed(thread, 3, now);
    thread.close();
    feed(thread, 3, now);
    ASSERT_EQ(thread.turnCount(), static_cast<size_t>(3));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: RYTHME ET HISTORIQUE
// ═══════════════════════════════════════════════════════════════════════════

void test_UrgentPacingAtClimaxStart() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    ASSERT_FALSE(thread.demandsUrgentPacing());
    feed(thread, 18, now);
    ASSERT_EQ(thread.phase(), ConversationPhase::CLIMAX);
    ASSERT_TRUE(thread.demandsUrgentPacing());
    feed(thread, 2, now);
    ASSERT_FALSE(thread.demandsUrgentPacing());
}

void test_UrgentPacingWhenEscalating() {
    auto thread = makeThread(SteadyClock::now());
    thread.escalate();
    ASSERT_TRUE(thread.demandsUrgentPacing());
}

void test_LastSpeakerAndActivity() {
    ManualClock clock;
    auto thread = makeThread(clock());
    clock.advance(10.0);
    thread.registerMessage(makeMessage("Echo", "did you hear that?", clock()));
    ASSERT_EQ(thread.lastSpeaker(), std::string("Echo"));
    ASSERT_TRUE(thread.lastActivity() == clock());
}

void test_NearDuplicateAgainstHistory() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    thread.registerMessage(makeMessage("Orion", "the rain is falling upward again", now));
    ASSERT_TRUE(thread.containsNearDuplicate("The rain is falling upward again!", 0.7));
    ASSERT_FALSE(thread.containsNearDuplicate("Nova, show me your proof", 0.7));
}

void test_TextHistoryBounded() {
    TimePoint now = SteadyClock::now();
    auto thread = makeThread(now);
    feed(thread, 35, now);
    ASSERT_EQ(thread.textHistory().size(), static_cast<size_t>(20));
    ASSERT_EQ(thread.textHistory().back(), std::string("line number 34"));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: REGISTRE
// ═══════════════════════════════════════════════════════════════════════════

void test_ManagerStartsSequentialThreads() {
    ManualClock clock;
    ThreadManager manager(ThreadConfig{});
    manager.setQuietMode(true);
    auto topic = std::make_shared<Topic>("exit code", clock());

    ThreadPtr first = manager.startThread(topic, {PersonaId::ORION, PersonaId::ECHO}, clock());
    ASSERT_EQ(first->id(), std::string("thread_1"));
    ASSERT_TRUE(manager.getActiveThread() == first);

    ThreadPtr second = manager.startThread(topic, {PersonaId::NOVA, PersonaId::LUMEN}, clock());
    ASSERT_EQ(second->id(), std::string("thread_2"));
    ASSERT_EQ(first->status(), ThreadStatus::CLOSED);
    ASSERT_TRUE(manager.getActiveThread() == second);
    ASSERT_EQ(manager.totalStarted(), static_cast<size_t>(2));
}

void test_ManagerPrunesIdleThreads() {
    ManualClock clock;
    ThreadManager manager(ThreadConfig{});
    manager.setQuietMode(true);
    auto topic = std::make_shared<Topic>("exit code", clock());
    ThreadPtr thread = manager.startThread(topic, {PersonaId::ORION, PersonaId::ECHO}, clock());

    clock.advance(60.0);
    ASSERT_EQ(manager.pruneStaleThreads(clock()), static_cast<size_t>(0));
    ASSERT_TRUE(manager.getActiveThread() == thread);

    clock.advance(61.0);
    ASSERT_EQ(manager.pruneStaleThreads(clock()), static_cast<size_t>(1));
    ASSERT_TRUE(manager.getActiveThread() == nullptr);
    ASSERT_EQ(manager.threadCount(), static_cast<size_t>(0));
    ASSERT_EQ(thread->status(), ThreadStatus::CLOSED);
}

void test_ManagerCloseUnknownThread() {
    ThreadManager manager(ThreadConfig{});
    ASSERT_FALSE(manager.closeThread("thread_404"));
    ASSERT_TRUE(manager.getThread("thread_404") == nullptr);
}

void test_ManagerCloseAll() {
    ManualClock clock;
    ThreadManager manager(ThreadConfig{});
    manager.setQuietMode(true);
    auto topic = std::make_shared<Topic>("exit code", clock());
    ThreadPtr thread = manager.startThread(topic, {PersonaId::ORION, PersonaId::ECHO}, clock());
    manager.closeAll();
    ASSERT_TRUE(manager.getActiveThread() == nullptr);
    ASSERT_EQ(thread->status(), ThreadStatus::CLOSED);
}

void test_ThreadJson() {
    auto thread = makeThread(SteadyClock::now());
    auto j = thread.toJson();
    ASSERT_EQ(j["id"].get<std::string>(), std::string("thread_test"));
    ASSERT_EQ(j["phase"].get<std::string>(), std::string("INTRODUCTION"));
    ASSERT_EQ(j["participants"].size(), static_cast<size_t>(2));
}

int main() {
    std::cout << "\n";
    std::cout << "+=================================================================+\n";
    std::cout << "|         TESTS UNITAIRES - ConversationThread                   |\n";
    std::cout << "+=================================================================+\n";

    std::cout << "\n>> Phases\n";
    RUN_TEST(InitialState);
    RUN_TEST(PhaseIntentWithoutQuestion);
    RUN_TEST(PhaseIntentWithQuestion);
    RUN_TEST(PhaseAdvancesOnSixthMessage);
    RUN_TEST(PhaseNeverDecreases);
    RUN_TEST(ResolutionCountsAndGoesStale);

    std::cout << "\n>> Statuts\n";
    RUN_TEST(StatusTransitionsOneWay);
    RUN_TEST(StaleNeverReturnsToActive);
    RUN_TEST(ClosedThreadIgnoresMessages);

    std::cout << "\n>> Rythme et historique\n";
    RUN_TEST(UrgentPacingAtClimaxStart);
    RUN_TEST(UrgentPacingWhenEscalating);
    RUN_TEST(LastSpeakerAndActivity);
    RUN_TEST(NearDuplicateAgainstHistory);
    RUN_TEST(TextHistoryBounded);

    std::cout << "\n>> Registre\n";
    RUN_TEST(ManagerStartsSequentialThreads);
    RUN_TEST(ManagerPrunesIdleThreads);
    RUN_TEST(ManagerCloseUnknownThread);
    RUN_TEST(ManagerCloseAll);
    RUN_TEST(ThreadJson);

    return printSummary("ConversationThread");
}
