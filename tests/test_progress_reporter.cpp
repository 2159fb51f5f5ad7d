#include "rendering/ProgressReporter.h"

#include <gtest/gtest.h>
#include <vector>

using namespace BeatSyncTypes;

namespace
{
    class ProgressReporterTest : public ::testing::Test
    {
    protected:
        ProgressReporterTest()
        {
            reporter.setClock([this] { return clockSeconds; });
            reporter.setEventCallback([this](const ProgressEvent& e) { events.push_back(e); });
        }

        double clockSeconds = 100.0;
        ProgressReporter reporter;
        std::vector<ProgressEvent> events;
    };
}

// Test 2 of 4 units is exactly 50%
TEST_F(ProgressReporterTest, HalfwayIsFiftyPercent)
{
    reporter.beginSession();
    reporter.beginPhase(ProgressPhase::Trim, 4);
    const auto event = reporter.unitsCompleted(2);

    EXPECT_DOUBLE_EQ(event.percent, 50.0);
    EXPECT_DOUBLE_EQ(event.overallPercent, 70.0);
    EXPECT_EQ(event.phase, ProgressPhase::Trim);
}

// Test every computed event reaches the callback, starting with the 0% one
TEST_F(ProgressReporterTest, EmitsPhaseStartAndUnits)
{
    reporter.beginSession();
    reporter.beginPhase(ProgressPhase::Validation, 3);
    reporter.unitsCompleted(1);
    reporter.unitsCompleted(2);
    reporter.unitsCompleted(3);

    ASSERT_EQ(events.size(), 4u);
    EXPECT_DOUBLE_EQ(events[0].percent, 0.0);
    EXPECT_NEAR(events[1].percent, 33.333, 0.001);
    EXPECT_DOUBLE_EQ(events[3].percent, 100.0);
    EXPECT_DOUBLE_EQ(events[3].overallPercent, 50.0);
}

// Test the ETA starts from the plan and then follows the measured rate
TEST_F(ProgressReporterTest, EtaUsesPlanThenMeasuredRate)
{
    reporter.beginSession();

    const auto start = reporter.beginPhase(ProgressPhase::Trim, 4);
    EXPECT_DOUBLE_EQ(start.etaSeconds, 4 * 10.0 + 30.0);

    clockSeconds += 8.0;
    const auto half = reporter.unitsCompleted(2);
    EXPECT_DOUBLE_EQ(half.elapsedSeconds, 8.0);
    EXPECT_DOUBLE_EQ(half.etaSeconds, 2 * 4.0 + 30.0);

    const auto validation = ProgressReporter::computeEvent(ProgressPlan(), ProgressPhase::Validation, 0, 6, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(validation.etaSeconds, 30.0);
}

// Test concat and mux start with the finalisation estimate still ahead of them
TEST_F(ProgressReporterTest, FinalisationPhasesSeedEta)
{
    reporter.beginSession();

    const auto concatStart = reporter.beginPhase(ProgressPhase::Concat, 1);
    EXPECT_DOUBLE_EQ(concatStart.etaSeconds, 30.0);

    clockSeconds += 6.0;
    const auto concatDone = reporter.unitsCompleted(1);
    EXPECT_DOUBLE_EQ(concatDone.etaSeconds, 15.0);

    const auto muxStart = reporter.beginPhase(ProgressPhase::Mux, 1);
    EXPECT_DOUBLE_EQ(muxStart.etaSeconds, 15.0);

    clockSeconds += 4.0;
    EXPECT_DOUBLE_EQ(reporter.unitsCompleted(1).etaSeconds, 0.0);
}

// Test elapsed times count from the session and the phase
TEST_F(ProgressReporterTest, TracksOverallAndPhaseElapsed)
{
    reporter.beginSession();
    clockSeconds += 12.0;
    reporter.beginPhase(ProgressPhase::Concat, 1);
    clockSeconds += 3.0;
    const auto event = reporter.unitsCompleted(1);

    EXPECT_DOUBLE_EQ(event.elapsedSeconds, 3.0);
    EXPECT_DOUBLE_EQ(event.overallElapsedSeconds, 15.0);
    EXPECT_DOUBLE_EQ(event.overallPercent, 95.0);
}

// Test finish reports 100% overall
TEST_F(ProgressReporterTest, FinishIsComplete)
{
    reporter.beginSession();
    reporter.beginPhase(ProgressPhase::Mux, 1);
    const auto done = reporter.finish();

    EXPECT_EQ(done.phase, ProgressPhase::Done);
    EXPECT_DOUBLE_EQ(done.percent, 100.0);
    EXPECT_DOUBLE_EQ(done.overallPercent, 100.0);
    EXPECT_DOUBLE_EQ(done.etaSeconds, 0.0);
    EXPECT_EQ(reporter.getCurrentPhase(), ProgressPhase::Done);
}

// Test the overall windows tile 0-100 in phase order
TEST(ProgressReporterWindowTest, WindowsTileTheRange)
{
    const ProgressPlan plan;
    const ProgressPhase order[] = { ProgressPhase::Validation, ProgressPhase::Trim, ProgressPhase::Concat, ProgressPhase::Mux };

    double expectedStart = 0.0;
    for (const auto phase : order)
    {
        const auto window = ProgressReporter::getOverallWindow(plan, phase);
        EXPECT_DOUBLE_EQ(window.getStart(), expectedStart);
        expectedStart = window.getEnd();
    }

    EXPECT_DOUBLE_EQ(expectedStart, 100.0);
}

// Test out-of-range counts are clamped and an empty phase reads as complete
TEST(ProgressReporterWindowTest, ClampsCounts)
{
    const ProgressPlan plan;

    EXPECT_DOUBLE_EQ(ProgressReporter::computeEvent(plan, ProgressPhase::Trim, 7, 4, 1.0, 1.0).percent, 100.0);
    EXPECT_DOUBLE_EQ(ProgressReporter::computeEvent(plan, ProgressPhase::Trim, -1, 4, 1.0, 1.0).percent, 0.0);
    EXPECT_DOUBLE_EQ(ProgressReporter::computeEvent(plan, ProgressPhase::Validation, 0, 0, 0.0, 0.0).percent, 100.0);
}
