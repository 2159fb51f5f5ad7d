#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"

/** Cost assumptions and the overall-percent split between phases. */
struct ProgressPlan
{
    double validationSecondsPerAsset = 5.0;
    double processingSecondsPerSegment = 10.0;
    double finalisationSeconds = 30.0;   // concat + mux, split evenly between them

    // Each phase owns [previous end, end) of the overall 0-100 range; mux ends at 100.
    double validationEnd = 50.0;
    double trimEnd = 90.0;
    double concatEnd = 95.0;
};

/**
 * Tracks one session's progress through validation -> trim -> concat -> mux -> done
 * and turns unit counts into ProgressEvents.
 *
 * Every computed event is handed to the event callback. The figures are advisory
 * only; nothing in the pipeline branches on them.
 */
class ProgressReporter
{
public:
    using EventCallback = std::function<void(const BeatSyncTypes::ProgressEvent&)>;

    ProgressReporter();
    explicit ProgressReporter(const ProgressPlan& plan);
    ~ProgressReporter();

    void setEventCallback(EventCallback callback);

    /** Replaces the wall clock (seconds); used by tests. */
    void setClock(std::function<double()> clockSeconds);

    /** Marks the start of the session; overall elapsed time counts from here. */
    void beginSession();

    /**
     * Enters a phase with the given number of work units and emits its 0% event,
     * whose ETA is the plan's estimate for the whole phase.
     */
    BeatSyncTypes::ProgressEvent beginPhase(BeatSyncTypes::ProgressPhase phase, int totalUnits);

    /** Emits the event for completedUnits of the current phase being done. */
    BeatSyncTypes::ProgressEvent unitsCompleted(int completedUnits);

    /** Emits the terminal 100% event. */
    BeatSyncTypes::ProgressEvent finish();

    BeatSyncTypes::ProgressPhase getCurrentPhase() const noexcept { return currentPhase; }

    /**
     * The pure computation behind every event.
     * percent = 100 * completed / total; the ETA uses the per-unit estimate until a
     * unit has completed, then extrapolates from the measured rate.
     */
    static BeatSyncTypes::ProgressEvent computeEvent(const ProgressPlan& plan,
                                                     BeatSyncTypes::ProgressPhase phase,
                                                     int completedUnits,
                                                     int totalUnits,
                                                     double phaseElapsedSeconds,
                                                     double overallElapsedSeconds);

    /** The [start, end] slice of overall percent owned by a phase. */
    static juce::Range<double> getOverallWindow(const ProgressPlan& plan, BeatSyncTypes::ProgressPhase phase);

private:
    double now() const;
    BeatSyncTypes::ProgressEvent emit(const BeatSyncTypes::ProgressEvent& event);

    ProgressPlan plan;
    EventCallback eventCallback;
    std::function<double()> clock;

    BeatSyncTypes::ProgressPhase currentPhase = BeatSyncTypes::ProgressPhase::Validation;
    int phaseTotalUnits = 0;
    double sessionStartSeconds = 0.0;
    double phaseStartSeconds = 0.0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProgressReporter)
};
