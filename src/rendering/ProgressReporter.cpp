#include "ProgressReporter.h"

using BeatSyncTypes::ProgressEvent;
using BeatSyncTypes::ProgressPhase;

ProgressReporter::ProgressReporter()
    : ProgressReporter(ProgressPlan())
{
}

ProgressReporter::ProgressReporter(const ProgressPlan& p)
    : plan(p)
{
}

ProgressReporter::~ProgressReporter()
{
}

void ProgressReporter::setEventCallback(EventCallback callback)
{
    eventCallback = std::move(callback);
}

void ProgressReporter::setClock(std::function<double()> clockSeconds)
{
    clock = std::move(clockSeconds);
}

double ProgressReporter::now() const
{
    if (clock)
        return clock();

    return juce::Time::getMillisecondCounterHiRes() * 0.001;
}

void ProgressReporter::beginSession()
{
    sessionStartSeconds = now();
    phaseStartSeconds = sessionStartSeconds;
    currentPhase = ProgressPhase::Validation;
    phaseTotalUnits = 0;
}

ProgressEvent ProgressReporter::beginPhase(ProgressPhase phase, int totalUnits)
{
    currentPhase = phase;
    phaseTotalUnits = juce::jmax(0, totalUnits);
    phaseStartSeconds = now();

    return emit(computeEvent(plan, currentPhase, 0, phaseTotalUnits, 0.0, phaseStartSeconds - sessionStartSeconds));
}

ProgressEvent ProgressReporter::unitsCompleted(int completedUnits)
{
    const double t = now();
    return emit(computeEvent(plan, currentPhase, completedUnits, phaseTotalUnits,
                             t - phaseStartSeconds, t - sessionStartSeconds));
}

ProgressEvent ProgressReporter::finish()
{
    const double t = now();
    currentPhase = ProgressPhase::Done;

    ProgressEvent event;
    event.phase = ProgressPhase::Done;
    event.percent = 100.0;
    event.elapsedSeconds = t - phaseStartSeconds;
    event.etaSeconds = 0.0;
    event.overallPercent = 100.0;
    event.overallElapsedSeconds = t - sessionStartSeconds;
    return emit(event);
}

ProgressEvent ProgressReporter::emit(const ProgressEvent& event)
{
    if (eventCallback)
        eventCallback(event);

    return event;
}

juce::Range<double> ProgressReporter::getOverallWindow(const ProgressPlan& plan, ProgressPhase phase)
{
    switch (phase)
    {
        case ProgressPhase::Validation: return { 0.0, plan.validationEnd };
        case ProgressPhase::Trim:       return { plan.validationEnd, plan.trimEnd };
        case ProgressPhase::Concat:     return { plan.trimEnd, plan.concatEnd };
        case ProgressPhase::Mux:        return { plan.concatEnd, 100.0 };
        case ProgressPhase::Done:       return { 100.0, 100.0 };
    }

    return { 0.0, 100.0 };
}

ProgressEvent ProgressReporter::computeEvent(const ProgressPlan& plan,
                                             ProgressPhase phase,
                                             int completedUnits,
                                             int totalUnits,
                                             double phaseElapsedSeconds,
                                             double overallElapsedSeconds)
{
    const int total = juce::jmax(0, totalUnits);
    const int completed = juce::jlimit(0, total, completedUnits);
    const int remaining = total - completed;

    ProgressEvent event;
    event.phase = phase;
    event.elapsedSeconds = juce::jmax(0.0, phaseElapsedSeconds);
    event.overallElapsedSeconds = juce::jmax(0.0, overallElapsedSeconds);
    event.percent = total > 0 ? 100.0 * completed / total : 100.0;

    double perUnitEstimate = 0.0;
    double tailEstimate = 0.0;

    if (phase == ProgressPhase::Validation)
    {
        perUnitEstimate = plan.validationSecondsPerAsset;
    }
    else if (phase == ProgressPhase::Trim)
    {
        perUnitEstimate = plan.processingSecondsPerSegment;
        tailEstimate = plan.finalisationSeconds;
    }
    else if (phase == ProgressPhase::Concat)
    {
        perUnitEstimate = plan.finalisationSeconds * 0.5;
        tailEstimate = plan.finalisationSeconds * 0.5;
    }
    else if (phase == ProgressPhase::Mux)
    {
        perUnitEstimate = plan.finalisationSeconds * 0.5;
    }

    if (completed > 0)
        perUnitEstimate = event.elapsedSeconds / completed;

    event.etaSeconds = juce::jmax(0.0, perUnitEstimate * remaining + tailEstimate);

    const auto window = getOverallWindow(plan, phase);
    event.overallPercent = window.getStart() + window.getLength() * event.percent / 100.0;

    return event;
}
