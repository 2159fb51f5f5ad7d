#include "ClipAssigner.h"

#include <cmath>
#include <limits>

ClipAssigner::ClipAssigner()
{
}

ClipAssigner::~ClipAssigner()
{
}

void ClipAssigner::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

std::vector<BeatSyncTypes::Interval> ClipAssigner::deriveIntervals(const std::vector<double>& beats,
                                                                   double tailDurationSeconds)
{
    std::vector<BeatSyncTypes::Interval> intervals;
    if (beats.empty())
        return intervals;

    intervals.reserve(beats.size());

    for (size_t i = 0; i + 1 < beats.size(); ++i)
    {
        BeatSyncTypes::Interval interval;
        interval.index = (int) i;
        interval.durationSeconds = beats[i + 1] - beats[i];
        intervals.push_back(interval);
    }

    BeatSyncTypes::Interval tail;
    tail.index = (int) intervals.size();
    tail.durationSeconds = tailDurationSeconds;
    tail.isTail = true;
    intervals.push_back(tail);

    return intervals;
}

juce::Result ClipAssigner::validateBeats(const std::vector<double>& beats)
{
    if (beats.size() < 2)
        return juce::Result::fail("At least two beats are required");

    for (size_t i = 0; i < beats.size(); ++i)
    {
        if (! std::isfinite(beats[i]) || beats[i] < 0.0)
            return juce::Result::fail("Beat " + juce::String((int) i) + " is not a valid timestamp");

        if (i > 0 && beats[i] <= beats[i - 1])
            return juce::Result::fail("Beats must be strictly increasing (beat " + juce::String((int) i) + ")");
    }

    return juce::Result::ok();
}

std::vector<size_t> ClipAssigner::buildScanOrder(const std::vector<BeatSyncTypes::MediaAsset>& pool,
                                                 bool randomize,
                                                 juce::Random& random)
{
    std::vector<size_t> order;
    for (size_t i = 0; i < pool.size(); ++i)
        if (pool[i].isValid)
            order.push_back(i);

    if (randomize)
    {
        // Fisher-Yates, once per session.
        for (size_t i = order.size(); i > 1; --i)
        {
            const auto j = (size_t) random.nextInt((int) i);
            std::swap(order[i - 1], order[j]);
        }
    }

    return order;
}

juce::Result ClipAssigner::assign(const std::vector<BeatSyncTypes::Interval>& intervals,
                                  const std::vector<BeatSyncTypes::MediaAsset>& pool,
                                  bool randomize,
                                  juce::Random& random,
                                  std::vector<BeatSyncTypes::Assignment>& assignmentsOut)
{
    assignmentsOut.clear();

    const std::vector<size_t> scanOrder = buildScanOrder(pool, randomize, random);
    std::vector<bool> used(pool.size(), false);
    std::vector<BeatSyncTypes::Assignment> assignments;
    assignments.reserve(intervals.size());

    for (const auto& interval : intervals)
    {
        const double needed = interval.durationSeconds;
        int best = -1;
        double minSurplus = std::numeric_limits<double>::infinity();

        // Strict '<' keeps the earliest candidate in scan order on a tie.
        for (const size_t index : scanOrder)
        {
            if (used[index])
                continue;

            const double surplus = pool[index].durationSeconds - needed;
            if (surplus >= 0.0 && surplus < minSurplus)
            {
                minSurplus = surplus;
                best = (int) index;
            }
        }

        if (best < 0)
        {
            for (const size_t index : scanOrder)
            {
                if (! used[index])
                {
                    best = (int) index;
                    break;
                }
            }

            if (best >= 0 && logCallback)
                logCallback("Interval " + juce::String(interval.index) + " (" + juce::String(needed, 3)
                            + "s) has no clip long enough; " + pool[(size_t) best].originalName
                            + " (" + juce::String(pool[(size_t) best].durationSeconds, 3) + "s) will be extended");
        }

        if (best < 0)
            return juce::Result::fail("No suitable clip available for beat interval " + juce::String(interval.index + 1)
                                      + " of " + juce::String((int) intervals.size())
                                      + " (" + juce::String(needed, 3) + "s)");

        used[(size_t) best] = true;

        BeatSyncTypes::Assignment assignment;
        assignment.intervalIndex = interval.index;
        assignment.assetId = pool[(size_t) best].id;
        assignments.push_back(assignment);
    }

    assignmentsOut = std::move(assignments);
    return juce::Result::ok();
}
