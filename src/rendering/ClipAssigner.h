#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"

/**
 * Matches beat intervals to source clips.
 *
 * The policy is greedy, interval-major, best-fit: intervals are handled in
 * timeline order, and each one takes the unused clip with the smallest
 * non-negative surplus (clip length minus interval length). When no unused clip
 * is long enough, the first unused clip in scan order is taken and will be
 * extended by the renderer. Every clip is used at most once.
 *
 * This is not an optimal packing - handling intervals in another order can
 * waste less - but downstream behaviour depends on exactly this policy.
 */
class ClipAssigner
{
public:
    ClipAssigner();
    ~ClipAssigner();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Derives one interval per beat: the gaps between consecutive beats plus a
     * trailing interval of tailDurationSeconds after the last beat.
     */
    static std::vector<BeatSyncTypes::Interval> deriveIntervals(const std::vector<double>& beats,
                                                                double tailDurationSeconds = 2.0);

    /** ok when there are at least two beats and they strictly increase. */
    static juce::Result validateBeats(const std::vector<double>& beats);

    /**
     * Assigns a clip to every interval.
     *
     * @param intervals      Required durations, in timeline order
     * @param pool           Candidate assets; invalid ones are ignored
     * @param randomize      When true the candidate scan order is shuffled once
     *                       with the given random source; otherwise pool order is used
     * @param random         Random source for the shuffle
     * @param assignmentsOut One assignment per interval on success
     * @return               ok, or a failure when an interval finds no unused clip
     */
    juce::Result assign(const std::vector<BeatSyncTypes::Interval>& intervals,
                        const std::vector<BeatSyncTypes::MediaAsset>& pool,
                        bool randomize,
                        juce::Random& random,
                        std::vector<BeatSyncTypes::Assignment>& assignmentsOut);

    /** Scan order for the valid assets of pool: indices into pool, shuffled when randomize is set. */
    static std::vector<size_t> buildScanOrder(const std::vector<BeatSyncTypes::MediaAsset>& pool,
                                              bool randomize,
                                              juce::Random& random);

private:
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipAssigner)
};
