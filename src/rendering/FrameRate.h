#pragma once
#include <juce_core/juce_core.h>

/**
 * A frame rate held as a reduced rational (e.g. 24000/1001).
 *
 * ffprobe reports r_frame_rate as "num/den". Parsing splits on the slash and
 * keeps both integers, so comparisons are exact (cross-multiplied) instead of
 * going through floating point.
 */
struct FrameRate
{
    juce::int64 num = 0;
    juce::int64 den = 1;

    FrameRate() = default;
    FrameRate(juce::int64 numerator, juce::int64 denominator);

    /** Largest numerator or denominator a parsed rate may have. */
    static constexpr juce::int64 maxTerm = 1000000;

    /**
     * Parses "num/den", a plain integer ("24") or a decimal ("25.5").
     * Decimals that round from an NTSC rate ("23.976", "29.97", "59.94") map to
     * the exact n*1000/1001 value. Returns an invalid rate (num == 0) for
     * anything else, including a zero denominator or terms above maxTerm.
     */
    static FrameRate fromString(const juce::String& text);

    bool isValid() const noexcept { return num > 0 && den > 0; }

    double toDouble() const noexcept { return isValid() ? (double) num / (double) den : 0.0; }

    /** Seconds per frame, or 0 for an invalid rate. */
    double frameDuration() const noexcept { return isValid() ? (double) den / (double) num : 0.0; }

    /** The value ffmpeg accepts for -r, e.g. "24" or "24000/1001". */
    juce::String toString() const;

    bool operator== (const FrameRate& other) const noexcept;
    bool operator!= (const FrameRate& other) const noexcept { return ! (*this == other); }
};
