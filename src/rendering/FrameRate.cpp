#include "FrameRate.h"

#include <cmath>
#include <numeric>

FrameRate::FrameRate(juce::int64 numerator, juce::int64 denominator)
    : num(numerator), den(denominator)
{
    if (num <= 0 || den <= 0)
    {
        num = 0;
        den = 1;
        return;
    }

    const auto divisor = std::gcd(num, den);
    num /= divisor;
    den /= divisor;
}

namespace
{
    constexpr int maxIntegerDigits = 7;
    constexpr int maxFractionDigits = 3;

    bool isDigits(const juce::String& text, int maxDigits)
    {
        return text.isNotEmpty() && text.length() <= maxDigits && text.containsOnly("0123456789");
    }

    FrameRate bounded(const FrameRate& rate)
    {
        if (rate.num > FrameRate::maxTerm || rate.den > FrameRate::maxTerm)
            return {};

        return rate;
    }

    FrameRate fromDecimal(const juce::String& wholeText, const juce::String& fractionText)
    {
        if (! isDigits(wholeText, maxIntegerDigits) || ! isDigits(fractionText, maxFractionDigits))
            return {};

        juce::int64 scale = 1;
        for (int i = 0; i < fractionText.length(); ++i)
            scale *= 10;

        const juce::int64 scaled = wholeText.getLargeIntValue() * scale + fractionText.getLargeIntValue();
        const double value = (double) scaled / (double) scale;

        // 23.976 is how people write 24000/1001; accept it when it rounds to the written digits.
        const auto nominal = (juce::int64) std::ceil(value);
        if (fractionText.length() >= 2 && nominal > 0)
        {
            const double ntsc = (double) (nominal * 1000) / 1001.0;
            if (std::abs(ntsc - value) < 0.5 / (double) scale)
                return bounded(FrameRate(nominal * 1000, 1001));
        }

        return bounded(FrameRate(scaled, scale));
    }
}

FrameRate FrameRate::fromString(const juce::String& text)
{
    const auto value = text.trim();
    if (value.isEmpty())
        return {};

    const int dotIndex = value.indexOfChar('.');
    if (dotIndex >= 0)
        return fromDecimal(value.substring(0, dotIndex), value.substring(dotIndex + 1));

    const int slashIndex = value.indexOfChar('/');
    const auto numText = slashIndex >= 0 ? value.substring(0, slashIndex).trim() : value;
    const auto denText = slashIndex >= 0 ? value.substring(slashIndex + 1).trim() : juce::String("1");

    // Integers only; "1/0" or anything with extra characters is rejected rather than approximated.
    if (! isDigits(numText, maxIntegerDigits) || ! isDigits(denText, maxIntegerDigits))
        return {};

    return bounded(FrameRate(numText.getLargeIntValue(), denText.getLargeIntValue()));
}

juce::String FrameRate::toString() const
{
    if (! isValid())
        return "0";

    if (den == 1)
        return juce::String(num);

    return juce::String(num) + "/" + juce::String(den);
}

bool FrameRate::operator== (const FrameRate& other) const noexcept
{
    return num * other.den == other.num * den;
}
