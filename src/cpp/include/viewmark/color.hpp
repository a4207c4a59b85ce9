#pragma once

#include <random>

#include "constants.hpp"

namespace viewmark {

/// Linear RGBA color, each channel in [0, 1].
struct Rgba {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    bool operator==(const Rgba& other) const;
    bool operator!=(const Rgba& other) const { return !(*this == other); }
};

/// HSV (all in [0, 1]) to an opaque RGB color.
Rgba hsv_to_rgb(float h, float s, float v);

/// (max - min) / max of the RGB channels; 0 for black.
float approx_saturation(const Rgba& c);

/// Rec. 709 luminance of the gamma-decoded channels, clamped to [0, 1].
float perceived_luminance(const Rgba& c);

/// Random hue with saturation and value kept high enough that the
/// color is neither grayish nor dark. If the result still reads as dull
/// the saturation and value are boosted once.
Rgba random_bright_color(std::mt19937& rng,
                         float min_saturation = DEFAULT_MIN_SATURATION,
                         float min_value = DEFAULT_MIN_VALUE);

} // namespace viewmark
