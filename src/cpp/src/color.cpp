#include "viewmark/color.hpp"

#include <algorithm>
#include <cmath>

namespace viewmark {

namespace {

float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

/// sRGB transfer function inverse.
float gamma_to_linear(float c) {
    if (c <= 0.04045f) {
        return c / 12.92f;
    }
    return std::pow((c + 0.055f) / 1.055f, 2.4f);
}

} // anonymous namespace

bool Rgba::operator==(const Rgba& other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
}

Rgba hsv_to_rgb(float h, float s, float v) {
    h = clamp01(h);
    s = clamp01(s);
    v = clamp01(v);

    if (s <= 0.0f) {
        return Rgba{v, v, v, 1.0f};
    }

    float scaled = h * 6.0f;
    int sector = static_cast<int>(std::floor(scaled));
    float f = scaled - static_cast<float>(sector);
    float p = v * (1.0f - s);
    float q = v * (1.0f - s * f);
    float t = v * (1.0f - s * (1.0f - f));

    switch (sector % 6) {
    case 0:  return Rgba{v, t, p, 1.0f};
    case 1:  return Rgba{q, v, p, 1.0f};
    case 2:  return Rgba{p, v, t, 1.0f};
    case 3:  return Rgba{p, q, v, 1.0f};
    case 4:  return Rgba{t, p, v, 1.0f};
    default: return Rgba{v, p, q, 1.0f};
    }
}

float approx_saturation(const Rgba& c) {
    float max = std::max(c.r, std::max(c.g, c.b));
    float min = std::min(c.r, std::min(c.g, c.b));
    if (max <= 0.0001f) {
        return 0.0f;
    }
    return (max - min) / max;
}

float perceived_luminance(const Rgba& c) {
    float y = 0.2126f * gamma_to_linear(c.r)
            + 0.7152f * gamma_to_linear(c.g)
            + 0.0722f * gamma_to_linear(c.b);
    return clamp01(y);
}

Rgba random_bright_color(std::mt19937& rng, float min_saturation, float min_value) {
    min_saturation = clamp01(min_saturation);
    min_value = clamp01(min_value);

    std::uniform_real_distribution<float> hue_dist(0.0f, 1.0f);
    std::uniform_real_distribution<float> sat_dist(min_saturation, 1.0f);
    std::uniform_real_distribution<float> val_dist(min_value, 1.0f);

    float h = hue_dist(rng);
    float s = sat_dist(rng);
    float v = val_dist(rng);

    Rgba c = hsv_to_rgb(h, s, v);

    if (approx_saturation(c) < min_saturation || perceived_luminance(c) < min_value) {
        s = std::max(s, std::min(0.9f, min_saturation + 0.1f));
        v = std::max(v, std::min(0.95f, min_value + 0.1f));
        c = hsv_to_rgb(h, s, v);
    }

    return c;
}

} // namespace viewmark
