/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace CurveLights {

std::mt19937& getThreadLocalRNG() {
    static thread_local std::mt19937 rng(std::random_device{}());
    return rng;
}

float randomFloat(float minValue, float maxValue) {
    if (maxValue <= minValue) {
        return minValue;
    }
    std::uniform_real_distribution<float> dist(minValue, maxValue);
    return dist(getThreadLocalRNG());
}

int randomInt(int minValue, int maxValue) {
    if (maxValue <= minValue) {
        return minValue;
    }
    std::uniform_int_distribution<int> dist(minValue, maxValue);
    return dist(getThreadLocalRNG());
}

bool randomChance(float probability) {
    if (probability <= 0.0f) {
        return false;
    }
    if (probability >= 1.0f) {
        return true;
    }
    return randomFloat(0.0f, 1.0f) < probability;
}

Vector3D randomUnitVector() {
    // Archimedes: uniform z and azimuth give a uniform sphere
    float z = randomFloat(-1.0f, 1.0f);
    float phi = randomFloat(0.0f, 2.0f * std::numbers::pi_v<float>);
    float r = std::sqrt(std::max(0.0f, 1.0f - z * z));
    return Vector3D(r * std::cos(phi), r * std::sin(phi), z);
}

Vector3D randomInBall(float radius) {
    if (radius <= 0.0f) {
        return Vector3D();
    }

    // Acceptance rate is ~52%, 32 tries failing is vanishingly unlikely
    for (int attempt = 0; attempt < 32; ++attempt) {
        Vector3D candidate(randomFloat(-1.0f, 1.0f), randomFloat(-1.0f, 1.0f),
                           randomFloat(-1.0f, 1.0f));
        if (candidate.lengthSquared() <= 1.0f) {
            return candidate * radius;
        }
    }
    return randomUnitVector() * (radius * randomFloat(0.0f, 1.0f));
}

} // namespace CurveLights
