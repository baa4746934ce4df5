/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RANDOM_UTILS_HPP
#define RANDOM_UTILS_HPP

#include "utils/Vector3D.hpp"
#include <random>

namespace CurveLights {

/**
 * @brief Thread-local Mersenne Twister shared by all randomized particle state
 *
 * Seeded once per thread from std::random_device.
 */
std::mt19937& getThreadLocalRNG();

/**
 * @brief Uniform float in [minValue, maxValue)
 */
float randomFloat(float minValue, float maxValue);

/**
 * @brief Uniform integer in [minValue, maxValue] (inclusive)
 */
int randomInt(int minValue, int maxValue);

/**
 * @brief Returns true with the given probability (clamped to [0,1])
 */
bool randomChance(float probability);

/**
 * @brief Uniformly distributed direction on the unit sphere
 */
Vector3D randomUnitVector();

/**
 * @brief Uniformly distributed point inside a ball of the given radius
 *
 * Uses rejection sampling on the enclosing cube so the result never exceeds
 * the radius. A non-positive radius yields the zero vector.
 */
Vector3D randomInBall(float radius);

} // namespace CurveLights

#endif // RANDOM_UTILS_HPP
