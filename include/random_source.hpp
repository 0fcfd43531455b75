#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <memory>
#include <mutex>
#include <random>

/**
 * @class RandomSource
 * @brief Source of the bounded jitter the engines add to their models.
 *
 * Engines take one by shared pointer so tests can inject fixed values.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Draws a value uniformly from [low, high).
     */
    virtual double uniform(double low, double high) = 0;
};

/**
 * @class MersenneRandomSource
 * @brief std::mt19937 seeded from std::random_device.
 */
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(unsigned int seed);

    double uniform(double low, double high) override;

private:
    std::mutex rng_mutex;
    std::mt19937 rng;
};

std::shared_ptr<RandomSource> makeDefaultRandomSource();

#endif // RANDOM_SOURCE_H
