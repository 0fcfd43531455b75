#include "random_source.hpp"

MersenneRandomSource::MersenneRandomSource() {
    std::random_device rd;
    rng.seed(rd());
}

MersenneRandomSource::MersenneRandomSource(unsigned int seed) : rng(seed) {}

double MersenneRandomSource::uniform(double low, double high) {
    std::uniform_real_distribution<> dis(low, high);
    std::lock_guard<std::mutex> lock(rng_mutex);
    return dis(rng);
}

std::shared_ptr<RandomSource> makeDefaultRandomSource() {
    return std::make_shared<MersenneRandomSource>();
}
