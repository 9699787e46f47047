#include "tcc/foundation/random_source.hpp"

namespace tcc::foundation {

Mt19937RandomSource::Mt19937RandomSource(uint32_t seed) : engine_(seed) {}

int32_t Mt19937RandomSource::NextInt(int32_t min, int32_t max) {
    if (max <= min) {
        return min;
    }
    std::uniform_int_distribution<int32_t> dist(min, max);
    return dist(engine_);
}

float Mt19937RandomSource::NextFloat(float min, float max) {
    if (max <= min) {
        return min;
    }
    std::uniform_real_distribution<float> dist(min, max);
    return dist(engine_);
}

void Mt19937RandomSource::Reseed(uint32_t seed) {
    engine_.seed(seed);
}

} // namespace tcc::foundation
