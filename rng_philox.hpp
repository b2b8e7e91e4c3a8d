#ifndef __RNG_PHILOX_H__
#define __RNG_PHILOX_H__

#include <cmath>
#include <vector>

#include "rng.hpp"

// RNG imitating torch cuda randn on CPU.
// Each randn() call draws one Philox4x32-10 block per element, with the call
// counter in the first word and the element index in the third.
class PhiloxRNG : public RNG {
private:
    uint64_t seed;
    uint32_t offset;

private:
    const uint32_t philox_m[2] = {0xD2511F53, 0xCD9E8D57};
    const uint32_t philox_w[2] = {0x9E3779B9, 0xBB67AE85};
    const float two_pow32_inv     = 2.3283064e-10f;
    const float two_pow32_inv_2pi = 2.3283064e-10f * 6.2831855f;

    static void split_u64(uint64_t x, uint32_t& lo, uint32_t& hi) {
        lo = static_cast<uint32_t>(x & 0xFFFFFFFF);
        hi = static_cast<uint32_t>(x >> 32);
    }

    // A single round of the Philox 4x32 random number generator.
    void philox4_round(uint32_t counter[4], const uint32_t key[2]) {
        uint32_t v1_lo, v1_hi, v2_lo, v2_hi;
        split_u64(static_cast<uint64_t>(counter[0]) * static_cast<uint64_t>(philox_m[0]), v1_lo, v1_hi);
        split_u64(static_cast<uint64_t>(counter[2]) * static_cast<uint64_t>(philox_m[1]), v2_lo, v2_hi);

        counter[0] = v2_hi ^ counter[1] ^ key[0];
        counter[1] = v2_lo;
        counter[2] = v1_hi ^ counter[3] ^ key[1];
        counter[3] = v1_lo;
    }

    void philox4_32(uint32_t counter[4], uint32_t key[2], int rounds = 10) {
        for (int i = 0; i < rounds - 1; ++i) {
            philox4_round(counter, key);
            key[0] += philox_w[0];
            key[1] += philox_w[1];
        }
        philox4_round(counter, key);
    }

    float box_muller(float x, float y) {
        float u  = x * two_pow32_inv + two_pow32_inv / 2;
        float v  = y * two_pow32_inv_2pi + two_pow32_inv_2pi / 2;
        float s  = std::sqrt(std::fmax(0.0f, -2.0f * std::log(u)));
        float r1 = s * std::sin(v);
        return r1;
    }

public:
    PhiloxRNG(uint64_t seed = 0) {
        this->seed   = seed;
        this->offset = 0;
    }

    void manual_seed(uint64_t seed) {
        this->seed   = seed;
        this->offset = 0;
    }

    std::vector<float> randn(uint32_t n) {
        uint32_t key_lo, key_hi;
        split_u64(this->seed, key_lo, key_hi);

        std::vector<float> result;
        result.reserve(n);
        for (uint32_t i = 0; i < n; ++i) {
            uint32_t counter[4] = {this->offset, 0, i, 0};
            uint32_t key[2]     = {key_lo, key_hi};
            philox4_32(counter, key);
            result.push_back(box_muller((float)counter[0], (float)counter[1]));
        }
        this->offset += 1;
        return result;
    }
};

#endif  // __RNG_PHILOX_H__
