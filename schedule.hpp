#ifndef __SCHEDULE_HPP__
#define __SCHEDULE_HPP__

#include <cmath>
#include <vector>

#include "ggml_extend.hpp"

#define TIMESTEPS 1000

#include "alphas_cumprod.inl"

// Recomputes the scaled_linear table that DDIM_ALPHAS_CUMPROD holds.
__STATIC_INLINE__ void calculate_alphas_cumprod(float* alphas_cumprod,
                                                float linear_start = 0.00085f,
                                                float linear_end   = 0.0120f,
                                                int timesteps      = TIMESTEPS) {
    float ls_sqrt = sqrtf(linear_start);
    float le_sqrt = sqrtf(linear_end);
    float amount  = le_sqrt - ls_sqrt;
    float product = 1.0f;
    for (int i = 0; i < timesteps; i++) {
        float beta = ls_sqrt + amount * ((float)i / (timesteps - 1));
        product *= 1.0f - beta * beta;
        alphas_cumprod[i] = product;
    }
}

__STATIC_INLINE__ ddim_status_t alpha_cumprod(int timestep, float& alpha) {
    if (timestep < 0 || timestep >= TIMESTEPS) {
        LOG_ERROR("timestep %d is outside [0, %d)", timestep, TIMESTEPS);
        return DDIM_ERROR_VALIDATION;
    }
    alpha = DDIM_ALPHAS_CUMPROD[timestep];
    return DDIM_OK;
}

// Every (1000 / n_steps)-th timestep starting at 1, ascending. More than 1000
// steps collapse to a stride of 1, so the list length is whatever the stride
// gives: 8 entries for 7 steps, 999 for 1000.
__STATIC_INLINE__ std::vector<int> build_ddim_timesteps(int n_steps) {
    std::vector<int> timesteps;
    if (n_steps <= 0) {
        return timesteps;
    }
    int stride = TIMESTEPS / n_steps;
    if (stride < 1) {
        stride = 1;
    }
    for (int t = 1; t < TIMESTEPS; t += stride) {
        timesteps.push_back(t);
    }
    return timesteps;
}

// Schedule of one sampling run, aligned to the ascending timestep list.
// The walk goes from the last index down to 0; index 0 steps to alpha 1.0.
struct AlphaSchedule {
    std::vector<int> timesteps;
    std::vector<float> alphas;
    std::vector<float> alphas_prev;

    ddim_status_t init(int n_steps) {
        timesteps.clear();
        alphas.clear();
        alphas_prev.clear();
        if (n_steps <= 0) {
            LOG_ERROR("sample_steps must be positive, got %d", n_steps);
            return DDIM_ERROR_CONFIG;
        }
        if (n_steps > TIMESTEPS) {
            LOG_WARN("sample_steps %d exceeds %d timesteps, using stride 1", n_steps, TIMESTEPS);
        }
        timesteps = build_ddim_timesteps(n_steps);
        for (size_t i = 0; i < timesteps.size(); i++) {
            float alpha          = 0.f;
            ddim_status_t status = alpha_cumprod(timesteps[i], alpha);
            if (status != DDIM_OK) {
                return status;
            }
            alphas.push_back(alpha);
            alphas_prev.push_back(i == 0 ? 1.0f : alphas[i - 1]);
        }
        return check();
    }

    ddim_status_t check() const {
        if (timesteps.empty()) {
            LOG_ERROR("empty schedule");
            return DDIM_ERROR_CONFIG;
        }
        for (size_t i = 0; i < timesteps.size(); i++) {
            if (timesteps[i] < 1 || timesteps[i] >= TIMESTEPS) {
                LOG_ERROR("schedule timestep %d is outside [1, %d)", timesteps[i], TIMESTEPS);
                return DDIM_ERROR_CONFIG;
            }
            if (i > 0 && timesteps[i] <= timesteps[i - 1]) {
                LOG_ERROR("schedule is not strictly increasing at index %zu", i);
                return DDIM_ERROR_CONFIG;
            }
            if (!(alphas[i] > 0.f && alphas[i] <= 1.f) || !(alphas_prev[i] > 0.f && alphas_prev[i] <= 1.f)) {
                LOG_ERROR("alpha out of (0, 1] at timestep %d", timesteps[i]);
                return DDIM_ERROR_CONFIG;
            }
        }
        return DDIM_OK;
    }

    size_t size() const {
        return timesteps.size();
    }
};

#endif  // __SCHEDULE_HPP__
