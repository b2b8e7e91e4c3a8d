#ifndef __SAMPLER_HPP__
#define __SAMPLER_HPP__

#include <cmath>
#include <memory>

#include "ggml_extend.hpp"
#include "rng.hpp"

/*================================================= DDIM ================================================*/

// sigma_t = eta * sqrt((1 - a_prev) / (1 - a_t)) * sqrt(1 - a_t / a_prev)
// eta = 0 is the deterministic sampler.
__STATIC_INLINE__ float ddim_sigma(float alpha_t, float alpha_prev, float eta) {
    if (eta <= 0.f || alpha_t >= 1.f) {
        return 0.f;
    }
    double a_t    = alpha_t;
    double a_prev = alpha_prev;
    double ratio  = 1.0 - a_t / a_prev;
    if (ratio <= 0.0) {
        return 0.f;
    }
    return (float)(eta * std::sqrt((1.0 - a_prev) / (1.0 - a_t)) * std::sqrt(ratio));
}

class DDIMSampler {
protected:
    std::shared_ptr<RNG> rng;
    float eta = 0.f;

public:
    DDIMSampler(std::shared_ptr<RNG> rng = nullptr, float eta = 0.f)
        : rng(rng), eta(eta) {}

    ddim_status_t set_eta(float eta) {
        if (!(eta >= 0.f && eta <= 1.f)) {
            LOG_ERROR("eta must be in [0, 1], got %f", eta);
            return DDIM_ERROR_CONFIG;
        }
        this->eta = eta;
        return DDIM_OK;
    }

    float get_eta() const {
        return eta;
    }

    // One reverse step from alpha_t to alpha_prev.
    //   pred_x0    = (x - sqrt(1 - a_t) * e_t) / sqrt(a_t)
    //   dir_xt     = sqrt(1 - a_prev - sigma_t^2) * e_t
    //   x_prev     = sqrt(a_prev) * pred_x0 + dir_xt [+ sigma_t * temperature * noise]
    // x_prev may alias x. noise is scratch of x's shape, needed only when eta > 0.
    ddim_status_t step(const struct ggml_tensor* x,
                       const struct ggml_tensor* e_t,
                       float alpha_t,
                       float alpha_prev,
                       float temperature,
                       struct ggml_tensor* x_prev,
                       struct ggml_tensor* pred_x0,
                       struct ggml_tensor* noise = NULL) {
        if (!(alpha_t > 0.f && alpha_t <= 1.f) || !(alpha_prev > 0.f && alpha_prev <= 1.f)) {
            LOG_ERROR("DDIM step: alphas must be in (0, 1], got alpha_t = %f, alpha_prev = %f", alpha_t, alpha_prev);
            return DDIM_ERROR_DOMAIN;
        }
        if (!ggml_are_same_shape(x, e_t) || !ggml_are_same_shape(x, x_prev) || !ggml_are_same_shape(x, pred_x0)) {
            LOG_ERROR("DDIM step: shape mismatch, x %s e_t %s x_prev %s pred_x0 %s",
                      ggml_tensor_shape_str(x).c_str(),
                      ggml_tensor_shape_str(e_t).c_str(),
                      ggml_tensor_shape_str(x_prev).c_str(),
                      ggml_tensor_shape_str(pred_x0).c_str());
            return DDIM_ERROR_SHAPE_MISMATCH;
        }

        float sigma_t = ddim_sigma(alpha_t, alpha_prev, eta);
        if (sigma_t > 0.f) {
            if (rng == nullptr || noise == NULL || !ggml_are_same_shape(x, noise)) {
                LOG_ERROR("DDIM step: eta %f needs an rng and a noise buffer of shape %s",
                          eta, ggml_tensor_shape_str(x).c_str());
                return DDIM_ERROR_CONFIG;
            }
            ggml_tensor_set_f32_randn(noise, rng);
        }

        float sqrt_alpha_t           = (float)std::sqrt((double)alpha_t);
        float sqrt_one_minus_alpha_t = (float)std::sqrt(1.0 - (double)alpha_t);
        float sqrt_alpha_prev        = (float)std::sqrt((double)alpha_prev);
        double dir_sq                = 1.0 - (double)alpha_prev - (double)sigma_t * sigma_t;
        float dir_coeff              = (float)std::sqrt(dir_sq > 0.0 ? dir_sq : 0.0);

        const float* vec_x     = (const float*)x->data;
        const float* vec_e_t   = (const float*)e_t->data;
        float* vec_x_prev      = (float*)x_prev->data;
        float* vec_pred_x0     = (float*)pred_x0->data;
        const float* vec_noise = sigma_t > 0.f ? (const float*)noise->data : NULL;
        int64_t ne_elements    = ggml_nelements(x);

        for (int64_t i = 0; i < ne_elements; i++) {
            float e  = vec_e_t[i];
            float p0 = (vec_x[i] - sqrt_one_minus_alpha_t * e) / sqrt_alpha_t;
            float xp = sqrt_alpha_prev * p0 + dir_coeff * e;
            if (vec_noise != NULL) {
                xp += sigma_t * vec_noise[i] * temperature;
            }
            vec_pred_x0[i] = p0;
            vec_x_prev[i]  = xp;
        }
        return DDIM_OK;
    }
};

#endif  // __SAMPLER_HPP__
