#ifndef __GUIDANCE_HPP__
#define __GUIDANCE_HPP__

#include "ggml_extend.hpp"

/*================================================= Classifier-free guidance ================================================*/

// out = uncond + scale * (cond - uncond); out may alias either input.
__STATIC_INLINE__ ddim_status_t combine_guidance(const struct ggml_tensor* uncond,
                                                 const struct ggml_tensor* cond,
                                                 float guidance_scale,
                                                 struct ggml_tensor* out) {
    if (!ggml_are_same_shape(uncond, cond) || !ggml_are_same_shape(uncond, out)) {
        LOG_ERROR("combine_guidance: shape mismatch, uncond %s cond %s out %s",
                  ggml_tensor_shape_str(uncond).c_str(),
                  ggml_tensor_shape_str(cond).c_str(),
                  ggml_tensor_shape_str(out).c_str());
        return DDIM_ERROR_SHAPE_MISMATCH;
    }
    const float* negative_pred_data = (const float*)uncond->data;
    const float* positive_pred_data = (const float*)cond->data;
    float* vec_out                  = (float*)out->data;
    int64_t ne_elements             = ggml_nelements(out);
    for (int64_t i = 0; i < ne_elements; i++) {
        vec_out[i] = negative_pred_data[i] + guidance_scale * (positive_pred_data[i] - negative_pred_data[i]);
    }
    return DDIM_OK;
}

// batched: the output of one predictor call over 2B rows, unconditional rows first.
// out: the guided [B] rows.
__STATIC_INLINE__ ddim_status_t combine_guidance_batched(const struct ggml_tensor* batched,
                                                         float guidance_scale,
                                                         struct ggml_tensor* out) {
    bool same_rows = batched->ne[0] == out->ne[0] &&
                     batched->ne[1] == out->ne[1] &&
                     batched->ne[2] == out->ne[2];
    if (!same_rows || batched->ne[3] != 2 * out->ne[3]) {
        LOG_ERROR("combine_guidance_batched: expected %s with twice the batch of %s",
                  ggml_tensor_shape_str(batched).c_str(), ggml_tensor_shape_str(out).c_str());
        return DDIM_ERROR_SHAPE_MISMATCH;
    }
    int64_t half                    = ggml_nelements(out);
    const float* negative_pred_data = (const float*)batched->data;
    const float* positive_pred_data = negative_pred_data + half;
    float* vec_out                  = (float*)out->data;
    for (int64_t i = 0; i < half; i++) {
        vec_out[i] = negative_pred_data[i] + guidance_scale * (positive_pred_data[i] - negative_pred_data[i]);
    }
    return DDIM_OK;
}

#endif  // __GUIDANCE_HPP__
