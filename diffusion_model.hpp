#ifndef __DIFFUSION_MODEL_H__
#define __DIFFUSION_MODEL_H__

#include "ggml_extend.hpp"

// Noise predictor (eps-prediction).
struct DiffusionModel {
    virtual ~DiffusionModel() = default;
    // x:       [4, W/8, H/8, N]
    // t_emb:   [320, N]
    // context: [D, 77, N]
    // output:  [4, W/8, H/8, N], pre-allocated by the caller
    virtual bool compute(int n_threads,
                         struct ggml_tensor* x,
                         struct ggml_tensor* t_emb,
                         struct ggml_tensor* context,
                         struct ggml_tensor** output     = NULL,
                         struct ggml_context* output_ctx = NULL) = 0;
    virtual void free_compute_buffer() {}
};

struct CallbackDiffusionModel : public DiffusionModel {
    ddim_predict_noise_cb_t cb;
    void* data;

    CallbackDiffusionModel(ddim_predict_noise_cb_t cb, void* data)
        : cb(cb), data(data) {}

    bool compute(int n_threads,
                 struct ggml_tensor* x,
                 struct ggml_tensor* t_emb,
                 struct ggml_tensor* context,
                 struct ggml_tensor** output     = NULL,
                 struct ggml_context* output_ctx = NULL) {
        if (output == NULL || *output == NULL) {
            LOG_ERROR("predict_noise needs a pre-allocated output");
            return false;
        }
        ddim_tensor_t x_view       = ddim_tensor_view(x);
        ddim_tensor_t t_emb_view   = ddim_tensor_view(t_emb);
        ddim_tensor_t context_view = ddim_tensor_view(context);
        ddim_tensor_t out_view     = ddim_tensor_view(*output);
        if (!cb(&x_view, &t_emb_view, &context_view, &out_view, data)) {
            return false;
        }
        return ddim_tensor_apply_reported_shape(output_ctx, out_view, output, "predict_noise");
    }
};

#endif  // __DIFFUSION_MODEL_H__
