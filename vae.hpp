#ifndef __VAE_HPP__
#define __VAE_HPP__

#include <vector>

#include "ggml_extend.hpp"

#define VAE_SCALE_FACTOR 8

struct ImageDecoder {
    virtual ~ImageDecoder() = default;
    // z:      [4, W/8, H/8, B]
    // output: [3, W, H, B], values roughly in [-1, 1]
    virtual bool compute(int n_threads,
                         struct ggml_tensor* z,
                         struct ggml_tensor** output,
                         struct ggml_context* output_ctx) = 0;
};

struct CallbackImageDecoder : public ImageDecoder {
    ddim_decode_cb_t cb;
    void* data;

    CallbackImageDecoder(ddim_decode_cb_t cb, void* data)
        : cb(cb), data(data) {}

    bool compute(int n_threads,
                 struct ggml_tensor* z,
                 struct ggml_tensor** output,
                 struct ggml_context* output_ctx) {
        ddim_tensor_t z_view   = ddim_tensor_view(z);
        ddim_tensor_t out_view = ddim_tensor_view(*output);
        if (!cb(&z_view, &out_view, data)) {
            return false;
        }
        return ddim_tensor_apply_reported_shape(output_ctx, out_view, output, "decode");
    }
};

__STATIC_INLINE__ uint8_t decoded_value_to_u8(float value) {
    float v = (value + 1.0f) / 2.0f * 255.0f;
    if (!(v >= 0.0f)) {
        v = 0.0f;
    }
    if (v > 255.0f) {
        v = 255.0f;
    }
    return (uint8_t)v;
}

// decoded: [3, W, H, B]
// image:   B * H * W * 3 bytes, row-major HWC per batch item
__STATIC_INLINE__ void decoded_tensor_to_image(const struct ggml_tensor* decoded, std::vector<uint8_t>& image) {
    int64_t n = ggml_nelements(decoded);
    image.resize(n);
    const float* vec_decoded = (const float*)decoded->data;
    for (int64_t i = 0; i < n; i++) {
        image[i] = decoded_value_to_u8(vec_decoded[i]);
    }
}

#endif  // __VAE_HPP__
