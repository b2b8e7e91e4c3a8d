#ifndef __GGML_EXTEND_HPP__
#define __GGML_EXTEND_HPP__

#include <cinttypes>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "ggml.h"

#include "ddim.h"
#include "rng.hpp"
#include "util.h"

#ifndef __STATIC_INLINE__
#define __STATIC_INLINE__ static inline
#endif

__STATIC_INLINE__ std::string ggml_tensor_shape_str(const struct ggml_tensor* tensor) {
    if (tensor == NULL) {
        return "[null]";
    }
    return format("[%" PRId64 ", %" PRId64 ", %" PRId64 ", %" PRId64 "]",
                  tensor->ne[0], tensor->ne[1], tensor->ne[2], tensor->ne[3]);
}

__STATIC_INLINE__ std::string ggml_shape_str(const int64_t ne[4]) {
    return format("[%" PRId64 ", %" PRId64 ", %" PRId64 ", %" PRId64 "]", ne[0], ne[1], ne[2], ne[3]);
}

__STATIC_INLINE__ void ggml_tensor_set_f32_randn(struct ggml_tensor* tensor, std::shared_ptr<RNG> rng) {
    uint32_t n                        = (uint32_t)ggml_nelements(tensor);
    std::vector<float> random_numbers = rng->randn(n);
    float* data                       = (float*)tensor->data;
    for (uint32_t i = 0; i < n; i++) {
        data[i] = random_numbers[i];
    }
}

__STATIC_INLINE__ void ggml_tensor_fill_f32(struct ggml_tensor* tensor, float value) {
    float* data = (float*)tensor->data;
    int64_t n   = ggml_nelements(tensor);
    for (int64_t i = 0; i < n; i++) {
        data[i] = value;
    }
}

// dst and src must be contiguous tensors of the same type and shape
__STATIC_INLINE__ bool copy_ggml_tensor(struct ggml_tensor* dst, const struct ggml_tensor* src) {
    if (dst->type != src->type || !ggml_are_same_shape(dst, src)) {
        LOG_ERROR("copy_ggml_tensor: %s %s -> %s %s",
                  ggml_type_name(src->type), ggml_tensor_shape_str(src).c_str(),
                  ggml_type_name(dst->type), ggml_tensor_shape_str(dst).c_str());
        return false;
    }
    if (dst != src) {
        memcpy(dst->data, src->data, ggml_nbytes(src));
    }
    return true;
}

__STATIC_INLINE__ struct ggml_tensor* vector_to_ggml_tensor_i32(struct ggml_context* ctx,
                                                                const std::vector<int>& vec) {
    struct ggml_tensor* t = ggml_new_tensor_1d(ctx, GGML_TYPE_I32, vec.size());
    memcpy(t->data, (const void*)vec.data(), ggml_nbytes(t));
    return t;
}

// row: 1d tensor [n]
// return: 2d tensor [n, rows] holding rows copies of row
__STATIC_INLINE__ struct ggml_tensor* ggml_repeat_rows(struct ggml_context* ctx,
                                                       const struct ggml_tensor* row,
                                                       int rows) {
    struct ggml_tensor* out = ggml_new_tensor_2d(ctx, row->type, row->ne[0], rows);
    size_t row_size         = ggml_nbytes(row);
    for (int i = 0; i < rows; i++) {
        memcpy((char*)out->data + i * row_size, row->data, row_size);
    }
    return out;
}

// Stacks a on top of b along batch_dim; every dimension above batch_dim must be 1,
// so the result is a's data followed by b's data.
__STATIC_INLINE__ struct ggml_tensor* ggml_concat_batch(struct ggml_context* ctx,
                                                        const struct ggml_tensor* a,
                                                        const struct ggml_tensor* b,
                                                        int batch_dim) {
    for (int d = 0; d < GGML_MAX_DIMS; d++) {
        if (d == batch_dim) {
            continue;
        }
        if (a->ne[d] != b->ne[d] || (d > batch_dim && a->ne[d] != 1)) {
            LOG_ERROR("ggml_concat_batch: can not stack %s and %s along dim %d",
                      ggml_tensor_shape_str(a).c_str(), ggml_tensor_shape_str(b).c_str(), batch_dim);
            return NULL;
        }
    }
    if (a->type != b->type) {
        LOG_ERROR("ggml_concat_batch: type mismatch %s vs %s", ggml_type_name(a->type), ggml_type_name(b->type));
        return NULL;
    }
    int64_t ne[GGML_MAX_DIMS] = {a->ne[0], a->ne[1], a->ne[2], a->ne[3]};
    ne[batch_dim] += b->ne[batch_dim];
    struct ggml_tensor* out = ggml_new_tensor(ctx, a->type, 4, ne);
    memcpy(out->data, a->data, ggml_nbytes(a));
    memcpy((char*)out->data + ggml_nbytes(a), b->data, ggml_nbytes(b));
    return out;
}

// timesteps: [N,]
// embedding: [N, dim], cos half first, then sin half
__STATIC_INLINE__ bool timestep_embedding(const std::vector<float>& timesteps,
                                          std::vector<float>& embedding,
                                          int dim,
                                          int max_period = 10000) {
    if (dim <= 0 || dim % 2 != 0) {
        LOG_ERROR("timestep embedding dim must be a positive even number, got %d", dim);
        return false;
    }
    size_t N = timesteps.size();
    int half = dim / 2;
    std::vector<float> freqs(half);
    for (int i = 0; i < half; ++i) {
        freqs[i] = (float)std::exp(-std::log((double)max_period) * i / half);
    }
    embedding.assign(N * dim, 0.f);
    for (size_t i = 0; i < N; ++i) {
        for (int j = 0; j < half; ++j) {
            double arg                   = (double)timesteps[i] * freqs[j];
            embedding[i * dim + j]       = (float)std::cos(arg);
            embedding[i * dim + j + half] = (float)std::sin(arg);
        }
    }
    return true;
}

__STATIC_INLINE__ bool set_timestep_embedding(const std::vector<float>& timesteps,
                                              struct ggml_tensor* embedding,
                                              int dim,
                                              int max_period = 10000) {
    if (embedding->ne[0] != dim || embedding->ne[1] != (int64_t)timesteps.size()) {
        LOG_ERROR("timestep embedding tensor %s does not hold %zu x %d values",
                  ggml_tensor_shape_str(embedding).c_str(), timesteps.size(), dim);
        return false;
    }
    std::vector<float> embedding_vec;
    if (!timestep_embedding(timesteps, embedding_vec, dim, max_period)) {
        return false;
    }
    memcpy(((char*)embedding->data), ((char*)embedding_vec.data()), ggml_nbytes(embedding));
    return true;
}

// one timestep per batch row; returns NULL on an invalid dim
__STATIC_INLINE__ struct ggml_tensor* new_timestep_embedding(struct ggml_context* ctx,
                                                             const std::vector<float>& timesteps,
                                                             int dim,
                                                             int max_period = 10000) {
    if (dim <= 0 || dim % 2 != 0) {
        LOG_ERROR("timestep embedding dim must be a positive even number, got %d", dim);
        return NULL;
    }
    struct ggml_tensor* embedding = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, dim, timesteps.size());
    if (!set_timestep_embedding(timesteps, embedding, dim, max_period)) {
        return NULL;
    }
    return embedding;
}

__STATIC_INLINE__ ddim_tensor_t ddim_tensor_view(struct ggml_tensor* tensor) {
    ddim_tensor_t view;
    view.type = tensor->type == GGML_TYPE_I32 ? DDIM_TENSOR_I32 : DDIM_TENSOR_F32;
    for (int i = 0; i < 4; i++) {
        view.ne[i] = tensor->ne[i];
    }
    view.data = tensor->data;
    return view;
}

// Applies the shape a callback reported for a pre-allocated output. When the
// shape changed and still fits the buffer, *output becomes a view with that
// shape so the caller's shape check sees it. Fails when it does not fit.
__STATIC_INLINE__ bool ddim_tensor_apply_reported_shape(struct ggml_context* output_ctx,
                                                        const ddim_tensor_t& reported,
                                                        struct ggml_tensor** output,
                                                        const char* call_name) {
    struct ggml_tensor* buffer = *output;
    bool same_shape            = true;
    for (int i = 0; i < 4; i++) {
        if (reported.ne[i] <= 0) {
            LOG_ERROR("%s reported an invalid shape %s", call_name, ggml_shape_str(reported.ne).c_str());
            return false;
        }
        same_shape = same_shape && reported.ne[i] == buffer->ne[i];
    }
    if (same_shape) {
        return true;
    }
    // n stays <= capacity, so the product never overflows
    int64_t capacity = ggml_nelements(buffer);
    int64_t n        = 1;
    for (int i = 0; i < 4; i++) {
        if (reported.ne[i] > capacity / n) {
            LOG_ERROR("%s reported shape %s, larger than its output buffer %s",
                      call_name, ggml_shape_str(reported.ne).c_str(), ggml_tensor_shape_str(buffer).c_str());
            return false;
        }
        n *= reported.ne[i];
    }
    size_t es = ggml_element_size(buffer);
    *output   = ggml_view_4d(output_ctx, buffer,
                             reported.ne[0], reported.ne[1], reported.ne[2], reported.ne[3],
                             reported.ne[0] * es,
                             reported.ne[0] * reported.ne[1] * es,
                             reported.ne[0] * reported.ne[1] * reported.ne[2] * es,
                             0);
    return true;
}

#endif  // __GGML_EXTEND_HPP__
