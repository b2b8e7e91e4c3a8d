#ifndef __STUB_MODELS_HPP__
#define __STUB_MODELS_HPP__

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "pipeline.hpp"

__STATIC_INLINE__ float ggml_tensor_get_f32(const ggml_tensor* tensor, int l, int k = 0, int j = 0, int i = 0) {
    GGML_ASSERT(tensor->nb[0] == sizeof(float));
    return *(float*)((char*)(tensor->data) + i * tensor->nb[3] + j * tensor->nb[2] + k * tensor->nb[1] + l * tensor->nb[0]);
}

__STATIC_INLINE__ std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// Deterministic stand-ins for the four collaborators. Every output row depends
// only on the matching input row, so batched and unbatched calls agree.

__STATIC_INLINE__ int32_t stub_word_id(const std::string& word) {
    uint32_t h = 2166136261u;
    for (unsigned char c : word) {
        h = (h ^ c) * 16777619u;
    }
    return 1000 + (int32_t)(h % 40000);
}

// "a b c" -> BOS, id(a), id(b), id(c), EOS
struct WordTokenizer : public Tokenizer {
    int calls = 0;

    bool tokenize(const std::string& text, std::vector<int32_t>& tokens) {
        calls++;
        tokens.clear();
        tokens.push_back(DDIM_BOS_TOKEN_ID);
        for (const std::string& word : split_words(text)) {
            tokens.push_back(stub_word_id(word));
        }
        tokens.push_back(DDIM_EOS_TOKEN_ID);
        return true;
    }
};

__STATIC_INLINE__ std::string words_prompt(int n_words) {
    std::string prompt;
    for (int i = 0; i < n_words; i++) {
        prompt += (i > 0 ? " w" : "w") + std::to_string(i);
    }
    return prompt;
}

__STATIC_INLINE__ float stub_context_value(int32_t id, int32_t pos, int64_t d) {
    return (float)(id % 97) / 97.f * std::cos(0.1f * d + 0.01f * pos);
}

struct StubTextEncoder : public TextEncoder {
    int calls           = 0;
    int wrong_dim_delta = 0;
    bool own_output     = false;
    bool fail           = false;
    std::vector<std::vector<int32_t>> seen_ids;

    bool compute(int n_threads,
                 struct ggml_tensor* input_ids,
                 struct ggml_tensor* position_ids,
                 struct ggml_tensor** output,
                 struct ggml_context* output_ctx) {
        calls++;
        if (fail) {
            return false;
        }
        const int32_t* ids = (const int32_t*)input_ids->data;
        const int32_t* pos = (const int32_t*)position_ids->data;
        seen_ids.push_back(std::vector<int32_t>(ids, ids + input_ids->ne[0]));

        struct ggml_tensor* out = *output;
        if (wrong_dim_delta != 0 || own_output) {
            out = ggml_new_tensor_3d(output_ctx, GGML_TYPE_F32, out->ne[0] + wrong_dim_delta, out->ne[1], out->ne[2]);
            *output = out;
        }
        float* vec_out = (float*)out->data;
        int64_t D      = out->ne[0];
        int64_t L      = out->ne[1];
        for (int64_t b = 0; b < out->ne[2]; b++) {
            for (int64_t p = 0; p < L; p++) {
                int32_t id = ids[b * L + p];
                for (int64_t d = 0; d < D; d++) {
                    vec_out[(b * L + p) * D + d] = stub_context_value(id, pos[b * L + p], d);
                }
            }
        }
        return true;
    }
};

// true when context row 0 holds the encoding of BOS followed by EOS padding
__STATIC_INLINE__ bool stub_is_unconditional(const struct ggml_tensor* context) {
    const float* vec_ctx = (const float*)context->data;
    int64_t D            = context->ne[0];
    for (int32_t p = 1; p < (int32_t)context->ne[1]; p++) {
        if (vec_ctx[p * D] != stub_context_value(DDIM_EOS_TOKEN_ID, p, 0)) {
            return false;
        }
    }
    return true;
}

// the timestep whose embedding matches t_emb row 0, or -1
__STATIC_INLINE__ int stub_embedded_timestep(const struct ggml_tensor* t_emb) {
    int dim = (int)t_emb->ne[0];
    std::vector<float> embedding;
    for (int t = 0; t < TIMESTEPS; t++) {
        if (!timestep_embedding(std::vector<float>(1, (float)t), embedding, dim)) {
            return -1;
        }
        if (memcmp(embedding.data(), t_emb->data, dim * sizeof(float)) == 0) {
            return t;
        }
    }
    return -1;
}

struct StubDiffusionModel : public DiffusionModel {
    int calls                   = 0;
    bool zero_output            = false;
    bool fail                   = false;
    bool record_timesteps       = false;
    int wrong_channels          = 0;
    int cancel_at_call          = -1;
    DDIMPipeline* cancel_target = NULL;
    std::vector<int64_t> seen_batch;
    std::vector<int> seen_timesteps;
    std::vector<bool> seen_unconditional;

    bool compute(int n_threads,
                 struct ggml_tensor* x,
                 struct ggml_tensor* t_emb,
                 struct ggml_tensor* context,
                 struct ggml_tensor** output     = NULL,
                 struct ggml_context* output_ctx = NULL) {
        calls++;
        seen_batch.push_back(x->ne[3]);
        seen_unconditional.push_back(stub_is_unconditional(context));
        if (record_timesteps) {
            seen_timesteps.push_back(stub_embedded_timestep(t_emb));
        }
        if (cancel_target != NULL && calls == cancel_at_call) {
            cancel_target->request_cancel();
        }
        if (fail) {
            return false;
        }
        struct ggml_tensor* out = *output;
        if (wrong_channels > 0) {
            out     = ggml_new_tensor_4d(output_ctx, GGML_TYPE_F32, wrong_channels, x->ne[1], x->ne[2], x->ne[3]);
            *output = out;
            ggml_tensor_fill_f32(out, 0.f);
            return true;
        }
        const float* vec_x   = (const float*)x->data;
        const float* vec_emb = (const float*)t_emb->data;
        const float* vec_ctx = (const float*)context->data;
        float* vec_out       = (float*)out->data;
        int64_t row          = x->ne[0] * x->ne[1] * x->ne[2];
        int64_t emb_dim      = t_emb->ne[0];
        int64_t ctx_row      = context->ne[0] * context->ne[1];
        for (int64_t b = 0; b < x->ne[3]; b++) {
            double ctx_sum = 0.0;
            for (int64_t j = 0; j < ctx_row; j++) {
                ctx_sum += vec_ctx[b * ctx_row + j];
            }
            float ctx_mean = (float)(ctx_sum / ctx_row);
            for (int64_t j = 0; j < row; j++) {
                float v = 0.5f * vec_x[b * row + j] + 0.05f * vec_emb[b * emb_dim + j % emb_dim] + 0.1f * ctx_mean;
                vec_out[b * row + j] = zero_output ? 0.f : v;
            }
        }
        return true;
    }
};

// nearest-neighbour x8 upsampling of the first three latent channels
struct StubImageDecoder : public ImageDecoder {
    int calls       = 0;
    bool fail       = false;
    bool half_size  = false;
    bool own_output = false;

    bool compute(int n_threads,
                 struct ggml_tensor* z,
                 struct ggml_tensor** output,
                 struct ggml_context* output_ctx) {
        calls++;
        if (fail) {
            return false;
        }
        struct ggml_tensor* out = *output;
        if (half_size || own_output) {
            int64_t scale = half_size ? 4 : 8;
            out           = ggml_new_tensor_4d(output_ctx, GGML_TYPE_F32, 3, z->ne[1] * scale, z->ne[2] * scale, z->ne[3]);
            *output       = out;
        }
        int64_t scale  = out->ne[1] / z->ne[1];
        int64_t W      = out->ne[1];
        int64_t H      = out->ne[2];
        float* vec_out = (float*)out->data;
        for (int64_t b = 0; b < out->ne[3]; b++) {
            for (int64_t y = 0; y < H; y++) {
                for (int64_t x = 0; x < W; x++) {
                    for (int64_t c = 0; c < 3; c++) {
                        float v = ggml_tensor_get_f32(z, (int)c, (int)(x / scale), (int)(y / scale), (int)b);
                        vec_out[((b * H + y) * W + x) * 3 + c] = std::tanh(v);
                    }
                }
            }
        }
        return true;
    }
};

struct StubModels {
    std::shared_ptr<WordTokenizer> tokenizer      = std::make_shared<WordTokenizer>();
    std::shared_ptr<StubTextEncoder> text_encoder = std::make_shared<StubTextEncoder>();
    std::shared_ptr<StubDiffusionModel> diffusion = std::make_shared<StubDiffusionModel>();
    std::shared_ptr<StubImageDecoder> decoder     = std::make_shared<StubImageDecoder>();

    std::unique_ptr<DDIMPipeline> make_pipeline(const ddim_ctx_params_t& params) {
        std::unique_ptr<DDIMPipeline> pipeline(new DDIMPipeline(params, tokenizer, text_encoder, diffusion, decoder));
        return pipeline;
    }
};

__STATIC_INLINE__ ddim_ctx_params_t small_ctx_params() {
    ddim_ctx_params_t params;
    ddim_ctx_params_init(&params);
    params.width       = 64;
    params.height      = 48;
    params.context_dim = 32;
    params.n_threads   = 1;
    return params;
}

#endif  // __STUB_MODELS_HPP__
