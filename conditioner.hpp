#ifndef __CONDITIONER_HPP__
#define __CONDITIONER_HPP__

#include <memory>
#include <string>
#include <vector>

#include "ggml_extend.hpp"

#define DDIM_MAX_TEXT_LEN 77

static const int32_t DDIM_BOS_TOKEN_ID = 49406;
static const int32_t DDIM_EOS_TOKEN_ID = 49407;

struct Tokenizer {
    virtual ~Tokenizer() = default;
    // May return any number of ids; the conditioner enforces the length limit.
    virtual bool tokenize(const std::string& text, std::vector<int32_t>& tokens) = 0;
};

struct TextEncoder {
    virtual ~TextEncoder() = default;
    // input_ids, position_ids: I32 [77, B]
    // output: F32 [D, 77, B]
    virtual bool compute(int n_threads,
                         struct ggml_tensor* input_ids,
                         struct ggml_tensor* position_ids,
                         struct ggml_tensor** output,
                         struct ggml_context* output_ctx) = 0;
};

// BOS followed by 76 EOS.
__STATIC_INLINE__ const std::vector<int32_t>& unconditional_tokens() {
    static const std::vector<int32_t> tokens = [] {
        std::vector<int32_t> t(DDIM_MAX_TEXT_LEN, DDIM_EOS_TOKEN_ID);
        t[0] = DDIM_BOS_TOKEN_ID;
        return t;
    }();
    return tokens;
}

// Pads a tokenized prompt with EOS to DDIM_MAX_TEXT_LEN. A prompt needs at
// least one trailing pad slot, so 77 or more tokens are rejected.
__STATIC_INLINE__ ddim_status_t pad_tokens(const std::vector<int32_t>& tokens, std::vector<int32_t>& padded) {
    if (tokens.size() >= DDIM_MAX_TEXT_LEN) {
        LOG_ERROR("prompt is too long (%zu tokens, should be less than %d)", tokens.size(), DDIM_MAX_TEXT_LEN);
        return DDIM_ERROR_VALIDATION;
    }
    padded = tokens;
    padded.resize(DDIM_MAX_TEXT_LEN, DDIM_EOS_TOKEN_ID);
    return DDIM_OK;
}

// Text conditioning for one run: the prompt context and the unconditional
// context, one encoder call each.
struct TextConditioner {
    std::shared_ptr<Tokenizer> tokenizer;
    std::shared_ptr<TextEncoder> text_encoder;
    int context_dim = 768;

    TextConditioner(std::shared_ptr<Tokenizer> tokenizer,
                    std::shared_ptr<TextEncoder> text_encoder,
                    int context_dim)
        : tokenizer(tokenizer), text_encoder(text_encoder), context_dim(context_dim) {}

    ddim_status_t tokenize(const std::string& text, std::vector<int32_t>& tokens) {
        std::vector<int32_t> raw;
        if (!tokenizer->tokenize(text, raw)) {
            LOG_ERROR("tokenize failed for prompt \"%s\"", text.c_str());
            return DDIM_ERROR_MODEL;
        }
        return pad_tokens(raw, tokens);
    }

    // tokens: [77] ids, repeated over batch rows
    // context: F32 [context_dim, 77, batch], allocated in work_ctx
    ddim_status_t encode(struct ggml_context* work_ctx,
                         int n_threads,
                         const std::vector<int32_t>& tokens,
                         int batch,
                         struct ggml_tensor** context) {
        std::vector<int> positions(DDIM_MAX_TEXT_LEN);
        for (int i = 0; i < DDIM_MAX_TEXT_LEN; i++) {
            positions[i] = i;
        }
        std::vector<int> ids(tokens.begin(), tokens.end());
        struct ggml_tensor* input_ids    = ggml_repeat_rows(work_ctx, vector_to_ggml_tensor_i32(work_ctx, ids), batch);
        struct ggml_tensor* position_ids = ggml_repeat_rows(work_ctx, vector_to_ggml_tensor_i32(work_ctx, positions), batch);

        struct ggml_tensor* out = ggml_new_tensor_3d(work_ctx, GGML_TYPE_F32, context_dim, DDIM_MAX_TEXT_LEN, batch);
        struct ggml_tensor* expected = out;
        if (!text_encoder->compute(n_threads, input_ids, position_ids, &out, work_ctx)) {
            LOG_ERROR("text encoder failed");
            return DDIM_ERROR_MODEL;
        }
        if (out == NULL || out->type != GGML_TYPE_F32 || !ggml_are_same_shape(out, expected)) {
            LOG_ERROR("text encoder returned %s, expected %s",
                      ggml_tensor_shape_str(out).c_str(), ggml_tensor_shape_str(expected).c_str());
            return DDIM_ERROR_SHAPE_MISMATCH;
        }
        *context = out;
        return DDIM_OK;
    }

    ddim_status_t get_learned_condition(struct ggml_context* work_ctx,
                                        int n_threads,
                                        const std::string& text,
                                        int batch,
                                        struct ggml_tensor** context) {
        std::vector<int32_t> tokens;
        ddim_status_t status = tokenize(text, tokens);
        if (status != DDIM_OK) {
            return status;
        }
        return encode(work_ctx, n_threads, tokens, batch, context);
    }

    ddim_status_t get_unconditional_condition(struct ggml_context* work_ctx,
                                              int n_threads,
                                              int batch,
                                              struct ggml_tensor** context) {
        return encode(work_ctx, n_threads, unconditional_tokens(), batch, context);
    }
};

/*================================================= C callback adapters ================================================*/

struct CallbackTokenizer : public Tokenizer {
    ddim_tokenize_cb_t cb;
    void* data;

    CallbackTokenizer(ddim_tokenize_cb_t cb, void* data)
        : cb(cb), data(data) {}

    bool tokenize(const std::string& text, std::vector<int32_t>& tokens) {
        // one slot past the limit is enough to tell an overflow
        std::vector<int32_t> buffer(DDIM_MAX_TEXT_LEN + 1);
        int n = cb(text.c_str(), buffer.data(), (int)buffer.size(), data);
        if (n < 0) {
            return false;
        }
        // ids past the buffer are unknown, but such a prompt is rejected anyway
        buffer.resize(n, DDIM_EOS_TOKEN_ID);
        tokens = buffer;
        return true;
    }
};

struct CallbackTextEncoder : public TextEncoder {
    ddim_encode_text_cb_t cb;
    void* data;

    CallbackTextEncoder(ddim_encode_text_cb_t cb, void* data)
        : cb(cb), data(data) {}

    bool compute(int n_threads,
                 struct ggml_tensor* input_ids,
                 struct ggml_tensor* position_ids,
                 struct ggml_tensor** output,
                 struct ggml_context* output_ctx) {
        ddim_tensor_t ids_view = ddim_tensor_view(input_ids);
        ddim_tensor_t pos_view = ddim_tensor_view(position_ids);
        ddim_tensor_t out_view = ddim_tensor_view(*output);
        if (!cb(&ids_view, &pos_view, &out_view, data)) {
            return false;
        }
        return ddim_tensor_apply_reported_shape(output_ctx, out_view, output, "encode_text");
    }
};

#endif  // __CONDITIONER_HPP__
