#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "ddim.h"

// Plain C callbacks driven through ddim_models_t::user_data.
struct CallbackState {
    int tokenize_calls     = 0;
    int encode_calls       = 0;
    int predict_calls      = 0;
    int decode_calls       = 0;
    int64_t predict_ne0    = 0;  // when non-zero, reported instead of ne[0]
    int cancel_at_call     = -1;
    ddim_ctx_t* ctx        = NULL;
    std::vector<std::pair<int, int>> progress;
};

static int tokenize_words(const char* text, int32_t* tokens, int max_tokens, void* data) {
    CallbackState* state = (CallbackState*)data;
    state->tokenize_calls++;
    std::vector<int32_t> ids;
    ids.push_back(49406);
    std::string word;
    for (const char* p = text;; p++) {
        if (*p == ' ' || *p == '\0') {
            if (!word.empty()) {
                ids.push_back(1000 + (int32_t)(word.size() * 31 + (unsigned char)word[0]));
                word.clear();
            }
            if (*p == '\0') {
                break;
            }
        } else {
            word += *p;
        }
    }
    ids.push_back(49407);
    for (int i = 0; i < (int)ids.size() && i < max_tokens; i++) {
        tokens[i] = ids[i];
    }
    return (int)ids.size();
}

static bool encode_ids(const ddim_tensor_t* input_ids,
                       const ddim_tensor_t* position_ids,
                       ddim_tensor_t* output,
                       void* data) {
    CallbackState* state = (CallbackState*)data;
    state->encode_calls++;
    if (input_ids->type != DDIM_TENSOR_I32 || output->type != DDIM_TENSOR_F32) {
        return false;
    }
    const int32_t* ids = (const int32_t*)input_ids->data;
    float* out         = (float*)output->data;
    int64_t D          = output->ne[0];
    int64_t tokens     = output->ne[1] * output->ne[2];
    for (int64_t t = 0; t < tokens; t++) {
        for (int64_t d = 0; d < D; d++) {
            out[t * D + d] = (float)(ids[t] % 13) / 13.f - 0.5f + 0.001f * d;
        }
    }
    return true;
}

static bool predict_scaled(const ddim_tensor_t* x,
                           const ddim_tensor_t* t_emb,
                           const ddim_tensor_t* context,
                           ddim_tensor_t* output,
                           void* data) {
    CallbackState* state = (CallbackState*)data;
    state->predict_calls++;
    if (state->ctx != NULL && state->predict_calls == state->cancel_at_call) {
        ddim_request_cancel(state->ctx);
    }
    int64_t n = output->ne[0] * output->ne[1] * output->ne[2] * output->ne[3];
    const float* in = (const float*)x->data;
    float* out      = (float*)output->data;
    for (int64_t i = 0; i < n; i++) {
        out[i] = 0.3f * in[i];
    }
    if (state->predict_ne0 != 0) {
        output->ne[0] = state->predict_ne0;
    }
    return true;
}

static bool decode_channels(const ddim_tensor_t* latent, ddim_tensor_t* output, void* data) {
    CallbackState* state = (CallbackState*)data;
    state->decode_calls++;
    const float* z = (const float*)latent->data;
    float* out     = (float*)output->data;
    int64_t C      = latent->ne[0];
    int64_t w      = latent->ne[1];
    int64_t h      = latent->ne[2];
    int64_t W      = output->ne[1];
    int64_t H      = output->ne[2];
    for (int64_t b = 0; b < output->ne[3]; b++) {
        for (int64_t y = 0; y < H; y++) {
            for (int64_t x = 0; x < W; x++) {
                for (int64_t c = 0; c < 3; c++) {
                    float v = z[((b * h + y / 8) * w + x / 8) * C + c];
                    out[((b * H + y) * W + x) * 3 + c] = std::tanh(v);
                }
            }
        }
    }
    return true;
}

static void record_progress(int step, int steps, float time, void* data) {
    ((CallbackState*)data)->progress.push_back(std::make_pair(step, steps));
}

static void quiet_log(enum ddim_log_level_t level, const char* text, void* data) {
}

class CAPITest : public ::testing::Test {
protected:
    CallbackState state;
    ddim_models_t models;
    ddim_ctx_params_t ctx_params;
    ddim_img_gen_params_t gen_params;
    ddim_ctx_t* ctx = NULL;

    void SetUp() override {
        ddim_set_log_callback(quiet_log, NULL);
        models.tokenize      = tokenize_words;
        models.encode_text   = encode_ids;
        models.predict_noise = predict_scaled;
        models.decode        = decode_channels;
        models.user_data     = &state;

        ddim_ctx_params_init(&ctx_params);
        ctx_params.width       = 32;
        ctx_params.height      = 24;
        ctx_params.context_dim = 16;
        ctx_params.n_threads   = 1;

        ddim_img_gen_params_init(&gen_params);
        gen_params.prompt       = "a lighthouse at dusk";
        gen_params.sample_steps = 10;
    }

    void TearDown() override {
        free_ddim_ctx(ctx);
        ddim_set_log_callback(NULL, NULL);
    }

    void create() {
        ctx       = new_ddim_ctx(&ctx_params, &models);
        state.ctx = ctx;
        ASSERT_NE(ctx, nullptr);
    }
};

TEST_F(CAPITest, GeneratesOneImage) {
    create();
    ddim_image_t* images = txt2img(ctx, &gen_params);
    ASSERT_NE(images, nullptr);
    EXPECT_EQ(images[0].width, 32u);
    EXPECT_EQ(images[0].height, 24u);
    EXPECT_EQ(images[0].channel, 3u);
    EXPECT_NE(images[0].data, nullptr);
    EXPECT_EQ(ddim_last_status(ctx), DDIM_OK);
    EXPECT_EQ(state.tokenize_calls, 1);
    EXPECT_EQ(state.encode_calls, 2);
    EXPECT_EQ(state.predict_calls, 20);
    EXPECT_EQ(state.decode_calls, 1);
    free_ddim_images(images, 1);
}

TEST_F(CAPITest, GeneratesBatchDeterministically) {
    ctx_params.batch_size = 2;
    create();
    ddim_image_t* first  = txt2img(ctx, &gen_params);
    ddim_image_t* second = txt2img(ctx, &gen_params);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    size_t image_size = 32 * 24 * 3;
    for (int i = 0; i < 2; i++) {
        EXPECT_EQ(memcmp(first[i].data, second[i].data, image_size), 0);
    }
    EXPECT_NE(memcmp(first[0].data, first[1].data, image_size), 0);
    free_ddim_images(first, 2);
    free_ddim_images(second, 2);
}

TEST_F(CAPITest, SmallerReportedShapeIsShapeMismatch) {
    create();
    state.predict_ne0 = 3;
    EXPECT_EQ(txt2img(ctx, &gen_params), nullptr);
    EXPECT_EQ(ddim_last_status(ctx), DDIM_ERROR_SHAPE_MISMATCH);
    EXPECT_EQ(state.decode_calls, 0);
}

TEST_F(CAPITest, LargerReportedShapeIsModelError) {
    create();
    state.predict_ne0 = 5;
    EXPECT_EQ(txt2img(ctx, &gen_params), nullptr);
    EXPECT_EQ(ddim_last_status(ctx), DDIM_ERROR_MODEL);
}

TEST_F(CAPITest, LongPromptIsValidationError) {
    create();
    std::string prompt;
    for (int i = 0; i < 80; i++) {
        prompt += "word ";
    }
    gen_params.prompt = prompt.c_str();
    EXPECT_EQ(txt2img(ctx, &gen_params), nullptr);
    EXPECT_EQ(ddim_last_status(ctx), DDIM_ERROR_VALIDATION);
    EXPECT_EQ(state.encode_calls, 0);
}

TEST_F(CAPITest, CancelFromInsideCallback) {
    create();
    state.cancel_at_call = 3;
    EXPECT_EQ(txt2img(ctx, &gen_params), nullptr);
    EXPECT_EQ(ddim_last_status(ctx), DDIM_ERROR_CANCELLED);
    EXPECT_EQ(state.predict_calls, 4);
    EXPECT_EQ(state.decode_calls, 0);
}

TEST_F(CAPITest, ProgressReportsEveryStep) {
    create();
    ddim_set_progress_callback(record_progress, &state);
    ddim_image_t* images = txt2img(ctx, &gen_params);
    ddim_set_progress_callback(NULL, NULL);
    ASSERT_NE(images, nullptr);
    free_ddim_images(images, 1);

    ASSERT_EQ(state.progress.size(), 11u);
    EXPECT_EQ(state.progress.front(), std::make_pair(0, 10));
    EXPECT_EQ(state.progress.back(), std::make_pair(10, 10));
}

TEST_F(CAPITest, MissingCallbackOrBadSizeFailsCreation) {
    models.decode = NULL;
    EXPECT_EQ(new_ddim_ctx(&ctx_params, &models), nullptr);

    models.decode    = decode_channels;
    ctx_params.width = 60;
    EXPECT_EQ(new_ddim_ctx(&ctx_params, &models), nullptr);
}

TEST_F(CAPITest, NullContextReportsConfigError) {
    EXPECT_EQ(ddim_last_status(NULL), DDIM_ERROR_CONFIG);
    EXPECT_EQ(txt2img(NULL, &gen_params), nullptr);
    ddim_request_cancel(NULL);
}

TEST(CAPINames, StatusAndRngNames) {
    EXPECT_STREQ(ddim_status_name(DDIM_OK), "ok");
    EXPECT_STREQ(ddim_status_name(DDIM_ERROR_SHAPE_MISMATCH), "shape mismatch");
    EXPECT_STREQ(ddim_status_name(DDIM_ERROR_CANCELLED), "cancelled");
    EXPECT_STREQ(ddim_rng_type_name(CUDA_RNG), "cuda");
    EXPECT_EQ(str_to_rng_type("cuda"), CUDA_RNG);
    EXPECT_EQ(str_to_rng_type("std_default"), STD_DEFAULT_RNG);
    EXPECT_EQ(str_to_rng_type("mt19937"), RNG_TYPE_COUNT);
    EXPECT_EQ(str_to_rng_type(NULL), RNG_TYPE_COUNT);
}

TEST(CAPIParams, DefaultsAndToString) {
    ddim_ctx_params_t ctx_params;
    ddim_ctx_params_init(&ctx_params);
    EXPECT_EQ(ctx_params.width, 512);
    EXPECT_EQ(ctx_params.context_dim, 768);
    EXPECT_EQ(ctx_params.rng_type, STD_DEFAULT_RNG);

    char* str = ddim_ctx_params_to_str(&ctx_params);
    ASSERT_NE(str, nullptr);
    EXPECT_NE(strstr(str, "rng_type: std_default"), nullptr);
    EXPECT_NE(strstr(str, "batch_cond_uncond: false"), nullptr);
    free(str);

    ddim_img_gen_params_t gen_params;
    ddim_img_gen_params_init(&gen_params);
    EXPECT_EQ(gen_params.sample_steps, 25);
    EXPECT_FLOAT_EQ(gen_params.guidance_scale, 7.5f);
    EXPECT_EQ(gen_params.seed, 42);
    str = ddim_img_gen_params_to_str(&gen_params);
    ASSERT_NE(str, nullptr);
    EXPECT_NE(strstr(str, "sample_steps: 25"), nullptr);
    free(str);
}
