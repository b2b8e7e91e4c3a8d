#ifndef __DDIM_H__
#define __DDIM_H__

#if defined(_WIN32) || defined(__CYGWIN__)
#ifndef DDIM_BUILD_SHARED_LIB
#define DDIM_API
#else
#ifdef DDIM_BUILD_DLL
#define DDIM_API __declspec(dllexport)
#else
#define DDIM_API __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define DDIM_API __attribute__((visibility("default")))
#else
#define DDIM_API
#endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

enum rng_type_t {
    STD_DEFAULT_RNG,
    CUDA_RNG,
    RNG_TYPE_COUNT
};

enum ddim_log_level_t {
    DDIM_LOG_DEBUG,
    DDIM_LOG_INFO,
    DDIM_LOG_WARN,
    DDIM_LOG_ERROR
};

enum ddim_status_t {
    DDIM_OK,
    DDIM_ERROR_VALIDATION,
    DDIM_ERROR_DOMAIN,
    DDIM_ERROR_SHAPE_MISMATCH,
    DDIM_ERROR_CONFIG,
    DDIM_ERROR_MODEL,
    DDIM_ERROR_CANCELLED,
    DDIM_ERROR_ALLOC,
    DDIM_STATUS_COUNT
};

enum ddim_tensor_type_t {
    DDIM_TENSOR_F32,
    DDIM_TENSOR_I32
};

// A borrowed view of a dense tensor. ne[] is innermost first, as in ggml:
// a latent [B, H/8, W/8, 4] is ne = {4, W/8, H/8, B}.
typedef struct {
    enum ddim_tensor_type_t type;
    int64_t ne[4];
    void* data;
} ddim_tensor_t;

// Writes at most max_tokens ids into tokens and returns how many ids the
// text encodes to (which may be larger than max_tokens), or -1 on failure.
typedef int (*ddim_tokenize_cb_t)(const char* text, int32_t* tokens, int max_tokens, void* data);

// Model callbacks receive an output view whose data buffer holds exactly the
// expected shape, with ne[] preset to that shape. A callback fills the buffer
// and leaves ne[] untouched, or rewrites ne[] to the shape it actually
// produced. It returns false on failure.
typedef bool (*ddim_encode_text_cb_t)(const ddim_tensor_t* input_ids,
                                      const ddim_tensor_t* position_ids,
                                      ddim_tensor_t* output,
                                      void* data);
typedef bool (*ddim_predict_noise_cb_t)(const ddim_tensor_t* x,
                                        const ddim_tensor_t* t_emb,
                                        const ddim_tensor_t* context,
                                        ddim_tensor_t* output,
                                        void* data);
typedef bool (*ddim_decode_cb_t)(const ddim_tensor_t* latent,
                                 ddim_tensor_t* output,
                                 void* data);

typedef struct {
    ddim_tokenize_cb_t tokenize;
    ddim_encode_text_cb_t encode_text;
    ddim_predict_noise_cb_t predict_noise;
    ddim_decode_cb_t decode;
    void* user_data;
} ddim_models_t;

typedef struct {
    int width;
    int height;
    int batch_size;
    int context_dim;
    int time_embed_dim;
    int n_threads;
    enum rng_type_t rng_type;
    bool batch_cond_uncond;
} ddim_ctx_params_t;

typedef struct {
    const char* prompt;
    int sample_steps;
    float guidance_scale;
    float temperature;
    float eta;
    int64_t seed;
} ddim_img_gen_params_t;

typedef struct {
    uint32_t width;
    uint32_t height;
    uint32_t channel;
    uint8_t* data;
} ddim_image_t;

typedef struct ddim_ctx_t ddim_ctx_t;

typedef void (*ddim_log_cb_t)(enum ddim_log_level_t level, const char* text, void* data);
typedef void (*ddim_progress_cb_t)(int step, int steps, float time, void* data);

DDIM_API void ddim_set_log_callback(ddim_log_cb_t ddim_log_cb, void* data);
DDIM_API void ddim_set_progress_callback(ddim_progress_cb_t cb, void* data);
DDIM_API int32_t get_num_physical_cores();

DDIM_API const char* ddim_status_name(enum ddim_status_t status);
DDIM_API const char* ddim_rng_type_name(enum rng_type_t rng_type);
DDIM_API enum rng_type_t str_to_rng_type(const char* str);

DDIM_API void ddim_ctx_params_init(ddim_ctx_params_t* ddim_ctx_params);
DDIM_API char* ddim_ctx_params_to_str(const ddim_ctx_params_t* ddim_ctx_params);

DDIM_API void ddim_img_gen_params_init(ddim_img_gen_params_t* ddim_img_gen_params);
DDIM_API char* ddim_img_gen_params_to_str(const ddim_img_gen_params_t* ddim_img_gen_params);

DDIM_API ddim_ctx_t* new_ddim_ctx(const ddim_ctx_params_t* ddim_ctx_params, const ddim_models_t* models);
DDIM_API void free_ddim_ctx(ddim_ctx_t* ddim_ctx);

// Returns batch_size images, or NULL on failure; ddim_last_status() tells why.
DDIM_API ddim_image_t* txt2img(ddim_ctx_t* ddim_ctx, const ddim_img_gen_params_t* ddim_img_gen_params);
DDIM_API void free_ddim_images(ddim_image_t* images, int count);

DDIM_API enum ddim_status_t ddim_last_status(const ddim_ctx_t* ddim_ctx);

// Stops a running txt2img() before its next step. Safe to call from another thread.
DDIM_API void ddim_request_cancel(ddim_ctx_t* ddim_ctx);

#ifdef __cplusplus
}
#endif

#endif  // __DDIM_H__
