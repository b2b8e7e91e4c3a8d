#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "pipeline.hpp"

#include "ddim.h"
#include "util.h"

const char* rng_type_to_str[] = {
    "std_default",
    "cuda",
};

const char* status_to_str[] = {
    "ok",
    "validation error",
    "domain error",
    "shape mismatch",
    "configuration error",
    "model error",
    "cancelled",
    "allocation error",
};

const char* ddim_rng_type_name(enum rng_type_t rng_type) {
    if (rng_type < RNG_TYPE_COUNT) {
        return rng_type_to_str[rng_type];
    }
    return NULL;
}

enum rng_type_t str_to_rng_type(const char* str) {
    if (str == NULL) {
        return RNG_TYPE_COUNT;
    }
    for (int i = 0; i < RNG_TYPE_COUNT; i++) {
        if (!strcmp(str, rng_type_to_str[i])) {
            return (enum rng_type_t)i;
        }
    }
    return RNG_TYPE_COUNT;
}

const char* ddim_status_name(enum ddim_status_t status) {
    if (status < DDIM_STATUS_COUNT) {
        return status_to_str[status];
    }
    return "unknown";
}

void ddim_ctx_params_init(ddim_ctx_params_t* ddim_ctx_params) {
    *ddim_ctx_params                   = {};
    ddim_ctx_params->width             = 512;
    ddim_ctx_params->height            = 512;
    ddim_ctx_params->batch_size        = 1;
    ddim_ctx_params->context_dim       = 768;
    ddim_ctx_params->time_embed_dim    = 320;
    ddim_ctx_params->n_threads         = get_num_physical_cores();
    ddim_ctx_params->rng_type          = STD_DEFAULT_RNG;
    ddim_ctx_params->batch_cond_uncond = false;
}

char* ddim_ctx_params_to_str(const ddim_ctx_params_t* ddim_ctx_params) {
    char* buf = (char*)malloc(4096);
    if (!buf)
        return NULL;
    buf[0] = '\0';

    snprintf(buf + strlen(buf), 4096 - strlen(buf),
             "width: %d\n"
             "height: %d\n"
             "batch_size: %d\n"
             "context_dim: %d\n"
             "time_embed_dim: %d\n"
             "n_threads: %d\n"
             "rng_type: %s\n"
             "batch_cond_uncond: %s\n",
             ddim_ctx_params->width,
             ddim_ctx_params->height,
             ddim_ctx_params->batch_size,
             ddim_ctx_params->context_dim,
             ddim_ctx_params->time_embed_dim,
             ddim_ctx_params->n_threads,
             ddim_rng_type_name(ddim_ctx_params->rng_type),
             BOOL_STR(ddim_ctx_params->batch_cond_uncond));

    return buf;
}

void ddim_img_gen_params_init(ddim_img_gen_params_t* ddim_img_gen_params) {
    *ddim_img_gen_params                = {};
    ddim_img_gen_params->prompt         = "";
    ddim_img_gen_params->sample_steps   = 25;
    ddim_img_gen_params->guidance_scale = 7.5f;
    ddim_img_gen_params->temperature    = 1.0f;
    ddim_img_gen_params->eta            = 0.0f;
    ddim_img_gen_params->seed           = 42;
}

char* ddim_img_gen_params_to_str(const ddim_img_gen_params_t* ddim_img_gen_params) {
    char* buf = (char*)malloc(4096);
    if (!buf)
        return NULL;
    buf[0] = '\0';

    snprintf(buf + strlen(buf), 4096 - strlen(buf),
             "prompt: %s\n"
             "sample_steps: %d\n"
             "guidance_scale: %.2f\n"
             "temperature: %.2f\n"
             "eta: %.2f\n"
             "seed: %" PRId64 "\n",
             SAFE_STR(ddim_img_gen_params->prompt),
             ddim_img_gen_params->sample_steps,
             ddim_img_gen_params->guidance_scale,
             ddim_img_gen_params->temperature,
             ddim_img_gen_params->eta,
             ddim_img_gen_params->seed);

    return buf;
}

/*================================================= DDIM API ==================================================*/

struct ddim_ctx_t {
    DDIMPipeline* ddim = NULL;
};

ddim_ctx_t* new_ddim_ctx(const ddim_ctx_params_t* ddim_ctx_params, const ddim_models_t* models) {
    if (ddim_ctx_params == NULL || models == NULL) {
        LOG_ERROR("new_ddim_ctx needs params and models");
        return NULL;
    }
    if (models->tokenize == NULL || models->encode_text == NULL ||
        models->predict_noise == NULL || models->decode == NULL) {
        LOG_ERROR("all of tokenize, encode_text, predict_noise and decode callbacks are required");
        return NULL;
    }

    ddim_ctx_t* ddim_ctx = (ddim_ctx_t*)malloc(sizeof(ddim_ctx_t));
    if (ddim_ctx == NULL) {
        return NULL;
    }

    ddim_ctx->ddim = new DDIMPipeline(*ddim_ctx_params,
                                      std::make_shared<CallbackTokenizer>(models->tokenize, models->user_data),
                                      std::make_shared<CallbackTextEncoder>(models->encode_text, models->user_data),
                                      std::make_shared<CallbackDiffusionModel>(models->predict_noise, models->user_data),
                                      std::make_shared<CallbackImageDecoder>(models->decode, models->user_data));
    if (ddim_ctx->ddim->init() != DDIM_OK) {
        delete ddim_ctx->ddim;
        ddim_ctx->ddim = NULL;
        free(ddim_ctx);
        return NULL;
    }
    return ddim_ctx;
}

void free_ddim_ctx(ddim_ctx_t* ddim_ctx) {
    if (ddim_ctx != NULL) {
        if (ddim_ctx->ddim != NULL) {
            delete ddim_ctx->ddim;
            ddim_ctx->ddim = NULL;
        }
        free(ddim_ctx);
    }
}

ddim_image_t* txt2img(ddim_ctx_t* ddim_ctx, const ddim_img_gen_params_t* ddim_img_gen_params) {
    if (ddim_ctx == NULL || ddim_img_gen_params == NULL) {
        return NULL;
    }
    DDIMPipeline* ddim = ddim_ctx->ddim;
    int width          = ddim->params.width;
    int height         = ddim->params.height;
    int batch_count    = ddim->params.batch_size;
    LOG_DEBUG("txt2img %dx%d", width, height);

    std::vector<uint8_t> pixels;
    if (ddim->generate(*ddim_img_gen_params, pixels) != DDIM_OK) {
        return NULL;
    }

    ddim_image_t* result_images = (ddim_image_t*)calloc(batch_count, sizeof(ddim_image_t));
    if (result_images == NULL) {
        LOG_ERROR("allocating %d result images failed", batch_count);
        ddim->fail(DDIM_ERROR_ALLOC);
        return NULL;
    }
    size_t image_size = (size_t)width * height * 3;
    for (int i = 0; i < batch_count; i++) {
        result_images[i].width   = width;
        result_images[i].height  = height;
        result_images[i].channel = 3;
        result_images[i].data    = (uint8_t*)malloc(image_size);
        if (result_images[i].data == NULL) {
            LOG_ERROR("allocating result image %d failed", i);
            free_ddim_images(result_images, i);
            ddim->fail(DDIM_ERROR_ALLOC);
            return NULL;
        }
        memcpy(result_images[i].data, pixels.data() + i * image_size, image_size);
    }
    return result_images;
}

void free_ddim_images(ddim_image_t* images, int count) {
    if (images == NULL) {
        return;
    }
    for (int i = 0; i < count; i++) {
        free(images[i].data);
        images[i].data = NULL;
    }
    free(images);
}

enum ddim_status_t ddim_last_status(const ddim_ctx_t* ddim_ctx) {
    if (ddim_ctx == NULL || ddim_ctx->ddim == NULL) {
        return DDIM_ERROR_CONFIG;
    }
    return ddim_ctx->ddim->get_last_status();
}

void ddim_request_cancel(ddim_ctx_t* ddim_ctx) {
    if (ddim_ctx != NULL && ddim_ctx->ddim != NULL) {
        ddim_ctx->ddim->request_cancel();
    }
}
