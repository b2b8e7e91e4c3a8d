#ifndef __PIPELINE_HPP__
#define __PIPELINE_HPP__

#include <atomic>
#include <cinttypes>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include "conditioner.hpp"
#include "diffusion_model.hpp"
#include "guidance.hpp"
#include "rng.hpp"
#include "rng_philox.hpp"
#include "sampler.hpp"
#include "schedule.hpp"
#include "vae.hpp"

#define LATENT_CHANNELS 4

enum pipeline_state_t {
    PIPELINE_IDLE,
    PIPELINE_CONTEXT_BUILT,
    PIPELINE_SAMPLING,
    PIPELINE_DECODED,
    PIPELINE_DONE,
    PIPELINE_FAILED,
};

__STATIC_INLINE__ const char* pipeline_state_name(pipeline_state_t state) {
    switch (state) {
        case PIPELINE_IDLE:
            return "idle";
        case PIPELINE_CONTEXT_BUILT:
            return "context_built";
        case PIPELINE_SAMPLING:
            return "sampling";
        case PIPELINE_DECODED:
            return "decoded";
        case PIPELINE_DONE:
            return "done";
        case PIPELINE_FAILED:
            return "failed";
    }
    return "unknown";
}

/*================================================= DDIMPipeline ================================================*/

class DDIMPipeline {
public:
    ddim_ctx_params_t params;
    int n_threads = -1;

    std::shared_ptr<RNG> rng = std::make_shared<STDDefaultRNG>();
    std::shared_ptr<TextConditioner> cond_stage_model;
    std::shared_ptr<DiffusionModel> diffusion_model;
    std::shared_ptr<ImageDecoder> first_stage_model;

protected:
    std::atomic<bool> cancel_requested{false};
    std::atomic<int> state{PIPELINE_IDLE};
    std::atomic<int> sampled_steps{0};
    ddim_status_t last_status = DDIM_OK;

public:
    DDIMPipeline(const ddim_ctx_params_t& params,
                 std::shared_ptr<Tokenizer> tokenizer,
                 std::shared_ptr<TextEncoder> text_encoder,
                 std::shared_ptr<DiffusionModel> diffusion_model,
                 std::shared_ptr<ImageDecoder> image_decoder)
        : params(params),
          diffusion_model(diffusion_model),
          first_stage_model(image_decoder) {
        cond_stage_model = std::make_shared<TextConditioner>(tokenizer, text_encoder, params.context_dim);
    }

    ddim_status_t init() {
        ddim_status_t status = validate_params();
        if (status != DDIM_OK) {
            last_status = status;
            return status;
        }
        n_threads = params.n_threads;
        if (n_threads <= 0) {
            n_threads = get_num_physical_cores();
        }
        if (params.rng_type == STD_DEFAULT_RNG) {
            rng = std::make_shared<STDDefaultRNG>();
        } else if (params.rng_type == CUDA_RNG) {
            rng = std::make_shared<PhiloxRNG>();
        }
        LOG_INFO("DDIM pipeline: %dx%d, batch %d, context dim %d, rng %s%s",
                 params.width, params.height, params.batch_size, params.context_dim,
                 ddim_rng_type_name(params.rng_type),
                 params.batch_cond_uncond ? ", batched guidance" : "");
        return DDIM_OK;
    }

    ddim_status_t validate_params() const {
        if (cond_stage_model->tokenizer == nullptr || cond_stage_model->text_encoder == nullptr ||
            diffusion_model == nullptr || first_stage_model == nullptr) {
            LOG_ERROR("tokenizer, text encoder, noise predictor and image decoder are all required");
            return DDIM_ERROR_CONFIG;
        }
        if (params.width <= 0 || params.height <= 0 ||
            params.width % VAE_SCALE_FACTOR != 0 || params.height % VAE_SCALE_FACTOR != 0) {
            LOG_ERROR("width and height must be positive multiples of %d, got %dx%d",
                      VAE_SCALE_FACTOR, params.width, params.height);
            return DDIM_ERROR_CONFIG;
        }
        if (params.batch_size <= 0) {
            LOG_ERROR("batch_size must be positive, got %d", params.batch_size);
            return DDIM_ERROR_CONFIG;
        }
        if (params.context_dim <= 0) {
            LOG_ERROR("context_dim must be positive, got %d", params.context_dim);
            return DDIM_ERROR_CONFIG;
        }
        if (params.time_embed_dim <= 0 || params.time_embed_dim % 2 != 0) {
            LOG_ERROR("time_embed_dim must be a positive even number, got %d", params.time_embed_dim);
            return DDIM_ERROR_VALIDATION;
        }
        if (params.rng_type != STD_DEFAULT_RNG && params.rng_type != CUDA_RNG) {
            LOG_ERROR("unknown rng type %d", (int)params.rng_type);
            return DDIM_ERROR_CONFIG;
        }
        return DDIM_OK;
    }

    pipeline_state_t get_state() const {
        return (pipeline_state_t)state.load();
    }

    ddim_status_t get_last_status() const {
        return last_status;
    }

    // steps completed by the current or last run
    int get_sampled_steps() const {
        return sampled_steps.load();
    }

    void request_cancel() {
        cancel_requested = true;
    }

    int latent_width() const {
        return params.width / VAE_SCALE_FACTOR;
    }

    int latent_height() const {
        return params.height / VAE_SCALE_FACTOR;
    }

    struct ggml_tensor* new_latent(struct ggml_context* work_ctx, int batch) const {
        return ggml_new_tensor_4d(work_ctx, GGML_TYPE_F32, LATENT_CHANNELS, latent_width(), latent_height(), batch);
    }

    size_t work_ctx_size() const {
        size_t B            = params.batch_size;
        size_t latent_bytes = LATENT_CHANNELS * latent_width() * latent_height() * B * sizeof(float);
        size_t ctx_bytes    = (size_t)params.context_dim * DDIM_MAX_TEXT_LEN * B * sizeof(float);
        size_t ids_bytes    = DDIM_MAX_TEXT_LEN * (B + 1) * sizeof(int32_t);
        size_t image_bytes  = 3 * (size_t)params.width * params.height * B * sizeof(float);

        size_t mem_size = 4 * ids_bytes + 2 * ctx_bytes + 6 * latent_bytes + image_bytes;
        if (params.batch_cond_uncond) {
            mem_size += 2 * ctx_bytes + 4 * latent_bytes;
        }
        // encoders and the decoder may allocate their own outputs in work_ctx
        mem_size += 2 * ctx_bytes + image_bytes;
        mem_size += 64 * (ggml_tensor_overhead() + GGML_MEM_ALIGN);
        mem_size += 1024 * 1024;
        return mem_size;
    }

    size_t step_ctx_size() const {
        size_t rows         = params.batch_cond_uncond ? 2 * params.batch_size : params.batch_size;
        size_t latent_bytes = LATENT_CHANNELS * latent_width() * latent_height() * rows * sizeof(float);
        size_t t_emb_bytes  = (size_t)params.time_embed_dim * rows * sizeof(float);
        // room for predictors that return their own output tensors
        size_t mem_size = 2 * t_emb_bytes + 4 * latent_bytes;
        mem_size += 32 * (ggml_tensor_overhead() + GGML_MEM_ALIGN);
        mem_size += 1024 * 1024;
        return mem_size;
    }

    ddim_status_t predict_noise(const char* call_name,
                                struct ggml_tensor* x,
                                struct ggml_tensor* t_emb,
                                struct ggml_tensor* context,
                                struct ggml_tensor* out_buffer,
                                struct ggml_context* step_ctx,
                                struct ggml_tensor** result) {
        struct ggml_tensor* out = out_buffer;
        if (!diffusion_model->compute(n_threads, x, t_emb, context, &out, step_ctx)) {
            LOG_ERROR("%s failed", call_name);
            return DDIM_ERROR_MODEL;
        }
        if (out == NULL || out->type != GGML_TYPE_F32 || !ggml_are_same_shape(out, out_buffer)) {
            LOG_ERROR("%s returned %s, expected %s",
                      call_name, ggml_tensor_shape_str(out).c_str(), ggml_tensor_shape_str(out_buffer).c_str());
            return DDIM_ERROR_SHAPE_MISMATCH;
        }
        *result = out;
        return DDIM_OK;
    }

    // Runs the reverse process over the schedule, highest timestep first.
    // x: initial noise on entry, final latent on success
    ddim_status_t sample(struct ggml_context* work_ctx,
                         struct ggml_tensor* x,
                         struct ggml_tensor* cond,
                         struct ggml_tensor* uncond,
                         const AlphaSchedule& schedule,
                         float cfg_scale,
                         float temperature,
                         float eta) {
        LOG_DEBUG("Sample");
        DDIMSampler sampler(rng);
        ddim_status_t status = sampler.set_eta(eta);
        if (status != DDIM_OK) {
            return status;
        }

        struct ggml_init_params params_step_ctx;
        params_step_ctx.mem_size   = step_ctx_size();
        params_step_ctx.mem_buffer = NULL;
        params_step_ctx.no_alloc   = false;
        struct ggml_context* step_ctx = ggml_init(params_step_ctx);
        if (!step_ctx) {
            LOG_ERROR("ggml_init() failed for step_ctx");
            return DDIM_ERROR_ALLOC;
        }
        status = sample_loop(work_ctx, step_ctx, sampler, x, cond, uncond, schedule, cfg_scale, temperature);
        diffusion_model->free_compute_buffer();
        ggml_free(step_ctx);
        return status;
    }

    ddim_status_t decode_first_stage(struct ggml_context* work_ctx,
                                     struct ggml_tensor* x,
                                     struct ggml_tensor** decoded) {
        int64_t t0                   = ggml_time_ms();
        struct ggml_tensor* result   = ggml_new_tensor_4d(work_ctx, GGML_TYPE_F32, 3,
                                                          x->ne[1] * VAE_SCALE_FACTOR,
                                                          x->ne[2] * VAE_SCALE_FACTOR,
                                                          x->ne[3]);
        struct ggml_tensor* expected = result;
        if (!first_stage_model->compute(n_threads, x, &result, work_ctx)) {
            LOG_ERROR("decode failed");
            return DDIM_ERROR_MODEL;
        }
        if (result == NULL || result->type != GGML_TYPE_F32 || !ggml_are_same_shape(result, expected)) {
            LOG_ERROR("decode returned %s, expected %s",
                      ggml_tensor_shape_str(result).c_str(), ggml_tensor_shape_str(expected).c_str());
            return DDIM_ERROR_SHAPE_MISMATCH;
        }
        int64_t t1 = ggml_time_ms();
        LOG_DEBUG("computing vae [mode: DECODE] completed, taking %.2fs", (t1 - t0) * 1.0f / 1000);
        *decoded = result;
        return DDIM_OK;
    }

    // image: batch_size * height * width * 3 bytes on success, empty otherwise
    ddim_status_t generate(const ddim_img_gen_params_t& gen_params, std::vector<uint8_t>& image) {
        image.clear();
        cancel_requested = false;
        sampled_steps    = 0;
        state            = PIPELINE_IDLE;

        struct ggml_init_params params_work_ctx;
        params_work_ctx.mem_size   = work_ctx_size();
        params_work_ctx.mem_buffer = NULL;
        params_work_ctx.no_alloc   = false;

        struct ggml_context* work_ctx = ggml_init(params_work_ctx);
        if (!work_ctx) {
            LOG_ERROR("ggml_init() failed for work_ctx");
            return fail(DDIM_ERROR_ALLOC);
        }
        int64_t t0           = ggml_time_ms();
        ddim_status_t status = generate_with_ctx(work_ctx, gen_params, image);
        ggml_free(work_ctx);
        if (status != DDIM_OK) {
            image.clear();
            return fail(status);
        }
        int64_t t1 = ggml_time_ms();
        LOG_INFO("txt2img completed in %.2fs", (t1 - t0) * 1.0f / 1000);
        state       = PIPELINE_DONE;
        last_status = DDIM_OK;
        return DDIM_OK;
    }

    ddim_status_t fail(ddim_status_t status) {
        pipeline_state_t failed_in = get_state();
        state                      = PIPELINE_FAILED;
        last_status                = status;
        LOG_ERROR("generation failed in state %s: %s", pipeline_state_name(failed_in), ddim_status_name(status));
        return status;
    }

protected:
    ddim_status_t generate_with_ctx(struct ggml_context* work_ctx,
                                    const ddim_img_gen_params_t& gen_params,
                                    std::vector<uint8_t>& image) {
        std::string prompt = gen_params.prompt != NULL ? gen_params.prompt : "";
        if (!(gen_params.guidance_scale >= 0.f)) {
            LOG_ERROR("guidance_scale must be >= 0, got %f", gen_params.guidance_scale);
            return DDIM_ERROR_CONFIG;
        }
        if (!(gen_params.temperature >= 0.f)) {
            LOG_ERROR("temperature must be >= 0, got %f", gen_params.temperature);
            return DDIM_ERROR_CONFIG;
        }
        if (!(gen_params.eta >= 0.f && gen_params.eta <= 1.f)) {
            LOG_ERROR("eta must be in [0, 1], got %f", gen_params.eta);
            return DDIM_ERROR_CONFIG;
        }
        AlphaSchedule schedule;
        ddim_status_t status = schedule.init(gen_params.sample_steps);
        if (status != DDIM_OK) {
            return status;
        }

        int64_t seed = gen_params.seed;
        if (seed < 0) {
            srand((int)time(NULL));
            seed = rand();
        }

        LOG_DEBUG("prompt: \"%s\"", prompt.c_str());

        // Get learned condition
        int64_t t0                 = ggml_time_ms();
        int batch                  = params.batch_size;
        struct ggml_tensor* cond   = NULL;
        struct ggml_tensor* uncond = NULL;
        status = cond_stage_model->get_learned_condition(work_ctx, n_threads, prompt, batch, &cond);
        if (status != DDIM_OK) {
            return status;
        }
        status = cond_stage_model->get_unconditional_condition(work_ctx, n_threads, batch, &uncond);
        if (status != DDIM_OK) {
            return status;
        }
        state      = PIPELINE_CONTEXT_BUILT;
        int64_t t1 = ggml_time_ms();
        LOG_INFO("get_learned_condition completed, taking %" PRId64 " ms", t1 - t0);

        LOG_INFO("sampling using DDIM method, %zu steps, cfg_scale %.2f, eta %.2f, seed %" PRId64,
                 schedule.size(), gen_params.guidance_scale, gen_params.eta, seed);
        rng->manual_seed(seed);
        struct ggml_tensor* x = new_latent(work_ctx, batch);
        ggml_tensor_set_f32_randn(x, rng);

        state  = PIPELINE_SAMPLING;
        status = sample(work_ctx, x, cond, uncond, schedule,
                        gen_params.guidance_scale, gen_params.temperature, gen_params.eta);
        if (status != DDIM_OK) {
            return status;
        }
        int64_t t2 = ggml_time_ms();
        LOG_INFO("sampling completed, taking %.2fs", (t2 - t1) * 1.0f / 1000);

        struct ggml_tensor* decoded = NULL;
        status = decode_first_stage(work_ctx, x, &decoded);
        if (status != DDIM_OK) {
            return status;
        }
        state = PIPELINE_DECODED;
        decoded_tensor_to_image(decoded, image);
        int64_t t3 = ggml_time_ms();
        LOG_INFO("decode_first_stage completed, taking %.2fs", (t3 - t2) * 1.0f / 1000);
        return DDIM_OK;
    }

    ddim_status_t sample_loop(struct ggml_context* work_ctx,
                              struct ggml_context* step_ctx,
                              DDIMSampler& sampler,
                              struct ggml_tensor* x,
                              struct ggml_tensor* cond,
                              struct ggml_tensor* uncond,
                              const AlphaSchedule& schedule,
                              float cfg_scale,
                              float temperature) {
        if (!ggml_are_same_shape(cond, uncond)) {
            LOG_ERROR("context %s and unconditional context %s differ",
                      ggml_tensor_shape_str(cond).c_str(), ggml_tensor_shape_str(uncond).c_str());
            return DDIM_ERROR_SHAPE_MISMATCH;
        }
        if (cond->ne[2] != x->ne[3]) {
            LOG_ERROR("context batch %" PRId64 " does not match latent batch %" PRId64, cond->ne[2], x->ne[3]);
            return DDIM_ERROR_SHAPE_MISMATCH;
        }
        int batch             = (int)x->ne[3];
        bool batched          = params.batch_cond_uncond;
        int steps             = (int)schedule.size();
        std::string timesteps = "";
        for (int i = steps - 1; i >= 0; i--) {
            timesteps += std::to_string(schedule.timesteps[i]) + (i > 0 ? ", " : "");
        }
        LOG_DEBUG("timesteps: %s", timesteps.c_str());

        struct ggml_tensor* pred_x0     = ggml_dup_tensor(work_ctx, x);
        struct ggml_tensor* e_t         = ggml_dup_tensor(work_ctx, x);
        struct ggml_tensor* noise       = sampler.get_eta() > 0.f ? ggml_dup_tensor(work_ctx, x) : NULL;
        struct ggml_tensor* out_cond    = NULL;
        struct ggml_tensor* out_uncond  = NULL;
        struct ggml_tensor* x_batched   = NULL;
        struct ggml_tensor* out_batched = NULL;
        struct ggml_tensor* c_batched   = NULL;
        if (batched) {
            x_batched   = new_latent(work_ctx, 2 * batch);
            out_batched = new_latent(work_ctx, 2 * batch);
            c_batched   = ggml_concat_batch(work_ctx, uncond, cond, 2);
            if (c_batched == NULL) {
                return DDIM_ERROR_SHAPE_MISMATCH;
            }
        } else {
            out_cond   = ggml_dup_tensor(work_ctx, x);
            out_uncond = ggml_dup_tensor(work_ctx, x);
        }

        pretty_progress(0, steps, 0);
        for (int i = steps - 1; i >= 0; i--) {
            if (cancel_requested) {
                LOG_WARN("sampling cancelled after %d/%d steps", steps - 1 - i, steps);
                return DDIM_ERROR_CANCELLED;
            }
            int64_t t0 = ggml_time_us();
            ggml_reset(step_ctx);

            int timestep = schedule.timesteps[i];
            LOG_DEBUG("step %d/%d, timestep %d", steps - i, steps, timestep);

            ddim_status_t status;
            int rows = batched ? 2 * batch : batch;
            std::vector<float> timesteps_vec(rows, (float)timestep);
            struct ggml_tensor* t_emb = new_timestep_embedding(step_ctx, timesteps_vec, params.time_embed_dim);
            if (t_emb == NULL) {
                return DDIM_ERROR_VALIDATION;
            }

            if (batched) {
                size_t half = ggml_nbytes(x);
                memcpy(x_batched->data, x->data, half);
                memcpy((char*)x_batched->data + half, x->data, half);
                struct ggml_tensor* out = NULL;
                status = predict_noise("predict_noise(batched)", x_batched, t_emb, c_batched, out_batched, step_ctx, &out);
                if (status != DDIM_OK) {
                    return status;
                }
                status = combine_guidance_batched(out, cfg_scale, e_t);
            } else {
                struct ggml_tensor* negative = NULL;
                struct ggml_tensor* positive = NULL;
                status = predict_noise("predict_noise(unconditional)", x, t_emb, uncond, out_uncond, step_ctx, &negative);
                if (status != DDIM_OK) {
                    return status;
                }
                status = predict_noise("predict_noise(conditional)", x, t_emb, cond, out_cond, step_ctx, &positive);
                if (status != DDIM_OK) {
                    return status;
                }
                status = combine_guidance(negative, positive, cfg_scale, e_t);
            }
            if (status != DDIM_OK) {
                return status;
            }

            status = sampler.step(x, e_t, schedule.alphas[i], schedule.alphas_prev[i], temperature, x, pred_x0, noise);
            if (status != DDIM_OK) {
                return status;
            }

            sampled_steps++;
            int64_t t1 = ggml_time_us();
            pretty_progress(steps - i, steps, (t1 - t0) / 1000000.f);
        }
        return DDIM_OK;
    }
};

#endif  // __PIPELINE_HPP__
