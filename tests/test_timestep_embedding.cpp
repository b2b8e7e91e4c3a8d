#include <gtest/gtest.h>

#include <cmath>

#include "ggml_extend.hpp"

class TimestepEmbeddingTest : public ::testing::Test {
protected:
    struct ggml_context* ctx = NULL;

    void SetUp() override {
        struct ggml_init_params params;
        params.mem_size   = 4 * 1024 * 1024;
        params.mem_buffer = NULL;
        params.no_alloc   = false;
        ctx               = ggml_init(params);
        ASSERT_NE(ctx, nullptr);
    }

    void TearDown() override {
        ggml_free(ctx);
    }
};

TEST_F(TimestepEmbeddingTest, ZeroTimestepIsCosOnesThenSinZeros) {
    std::vector<float> embedding;
    ASSERT_TRUE(timestep_embedding({0.f}, embedding, 320));
    ASSERT_EQ(embedding.size(), 320u);
    for (int i = 0; i < 160; i++) {
        EXPECT_FLOAT_EQ(embedding[i], 1.f);
        EXPECT_FLOAT_EQ(embedding[i + 160], 0.f);
    }
}

TEST_F(TimestepEmbeddingTest, FollowsSinusoidalFormula) {
    const int dim  = 320;
    const int half = dim / 2;
    std::vector<float> embedding;
    ASSERT_TRUE(timestep_embedding({981.f}, embedding, dim));
    for (int i = 0; i < half; i++) {
        double freq = std::exp(-std::log(10000.0) * i / half);
        double arg  = 981.0 * freq;
        EXPECT_NEAR(embedding[i], std::cos(arg), 1e-4) << "i = " << i;
        EXPECT_NEAR(embedding[i + half], std::sin(arg), 1e-4) << "i = " << i;
    }
    EXPECT_NEAR(embedding[0], std::cos(981.0), 1e-5);
    EXPECT_NEAR(embedding[half], std::sin(981.0), 1e-5);
}

TEST_F(TimestepEmbeddingTest, OddDimIsRejected) {
    std::vector<float> embedding;
    EXPECT_FALSE(timestep_embedding({1.f}, embedding, 321));
    EXPECT_FALSE(timestep_embedding({1.f}, embedding, 0));
    EXPECT_EQ(new_timestep_embedding(ctx, {1.f}, 7), nullptr);
}

TEST_F(TimestepEmbeddingTest, OneRowPerBatchEntry) {
    struct ggml_tensor* emb = new_timestep_embedding(ctx, {1.f, 501.f, 1.f}, 320);
    ASSERT_NE(emb, nullptr);
    EXPECT_EQ(emb->ne[0], 320);
    EXPECT_EQ(emb->ne[1], 3);
    const float* data = (const float*)emb->data;
    for (int i = 0; i < 320; i++) {
        EXPECT_EQ(data[i], data[2 * 320 + i]);
    }
    EXPECT_NE(data[160], data[320 + 160]);

    std::vector<float> single;
    ASSERT_TRUE(timestep_embedding({501.f}, single, 320));
    for (int i = 0; i < 320; i++) {
        EXPECT_EQ(data[320 + i], single[i]);
    }
}

TEST_F(TimestepEmbeddingTest, SetRejectsMismatchedTensor) {
    struct ggml_tensor* emb = ggml_new_tensor_2d(ctx, GGML_TYPE_F32, 320, 2);
    EXPECT_FALSE(set_timestep_embedding({1.f}, emb, 320));
    EXPECT_FALSE(set_timestep_embedding({1.f, 2.f}, emb, 160));
    EXPECT_TRUE(set_timestep_embedding({1.f, 2.f}, emb, 320));
}
