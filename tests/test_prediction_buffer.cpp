#include <gtest/gtest.h>
#include "../src/prediction_buffer.hpp"

TEST(PredictionBuffer, ShortFinalBatchKeepsExactCount) {
	// 10 rows in batches of 4: 4 + 4 + 2
	PredictionBuffer buffer(3, 4);
	EXPECT_EQ(buffer.Capacity(), 12u);
	buffer.Write(0, torch::arange(0, 4, torch::kFloat));
	buffer.Write(1, torch::arange(4, 8, torch::kFloat));
	buffer.Write(2, torch::arange(8, 10, torch::kFloat));

	auto values = buffer.Collect();
	ASSERT_EQ(values.size(), 10u);
	for (size_t i = 0; i < values.size(); ++i) {
		EXPECT_FLOAT_EQ(values[i], (float)i);
	}
	EXPECT_EQ(buffer.NumValid(), 10u);
}

TEST(PredictionBuffer, ValuesThatLookLikeSentinelsSurvive) {
	PredictionBuffer buffer(2, 2);
	buffer.Write(0, torch::tensor({-1.f, -1.f}));
	buffer.Write(1, torch::tensor({-1.f}));
	auto values = buffer.Collect();
	ASSERT_EQ(values.size(), 3u);
	EXPECT_FLOAT_EQ(values[2], -1.f);
}

TEST(PredictionBuffer, UnwrittenBufferIsEmpty) {
	PredictionBuffer buffer(4, 8);
	EXPECT_TRUE(buffer.Collect().empty());
}
