// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "pcm/FloatConvert.hxx"

#include <gtest/gtest.h>

#include <array>
#include <cstring>
#include <stdexcept>

template<typename T, std::size_t N>
static std::vector<float>
Convert(SampleFormat format, const std::array<T, N> &src)
{
	std::vector<float> dest;
	PcmAppendFloat(dest, format, std::as_bytes(std::span{src}));
	return dest;
}

TEST(FloatConvert, S8)
{
	const std::array<int8_t, 3> src{0, 64, -128};
	const auto dest = Convert(SampleFormat::S8, src);
	ASSERT_EQ(dest.size(), 3u);
	EXPECT_FLOAT_EQ(dest[0], 0.0f);
	EXPECT_FLOAT_EQ(dest[1], 0.5f);
	EXPECT_FLOAT_EQ(dest[2], -1.0f);
}

TEST(FloatConvert, S16)
{
	const std::array<int16_t, 4> src{0, 16384, -32768, 32767};
	const auto dest = Convert(SampleFormat::S16, src);
	ASSERT_EQ(dest.size(), 4u);
	EXPECT_FLOAT_EQ(dest[0], 0.0f);
	EXPECT_FLOAT_EQ(dest[1], 0.5f);
	EXPECT_FLOAT_EQ(dest[2], -1.0f);
	EXPECT_NEAR(dest[3], 1.0f, 1e-4);
}

TEST(FloatConvert, S24_P32)
{
	const std::array<int32_t, 2> src{1 << 22, -(1 << 23)};
	const auto dest = Convert(SampleFormat::S24_P32, src);
	ASSERT_EQ(dest.size(), 2u);
	EXPECT_FLOAT_EQ(dest[0], 0.5f);
	EXPECT_FLOAT_EQ(dest[1], -1.0f);
}

TEST(FloatConvert, S32)
{
	const std::array<int32_t, 2> src{1 << 30, INT32_MIN};
	const auto dest = Convert(SampleFormat::S32, src);
	ASSERT_EQ(dest.size(), 2u);
	EXPECT_FLOAT_EQ(dest[0], 0.5f);
	EXPECT_FLOAT_EQ(dest[1], -1.0f);
}

TEST(FloatConvert, FloatIsClamped)
{
	const std::array<float, 3> src{0.25f, 1.5f, -2.0f};
	const auto dest = Convert(SampleFormat::FLOAT, src);
	ASSERT_EQ(dest.size(), 3u);
	EXPECT_FLOAT_EQ(dest[0], 0.25f);
	EXPECT_FLOAT_EQ(dest[1], 1.0f);
	EXPECT_FLOAT_EQ(dest[2], -1.0f);
}

TEST(FloatConvert, Append)
{
	std::vector<float> dest{0.75f};
	const std::array<int16_t, 1> src{-16384};
	PcmAppendFloat(dest, SampleFormat::S16, std::as_bytes(std::span{src}));
	ASSERT_EQ(dest.size(), 2u);
	EXPECT_FLOAT_EQ(dest[0], 0.75f);
	EXPECT_FLOAT_EQ(dest[1], -0.5f);
}

TEST(FloatConvert, Unaligned)
{
	/* decoder buffers need not be aligned */
	std::array<std::byte, 5> buffer{};
	const int16_t value = 16384;
	memcpy(buffer.data() + 1, &value, sizeof(value));

	std::vector<float> dest;
	PcmAppendFloat(dest, SampleFormat::S16,
		       std::span<const std::byte>{buffer}.subspan(1, 2));
	ASSERT_EQ(dest.size(), 1u);
	EXPECT_FLOAT_EQ(dest[0], 0.5f);
}

TEST(FloatConvert, Errors)
{
	std::vector<float> dest;
	const std::array<std::byte, 3> odd{};

	EXPECT_THROW(PcmAppendFloat(dest, SampleFormat::S16, odd),
		     std::invalid_argument);
	EXPECT_THROW(PcmAppendFloat(dest, SampleFormat::UNDEFINED, odd),
		     std::invalid_argument);
	EXPECT_TRUE(dest.empty());
}
