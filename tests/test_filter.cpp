#include "xpt2046_filter.h"

#include <gtest/gtest.h>

using namespace xpt2046;

TEST(ReduceSamples, RejectsOutlierFromFive) {
	// median of {10, 11, 12, 13} as the controller-side sort picks it
	EXPECT_EQ(12, reduce_samples({10, 12, 11, 500, 13}, 4095));
}

TEST(ReduceSamples, DropsSingleMinAndMax) {
	EXPECT_EQ(100, reduce_samples({0, 100, 4095}, 4095));
	EXPECT_EQ(101, reduce_samples({90, 100, 102, 3000}, 4095));
}

TEST(ReduceSamples, AveragesWhenFewerThanThree) {
	EXPECT_EQ(15, reduce_samples({10, 20}, 4095));
	EXPECT_EQ(11, reduce_samples({10, 11}, 4095));
}

TEST(ReduceSamples, DiscardsOutOfRangeBeforeTrimming) {
	// 8191 and -1 are dropped first, leaving {100, 110, 120}
	EXPECT_EQ(110, reduce_samples({100, 8191, 110, -1, 120}, 4095));
	// only two valid left: averaged without trimming
	EXPECT_EQ(105, reduce_samples({100, 8191, 110}, 4095));
}

TEST(ReduceSamples, TooFewValidSamplesThrow) {
	EXPECT_THROW(reduce_samples({100, 5000, 6000}, 4095), SampleError);
	EXPECT_THROW(reduce_samples({}, 4095), SampleError);
	EXPECT_THROW(reduce_samples({7}, 4095), SampleError);
}

TEST(ReduceSamples, Deterministic) {
	const std::vector<int> raw = {812, 799, 805, 1500, 801};
	const int first = reduce_samples(raw, 4095);
	for (int i = 0; i < 10; ++i) EXPECT_EQ(first, reduce_samples(raw, 4095));
}

TEST(ReduceSamples, OrderDoesNotMatter) {
	EXPECT_EQ(reduce_samples({5, 9, 7, 3, 11}, 4095), reduce_samples({11, 3, 7, 9, 5}, 4095));
}

TEST(Pressure, RisesWithZ1AndFallsWithZ2) {
	EXPECT_EQ(0, pressure_from(0, 4095, 4095));
	EXPECT_LT(pressure_from(300, 3500, 4095), pressure_from(600, 3500, 4095));
	EXPECT_LT(pressure_from(600, 3500, 4095), pressure_from(600, 3000, 4095));
}

TEST(Pressure, OutOfRangeConversionIsInvalid) {
	EXPECT_EQ(-1, pressure_from(5000, 100, 4095));
	EXPECT_EQ(-1, pressure_from(100, -1, 4095));
}

TEST(ReduceReading, EachAxisIndependently) {
	std::vector<TouchSample> set(3);
	set[0].raw_x = 1000; set[0].raw_y = 2000; set[0].raw_z = 900;
	set[1].raw_x = 1010; set[1].raw_y = 9000; set[1].raw_z = 950;
	set[2].raw_x = 1020; set[2].raw_y = 2010; set[2].raw_z = 1000;

	StableReading r = reduce_reading(set, 4095);
	EXPECT_EQ(1010, r.x);
	EXPECT_EQ(2005, r.y);
	EXPECT_EQ(950, r.z);
}

TEST(ReduceReading, InvalidPressureSamplesAreDropped) {
	std::vector<TouchSample> set(3);
	set[0].raw_z = -1;
	set[1].raw_z = -1;
	set[2].raw_z = 700;
	EXPECT_THROW(reduce_reading(set, 4095), SampleError);
}
