#ifndef XPT2046_FILTER_H
#define XPT2046_FILTER_H

#include <stdexcept>
#include <string>
#include <vector>

namespace xpt2046 {

class SampleError : public std::runtime_error {
public:
	explicit SampleError(const std::string& what) : std::runtime_error(what) {}
};

// One X/Y/Z transaction set.
struct TouchSample {
	int raw_x = 0;
	int raw_y = 0;
	int raw_z = 0;
};

struct StableReading {
	int x = 0;
	int y = 0;
	int z = 0;
};

// Drops values outside [0, max_value], then the single minimum and maximum
// when at least three remain, and returns the rounded mean of the rest.
// Throws SampleError when fewer than two valid values are left.
int reduce_samples(const std::vector<int>& values, int max_value, const char* axis = "axis");

// Pressure from the two Z conversions; 0 with no contact, rising with force.
// Returns -1 when either conversion is out of range.
int pressure_from(int z1, int z2, int max_value);

// Per-axis reduction of a sample set. Z uses the range [0, 2 * max_value].
StableReading reduce_reading(const std::vector<TouchSample>& samples, int max_value);

} // namespace xpt2046

#endif // XPT2046_FILTER_H
