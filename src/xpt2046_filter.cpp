#include "xpt2046_filter.h"

#include <algorithm>
#include <sstream>

namespace xpt2046 {

int reduce_samples(const std::vector<int>& values, int max_value, const char* axis) {
	std::vector<int> valid;
	valid.reserve(values.size());
	for (int v : values) {
		if (v >= 0 && v <= max_value) valid.push_back(v);
	}
	if (valid.size() < 2) {
		std::ostringstream msg;
		msg << "only " << valid.size() << " of " << values.size()
			<< " " << axis << " samples in range [0," << max_value << "]";
		throw SampleError(msg.str());
	}

	std::sort(valid.begin(), valid.end());
	size_t first = 0;
	size_t last = valid.size();
	if (valid.size() >= 3) {
		++first;
		--last;
	}

	long sum = 0;
	for (size_t i = first; i < last; ++i) sum += valid[i];
	const long count = (long)(last - first);
	return (int)((sum + count / 2) / count);
}

int pressure_from(int z1, int z2, int max_value) {
	if (z1 < 0 || z1 > max_value || z2 < 0 || z2 > max_value) return -1;
	return z1 + max_value - z2;
}

StableReading reduce_reading(const std::vector<TouchSample>& samples, int max_value) {
	std::vector<int> xs, ys, zs;
	xs.reserve(samples.size());
	ys.reserve(samples.size());
	zs.reserve(samples.size());
	for (const auto& s : samples) {
		xs.push_back(s.raw_x);
		ys.push_back(s.raw_y);
		zs.push_back(s.raw_z);
	}

	StableReading r;
	r.x = reduce_samples(xs, max_value, "x");
	r.y = reduce_samples(ys, max_value, "y");
	r.z = reduce_samples(zs, 2 * max_value, "z");
	return r;
}

} // namespace xpt2046
