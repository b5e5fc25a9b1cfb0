#include "xpt2046_transform.h"

#include <algorithm>
#include <cstdint>
#include <sstream>

namespace xpt2046 {

template <typename T>
static T clamp_val(T v, T lo, T hi) {
	return (v < lo) ? lo : ((v > hi) ? hi : v);
}

bool rotation_from_int(int value, Rotation& out) {
	switch (value) {
	case 0: out = Rotation::R0; return true;
	case 1: case 90: out = Rotation::R90; return true;
	case 2: case 180: out = Rotation::R180; return true;
	case 3: case 270: out = Rotation::R270; return true;
	default: return false;
	}
}

int rotation_degrees(Rotation r) {
	return (int)r * 90;
}

void validate(const CalibrationProfile& p) {
	std::ostringstream msg;
	if (p.x_min >= p.x_max) {
		msg << "x_min (" << p.x_min << ") must be below x_max (" << p.x_max << ")";
	} else if (p.y_min >= p.y_max) {
		msg << "y_min (" << p.y_min << ") must be below y_max (" << p.y_max << ")";
	} else if (p.width <= 0 || p.height <= 0) {
		msg << "panel size " << p.width << "x" << p.height << " is not positive";
	} else {
		return;
	}
	throw CalibrationError(msg.str());
}

int map_axis(int raw, int raw_min, int raw_max, int size) {
	// 64-bit throughout: any ordered int bounds are accepted
	const int64_t span = (int64_t)raw_max - raw_min;
	const int64_t scaled = ((int64_t)raw - raw_min) * size / span;
	return (int)clamp_val<int64_t>(scaled, 0, size - 1);
}

TouchPoint rotate(TouchPoint p, Rotation rotation, int width, int height) {
	TouchPoint out = p;
	switch (rotation) {
	case Rotation::R0:
		break;
	case Rotation::R90:
		out.x = p.y;
		out.y = width - 1 - p.x;
		break;
	case Rotation::R180:
		out.x = width - 1 - p.x;
		out.y = height - 1 - p.y;
		break;
	case Rotation::R270:
		out.x = height - 1 - p.y;
		out.y = p.x;
		break;
	}
	return out;
}

TouchPoint to_screen(const StableReading& reading, const CalibrationProfile& profile, int adc_max) {
	int x = reading.x;
	int y = reading.y;
	if (profile.swap_xy) std::swap(x, y);
	if (profile.invert_x) x = adc_max - x;
	if (profile.invert_y) y = adc_max - y;

	TouchPoint p;
	p.x = map_axis(x, profile.x_min, profile.x_max, profile.width);
	p.y = map_axis(y, profile.y_min, profile.y_max, profile.height);
	return rotate(p, profile.rotation, profile.width, profile.height);
}

int screen_width(const CalibrationProfile& profile) {
	bool swapped = profile.rotation == Rotation::R90 || profile.rotation == Rotation::R270;
	return swapped ? profile.height : profile.width;
}

int screen_height(const CalibrationProfile& profile) {
	bool swapped = profile.rotation == Rotation::R90 || profile.rotation == Rotation::R270;
	return swapped ? profile.width : profile.height;
}

} // namespace xpt2046
