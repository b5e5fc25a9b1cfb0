#ifndef XPT2046_TRANSFORM_H
#define XPT2046_TRANSFORM_H

#include "xpt2046_filter.h"

#include <stdexcept>
#include <string>

namespace xpt2046 {

class CalibrationError : public std::runtime_error {
public:
	explicit CalibrationError(const std::string& what) : std::runtime_error(what) {}
};

// Should match the display rotation.
enum class Rotation : int {
	R0 = 0,
	R90 = 1,
	R180 = 2,
	R270 = 3
};

// Accepts 0-3 or degrees (0/90/180/270).
bool rotation_from_int(int value, Rotation& out);
int rotation_degrees(Rotation r);

struct CalibrationProfile {
	// ADC bounds of the visible area
	int x_min = 0;
	int x_max = 4095;
	int y_min = 0;
	int y_max = 4095;

	// Unrotated panel size in pixels
	int width = 240;
	int height = 320;

	Rotation rotation = Rotation::R0;

	// Panel wiring fix-ups, applied to raw values before mapping
	bool invert_x = false;
	bool invert_y = false;
	bool swap_xy = false;
};

struct TouchPoint {
	int x = 0;
	int y = 0;
};

// Throws CalibrationError unless x_min < x_max, y_min < y_max and the
// panel size is positive.
void validate(const CalibrationProfile& profile);

// Linear map of one raw axis onto [0, size - 1].
int map_axis(int raw, int raw_min, int raw_max, int size);

// Applies the rotation to a point calibrated in the unrotated frame.
TouchPoint rotate(TouchPoint p, Rotation rotation, int width, int height);

// Full transform. adc_max is the top raw code used by the inversions.
TouchPoint to_screen(const StableReading& reading, const CalibrationProfile& profile, int adc_max = 4095);

// Size of the rotated output frame.
int screen_width(const CalibrationProfile& profile);
int screen_height(const CalibrationProfile& profile);

} // namespace xpt2046

#endif // XPT2046_TRANSFORM_H
