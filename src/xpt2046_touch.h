/*
 * XPT2046 touch driver
 *
 * Sampling and calibration pipeline for the XPT2046 resistive touch
 * controller: framed conversions over SPI, outlier-rejecting multi-sample
 * filter, linear calibration and rotation into screen coordinates.
 *
 * The driver keeps no touch state between calls. Callers sharing one
 * instance between threads must serialize whole calls themselves.
 */

#ifndef XPT2046_TOUCH_H
#define XPT2046_TOUCH_H

#include "xpt2046_bus.h"
#include "xpt2046_filter.h"
#include "xpt2046_transform.h"

namespace xpt2046 {

struct DriverConfig {
	CalibrationProfile calibration;

	int samples = 3;              // transaction sets per reading, 2..16
	int pressure_threshold = 400; // minimum z counted as a touch
	Resolution resolution = Resolution::Bits12;
	int sample_interval_us = 10000; // settle time between sets
	bool debug = false;           // [DEBUG] lines on stderr
};

class Xpt2046 {
public:
	static const int kMinSamples = 2;
	static const int kMaxSamples = 16;

	// irq may be null; it is read as active-low PENIRQ.
	// Throws CalibrationError for invalid bounds, std::invalid_argument for
	// other out-of-range settings.
	Xpt2046(SpiBus& bus, OutputPin& cs, InputPin* irq, const DriverConfig& config = DriverConfig());

	// Cheap poll: PENIRQ pre-filter, then one Z1/Z2 pair against the
	// threshold. Never throws; transport errors read as "not touched".
	bool is_touched();

	// Filtered ADC reading. Returns false when not touched. BusError and
	// SampleError propagate.
	bool get_raw_touch(StableReading& out);

	// Calibrated and rotated position. Same return and error rules as
	// get_raw_touch().
	bool get_touch(TouchPoint& out);

	// One transaction set plus the settle delay, N times, then reduction.
	StableReading sample(int n);

	// Raw temperature, battery or auxiliary conversion.
	int read_auxiliary(Channel ch);

	const CalibrationProfile& calibration() const { return config_.calibration; }

	// Replaces the whole profile. On CalibrationError the old one stays.
	void set_calibration(const CalibrationProfile& profile);

	const DriverConfig& config() const { return config_; }

	// Replaces every driver setting at once, same checks as the
	// constructor. On error the previous configuration stays.
	void reconfigure(const DriverConfig& config);

private:
	static void check(const DriverConfig& config);

	int read(Channel ch);
	int read_pressure();
	TouchSample read_sample();

	SpiBus& bus_;
	OutputPin& cs_;
	InputPin* irq_;
	DriverConfig config_;
	int adc_max_;
};

} // namespace xpt2046

#endif // XPT2046_TOUCH_H
