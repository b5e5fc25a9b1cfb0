#include "xpt2046_touch.h"

#include <iostream>
#include <stdexcept>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace xpt2046 {

const int Xpt2046::kMinSamples;
const int Xpt2046::kMaxSamples;

void Xpt2046::check(const DriverConfig& config) {
	validate(config.calibration);
	if (config.samples < kMinSamples || config.samples > kMaxSamples) {
		std::ostringstream msg;
		msg << "samples=" << config.samples << " outside [" << kMinSamples << "," << kMaxSamples << "]";
		throw std::invalid_argument(msg.str());
	}
	if (config.resolution != Resolution::Bits12 && config.resolution != Resolution::Bits8) {
		throw std::invalid_argument("resolution must be 8 or 12 bits");
	}
	if (config.sample_interval_us < 0) {
		throw std::invalid_argument("sample_interval_us must not be negative");
	}
}

Xpt2046::Xpt2046(SpiBus& bus, OutputPin& cs, InputPin* irq, const DriverConfig& config)
	: bus_(bus), cs_(cs), irq_(irq), config_(config), adc_max_(adc_max(config.resolution)) {
	check(config_);

	// Idle level before the first frame.
	cs_.set(true);

	if (config_.debug) {
		const CalibrationProfile& c = config_.calibration;
		std::cerr << "[DEBUG] xpt2046: x:[" << c.x_min << "," << c.x_max << "] y:[" << c.y_min << "," << c.y_max << "]"
				  << " panel=" << c.width << "x" << c.height
				  << " rotation=" << rotation_degrees(c.rotation)
				  << " samples=" << config_.samples
				  << " threshold=" << config_.pressure_threshold
				  << " irq=" << (irq_ ? "yes" : "no") << std::endl;
	}
}

int Xpt2046::read(Channel ch) {
	return read_channel(bus_, cs_, make_command(ch, config_.resolution, is_single_ended(ch)), config_.resolution);
}

int Xpt2046::read_pressure() {
	int z1 = read(Channel::Z1);
	int z2 = read(Channel::Z2);
	return pressure_from(z1, z2, adc_max_);
}

TouchSample Xpt2046::read_sample() {
	TouchSample s;
	s.raw_x = read(Channel::X);
	s.raw_y = read(Channel::Y);
	s.raw_z = read_pressure();
	return s;
}

StableReading Xpt2046::sample(int n) {
	std::vector<TouchSample> set;
	set.reserve(n > 0 ? n : 0);
	for (int i = 0; i < n; ++i) {
		if (i > 0 && config_.sample_interval_us > 0) usleep((useconds_t)config_.sample_interval_us);
		set.push_back(read_sample());
	}
	return reduce_reading(set, adc_max_);
}

bool Xpt2046::is_touched() {
	// PENIRQ is pulled low while the panel is pressed
	if (irq_) {
		try {
			if (irq_->read()) return false;
		} catch (const std::exception& e) {
			if (config_.debug) std::cerr << "[DEBUG] xpt2046: irq read failed: " << e.what() << std::endl;
			return false;
		}
	}

	try {
		int z = read_pressure();
		return z >= 0 && z >= config_.pressure_threshold;
	} catch (const std::exception& e) {
		if (config_.debug) std::cerr << "[DEBUG] xpt2046: pressure poll failed: " << e.what() << std::endl;
		return false;
	}
}

bool Xpt2046::get_raw_touch(StableReading& out) {
	if (!is_touched()) return false;

	StableReading r = sample(config_.samples);
	// Finger lifted while sampling
	if (r.z < config_.pressure_threshold) {
		if (config_.debug) std::cerr << "[DEBUG] xpt2046: released during sampling z=" << r.z << std::endl;
		return false;
	}
	out = r;
	return true;
}

bool Xpt2046::get_touch(TouchPoint& out) {
	StableReading r;
	if (!get_raw_touch(r)) return false;
	out = to_screen(r, config_.calibration, adc_max_);
	if (config_.debug) {
		std::cerr << "[DEBUG] xpt2046: raw(" << r.x << "," << r.y << ") z=" << r.z
				  << " screen(" << out.x << "," << out.y << ")" << std::endl;
	}
	return true;
}

int Xpt2046::read_auxiliary(Channel ch) {
	return read(ch);
}

void Xpt2046::set_calibration(const CalibrationProfile& profile) {
	validate(profile);
	config_.calibration = profile;
}

void Xpt2046::reconfigure(const DriverConfig& config) {
	check(config);
	config_ = config;
	adc_max_ = adc_max(config_.resolution);
}

} // namespace xpt2046
