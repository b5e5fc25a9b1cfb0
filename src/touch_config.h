/*
 * touch_config.txt handling
 *
 * Plain key=value lines, '#' comments. The file is looked up in
 * $TOUCH_CONFIG_PATH, /etc/xpt2046, the working directory and next to the
 * executable; every key can be overridden with XPT_<KEY> in the environment.
 */

#ifndef TOUCH_CONFIG_H
#define TOUCH_CONFIG_H

#include "xpt2046_touch.h"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace xpt2046 {

struct TouchConfig {
	DriverConfig driver;

	std::string spi_device;        // empty = auto-detect
	uint32_t spi_speed_hz = 1000000;
	int cs_gpio = -1;              // -1 = spidev CE line
	int irq_gpio = -1;             // -1 = no PENIRQ, always poll the bus
	int poll_us = 100000;          // idle poll interval of the tools
};

// Keys understood by apply_setting(), in file order.
const std::vector<std::string>& config_keys();

// Sets one key. Returns false for unknown keys and unparsable values.
bool apply_setting(TouchConfig& cfg, const std::string& key, const std::string& value);

// Reads key=value lines; bad lines are reported on stderr and skipped.
void parse_config(std::istream& in, TouchConfig& cfg);

std::string get_exe_dir();
std::string find_config_path();

// Loads the first config found; usedPath is empty when none was.
void load_config(TouchConfig& cfg, std::string& usedPath);

// XPT_<KEY> for every key, e.g. XPT_MIN_X, XPT_SPI_DEVICE.
void apply_env_overrides(TouchConfig& cfg);

// Clamps tool and sampling settings into range. Calibration bounds are left
// alone; the driver rejects invalid ones.
void sanitize(TouchConfig& cfg);

// Where tools persist settings when no config file was found.
std::string default_config_save_path(const std::string& existingCfg);

// Replaces key=... in place or appends it. Returns false on I/O failure.
bool update_config_value(const std::string& cfgPath, const std::string& key, const std::string& value);

// Transport keys that differ between the running and a reloaded config.
// These are only read when the device is opened.
std::vector<std::string> restart_keys(const TouchConfig& running, const TouchConfig& next);

// One-line summary for [CONFIG] output.
std::string describe(const TouchConfig& cfg);

} // namespace xpt2046

#endif // TOUCH_CONFIG_H
