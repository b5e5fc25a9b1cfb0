#include "touch_config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace xpt2046 {

static bool parse_int(const std::string& s, int& out) {
	char* end = nullptr;
	long v = std::strtol(s.c_str(), &end, 10);
	if (end == s.c_str()) return false;
	out = (int)v;
	return true;
}

template <typename T>
static T clamp_val(T v, T lo, T hi) {
	return (v < lo) ? lo : ((v > hi) ? hi : v);
}

static void trim(std::string& s) {
	s.erase(0, s.find_first_not_of(" \t\r"));
	s.erase(s.find_last_not_of(" \t\r") + 1);
}

const std::vector<std::string>& config_keys() {
	static const std::vector<std::string> keys = {
		"spi_device", "spi_speed_hz", "cs_gpio", "irq_gpio",
		"screen_w", "screen_h",
		"min_x", "max_x", "min_y", "max_y",
		"invert_x", "invert_y", "swap_xy", "rotation",
		"samples", "press_threshold", "sample_interval_us", "resolution_bits",
		"poll_us", "debug"};
	return keys;
}

bool apply_setting(TouchConfig& cfg, const std::string& key, const std::string& val) {
	CalibrationProfile& cal = cfg.driver.calibration;

	if (key == "spi_device") {
		cfg.spi_device = val;
		return true;
	}

	int iv = 0;
	if (!parse_int(val, iv)) return false;

	if (key == "spi_speed_hz") {
		if (iv <= 0) return false;
		cfg.spi_speed_hz = (uint32_t)iv;
	}
	else if (key == "cs_gpio") cfg.cs_gpio = iv;
	else if (key == "irq_gpio") cfg.irq_gpio = iv;
	else if (key == "screen_w") cal.width = iv;
	else if (key == "screen_h") cal.height = iv;
	else if (key == "min_x") cal.x_min = iv;
	else if (key == "max_x") cal.x_max = iv;
	else if (key == "min_y") cal.y_min = iv;
	else if (key == "max_y") cal.y_max = iv;
	else if (key == "invert_x") cal.invert_x = iv != 0;
	else if (key == "invert_y") cal.invert_y = iv != 0;
	else if (key == "swap_xy") cal.swap_xy = iv != 0;
	else if (key == "rotation") return rotation_from_int(iv, cal.rotation);
	else if (key == "samples") cfg.driver.samples = iv;
	else if (key == "press_threshold") cfg.driver.pressure_threshold = iv;
	else if (key == "sample_interval_us") cfg.driver.sample_interval_us = iv;
	else if (key == "resolution_bits") {
		if (iv == 8) cfg.driver.resolution = Resolution::Bits8;
		else if (iv == 12) cfg.driver.resolution = Resolution::Bits12;
		else return false;
	}
	else if (key == "poll_us") cfg.poll_us = iv;
	else if (key == "debug") cfg.driver.debug = iv != 0;
	else return false;
	return true;
}

void parse_config(std::istream& in, TouchConfig& cfg) {
	std::string line;
	int lineno = 0;
	while (std::getline(in, line)) {
		++lineno;
		trim(line);
		if (line.empty() || line[0] == '#') continue;
		auto pos = line.find('=');
		if (pos == std::string::npos) {
			std::cerr << "[WARN] touch_config line " << lineno << ": no '=', skipped" << std::endl;
			continue;
		}
		std::string key = line.substr(0, pos);
		std::string val = line.substr(pos + 1);
		trim(key);
		trim(val);
		if (!apply_setting(cfg, key, val)) {
			std::cerr << "[WARN] touch_config line " << lineno << ": ignoring " << key << "=" << val << std::endl;
		}
	}
}

std::string get_exe_dir() {
	char buf[4096];
	ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
	if (n <= 0) return std::string();
	buf[n] = '\0';
	std::string path(buf);
	size_t pos = path.find_last_of('/');
	if (pos == std::string::npos) return std::string();
	return path.substr(0, pos);
}

std::string find_config_path() {
	const char* envPath = getenv("TOUCH_CONFIG_PATH");
	if (envPath && *envPath) {
		std::ifstream f(envPath);
		if (f.good()) return std::string(envPath);
	}

	std::vector<std::string> candidates;
	// System-wide config (useful when running as a system service)
	candidates.push_back("/etc/xpt2046/touch_config.txt");
	candidates.push_back("touch_config.txt");
	candidates.push_back("installation/touch_config.txt");

	// Binary usually in build/, config in ../installation/
	std::string exeDir = get_exe_dir();
	if (!exeDir.empty()) {
		candidates.push_back(exeDir + "/touch_config.txt");
		candidates.push_back(exeDir + "/installation/touch_config.txt");
		candidates.push_back(exeDir + "/../installation/touch_config.txt");
	}

	for (const auto& p : candidates) {
		std::ifstream f(p);
		if (f.good()) return p;
	}
	return std::string();
}

void load_config(TouchConfig& cfg, std::string& usedPath) {
	usedPath = find_config_path();
	if (usedPath.empty()) {
		std::cerr << "[INFO] No touch_config.txt found; using defaults." << std::endl;
		return;
	}
	std::ifstream in(usedPath);
	if (!in.good()) {
		std::cerr << "[INFO] " << usedPath << " not readable; using defaults." << std::endl;
		usedPath.clear();
		return;
	}
	parse_config(in, cfg);
}

void apply_env_overrides(TouchConfig& cfg) {
	for (const auto& key : config_keys()) {
		std::string name = "XPT_";
		for (char c : key) name += (char)std::toupper((unsigned char)c);
		const char* v = getenv(name.c_str());
		if (!v || !*v) continue;
		if (!apply_setting(cfg, key, v)) {
			std::cerr << "[WARN] Ignoring " << name << "=" << v << std::endl;
		}
	}
}

void sanitize(TouchConfig& cfg) {
	CalibrationProfile& cal = cfg.driver.calibration;
	cal.width = clamp_val(cal.width, 1, 4096);
	cal.height = clamp_val(cal.height, 1, 4096);
	cfg.poll_us = clamp_val(cfg.poll_us, 1000, 1000000);
	cfg.driver.samples = clamp_val(cfg.driver.samples, Xpt2046::kMinSamples, Xpt2046::kMaxSamples);
	cfg.driver.sample_interval_us = clamp_val(cfg.driver.sample_interval_us, 0, 100000);
	if (cfg.driver.pressure_threshold < 0) cfg.driver.pressure_threshold = 0;
}

std::string default_config_save_path(const std::string& existingCfg) {
	if (!existingCfg.empty()) return existingCfg;
	std::string exeDir = get_exe_dir();
	if (!exeDir.empty()) return exeDir + "/../installation/touch_config.txt";
	return std::string("installation/touch_config.txt");
}

bool update_config_value(const std::string& cfgPath, const std::string& key, const std::string& value) {
	if (cfgPath.empty() || key.empty()) return false;
	std::ifstream in(cfgPath);
	std::vector<std::string> lines;
	bool replaced = false;
	const std::string prefix = key + "=";
	if (in.good()) {
		std::string line;
		while (std::getline(in, line)) {
			if (line.rfind(prefix, 0) == 0) {
				lines.push_back(prefix + value);
				replaced = true;
			} else {
				lines.push_back(line);
			}
		}
		in.close();
	}
	if (!replaced) lines.push_back(prefix + value);

	std::ofstream out(cfgPath, std::ios::trunc);
	if (!out.good()) return false;
	for (size_t i = 0; i < lines.size(); ++i) {
		out << lines[i] << "\n";
	}
	return out.good();
}

std::vector<std::string> restart_keys(const TouchConfig& running, const TouchConfig& next) {
	std::vector<std::string> keys;
	if (running.spi_device != next.spi_device) keys.push_back("spi_device");
	if (running.spi_speed_hz != next.spi_speed_hz) keys.push_back("spi_speed_hz");
	if (running.cs_gpio != next.cs_gpio) keys.push_back("cs_gpio");
	if (running.irq_gpio != next.irq_gpio) keys.push_back("irq_gpio");
	return keys;
}

std::string describe(const TouchConfig& cfg) {
	const CalibrationProfile& cal = cfg.driver.calibration;
	std::ostringstream s;
	s << "spi=" << (cfg.spi_device.empty() ? "<auto>" : cfg.spi_device)
	  << " speed=" << cfg.spi_speed_hz
	  << " cs_gpio=" << cfg.cs_gpio
	  << " irq_gpio=" << cfg.irq_gpio
	  << " ranges x:[" << cal.x_min << "," << cal.x_max << "] y:[" << cal.y_min << "," << cal.y_max << "]"
	  << " screen:[" << cal.width << "x" << cal.height << "]"
	  << " rotation=" << rotation_degrees(cal.rotation)
	  << " invert_x=" << cal.invert_x
	  << " invert_y=" << cal.invert_y
	  << " swap_xy=" << cal.swap_xy
	  << " samples=" << cfg.driver.samples
	  << " press=" << cfg.driver.pressure_threshold
	  << " interval_us=" << cfg.driver.sample_interval_us
	  << " bits=" << (int)cfg.driver.resolution
	  << " poll_us=" << cfg.poll_us;
	return s.str();
}

} // namespace xpt2046
