#include "touch_config.h"
#include "touch_device.h"
#include "xpt2046_linux.h"
#include "xpt2046_touch.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace xpt2046;

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
	g_running = false;
}

static void print_usage(const char* argv0) {
	std::cout << "Usage: " << argv0 << " [--probe SECONDS] [--aux] [--advanced_raw] [--count N] [--<key> VALUE]...\n"
			  << "  --probe SECONDS  score every spidev node while the panel is pressed, save the best\n"
			  << "  --aux            print temperature, battery and aux conversions once\n"
			  << "  --advanced_raw   also print untouched polls\n"
			  << "  --count N        stop after N touched readings\n"
			  << "  keys:";
	for (const auto& k : config_keys()) std::cout << " " << k;
	std::cout << std::endl;
}

static void print_progress_bar(const std::string& dev, int hits, int samples) {
	int percent = (samples > 0) ? (hits * 100 / samples) : 0;
	int bar_len = 20;
	int filled = percent * bar_len / 100;
	std::string bar(filled, '#');
	bar += std::string(bar_len - filled, '-');
	const char* status = "Poor";
	if (percent > 90) status = "Excellent";
	else if (percent > 70) status = "Good";
	else if (percent > 40) status = "Fair";
	printf("%s: [%s] %3d%%  %s\n", dev.c_str(), bar.c_str(), percent, status);
}

// A hit needs pressure above threshold and a position away from the rails.
static bool probe_hit(Xpt2046& drv) {
	const int rail = adc_max(drv.config().resolution);
	StableReading r;
	try {
		if (!drv.get_raw_touch(r)) return false;
	} catch (const std::exception&) {
		return false;
	}
	return r.x >= 50 && r.x <= rail - 50 && r.y >= 50 && r.y <= rail - 50;
}

static int run_probe(const TouchConfig& cfg, const std::string& cfgPath, int probe_seconds) {
	DriverConfig probe_cfg = cfg.driver;
	probe_cfg.calibration = CalibrationProfile();
	probe_cfg.sample_interval_us = 0;
	probe_cfg.debug = false;

	struct Candidate {
		std::string dev;
		std::unique_ptr<SpidevBus> bus;
		std::unique_ptr<Xpt2046> drv;
		int hits = 0;
	};
	KernelChipSelect ce;
	std::vector<Candidate> devs;
	for (const auto& dev : spidev_candidates(std::string())) {
		Candidate c;
		c.dev = dev;
		try {
			c.bus.reset(new SpidevBus(dev, cfg.spi_speed_hz));
			c.drv.reset(new Xpt2046(*c.bus, ce, nullptr, probe_cfg));
		} catch (const BusError& e) {
			std::cerr << "[DEBUG] " << e.what() << std::endl;
		}
		devs.push_back(std::move(c));
	}

	printf("Press and hold finger at the center of display\n");
	for (const auto& c : devs) print_progress_bar(c.dev, 0, 1);
	fflush(stdout);

	const int samples = probe_seconds * 100; // 10ms per round
	for (int j = 0; j < samples && g_running; ++j) {
		for (auto& c : devs) {
			if (c.drv && probe_hit(*c.drv)) c.hits++;
		}
		if (j % 10 == 0 || j == samples - 1) {
			// Move cursor up and redraw the bars in place
			for (size_t k = 0; k < devs.size(); ++k) printf("\033[F");
			for (const auto& c : devs) print_progress_bar(c.dev, c.hits, j + 1);
			fflush(stdout);
		}
		usleep(10000);
	}

	const Candidate* best = nullptr;
	for (const auto& c : devs) {
		if (!best || c.hits > best->hits) best = &c;
	}
	if (!best || best->hits <= 0) {
		std::cerr << "[ERROR] Probe failed: no valid SPI device detected (no hits)." << std::endl;
		return 1;
	}
	std::cout << "[PROBE] Selected SPI: " << best->dev << " (hits=" << best->hits << ")" << std::endl;
	std::string savePath = default_config_save_path(cfgPath);
	if (!update_config_value(savePath, "spi_device", best->dev)) {
		std::cerr << "[ERROR] Cannot write " << savePath << std::endl;
		return 1;
	}
	std::cout << "[CONFIG] Saved spi_device=" << best->dev << " to " << savePath << std::endl;
	return 0;
}

static int run_aux(Xpt2046& drv) {
	struct { const char* name; Channel ch; } channels[] = {
		{"temp0", Channel::Temp0},
		{"temp1", Channel::Temp1},
		{"vbat", Channel::Battery},
		{"aux", Channel::Aux}};
	for (const auto& c : channels) {
		std::cout << "[ADV] " << c.name << "=" << drv.read_auxiliary(c.ch) << std::endl;
	}
	return 0;
}

static int run_monitor(Xpt2046& drv, const TouchConfig& cfg, const std::string& spi, bool advanced_raw, int count) {
	const CalibrationProfile& cal = drv.calibration();
	const int rail = adc_max(drv.config().resolution);
	std::cout << "Press Ctrl+C to stop test..." << std::endl;

	bool warned_dead = false;
	bool warned_static = false;
	int extreme_count = 0;
	int same_count = 0;
	int last_x = -1, last_y = -1;
	int printed = 0;

	while (g_running && (count <= 0 || printed < count)) {
		StableReading r;
		bool down = false;
		try {
			down = drv.get_raw_touch(r);
		} catch (const SampleError& e) {
			std::cerr << "[WARN] " << e.what() << std::endl;
		} catch (const BusError& e) {
			std::cerr << "[ERROR] SPI transfer failed: " << e.what() << std::endl;
		}

		if (!down) {
			extreme_count = 0;
			same_count = 0;
			if (advanced_raw) std::cout << "[ADV] no touch" << std::endl;
			usleep((useconds_t)cfg.poll_us);
			continue;
		}

		TouchPoint p = to_screen(r, cal, rail);

		// Saturated readings while pressed usually mean the wrong CE line
		bool extreme = ((r.x <= 0 || r.x >= rail) && (r.y <= 0 || r.y >= rail));
		extreme_count = extreme ? (extreme_count + 1) : 0;
		if (!warned_dead && extreme_count > 30) {
			std::cerr << "[WARN] Readings are saturated (0 or " << rail << "). Possibly wrong CS/device. Recommendation: check "
					  << spi << " and CE wiring." << std::endl;
			warned_dead = true;
		}

		if (r.x == last_x && r.y == last_y) same_count++; else same_count = 0;
		last_x = r.x;
		last_y = r.y;
		if (!warned_static && same_count > 100) {
			std::cerr << "[INFO] Readings are static. If unexpected, check CS and touch wiring." << std::endl;
			warned_static = true;
		}

		std::cout << "[SPI] XPT2046 raw X: " << r.x << "  Y: " << r.y << "  Z: " << r.z
				  << "  (SX: " << p.x << " SY: " << p.y << ")" << std::endl;
		++printed;
		usleep((useconds_t)cfg.poll_us);
	}
	return 0;
}

int main(int argc, char* argv[]) {
	std::signal(SIGINT, handle_signal);
	std::signal(SIGTERM, handle_signal);

	// Defaults, then config file, then CLI args, then environment
	TouchConfig cfg;
	std::string cfgPath;
	load_config(cfg, cfgPath);

	int probe_seconds = 0;
	int count = 0;
	bool advanced_raw = false;
	bool aux = false;
	for (int i = 1; i < argc; ++i) {
		if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
			print_usage(argv[0]);
			return 0;
		}
		if (strcmp(argv[i], "--probe") == 0 && i + 1 < argc) probe_seconds = atoi(argv[++i]);
		else if (strcmp(argv[i], "--count") == 0 && i + 1 < argc) count = atoi(argv[++i]);
		else if (strcmp(argv[i], "--advanced_raw") == 0) advanced_raw = true;
		else if (strcmp(argv[i], "--aux") == 0) aux = true;
		else if (strncmp(argv[i], "--", 2) == 0 && i + 1 < argc) {
			std::string key = argv[i] + 2;
			if (!apply_setting(cfg, key, argv[++i])) {
				std::cerr << "[ERROR] Bad option --" << key << " " << argv[i] << std::endl;
				print_usage(argv[0]);
				return 2;
			}
		} else {
			std::cerr << "[ERROR] Unknown argument: " << argv[i] << std::endl;
			print_usage(argv[0]);
			return 2;
		}
	}

	// Environment overrides for live testing without saving
	apply_env_overrides(cfg);
	sanitize(cfg);

	if (probe_seconds > 0) return run_probe(cfg, cfgPath, probe_seconds);

	std::cout << "XPT2046 userspace driver start!" << std::endl;
	if (cfgPath.empty()) {
		std::cerr << "[INFO] No touch_config.txt found. Set TOUCH_CONFIG_PATH or copy installation/touch_config.txt." << std::endl;
	} else {
		std::cout << "[CONFIG] Using: " << cfgPath << std::endl;
	}
	std::cout << "[CONFIG] " << describe(cfg) << std::endl;

	try {
		TouchDevice dev(cfg);
		std::cout << "[OK] SPI device selected: " << dev.spi_device() << std::endl;

		// Persist detected device to config if not set explicitly
		if (!cfgPath.empty() && cfg.spi_device.empty()) {
			if (update_config_value(cfgPath, "spi_device", dev.spi_device())) {
				std::cout << "[CONFIG] Saved spi_device=" << dev.spi_device() << " to " << cfgPath << std::endl;
			}
		}

		if (aux) return run_aux(dev.driver());
		return run_monitor(dev.driver(), cfg, dev.spi_device(), advanced_raw, count);
	} catch (const CalibrationError& e) {
		std::cerr << "[ERROR] Invalid calibration: " << e.what() << std::endl;
	} catch (const BusError& e) {
		std::cerr << "[ERROR] " << e.what() << std::endl;
		std::cerr << "[HINT] Ensure SPI is enabled (raspi-config), CS wiring is correct, and /dev/spidev* permissions are allowed."
				  << " If your XPT2046 is on CE1, set spi_device=/dev/spidev0.1 in the config or XPT_SPI_DEVICE in the environment." << std::endl;
	} catch (const std::invalid_argument& e) {
		std::cerr << "[ERROR] " << e.what() << std::endl;
	}
	return 1;
}
