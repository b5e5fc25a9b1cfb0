#include "touch_config.h"
#include "touch_device.h"
#include "xpt2046_touch.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <linux/input.h>
#include <linux/uinput.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace xpt2046;

static std::atomic<bool> g_running{true};

static void handle_signal(int) {
	g_running = false;
}

static bool stat_mtime(const std::string& path, timespec& out) {
	struct stat st;
	if (path.empty()) return false;
	if (stat(path.c_str(), &st) != 0) return false;
	out = st.st_mtim;
	return true;
}

static bool timespec_differs(const timespec& a, const timespec& b) {
	return a.tv_sec != b.tv_sec || a.tv_nsec != b.tv_nsec;
}

static TouchConfig read_config(std::string& usedPath) {
	TouchConfig cfg;
	load_config(cfg, usedPath);
	apply_env_overrides(cfg);
	sanitize(cfg);
	return cfg;
}

static int uinput_create_touch(int screen_w, int screen_h) {
	int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
	if (fd < 0) {
		std::perror("open(/dev/uinput)");
		return -1;
	}

	const int max_x = std::max(0, screen_w - 1);
	const int max_y = std::max(0, screen_h - 1);

	// Mark as a direct touch device (not a touchpad)
	(void)ioctl(fd, UI_SET_PROPBIT, INPUT_PROP_DIRECT);

	if (ioctl(fd, UI_SET_EVBIT, EV_KEY) < 0) goto fail;
	if (ioctl(fd, UI_SET_KEYBIT, BTN_TOUCH) < 0) goto fail;
	// Some stacks expect TOOL_FINGER for touchscreens
	(void)ioctl(fd, UI_SET_KEYBIT, BTN_TOOL_FINGER);
	if (ioctl(fd, UI_SET_EVBIT, EV_ABS) < 0) goto fail;
	if (ioctl(fd, UI_SET_ABSBIT, ABS_X) < 0) goto fail;
	if (ioctl(fd, UI_SET_ABSBIT, ABS_Y) < 0) goto fail;

	// Multitouch-style reporting (works well with SDL/Qt/evdev)
	(void)ioctl(fd, UI_SET_ABSBIT, ABS_MT_SLOT);
	(void)ioctl(fd, UI_SET_ABSBIT, ABS_MT_POSITION_X);
	(void)ioctl(fd, UI_SET_ABSBIT, ABS_MT_POSITION_Y);
	(void)ioctl(fd, UI_SET_ABSBIT, ABS_MT_TRACKING_ID);
	(void)ioctl(fd, UI_SET_ABSBIT, ABS_MT_PRESSURE);

	if (ioctl(fd, UI_SET_EVBIT, EV_SYN) < 0) goto fail;

	{
		uinput_user_dev uidev;
		std::memset(&uidev, 0, sizeof(uidev));
		std::snprintf(uidev.name, sizeof(uidev.name), "XPT2046 uinput touch");
		uidev.id.bustype = BUS_SPI;
		uidev.id.vendor = 0x1234;
		uidev.id.product = 0x5678;
		uidev.id.version = 1;

		uidev.absmin[ABS_X] = 0;
		uidev.absmax[ABS_X] = max_x;
		uidev.absmin[ABS_Y] = 0;
		uidev.absmax[ABS_Y] = max_y;

		uidev.absmin[ABS_MT_SLOT] = 0;
		uidev.absmax[ABS_MT_SLOT] = 0;

		uidev.absmin[ABS_MT_POSITION_X] = 0;
		uidev.absmax[ABS_MT_POSITION_X] = max_x;
		uidev.absmin[ABS_MT_POSITION_Y] = 0;
		uidev.absmax[ABS_MT_POSITION_Y] = max_y;
		uidev.absmin[ABS_MT_TRACKING_ID] = 0;
		uidev.absmax[ABS_MT_TRACKING_ID] = 65535;
		uidev.absmin[ABS_MT_PRESSURE] = 0;
		uidev.absmax[ABS_MT_PRESSURE] = 8190;

		if (write(fd, &uidev, sizeof(uidev)) < 0) goto fail;
	}
	if (ioctl(fd, UI_DEV_CREATE) < 0) goto fail;

	// Give the input subsystem a moment
	usleep(100000);
	return fd;

fail:
	std::perror("uinput setup");
	close(fd);
	return -1;
}

static void uinput_emit(int fd, uint16_t type, uint16_t code, int32_t value) {
	input_event ev;
	std::memset(&ev, 0, sizeof(ev));
	ev.type = type;
	ev.code = code;
	ev.value = value;
	// time left as 0; kernel fills / not required
	if (write(fd, &ev, sizeof(ev)) < 0 && errno != EAGAIN) {
		std::perror("uinput write");
	}
}

static void uinput_sync(int fd) {
	uinput_emit(fd, EV_SYN, SYN_REPORT, 0);
}

static void emit_touch(int fd, const TouchPoint& p, int pressure, bool first, int32_t tracking_id) {
	// Type-B MT: set slot + tracking + position first, then key.
	uinput_emit(fd, EV_ABS, ABS_MT_SLOT, 0);
	if (first) uinput_emit(fd, EV_ABS, ABS_MT_TRACKING_ID, tracking_id);
	uinput_emit(fd, EV_ABS, ABS_MT_POSITION_X, p.x);
	uinput_emit(fd, EV_ABS, ABS_MT_POSITION_Y, p.y);
	uinput_emit(fd, EV_ABS, ABS_MT_PRESSURE, pressure);

	// Also publish single-touch ABS for compatibility.
	uinput_emit(fd, EV_ABS, ABS_X, p.x);
	uinput_emit(fd, EV_ABS, ABS_Y, p.y);

	if (first) {
		uinput_emit(fd, EV_KEY, BTN_TOUCH, 1);
		uinput_emit(fd, EV_KEY, BTN_TOOL_FINGER, 1);
	}
	uinput_sync(fd);
}

static void emit_release(int fd) {
	uinput_emit(fd, EV_ABS, ABS_MT_SLOT, 0);
	uinput_emit(fd, EV_ABS, ABS_MT_TRACKING_ID, -1);
	uinput_emit(fd, EV_KEY, BTN_TOUCH, 0);
	uinput_emit(fd, EV_KEY, BTN_TOOL_FINGER, 0);
	uinput_sync(fd);
}

int main() {
	std::signal(SIGINT, handle_signal);
	std::signal(SIGTERM, handle_signal);

	std::string cfgPath;
	TouchConfig cfg = read_config(cfgPath);

	std::unique_ptr<TouchDevice> dev;
	try {
		dev.reset(new TouchDevice(cfg));
	} catch (const std::exception& e) {
		std::cerr << "[ERROR] " << e.what() << std::endl;
		return 1;
	}

	const int ui_w = screen_width(dev->driver().calibration());
	const int ui_h = screen_height(dev->driver().calibration());
	int ui_fd = uinput_create_touch(ui_w, ui_h);
	if (ui_fd < 0) return 1;

	std::cerr << "[INFO] xpt2046_uinputd started. cfg=" << (cfgPath.empty() ? "<none>" : cfgPath)
			  << " spi=" << dev->spi_device()
			  << " screen=" << ui_w << "x" << ui_h
			  << " poll_us=" << cfg.poll_us
			  << " active_poll_us=" << 5000
			  << std::endl;

	timespec cfg_mtime{0, 0};
	(void)stat_mtime(cfgPath, cfg_mtime);
	auto next_cfg_check = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);

	bool touch_down = false;
	int32_t tracking_id = 1;
	const int active_poll_us = 5000; // 200 Hz when touching

	while (g_running) {
		// Reload touch_config.txt when it changes, only while idle to avoid
		// mid-gesture jumps. The uinput device keeps its initial size.
		const auto now = std::chrono::steady_clock::now();
		if (now >= next_cfg_check && !touch_down) {
			next_cfg_check = now + std::chrono::milliseconds(500);
			timespec new_mtime{0, 0};
			std::string newPath = find_config_path();
			if (!newPath.empty() && (newPath != cfgPath || (stat_mtime(newPath, new_mtime) && timespec_differs(new_mtime, cfg_mtime)))) {
				std::string usedPath;
				TouchConfig next = read_config(usedPath);
				cfgPath = usedPath;
				try {
					dev->driver().reconfigure(next.driver);
					cfg.driver = next.driver;
					cfg.poll_us = next.poll_us;
					std::cerr << "[INFO] Reloaded cfg=" << (cfgPath.empty() ? "<none>" : cfgPath)
							  << " " << describe(cfg) << std::endl;
				} catch (const CalibrationError& e) {
					std::cerr << "[WARN] Keeping previous settings: " << e.what() << std::endl;
				} catch (const std::invalid_argument& e) {
					std::cerr << "[WARN] Keeping previous settings: " << e.what() << std::endl;
				}

				const std::vector<std::string> stale = restart_keys(cfg, next);
				if (!stale.empty()) {
					std::string names;
					for (const std::string& k : stale) names += (names.empty() ? "" : ",") + k;
					std::cerr << "[WARN] Not applied until restart: " << names << std::endl;
				}
				const CalibrationProfile& now_cal = dev->driver().calibration();
				if (screen_width(now_cal) != ui_w || screen_height(now_cal) != ui_h) {
					std::cerr << "[WARN] uinput device stays " << ui_w << "x" << ui_h
							  << ", restart to resize to " << screen_width(now_cal) << "x" << screen_height(now_cal) << std::endl;
				}
				(void)stat_mtime(cfgPath, cfg_mtime);
			}
		}

		TouchPoint p;
		StableReading r;
		bool touched = false;
		try {
			touched = dev->driver().get_raw_touch(r);
			if (touched) p = to_screen(r, dev->driver().calibration(), adc_max(dev->driver().config().resolution));
		} catch (const std::runtime_error& e) {
			std::cerr << "[WARN] " << e.what() << std::endl;
		}

		if (touched) {
			emit_touch(ui_fd, p, r.z, !touch_down, tracking_id);
			if (!touch_down) tracking_id++;
		} else if (touch_down) {
			emit_release(ui_fd);
		}
		touch_down = touched;

		usleep((useconds_t)(touch_down ? active_poll_us : cfg.poll_us));
	}

	if (touch_down) emit_release(ui_fd);
	ioctl(ui_fd, UI_DEV_DESTROY);
	close(ui_fd);
	std::cerr << "[INFO] xpt2046_uinputd exiting." << std::endl;
	return 0;
}
