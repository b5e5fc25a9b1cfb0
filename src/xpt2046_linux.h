/*
 * Linux transports for the XPT2046 driver: spidev character devices and
 * sysfs GPIO lines for chip-select and PENIRQ.
 */

#ifndef XPT2046_LINUX_H
#define XPT2046_LINUX_H

#include "xpt2046_bus.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace xpt2046 {

class SpidevBus : public SpiBus {
public:
	static const uint32_t kDefaultSpeedHz = 1000000;

	// Throws BusError when the device cannot be opened or configured.
	// no_cs sets SPI_NO_CS for a chip-select driven from a GPIO.
	explicit SpidevBus(const std::string& device, uint32_t speed_hz = kDefaultSpeedHz, bool no_cs = false);
	~SpidevBus() override;

	SpidevBus(const SpidevBus&) = delete;
	SpidevBus& operator=(const SpidevBus&) = delete;

	size_t transfer(const uint8_t* tx, uint8_t* rx, size_t len) override;

	const std::string& device() const { return device_; }

private:
	int fd_;
	std::string device_;
	uint32_t speed_hz_;
};

// Configured device first, then the usual Raspberry Pi CE nodes.
std::vector<std::string> spidev_candidates(const std::string& preferred);

// Opens the first candidate that accepts mode and speed.
// Throws BusError listing what was tried when none does.
std::unique_ptr<SpidevBus> open_spidev(const std::string& preferred, uint32_t speed_hz, bool no_cs);

// Line exported through /sys/class/gpio. A line this object exported is
// unexported again on destruction or when setup fails.
class SysfsGpio : public OutputPin, public InputPin {
public:
	enum Direction { In, Out };

	SysfsGpio(int line, Direction dir, const std::string& root = "/sys/class/gpio");
	~SysfsGpio() override;

	SysfsGpio(const SysfsGpio&) = delete;
	SysfsGpio& operator=(const SysfsGpio&) = delete;

	void set(bool high) override;
	bool read() override;

	int line() const { return line_; }

private:
	void unexport();

	std::string root_;
	int line_;
	int fd_;
	bool exported_;
};

// spidev toggles CE itself when no GPIO chip-select is wired.
class KernelChipSelect : public OutputPin {
public:
	void set(bool) override {}
};

} // namespace xpt2046

#endif // XPT2046_LINUX_H
