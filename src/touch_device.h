#ifndef TOUCH_DEVICE_H
#define TOUCH_DEVICE_H

#include "touch_config.h"
#include "xpt2046_linux.h"
#include "xpt2046_touch.h"

#include <memory>

namespace xpt2046 {

// Owns the spidev bus, the chip-select and PENIRQ lines and the driver
// built on them, wired from a TouchConfig.
class TouchDevice {
public:
	// Throws BusError, CalibrationError or std::invalid_argument.
	explicit TouchDevice(const TouchConfig& cfg);

	Xpt2046& driver() { return *driver_; }
	const std::string& spi_device() const { return bus_->device(); }

private:
	std::unique_ptr<SpidevBus> bus_;
	std::unique_ptr<OutputPin> cs_;
	std::unique_ptr<SysfsGpio> irq_;
	std::unique_ptr<Xpt2046> driver_;
};

} // namespace xpt2046

#endif // TOUCH_DEVICE_H
