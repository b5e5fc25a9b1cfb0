#include "touch_device.h"

namespace xpt2046 {

TouchDevice::TouchDevice(const TouchConfig& cfg) {
	// Validate before touching any hardware
	validate(cfg.driver.calibration);

	const bool gpio_cs = cfg.cs_gpio >= 0;
	bus_ = open_spidev(cfg.spi_device, cfg.spi_speed_hz, gpio_cs);
	if (gpio_cs) {
		cs_.reset(new SysfsGpio(cfg.cs_gpio, SysfsGpio::Out));
	} else {
		cs_.reset(new KernelChipSelect());
	}
	if (cfg.irq_gpio >= 0) {
		irq_.reset(new SysfsGpio(cfg.irq_gpio, SysfsGpio::In));
	}
	driver_.reset(new Xpt2046(*bus_, *cs_, irq_.get(), cfg.driver));
}

} // namespace xpt2046
