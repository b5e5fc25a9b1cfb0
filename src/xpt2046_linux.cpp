#include "xpt2046_linux.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xpt2046 {

const uint32_t SpidevBus::kDefaultSpeedHz;

static std::string errno_text(const std::string& what) {
	std::ostringstream msg;
	msg << what << ": " << strerror(errno) << " (errno=" << errno << ")";
	return msg.str();
}

SpidevBus::SpidevBus(const std::string& device, uint32_t speed_hz, bool no_cs)
	: fd_(-1), device_(device), speed_hz_(speed_hz) {
	fd_ = open(device.c_str(), O_RDWR);
	if (fd_ < 0) throw BusError(errno_text("open(" + device + ")"));

	uint8_t mode = SPI_MODE_0;
	if (no_cs) mode |= SPI_NO_CS;
	uint8_t bits = 8;
	if (ioctl(fd_, SPI_IOC_WR_MODE, &mode) < 0) {
		std::string err = errno_text("ioctl(SPI_IOC_WR_MODE) on " + device);
		close(fd_);
		throw BusError(err);
	}
	if (ioctl(fd_, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
		std::string err = errno_text("ioctl(SPI_IOC_WR_BITS_PER_WORD) on " + device);
		close(fd_);
		throw BusError(err);
	}
	if (ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed_hz_) < 0) {
		std::string err = errno_text("ioctl(SPI_IOC_WR_MAX_SPEED_HZ) on " + device);
		close(fd_);
		throw BusError(err);
	}
}

SpidevBus::~SpidevBus() {
	if (fd_ >= 0) close(fd_);
}

size_t SpidevBus::transfer(const uint8_t* tx, uint8_t* rx, size_t len) {
	struct spi_ioc_transfer tr = {};
	tr.tx_buf = (unsigned long)tx;
	tr.rx_buf = (unsigned long)rx;
	tr.len = (uint32_t)len;
	tr.speed_hz = speed_hz_;
	tr.bits_per_word = 8;
	tr.delay_usecs = 0;
	int ret = ioctl(fd_, SPI_IOC_MESSAGE(1), &tr);
	if (ret < 1) return 0;
	return (size_t)ret;
}

std::vector<std::string> spidev_candidates(const std::string& preferred) {
	std::vector<std::string> candidates;
	if (!preferred.empty()) candidates.push_back(preferred);
	const char* defaults[] = {"/dev/spidev0.1", "/dev/spidev0.0", "/dev/spidev1.0", "/dev/spidev1.1"};
	for (const char* dev : defaults) {
		if (dev != preferred) candidates.push_back(dev);
	}
	return candidates;
}

std::unique_ptr<SpidevBus> open_spidev(const std::string& preferred, uint32_t speed_hz, bool no_cs) {
	std::ostringstream tried;
	for (const auto& dev : spidev_candidates(preferred)) {
		try {
			return std::unique_ptr<SpidevBus>(new SpidevBus(dev, speed_hz, no_cs));
		} catch (const BusError& e) {
			tried << "\n  " << e.what();
		}
	}
	throw BusError("no usable SPI device (spidev):" + tried.str());
}

static void write_sysfs(const std::string& path, const std::string& value) {
	int fd = open(path.c_str(), O_WRONLY);
	if (fd < 0) throw BusError(errno_text("open(" + path + ")"));
	ssize_t n = write(fd, value.c_str(), value.size());
	int saved = errno;
	close(fd);
	if (n < 0) {
		errno = saved;
		throw BusError(errno_text("write(" + path + ", " + value + ")"));
	}
}

static bool path_exists(const std::string& p) {
	struct stat st;
	return ::stat(p.c_str(), &st) == 0;
}

SysfsGpio::SysfsGpio(int line, Direction dir, const std::string& root)
	: root_(root), line_(line), fd_(-1), exported_(false) {
	const std::string base = root_ + "/gpio" + std::to_string(line);
	if (!path_exists(base)) {
		write_sysfs(root_ + "/export", std::to_string(line));
		exported_ = true;
		// udev may need a moment to hand over the attribute files
		for (int i = 0; i < 50 && !path_exists(base + "/direction"); ++i) usleep(2000);
	}

	try {
		// "high" configures an output already deasserted, so CS never glitches low
		write_sysfs(base + "/direction", dir == Out ? "high" : "in");

		fd_ = open((base + "/value").c_str(), dir == Out ? O_RDWR : O_RDONLY);
		if (fd_ < 0) throw BusError(errno_text("open(" + base + "/value)"));
	} catch (const BusError&) {
		unexport();
		throw;
	}
}

SysfsGpio::~SysfsGpio() {
	if (fd_ >= 0) close(fd_);
	unexport();
}

void SysfsGpio::unexport() {
	if (!exported_) return;
	exported_ = false;
	try {
		write_sysfs(root_ + "/unexport", std::to_string(line_));
	} catch (const BusError&) {
		// line stays exported; the next run picks it up as is
	}
}

void SysfsGpio::set(bool high) {
	const char v = high ? '1' : '0';
	if (pwrite(fd_, &v, 1, 0) != 1) {
		throw BusError(errno_text("gpio" + std::to_string(line_) + " write"));
	}
}

bool SysfsGpio::read() {
	char v = '0';
	if (pread(fd_, &v, 1, 0) != 1) {
		throw BusError(errno_text("gpio" + std::to_string(line_) + " read"));
	}
	return v == '1';
}

} // namespace xpt2046
