#include "touch_config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace xpt2046;

namespace {

std::string temp_file(const std::string& contents) {
	char path[] = "/tmp/xpt2046_cfg_XXXXXX";
	int fd = mkstemp(path);
	if (fd >= 0) close(fd);
	std::ofstream out(path, std::ios::trunc);
	out << contents;
	return path;
}

std::string slurp(const std::string& path) {
	std::ifstream in(path);
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

} // namespace

TEST(Config, DefaultsMatchPanel) {
	TouchConfig cfg;
	EXPECT_EQ(240, cfg.driver.calibration.width);
	EXPECT_EQ(320, cfg.driver.calibration.height);
	EXPECT_EQ(0, cfg.driver.calibration.x_min);
	EXPECT_EQ(4095, cfg.driver.calibration.x_max);
	EXPECT_EQ(Rotation::R0, cfg.driver.calibration.rotation);
	EXPECT_EQ(3, cfg.driver.samples);
	EXPECT_EQ(-1, cfg.irq_gpio);
	EXPECT_TRUE(cfg.spi_device.empty());
}

TEST(Config, ParsesKeyValueLines) {
	std::istringstream in(
		"# comment\n"
		"\n"
		"spi_device = /dev/spidev0.0\n"
		"min_x=100\n"
		"max_x=1962\n"
		"  min_y =  120 \n"
		"max_y=1900\r\n"
		"screen_w=320\n"
		"screen_h=480\n"
		"rotation=270\n"
		"invert_x=1\n"
		"irq_gpio=17\n"
		"samples=5\n"
		"press_threshold=250\n"
		"resolution_bits=8\n");
	TouchConfig cfg;
	parse_config(in, cfg);

	const CalibrationProfile& cal = cfg.driver.calibration;
	EXPECT_EQ("/dev/spidev0.0", cfg.spi_device);
	EXPECT_EQ(100, cal.x_min);
	EXPECT_EQ(1962, cal.x_max);
	EXPECT_EQ(120, cal.y_min);
	EXPECT_EQ(1900, cal.y_max);
	EXPECT_EQ(320, cal.width);
	EXPECT_EQ(480, cal.height);
	EXPECT_EQ(Rotation::R270, cal.rotation);
	EXPECT_TRUE(cal.invert_x);
	EXPECT_FALSE(cal.invert_y);
	EXPECT_EQ(17, cfg.irq_gpio);
	EXPECT_EQ(5, cfg.driver.samples);
	EXPECT_EQ(250, cfg.driver.pressure_threshold);
	EXPECT_EQ(Resolution::Bits8, cfg.driver.resolution);
}

TEST(Config, BadLinesAreSkipped) {
	std::istringstream in(
		"min_x=abc\n"
		"rotation=45\n"
		"unknown_key=3\n"
		"no equals sign\n"
		"max_x=3000\n");
	TouchConfig cfg;
	parse_config(in, cfg);
	EXPECT_EQ(0, cfg.driver.calibration.x_min);
	EXPECT_EQ(3000, cfg.driver.calibration.x_max);
	EXPECT_EQ(Rotation::R0, cfg.driver.calibration.rotation);
}

TEST(Config, InvertedBoundsAreNotRepaired) {
	std::istringstream in("min_x=2000\nmax_x=100\n");
	TouchConfig cfg;
	parse_config(in, cfg);
	sanitize(cfg);
	EXPECT_EQ(2000, cfg.driver.calibration.x_min);
	EXPECT_EQ(100, cfg.driver.calibration.x_max);
	EXPECT_THROW(validate(cfg.driver.calibration), CalibrationError);
}

TEST(Config, SanitizeClampsToolSettings) {
	TouchConfig cfg;
	cfg.driver.calibration.width = 0;
	cfg.driver.calibration.height = 10000;
	cfg.poll_us = 10;
	cfg.driver.samples = 40;
	cfg.driver.pressure_threshold = -5;
	sanitize(cfg);
	EXPECT_EQ(1, cfg.driver.calibration.width);
	EXPECT_EQ(4096, cfg.driver.calibration.height);
	EXPECT_EQ(1000, cfg.poll_us);
	EXPECT_EQ(Xpt2046::kMaxSamples, cfg.driver.samples);
	EXPECT_EQ(0, cfg.driver.pressure_threshold);
}

TEST(Config, EnvironmentOverridesFile) {
	std::istringstream in("min_x=100\nspi_device=/dev/spidev0.0\n");
	TouchConfig cfg;
	parse_config(in, cfg);

	setenv("XPT_MIN_X", "321", 1);
	setenv("XPT_SPI_DEVICE", "/dev/spidev1.0", 1);
	setenv("XPT_ROTATION", "2", 1);
	apply_env_overrides(cfg);
	unsetenv("XPT_MIN_X");
	unsetenv("XPT_SPI_DEVICE");
	unsetenv("XPT_ROTATION");

	EXPECT_EQ(321, cfg.driver.calibration.x_min);
	EXPECT_EQ("/dev/spidev1.0", cfg.spi_device);
	EXPECT_EQ(Rotation::R180, cfg.driver.calibration.rotation);
}

TEST(Config, FindsFileFromEnvironmentPath) {
	std::string path = temp_file("max_y=1234\n");
	setenv("TOUCH_CONFIG_PATH", path.c_str(), 1);

	TouchConfig cfg;
	std::string used;
	load_config(cfg, used);
	unsetenv("TOUCH_CONFIG_PATH");

	EXPECT_EQ(path, used);
	EXPECT_EQ(1234, cfg.driver.calibration.y_max);
	std::remove(path.c_str());
}

TEST(Config, UpdateReplacesExistingKey) {
	std::string path = temp_file("# touch\nspi_device=/dev/spidev0.0\nmin_x=100\n");
	ASSERT_TRUE(update_config_value(path, "spi_device", "/dev/spidev0.1"));
	EXPECT_EQ("# touch\nspi_device=/dev/spidev0.1\nmin_x=100\n", slurp(path));
	std::remove(path.c_str());
}

TEST(Config, UpdateAppendsMissingKey) {
	std::string path = temp_file("min_x=100\n");
	ASSERT_TRUE(update_config_value(path, "spi_device", "/dev/spidev1.1"));
	EXPECT_EQ("min_x=100\nspi_device=/dev/spidev1.1\n", slurp(path));
	std::remove(path.c_str());
}

TEST(Config, UpdateWithoutPathFails) {
	EXPECT_FALSE(update_config_value("", "spi_device", "/dev/spidev0.0"));
}

TEST(Config, RestartKeysListTransportChanges) {
	TouchConfig running;
	TouchConfig next = running;
	next.driver.samples = 7;
	next.driver.calibration.x_min = 50;
	next.poll_us = 5000;
	EXPECT_TRUE(restart_keys(running, next).empty());

	next.spi_device = "/dev/spidev1.0";
	next.irq_gpio = 25;
	std::vector<std::string> keys = restart_keys(running, next);
	ASSERT_EQ(2u, keys.size());
	EXPECT_EQ("spi_device", keys[0]);
	EXPECT_EQ("irq_gpio", keys[1]);
}

TEST(Config, DescribeMentionsRanges) {
	TouchConfig cfg;
	std::string s = describe(cfg);
	EXPECT_NE(std::string::npos, s.find("x:[0,4095]"));
	EXPECT_NE(std::string::npos, s.find("spi=<auto>"));
}
