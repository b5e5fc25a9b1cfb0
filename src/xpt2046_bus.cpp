#include "xpt2046_bus.h"

#include <sstream>

namespace xpt2046 {

uint8_t make_command(Channel ch, Resolution res, bool single_ended) {
	uint8_t cmd = 0x80;
	cmd |= (uint8_t)(((uint8_t)ch & 0x07) << 4);
	if (res == Resolution::Bits8) cmd |= 0x08;
	if (single_ended) cmd |= 0x04;
	return cmd;
}

bool is_single_ended(Channel ch) {
	switch (ch) {
	case Channel::X:
	case Channel::Y:
	case Channel::Z1:
	case Channel::Z2:
		return false;
	default:
		return true;
	}
}

int read_channel(SpiBus& bus, OutputPin& cs, uint8_t command, Resolution res) {
	uint8_t tx[3] = {command, 0x00, 0x00};
	uint8_t rx[3] = {0};
	size_t n = 0;
	{
		ChipSelectGuard frame(cs);
		n = bus.transfer(tx, rx, sizeof(tx));
		frame.release();
	}
	if (n < sizeof(tx)) {
		std::ostringstream msg;
		msg << "SPI transfer short for command 0x" << std::hex << (int)command
			<< std::dec << ": " << n << "/" << sizeof(tx) << " bytes";
		throw BusError(msg.str());
	}
	int word = (rx[1] << 8) | rx[2];
	return res == Resolution::Bits8 ? (word >> 7) : (word >> 3);
}

} // namespace xpt2046
