#ifndef XPT2046_BUS_H
#define XPT2046_BUS_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace xpt2046 {

// Transport failure: short transfer, device open/ioctl error, GPIO error.
class BusError : public std::runtime_error {
public:
	explicit BusError(const std::string& what) : std::runtime_error(what) {}
};

// Synchronous full-duplex transfer of a fixed length.
// Returns the number of bytes actually clocked.
class SpiBus {
public:
	virtual ~SpiBus() = default;
	virtual size_t transfer(const uint8_t* tx, uint8_t* rx, size_t len) = 0;
};

class OutputPin {
public:
	virtual ~OutputPin() = default;
	virtual void set(bool high) = 0;
};

class InputPin {
public:
	virtual ~InputPin() = default;
	virtual bool read() = 0;
};

// Asserts chip-select (low) for the lifetime of the guard.
// release() deasserts it and lets a pin error propagate; the destructor
// only covers the unwinding path and drops such errors.
class ChipSelectGuard {
public:
	explicit ChipSelectGuard(OutputPin& cs) : cs_(cs), held_(true) { cs_.set(false); }
	~ChipSelectGuard() {
		if (!held_) return;
		try {
			cs_.set(true);
		} catch (const std::exception&) {
			// already unwinding from a transfer error
		}
	}

	void release() {
		held_ = false;
		cs_.set(true);
	}

	ChipSelectGuard(const ChipSelectGuard&) = delete;
	ChipSelectGuard& operator=(const ChipSelectGuard&) = delete;

private:
	OutputPin& cs_;
	bool held_;
};

// Input multiplexer address (A2..A0) of the command byte.
enum class Channel : uint8_t {
	Temp0 = 0x0,
	X = 0x1,
	Battery = 0x2,
	Z1 = 0x3,
	Z2 = 0x4,
	Y = 0x5,
	Aux = 0x6,
	Temp1 = 0x7
};

enum class Resolution : uint8_t {
	Bits12 = 12,
	Bits8 = 8
};

inline int adc_max(Resolution res) {
	return res == Resolution::Bits8 ? 255 : 4095;
}

// S A2 A1 A0 MODE SER/DFR PD1 PD0. PD=00 keeps PENIRQ enabled between conversions.
uint8_t make_command(Channel ch, Resolution res, bool single_ended);

// Position and pressure channels are differential, the rest single-ended.
bool is_single_ended(Channel ch);

// One framed conversion. The busy bit is kept, so a floating MISO line
// reads back above adc_max() instead of being masked into range.
int read_channel(SpiBus& bus, OutputPin& cs, uint8_t command, Resolution res);

} // namespace xpt2046

#endif // XPT2046_BUS_H
