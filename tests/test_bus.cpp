#include "fake_bus.h"
#include "xpt2046_bus.h"

#include <gtest/gtest.h>

#include <string>

using namespace xpt2046;

TEST(Command, PositionAndPressureMatchDatasheet) {
	EXPECT_EQ(0x90, make_command(Channel::X, Resolution::Bits12, false));
	EXPECT_EQ(0xD0, make_command(Channel::Y, Resolution::Bits12, false));
	EXPECT_EQ(0xB0, make_command(Channel::Z1, Resolution::Bits12, false));
	EXPECT_EQ(0xC0, make_command(Channel::Z2, Resolution::Bits12, false));
}

TEST(Command, AuxiliaryChannelsAreSingleEnded) {
	EXPECT_FALSE(is_single_ended(Channel::X));
	EXPECT_FALSE(is_single_ended(Channel::Z2));
	EXPECT_TRUE(is_single_ended(Channel::Temp0));
	EXPECT_TRUE(is_single_ended(Channel::Battery));
	EXPECT_EQ(0x84, make_command(Channel::Temp0, Resolution::Bits12, true));
	EXPECT_EQ(0xA4, make_command(Channel::Battery, Resolution::Bits12, true));
	EXPECT_EQ(0xE4, make_command(Channel::Aux, Resolution::Bits12, true));
	EXPECT_EQ(0xF4, make_command(Channel::Temp1, Resolution::Bits12, true));
}

TEST(Command, EightBitModeSetsModeBit) {
	EXPECT_EQ(0x98, make_command(Channel::X, Resolution::Bits8, false));
}

TEST(ReadChannel, DecodesTwelveBitResponse) {
	FakePin cs;
	FakeBus bus;
	bus.queue(0x90, {1234});

	EXPECT_EQ(1234, read_channel(bus, cs, 0x90, Resolution::Bits12));
	ASSERT_EQ(1u, bus.commands.size());
	EXPECT_EQ(0x90, bus.commands[0]);
}

TEST(ReadChannel, DecodesEightBitResponse) {
	FakePin cs;
	FakeBus bus;
	bus.shift = 7;
	bus.queue(0x98, {200});

	EXPECT_EQ(200, read_channel(bus, cs, 0x98, Resolution::Bits8));
}

TEST(ReadChannel, FloatingLineReadsAboveRange) {
	FakePin cs;
	FakeBus bus;
	bus.queue_word(0x90, 0xFFFF);

	EXPECT_GT(read_channel(bus, cs, 0x90, Resolution::Bits12), adc_max(Resolution::Bits12));
}

TEST(ReadChannel, ChipSelectLowOnlyDuringFrame) {
	FakePin cs;
	FakeBus bus;
	bus.watch(&cs.level);
	bus.queue(0xD0, {10});

	read_channel(bus, cs, 0xD0, Resolution::Bits12);

	ASSERT_EQ(1u, bus.cs_low_during_transfer.size());
	EXPECT_TRUE(bus.cs_low_during_transfer[0]);
	ASSERT_EQ(2u, cs.writes.size());
	EXPECT_FALSE(cs.writes[0]);
	EXPECT_TRUE(cs.writes[1]);
	EXPECT_TRUE(cs.level);
}

TEST(ReadChannel, ShortTransferThrowsAndReleasesChipSelect) {
	FakePin cs;
	FakeBus bus;
	bus.fail_after = 0;

	EXPECT_THROW(read_channel(bus, cs, 0x90, Resolution::Bits12), BusError);
	EXPECT_TRUE(cs.level);
}

TEST(ReadChannel, ZeroLengthTransferIsBusError) {
	FakePin cs;
	FakeBus bus;
	bus.fail_after = 0;
	bus.short_length = 0;

	EXPECT_THROW(read_channel(bus, cs, 0xB0, Resolution::Bits12), BusError);
	EXPECT_TRUE(cs.level);
}

TEST(ReadChannel, ChipSelectReleaseFailureIsBusError) {
	FakePin cs;
	FakeBus bus;
	bus.queue(0x90, {1234});
	cs.fail_release = true;

	EXPECT_THROW(read_channel(bus, cs, 0x90, Resolution::Bits12), BusError);
	// one release attempt only, not a second one from the guard
	ASSERT_EQ(2u, cs.writes.size());
	EXPECT_TRUE(cs.writes[1]);
}

TEST(ReadChannel, TransferErrorWinsOverReleaseFailure) {
	FakePin cs;
	FakeBus bus;
	bus.throw_transfer = true;
	cs.fail_release = true;

	try {
		read_channel(bus, cs, 0x90, Resolution::Bits12);
		FAIL() << "expected BusError";
	} catch (const BusError& e) {
		EXPECT_EQ(std::string("spi ioctl failed"), e.what());
	}
	ASSERT_EQ(2u, cs.writes.size());
}
