#include <errno.h>

#include <catch2/catch.hpp>

#include "error.hpp"
#include "test_support.hpp"

using namespace rtlsdrusb;
using rtlsdrusb::test::Bench;

TEST_CASE("block register write then read returns the value", "[register]")
{
	Bench b;
	uint16_t v = 0;

	REQUIRE(!b.rtl.writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL, 0x1002, 2));
	REQUIRE(!b.rtl.readReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL, 2, v));
	CHECK(v == 0x1002);

	REQUIRE(!b.rtl.writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO, 0xa5, 1));
	REQUIRE(!b.rtl.readReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO, 1, v));
	CHECK(v == 0xa5);
}

TEST_CASE("two byte registers go out MSB first", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_MAXPKT, 0x0002, 2));

	const SimCall &c = b.dev->calls.back();
	CHECK(c.requestType == USB_CTRL_OUT);
	CHECK(c.request == 0);
	CHECK(c.value == RTL2832_USB_EPA_MAXPKT);
	CHECK(c.index == ((RTL2832_BLOCK_USB << 8) | 0x10));
	REQUIRE(c.data.size() == 2);
	CHECK(c.data[0] == 0x00);
	CHECK(c.data[1] == 0x02);
	CHECK(b.dev->peek(RTL2832_BLOCK_USB, RTL2832_USB_EPA_MAXPKT + 1) == 0x02);
}

TEST_CASE("demod writes use the page encoding and a dummy read", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.demodWriteReg(1, 0x15, 0x01, 1));

	REQUIRE(b.dev->calls.size() == 2);
	CHECK(b.dev->calls[0].value == ((0x15 << 8) | 0x20));
	CHECK(b.dev->calls[0].index == 0x11);
	CHECK((b.dev->calls[1].requestType & USB_DIR_IN) != 0);
	CHECK(b.dev->calls[1].value == ((0x01 << 8) | 0x20));
	CHECK(b.dev->calls[1].index == 0x0a);
	CHECK(b.dev->demod(1, 0x15) == 0x01);

	uint16_t v = 0;
	REQUIRE(!b.rtl.readReg(RTL2832_BLOCK_DEMOD, (1 << 8) | 0x15, 1, v));
	CHECK(v == 0x01);
}

TEST_CASE("addresses outside a block are rejected before any transfer", "[register]")
{
	Bench b;
	uint16_t v;
	const boost::system::error_code invalid = error::make_error_code(error::invalid_address);

	CHECK(b.rtl.readReg(RTL2832_BLOCK_DEMOD, 0x0500, 1, v) == invalid);
	CHECK(b.rtl.readReg(RTL2832_BLOCK_DEMOD, 0x01ff, 2, v) == invalid);
	CHECK(b.rtl.readReg(RTL2832_BLOCK_USB, 0x1fff, 1, v) == invalid);
	CHECK(b.rtl.readReg(RTL2832_BLOCK_USB, 0x2fff, 2, v) == invalid);
	CHECK(b.rtl.writeReg(RTL2832_BLOCK_SYS, 0x3100, 0, 1) == invalid);
	CHECK(b.rtl.writeReg(RTL2832_BLOCK_TUN, 0x0100, 0, 1) == invalid);
	CHECK(b.rtl.readReg(RTL2832_BLOCK_IIC, 0x34, 1, v) == invalid);
	CHECK(b.rtl.readReg(RTL2832_BLOCK_USB, 0x2000, 3, v) == invalid);
	CHECK(b.rtl.readReg(7, 0x0000, 1, v) == invalid);
	CHECK(b.rtl.demodWriteReg(5, 0x00, 0, 1) == invalid);

	CHECK(b.dev->calls.empty());
}

TEST_CASE("failed transfers are transport errors", "[register]")
{
	Bench b;
	uint16_t v;

	b.dev->failControls = 1;
	b.dev->failErrno = EIO;
	CHECK(b.rtl.readReg(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL, 1, v)
		== error::make_error_code(error::transport_error));

	// a stall on a plain register is not an I2C condition
	b.dev->failControls = 1;
	b.dev->failErrno = EPIPE;
	CHECK(b.rtl.writeReg(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL, 0x09, 1)
		== error::make_error_code(error::transport_error));

	CHECK(!b.rtl.writeReg(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL, 0x09, 1));
}

TEST_CASE("FIR coefficients are packed 8 x int8 then 8 x int12", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.setFir(RTL2832_DEFAULT_FIR));

	CHECK(b.dev->demod(1, 0x1c) == 0xca);	// -54
	CHECK(b.dev->demod(1, 0x23) == 53);
	// 101, 156
	CHECK(b.dev->demod(1, 0x24) == 0x06);
	CHECK(b.dev->demod(1, 0x25) == 0x50);
	CHECK(b.dev->demod(1, 0x26) == 0x9c);

	int bad[RTL2832_FIR_LEN];
	for (int i = 0; i < RTL2832_FIR_LEN; i++)
		bad[i] = RTL2832_DEFAULT_FIR[i];
	bad[12] = 4096;
	size_t before = b.dev->calls.size();
	CHECK(b.rtl.setFir(bad) == error::make_error_code(error::invalid_argument));
	CHECK(b.dev->calls.size() == before);
}

TEST_CASE("IF frequency is a negative 22 bit fraction of the crystal", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.setIfFreq(3570000, RTL2832_DEF_XTAL_FREQ));
	CHECK(b.dev->demod(1, 0x19) == 0x38);
	CHECK(b.dev->demod(1, 0x1a) == 0x11);
	CHECK(b.dev->demod(1, 0x1b) == 0x12);
}

TEST_CASE("resample ratio is split across 0x9f and 0xa1", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.writeResampleRatio(0x03840b84));
	CHECK(b.dev->demod16(1, 0x9f) == 0x0384);
	CHECK(b.dev->demod16(1, 0xa1) == 0x0b84);
}

TEST_CASE("baseband init powers the demod and enables SDR mode", "[register]")
{
	Bench b;
	REQUIRE(!b.rtl.initBaseband());

	CHECK(b.dev->peek(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL) == 0x09);
	CHECK(b.dev->peek16(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL) == 0x1002);
	CHECK(b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL) == 0xe8);
	CHECK(b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL_1) == 0x22);
	CHECK(b.dev->demod(0, 0x19) == 0x05);
	CHECK(b.dev->demod(1, 0xb1) == 0x1b);
	CHECK(b.dev->demod(0, 0x0d) == 0x83);

	REQUIRE(!b.rtl.deinitBaseband());
	CHECK(b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL) == 0x20);
}

TEST_CASE("GPIO output and bit", "[register]")
{
	Bench b;
	b.dev->poke(RTL2832_BLOCK_SYS, RTL2832_SYS_GPD, 0xff);

	REQUIRE(!b.rtl.setGpioOutput(0));
	CHECK(b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPD) == 0xfe);
	CHECK((b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPOE) & 0x01) == 0x01);

	REQUIRE(!b.rtl.setGpioBit(0, true));
	CHECK((b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x01);
	REQUIRE(!b.rtl.setGpioBit(0, false));
	CHECK((b.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x00);
}
