
#include <string.h>

#include "error.hpp"
#include "log.hpp"
#include "rtl2832-core.hpp"

namespace rtlsdrusb {

const int RTL2832_DEFAULT_FIR[RTL2832_FIR_LEN] = {
	-54, -36, -41, -40, -32, -14, 14, 53,	/* 8 bit signed */
	101, 156, 215, 273, 327, 372, 404, 421	/* 12 bit signed */
};

static const PollPolicy DEFAULT_I2C_POLICY = { 3, 5 };

RTL2832Device::RTL2832Device (UsbTransport *usb, unsigned timeoutMs)
: usb(usb), timeout(timeoutMs), i2cPolicy(DEFAULT_I2C_POLICY)
{
}

bool RTL2832Device::isValidAddress (uint8_t block, uint16_t offset, uint8_t len)
{
	if (len != 1 && len != 2)
		return false;
	uint32_t last = uint32_t(offset) + len - 1;
	switch (block) {
	case RTL2832_BLOCK_DEMOD:
		// page 0..4, the register may not run past the end of the page
		return (offset >> 8) <= 4 && (last >> 8) == (offset >> 8);
	case RTL2832_BLOCK_USB:
		return offset >= 0x2000 && last <= 0x2fff;
	case RTL2832_BLOCK_SYS:
		return offset >= 0x3000 && last <= 0x30ff;
	case RTL2832_BLOCK_TUN:
		return last <= 0xff;
	case RTL2832_BLOCK_ROM:
	case RTL2832_BLOCK_IR:
		return last <= 0xffff;
	default:
		// IIC is only reachable through the I2C tunnel
		return false;
	}
}

boost::system::error_code RTL2832Device::checkTransfer (int r, uint16_t len, const boost::system::error_code &ec) const
{
	if (ec || r < 0) {
		if(traceOut()) *traceOut() << "rtl2832: transfer failed: " << ec.message() << std::endl;
		return error::make_error_code(error::transport_error);
	}
	if (r < len)
		return error::make_error_code(error::transport_error);
	return boost::system::error_code();
}

boost::system::error_code RTL2832Device::readReg (uint8_t block, uint16_t offset, uint8_t len, uint16_t &val)
{
	if (!isValidAddress(block, offset, len))
		return error::make_error_code(error::invalid_address);
	if (block == RTL2832_BLOCK_DEMOD)
		return demodReadReg(offset >> 8, offset & 0xff, len, val);

	uint8_t data[2] = {0, 0};
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_IN, 0, offset, block << 8, data, len, timeout, ec);
	if ((ec = checkTransfer(r, len, ec)))
		return ec;
	val = len == 2 ? (data[0] << 8) | data[1] : data[0];
	return ec;
}

boost::system::error_code RTL2832Device::writeReg (uint8_t block, uint16_t offset, uint16_t val, uint8_t len)
{
	if (!isValidAddress(block, offset, len))
		return error::make_error_code(error::invalid_address);
	if (block == RTL2832_BLOCK_DEMOD)
		return demodWriteReg(offset >> 8, offset & 0xff, val, len);

	uint8_t data[2];
	if (len == 1) {
		data[0] = val & 0xff;
	} else {
		data[0] = val >> 8;
		data[1] = val & 0xff;
	}
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_OUT, 0, offset, (block << 8) | 0x10, data, len, timeout, ec);
	return checkTransfer(r, len, ec);
}

boost::system::error_code RTL2832Device::demodReadReg (uint8_t page, uint8_t addr, uint8_t len, uint16_t &val)
{
	if (page > 4 || (len != 1 && len != 2))
		return error::make_error_code(error::invalid_address);

	uint8_t data[2] = {0, 0};
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_IN, 0, (addr << 8) | 0x20, page, data, len, timeout, ec);
	if ((ec = checkTransfer(r, len, ec)))
		return ec;
	val = len == 2 ? (data[0] << 8) | data[1] : data[0];
	return ec;
}

boost::system::error_code RTL2832Device::demodWriteReg (uint8_t page, uint8_t addr, uint16_t val, uint8_t len)
{
	if (page > 4 || (len != 1 && len != 2))
		return error::make_error_code(error::invalid_address);

	uint8_t data[2];
	if (len == 1) {
		data[0] = val & 0xff;
	} else {
		data[0] = val >> 8;
		data[1] = val & 0xff;
	}
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_OUT, 0, (addr << 8) | 0x20, 0x10 | page, data, len, timeout, ec);
	if ((ec = checkTransfer(r, len, ec)))
		return ec;

	// the demod needs a read of page 0x0a reg 0x01 after every write
	uint8_t dummy;
	r = usb->controlTransfer(USB_CTRL_IN, 0, (0x01 << 8) | 0x20, 0x0a, &dummy, 1, timeout, ec);
	return checkTransfer(r, 1, ec);
}

boost::system::error_code RTL2832Device::readArray (uint8_t block, uint16_t addr, uint8_t *buf, uint16_t len)
{
	if (block > RTL2832_BLOCK_IIC)
		return error::make_error_code(error::invalid_address);
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_IN, 0, addr, block << 8, buf, len, timeout, ec);
	return checkTransfer(r, len, ec);
}

boost::system::error_code RTL2832Device::writeArray (uint8_t block, uint16_t addr, const uint8_t *buf, uint16_t len)
{
	if (block > RTL2832_BLOCK_IIC)
		return error::make_error_code(error::invalid_address);
	uint8_t data[256];
	if (len > sizeof(data))
		return error::make_error_code(error::invalid_argument);
	memcpy(data, buf, len);
	boost::system::error_code ec;
	int r = usb->controlTransfer(USB_CTRL_OUT, 0, addr, (block << 8) | 0x10, data, len, timeout, ec);
	return checkTransfer(r, len, ec);
}

/* baseband */

boost::system::error_code RTL2832Device::initBaseband ()
{
	boost::system::error_code ec;

	// initialize USB
	if ((ec = writeReg(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL, 0x09, 1))
	|| (ec = writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_MAXPKT, 0x0002, 2))
	|| (ec = writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL, 0x1002, 2)))
		return ec;

	// poweron demod
	if ((ec = writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL_1, 0x22, 1))
	|| (ec = writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL, 0xe8, 1)))
		return ec;

	if ((ec = resetDemod()))
		return ec;

	// disable spectrum inversion and adjacent channel rejection
	if ((ec = demodWriteReg(1, 0x15, 0x00, 1))
	|| (ec = demodWriteReg(1, 0x16, 0x0000, 2)))
		return ec;

	// clear both DDC shift and IF frequency registers
	for (uint8_t i = 0; i < 6; i++) {
		if ((ec = demodWriteReg(1, 0x16 + i, 0x00, 1)))
			return ec;
	}

	if ((ec = setFir(RTL2832_DEFAULT_FIR)))
		return ec;

	// enable SDR mode, disable DAGC (bit 5)
	if ((ec = demodWriteReg(0, 0x19, 0x05, 1)))
		return ec;

	// init FSM state-holding register
	if ((ec = demodWriteReg(1, 0x93, 0xf0, 1))
	|| (ec = demodWriteReg(1, 0x94, 0x0f, 1)))
		return ec;

	// disable AGC (en_dagc, bit 0)
	if ((ec = demodWriteReg(1, 0x11, 0x00, 1)))
		return ec;

	// disable RF and IF AGC loop
	if ((ec = demodWriteReg(1, 0x04, 0x00, 1)))
		return ec;

	// disable PID filter
	if ((ec = demodWriteReg(0, 0x61, 0x60, 1)))
		return ec;

	// opt_adc_iq = 0, default ADC_I/ADC_Q datapath
	if ((ec = demodWriteReg(0, 0x06, 0x80, 1)))
		return ec;

	// enable Zero-IF mode, DC cancellation, and IQ estimation/compensation
	if ((ec = demodWriteReg(1, 0xb1, 0x1b, 1)))
		return ec;

	// disable 4.096 MHz clock output on pin TP_CK0
	return demodWriteReg(0, 0x0d, 0x83, 1);
}

boost::system::error_code RTL2832Device::deinitBaseband ()
{
	// poweroff demodulator and ADCs
	return writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL, 0x20, 1);
}

boost::system::error_code RTL2832Device::resetDemod ()
{
	boost::system::error_code ec;
	// soft_rst, bit 2
	if ((ec = demodWriteReg(1, 0x01, 0x14, 1)))
		return ec;
	return demodWriteReg(1, 0x01, 0x10, 1);
}

boost::system::error_code RTL2832Device::setFir (const int fir[RTL2832_FIR_LEN])
{
	uint8_t tmp[20];

	// 8 x int8
	for (int i = 0; i < 8; i++) {
		if (fir[i] < -128 || fir[i] > 127)
			return error::make_error_code(error::invalid_argument);
		tmp[i] = fir[i] & 0xff;
	}
	// 8 x int12, packed as 3 bytes per pair
	for (int i = 0; i < 8; i += 2) {
		int val0 = fir[8 + i];
		int val1 = fir[8 + i + 1];
		if (val0 < -2048 || val0 > 2047 || val1 < -2048 || val1 > 2047)
			return error::make_error_code(error::invalid_argument);
		tmp[8 + i * 3 / 2] = (val0 >> 4) & 0xff;
		tmp[8 + i * 3 / 2 + 1] = ((val0 << 4) | ((val1 >> 8) & 0x0f)) & 0xff;
		tmp[8 + i * 3 / 2 + 2] = val1 & 0xff;
	}

	boost::system::error_code ec;
	for (uint8_t i = 0; i < sizeof(tmp); i++) {
		if ((ec = demodWriteReg(1, 0x1c + i, tmp[i], 1)))
			return ec;
	}
	return ec;
}

boost::system::error_code RTL2832Device::setIfFreq (uint32_t freq, uint32_t xtal)
{
	if (xtal == 0)
		return error::make_error_code(error::invalid_argument);
	int32_t if_freq = -(int32_t)(((int64_t)freq << 22) / xtal);

	boost::system::error_code ec;
	if ((ec = demodWriteReg(1, 0x19, (if_freq >> 16) & 0x3f, 1))
	|| (ec = demodWriteReg(1, 0x1a, (if_freq >> 8) & 0xff, 1))
	|| (ec = demodWriteReg(1, 0x1b, if_freq & 0xff, 1)))
		return ec;
	if(traceOut()) *traceOut() << "rtl2832: if " << freq << " Hz, reg " << (if_freq & 0x3fffff) << std::endl;
	return ec;
}

boost::system::error_code RTL2832Device::writeResampleRatio (uint32_t ratio)
{
	boost::system::error_code ec;
	if ((ec = demodWriteReg(1, 0x9f, (ratio >> 16) & 0xffff, 2)))
		return ec;
	return demodWriteReg(1, 0xa1, ratio & 0xffff, 2);
}

boost::system::error_code RTL2832Device::resetBuffer ()
{
	boost::system::error_code ec;
	if ((ec = writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL, 0x1002, 2)))
		return ec;
	return writeReg(RTL2832_BLOCK_USB, RTL2832_USB_EPA_CTL, 0x0000, 2);
}

boost::system::error_code RTL2832Device::setTestMode (bool on)
{
	return demodWriteReg(0, 0x19, on ? 0x03 : 0x05, 1);
}

boost::system::error_code RTL2832Device::setAgcMode (bool on)
{
	return demodWriteReg(0, 0x19, on ? 0x25 : 0x05, 1);
}

boost::system::error_code RTL2832Device::setGpioOutput (uint8_t gpio)
{
	uint8_t bit = 1 << gpio;
	uint16_t r;
	boost::system::error_code ec;
	if ((ec = readReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPD, 1, r))
	|| (ec = writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPD, r & ~bit, 1)))
		return ec;
	if ((ec = readReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPOE, 1, r)))
		return ec;
	return writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPOE, r | bit, 1);
}

boost::system::error_code RTL2832Device::setGpioBit (uint8_t gpio, bool on)
{
	uint8_t bit = 1 << gpio;
	uint16_t r;
	boost::system::error_code ec;
	if ((ec = readReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO, 1, r)))
		return ec;
	r = on ? (r | bit) : (r & ~bit);
	return writeReg(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO, r, 1);
}

}
