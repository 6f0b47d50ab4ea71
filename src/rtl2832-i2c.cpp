// RTL2832 I2C tunnel

#include <boost/bind/bind.hpp>

#include "error.hpp"
#include "log.hpp"
#include "rtl2832-core.hpp"

namespace rtlsdrusb {

// One bus cycle on the IIC block. A stall means the target did not ack,
// a timeout leaves the cycle to be retried.
boost::system::error_code RTL2832Device::i2cAttempt (bool in, uint8_t addr, uint8_t *buf, uint16_t len,
	unsigned attempt, bool &done)
{
	boost::system::error_code ec;
	int r = usb->controlTransfer(in ? USB_CTRL_IN : USB_CTRL_OUT, 0, addr,
		in ? RTL2832_BLOCK_IIC << 8 : (RTL2832_BLOCK_IIC << 8) | 0x10, buf, len, timeout, ec);
	if (!ec && r >= len) {
		done = true;
		return ec;
	}
	if (ec == boost::system::errc::broken_pipe)
		return error::make_error_code(error::i2c_nack);
	if (ec == boost::system::errc::timed_out) {
		if(traceOut()) *traceOut() << "i2c: 0x" << std::hex << (unsigned)addr << std::dec
			<< " timed out, attempt " << attempt + 1 << std::endl;
		return boost::system::error_code();
	}
	return error::make_error_code(error::transport_error);
}

boost::system::error_code RTL2832Device::setI2cRepeater (bool on)
{
	return demodWriteReg(1, 0x01, on ? 0x18 : 0x10, 1);
}

boost::system::error_code RTL2832Device::i2cCycle (bool in, uint8_t addr, uint8_t *buf, uint16_t len)
{
	return pollUntil(i2cPolicy,
		boost::bind(&RTL2832Device::i2cAttempt, this, in, addr, buf, len,
			boost::placeholders::_1, boost::placeholders::_2),
		error::i2c_timeout);
}

boost::system::error_code RTL2832Device::i2cWriteBuf (uint8_t addr, const uint8_t *buf, uint16_t len)
{
	return i2cCycle(false, addr, const_cast<uint8_t *>(buf), len);
}

boost::system::error_code RTL2832Device::i2cReadBuf (uint8_t addr, uint8_t *buf, uint16_t len)
{
	return i2cCycle(true, addr, buf, len);
}

boost::system::error_code RTL2832Device::i2cWriteReg (uint8_t addr, uint8_t reg, uint8_t val)
{
	uint8_t data[2] = { reg, val };
	return i2cWriteBuf(addr, data, 2);
}

boost::system::error_code RTL2832Device::i2cReadReg (uint8_t addr, uint8_t reg, uint8_t &val)
{
	boost::system::error_code ec = i2cWriteBuf(addr, &reg, 1);
	if (ec)
		return ec;
	return i2cReadBuf(addr, &val, 1);
}

boost::system::error_code RTL2832Device::readEeprom (uint8_t offset, uint8_t *buf, int len)
{
	if (len < 0 || offset + len > RTL2832_EEPROM_SIZE)
		return error::make_error_code(error::invalid_argument);

	boost::system::error_code ec = i2cWriteBuf(RTL2832_EEPROM_ADDR, &offset, 1);
	if (ec)
		return ec;
	for (int i = 0; i < len; i++) {
		if ((ec = i2cReadBuf(RTL2832_EEPROM_ADDR, buf + i, 1)))
			return ec;
	}
	return ec;
}

}
