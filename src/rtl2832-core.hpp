// RTL2832 core

#ifndef _RTL2832_CORE_HPP_
#define _RTL2832_CORE_HPP_

#include <inttypes.h>

#include <boost/system/error_code.hpp>

#include "poll.hpp"
#include "usbops.hpp"

/* register blocks (wIndex high byte) */
#define RTL2832_BLOCK_DEMOD	0
#define RTL2832_BLOCK_USB	1
#define RTL2832_BLOCK_SYS	2
#define RTL2832_BLOCK_TUN	3
#define RTL2832_BLOCK_ROM	4
#define RTL2832_BLOCK_IR	5
#define RTL2832_BLOCK_IIC	6

/* USB block */
#define RTL2832_USB_SYSCTL		0x2000
#define RTL2832_USB_CTRL		0x2010
#define RTL2832_USB_STAT		0x2014
#define RTL2832_USB_EPA_CFG		0x2144
#define RTL2832_USB_EPA_CTL		0x2148
#define RTL2832_USB_EPA_MAXPKT		0x2158
#define RTL2832_USB_EPA_MAXPKT_2	0x215a
#define RTL2832_USB_EPA_FIFO_CFG	0x2160

/* SYS block */
#define RTL2832_SYS_DEMOD_CTL	0x3000
#define RTL2832_SYS_GPO			0x3001
#define RTL2832_SYS_GPI			0x3002
#define RTL2832_SYS_GPOE		0x3003
#define RTL2832_SYS_GPD			0x3004
#define RTL2832_SYS_SYSINTE		0x3005
#define RTL2832_SYS_SYSINTS		0x3006
#define RTL2832_SYS_GP_CFG0		0x3007
#define RTL2832_SYS_GP_CFG1		0x3008
#define RTL2832_SYS_SYSINTE_1	0x3009
#define RTL2832_SYS_SYSINTS_1	0x300a
#define RTL2832_SYS_DEMOD_CTL_1	0x300b
#define RTL2832_SYS_IR_SUSPEND	0x300c

#define RTL2832_EP_BULK			0x81
#define RTL2832_EEPROM_ADDR		0xa0
#define RTL2832_EEPROM_SIZE		256
#define RTL2832_CTRL_TIMEOUT	300

#define RTL2832_FIR_LEN			16
#define RTL2832_DEF_XTAL_FREQ	28800000
#define RTL2832_MIN_XTAL_FREQ	(RTL2832_DEF_XTAL_FREQ - 1000)
#define RTL2832_MAX_XTAL_FREQ	(RTL2832_DEF_XTAL_FREQ + 1000)

namespace rtlsdrusb {

extern const int RTL2832_DEFAULT_FIR[RTL2832_FIR_LEN];

// Register and I2C access to the RTL2832U over vendor control transfers.
// Does not own the transport.
class RTL2832Device
{
public:
	explicit RTL2832Device (UsbTransport *usb, unsigned timeoutMs = RTL2832_CTRL_TIMEOUT);

	// block register access, len 1 or 2, big-endian. DEMOD offsets are (page << 8) | addr.
	boost::system::error_code readReg (uint8_t block, uint16_t offset, uint8_t len, uint16_t &val);
	boost::system::error_code writeReg (uint8_t block, uint16_t offset, uint16_t val, uint8_t len);
	static bool isValidAddress (uint8_t block, uint16_t offset, uint8_t len);

	boost::system::error_code demodReadReg (uint8_t page, uint8_t addr, uint8_t len, uint16_t &val);
	boost::system::error_code demodWriteReg (uint8_t page, uint8_t addr, uint16_t val, uint8_t len);

	boost::system::error_code readArray (uint8_t block, uint16_t addr, uint8_t *buf, uint16_t len);
	boost::system::error_code writeArray (uint8_t block, uint16_t addr, const uint8_t *buf, uint16_t len);

	/* I2C tunnel (rtl2832-i2c.cpp) */
	boost::system::error_code setI2cRepeater (bool on);
	boost::system::error_code i2cWriteBuf (uint8_t addr, const uint8_t *buf, uint16_t len);
	boost::system::error_code i2cReadBuf (uint8_t addr, uint8_t *buf, uint16_t len);
	boost::system::error_code i2cWriteReg (uint8_t addr, uint8_t reg, uint8_t val);
	boost::system::error_code i2cReadReg (uint8_t addr, uint8_t reg, uint8_t &val);
	boost::system::error_code readEeprom (uint8_t offset, uint8_t *buf, int len);
	void setI2cPolicy (const PollPolicy &policy) { i2cPolicy = policy; }

	/* baseband */
	boost::system::error_code initBaseband ();
	boost::system::error_code deinitBaseband ();
	boost::system::error_code resetDemod ();
	boost::system::error_code setFir (const int fir[RTL2832_FIR_LEN]);
	boost::system::error_code setIfFreq (uint32_t freq, uint32_t xtal);
	boost::system::error_code writeResampleRatio (uint32_t ratio);
	boost::system::error_code resetBuffer ();
	boost::system::error_code setTestMode (bool on);
	boost::system::error_code setAgcMode (bool on);
	boost::system::error_code setGpioOutput (uint8_t gpio);
	boost::system::error_code setGpioBit (uint8_t gpio, bool on);

	UsbTransport *transport () const { return usb; }

private:
	boost::system::error_code checkTransfer (int r, uint16_t len, const boost::system::error_code &ec) const;
	boost::system::error_code i2cCycle (bool in, uint8_t addr, uint8_t *buf, uint16_t len);
	boost::system::error_code i2cAttempt (bool in, uint8_t addr, uint8_t *buf, uint16_t len,
		unsigned attempt, bool &done);

	UsbTransport *usb;
	unsigned timeout;
	PollPolicy i2cPolicy;
};

}

#endif
