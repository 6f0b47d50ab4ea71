// 疑似デバイス (テスト用トランスポート)

#ifndef _SIM_TRANSPORT_HPP_
#define _SIM_TRANSPORT_HPP_

#include <map>
#include <vector>
#include <string>

#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>

#include "usbops.hpp"

namespace rtlsdrusb {

// I2C target behind the IIC block. A write sets the pointer from its first
// byte and stores the rest in regs[]. A read returns data[] from the pointer
// and advances it.
struct SimI2cPeripheral {
	uint8_t regs[256];
	uint8_t data[256];
	uint8_t pointer;
	bool nack;
	unsigned timeouts;	// upcoming bus cycles that time out
	unsigned cycles;

	SimI2cPeripheral ();

	// R82xx chips return every byte bit-reversed
	void setStatus (uint8_t idx, uint8_t value);
};

struct SimCall {
	enum Kind { CONTROL, BULK, CLAIM, RELEASE, RESET };
	Kind kind;
	uint8_t requestType;
	uint8_t request;
	uint16_t value;
	uint16_t index;
	std::vector<uint8_t> data;
};

class SimDevice
{
public:
	SimDevice (uint16_t vendorId, uint16_t productId, const std::string &serial);

	uint16_t vendorId;
	uint16_t productId;
	std::string manufacturer;
	std::string product;
	std::string serial;

	std::map<uint32_t, uint8_t> memory;	// (block << 16) | offset, demod pages as (page << 8) | addr
	std::map<uint8_t, SimI2cPeripheral> i2c;
	std::vector<SimCall> calls;

	bool claimed;
	unsigned resets;
	int failControls;	// next N control transfers fail with failErrno
	int failErrno;
	boost::function<bool (const SimCall &)> failIf;	// fail matching control transfers with failErrno
	bool bulkFail;
	int bulkChunk;		// 0 = fill the whole request
	unsigned bulkEmpty;	// upcoming bulk transfers that return no data
	uint8_t bulkCounter;
	unsigned bulkReads;
	boost::function<void ()> onBulk;

	SimI2cPeripheral &addPeripheral (uint8_t addr);
	SimI2cPeripheral &addR820T ();
	SimI2cPeripheral &addR828D ();
	SimI2cPeripheral &addEeprom ();

	uint8_t peek (uint8_t block, uint16_t offset) const;
	uint16_t peek16 (uint8_t block, uint16_t offset) const;
	uint8_t demod (uint8_t page, uint8_t addr) const;
	uint16_t demod16 (uint8_t page, uint8_t addr) const;
	void poke (uint8_t block, uint16_t offset, uint8_t value);

	size_t countControlWrites (uint16_t value, uint16_t index) const;

	int control (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
		uint8_t *data, uint16_t length, boost::system::error_code &ec);
	int bulk (uint8_t endpoint, uint8_t *data, int length, boost::system::error_code &ec);

private:
	int i2cCycle (bool in, uint8_t addr, uint8_t *data, uint16_t length, boost::system::error_code &ec);
	int descriptor (uint16_t value, uint8_t *data, uint16_t length, boost::system::error_code &ec);
};

typedef boost::shared_ptr<SimDevice> SimDevicePtr;

class SimTransport : public UsbTransport
{
public:
	explicit SimTransport (const SimDevicePtr &dev);
	~SimTransport ();

	int controlTransfer (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
		uint8_t *data, uint16_t length, unsigned timeoutMs, boost::system::error_code &ec);
	int bulkTransfer (uint8_t endpoint, uint8_t *data, int length, unsigned timeoutMs,
		boost::system::error_code &ec);
	boost::system::error_code claimInterface (unsigned int interface);
	boost::system::error_code releaseInterface (unsigned int interface);
	boost::system::error_code resetDevice ();
	boost::system::error_code deviceDescriptor (usb_device_descriptor &desc);

private:
	SimDevicePtr dev;
	bool holdsClaim;
};

class SimBus : public UsbBus
{
public:
	SimDevicePtr addDevice (uint16_t vendorId, uint16_t productId, const std::string &serial);
	void addFd (int fd, const SimDevicePtr &dev);

	boost::system::error_code listDevices (std::vector<UsbDeviceInfo> &devices);
	boost::system::error_code readStrings (UsbDeviceInfo &info);
	UsbTransport *openDevice (const std::string &path, boost::system::error_code &ec);
	UsbTransport *wrapDevice (int fd, boost::system::error_code &ec);

	unsigned opened;

	SimBus () : opened(0) {}

private:
	SimDevicePtr find (const std::string &path) const;

	std::vector<SimDevicePtr> devices;
	std::map<int, SimDevicePtr> fds;
};

}

#endif
