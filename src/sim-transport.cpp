// 疑似デバイス (テスト用トランスポート)

#include <errno.h>
#include <string.h>
#include <stdio.h>

#include "error.hpp"
#include "sim-transport.hpp"

#define SIM_BLOCK_DEMOD	0
#define SIM_BLOCK_IIC	6

namespace rtlsdrusb {

static inline boost::system::error_code errnoCode (int e)
{
	return boost::system::error_code(e, boost::system::system_category());
}

static uint8_t bitrev8 (uint8_t b)
{
	uint8_t r = 0;
	for (int i = 0; i < 8; i++) {
		r = (r << 1) | (b & 1);
		b >>= 1;
	}
	return r;
}

SimI2cPeripheral::SimI2cPeripheral ()
: pointer(0), nack(false), timeouts(0), cycles(0)
{
	memset(regs, 0, sizeof(regs));
	memset(data, 0, sizeof(data));
}

void SimI2cPeripheral::setStatus (uint8_t idx, uint8_t value)
{
	data[idx] = bitrev8(value);
}

SimDevice::SimDevice (uint16_t vendorId, uint16_t productId, const std::string &serial)
: vendorId(vendorId), productId(productId), manufacturer("Realtek"), product("RTL2838UHIDIR"),
  serial(serial), claimed(false), resets(0), failControls(0), failErrno(EIO),
  bulkFail(false), bulkChunk(0), bulkEmpty(0), bulkCounter(0), bulkReads(0)
{
}

SimI2cPeripheral &SimDevice::addPeripheral (uint8_t addr)
{
	return i2c[addr];
}

SimI2cPeripheral &SimDevice::addR820T ()
{
	SimI2cPeripheral &p = addPeripheral(0x34);
	p.data[0] = 0x69;		// chip id, read raw by tuner detection
	p.setStatus(2, 0x40);	// PLL locked
	p.setStatus(4, 0x28);	// VCO fine tune 2, filter calibration code 8
	return p;
}

SimI2cPeripheral &SimDevice::addR828D ()
{
	SimI2cPeripheral &p = addPeripheral(0x74);
	p.data[0] = 0x69;
	p.setStatus(2, 0x40);
	p.setStatus(4, 0x18);	// VCO fine tune 1
	return p;
}

SimI2cPeripheral &SimDevice::addEeprom ()
{
	SimI2cPeripheral &p = addPeripheral(0xa0);
	memset(p.data, 0, sizeof(p.data));
	p.data[7] = 0x02;	// bias tee and direct sampling not forced
	return p;
}

uint8_t SimDevice::peek (uint8_t block, uint16_t offset) const
{
	std::map<uint32_t, uint8_t>::const_iterator it = memory.find((uint32_t(block) << 16) | offset);
	return it == memory.end() ? 0 : it->second;
}

uint16_t SimDevice::peek16 (uint8_t block, uint16_t offset) const
{
	return (peek(block, offset) << 8) | peek(block, offset + 1);
}

uint8_t SimDevice::demod (uint8_t page, uint8_t addr) const
{
	return peek(SIM_BLOCK_DEMOD, (page << 8) | addr);
}

uint16_t SimDevice::demod16 (uint8_t page, uint8_t addr) const
{
	return (demod(page, addr) << 8) | demod(page, addr + 1);
}

void SimDevice::poke (uint8_t block, uint16_t offset, uint8_t value)
{
	memory[(uint32_t(block) << 16) | offset] = value;
}

size_t SimDevice::countControlWrites (uint16_t value, uint16_t index) const
{
	size_t n = 0;
	for (size_t i = 0; i < calls.size(); i++) {
		const SimCall &c = calls[i];
		if (c.kind == SimCall::CONTROL && !(c.requestType & USB_DIR_IN) && c.value == value && c.index == index)
			n++;
	}
	return n;
}

int SimDevice::control (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
	uint8_t *data, uint16_t length, boost::system::error_code &ec)
{
	SimCall call;
	call.kind = SimCall::CONTROL;
	call.requestType = requestType;
	call.request = request;
	call.value = value;
	call.index = index;
	if (!(requestType & USB_DIR_IN))
		call.data.assign(data, data + length);
	calls.push_back(call);

	if (failControls > 0) {
		failControls--;
		ec = errnoCode(failErrno);
		return -1;
	}
	if (failIf && failIf(call)) {
		ec = errnoCode(failErrno);
		return -1;
	}

	if (requestType == (USB_DIR_IN | USB_TYPE_STANDARD | USB_RECIP_DEVICE) && request == USB_REQ_GET_DESCRIPTOR)
		return descriptor(value, data, length, ec);
	if ((requestType & USB_TYPE_MASK) != USB_TYPE_VENDOR || request != 0) {
		ec = errnoCode(EPIPE);
		return -1;
	}

	bool in = (requestType & USB_DIR_IN) != 0;
	uint8_t block = index >> 8;
	if (block == SIM_BLOCK_IIC)
		return i2cCycle(in, value & 0xff, data, length, ec);

	uint32_t base;
	if (block == SIM_BLOCK_DEMOD) {
		if ((value & 0xff) != 0x20) {
			ec = errnoCode(EPIPE);
			return -1;
		}
		base = ((index & 0x0f) << 8) | (value >> 8);
	} else {
		base = (uint32_t(block) << 16) | value;
	}

	for (uint16_t i = 0; i < length; i++) {
		if (in) {
			std::map<uint32_t, uint8_t>::const_iterator it = memory.find(base + i);
			data[i] = it == memory.end() ? 0 : it->second;
		} else {
			memory[base + i] = data[i];
		}
	}
	return length;
}

int SimDevice::i2cCycle (bool in, uint8_t addr, uint8_t *data, uint16_t length, boost::system::error_code &ec)
{
	std::map<uint8_t, SimI2cPeripheral>::iterator it = i2c.find(addr);
	if (it == i2c.end() || it->second.nack) {
		ec = errnoCode(EPIPE);
		return -1;
	}
	SimI2cPeripheral &p = it->second;
	if (p.timeouts > 0) {
		p.timeouts--;
		ec = errnoCode(ETIMEDOUT);
		return -1;
	}
	p.cycles++;

	if (in) {
		for (uint16_t i = 0; i < length; i++)
			data[i] = p.data[p.pointer++];
	} else if (length > 0) {
		p.pointer = data[0];
		for (uint16_t i = 1; i < length; i++)
			p.regs[(p.pointer + i - 1) & 0xff] = data[i];
	}
	return length;
}

int SimDevice::descriptor (uint16_t value, uint8_t *data, uint16_t length, boost::system::error_code &ec)
{
	if ((value >> 8) != USB_DT_STRING) {
		ec = errnoCode(EPIPE);
		return -1;
	}
	uint8_t buf[255];
	int len;
	uint8_t idx = value & 0xff;
	if (idx == 0) {
		buf[2] = 0x09;	// en-US
		buf[3] = 0x04;
		len = 4;
	} else {
		const std::string *s = idx == 1 ? &manufacturer : idx == 2 ? &product : idx == 3 ? &serial : NULL;
		if (!s) {
			ec = errnoCode(EPIPE);
			return -1;
		}
		len = 2;
		for (size_t i = 0; i < s->size() && len + 2 <= (int)sizeof(buf); i++) {
			buf[len++] = (*s)[i];
			buf[len++] = 0;
		}
	}
	buf[0] = len;
	buf[1] = USB_DT_STRING;
	if (len > length)
		len = length;
	memcpy(data, buf, len);
	return len;
}

int SimDevice::bulk (uint8_t endpoint, uint8_t *data, int length, boost::system::error_code &ec)
{
	SimCall call;
	call.kind = SimCall::BULK;
	call.requestType = endpoint;
	call.request = 0;
	call.value = 0;
	call.index = 0;
	calls.push_back(call);

	if (onBulk)
		onBulk();
	if (bulkFail) {
		ec = errnoCode(EIO);
		return -1;
	}
	if (bulkEmpty > 0) {
		bulkEmpty--;
		return 0;
	}
	int n = (bulkChunk > 0 && bulkChunk < length) ? bulkChunk : length;
	for (int i = 0; i < n; i++)
		data[i] = bulkCounter++;
	bulkReads++;
	return n;
}

/* SimTransport */

SimTransport::SimTransport (const SimDevicePtr &dev)
: dev(dev), holdsClaim(false)
{
}

SimTransport::~SimTransport ()
{
	if (holdsClaim)
		dev->claimed = false;
}

int SimTransport::controlTransfer (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
	uint8_t *data, uint16_t length, unsigned timeoutMs, boost::system::error_code &ec)
{
	return dev->control(requestType, request, value, index, data, length, ec);
}

int SimTransport::bulkTransfer (uint8_t endpoint, uint8_t *data, int length, unsigned timeoutMs,
	boost::system::error_code &ec)
{
	return dev->bulk(endpoint, data, length, ec);
}

boost::system::error_code SimTransport::claimInterface (unsigned int interface)
{
	SimCall call = {SimCall::CLAIM, 0, 0, (uint16_t)interface, 0, std::vector<uint8_t>()};
	dev->calls.push_back(call);
	if (holdsClaim)
		return boost::system::error_code();
	if (dev->claimed)
		return error::make_error_code(error::device_busy);
	dev->claimed = true;
	holdsClaim = true;
	return boost::system::error_code();
}

boost::system::error_code SimTransport::releaseInterface (unsigned int interface)
{
	SimCall call = {SimCall::RELEASE, 0, 0, (uint16_t)interface, 0, std::vector<uint8_t>()};
	dev->calls.push_back(call);
	if (holdsClaim) {
		dev->claimed = false;
		holdsClaim = false;
	}
	return boost::system::error_code();
}

boost::system::error_code SimTransport::resetDevice ()
{
	SimCall call = {SimCall::RESET, 0, 0, 0, 0, std::vector<uint8_t>()};
	dev->calls.push_back(call);
	dev->resets++;
	return boost::system::error_code();
}

boost::system::error_code SimTransport::deviceDescriptor (usb_device_descriptor &desc)
{
	memset(&desc, 0, sizeof(desc));
	desc.bLength = USB_DT_DEVICE_SIZE;
	desc.bDescriptorType = USB_DT_DEVICE;
	desc.idVendor = dev->vendorId;
	desc.idProduct = dev->productId;
	desc.iManufacturer = 1;
	desc.iProduct = 2;
	desc.iSerialNumber = 3;
	return boost::system::error_code();
}

/* SimBus */

SimDevicePtr SimBus::addDevice (uint16_t vendorId, uint16_t productId, const std::string &serial)
{
	SimDevicePtr dev(new SimDevice(vendorId, productId, serial));
	devices.push_back(dev);
	return dev;
}

void SimBus::addFd (int fd, const SimDevicePtr &dev)
{
	fds[fd] = dev;
}

static std::string simPath (size_t i)
{
	char buf[32];
	snprintf(buf, sizeof(buf), "sim/001/%03u", (unsigned)(i + 1));
	return buf;
}

boost::system::error_code SimBus::listDevices (std::vector<UsbDeviceInfo> &out)
{
	out.clear();
	for (size_t i = 0; i < devices.size(); i++) {
		UsbDeviceInfo info;
		info.path = simPath(i);
		info.vendorId = devices[i]->vendorId;
		info.productId = devices[i]->productId;
		info.iManufacturer = 1;
		info.iProduct = 2;
		info.iSerialNumber = 3;
		out.push_back(info);
	}
	return boost::system::error_code();
}

boost::system::error_code SimBus::readStrings (UsbDeviceInfo &info)
{
	SimDevicePtr dev = find(info.path);
	if (!dev)
		return error::make_error_code(error::device_not_found);
	SimTransport usb(dev);
	boost::system::error_code ec;
	if ((ec = usb_getstring(usb, info.iManufacturer, info.manufacturer)))
		return ec;
	if ((ec = usb_getstring(usb, info.iProduct, info.product)))
		return ec;
	return usb_getstring(usb, info.iSerialNumber, info.serial);
}

UsbTransport *SimBus::openDevice (const std::string &path, boost::system::error_code &ec)
{
	SimDevicePtr dev = find(path);
	if (!dev) {
		ec = error::make_error_code(error::device_not_found);
		return NULL;
	}
	opened++;
	return new SimTransport(dev);
}

UsbTransport *SimBus::wrapDevice (int fd, boost::system::error_code &ec)
{
	std::map<int, SimDevicePtr>::const_iterator it = fds.find(fd);
	if (it == fds.end()) {
		ec = error::make_error_code(error::invalid_argument);
		return NULL;
	}
	opened++;
	return new SimTransport(it->second);
}

SimDevicePtr SimBus::find (const std::string &path) const
{
	for (size_t i = 0; i < devices.size(); i++) {
		if (simPath(i) == path)
			return devices[i];
	}
	return SimDevicePtr();
}

}
