// USB操作

#ifndef _USB_OPS_HPP_
#define _USB_OPS_HPP_

#include <linux/usb/ch9.h>
#include <linux/usbdevice_fs.h>
#include <inttypes.h>
#include <string>
#include <vector>

#include <boost/system/error_code.hpp>

#define USB_CTRL_IN		(USB_DIR_IN |USB_TYPE_VENDOR|USB_RECIP_DEVICE)
#define USB_CTRL_OUT	(USB_DIR_OUT|USB_TYPE_VENDOR|USB_RECIP_DEVICE)

namespace rtlsdrusb {

struct UsbDeviceInfo {
	std::string path;
	uint16_t vendorId;
	uint16_t productId;
	uint8_t iManufacturer;
	uint8_t iProduct;
	uint8_t iSerialNumber;
	std::string manufacturer;
	std::string product;
	std::string serial;

	UsbDeviceInfo () : vendorId(0), productId(0), iManufacturer(0), iProduct(0), iSerialNumber(0) {}
};

// Blocking transfers on one opened device. Transfer errors carry the errno
// in boost::system::system_category, so EPIPE (stall) and ETIMEDOUT can be
// told apart by the caller.
class UsbTransport
{
public:
	virtual ~UsbTransport () {}

	virtual int controlTransfer (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
		uint8_t *data, uint16_t length, unsigned timeoutMs, boost::system::error_code &ec) = 0;
	virtual int bulkTransfer (uint8_t endpoint, uint8_t *data, int length, unsigned timeoutMs,
		boost::system::error_code &ec) = 0;

	virtual boost::system::error_code claimInterface (unsigned int interface) = 0;
	virtual boost::system::error_code releaseInterface (unsigned int interface) = 0;
	virtual boost::system::error_code resetDevice () = 0;
	virtual boost::system::error_code deviceDescriptor (usb_device_descriptor &desc) = 0;
};

// Descriptor listing and open. Open returns a new transport owned by the caller.
class UsbBus
{
public:
	virtual ~UsbBus () {}

	virtual boost::system::error_code listDevices (std::vector<UsbDeviceInfo> &devices) = 0;
	virtual boost::system::error_code readStrings (UsbDeviceInfo &info) = 0;
	virtual UsbTransport *openDevice (const std::string &path, boost::system::error_code &ec) = 0;
	virtual UsbTransport *wrapDevice (int fd, boost::system::error_code &ec) = 0;
};

// string descriptor, UTF-16 reduced to ASCII
boost::system::error_code usb_getstring (UsbTransport &usb, uint8_t index, std::string &out);

boost::system::error_code usb_getdesc (const char *devfile, usb_device_descriptor *desc);
int	usb_open (const char *devfile, bool exclusive, boost::system::error_code &ec);
boost::system::error_code usb_claim (int fd, unsigned int interface);
boost::system::error_code usb_release (int fd, unsigned int interface);
boost::system::error_code usb_reset (int fd);
int	usb_ctrl (int fd, usbdevfs_ctrltransfer *ctrl, boost::system::error_code &ec);
int	usb_bulk (int fd, usbdevfs_bulktransfer *bulk, boost::system::error_code &ec);

// usbdevfs (/dev/bus/usb or /proc/bus/usb)
class UsbfsTransport : public UsbTransport
{
public:
	UsbfsTransport (int fd, bool ownsFd);
	~UsbfsTransport ();

	int controlTransfer (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
		uint8_t *data, uint16_t length, unsigned timeoutMs, boost::system::error_code &ec);
	int bulkTransfer (uint8_t endpoint, uint8_t *data, int length, unsigned timeoutMs,
		boost::system::error_code &ec);
	boost::system::error_code claimInterface (unsigned int interface);
	boost::system::error_code releaseInterface (unsigned int interface);
	boost::system::error_code resetDevice ();
	boost::system::error_code deviceDescriptor (usb_device_descriptor &desc);

private:
	int fd;
	bool ownsFd;
	std::vector<unsigned int> claimed;
};

class UsbfsBus : public UsbBus
{
public:
	UsbfsBus ();

	boost::system::error_code listDevices (std::vector<UsbDeviceInfo> &devices);
	boost::system::error_code readStrings (UsbDeviceInfo &info);
	UsbTransport *openDevice (const std::string &path, boost::system::error_code &ec);
	UsbTransport *wrapDevice (int fd, boost::system::error_code &ec);

	const std::string &baseDir () const { return base_dir; }

private:
	std::string base_dir;
};

}

#endif
