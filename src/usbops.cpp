// USB操作

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <string.h>
#include <sys/file.h>

#include <algorithm>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/scoped_ptr.hpp>

#include "error.hpp"
#include "log.hpp"
#include "usbops.hpp"

#define USB_STRING_TIMEOUT	300

namespace rtlsdrusb {

const char BASE_DIR_UDEV[]	= "/dev/bus/usb"; // udev_USB
const char BASE_DIR_USBFS[]	= "/proc/bus/usb"; // usbfs

static inline boost::system::error_code errnoCode (int e)
{
	return boost::system::error_code(e, boost::system::system_category());
}

boost::system::error_code
usb_getstring (UsbTransport &usb, uint8_t index, std::string &out)
{
	out.clear();
	if (index == 0)
		return boost::system::error_code();

	uint8_t buf[255];
	boost::system::error_code ec;
	// language table first
	int r = usb.controlTransfer(USB_DIR_IN, USB_REQ_GET_DESCRIPTOR, USB_DT_STRING << 8, 0,
		buf, sizeof(buf), USB_STRING_TIMEOUT, ec);
	if (ec)
		return ec;
	if (r < 4)
		return error::make_error_code(error::transport_error);
	uint16_t langid = buf[2] | (buf[3] << 8);

	r = usb.controlTransfer(USB_DIR_IN, USB_REQ_GET_DESCRIPTOR, (USB_DT_STRING << 8) | index, langid,
		buf, sizeof(buf), USB_STRING_TIMEOUT, ec);
	if (ec)
		return ec;
	if (r < 2 || buf[1] != USB_DT_STRING)
		return error::make_error_code(error::transport_error);

	int len = std::min<int>(r, buf[0]);
	for (int i = 2; i + 1 < len; i += 2) {
		if (buf[i + 1] || (buf[i] & 0x80))
			out += '?';
		else
			out += static_cast<char>(buf[i]);
	}
	return boost::system::error_code();
}

boost::system::error_code
usb_getdesc (const char *devfile, usb_device_descriptor* desc)
{
	int f = open(devfile, O_RDONLY);
	if (-1 == f) {
		int errno_bak = errno;
		if(logOut()) *logOut() << "can't open usbdevfile to read '" << devfile << "'" << std::endl;
		return errnoCode(errno_bak);
	}

	memset(desc, 0, sizeof(usb_device_descriptor));
	ssize_t rlen = read(f, desc, sizeof(usb_device_descriptor));
	int errno_bak = errno;
	close(f);
	if (-1 == rlen) {
		if(logOut()) *logOut() << "can't read usbdevfile '" << devfile << "'" << std::endl;
		return errnoCode(errno_bak);
	}
	if (rlen < (ssize_t)sizeof(usb_device_descriptor) || desc->bDescriptorType != USB_DT_DEVICE)
		return error::make_error_code(error::transport_error);
	return boost::system::error_code();
}

int
usb_open (const char *devfile, bool exclusive, boost::system::error_code &ec)
{
	// open
	int fd = open(devfile, O_RDWR);
	if (-1 == fd) {
		int errno_bak = errno;
		if(logOut()) *logOut() << "usb open failed: " << errno_bak << std::endl;
		ec = errnoCode(errno_bak);
	}else if(exclusive && ::flock(fd, LOCK_EX | LOCK_NB) < 0) {
		close(fd);
		fd = -1;
		if(logOut()) *logOut() << "share violation" << std::endl;
		ec = error::make_error_code(error::device_busy);
	}
	return fd;
}

boost::system::error_code
usb_claim (int fd, unsigned int interface)
{
	int r = ioctl(fd, USBDEVFS_CLAIMINTERFACE, &interface);
	if (r < 0) {
		int errno_bak = errno;
		if (errno_bak == EBUSY) { // BUSY?
			if(logOut()) *logOut() << "usb interface busy." << std::endl;
			return error::make_error_code(error::device_busy);
		}

		// failed
		if(logOut()) *logOut() << "usb claim failed: " << errno_bak << std::endl;
		return errnoCode(errno_bak);
	}
	return boost::system::error_code();
}

boost::system::error_code
usb_release (int fd, unsigned int interface)
{
	int r = ioctl(fd, USBDEVFS_RELEASEINTERFACE, &interface);
	if (r < 0) {
		int errno_bak = errno;
		// failed
		if(logOut()) *logOut() << "usb release failed: " << errno_bak << std::endl;
		return errnoCode(errno_bak);
	}
	return boost::system::error_code();
}

boost::system::error_code
usb_reset (int fd)
{
	if (ioctl(fd, USBDEVFS_RESET, NULL) < 0)
		return errnoCode(errno);
	return boost::system::error_code();
}

int
usb_ctrl (int fd, usbdevfs_ctrltransfer *ctrl, boost::system::error_code &ec)
{
	int r = ioctl(fd, USBDEVFS_CONTROL, ctrl);
	if (r < 0) {
		int errno_bak = errno;
		// failed
		if(traceOut()) *traceOut() << "usb ctrl failed: " << errno_bak << std::endl;
		ec = errnoCode(errno_bak);
	}
	return r;
}

int
usb_bulk (int fd, usbdevfs_bulktransfer *bulk, boost::system::error_code &ec)
{
	int r = ioctl(fd, USBDEVFS_BULK, bulk);
	if (r < 0) {
		int errno_bak = errno;
		if(logOut()) *logOut() << "usb bulk failed: " << errno_bak << std::endl;
		ec = errnoCode(errno_bak);
	}
	return r;
}

/* UsbfsTransport */

UsbfsTransport::UsbfsTransport (int fd, bool ownsFd)
: fd(fd), ownsFd(ownsFd)
{
}

UsbfsTransport::~UsbfsTransport ()
{
	for (size_t i = 0; i < claimed.size(); i++)
		usb_release(fd, claimed[i]);
	if (ownsFd && fd >= 0)
		close(fd);
}

int UsbfsTransport::controlTransfer (uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
	uint8_t *data, uint16_t length, unsigned timeoutMs, boost::system::error_code &ec)
{
	usbdevfs_ctrltransfer ctrl1 = {requestType, request, value, index, length, timeoutMs, data};
	return usb_ctrl(fd, &ctrl1, ec);
}

int UsbfsTransport::bulkTransfer (uint8_t endpoint, uint8_t *data, int length, unsigned timeoutMs,
	boost::system::error_code &ec)
{
	usbdevfs_bulktransfer bulk = {endpoint, (unsigned int)length, timeoutMs, data};
	return usb_bulk(fd, &bulk, ec);
}

boost::system::error_code UsbfsTransport::claimInterface (unsigned int interface)
{
	boost::system::error_code ec = usb_claim(fd, interface);
	if (!ec)
		claimed.push_back(interface);
	return ec;
}

boost::system::error_code UsbfsTransport::releaseInterface (unsigned int interface)
{
	std::vector<unsigned int>::iterator it = std::find(claimed.begin(), claimed.end(), interface);
	if (it == claimed.end())
		return boost::system::error_code();
	claimed.erase(it);
	return usb_release(fd, interface);
}

boost::system::error_code UsbfsTransport::resetDevice ()
{
	return usb_reset(fd);
}

boost::system::error_code UsbfsTransport::deviceDescriptor (usb_device_descriptor &desc)
{
	memset(&desc, 0, sizeof(desc));
	ssize_t rlen = pread(fd, &desc, sizeof(desc), 0);
	if (rlen < 0)
		return errnoCode(errno);
	if (rlen < (ssize_t)sizeof(desc))
		return error::make_error_code(error::transport_error);
	return boost::system::error_code();
}

/* UsbfsBus */

UsbfsBus::UsbfsBus ()
: base_dir(BASE_DIR_UDEV)
{
	boost::filesystem::path base(base_dir);
	if (!boost::filesystem::exists(base) || !boost::filesystem::is_directory(base)) {
		base_dir = BASE_DIR_USBFS;
	}
}

boost::system::error_code UsbfsBus::listDevices (std::vector<UsbDeviceInfo> &devices)
{
	devices.clear();
	boost::system::error_code ec;
	boost::filesystem::path base(base_dir);
	if (!boost::filesystem::is_directory(base, ec))
		return ec ? ec : error::make_error_code(error::device_not_found);

	std::vector<std::string> files;
	boost::filesystem::directory_iterator end;
	for (boost::filesystem::directory_iterator bus_iter(base, ec); !ec && bus_iter != end; bus_iter.increment(ec)) {
		// バスでループ
		if (!boost::filesystem::is_directory(bus_iter->status()))
			continue;
		boost::system::error_code dev_ec;
		for (boost::filesystem::directory_iterator dev_iter(bus_iter->path(), dev_ec); !dev_ec && dev_iter != end; dev_iter.increment(dev_ec)) {
			// バスに繋がっているデバイスでループ
			if (!boost::filesystem::is_directory(dev_iter->status()))
				files.push_back(dev_iter->path().string());
		}
	}
	if (ec)
		return ec;
	std::sort(files.begin(), files.end());

	for (size_t i = 0; i < files.size(); i++) {
		usb_device_descriptor desc;
		if (usb_getdesc(files[i].c_str(), &desc))
			continue;
		UsbDeviceInfo info;
		info.path = files[i];
		info.vendorId = desc.idVendor;
		info.productId = desc.idProduct;
		info.iManufacturer = desc.iManufacturer;
		info.iProduct = desc.iProduct;
		info.iSerialNumber = desc.iSerialNumber;
		devices.push_back(info);
	}
	return boost::system::error_code();
}

boost::system::error_code UsbfsBus::readStrings (UsbDeviceInfo &info)
{
	boost::system::error_code ec;
	int fd = usb_open(info.path.c_str(), false, ec);
	if (fd < 0)
		return ec;
	UsbfsTransport usb(fd, true);

	if ((ec = usb_getstring(usb, info.iManufacturer, info.manufacturer)))
		return ec;
	if ((ec = usb_getstring(usb, info.iProduct, info.product)))
		return ec;
	return usb_getstring(usb, info.iSerialNumber, info.serial);
}

UsbTransport *UsbfsBus::openDevice (const std::string &path, boost::system::error_code &ec)
{
	int fd = usb_open(path.c_str(), true, ec);
	if (fd < 0)
		return NULL;
	return new UsbfsTransport(fd, true);
}

UsbTransport *UsbfsBus::wrapDevice (int fd, boost::system::error_code &ec)
{
	if (fd < 0) {
		ec = error::make_error_code(error::invalid_argument);
		return NULL;
	}
	return new UsbfsTransport(fd, false);
}

}
