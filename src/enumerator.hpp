// デバイス検索

#ifndef _RTLSDRUSB_ENUMERATOR_HPP_
#define _RTLSDRUSB_ENUMERATOR_HPP_

#include <inttypes.h>
#include <string>
#include <vector>

#include <boost/variant.hpp>
#include <boost/system/error_code.hpp>

#include "usbops.hpp"

namespace rtlsdrusb {

struct ByIndex {
	uint32_t index;
	explicit ByIndex (uint32_t index) : index(index) {}
};

struct BySerial {
	std::string serial;
	explicit BySerial (const std::string &serial) : serial(serial) {}
};

// already opened usbdevfs descriptor, e.g. handed over by Android or a broker
struct ByFileDescriptor {
	int fd;
	explicit ByFileDescriptor (int fd) : fd(fd) {}
};

typedef boost::variant<ByIndex, BySerial, ByFileDescriptor> DeviceIdentity;

struct DeviceDescriptor {
	unsigned index;
	std::string path;	// empty when opened from a descriptor
	int fd;				// -1 unless opened from a descriptor
	uint16_t vendorId;
	uint16_t productId;
	std::string name;
	std::string manufacturer;
	std::string product;
	std::string serial;
	bool upconverter;

	DeviceDescriptor () : index(0), fd(-1), vendorId(0), productId(0), upconverter(false) {}
};

// RTL-SDR Blog V4: R828D behind an HF upconverter
bool isUpconverterBoard (const std::string &manufacturer, const std::string &product);

class DeviceEnumerator
{
public:
	explicit DeviceEnumerator (UsbBus &bus);

	// known RTL2832U boards in bus order; does not claim anything
	boost::system::error_code listDevices (std::vector<DeviceDescriptor> &devices);
	boost::system::error_code resolve (const DeviceIdentity &identity, DeviceDescriptor &target);

private:
	UsbBus &bus;
};

}

#endif
