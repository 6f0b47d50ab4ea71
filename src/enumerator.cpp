// デバイス検索

#include "error.hpp"
#include "log.hpp"
#include "enumerator.hpp"
#include "known-devices.hpp"

namespace rtlsdrusb {

bool isUpconverterBoard (const std::string &manufacturer, const std::string &product)
{
	return manufacturer == "RTLSDRBlog" && product == "Blog V4";
}

namespace {

class ResolveVisitor : public boost::static_visitor<boost::system::error_code>
{
public:
	ResolveVisitor (DeviceEnumerator &enumerator, DeviceDescriptor &target)
	: enumerator(enumerator), target(target) {}

	boost::system::error_code operator() (const ByIndex &id) const
	{
		std::vector<DeviceDescriptor> devices;
		boost::system::error_code ec = enumerator.listDevices(devices);
		if (ec)
			return ec;
		if (id.index >= devices.size())
			return error::make_error_code(error::device_not_found);
		target = devices[id.index];
		return ec;
	}

	boost::system::error_code operator() (const BySerial &id) const
	{
		std::vector<DeviceDescriptor> devices;
		boost::system::error_code ec = enumerator.listDevices(devices);
		if (ec)
			return ec;
		const DeviceDescriptor *found = NULL;
		for (size_t i = 0; i < devices.size(); i++) {
			if (devices[i].serial != id.serial)
				continue;
			if (found)
				return error::make_error_code(error::ambiguous_serial);
			found = &devices[i];
		}
		if (!found)
			return error::make_error_code(error::device_not_found);
		target = *found;
		return ec;
	}

	// identity and strings are read once the descriptor is wrapped
	boost::system::error_code operator() (const ByFileDescriptor &id) const
	{
		if (id.fd < 0)
			return error::make_error_code(error::invalid_argument);
		target = DeviceDescriptor();
		target.fd = id.fd;
		return boost::system::error_code();
	}

private:
	DeviceEnumerator &enumerator;
	DeviceDescriptor &target;
};

}

DeviceEnumerator::DeviceEnumerator (UsbBus &bus)
: bus(bus)
{
}

boost::system::error_code DeviceEnumerator::listDevices (std::vector<DeviceDescriptor> &devices)
{
	std::vector<UsbDeviceInfo> infos;
	boost::system::error_code ec = bus.listDevices(infos);
	if (ec) {
		if(logOut()) *logOut() << "usb bus scan failed: " << ec.message() << std::endl;
		return ec;
	}

	devices.clear();
	for (size_t i = 0; i < infos.size(); i++) {
		const KnownDevice *known = findKnownDevice(infos[i].vendorId, infos[i].productId);
		if (!known)
			continue;

		UsbDeviceInfo &info = infos[i];
		boost::system::error_code sec = bus.readStrings(info);
		if (sec) {
			// typically no permission on the device node
			if(logOut()) *logOut() << info.path << ": can't read strings: " << sec.message() << std::endl;
		}

		DeviceDescriptor d;
		d.index = devices.size();
		d.path = info.path;
		d.vendorId = info.vendorId;
		d.productId = info.productId;
		d.name = known->name;
		d.manufacturer = info.manufacturer;
		d.product = info.product;
		d.serial = info.serial;
		d.upconverter = (known->flags & KNOWN_DEV_REFERENCE) && isUpconverterBoard(d.manufacturer, d.product);
		devices.push_back(d);
	}
	return boost::system::error_code();
}

boost::system::error_code DeviceEnumerator::resolve (const DeviceIdentity &identity, DeviceDescriptor &target)
{
	return boost::apply_visitor(ResolveVisitor(*this, target), identity);
}

}
