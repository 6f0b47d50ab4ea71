// テスト用ベンチ

#ifndef _RTLSDRUSB_TEST_SUPPORT_HPP_
#define _RTLSDRUSB_TEST_SUPPORT_HPP_

#include "rtl2832-core.hpp"
#include "rtlsdr-device.hpp"
#include "sim-transport.hpp"

namespace rtlsdrusb {
namespace test {

// retry I2C timeouts without sleeping
static const PollPolicy FAST_I2C = { 3, 0 };

// one simulated dongle wired straight to the baseband layer
struct Bench {
	SimDevicePtr dev;
	SimTransport usb;
	RTL2832Device rtl;

	Bench ()
	: dev(new SimDevice(0x0bda, 0x2838, "00000001")), usb(dev), rtl(&usb)
	{
		rtl.setI2cPolicy(FAST_I2C);
	}
};

// a bus with one dongle and a device object in front of it
struct Rig {
	SimBus bus;
	SimDevicePtr dev;
	RtlSdrDevice sdr;

	explicit Rig (const DeviceConfig &config = DeviceConfig())
	: dev(bus.addDevice(0x0bda, 0x2838, "00000001")), sdr(bus, config)
	{
	}
};

inline uint64_t distance (uint64_t a, uint64_t b)
{
	return a > b ? a - b : b - a;
}

}
}

#endif
