// 対応デバイス一覧

#ifndef _RTLSDRUSB_KNOWN_DEVICES_HPP_
#define _RTLSDRUSB_KNOWN_DEVICES_HPP_

#include <inttypes.h>
#include <stddef.h>

// Realtek reference VID/PID, shared by several boards (RTL-SDR Blog V3/V4 included)
#define KNOWN_DEV_REFERENCE	0x01

namespace rtlsdrusb {

struct KnownDevice {
	uint16_t vendorId;
	uint16_t productId;
	const char *name;
	unsigned flags;
};

extern const KnownDevice KNOWN_DEVICES[];
extern const size_t KNOWN_DEVICE_COUNT;

// NULL if (vid, pid) is not an RTL2832U board
const KnownDevice *findKnownDevice (uint16_t vendorId, uint16_t productId);

}

#endif
