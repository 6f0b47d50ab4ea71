// エラーコード

#include <string>

#include "error.hpp"

namespace rtlsdrusb {
namespace error {

namespace {

class rtlsdr_category : public boost::system::error_category
{
public:
	const char *name() const BOOST_SYSTEM_NOEXCEPT { return "rtlsdrusb"; }

	std::string message(int ev) const
	{
		switch (static_cast<errc>(ev)) {
		case success:			return "success";
		case transport_error:		return "usb transfer failed";
		case invalid_address:		return "invalid register address";
		case frequency_out_of_range:	return "frequency out of range";
		case sample_rate_out_of_range:	return "sample rate out of range";
		case i2c_nack:			return "i2c peripheral did not acknowledge";
		case i2c_timeout:		return "i2c bus cycle timed out";
		case calibration_failed:	return "tuner filter calibration failed";
		case pll_not_locked:		return "tuner pll not locked";
		case no_supported_tuner:	return "no supported tuner found";
		case device_not_found:		return "device not found";
		case ambiguous_serial:		return "more than one device has this serial";
		case invalid_argument:		return "invalid argument";
		case device_not_open:		return "device not open";
		case device_busy:		return "device is claimed by another handle";
		case not_streaming:		return "streaming not started";
		case streaming_cancelled:	return "streaming cancelled";
		}
		return "unknown error";
	}
};

}

const boost::system::error_category& category()
{
	static const rtlsdr_category instance;
	return instance;
}

}	// namespace error
}	// namespace rtlsdrusb
