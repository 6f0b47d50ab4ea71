// エラーコード

#ifndef _RTLSDRUSB_ERROR_HPP_
#define _RTLSDRUSB_ERROR_HPP_

#include <boost/system/error_code.hpp>

namespace rtlsdrusb {
namespace error {

enum errc {
	success = 0,
	transport_error,		// control/bulk transfer failed or came back short
	invalid_address,		// block/offset rejected before transmission
	frequency_out_of_range,
	sample_rate_out_of_range,
	i2c_nack,
	i2c_timeout,
	calibration_failed,
	pll_not_locked,
	no_supported_tuner,
	device_not_found,
	ambiguous_serial,
	invalid_argument,
	device_not_open,
	device_busy,
	not_streaming,
	streaming_cancelled
};

const boost::system::error_category& category();

inline boost::system::error_code make_error_code(errc e)
{
	return boost::system::error_code(static_cast<int>(e), category());
}

}	// namespace error
}	// namespace rtlsdrusb

namespace boost {
namespace system {
template<> struct is_error_code_enum<rtlsdrusb::error::errc> {
	static const bool value = true;
};
}
}

#endif
