// チューナ共通インタフェース

#ifndef _RTLSDRUSB_TUNER_HPP_
#define _RTLSDRUSB_TUNER_HPP_

#include <inttypes.h>
#include <vector>

#include <boost/system/error_code.hpp>

namespace rtlsdrusb {

enum TunerType {
	TUNER_UNKNOWN = 0,
	TUNER_R820T,
	TUNER_R828D
};

const char *tunerName (TunerType type);

struct GainMode {
	bool automatic;
	int tenthsDb;		// manual gain, 0.1 dB units

	static GainMode Auto () { GainMode m = { true, 0 }; return m; }
	static GainMode Manual (int tenthsDb) { GainMode m = { false, tenthsDb }; return m; }
};

// Operations every tuner driver provides. Callers enable the demod I2C
// repeater around each call.
class Tuner
{
public:
	virtual ~Tuner () {}

	virtual TunerType type () const = 0;

	virtual boost::system::error_code init () = 0;
	virtual boost::system::error_code exit () = 0;

	// false when setFrequency would refuse hz without touching the bus
	virtual bool frequencyInRange (uint32_t hz) const = 0;
	// achieved is what the synthesizer produces, not the request
	virtual boost::system::error_code setFrequency (uint32_t hz, uint32_t &achieved) = 0;
	virtual boost::system::error_code setGain (const GainMode &mode) = 0;
	virtual boost::system::error_code setStageGains (int lna, int mixer, int vga) = 0;
	virtual boost::system::error_code setBandwidth (uint32_t hz, uint32_t &achieved) = 0;

	virtual uint32_t ifFrequency () const = 0;
	virtual void setXtal (uint32_t hz) = 0;
	virtual uint32_t xtal () const = 0;
	virtual std::vector<int> gains () const = 0;
};

}

#endif
