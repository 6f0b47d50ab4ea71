/* RTL2832U SDR デバイス
	open -> tuner detect -> configure -> idle <-> streaming -> close
*/

#ifndef _RTLSDRUSB_DEVICE_HPP_
#define _RTLSDRUSB_DEVICE_HPP_

#include <inttypes.h>
#include <string>
#include <vector>

#include <boost/atomic.hpp>
#include <boost/blank.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/variant.hpp>
#include <boost/system/error_code.hpp>

#include "enumerator.hpp"
#include "r82xx.hpp"
#include "rtl2832-core.hpp"
#include "usbops.hpp"

namespace rtlsdrusb {

struct DeviceConfig {
	uint32_t xtalFreq;			// RTL2832U crystal
	unsigned ctrlTimeoutMs;
	unsigned bulkTimeoutMs;		// 0 = wait forever
	int bulkChunk;				// bytes per bulk transfer
	unsigned interface;

	DeviceConfig ()
	: xtalFreq(RTL2832_DEF_XTAL_FREQ), ctrlTimeoutMs(RTL2832_CTRL_TIMEOUT), bulkTimeoutMs(0),
	  bulkChunk(16384), interface(0) {}
};

enum DeviceState {
	STATE_CLOSED,
	STATE_OPENING,
	STATE_TUNER_DETECT,
	STATE_CONFIGURING,
	STATE_IDLE,
	STATE_STREAMING
};

const char *stateName (DeviceState state);

enum DirectSampling {
	DIRECT_SAMPLING_OFF = 0,
	DIRECT_SAMPLING_I = 1,
	DIRECT_SAMPLING_Q = 2
};

// interleaved unsigned 8 bit I/Q
typedef std::vector<uint8_t> SampleBlock;

typedef boost::variant<boost::blank, R820TTuner, R828DTuner> TunerVariant;

#define RTLSDR_MIN_RATE_LOW		225001
#define RTLSDR_MAX_RATE_LOW		300000
#define RTLSDR_MIN_RATE_HIGH	900001
#define RTLSDR_MAX_RATE_HIGH	3200000

#define RTLSDR_MAX_PPM			1000
#define RTLSDR_MAX_EMPTY_BULK	16

class RtlSdrDevice : boost::noncopyable
{
public:
	explicit RtlSdrDevice (UsbBus &bus, const DeviceConfig &config = DeviceConfig());
	~RtlSdrDevice ();

	boost::system::error_code open (const DeviceIdentity &identity);
	boost::system::error_code close ();

	boost::system::error_code setFrequency (uint32_t hz, uint32_t &achieved);
	boost::system::error_code setSampleRate (uint32_t hz, uint32_t &achieved);
	boost::system::error_code setGain (const GainMode &mode);
	boost::system::error_code setStageGains (int lna, int mixer, int vga);
	// 0 follows the sample rate
	boost::system::error_code setBandwidth (uint32_t hz, uint32_t &achieved);
	// within +-RTLSDR_MAX_PPM
	boost::system::error_code setFreqCorrection (int ppm);
	// tunerHz 0 keeps the tuner crystal
	boost::system::error_code setXtalFreq (uint32_t rtlHz, uint32_t tunerHz);

	boost::system::error_code setBiasTee (bool on);
	boost::system::error_code setDirectSampling (DirectSampling mode);
	boost::system::error_code setOffsetTuning (bool on);
	boost::system::error_code setTestMode (bool on);
	boost::system::error_code setAgcMode (bool on);

	boost::system::error_code startStreaming ();
	// blocks until len bytes arrived; block receives the buffer by swap
	boost::system::error_code readSamples (size_t len, SampleBlock &block);
	// safe from any thread, takes effect before the next read
	void cancelStreaming ();
	boost::system::error_code stopStreaming ();
	boost::system::error_code resetBuffer ();

	DeviceState state () const { return devState; }
	bool isOpen () const { return devState != STATE_CLOSED; }
	TunerType tunerType () const;
	const TunerVariant &tunerVariant () const { return tuner; }
	std::vector<int> gains () const;
	uint32_t frequency () const { return freq; }
	uint32_t sampleRate () const { return rate; }
	uint32_t bandwidth () const { return bw; }
	int freqCorrection () const { return ppm; }
	uint32_t rtlXtal () const { return rtlXtalFreq; }
	uint32_t tunerXtal () const { return tunerXtalFreq; }
	DirectSampling directSampling () const { return dsMode; }
	bool biasTee () const { return biasTeeOn; }
	// manufacturer, product and serial of the open device
	const DeviceDescriptor &descriptor () const { return desc; }

	RTL2832Device *baseband () const { return rtl.get(); }

private:
	typedef boost::function<boost::system::error_code ()> TunerCall;

	boost::system::error_code abortOpen (const boost::system::error_code &ec);
	boost::system::error_code readIdentity ();
	boost::system::error_code detectTuner (uint8_t addr, bool &found);
	boost::system::error_code detectTuner ();
	boost::system::error_code readEepromFlags ();
	boost::system::error_code withRepeater (const TunerCall &call);
	boost::system::error_code retune ();
	boost::system::error_code applyBandwidth (uint32_t hz, uint32_t &achieved);
	boost::system::error_code writeSampleRate (uint32_t hz, uint32_t &achieved);
	boost::system::error_code checkIdle () const;

	Tuner *activeTuner ();
	const Tuner *activeTuner () const;
	uint32_t applyPpm (uint32_t hz) const;

	UsbBus &bus;
	DeviceConfig config;
	DeviceState devState;
	DeviceDescriptor desc;

	boost::scoped_ptr<UsbTransport> usb;
	boost::scoped_ptr<RTL2832Device> rtl;
	TunerVariant tuner;

	uint32_t rtlXtalFreq;
	uint32_t tunerXtalFreq;
	uint32_t rate;
	uint32_t bw;
	uint32_t freq;
	int ppm;
	DirectSampling dsMode;
	bool biasTeeOn;
	bool forceBiasTee;
	bool forceDirectSampling;
	boost::atomic<bool> cancelled;
};

}

#endif
