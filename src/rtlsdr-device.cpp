/* RTL2832U SDR デバイス */

#include <boost/bind/bind.hpp>
#include <boost/ref.hpp>

#include "error.hpp"
#include "log.hpp"
#include "known-devices.hpp"
#include "rtlsdr-device.hpp"

namespace rtlsdrusb {

namespace {

class TunerOf : public boost::static_visitor<Tuner *>
{
public:
	Tuner *operator() (boost::blank &) const { return NULL; }
	template <typename T> Tuner *operator() (T &t) const { return &t; }
};

}

const char *stateName (DeviceState state)
{
	switch (state) {
	case STATE_CLOSED:			return "closed";
	case STATE_OPENING:			return "opening";
	case STATE_TUNER_DETECT:	return "tuner detect";
	case STATE_CONFIGURING:		return "configuring";
	case STATE_IDLE:			return "idle";
	case STATE_STREAMING:		return "streaming";
	default:					return "?";
	}
}

RtlSdrDevice::RtlSdrDevice (UsbBus &bus, const DeviceConfig &config)
: bus(bus), config(config), devState(STATE_CLOSED), rtlXtalFreq(config.xtalFreq), tunerXtalFreq(0),
  rate(0), bw(0), freq(0), ppm(0), dsMode(DIRECT_SAMPLING_OFF), biasTeeOn(false),
  forceBiasTee(false), forceDirectSampling(false), cancelled(false)
{
}

RtlSdrDevice::~RtlSdrDevice ()
{
	boost::system::error_code ec = close();
	if (ec && logOut())
		*logOut() << "close on destruction: " << ec.message() << std::endl;
}

Tuner *RtlSdrDevice::activeTuner ()
{
	TunerOf visitor;
	return boost::apply_visitor(visitor, tuner);
}

const Tuner *RtlSdrDevice::activeTuner () const
{
	return const_cast<RtlSdrDevice *>(this)->activeTuner();
}

uint32_t RtlSdrDevice::applyPpm (uint32_t hz) const
{
	return static_cast<uint32_t>(int64_t(hz) * (1000000 + ppm) / 1000000);
}

boost::system::error_code RtlSdrDevice::checkIdle () const
{
	if (devState != STATE_IDLE && devState != STATE_STREAMING)
		return error::make_error_code(error::device_not_open);
	return boost::system::error_code();
}

// tuner registers are only reachable while the demod repeats I2C to it
boost::system::error_code RtlSdrDevice::withRepeater (const TunerCall &call)
{
	boost::system::error_code ec = rtl->setI2cRepeater(true);
	if (ec)
		return ec;
	ec = call();
	boost::system::error_code off = rtl->setI2cRepeater(false);
	return ec ? ec : off;
}

/* open / close */

boost::system::error_code RtlSdrDevice::abortOpen (const boost::system::error_code &ec)
{
	if(logOut()) *logOut() << "open failed (" << stateName(devState) << "): " << ec.message() << std::endl;
	tuner = boost::blank();
	rtl.reset();
	if (usb) {
		boost::system::error_code rec = usb->releaseInterface(config.interface);
		if (rec && logOut())
			*logOut() << "release interface: " << rec.message() << std::endl;
	}
	usb.reset();
	desc = DeviceDescriptor();
	devState = STATE_CLOSED;
	return ec;
}

boost::system::error_code RtlSdrDevice::readIdentity ()
{
	usb_device_descriptor dd;
	boost::system::error_code ec = usb->deviceDescriptor(dd);
	if (ec)
		return ec;
	desc.vendorId = dd.idVendor;
	desc.productId = dd.idProduct;

	const KnownDevice *known = findKnownDevice(desc.vendorId, desc.productId);
	desc.name = known ? known->name : "unknown RTL2832U board";

	if ((dd.iManufacturer && (ec = usb_getstring(*usb, dd.iManufacturer, desc.manufacturer)))
	|| (dd.iProduct && (ec = usb_getstring(*usb, dd.iProduct, desc.product)))
	|| (dd.iSerialNumber && (ec = usb_getstring(*usb, dd.iSerialNumber, desc.serial)))) {
		if(logOut()) *logOut() << "can't read usb strings: " << ec.message() << std::endl;
	}
	desc.upconverter = known && (known->flags & KNOWN_DEV_REFERENCE)
		&& isUpconverterBoard(desc.manufacturer, desc.product);
	return boost::system::error_code();
}

// byte 7: bit 1 clear forces the bias tee on, bit 0 set forces direct sampling
boost::system::error_code RtlSdrDevice::readEepromFlags ()
{
	uint8_t flags = 0;
	boost::system::error_code ec = rtl->readEeprom(7, &flags, 1);
	if (ec) {
		if(logOut()) *logOut() << "no eeprom (" << ec.message() << "), using defaults" << std::endl;
		forceBiasTee = false;
		forceDirectSampling = false;
		return boost::system::error_code();
	}
	forceBiasTee = !(flags & 0x02);
	forceDirectSampling = (flags & 0x01) != 0;
	if (forceBiasTee && logOut())
		*logOut() << "eeprom: bias tee forced on" << std::endl;
	if (forceDirectSampling && logOut())
		*logOut() << "eeprom: direct sampling forced" << std::endl;
	return ec;
}

boost::system::error_code RtlSdrDevice::detectTuner (uint8_t addr, bool &found)
{
	uint8_t id = 0;
	found = false;
	boost::system::error_code ec = rtl->i2cReadReg(addr, R82XX_CHECK_ADDR, id);
	if (ec == error::make_error_code(error::i2c_nack))
		return boost::system::error_code();
	if (ec)
		return ec;
	found = id == R82XX_CHECK_VAL;
	return ec;
}

boost::system::error_code RtlSdrDevice::detectTuner ()
{
	bool found = false;
	boost::system::error_code ec;

	if ((ec = detectTuner(R820T_I2C_ADDR, found)))
		return ec;
	if (found) {
		tunerXtalFreq = rtlXtalFreq;
		tuner = R820TTuner(rtl.get(), applyPpm(tunerXtalFreq));
	} else {
		if ((ec = detectTuner(R828D_I2C_ADDR, found)))
			return ec;
		if (!found)
			return error::make_error_code(error::no_supported_tuner);
		// the Blog V4 runs the R828D from the RTL2832U crystal
		tunerXtalFreq = desc.upconverter ? rtlXtalFreq : R828D_XTAL_FREQ;
		tuner = R828DTuner(rtl.get(), applyPpm(tunerXtalFreq), desc.upconverter);
	}

	if(logOut()) *logOut() << "Found Rafael Micro " << tunerName(tunerType()) << " tuner"
		<< (desc.upconverter ? " (with HF upconverter)" : "") << std::endl;
	return ec;
}

boost::system::error_code RtlSdrDevice::open (const DeviceIdentity &identity)
{
	if (devState != STATE_CLOSED)
		return error::make_error_code(error::device_busy);

	boost::system::error_code ec;
	devState = STATE_OPENING;

	DeviceEnumerator enumerator(bus);
	if ((ec = enumerator.resolve(identity, desc)))
		return abortOpen(ec);

	if (desc.fd >= 0)
		usb.reset(bus.wrapDevice(desc.fd, ec));
	else
		usb.reset(bus.openDevice(desc.path, ec));
	if (!usb) {
		if (!ec)
			ec = error::make_error_code(error::transport_error);
		return abortOpen(ec);
	}
	if ((ec = usb->claimInterface(config.interface)))
		return abortOpen(ec);
	if (desc.fd >= 0 && (ec = readIdentity()))
		return abortOpen(ec);

	if(logOut()) *logOut() << "device: " << (desc.path.empty() ? "(fd)" : desc.path) << " " << desc.name
		<< " [" << desc.manufacturer << " " << desc.product << ", SN: " << desc.serial << "]" << std::endl;

	rtl.reset(new RTL2832Device(usb.get(), config.ctrlTimeoutMs));

	// dummy write, a wedged chip refuses it until reset
	if (rtl->writeReg(RTL2832_BLOCK_USB, RTL2832_USB_SYSCTL, 0x09, 1)) {
		if(logOut()) *logOut() << "resetting device..." << std::endl;
		if ((ec = usb->resetDevice()))
			return abortOpen(ec);
	}

	if ((ec = rtl->initBaseband()))
		return abortOpen(ec);
	if ((ec = readEepromFlags()))
		return abortOpen(ec);

	devState = STATE_TUNER_DETECT;
	if ((ec = rtl->setI2cRepeater(true)))
		return abortOpen(ec);
	if ((ec = detectTuner()))
		return abortOpen(ec);

	devState = STATE_CONFIGURING;
	Tuner *t = activeTuner();
	// disable Zero-IF mode, In-phase ADC input only, spectrum inversion on
	if ((ec = rtl->demodWriteReg(1, 0xb1, 0x1a, 1))
	|| (ec = rtl->demodWriteReg(0, 0x08, 0x4d, 1))
	|| (ec = rtl->setIfFreq(t->ifFrequency(), applyPpm(rtlXtalFreq)))
	|| (ec = rtl->demodWriteReg(1, 0x15, 0x01, 1)))
		return abortOpen(ec);

	if ((ec = t->init()))
		return abortOpen(ec);
	if ((ec = rtl->setI2cRepeater(false)))
		return abortOpen(ec);

	devState = STATE_IDLE;
	if (forceBiasTee && (ec = setBiasTee(true)))
		return abortOpen(ec);
	if (forceDirectSampling && (ec = setDirectSampling(DIRECT_SAMPLING_Q)))
		return abortOpen(ec);
	return ec;
}

boost::system::error_code RtlSdrDevice::close ()
{
	if (devState == STATE_CLOSED)
		return boost::system::error_code();

	boost::system::error_code ec, e;
	if (rtl) {
		Tuner *t = activeTuner();
		if (t && (e = withRepeater(boost::bind(&Tuner::exit, t)))) {
			if(logOut()) *logOut() << "tuner standby: " << e.message() << std::endl;
			ec = e;
		}
		if (biasTeeOn && (e = rtl->setGpioBit(0, false)) && !ec)
			ec = e;
		// poweroff demodulator and ADCs
		if ((e = rtl->deinitBaseband()) && !ec)
			ec = e;
	}

	tuner = boost::blank();
	rtl.reset();
	if (usb && (e = usb->releaseInterface(config.interface)) && !ec)
		ec = e;
	usb.reset();

	desc = DeviceDescriptor();
	rate = bw = freq = 0;
	ppm = 0;
	tunerXtalFreq = 0;
	dsMode = DIRECT_SAMPLING_OFF;
	biasTeeOn = forceBiasTee = forceDirectSampling = false;
	cancelled = false;
	devState = STATE_CLOSED;
	return ec;
}

/* tuning */

boost::system::error_code RtlSdrDevice::retune ()
{
	uint32_t achieved;
	if (dsMode != DIRECT_SAMPLING_OFF)
		return rtl->setIfFreq(freq, applyPpm(rtlXtalFreq));
	Tuner *t = activeTuner();
	if (!t->frequencyInRange(freq))
		return error::make_error_code(error::frequency_out_of_range);
	return withRepeater(boost::bind(&Tuner::setFrequency, t, freq, boost::ref(achieved)));
}

boost::system::error_code RtlSdrDevice::setFrequency (uint32_t hz, uint32_t &achieved)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;

	if (dsMode != DIRECT_SAMPLING_OFF) {
		if ((ec = rtl->setIfFreq(hz, applyPpm(rtlXtalFreq))))
			return ec;
		achieved = hz;
	} else {
		Tuner *t = activeTuner();
		if (!t->frequencyInRange(hz))
			return error::make_error_code(error::frequency_out_of_range);
		if ((ec = withRepeater(boost::bind(&Tuner::setFrequency, t, hz, boost::ref(achieved)))))
			return ec;
	}
	freq = hz;
	if(traceOut()) *traceOut() << "frequency " << hz << " Hz, achieved " << achieved << " Hz" << std::endl;
	return ec;
}

boost::system::error_code RtlSdrDevice::applyBandwidth (uint32_t hz, uint32_t &achieved)
{
	Tuner *t = activeTuner();
	boost::system::error_code ec;
	if ((ec = withRepeater(boost::bind(&Tuner::setBandwidth, t, hz, boost::ref(achieved)))))
		return ec;
	// the IF follows the filter
	if ((ec = rtl->setIfFreq(t->ifFrequency(), applyPpm(rtlXtalFreq))))
		return ec;
	if (freq)
		return retune();
	return ec;
}

boost::system::error_code RtlSdrDevice::setBandwidth (uint32_t hz, uint32_t &achieved)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if ((ec = applyBandwidth(hz ? hz : rate, achieved)))
		return ec;
	bw = hz;
	return ec;
}

boost::system::error_code RtlSdrDevice::writeSampleRate (uint32_t hz, uint32_t &achieved)
{
	uint64_t xtal = applyPpm(rtlXtalFreq);
	uint32_t ratio = static_cast<uint32_t>((xtal << 22) / hz) & 0x0ffffffc;
	uint32_t real = ratio | ((ratio & 0x08000000) << 1);
	if (real == 0)
		return error::make_error_code(error::sample_rate_out_of_range);
	achieved = static_cast<uint32_t>((xtal << 22) / real);
	return rtl->writeResampleRatio(ratio);
}

boost::system::error_code RtlSdrDevice::setSampleRate (uint32_t hz, uint32_t &achieved)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (!((hz >= RTLSDR_MIN_RATE_LOW && hz <= RTLSDR_MAX_RATE_LOW)
		|| (hz >= RTLSDR_MIN_RATE_HIGH && hz <= RTLSDR_MAX_RATE_HIGH)))
		return error::make_error_code(error::sample_rate_out_of_range);

	if ((ec = writeSampleRate(hz, achieved)))
		return ec;
	rate = achieved;
	if(logOut()) *logOut() << "sample rate " << hz << " Hz, exact " << achieved << " Hz" << std::endl;

	if (dsMode == DIRECT_SAMPLING_OFF) {
		uint32_t filter;
		if ((ec = applyBandwidth(bw ? bw : rate, filter)))
			return ec;
	}
	return rtl->resetDemod();
}

boost::system::error_code RtlSdrDevice::setGain (const GainMode &mode)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	return withRepeater(boost::bind(&Tuner::setGain, activeTuner(), mode));
}

boost::system::error_code RtlSdrDevice::setStageGains (int lna, int mixer, int vga)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (lna < 0 || lna > 15 || mixer < 0 || mixer > 15 || vga < 0 || vga > 15)
		return error::make_error_code(error::invalid_argument);
	return withRepeater(boost::bind(&Tuner::setStageGains, activeTuner(), lna, mixer, vga));
}

boost::system::error_code RtlSdrDevice::setFreqCorrection (int newPpm)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (newPpm < -RTLSDR_MAX_PPM || newPpm > RTLSDR_MAX_PPM)
		return error::make_error_code(error::invalid_argument);
	if (newPpm == ppm)
		return ec;

	// takes effect with the next frequency or rate change
	ppm = newPpm;
	activeTuner()->setXtal(applyPpm(tunerXtalFreq));
	if(logOut()) *logOut() << "frequency correction " << ppm << " ppm" << std::endl;
	return ec;
}

boost::system::error_code RtlSdrDevice::setXtalFreq (uint32_t rtlHz, uint32_t tunerHz)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (rtlHz && (rtlHz < RTL2832_MIN_XTAL_FREQ || rtlHz > RTL2832_MAX_XTAL_FREQ))
		return error::make_error_code(error::invalid_argument);

	if (rtlHz && rtlHz != rtlXtalFreq) {
		rtlXtalFreq = rtlHz;
		// update xtal-dependent settings
		if (rate) {
			uint32_t achieved;
			if ((ec = setSampleRate(rate, achieved)))
				return ec;
		}
	}
	if (tunerHz && tunerHz != tunerXtalFreq) {
		tunerXtalFreq = tunerHz;
		activeTuner()->setXtal(applyPpm(tunerXtalFreq));
		if (freq)
			return retune();
	}
	return ec;
}

/* board features */

boost::system::error_code RtlSdrDevice::setBiasTee (bool on)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (forceBiasTee)
		on = true;
	if ((ec = rtl->setGpioOutput(0))
	|| (ec = rtl->setGpioBit(0, on)))
		return ec;
	biasTeeOn = on;
	return ec;
}

boost::system::error_code RtlSdrDevice::setDirectSampling (DirectSampling mode)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	if (mode != DIRECT_SAMPLING_OFF && mode != DIRECT_SAMPLING_I && mode != DIRECT_SAMPLING_Q)
		return error::make_error_code(error::invalid_argument);
	if (mode == dsMode)
		return ec;

	Tuner *t = activeTuner();
	if (mode != DIRECT_SAMPLING_OFF) {
		if (dsMode == DIRECT_SAMPLING_OFF && (ec = withRepeater(boost::bind(&Tuner::exit, t))))
			return ec;
		// disable Zero-IF mode and spectrum inversion, In-phase ADC input only
		if ((ec = rtl->demodWriteReg(1, 0xb1, 0x1a, 1))
		|| (ec = rtl->demodWriteReg(1, 0x15, 0x00, 1))
		|| (ec = rtl->demodWriteReg(0, 0x08, 0x4d, 1)))
			return ec;
		// swap I and Q ADC to pick the input
		if ((ec = rtl->demodWriteReg(0, 0x06, mode == DIRECT_SAMPLING_Q ? 0x90 : 0x80, 1)))
			return ec;
	} else {
		if ((ec = withRepeater(boost::bind(&Tuner::init, t))))
			return ec;
		if ((ec = rtl->setIfFreq(t->ifFrequency(), applyPpm(rtlXtalFreq)))
		|| (ec = rtl->demodWriteReg(1, 0x15, 0x01, 1))
		|| (ec = rtl->demodWriteReg(0, 0x06, 0x80, 1)))
			return ec;
	}
	dsMode = mode;
	if(logOut()) *logOut() << "direct sampling " << (mode == DIRECT_SAMPLING_OFF ? "off" : mode == DIRECT_SAMPLING_I ? "I-ADC" : "Q-ADC") << std::endl;

	// an HF frequency from direct sampling is left for the caller to replace
	if (freq && (mode != DIRECT_SAMPLING_OFF || t->frequencyInRange(freq)))
		return retune();
	return ec;
}

boost::system::error_code RtlSdrDevice::setOffsetTuning (bool on)
{
#ifdef RTLSDRUSB_BLOG_MODS
	// R82xx tuners have no offset tuning; Blog builds drive the bias tee instead
	return setBiasTee(on);
#else
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	return error::make_error_code(error::invalid_argument);
#endif
}

boost::system::error_code RtlSdrDevice::setTestMode (bool on)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	return rtl->setTestMode(on);
}

boost::system::error_code RtlSdrDevice::setAgcMode (bool on)
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	return rtl->setAgcMode(on);
}

/* streaming */

boost::system::error_code RtlSdrDevice::resetBuffer ()
{
	boost::system::error_code ec;
	if ((ec = checkIdle()))
		return ec;
	return rtl->resetBuffer();
}

boost::system::error_code RtlSdrDevice::startStreaming ()
{
	if (devState == STATE_STREAMING)
		return error::make_error_code(error::device_busy);
	if (devState != STATE_IDLE)
		return error::make_error_code(error::device_not_open);

	boost::system::error_code ec;
	if ((ec = rtl->resetBuffer()))
		return ec;
	cancelled = false;
	devState = STATE_STREAMING;
	return ec;
}

boost::system::error_code RtlSdrDevice::readSamples (size_t len, SampleBlock &block)
{
	if (devState != STATE_STREAMING)
		return error::make_error_code(error::not_streaming);
	if (len == 0 || (len & 1) || config.bulkChunk <= 0)
		return error::make_error_code(error::invalid_argument);
	if (cancelled.load())
		return error::make_error_code(error::streaming_cancelled);

	SampleBlock buf(len);
	size_t pos = 0;
	int empty = 0;
	while (pos < len) {
		int chunk = len - pos < size_t(config.bulkChunk) ? int(len - pos) : config.bulkChunk;
		boost::system::error_code ec;
		int r = usb->bulkTransfer(RTL2832_EP_BULK, &buf[pos], chunk, config.bulkTimeoutMs, ec);
		if (ec || r < 0) {
			if(logOut()) *logOut() << "bulk read failed: " << ec.message() << std::endl;
			return error::make_error_code(error::transport_error);
		}
		// zero length packets
		if (r == 0 && ++empty >= RTLSDR_MAX_EMPTY_BULK) {
			if(logOut()) *logOut() << "bulk read: " << empty << " empty transfers in a row" << std::endl;
			return error::make_error_code(error::transport_error);
		}
		if (r > 0)
			empty = 0;
		pos += r;
	}
	block.swap(buf);
	return boost::system::error_code();
}

void RtlSdrDevice::cancelStreaming ()
{
	cancelled = true;
}

boost::system::error_code RtlSdrDevice::stopStreaming ()
{
	if (devState != STATE_STREAMING)
		return error::make_error_code(error::not_streaming);
	cancelled = false;
	devState = STATE_IDLE;
	return boost::system::error_code();
}

/* getters */

TunerType RtlSdrDevice::tunerType () const
{
	const Tuner *t = activeTuner();
	return t ? t->type() : TUNER_UNKNOWN;
}

std::vector<int> RtlSdrDevice::gains () const
{
	const Tuner *t = activeTuner();
	return t ? t->gains() : std::vector<int>();
}

}
