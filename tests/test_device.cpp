#include <catch2/catch.hpp>

#include <boost/variant/get.hpp>

#include "error.hpp"
#include "rtlsdr-device.hpp"
#include "test_support.hpp"

using namespace rtlsdrusb;
using rtlsdrusb::test::Rig;
using rtlsdrusb::test::distance;

namespace {

// fails the first control transfer to one register
struct FailOnce {
	uint16_t value;
	uint16_t index;
	bool fired;

	FailOnce (uint16_t value, uint16_t index) : value(value), index(index), fired(false) {}

	bool operator() (const SimCall &c)
	{
		if (fired || (c.requestType & USB_DIR_IN) || c.value != value || c.index != index)
			return false;
		fired = true;
		return true;
	}
};

size_t countKind (const SimDevice &dev, SimCall::Kind kind)
{
	size_t n = 0;
	for (size_t i = 0; i < dev.calls.size(); i++)
		if (dev.calls[i].kind == kind)
			n++;
	return n;
}

}

TEST_CASE("open finds an R820T at 0x34", "[device][open]")
{
	Rig r;
	r.dev->addR820T();

	REQUIRE(!r.sdr.open(ByIndex(0)));
	CHECK(r.sdr.state() == STATE_IDLE);
	CHECK(r.sdr.isOpen());
	CHECK(r.sdr.tunerType() == TUNER_R820T);
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant()) != NULL);
	CHECK(r.sdr.tunerXtal() == RTL2832_DEF_XTAL_FREQ);
	CHECK(r.sdr.gains().size() == 30);
	CHECK(r.dev->claimed);

	CHECK(r.sdr.descriptor().serial == "00000001");
	CHECK(r.sdr.descriptor().name == "Generic RTL2832U OEM");
	CHECK(!r.sdr.descriptor().upconverter);

	// spectrum inversion on, repeater left off
	CHECK(r.dev->demod(1, 0x15) == 0x01);
	CHECK(r.dev->demod(1, 0xb1) == 0x1a);
	CHECK(r.dev->demod(1, 0x01) == 0x10);
}

TEST_CASE("open falls back to an R828D at 0x74", "[device][open]")
{
	Rig r;
	r.dev->addR828D();

	REQUIRE(!r.sdr.open(ByIndex(0)));
	CHECK(r.sdr.tunerType() == TUNER_R828D);
	CHECK(r.sdr.tunerXtal() == R828D_XTAL_FREQ);

	const R828DTuner *t = boost::get<R828DTuner>(&r.sdr.tunerVariant());
	REQUIRE(t != NULL);
	CHECK(!t->hasUpconverter());
	CHECK(t->xtal() == R828D_XTAL_FREQ);
}

TEST_CASE("Blog V4 runs the R828D with the upconverter", "[device][open][upconverter]")
{
	Rig r;
	r.dev->manufacturer = "RTLSDRBlog";
	r.dev->product = "Blog V4";
	r.dev->addR828D();

	REQUIRE(!r.sdr.open(ByIndex(0)));
	CHECK(r.sdr.descriptor().upconverter);
	CHECK(r.sdr.tunerXtal() == RTL2832_DEF_XTAL_FREQ);

	const R828DTuner *t = boost::get<R828DTuner>(&r.sdr.tunerVariant());
	REQUIRE(t != NULL);
	CHECK(t->hasUpconverter());

	uint32_t achieved = 0;
	REQUIRE(!r.sdr.setFrequency(7000000, achieved));
	CHECK(distance(achieved, 7000000) <= pllStepHz(t->lastPll(), RTL2832_DEF_XTAL_FREQ));
	CHECK(t->inputPath() == R828DTuner::INPUT_CABLE2);
}

TEST_CASE("open without a supported tuner releases the device", "[device][open]")
{
	Rig r;

	CHECK(r.sdr.open(ByIndex(0)) == error::make_error_code(error::no_supported_tuner));
	CHECK(r.sdr.state() == STATE_CLOSED);
	CHECK(!r.sdr.isOpen());
	CHECK(!r.dev->claimed);
	REQUIRE(!r.dev->calls.empty());
	CHECK(r.dev->calls.back().kind == SimCall::RELEASE);

	// a wrong chip id is no tuner either
	r.dev->addR820T().data[0] = 0x00;
	CHECK(r.sdr.open(ByIndex(0)) == error::make_error_code(error::no_supported_tuner));
	CHECK(!r.dev->claimed);
}

TEST_CASE("open of a missing device", "[device][open]")
{
	Rig r;
	r.dev->addR820T();

	CHECK(r.sdr.open(ByIndex(1)) == error::make_error_code(error::device_not_found));
	CHECK(r.sdr.open(BySerial("nope")) == error::make_error_code(error::device_not_found));
	CHECK(r.sdr.state() == STATE_CLOSED);
	CHECK(r.bus.opened == 0);
}

TEST_CASE("a second handle cannot claim an open device", "[device][open]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));

	RtlSdrDevice other(r.bus);
	CHECK(other.open(ByIndex(0)) == error::make_error_code(error::device_busy));
	CHECK(other.state() == STATE_CLOSED);
	CHECK(r.dev->claimed);

	// and the same handle refuses a second open
	CHECK(r.sdr.open(ByIndex(0)) == error::make_error_code(error::device_busy));
	CHECK(r.sdr.state() == STATE_IDLE);
}

TEST_CASE("a refused first write resets the device", "[device][open]")
{
	Rig r;
	r.dev->addR820T();
	r.dev->failIf = FailOnce(RTL2832_USB_SYSCTL, (RTL2832_BLOCK_USB << 8) | 0x10);

	REQUIRE(!r.sdr.open(ByIndex(0)));
	CHECK(r.dev->resets == 1);
	CHECK(countKind(*r.dev, SimCall::RESET) == 1);
	CHECK(r.sdr.state() == STATE_IDLE);
}

TEST_CASE("open by file descriptor reads the identity itself", "[device][open]")
{
	SimBus bus;
	SimDevicePtr dev(new SimDevice(0x0bda, 0x2832, "SN42"));
	dev->addR820T();
	bus.addFd(9, dev);

	RtlSdrDevice sdr(bus);
	REQUIRE(!sdr.open(ByFileDescriptor(9)));
	CHECK(sdr.descriptor().fd == 9);
	CHECK(sdr.descriptor().path.empty());
	CHECK(sdr.descriptor().vendorId == 0x0bda);
	CHECK(sdr.descriptor().productId == 0x2832);
	CHECK(sdr.descriptor().manufacturer == "Realtek");
	CHECK(sdr.descriptor().product == "RTL2838UHIDIR");
	CHECK(sdr.descriptor().serial == "SN42");
	CHECK(dev->claimed);

	RtlSdrDevice stale(bus);
	CHECK(stale.open(ByFileDescriptor(3)) == error::make_error_code(error::invalid_argument));
}

TEST_CASE("upconverter strings only count on Realtek reference ids", "[device][open][upconverter]")
{
	SimBus bus;
	SimDevicePtr v4(new SimDevice(0x0bda, 0x2838, "00000001"));
	SimDevicePtr clone(new SimDevice(0x0ccd, 0x00d3, "00000002"));
	v4->manufacturer = clone->manufacturer = "RTLSDRBlog";
	v4->product = clone->product = "Blog V4";
	v4->addR828D();
	clone->addR828D();
	bus.addFd(4, v4);
	bus.addFd(5, clone);

	RtlSdrDevice a(bus);
	REQUIRE(!a.open(ByFileDescriptor(4)));
	CHECK(a.descriptor().upconverter);
	CHECK(a.tunerXtal() == RTL2832_DEF_XTAL_FREQ);

	// same answer the bus listing gives for this board
	RtlSdrDevice b(bus);
	REQUIRE(!b.open(ByFileDescriptor(5)));
	CHECK(!b.descriptor().upconverter);
	CHECK(b.tunerXtal() == R828D_XTAL_FREQ);
}

TEST_CASE("open by serial", "[device][open]")
{
	Rig r;
	r.dev->addR820T();
	SimDevicePtr second = r.bus.addDevice(0x0bda, 0x2832, "00000002");
	second->addR828D();

	SECTION("unique") {
		REQUIRE(!r.sdr.open(BySerial("00000002")));
		CHECK(r.sdr.tunerType() == TUNER_R828D);
		CHECK(second->claimed);
		CHECK(!r.dev->claimed);
	}

	SECTION("ambiguous") {
		second->serial = "00000001";
		CHECK(r.sdr.open(BySerial("00000001")) == error::make_error_code(error::ambiguous_serial));
		CHECK(!r.dev->claimed);
		CHECK(!second->claimed);
	}
}

TEST_CASE("operations on a closed device", "[device]")
{
	Rig r;
	r.dev->addR820T();
	uint32_t achieved;

	CHECK(r.sdr.setFrequency(100000000, achieved) == error::make_error_code(error::device_not_open));
	CHECK(r.sdr.setSampleRate(2048000, achieved) == error::make_error_code(error::device_not_open));
	CHECK(r.sdr.setGain(GainMode::Auto()) == error::make_error_code(error::device_not_open));
	CHECK(r.sdr.setFreqCorrection(10) == error::make_error_code(error::device_not_open));
	CHECK(r.sdr.setBiasTee(true) == error::make_error_code(error::device_not_open));
	CHECK(r.sdr.startStreaming() == error::make_error_code(error::device_not_open));
	CHECK(r.dev->calls.empty());
	CHECK(r.sdr.tunerType() == TUNER_UNKNOWN);
	CHECK(r.sdr.gains().empty());
}

TEST_CASE("sample rate programs the resampler", "[device][rate]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));
	CHECK(achieved == 2048000);
	CHECK(r.sdr.sampleRate() == 2048000);
	uint32_t ratio = (uint32_t(r.dev->demod16(1, 0x9f)) << 16) | r.dev->demod16(1, 0xa1);
	CHECK(ratio == 0x3840000);
	CHECK((uint64_t(RTL2832_DEF_XTAL_FREQ) << 22) / ratio == 2048000);

	// the filter follows the rate and the IF follows the filter
	const R820TTuner *t = boost::get<R820TTuner>(&r.sdr.tunerVariant());
	REQUIRE(t != NULL);
	CHECK(t->ifFrequency() == 1675000);
	CHECK(r.dev->demod(1, 0x19) == 0x3c);
	CHECK(r.dev->demod(1, 0x1a) == 0x47);
	CHECK(r.dev->demod(1, 0x1b) == 0x1d);

	REQUIRE(!r.sdr.setSampleRate(3200000, achieved));
	ratio = (uint32_t(r.dev->demod16(1, 0x9f)) << 16) | r.dev->demod16(1, 0xa1);
	CHECK(ratio == 37748736);
}

TEST_CASE("low sample rates carry bit 27 of the ratio into bit 28", "[device][rate]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	REQUIRE(!r.sdr.setSampleRate(250000, achieved));
	CHECK(achieved == 250000);
	uint32_t ratio = (uint32_t(r.dev->demod16(1, 0x9f)) << 16) | r.dev->demod16(1, 0xa1);
	CHECK(ratio == 0x0ccccccc);
	uint32_t real = ratio | ((ratio & 0x08000000) << 1);
	CHECK(real == 0x1ccccccc);
	CHECK((uint64_t(RTL2832_DEF_XTAL_FREQ) << 22) / real == achieved);
}

TEST_CASE("sample rate limits", "[device][rate]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	CHECK(!r.sdr.setSampleRate(225001, achieved));
	CHECK(distance(achieved, 225001) < 2);
	CHECK(!r.sdr.setSampleRate(300000, achieved));
	CHECK(!r.sdr.setSampleRate(900001, achieved));
	CHECK(!r.sdr.setSampleRate(3200000, achieved));

	size_t before = r.dev->calls.size();
	static const uint32_t bad[] = { 0, 225000, 300001, 900000, 3200001 };
	for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++)
		CHECK(r.sdr.setSampleRate(bad[i], achieved) == error::make_error_code(error::sample_rate_out_of_range));
	CHECK(r.dev->calls.size() == before);
	CHECK(r.sdr.sampleRate() == 3200000);
}

TEST_CASE("frequency is reached within one synthesizer step", "[device][tuning]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;
	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));

	REQUIRE(!r.sdr.setFrequency(100000000, achieved));
	CHECK(r.sdr.frequency() == 100000000);
	const R820TTuner *t = boost::get<R820TTuner>(&r.sdr.tunerVariant());
	REQUIRE(t != NULL);
	CHECK(distance(achieved, 100000000) <= pllStepHz(t->lastPll(), RTL2832_DEF_XTAL_FREQ));

	size_t before = r.dev->calls.size();
	CHECK(r.sdr.setFrequency(20000000, achieved) == error::make_error_code(error::frequency_out_of_range));
	CHECK(r.sdr.setFrequency(2000000000, achieved) == error::make_error_code(error::frequency_out_of_range));
	CHECK(r.dev->calls.size() == before);
	CHECK(r.sdr.frequency() == 100000000);
}

TEST_CASE("frequency correction applies to later settings", "[device][ppm]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	size_t before = r.dev->calls.size();
	REQUIRE(!r.sdr.setFreqCorrection(50));
	CHECK(r.dev->calls.size() == before);
	CHECK(r.sdr.freqCorrection() == 50);

	const R820TTuner *t = boost::get<R820TTuner>(&r.sdr.tunerVariant());
	REQUIRE(t != NULL);
	CHECK(t->xtal() == 28801440);
	CHECK(r.sdr.tunerXtal() == RTL2832_DEF_XTAL_FREQ);

	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));
	CHECK(r.dev->demod16(1, 0x9f) == 0x0384);
	CHECK(r.dev->demod16(1, 0xa1) == 0x0b84);
	CHECK(achieved == 2048000);

	// same value again is a no-op
	before = r.dev->calls.size();
	REQUIRE(!r.sdr.setFreqCorrection(50));
	CHECK(r.dev->calls.size() == before);
}

TEST_CASE("frequency correction range", "[device][ppm]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	size_t before = r.dev->calls.size();
	CHECK(r.sdr.setFreqCorrection(-2000000) == error::make_error_code(error::invalid_argument));
	CHECK(r.sdr.setFreqCorrection(RTLSDR_MAX_PPM + 1) == error::make_error_code(error::invalid_argument));
	CHECK(r.sdr.setFreqCorrection(-RTLSDR_MAX_PPM - 1) == error::make_error_code(error::invalid_argument));
	CHECK(r.dev->calls.size() == before);
	CHECK(r.sdr.freqCorrection() == 0);
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->xtal() == RTL2832_DEF_XTAL_FREQ);

	REQUIRE(!r.sdr.setFreqCorrection(-RTLSDR_MAX_PPM));
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->xtal() == 28771200);
	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));
	CHECK(distance(achieved, 2048000) < 10);

	REQUIRE(!r.sdr.setFreqCorrection(RTLSDR_MAX_PPM));
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->xtal() == 28828800);
}

TEST_CASE("crystal frequency bounds", "[device][ppm]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved;
	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));

	CHECK(r.sdr.setXtalFreq(30000000, 0) == error::make_error_code(error::invalid_argument));
	CHECK(r.sdr.setXtalFreq(RTL2832_MAX_XTAL_FREQ + 1, 0) == error::make_error_code(error::invalid_argument));
	CHECK(r.sdr.rtlXtal() == RTL2832_DEF_XTAL_FREQ);

	REQUIRE(!r.sdr.setXtalFreq(28800500, 0));
	CHECK(r.sdr.rtlXtal() == 28800500);
	CHECK(r.sdr.tunerXtal() == RTL2832_DEF_XTAL_FREQ);
	uint32_t ratio = (uint32_t(r.dev->demod16(1, 0x9f)) << 16) | r.dev->demod16(1, 0xa1);
	CHECK(ratio == ((uint64_t(28800500) << 22) / 2048000 & 0x0ffffffc));

	REQUIRE(!r.sdr.setXtalFreq(0, 28799000));
	CHECK(r.sdr.tunerXtal() == 28799000);
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->xtal() == 28799000);
}

TEST_CASE("gain through the device", "[device][gain]")
{
	Rig r;
	SimI2cPeripheral &chip = r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));

	REQUIRE(!r.sdr.setGain(GainMode::Manual(320)));
	CHECK((chip.regs[0x05] & 0x1f) == (0x10 | 9));
	CHECK((chip.regs[0x07] & 0x1f) == 8);

	REQUIRE(!r.sdr.setStageGains(2, 3, 4));
	CHECK((chip.regs[0x05] & 0x0f) == 2);
	CHECK(r.sdr.setStageGains(0, -1, 0) == error::make_error_code(error::invalid_argument));

	REQUIRE(!r.sdr.setGain(GainMode::Auto()));
	CHECK((chip.regs[0x05] & 0x10) == 0x00);

	// repeater closed again after each call
	CHECK((r.dev->demod(1, 0x01) & 0x08) == 0x00);
}

TEST_CASE("explicit bandwidth overrides the sample rate", "[device][bandwidth]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	REQUIRE(!r.sdr.setBandwidth(8000000, achieved));
	CHECK(achieved == 8000000);
	CHECK(r.sdr.bandwidth() == 8000000);
	REQUIRE(!r.sdr.setSampleRate(2048000, achieved));
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->ifFrequency() == 4570000);

	REQUIRE(!r.sdr.setBandwidth(0, achieved));
	CHECK(achieved == 1950000);
	CHECK(boost::get<R820TTuner>(&r.sdr.tunerVariant())->ifFrequency() == 1675000);
}

TEST_CASE("bias tee drives GPIO 0", "[device][gpio]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));

	REQUIRE(!r.sdr.setBiasTee(true));
	CHECK(r.sdr.biasTee());
	CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x01);
	CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPOE) & 0x01) == 0x01);
	CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPD) & 0x01) == 0x00);

	REQUIRE(!r.sdr.setBiasTee(false));
	CHECK(!r.sdr.biasTee());
	CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x00);

#ifdef RTLSDRUSB_BLOG_MODS
	REQUIRE(!r.sdr.setOffsetTuning(true));
	CHECK(r.sdr.biasTee());
#else
	CHECK(r.sdr.setOffsetTuning(true) == error::make_error_code(error::invalid_argument));
#endif
}

TEST_CASE("EEPROM flags force board features", "[device][eeprom]")
{
	Rig r;
	r.dev->addR820T();
	SimI2cPeripheral &eeprom = r.dev->addEeprom();

	SECTION("defaults") {
		REQUIRE(!r.sdr.open(ByIndex(0)));
		CHECK(!r.sdr.biasTee());
		CHECK(r.sdr.directSampling() == DIRECT_SAMPLING_OFF);
	}

	SECTION("bias tee forced on") {
		eeprom.data[7] = 0x00;
		REQUIRE(!r.sdr.open(ByIndex(0)));
		CHECK(r.sdr.biasTee());
		REQUIRE(!r.sdr.setBiasTee(false));
		CHECK(r.sdr.biasTee());
		CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x01);
	}

	SECTION("direct sampling forced") {
		eeprom.data[7] = 0x03;
		REQUIRE(!r.sdr.open(ByIndex(0)));
		CHECK(!r.sdr.biasTee());
		CHECK(r.sdr.directSampling() == DIRECT_SAMPLING_Q);
		CHECK(r.dev->demod(0, 0x06) == 0x90);
	}
}

TEST_CASE("direct sampling bypasses the tuner", "[device][direct]")
{
	Rig r;
	SimI2cPeripheral &chip = r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved = 0;

	REQUIRE(!r.sdr.setDirectSampling(DIRECT_SAMPLING_Q));
	CHECK(r.sdr.directSampling() == DIRECT_SAMPLING_Q);
	CHECK(r.dev->demod(0, 0x06) == 0x90);
	CHECK(r.dev->demod(1, 0x15) == 0x00);
	// tuner in standby
	CHECK(chip.regs[0x06] == 0xb1);

	// HF straight into the ADC, the IF register carries the frequency
	REQUIRE(!r.sdr.setFrequency(14200000, achieved));
	CHECK(achieved == 14200000);
	int32_t iff = -(int32_t)((int64_t(14200000) << 22) / RTL2832_DEF_XTAL_FREQ);
	CHECK(r.dev->demod(1, 0x19) == ((iff >> 16) & 0x3f));
	CHECK(r.dev->demod(1, 0x1b) == (iff & 0xff));

	REQUIRE(!r.sdr.setDirectSampling(DIRECT_SAMPLING_I));
	CHECK(r.dev->demod(0, 0x06) == 0x80);

	// back on the tuner, which is initialised again
	unsigned cycles = chip.cycles;
	REQUIRE(!r.sdr.setDirectSampling(DIRECT_SAMPLING_OFF));
	CHECK(r.sdr.directSampling() == DIRECT_SAMPLING_OFF);
	CHECK(r.dev->demod(1, 0x15) == 0x01);
	CHECK(r.dev->demod(0, 0x06) == 0x80);
	CHECK(chip.cycles > cycles);
	REQUIRE(!r.sdr.setFrequency(100000000, achieved));

	CHECK(r.sdr.setDirectSampling(static_cast<DirectSampling>(3)) == error::make_error_code(error::invalid_argument));
}

TEST_CASE("test mode and digital AGC", "[device]")
{
	Rig r;
	r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));

	REQUIRE(!r.sdr.setTestMode(true));
	CHECK(r.dev->demod(0, 0x19) == 0x03);
	REQUIRE(!r.sdr.setAgcMode(true));
	CHECK(r.dev->demod(0, 0x19) == 0x25);
	REQUIRE(!r.sdr.setAgcMode(false));
	CHECK(r.dev->demod(0, 0x19) == 0x05);
}

TEST_CASE("close powers down and is idempotent", "[device][close]")
{
	Rig r;
	SimI2cPeripheral &chip = r.dev->addR820T();
	REQUIRE(!r.sdr.open(ByIndex(0)));
	uint32_t achieved;
	REQUIRE(!r.sdr.setFrequency(100000000, achieved));
	REQUIRE(!r.sdr.setBiasTee(true));

	REQUIRE(!r.sdr.close());
	CHECK(r.sdr.state() == STATE_CLOSED);
	CHECK(r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_DEMOD_CTL) == 0x20);
	CHECK((r.dev->peek(RTL2832_BLOCK_SYS, RTL2832_SYS_GPO) & 0x01) == 0x00);
	CHECK(chip.regs[0x06] == 0xb1);
	CHECK(!r.dev->claimed);
	CHECK(r.sdr.frequency() == 0);
	CHECK(r.sdr.tunerType() == TUNER_UNKNOWN);

	size_t before = r.dev->calls.size();
	REQUIRE(!r.sdr.close());
	CHECK(r.dev->calls.size() == before);
	CHECK(r.sdr.setFrequency(100000000, achieved) == error::make_error_code(error::device_not_open));

	// and it opens again
	REQUIRE(!r.sdr.open(ByIndex(0)));
	CHECK(r.sdr.state() == STATE_IDLE);
}
