/* R820T / R828D */

#include <string.h>

#include <boost/bind/bind.hpp>

#include "error.hpp"
#include "log.hpp"
#include "r82xx.hpp"

#ifdef RTLSDRUSB_BLOG_MODS
#define R82XX_VCO_CURRENT		0x06
#define R82XX_VCO_CURRENT_MASK	0xff
#define R82XX_DIV_BUF_CUR		0xa0	/* PLL drop out 2.0 V, better L-band */
#else
#define R82XX_VCO_CURRENT		0x80
#define R82XX_VCO_CURRENT_MASK	0xe0
#define R82XX_DIV_BUF_CUR		0x30
#endif

namespace rtlsdrusb {

static const PollPolicy PLL_LOCK_POLICY = { 3, 1 };
static const PollPolicy FILTER_CAL_POLICY = { 2, 1 };

static uint8_t bitrev (uint8_t byte)
{
	static const uint8_t lut[16] = {
		0x0, 0x8, 0x4, 0xc, 0x2, 0xa, 0x6, 0xe,
		0x1, 0x9, 0x5, 0xd, 0x3, 0xb, 0x7, 0xf
	};
	return (lut[byte & 0xf] << 4) | lut[byte >> 4];
}

R82xxTuner::R82xxTuner (RTL2832Device *dev, TunerType type, uint8_t i2cAddr, uint32_t xtal, unsigned vcoPowerRef)
: input(0), dev(dev), chip(type), addr(i2cAddr), xtalFreq(xtal), vcoPowerRef(vcoPowerRef),
  intFreq(R82XX_IF_FREQ), filCalCode(0), initDone(false)
{
	memset(regs, 0, sizeof(regs));
	memcpy(regs + R82XX_RW_REG_START, R82XX_INIT_REGS, sizeof(R82XX_INIT_REGS));
	memset(&pll, 0, sizeof(pll));
}

/* register access */

boost::system::error_code R82xxTuner::write (uint8_t reg, const uint8_t *val, int len)
{
	if (reg < R82XX_RW_REG_START || reg + len > R82XX_NUM_REGS)
		return error::make_error_code(error::invalid_address);

	memcpy(regs + reg, val, len);

	uint8_t buf[R82XX_MAX_I2C_MSG_LEN];
	int pos = 0;
	while (pos < len) {
		int size = len - pos;
		if (size > R82XX_MAX_I2C_MSG_LEN - 1)
			size = R82XX_MAX_I2C_MSG_LEN - 1;
		buf[0] = reg + pos;
		memcpy(buf + 1, val + pos, size);
		boost::system::error_code ec = dev->i2cWriteBuf(addr, buf, size + 1);
		if (ec) {
			if(logOut()) *logOut() << tunerName(chip) << ": i2c write failed at reg 0x"
				<< std::hex << (unsigned)(reg + pos) << std::dec << ": " << ec.message() << std::endl;
			return ec;
		}
		pos += size;
	}
	return boost::system::error_code();
}

boost::system::error_code R82xxTuner::writeReg (uint8_t reg, uint8_t val)
{
	return write(reg, &val, 1);
}

boost::system::error_code R82xxTuner::writeRegMask (uint8_t reg, uint8_t val, uint8_t mask)
{
	if (reg >= R82XX_NUM_REGS)
		return error::make_error_code(error::invalid_address);
	uint8_t rc = (regs[reg] & ~mask) | (val & mask);
	return write(reg, &rc, 1);
}

// the chip always reads out from register 0, bit-reversed
boost::system::error_code R82xxTuner::read (uint8_t *val, int len)
{
	uint8_t start = 0;
	boost::system::error_code ec = dev->i2cWriteBuf(addr, &start, 1);
	if (ec)
		return ec;
	if ((ec = dev->i2cReadBuf(addr, val, len)))
		return ec;
	for (int i = 0; i < len; i++)
		val[i] = bitrev(val[i]);
	return ec;
}

/* synthesizer */

boost::system::error_code R82xxTuner::setMux (uint64_t loHz, uint32_t hz)
{
	const R82xxFreqRange &range = r82xxFreqRange(loHz);
	boost::system::error_code ec;

	// Open Drain
	if ((ec = writeRegMask(0x17, openDrain(hz, range), 0x08)))
		return ec;
	// RF_MUX, Polymux
	if ((ec = writeRegMask(0x1a, range.rf_mux_ploy, 0xc3)))
		return ec;
	// TF BAND
	if ((ec = writeReg(0x1b, range.tf_c)))
		return ec;
	// XTAL CAP & Drive, high cap 0 pF
	if ((ec = writeRegMask(0x10, range.xtal_cap0p | 0x00, 0x0b)))
		return ec;
	if ((ec = writeRegMask(0x08, 0x00, 0x3f)))
		return ec;
	return writeRegMask(0x09, 0x00, 0x3f);
}

boost::system::error_code R82xxTuner::pollLock (unsigned attempt, bool &done)
{
	uint8_t data[3];
	boost::system::error_code ec = read(data, sizeof(data));
	if (ec)
		return ec;
	if (data[2] & 0x40) {
		done = true;
		return ec;
	}
	// didn't lock, increase VCO current
	if (attempt == 0)
		return writeRegMask(0x12, 0x60, 0xe0);
	return ec;
}

boost::system::error_code R82xxTuner::setPll (uint64_t loHz)
{
	boost::system::error_code ec;

	// refdiv2 = 0, set pll autotune = 128kHz
	if ((ec = writeRegMask(0x10, 0x00, 0x10))
	|| (ec = writeRegMask(0x1a, 0x00, 0x0c))
	|| (ec = writeRegMask(0x12, R82XX_VCO_CURRENT, R82XX_VCO_CURRENT_MASK)))
		return ec;

	PllSettings next;
	if ((ec = computePll(loHz, xtalFreq, vcoPowerRef, next)))
		return ec;

	// VCO band from the fine tune reading
	uint8_t data[5];
	if ((ec = read(data, sizeof(data))))
		return ec;
	unsigned vcoFineTune = (data[4] & 0x30) >> 4;
	uint8_t divNum = next.divNum;
	if (vcoFineTune > vcoPowerRef && divNum > 0)
		divNum--;
	else if (vcoFineTune < vcoPowerRef && divNum < 7)
		divNum++;
	if ((ec = writeRegMask(0x10, divNum << 5, 0xe0)))
		return ec;

	uint8_t ni = (next.nint - 13) / 4;
	uint8_t si = next.nint - 4 * ni - 13;
	if ((ec = writeReg(0x14, ni + (si << 6))))
		return ec;

	// pw_sdm
	if ((ec = writeRegMask(0x12, next.sdm == 0 ? 0x08 : 0x00, 0x08)))
		return ec;
	if ((ec = writeReg(0x16, next.sdm >> 8))
	|| (ec = writeReg(0x15, next.sdm & 0xff)))
		return ec;

	pll = next;
	if(traceOut()) *traceOut() << tunerName(chip) << ": lo " << loHz << " Hz, mix_div " << next.mixDiv
		<< ", nint " << (unsigned)next.nint << ", sdm " << next.sdm << std::endl;

	if ((ec = pollUntil(PLL_LOCK_POLICY,
		boost::bind(&R82xxTuner::pollLock, this, boost::placeholders::_1, boost::placeholders::_2),
		error::pll_not_locked))) {
		if(logOut()) *logOut() << tunerName(chip) << ": pll not locked at " << loHz << " Hz" << std::endl;
		return ec;
	}

	// set pll autotune = 8kHz
	return writeRegMask(0x1a, 0x08, 0x08);
}

/* init */

boost::system::error_code R82xxTuner::calibrateStep (unsigned attempt, bool &done)
{
	boost::system::error_code ec;

	// set filt_cap, cali clk on, xtal cap 0pF for PLL
	if ((ec = writeRegMask(0x0b, 0x6b, 0x60))
	|| (ec = writeRegMask(0x0f, 0x04, 0x04))
	|| (ec = writeRegMask(0x10, 0x00, 0x03)))
		return ec;

	if ((ec = setPll(56000000ULL))) {
		if (ec == error::make_error_code(error::pll_not_locked))
			return error::make_error_code(error::calibration_failed);
		return ec;
	}

	// start trigger, stop trigger, cali clk off
	if ((ec = writeRegMask(0x0b, 0x10, 0x10))
	|| (ec = writeRegMask(0x0b, 0x00, 0x10))
	|| (ec = writeRegMask(0x0f, 0x00, 0x04)))
		return ec;

	uint8_t data[5];
	if ((ec = read(data, sizeof(data))))
		return ec;
	filCalCode = data[4] & 0x0f;
	// 0 is a valid code but worth one more try
	done = filCalCode != 0x0f && (filCalCode != 0 || attempt + 1 >= FILTER_CAL_POLICY.maxAttempts);
	return ec;
}

boost::system::error_code R82xxTuner::setTvStandard ()
{
	// DVB-T 6 MHz defaults
	const uint8_t filt_gain = 0x10;		/* +3dB, 6MHz on */
	const uint8_t img_r = 0x00;			/* image negative */
	const uint8_t filt_q = 0x10;		/* r10[4]:low q(1'b1) */
	const uint8_t hp_cor = 0x6b;		/* 1.7m disable, +2cap, 1.0mhz */
	const uint8_t ext_enable = 0x60;	/* r30[6]=1 ext enable; r30[5]:1 ext at lna max-1 */
	const uint8_t loop_through = 0x01;	/* r5[7], lt off */
	const uint8_t lt_att = 0x00;		/* r31[7], lt att enable */
	const uint8_t flt_ext_widest = 0x00;	/* r15[7]: flt_ext_wide off */
	const uint8_t polyfil_cur = 0x60;	/* r25[6:5]:min */

	boost::system::error_code ec;

	// init flag & xtal_check result, version, LT gain test
	if ((ec = writeRegMask(0x0c, 0x00, 0x0f))
	|| (ec = writeRegMask(0x13, R82XX_VER_NUM, 0x3f))
	|| (ec = writeRegMask(0x1d, 0x00, 0x38)))
		return ec;

	intFreq = R82XX_IF_FREQ;

	if ((ec = pollUntil(FILTER_CAL_POLICY,
		boost::bind(&R82xxTuner::calibrateStep, this, boost::placeholders::_1, boost::placeholders::_2),
		error::calibration_failed))) {
		if(logOut()) *logOut() << tunerName(chip) << ": filter calibration failed: " << ec.message() << std::endl;
		return ec;
	}

	if ((ec = writeRegMask(0x0a, filt_q | filCalCode, 0x1f)))
		return ec;
	// BW, filter gain & HP corner
	if ((ec = writeRegMask(0x0b, hp_cor, 0xef)))
		return ec;
	if ((ec = writeRegMask(0x07, img_r, 0x80))
	|| (ec = writeRegMask(0x06, filt_gain, 0x30))
	|| (ec = writeRegMask(0x1e, ext_enable, 0x60))
	|| (ec = writeRegMask(0x05, loop_through, 0x80))
	|| (ec = writeRegMask(0x1f, lt_att, 0x80))
	|| (ec = writeRegMask(0x0f, flt_ext_widest, 0x80))
	|| (ec = writeRegMask(0x19, polyfil_cur, 0x60)))
		return ec;
	return ec;
}

boost::system::error_code R82xxTuner::sysfreqSel ()
{
	// DVB-T 8M
	const uint8_t mixer_top = 0x24;		/* mixer top:13 , top-1, low-discharge */
	const uint8_t lna_top = 0xe5;		/* detect bw 3, lna top:4, predet top:2 */
	const uint8_t lna_vth_l = 0x53;		/* lna vth 0.84, vtl 0.64 */
	const uint8_t mixer_vth_l = 0x75;	/* mixer vth 1.04, vtl 0.84 */
	const uint8_t air_cable1_in = 0x00;
	const uint8_t cable2_in = 0x00;
	const uint8_t lna_discharge = 14;
	const uint8_t cp_cur = 0x38;		/* 111, auto */
	const uint8_t filter_cur = 0x40;	/* 10, low */

	boost::system::error_code ec;
	if ((ec = writeRegMask(0x1d, lna_top, 0xc7))
	|| (ec = writeRegMask(0x1c, mixer_top, 0xf8))
	|| (ec = writeReg(0x0d, lna_vth_l))
	|| (ec = writeReg(0x0e, mixer_vth_l)))
		return ec;

	input = air_cable1_in;
	if ((ec = writeRegMask(0x05, air_cable1_in, 0x60))
	|| (ec = writeRegMask(0x06, cable2_in, 0x08))
	|| (ec = writeRegMask(0x11, cp_cur, 0x38))
	|| (ec = writeRegMask(0x17, R82XX_DIV_BUF_CUR, 0x30))
	|| (ec = writeRegMask(0x0a, filter_cur, 0x60)))
		return ec;

	// LNA TOP lowest, normal mode, PRE_DECT off, agc clk 250hz
	if ((ec = writeRegMask(0x1d, 0, 0x38))
	|| (ec = writeRegMask(0x1c, 0, 0x04))
	|| (ec = writeRegMask(0x06, 0, 0x40))
	|| (ec = writeRegMask(0x1a, 0x30, 0x30)))
		return ec;

	// LNA TOP = 3, discharge mode, LNA discharge current, agc clk 60hz
	if ((ec = writeRegMask(0x1d, 0x18, 0x38))
	|| (ec = writeRegMask(0x1c, mixer_top, 0x04))
	|| (ec = writeRegMask(0x1e, lna_discharge, 0x1f))
	|| (ec = writeRegMask(0x1a, 0x20, 0x30)))
		return ec;

	return writeRegMask(0x10, lna_discharge, 0x04);
}

boost::system::error_code R82xxTuner::init ()
{
	boost::system::error_code ec;

	if ((ec = write(R82XX_RW_REG_START, R82XX_INIT_REGS, sizeof(R82XX_INIT_REGS))))
		return ec;
	if ((ec = setTvStandard()))
		return ec;
	if ((ec = sysfreqSel()))
		return ec;

	initDone = true;
	if(logOut()) *logOut() << tunerName(chip) << ": initialized, filter cal code "
		<< (unsigned)filCalCode << ", xtal " << xtalFreq << " Hz" << std::endl;
	return ec;
}

boost::system::error_code R82xxTuner::exit ()
{
	if (!initDone)
		return boost::system::error_code();

	static const uint8_t standby[][2] = {
		{ 0x06, 0xb1 }, { 0x05, 0xa0 }, { 0x07, 0x3a }, { 0x08, 0x40 },
		{ 0x09, 0xc0 }, { 0x0a, 0x36 }, { 0x0c, 0x35 }, { 0x0f, 0x68 },
		{ 0x11, 0x03 }, { 0x17, 0xf4 }, { 0x19, 0x0c }
	};
	boost::system::error_code ec;
	for (size_t i = 0; i < sizeof(standby) / sizeof(standby[0]); i++) {
		if ((ec = writeReg(standby[i][0], standby[i][1])))
			return ec;
	}
	initDone = false;
	return ec;
}

/* tuning */

bool R82xxTuner::frequencyInRange (uint32_t hz) const
{
	uint32_t resolved = resolveFrequency(hz);
	return resolved >= R82XX_MIN_FREQ && resolved <= R82XX_MAX_FREQ;
}

boost::system::error_code R82xxTuner::setFrequency (uint32_t hz, uint32_t &achieved)
{
	if (!frequencyInRange(hz))
		return error::make_error_code(error::frequency_out_of_range);
	uint32_t resolved = resolveFrequency(hz);

	uint64_t lo = uint64_t(resolved) + intFreq;
	boost::system::error_code ec;
	if ((ec = setMux(lo, hz))
	|| (ec = setPll(lo))
	|| (ec = selectInput(hz)))
		return ec;

	uint64_t real = pllOutputFrequency(pll, xtalFreq) - intFreq;
	achieved = static_cast<uint32_t>(real - (resolved - hz));
	return ec;
}

boost::system::error_code R82xxTuner::setGain (const GainMode &mode)
{
	boost::system::error_code ec;

	if (mode.automatic) {
		// LNA auto, mixer auto, fixed VGA gain 26.5 dB
		if ((ec = writeRegMask(0x05, 0x00, 0x10))
		|| (ec = writeRegMask(0x07, 0x10, 0x10)))
			return ec;
		return writeRegMask(0x0c, 0x0b, 0x9f);
	}

	R82xxGainStep step = r82xxResolveGain(mode.tenthsDb);

	// LNA manual, mixer manual, fixed VGA gain 16.3 dB
	if ((ec = writeRegMask(0x05, 0x10, 0x10))
	|| (ec = writeRegMask(0x07, 0x00, 0x10))
	|| (ec = writeRegMask(0x0c, 0x08, 0x9f)))
		return ec;

	if ((ec = writeRegMask(0x05, step.lna, 0x0f)))
		return ec;
	if ((ec = writeRegMask(0x07, step.mixer, 0x0f)))
		return ec;
	if(traceOut()) *traceOut() << tunerName(chip) << ": gain " << step.gain << " (lna " << (unsigned)step.lna
		<< ", mixer " << (unsigned)step.mixer << ")" << std::endl;
	return ec;
}

boost::system::error_code R82xxTuner::setStageGains (int lna, int mixer, int vga)
{
	if (lna < 0 || lna > 15 || mixer < 0 || mixer > 15 || vga < 0 || vga > 15)
		return error::make_error_code(error::invalid_argument);

	boost::system::error_code ec;
	if ((ec = writeRegMask(0x05, 0x10 | lna, 0x1f))
	|| (ec = writeRegMask(0x07, mixer, 0x1f)))
		return ec;
	return writeRegMask(0x0c, vga, 0x9f);
}

boost::system::error_code R82xxTuner::setBandwidth (uint32_t hz, uint32_t &achieved)
{
	R82xxBandwidth e = r82xxResolveBandwidth(hz);
	boost::system::error_code ec;
	if ((ec = writeRegMask(0x0a, e.reg0a, 0x10))
	|| (ec = writeRegMask(0x0b, e.reg0b, 0xef)))
		return ec;

	intFreq = e.ifFreq;
	achieved = e.bw;
	return ec;
}

std::vector<int> R82xxTuner::gains () const
{
	std::vector<R82xxGainStep> table = r82xxGainTable();
	std::vector<int> out;
	for (size_t i = 0; i < table.size(); i++)
		out.push_back(table[i].gain);
	return out;
}

/* R820T */

R820TTuner::R820TTuner (RTL2832Device *dev, uint32_t xtal)
: R82xxTuner(dev, TUNER_R820T, R820T_I2C_ADDR, xtal, 2)
{
}

/* R828D */

R828DTuner::R828DTuner (RTL2832Device *dev, uint32_t xtal, bool upconverter)
: R82xxTuner(dev, TUNER_R828D, R828D_I2C_ADDR, xtal, 1), upconverter(upconverter), path(INPUT_NONE)
{
}

uint32_t R828DTuner::resolveFrequency (uint32_t hz) const
{
	if (upconverter && hz < R828D_UPCONVERT_FREQ)
		return hz + R828D_UPCONVERT_FREQ;
	return hz;
}

uint8_t R828DTuner::openDrain (uint32_t hz, const R82xxFreqRange &range) const
{
	if (!upconverter)
		return range.open_d;
	// notch filters off inside the broadcast bands
	if (hz <= 2200000 || (hz >= 85000000 && hz <= 112000000) || (hz >= 172000000 && hz <= 242000000))
		return 0x00;
	return 0x08;
}

// hz is the requested frequency; after the upconverter shift HF would land in the VHF band
boost::system::error_code R828DTuner::selectInput (uint32_t hz)
{
	boost::system::error_code ec;

	if (!upconverter) {
		// Cable1 below 345 MHz, Air-In above
		uint8_t air_cable1_in = hz > 345000000 ? 0x00 : 0x60;
		InputPath next = air_cable1_in ? INPUT_CABLE1 : INPUT_AIR;
		if (air_cable1_in != input || path == INPUT_NONE) {
			if ((ec = writeRegMask(0x05, air_cable1_in, 0x60)))
				return ec;
			input = air_cable1_in;
		}
		path = next;
		return ec;
	}

	// HF through the upconverter on Cable2, VHF on Cable1, UHF on Air
	InputPath next = hz <= R828D_UPCONVERT_FREQ ? INPUT_CABLE2 : hz < 250000000 ? INPUT_CABLE1 : INPUT_AIR;
	if (next == path)
		return ec;

	if ((ec = writeRegMask(0x06, next == INPUT_CABLE2 ? 0x08 : 0x00, 0x08))
	|| (ec = writeRegMask(0x05, next == INPUT_CABLE1 ? 0x40 : 0x00, 0x40))
	|| (ec = writeRegMask(0x05, next == INPUT_AIR ? 0x00 : 0x20, 0x20)))
		return ec;
	path = next;
	if(logOut()) *logOut() << "R828D: input " << (next == INPUT_CABLE2 ? "cable2 (HF)" : next == INPUT_CABLE1 ? "cable1 (VHF)" : "air (UHF)") << std::endl;
	return ec;
}

}
