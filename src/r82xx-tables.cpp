// R82xx register tables and PLL arithmetic

#include <stdlib.h>

#include "error.hpp"
#include "r82xx.hpp"

#define FILT_HP_BW1	350000
#define FILT_HP_BW2	380000

namespace rtlsdrusb {

const uint8_t R82XX_INIT_REGS[R82XX_NUM_INIT_REGS] = {
	0x83, 0x32, 0x75,			/* 05 to 07 */
	0xc0, 0x40, 0xd6, 0x6c,		/* 08 to 0b */
	0xf5, 0x63, 0x75, 0x68,		/* 0c to 0f */
	0x6c, 0x83, 0x80, 0x00,		/* 10 to 13 */
	0x0f, 0x00, 0xc0, 0x30,		/* 14 to 17 */
	0x48, 0xcc, 0x60, 0x00,		/* 18 to 1b */
	0x54, 0xae, 0x4a, 0xc0		/* 1c to 1f */
};

const int R82XX_LNA_GAIN_STEPS[16] = {
	0, 9, 13, 40, 38, 13, 31, 22, 26, 31, 26, 14, 19, 5, 35, 13
};

const int R82XX_MIXER_GAIN_STEPS[16] = {
	0, 5, 10, 10, 19, 9, 10, 25, 17, 10, 8, 16, 13, 6, 3, -8
};

const int R82XX_VGA_GAIN_STEPS[16] = {
	0, 26, 26, 30, 42, 35, 24, 13, 14, 32, 36, 34, 35, 37, 35, 36
};

static const R82xxFreqRange FREQ_RANGES[] = {
	/* MHz  open_d mux_ploy tf_c  cap20p cap10p cap0p */
	{   0,  0x08,  0x02,    0xdf, 0x02,  0x01,  0x00 },
	{  50,  0x08,  0x02,    0xbe, 0x02,  0x01,  0x00 },
	{  55,  0x08,  0x02,    0x8b, 0x02,  0x01,  0x00 },
	{  60,  0x08,  0x02,    0x7b, 0x02,  0x01,  0x00 },
	{  65,  0x08,  0x02,    0x69, 0x02,  0x01,  0x00 },
	{  70,  0x08,  0x02,    0x58, 0x02,  0x01,  0x00 },
	{  75,  0x00,  0x02,    0x44, 0x02,  0x01,  0x00 },
	{  80,  0x00,  0x02,    0x44, 0x02,  0x01,  0x00 },
	{  90,  0x00,  0x02,    0x34, 0x01,  0x01,  0x00 },
	{ 100,  0x00,  0x02,    0x34, 0x01,  0x01,  0x00 },
	{ 110,  0x00,  0x02,    0x24, 0x01,  0x01,  0x00 },
	{ 120,  0x00,  0x02,    0x24, 0x01,  0x01,  0x00 },
	{ 140,  0x00,  0x02,    0x14, 0x01,  0x01,  0x00 },
	{ 180,  0x00,  0x02,    0x13, 0x00,  0x00,  0x00 },
	{ 220,  0x00,  0x02,    0x13, 0x00,  0x00,  0x00 },
	{ 250,  0x00,  0x02,    0x11, 0x00,  0x00,  0x00 },
	{ 280,  0x00,  0x02,    0x00, 0x00,  0x00,  0x00 },
	{ 310,  0x00,  0x41,    0x00, 0x00,  0x00,  0x00 },
	{ 450,  0x00,  0x41,    0x00, 0x00,  0x00,  0x00 },
	{ 588,  0x00,  0x40,    0x00, 0x00,  0x00,  0x00 },
	{ 650,  0x00,  0x40,    0x00, 0x00,  0x00,  0x00 }
};

// IF low-pass corners, widest first
static const uint32_t IF_LOW_PASS_BW[10] = {
	1700000, 1600000, 1550000, 1450000, 1200000, 900000, 700000, 550000, 450000, 350000
};

const char *tunerName (TunerType type)
{
	switch (type) {
	case TUNER_R820T:	return "R820T";
	case TUNER_R828D:	return "R828D";
	default:		return "unknown";
	}
}

std::vector<R82xxGainStep> r82xxGainTable ()
{
	std::vector<R82xxGainStep> table;
	R82xxGainStep step = { 0, 0, 0 };
	table.push_back(step);
	// LNA and mixer alternate; the last mixer step is negative and left out
	while (step.lna < 15) {
		step.lna++;
		step.gain += R82XX_LNA_GAIN_STEPS[step.lna];
		table.push_back(step);
		if (step.mixer < 14) {
			step.mixer++;
			step.gain += R82XX_MIXER_GAIN_STEPS[step.mixer];
			table.push_back(step);
		}
	}
	return table;
}

R82xxGainStep r82xxResolveGain (int tenthsDb)
{
	static const std::vector<R82xxGainStep> table = r82xxGainTable();

	size_t best = 0;
	for (size_t i = 1; i < table.size(); i++) {
		if (abs(table[i].gain - tenthsDb) < abs(table[best].gain - tenthsDb))
			best = i;
	}
	return table[best];
}

std::vector<R82xxBandwidth> r82xxBandwidthTable ()
{
	std::vector<R82xxBandwidth> table;
	R82xxBandwidth e;

	// low-pass only, both high-pass corners off
	for (int i = 9; i >= 0; i--) {
		e.bw = IF_LOW_PASS_BW[i];
		e.reg0a = 0x00;
		e.reg0b = 0x80 | 0x40 | 0x20 | (15 - i);
		e.ifFreq = 2300000 - e.bw / 2;
		table.push_back(e);
	}
	// + first high-pass corner
	for (int i = 3; i >= 0; i--) {
		e.bw = IF_LOW_PASS_BW[i] + FILT_HP_BW1;
		e.reg0a = 0x00;
		e.reg0b = 0x80 | 0x20 | (15 - i);
		e.ifFreq = 2300000 + FILT_HP_BW1 - e.bw / 2;
		table.push_back(e);
	}
	// + both high-pass corners
	for (int i = 3; i >= 0; i--) {
		e.bw = IF_LOW_PASS_BW[i] + FILT_HP_BW1 + FILT_HP_BW2;
		e.reg0a = 0x00;
		e.reg0b = 0x80 | (15 - i);
		e.ifFreq = 2300000 + FILT_HP_BW1 + FILT_HP_BW2 - e.bw / 2;
		table.push_back(e);
	}

	static const R82xxBandwidth wide[3] = {
		{ 6000000, 0x10, 0x6b, 3570000 },
		{ 7000000, 0x10, 0x2a, 4570000 },
		{ 8000000, 0x10, 0x0b, 4570000 }
	};
	table.insert(table.end(), wide, wide + 3);
	return table;
}

R82xxBandwidth r82xxResolveBandwidth (uint32_t hz)
{
	static const std::vector<R82xxBandwidth> table = r82xxBandwidthTable();

	size_t sel = 0;
	for (size_t i = 0; i < table.size(); i++) {
		if (table[i].bw <= hz)
			sel = i;
	}
	return table[sel];
}

const R82xxFreqRange &r82xxFreqRange (uint64_t loHz)
{
	uint64_t mhz = loHz / 1000000;
	size_t n = sizeof(FREQ_RANGES) / sizeof(FREQ_RANGES[0]);
	size_t sel = 0;
	for (size_t i = 0; i < n; i++) {
		if (FREQ_RANGES[i].freqMhz <= mhz)
			sel = i;
	}
	return FREQ_RANGES[sel];
}

boost::system::error_code computePll (uint64_t loHz, uint32_t pllRef, unsigned vcoPowerRef, PllSettings &out)
{
	if (pllRef == 0 || vcoPowerRef == 0)
		return error::make_error_code(error::invalid_argument);

	uint64_t freqKhz = (loHz + 500) / 1000;
	uint32_t mixDiv = 2;
	while (mixDiv <= 64) {
		if (freqKhz * mixDiv >= R82XX_VCO_MIN_KHZ && freqKhz * mixDiv < R82XX_VCO_MAX_KHZ)
			break;
		mixDiv <<= 1;
	}
	if (mixDiv > 64) {
		// just outside the VCO range at either end of the band
		mixDiv = freqKhz * 2 >= R82XX_VCO_MAX_KHZ ? 2 : 64;
	}

	uint8_t divNum = 0;
	for (uint32_t d = mixDiv; d > 2; d >>= 1)
		divNum++;

	uint64_t vco = loHz * mixDiv;
	uint64_t twoRef = 2ULL * pllRef;
	uint64_t nint = vco / twoRef;
	uint64_t sdm = ((vco - nint * twoRef) * 65536 + twoRef / 2) / twoRef;
	if (sdm >= 65536) {
		nint++;
		sdm = 0;
	}
	if (nint < 13 || nint > 128 / vcoPowerRef - 1)
		return error::make_error_code(error::frequency_out_of_range);

	out.mixDiv = mixDiv;
	out.divNum = divNum;
	out.nint = static_cast<uint8_t>(nint);
	out.sdm = static_cast<uint16_t>(sdm);
	return boost::system::error_code();
}

uint64_t pllOutputFrequency (const PllSettings &pll, uint32_t pllRef)
{
	uint64_t n = (uint64_t(pll.nint) << 16) + pll.sdm;
	uint64_t den = 65536ULL * pll.mixDiv;
	return (2ULL * pllRef * n + den / 2) / den;
}

double pllStepHz (const PllSettings &pll, uint32_t pllRef)
{
	return 2.0 * pllRef / (65536.0 * pll.mixDiv);
}

}
