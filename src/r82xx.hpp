/* R820T / R828D
	Rafael Micro R820T	I2C 0x34, crystal shared with the RTL2832U
	Rafael Micro R828D	I2C 0x74, 16 MHz crystal (28.8 MHz on RTL-SDR Blog V4)
*/

#ifndef _R82XX_HPP_
#define _R82XX_HPP_

#include <inttypes.h>
#include <vector>

#include "rtl2832-core.hpp"
#include "tuner.hpp"

#define R820T_I2C_ADDR		0x34
#define R828D_I2C_ADDR		0x74
#define R82XX_CHECK_ADDR	0x00
#define R82XX_CHECK_VAL		0x69

#define R82XX_IF_FREQ		3570000
#define R828D_XTAL_FREQ		16000000

#define R82XX_NUM_REGS		32
#define R82XX_RW_REG_START	5
#define R82XX_NUM_INIT_REGS	(R82XX_NUM_REGS - R82XX_RW_REG_START)
#define R82XX_MAX_I2C_MSG_LEN	8
#define R82XX_VER_NUM		49

#define R82XX_MIN_FREQ		24000000U
#define R82XX_MAX_FREQ		1766000000U
#define R82XX_VCO_MIN_KHZ	1770000U
#define R82XX_VCO_MAX_KHZ	3540000U

#define R828D_UPCONVERT_FREQ	28800000U

namespace rtlsdrusb {

struct R82xxFreqRange {
	uint32_t freqMhz;
	uint8_t open_d;
	uint8_t rf_mux_ploy;
	uint8_t tf_c;
	uint8_t xtal_cap20p;
	uint8_t xtal_cap10p;
	uint8_t xtal_cap0p;
};

// cumulative LNA/mixer gain, one stage step per entry
struct R82xxGainStep {
	int gain;		// 0.1 dB
	uint8_t lna;
	uint8_t mixer;
};

struct R82xxBandwidth {
	uint32_t bw;
	uint8_t reg0a;
	uint8_t reg0b;
	uint32_t ifFreq;
};

extern const uint8_t R82XX_INIT_REGS[R82XX_NUM_INIT_REGS];
extern const int R82XX_LNA_GAIN_STEPS[16];
extern const int R82XX_MIXER_GAIN_STEPS[16];
extern const int R82XX_VGA_GAIN_STEPS[16];

std::vector<R82xxGainStep> r82xxGainTable ();
// nearest entry, ties to the lower one, clamped to the table ends
R82xxGainStep r82xxResolveGain (int tenthsDb);

std::vector<R82xxBandwidth> r82xxBandwidthTable ();
// largest entry not above hz, the narrowest filter below that
R82xxBandwidth r82xxResolveBandwidth (uint32_t hz);

const R82xxFreqRange &r82xxFreqRange (uint64_t loHz);

struct PllSettings {
	uint32_t mixDiv;	// 2..64
	uint8_t divNum;		// log2(mixDiv) - 1
	uint8_t nint;
	uint16_t sdm;		// 1/65536 fraction of 2 * pllRef
};

boost::system::error_code computePll (uint64_t loHz, uint32_t pllRef, unsigned vcoPowerRef, PllSettings &pll);
uint64_t pllOutputFrequency (const PllSettings &pll, uint32_t pllRef);
// frequency resolution for a given divider
double pllStepHz (const PllSettings &pll, uint32_t pllRef);

class R82xxTuner : public Tuner
{
public:
	R82xxTuner (RTL2832Device *dev, TunerType type, uint8_t i2cAddr, uint32_t xtal, unsigned vcoPowerRef);

	TunerType type () const { return chip; }

	boost::system::error_code init ();
	boost::system::error_code exit ();
	bool frequencyInRange (uint32_t hz) const;
	boost::system::error_code setFrequency (uint32_t hz, uint32_t &achieved);
	boost::system::error_code setGain (const GainMode &mode);
	boost::system::error_code setStageGains (int lna, int mixer, int vga);
	boost::system::error_code setBandwidth (uint32_t hz, uint32_t &achieved);

	uint32_t ifFrequency () const { return intFreq; }
	void setXtal (uint32_t hz) { xtalFreq = hz; }
	uint32_t xtal () const { return xtalFreq; }
	std::vector<int> gains () const;

	uint8_t i2cAddress () const { return addr; }
	const PllSettings &lastPll () const { return pll; }
	uint8_t cachedReg (uint8_t reg) const { return reg < R82XX_NUM_REGS ? regs[reg] : 0; }
	uint8_t filterCalCode () const { return filCalCode; }

protected:
	// frequency handed to the synthesizer for a request
	virtual uint32_t resolveFrequency (uint32_t hz) const { return hz; }
	virtual uint8_t openDrain (uint32_t hz, const R82xxFreqRange &range) const { return range.open_d; }
	virtual boost::system::error_code selectInput (uint32_t hz) { return boost::system::error_code(); }

	boost::system::error_code write (uint8_t reg, const uint8_t *val, int len);
	boost::system::error_code writeReg (uint8_t reg, uint8_t val);
	boost::system::error_code writeRegMask (uint8_t reg, uint8_t val, uint8_t mask);
	boost::system::error_code read (uint8_t *val, int len);

	uint8_t input;

private:
	boost::system::error_code setMux (uint64_t loHz, uint32_t hz);
	boost::system::error_code setPll (uint64_t loHz);
	boost::system::error_code pollLock (unsigned attempt, bool &done);
	boost::system::error_code calibrateStep (unsigned attempt, bool &done);
	boost::system::error_code setTvStandard ();
	boost::system::error_code sysfreqSel ();

	RTL2832Device *dev;
	TunerType chip;
	uint8_t addr;
	uint32_t xtalFreq;
	unsigned vcoPowerRef;

	uint8_t regs[R82XX_NUM_REGS];
	uint32_t intFreq;
	uint8_t filCalCode;
	PllSettings pll;
	bool initDone;
};

class R820TTuner : public R82xxTuner
{
public:
	R820TTuner (RTL2832Device *dev, uint32_t xtal);
};

class R828DTuner : public R82xxTuner
{
public:
	enum InputPath { INPUT_NONE, INPUT_AIR, INPUT_CABLE1, INPUT_CABLE2 };

	// upconverter: RTL-SDR Blog V4 board with the HF upconverter in front
	R828DTuner (RTL2832Device *dev, uint32_t xtal, bool upconverter);

	bool hasUpconverter () const { return upconverter; }
	InputPath inputPath () const { return path; }

protected:
	uint32_t resolveFrequency (uint32_t hz) const;
	uint8_t openDrain (uint32_t hz, const R82xxFreqRange &range) const;
	boost::system::error_code selectInput (uint32_t hz);

private:
	bool upconverter;
	InputPath path;
};

}

#endif
