/*
recrtlsdr
RTL2832U + R820T/R828D raw I/Q recorder
*/

#include <stdio.h>
#include <stdlib.h>
#include <signal.h>
#include <string.h>
#include <getopt.h>
#include <fcntl.h>
#include <time.h>
#include <unistd.h>

#include <iostream>
#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "enumerator.hpp"
#include "rtlsdr-device.hpp"

/* maximum write length at once */
#define SIZE_CHUNK 16384

/* samples per read */
#define DEFAULT_BUF_LENGTH (16 * 16384)

using namespace rtlsdrusb;

/* usageの表示 */
void usage(char *argv0)
{
	std::cerr << "usage:\n" << argv0
		<< " [-d index | -s serial]"
		<< " [-r rate] [-g gain] [-p ppm] [-b bw]"
		<< " [-T] [-n blocks] [-v] frequency recsec destfile\n" << std::endl;

	std::cerr << "Remarks:\n"
			<< "if rectime  is '-', records indefinitely.\n"
			<< "if destfile is '-', stdout is used for output.\n" << std::endl;

	std::cerr << "device list:\n" << argv0 << " --list\n" << std::endl;

	std::cerr << "Options:" << std::endl;
	std::cerr << "-d index:           Device index (default: 0)" << std::endl;
	std::cerr << "-s serial:          Device serial number" << std::endl;
	std::cerr << "-r rate:            Sample rate in Hz (default: 2048000)" << std::endl;
	std::cerr << "-g gain:            Tuner gain in dB (default: auto)" << std::endl;
	std::cerr << "-p ppm:             Frequency correction" << std::endl;
	std::cerr << "-b bw:              Tuner bandwidth in Hz (default: sample rate)" << std::endl;
	std::cerr << "-T:                 Enable bias tee" << std::endl;
	std::cerr << "-n blocks:          Stop after this many reads of " << DEFAULT_BUF_LENGTH << " bytes" << std::endl;
	std::cerr << "-v:                 Verbose log" << std::endl;
	std::cerr << "--list:             List RTL2832U devices and exit" << std::endl;
	exit(1);
}

RtlSdrDevice	*sdr = NULL;
time_t			time_start;	// 開始時間

/* オプション情報 */
struct Args {
	bool stdout;
	uint32_t frequency;
	bool forever;
	int recsec;
	char* destfile;
	bool verbose;
	bool list;
	unsigned index;
	char* serial;
	uint32_t rate;
	bool autoGain;
	int gain;		// 0.1 dB
	int ppm;
	uint32_t bandwidth;
	bool biasTee;
	unsigned blocks;
};

Args args = {
	false,
	0,
	false,
	0,
	NULL,
	false,
	false,
	0,
	NULL,
	2048000,
	true,
	0,
	0,
	0,
	false,
	0
};

/* オプションの解析 */
void parseOption(int argc, char *argv[])
{
	while (1) {
		int option_index = 0;
		static option long_options[] = {
			{ "list",     0, NULL, 'l' },
			{ 0,     0, NULL, 0   }
		};

		int r = getopt_long(argc, argv,
							"d:s:r:g:p:b:Tn:v",
							long_options, &option_index);
		if (r < 0) {
			break;
		}

		switch (r) {
			case 'l':
				args.list = true;
				break;
			case 'd':
				args.index = atoi(optarg);
				break;
			case 's':
				args.serial = optarg;
				break;
			case 'r':
				args.rate = strtoul(optarg, NULL, 10);
				break;
			case 'g':
				args.autoGain = false;
				args.gain = (int)(atof(optarg) * 10);
				break;
			case 'p':
				args.ppm = atoi(optarg);
				break;
			case 'b':
				args.bandwidth = strtoul(optarg, NULL, 10);
				break;
			case 'T':
				args.biasTee = true;
				break;
			case 'n':
				args.blocks = atoi(optarg);
				break;
			case 'v':
				args.verbose = true;
				break;
			default:
				usage(argv[0]);
				break;
		}
	}

	if (args.list)
		return;

	if (argc - optind != 3) {
		usage(argv[0]);
	}

	args.frequency = strtoul(argv[optind++], NULL, 10);
	char *recsecstr = argv[optind++];
	if (strcmp("-", recsecstr) == 0) {
		args.forever = true;
	}
	args.recsec    = atoi(recsecstr);
	args.destfile = argv[optind++];
	if (strcmp("-", args.destfile) == 0) {
		args.stdout = true;
	}
}

static volatile sig_atomic_t caughtSignal = 0;

void sighandler(int arg)
{
	caughtSignal = 1;
	if (sdr)
		sdr->cancelStreaming();
}

static int listDevices()
{
	UsbfsBus bus;
	DeviceEnumerator enumerator(bus);
	std::vector<DeviceDescriptor> devices;
	boost::system::error_code ec = enumerator.listDevices(devices);
	if (ec) {
		std::cerr << "can't scan " << bus.baseDir() << ": " << ec.message() << std::endl;
		return 1;
	}
	if (devices.empty()) {
		std::cerr << "No supported devices found." << std::endl;
		return 1;
	}
	std::cerr << "Found " << devices.size() << " device(s):" << std::endl;
	for (size_t i = 0; i < devices.size(); i++) {
		const DeviceDescriptor &d = devices[i];
		std::cerr << "  " << d.index << ":  " << d.manufacturer << ", " << d.product << ", SN: " << d.serial
			<< " (" << d.name << (d.upconverter ? ", HF upconverter" : "") << ") " << d.path << std::endl;
	}
	return 0;
}

static bool check(const char *what, const boost::system::error_code &ec)
{
	if (ec) {
		std::cerr << what << " failed: " << ec.message() << std::endl;
		return false;
	}
	return true;
}

int main(int argc, char **argv)
{
	int					dest;
	int					status = 0;
	uint32_t			achieved;

	parseOption(argc, argv);

	if (args.list)
		return listDevices();

	if (!args.forever && args.recsec <= 0) {
		std::cerr << "recsec must be (recsec > 0)." << std::endl;
		exit(1);
	}

	// ログ出力先設定
	std::ostream& log = args.stdout ? std::cerr : std::cout;
	log << "recrtlsdr ver. 0.1.0" << std::endl << "RTL2832U SDR receiver" << std::endl;
	setLog(&log, args.verbose);

	UsbfsBus bus;
	RtlSdrDevice dev(bus);
	DeviceIdentity id = args.serial ? DeviceIdentity(BySerial(args.serial)) : DeviceIdentity(ByIndex(args.index));
	if (!check("open", dev.open(id)))
		return 1;
	sdr = &dev;

	if (!check("set sample rate", dev.setSampleRate(args.rate, achieved)))
		return 1;
	if (args.ppm && !check("set frequency correction", dev.setFreqCorrection(args.ppm)))
		return 1;
	if (!check("set frequency", dev.setFrequency(args.frequency, achieved)))
		return 1;
	log << "Tuned to " << achieved << " Hz." << std::endl;
	if (!check("set gain", dev.setGain(args.autoGain ? GainMode::Auto() : GainMode::Manual(args.gain))))
		return 1;
	if (args.bandwidth && !check("set bandwidth", dev.setBandwidth(args.bandwidth, achieved)))
		return 1;
	if (args.biasTee && !check("set bias tee", dev.setBiasTee(true)))
		return 1;

	// SIGINT, SIGTERM
	struct sigaction sa;
	memset(&sa, 0, sizeof(struct sigaction));
	sa.sa_handler = sighandler;
	sa.sa_flags = SA_RESTART;
	sigaction(SIGINT,  &sa, NULL);
	sigaction(SIGTERM, &sa, NULL);
	sigaction(SIGPIPE, &sa, NULL);

	// 出力先ファイルオープン
	if(!args.stdout) {
		dest = open(args.destfile, (O_RDWR | O_CREAT | O_TRUNC), 0666);
		if (0 > dest) {
			std::cerr << "can't open file '" << args.destfile << "' to write." << std::endl;
			exit(1);
		}
	}else
		dest = 1;	// stdout;

	if (!check("start streaming", dev.startStreaming()))
		return 1;

	time_start = time(NULL);
	SampleBlock block;
	unsigned count = 0;
	while (!caughtSignal) {
		if (!args.forever && time(NULL) - time_start >= args.recsec)
			break;
		if (args.blocks && count >= args.blocks)
			break;

		boost::system::error_code ec = dev.readSamples(DEFAULT_BUF_LENGTH, block);
		if (ec == error::make_error_code(error::streaming_cancelled))
			break;
		if (ec) {
			log << "read failed: " << ec.message() << std::endl;
			status = 1;
			break;
		}
		count++;

		const uint8_t *buf = &block[0];
		int rlen = block.size();
		if(args.verbose) {
			log << "Block " << count << ", " << rlen << " bytes wrote." << std::endl;
		}
		while(rlen > 0) {
			ssize_t wc;
			int ws = rlen < SIZE_CHUNK ? rlen : SIZE_CHUNK;
			wc = write(dest, buf, ws);
			if(wc < 0) {
				log << "write failed." << std::endl;
				caughtSignal = 1;
				status = 1;
				break;
			}
			rlen -= wc;
			buf += wc;
		}
	}
	if (caughtSignal && !status) {
		log << "interrupted." << std::endl;
	}
	check("stop streaming", dev.stopStreaming());

	// Default Signal Handler
	struct sigaction saDefault;
	memset(&saDefault, 0, sizeof(struct sigaction));
	saDefault.sa_handler = SIG_DFL;
	sigaction(SIGINT,  &saDefault, NULL);
	sigaction(SIGTERM, &saDefault, NULL);
	sigaction(SIGPIPE, &saDefault, NULL);

	// 録画時間の測定
	time_t time_end = time(NULL);

	if(!args.stdout ) {
		close(dest);
	}
	log << "done." << std::endl;
	log << "Rec time: " << static_cast<unsigned>(time_end - time_start) << " sec." << std::endl;

	sdr = NULL;
	if (!check("close", dev.close()))
		status = 1;
	return status;
}
