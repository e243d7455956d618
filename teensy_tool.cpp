// $Id$

/*
 * Copyright 2015 Don Kinzer
 *
 * This program is free software; you can redistribute it and/or modify it under
 * the terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 2 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with
 * this program; if not, write to the Free Software Foundation, Inc., 51 Franklin
 * Street, Fifth Floor, Boston, MA 02110-1301 USA.
 *
 */

/*
 *
 * This code implements a downloader for Teensy 3.x and 4.x boards.  A
 * firmware file is converted to 1K blocks which are sent to the HalfKay
 * bootloader as HID output reports.  Three kinds of files are handled:
 *
 *	.hex	an Intel HEX file for the application
 *	.ehex	an Intel HEX file for the application (relative to the start of
 *			Flash) followed by a second HEX session containing a loader
 *			utility (at absolute RAM addresses); 4.x boards only
 *	other	a raw binary image, loaded at the start of Flash
 *
 * After the download, the utility can monitor the text that the running
 * application writes to its serial port, optionally logging it to a file.
 *
 * Options may also be given in the TEENSY_TOOL environment variable; they
 * are processed before those on the command line.
 *
 */

/** include files **/
#include "teensy.h"
#include "image.h"
#include "serial.h"
#include "hid.h"
#include <string>
#include <vector>
#if defined(__linux__)
  #include <sys/ioctl.h>
  #include <unistd.h>
#endif

/** local definitions **/

#if defined(WIN32)
#define DEF_COMM_CHANNEL			"COM3"
#elif defined(__linux__)
#define DEF_COMM_CHANNEL			"/dev/ttyACM0"
#endif

#define DEF_MON_ESCAPE				0x04
#define MONITOR_POLL_DELAY			10			// milliseconds between checks for input
#define MAX_SEND_ATTEMPTS			100

#define STR(x)						#x
#define XSTR(x)						STR(x)

// operating modes
typedef enum
{
	ModeWriteFlash,				// write files to the device
	ModeImageInfo,				// output information about an image
	ModeNone
} Mode_t;

// option processing modes
typedef enum
{
	OptionNone,
	OptionSetDevice,
	OptionSetPort,
	OptionSetSpeed,
	OptionSetDataBits,
	OptionSetParity,
	OptionSetStopBits,
	OptionSetRetries,
	OptionProcessFile,
	OptionWriteFlash,
	OptionImageInfo,
	OptionMonitor,
	OptionMonitorExit,
	OptionLog,
	OptionSetQuiet,
	OptionHelp,
	OptionInvalid,
	OptionInvalidValue,
	OptionBadForm
} Option_t;

// structure to hold parameter values
typedef struct Parameter_tag
{
	const char *portStr;		// the serial port designator (e.g. COM2 or /dev/ttyACM0)
	uint32_t runSpeed;			// the baud rate for the monitor
	unsigned serialFlags;		// data bits, parity and stop bits for the monitor
	uint8_t monExit;			// the monitor exit character code
	Mode_t mode;				// the operating mode
	uint16_t vendorID;			// the device to be used
	uint16_t productID;
	bool haveDevice;			// if the device was specified
	TransferConfig_t transfer;	// retry and pacing parameters
	bool quiet;					// suppress progress reporting
	bool termMode;				// if monitor mode should be entered
	const char *logFile;		// name of a file to which to log device output
	bool longOpt;

	Parameter_tag()
	{
		// set the default values
		portStr = DEF_COMM_CHANNEL;
		runSpeed = DEF_SERIAL_SPEED;
		serialFlags = SERIAL_NO_FLAGS;
		monExit = DEF_MON_ESCAPE;
		mode = ModeWriteFlash;
		vendorID = 0;
		productID = 0;
		haveDevice = false;
		quiet = false;
		termMode = false;
		logFile = NULL;
		longOpt = false;
	}
} Parameter_t;

typedef struct
{
	const char *opt;				// the option
	Option_t value;					// the associated option value
} OptWord_t;

typedef struct
{
	const char *shortForm;
	const char *longForm;
	const char *desc;				// NULL for the table terminator
} HelpLine_t;

/** private data **/
static const char *versionStr = "0.1";

#if defined(WIN32)
// storage for the serial port string, e.g "//./COM2"
static char commPortStr[20];
#endif

//
// Long form options (preceeded by '--'), and their corresponding values.
// N.B.: this table is scanned sequentially for an entry being a substring
//       of an option.  Consequently, an entry that is a prefix of another
//       entry must follow the longer entry.
//
static OptWord_t optWords[] =
{
	{ "baud=",			OptionSetSpeed },
	{ "data-bits=",		OptionSetDataBits },
	{ "device=",		OptionSetDevice },
	{ "exit=",			OptionMonitorExit },
	{ "file=",			OptionProcessFile },
	{ "help",			OptionHelp },
	{ "image-info",		OptionImageInfo },
	{ "log=",			OptionLog },
	{ "monitor",		OptionMonitor },
	{ "parity=",		OptionSetParity },
	{ "port=",			OptionSetPort },
	{ "quiet",			OptionSetQuiet },
	{ "retries=",		OptionSetRetries },
	{ "stop-bits=",		OptionSetStopBits },
	{ "write",			OptionWriteFlash },
	{ NULL,				OptionInvalid }
};

// the help text, one line per option
static const HelpLine_t optionHelp[] =
{
	{ "-h",				"--help",				"display this information" },
	{ "-d<id>",			"--device=<id>",		"select the device by vendor:product ID, e.g. 16c0:0478" },
	{ "-n<count>",		"--retries=<count>",	"attempts to send each block (default " XSTR(DEF_SEND_ATTEMPTS) ")" },
	{ "-q",				"--quiet",				"suppress progress reporting" },
	{ "-m[<speed>]",	"--monitor[=<speed>]",	"after the operations, display the device's serial output" },
	{ "-p<port>",		"--port=<port>",		"the serial port to monitor (default " DEF_COMM_CHANNEL ")" },
	{ "-b<speed>",		"--baud=<speed>",		"the monitor baud rate" },
	{ "",				"--data-bits=<n>",		"monitor data bits: 5, 6, 7 or 8" },
	{ "",				"--parity=<p>",			"monitor parity: none, even or odd" },
	{ "",				"--stop-bits=<n>",		"monitor stop bits: 1 or 2" },
	{ "-l<file>",		"--log=<file>",			"also write the monitored lines to a file" },
	{ "-x<code>",		"--exit=<code>",		"the console character that ends monitoring" },
	{ NULL,				NULL,					NULL }
};

static const HelpLine_t operationHelp[] =
{
	{ "-ow",			"--write",				"write the following files to the device (default)" },
	{ "-oi",			"--image-info",			"describe the blocks the following files produce" },
	{ NULL,				NULL,					NULL }
};

/** internal functions **/
static void displayHelp(bool doExit = true);
static void listHelp(const HelpLine_t *hlp);
static void splitArgs(const char *argList, std::vector<std::string>& args);
static void processArg(Parameter_t& parms, const char *argp);
static void processFile(Parameter_t& parm, const char *file);
static void runMonitor(Parameter_t& parm);
static void monitorLine(const char *line, void *context);
static bool consoleKey(uint8_t& c);
static bool getNumber(const char *p, uint32_t& val);
static bool getDeviceID(const char *p, uint16_t& vendorID, uint16_t& productID);

/** public functions **/

int
main(int argc, char **argv)
{
	Parameter_t parms;

	// arguments from the environment come first, they must outlive the parameters
	std::vector<std::string> envArgs;
	splitArgs(getenv("TEENSY_TOOL"), envArgs);
	for (size_t i = 0; i < envArgs.size(); i++)
		processArg(parms, envArgs[i].c_str());

	if (argc < 2)
		displayHelp();
	for (int i = 1; i < argc; i++)
		processArg(parms, argv[i]);

	if (parms.termMode)
		runMonitor(parms);

	HidDevice::Shutdown();
	return(0);
}

/** private functions **/

/*
 ** displayHelp
 *
 * Display invocation help on stdout.
 *
 */
static void
displayHelp(bool doExit)
{
	fprintf(stdout, "teensy_tool V%s\n", versionStr);
	fprintf(stdout, "usage: teensy_tool [[<options>] [<operation>] [<file>]]...\n");
	fprintf(stdout, "\nOptions:\n");
	listHelp(optionHelp);
	fprintf(stdout, "\nOperations:\n");
	listHelp(operationHelp);

	fprintf(stdout, "\nKnown devices:\n");
	for (const DeviceInfo_t *dip = DeviceList(); dip->name != NULL; dip++)
		fprintf(stdout, "  %04x:%04x   %s\n", dip->vendorID, dip->productID, dip->name);
	fprintf(stdout, "\nOptions are also taken from the TEENSY_TOOL environment variable.\n");

	if (doExit)
		exit(0);
}

static void
listHelp(const HelpLine_t *hlp)
{
	for ( ; hlp->desc != NULL; hlp++)
		fprintf(stdout, "  %-12s %-22s %s\n", hlp->shortForm, hlp->longForm, hlp->desc);
}

//
// Break a string into whitespace-separated arguments.  Text between a pair
// of single or double quotes is one argument even if it contains spaces.
//
static void
splitArgs(const char *argList, std::vector<std::string>& args)
{
	if (argList == NULL)
		return;

	const char *p = argList;
	while (*p != '\0')
	{
		if ((*p == ' ') || (*p == '\t'))
		{
			p++;
			continue;
		}

		std::string arg;
		char quote = '\0';
		if ((*p == '"') || (*p == '\''))
			quote = *p++;
		for ( ; *p != '\0'; p++)
		{
			if (quote ? (*p == quote) : ((*p == ' ') || (*p == '\t')))
				break;
			arg += *p;
		}
		if (quote && (*p == quote))
			p++;
		args.push_back(arg);
	}
}

//
// Process an argument string.
//
static void
processArg(Parameter_t& parm, const char *argp)
{
	char c;
	const char *p;
	uint32_t val;
	Option_t option = OptionInvalid;

	parm.longOpt = false;
	if (((p = argp) == NULL) || ((c = *p++) == '\0'))
		return;
	if (c  == '-')
	{
		switch(*p++)
		{
		case '?':
		case 'H':
		case 'h':			option = OptionHelp;			break;

		case 'b':			option = OptionSetSpeed;		break;

		case 'd':			option = OptionSetDevice;		break;

		case 'l':			option = OptionLog;				break;

		case 'm':			option = OptionMonitor;			break;

		case 'n':			option = OptionSetRetries;		break;

		case 'o':			// specify an operation
			switch (*p++)
			{
			case 'i':		option = OptionImageInfo;		break;
			case 'w':		option = OptionWriteFlash;		break;
			}
			break;

		case 'p':			option = OptionSetPort;			break;

		case 'q':			option = OptionSetQuiet;		break;

		case 'x':			option = OptionMonitorExit;		break;

		case '-':
			{
				// possible long-form option, look up the option in a table
				for (OptWord_t *owp = optWords; owp->opt != NULL; owp++)
				{
					int optLen = strlen(owp->opt);
					if (strncmp(p, owp->opt, optLen) == 0)
					{
						option = owp->value;
						p += optLen;
						parm.longOpt = true;
						break;
					}
				}
			}
			break;

		default:
			break;
		}
	}
#if defined(WIN32)
	// support additional help options on Windows
	else if ((c == '/') && (((c = argp[1]) == 'H') || (c == 'h') || (c == '?')) && (argp[2] == '\0'))
		option = OptionHelp;
#endif
	else
	{
		// assume it is a file to be processed
		option = OptionProcessFile;
		p = argp;
	}

	// take action based on the option seen
	switch (option)
	{
	case OptionHelp:
		displayHelp();
		break;

	//--------------------------------------------------------------------------
	// Options that save data for later use.
	//--------------------------------------------------------------------------
	case OptionSetQuiet:
		if (*p == '\0')
			parm.quiet = true;
		else
			option = OptionBadForm;
		break;

	case OptionSetDevice:
		if (*p == '\0')
			option = OptionBadForm;
		else if (!getDeviceID(p, parm.vendorID, parm.productID))
		{
			fprintf(stderr, "Invalid device designator, expected <vendor>:<product>: \"%s\".\n", argp);
			exit(1);
		}
		else
			parm.haveDevice = true;
		break;

	case OptionSetPort:
#if defined(WIN32)
		{
			// accept comm port specification as a numeric value or COMn
			if ((_strnicmp(p, "COM", 3) == 0) && isdigit(p[3]))
				p += 3;
			if (isdigit(*p))
			{
				if (!getNumber(p, val))
				{
					option = OptionInvalidValue;
					break;
				}
				if ((val == 0) || (val > 99))
				{
					fprintf(stderr, "Invalid serial channel: \"%s\".\n", argp);
					exit(1);
				}

				// produce a port descriptor string using the port number
				sprintf(commPortStr, "//./COM%u", val);
				parm.portStr = commPortStr;
				break;
			}
		}
#else
		// accept any non-empty string, validated when attempting open
		if (*p != '\0')
		{
			parm.portStr = p;
			break;
		}
#endif
		option = OptionBadForm;
		break;

	case OptionSetSpeed:
		if (getNumber(p, val) && val)
		{
			parm.runSpeed = val;
			break;
		}
		option = OptionInvalidValue;
		break;

	case OptionSetDataBits:
		if (!getNumber(p, val) || (val < 5) || (val > 8))
		{
			fprintf(stderr, "The data bits must be 5, 6, 7 or 8 - \"%s\".\n", argp);
			exit(1);
		}
		parm.serialFlags = (parm.serialFlags & ~SERIAL_BITS_MASK) | (8 - val);
		break;

	case OptionSetParity:
		{
			unsigned parity;
			if (_stricmp(p, "none") == 0)
				parity = SERIAL_PARITY_NONE;
			else if (_stricmp(p, "even") == 0)
				parity = SERIAL_PARITY_EVEN;
			else if (_stricmp(p, "odd") == 0)
				parity = SERIAL_PARITY_ODD;
			else
			{
				fprintf(stderr, "Unrecognized parity designator: \"%s\".\n", argp);
				exit(1);
			}
			parm.serialFlags = (parm.serialFlags & ~SERIAL_PARITY_MASK) | parity;
		}
		break;

	case OptionSetStopBits:
		if (!getNumber(p, val) || ((val != 1) && (val != 2)))
		{
			fprintf(stderr, "The stop bits must be 1 or 2 - \"%s\".\n", argp);
			exit(1);
		}
		parm.serialFlags = (parm.serialFlags & ~SERIAL_STOPBITS_MASK) |
				((val == 2) ? SERIAL_STOPBITS_2 : SERIAL_STOPBITS_1);
		break;

	case OptionSetRetries:
		if (!getNumber(p, val))
		{
			option = OptionInvalidValue;
			break;
		}
		if ((val == 0) || (val > MAX_SEND_ATTEMPTS))
		{
			fprintf(stderr, "The number of attempts must be between 1 and %u - \"%s\".\n", MAX_SEND_ATTEMPTS, argp);
			exit(1);
		}
		parm.transfer.sendAttempts = val;
		break;

	case OptionMonitor:
		if (*p == '=')
		{
			if (!parm.longOpt)
			{
				option = OptionBadForm;
				break;
			}
			if (*++p == '\0')
			{
				fprintf(stderr, "Missing run speed - \"%s\".\n", argp);
				exit(1);
			}
		}
		if (*p != '\0')
		{
			if (!getNumber(p, val))
			{
				option = OptionInvalidValue;
				break;
			}
			if (val == 0)
			{
				fprintf(stderr, "The run speed must be non-zero - \"%s\".\n", argp);
				exit(1);
			}
			parm.runSpeed = val;
		}
		parm.termMode = true;
		break;

	case OptionMonitorExit:
		if (*p != '\0')
		{
			if (!getNumber(p, val))
			{
				option = OptionInvalidValue;
				break;
			}
			if (val > 0xff)
			{
				fprintf(stderr, "The monitor exit code must be a byte value - \"%s\".\n", argp);
				exit(1);
			}
			parm.monExit = (uint8_t)val;
		}
		else
			option = OptionBadForm;
		break;

	case OptionLog:
		if (*p != '\0')
			parm.logFile = p;
		else
			option = OptionBadForm;
		break;

	//--------------------------------------------------------------------------
	// Options that set a mode for later operations.
	//--------------------------------------------------------------------------
	case OptionWriteFlash:
		if (*p == '\0')
			parm.mode = ModeWriteFlash;
		else
			option = OptionBadForm;
		break;

	case OptionImageInfo:
		if (*p == '\0')
			parm.mode = ModeImageInfo;
		else
			option = OptionBadForm;
		break;

	case OptionProcessFile:
		processFile(parm, p);
		break;

	default:
		break;
	}

	if (option == OptionInvalid)
	{
		fprintf(stderr, "Unrecognized option: \"%s\".\n", argp);
		exit(1);
	}
	if (option == OptionBadForm)
	{
		fprintf(stderr, "Badly formed option: \"%s\".\n", argp);
		exit(1);
	}
	if (option == OptionInvalidValue)
	{
		fprintf(stderr, "Invalid character in option value: \"%s\".\n", argp);
		exit(1);
	}
}

//
// Process a file using the accumulated option values.
//
static void
processFile(Parameter_t& parm, const char *file)
{
	int stat;

	if ((file == NULL) || (*file == '\0'))
		return;

	FirmwareImage image;
	if (image.Load(file) != 0)
		exit(1);

	// determine the target device
	if (!parm.haveDevice && (parm.mode == ModeWriteFlash))
	{
		const DeviceInfo_t *dip;
		if ((dip = HidDevice::FindPresent()) == NULL)
		{
			fprintf(stderr, "No device was specified and no known device is attached.\n");
			exit(1);
		}
		parm.vendorID = dip->vendorID;
		parm.productID = dip->productID;
		parm.haveDevice = true;
		if (!parm.quiet)
			fprintf(stdout, "Found %s (%04x:%04x).\n", dip->name, dip->vendorID, dip->productID);
	}
	image.SetDevice(parm.vendorID, parm.productID);

	// an unrecognized extension is taken to be a binary image, perhaps mistakenly
	ImageFormat_t format;
	const char *ext = strrchr(file, '.');
	if ((FirmwareImage::SelectFormat(file, image.Family(), format) == 0) &&
			(format == FormatRawBinary) && ((ext == NULL) || (_stricmp(ext, ".bin") != 0)))
		fprintf(stderr, "Note: \"%s\" is being treated as a raw binary image.\n", file);

	switch (parm.mode)
	{
	case ModeImageInfo:
		if (image.ImageInfo() != 0)
			exit(1);
		break;

	case ModeWriteFlash:
		{
			BlockSet_t blockSet;
			if (image.BuildBlocks(blockSet) != 0)
				exit(1);

			Teensy teensy(parm.transfer);
			if (parm.quiet)
				teensy.SetFlags(TEENSY_QUIET);
			HidDevice hid(parm.vendorID, parm.productID);
			if ((stat = teensy.FlashFirmware(blockSet, hid)) != 0)
			{
				if (stat == TEENSY_ERROR_TRANSFER)
					fprintf(stderr, "Download of file \"%s\" failed at address 0x%08x.\n", file, teensy.ErrorAddress());
				else
					fprintf(stderr, "Download of file \"%s\" failed (%d).\n", file, stat);
				exit(1);
			}
		}
		break;

	default:
		break;
	}
}

//
// Echo the lines of text arriving at the serial port until the exit
// character is entered at the console or the port goes away.
//
static void
runMonitor(Parameter_t& parm)
{
	FILE *fpLog = NULL;

	if ((parm.logFile != NULL) && ((fpLog = fopen(parm.logFile, "w")) == NULL))
		fprintf(stderr, "Can't create monitor log file \"%s\".\n", parm.logFile);

	SerialMonitor monitor;
	SerialConfig_t config(parm.portStr, parm.runSpeed, parm.serialFlags);
	if (monitor.Open(config) != 0)
	{
		fprintf(stderr, "Can't open port %s.\n", parm.portStr);
		exit(1);
	}
	monitor.OnLine(monitorLine, fpLog);
	if (!parm.quiet)
		fprintf(stdout, "Monitoring %s at %u baud, exit with character code 0x%02x.\n",
				monitor.PortName(), parm.runSpeed, parm.monExit);

	while (1)
	{
		int stat;
		if ((stat = monitor.Service()) < 0)
		{
			fprintf(stderr, "The serial port %s is no longer available.\n", parm.portStr);
			break;
		}
		if (stat == 0)
		{
			uint8_t c;
			if (consoleKey(c) && (c == parm.monExit))
				break;
			msDelay(MONITOR_POLL_DELAY);
		}
	}
	if (monitor.IsOpen())
		monitor.Close();
	if (fpLog != NULL)
		fclose(fpLog);
}

static void
monitorLine(const char *line, void *context)
{
	FILE *fpLog = (FILE *)context;

	fprintf(stdout, "%s\n", line);
	fflush(stdout);
	if (fpLog != NULL)
	{
		fprintf(fpLog, "%s\n", line);
		fflush(fpLog);
	}
}

//
// Check for a character typed at the console.
//
static bool
consoleKey(uint8_t& c)
{
#if defined(WIN32)
	if (_kbhit())
	{
		c = (uint8_t)_getch();
		return(true);
	}
#elif defined(__linux__)
	int byteCnt;
	if ((ioctl(0, FIONREAD, &byteCnt) >= 0) && byteCnt)
		return(read(0, &c, 1) == 1);
#endif
	return(false);
}

/*
 ** getNumber
 *
 * Convert an option value, decimal or hexadecimal with a leading x, X, 0x
 * or 0X, that must occupy the rest of the string.  Return true if it does.
 *
 */
static bool
getNumber(const char *p, uint32_t& val)
{
	if (p == NULL)
		return(false);

	int radix = 10;
	if ((*p == 'x') || (*p == 'X'))
		p++, radix = 16;
	else if ((p[0] == '0') && ((p[1] == 'x') || (p[1] == 'X')))
		p += 2, radix = 16;
	if ((radix == 16) ? !isxdigit((unsigned char)*p) : !isdigit((unsigned char)*p))
		return(false);

	char *end;
	unsigned long v = strtoul(p, &end, radix);
	if ((*end != '\0') || (v > 0xffffffffUL))
		return(false);
	val = (uint32_t)v;
	return(true);
}

//
// Extract a device identity of the form <vendor>:<product>, each a
// hexadecimal value, e.g. 16c0:0478.
//
static bool
getDeviceID(const char *p, uint16_t& vendorID, uint16_t& productID)
{
	if ((p == NULL) || !isxdigit((unsigned char)*p))
		return(false);

	char *end;
	unsigned long vid = strtoul(p, &end, 16);
	if ((*end != ':') || !isxdigit((unsigned char)end[1]))
		return(false);
	unsigned long pid = strtoul(end + 1, &end, 16);
	if ((*end != '\0') || (vid > 0xffff) || (pid > 0xffff))
		return(false);

	vendorID = (uint16_t)vid;
	productID = (uint16_t)pid;
	return(true);
}
