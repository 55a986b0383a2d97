/*
 * Copyright 2013-2016 Christian Lockley
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may
 * not use this file except in compliance with the License. You may obtain
 * a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
 * implied. See the License for the specific language governing
 * permissions and limitations under the License.
 */

#include <getopt.h>
#include "hostguard.hpp"
#include "init.hpp"
#include "sub.hpp"
#include "logutils.hpp"
#include "multicall.hpp"

int ParseCommandLine(int *argc, char **argv, struct cfgoptions *cfg, Logger &log)
{
	int opt = 0;

	const struct option longOptions[] = {
		{"no-action", no_argument, 0, 'q'},
		{"once", no_argument, 0, 'o'},
		{"sync", no_argument, 0, 'S'},
		{"help", no_argument, 0, 'h'},
		{"verbose", no_argument, 0, 'v'},
		{"version", no_argument, 0, 'V'},
		{"config-file", required_argument, 0, 'c'},
		{"loglevel", required_argument, 0, 'l'},
		{0, 0, 0, 0}
	};

	int tmp = 0;
	optind = 1;
	while ((opt =
		getopt_long(*argc, argv, "qoShvVc:l:", longOptions,
			    &tmp)) != -1) {

		switch (opt) {
		case 'c':
			cfg->confile = optarg;
			break;
		case 'q':
			cfg->options |= NOACTION;
			break;
		case 'o':
			cfg->options |= ONESHOT;
			break;
		case 'S':
			cfg->options |= SYNCMODE;
			break;
		case 'l':
			if (log.LogUpTo(optarg, true) == false) {
				return -1;
			}
			cfg->options |= LOGLVLSETCMDLN;
			break;
		case 'v':
			cfg->options |= VERBOSE;
			break;
		case 'V':
			PrintVersionString();
			return 1;
		case 'h':
			Usage();
			return 1;
		case '?':
			if (optopt == 'l') {
				fprintf(stderr, "Valid loglevels are:\n none, err, warning, notice, info, debug\n");
			}
			return -1;
		default:
			Usage();
			return -1;
		}
	}

	if (optind < *argc) {
		fprintf(stderr, "%s: unexpected argument: %s\n", PACKAGE_NAME, argv[optind]);
		return -1;
	}

	return 0;
}

int PrintVersionString(void)
{
	printf("%s\n", PACKAGE_STRING);
	printf("Licensed under the Apache License, Version 2.0.\n");
	printf("There is NO WARRANTY, to the extent permitted by law.\n");

	return 0;
}

int Usage(void)
{
//Emulate the gnu --help output.
	const char *const help[][2] = {
		{"Usage: ", " [OPTION]"},
		{"Power off the machine when none of a list of hosts answers pings,", ""},
		{"or run a list of rsync backup tasks.", ""},
		{"", ""},
		{"  -c, --config-file ", "path to configuration file"},
		{"  -o, --once", "power off after a single round of pings"},
		{"  -q, --no-action", "do not run the shutdown command"},
		{"  -S, --sync", "run the rsync tasks"},
		{"  -l, --loglevel", "sets max loglevel none, err, warning, notice, info, debug"},
		{"  -v, --verbose", "print the configuration at startup"},
		{"  -h, --help", "this help"},
		{"  -V, --version", "print version info"},
	};

	bool isterm = isatty(STDOUT_FILENO) == 1;

	printf("%s%s%s\n", help[0][0], GetExeName()[0] != '\0' ? GetExeName() : PACKAGE_NAME, help[0][1]);

	for (size_t i = 1; i < ARRAY_SIZE(help); i += 1) {
		if (help[i][1][0] == '\0') {
			printf("%s\n", help[i][0]);
			continue;
		}

		if (isterm) {
			printf("\x1B[1m%-22s\x1B[22m%s\n", help[i][0], help[i][1]);
		} else {
			printf("%-22s%s\n", help[i][0], help[i][1]);
		}
	}

	return 0;
}
