// SPDX-License-Identifier: GPL-2.0-only
#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <wlr/util/log.h>
#include "common/spawn.h"
#include "config/rcxml.h"
#include "stackwc.h"

struct seat g_seat;
struct server g_server;

static const struct option long_options[] = {
	{"config", required_argument, NULL, 'c'},
	{"debug", no_argument, NULL, 'd'},
	{"help", no_argument, NULL, 'h'},
	{"startup", required_argument, NULL, 's'},
	{"version", no_argument, NULL, 'v'},
	{"verbose", no_argument, NULL, 'V'},
	{0, 0, 0, 0}
};

static const char stackwc_usage[] =
"Usage: stackwc [options...]\n"
"  -c, --config <file>      Specify config file (with path)\n"
"  -d, --debug              Enable full logging, including debug information\n"
"  -h, --help               Show help message and quit\n"
"  -s, --startup <command>  Run command on startup\n"
"  -v, --version            Show version number and quit\n"
"  -V, --verbose            Enable more verbose logging\n";

static void
usage(void)
{
	printf("%s", stackwc_usage);
	exit(0);
}

int
main(int argc, char *argv[])
{
	const char *startup_cmd = NULL;
	const char *config_file = NULL;
	enum wlr_log_importance verbosity = WLR_ERROR;

	int c;
	while (1) {
		int index = 0;
		c = getopt_long(argc, argv, "c:dhs:vV", long_options, &index);
		if (c == -1) {
			break;
		}
		switch (c) {
		case 'c':
			config_file = optarg;
			break;
		case 'd':
			verbosity = WLR_DEBUG;
			break;
		case 's':
			startup_cmd = optarg;
			break;
		case 'v':
			printf("stackwc " STACKWC_VERSION "\n");
			exit(0);
		case 'V':
			verbosity = WLR_INFO;
			break;
		case 'h':
		default:
			usage();
		}
	}
	if (optind < argc) {
		usage();
	}

	wlr_log_init(verbosity, NULL);

	rcxml_read(config_file);

	server_init();
	server_start();

	if (startup_cmd) {
		spawn_shell(startup_cmd);
	}
	for (auto &command : rc.autostart) {
		spawn_shell(command.c());
	}

	wl_display_run(g_server.wl_display);

	server_finish();
	rcxml_finish();
	return 0;
}
