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

#ifndef HOSTGUARD_H
#define HOSTGUARD_H

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif
#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif
#include <cassert>
#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <climits>
#include <config.h>
#include <csignal>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <memory>
#include <string>
#include <syslog.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#define ARRAY_SIZE(a) (sizeof(a)/sizeof((a)[0]))

#define NOACTION 0x1
#define VERBOSE 0x2
#define SYNCMODE 0x4
#define ONESHOT 0x8
#define LOGLVLSETCMDLN 0x10
#define USEPIDFILE 0x20
#define LOGJOURNAL 0x40

#define DEFAULT_LOG_MAX_SIZE 512000
#define DEFAULT_LOG_BACKUPS 30
#define DEFAULT_INTERVAL 60

struct synctask_t {
	std::string name;
	std::string source;
	std::string target;
};

struct cfgoptions {
	cfgoptions() {
	};
	const char *confile = "/etc/hostguard.conf";
	unsigned long options = 0;
	std::string logFile;
	std::string logUpto;
	long logMaxSize = DEFAULT_LOG_MAX_SIZE;
	int logBackups = DEFAULT_LOG_BACKUPS;
	std::vector<std::string> hosts;
	time_t requiredOffline = 0;
	time_t interval = DEFAULT_INTERVAL;
	std::vector<std::string> pingCommand = {"ping", "-c", "1", "-w", "5"};
	std::vector<std::string> shutdownCommand = {"/sbin/shutdown", "-P", "now"};
	std::string rsyncBinary = "/usr/bin/rsync";
	std::string rsyncLogDirectory;
	int nice = 0;
	std::string pidfileName;
	std::vector<synctask_t> tasks;
	bool haveConfigFile = false;
};

#endif
