/*
 * Copyright 2016 Christian Lockley
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

#include "hostguard.hpp"

#include "sub.hpp"
#include "init.hpp"
#include "configfile.hpp"
#include "logutils.hpp"
#include "multicall.hpp"
#include "pidfile.hpp"
#include "clock.hpp"
#include "exe.hpp"
#include "shutdown.hpp"
#include "synctask.hpp"

static void PrintConfiguration(const struct cfgoptions *const cfg, Logger &log)
{
	log.Logmsg(LOG_INFO, "config=%s(%s) log=%s max-size=%li backups=%i journal=%s",
		   cfg->confile, cfg->haveConfigFile ? "loaded" : "defaults",
		   cfg->logFile.empty() ? "no" : cfg->logFile.c_str(), cfg->logMaxSize,
		   cfg->logBackups, cfg->options & LOGJOURNAL ? "yes" : "no");

	if (cfg->options & SYNCMODE) {
		log.Logmsg(LOG_INFO, "rsync=%s logs=%s nice=%i pidfile=%s", cfg->rsyncBinary.c_str(),
			   cfg->rsyncLogDirectory.c_str(), cfg->nice,
			   cfg->options & USEPIDFILE ? cfg->pidfileName.c_str() : "no");

		for (size_t i = 0; i < cfg->tasks.size(); i++) {
			log.Logmsg(LOG_INFO, "task: %s %s -> %s", cfg->tasks[i].name.c_str(),
				   cfg->tasks[i].source.c_str(), cfg->tasks[i].target.c_str());
		}
		return;
	}

	log.Logmsg(LOG_INFO, "required-offline=%lis interval=%lis no_act=%s",
		   cfg->options & ONESHOT ? 0L : (long)cfg->requiredOffline, (long)cfg->interval,
		   cfg->options & NOACTION ? "yes" : "no");
	log.Logmsg(LOG_INFO, "ping: %s", JoinArgv(cfg->pingCommand).c_str());
	log.Logmsg(LOG_INFO, "shutdown: %s", JoinArgv(cfg->shutdownCommand).c_str());

	if (cfg->hosts.empty()) {
		log.Logmsg(LOG_INFO, "hosts: no machine to check");
	}

	for (size_t i = 0; i < cfg->hosts.size(); i++) {
		log.Logmsg(LOG_INFO, "host: %s", cfg->hosts[i].c_str());
	}
}

static int SyncMain(struct cfgoptions *const options, Logger &log)
{
	ProcessExecutor executor(log);
	SystemClock clock;
	Pidfile pidfile(log);

	if (options->options & USEPIDFILE) {
		if (pidfile.Open(options->pidfileName.c_str()) < 0 || pidfile.Write(getpid()) < 0) {
			return EXIT_FAILURE;
		}
	}

	executor.SetNice(options->nice);

	int ret = RunSyncTasks(options, executor, clock, log);

	if (options->options & USEPIDFILE && pidfile.Delete() < 0) {
		ret = EXIT_FAILURE;
	}

	return ret;
}

int main(int argc, char **argv)
{
	cfgoptions options;
	Logger log;

	if (MyStrerrorInit() == false) {
		std::perror("Unable to create a new locale object");
		return EXIT_FAILURE;
	}

	if (strcmp(GetExeName(), PACKAGE_NAME "-sync") == 0) {
		options.options |= SYNCMODE;
	}

	int ret = ParseCommandLine(&argc, argv, &options, log);

	if (ret < 0) {
		FreeLocale();
		return EXIT_FAILURE;
	} else if (ret != 0) {
		FreeLocale();
		return EXIT_SUCCESS;
	}

	if (ReadConfigurationFile(&options, log) < 0) {
		FreeLocale();
		return EXIT_FAILURE;
	}

	if (options.logFile.empty() == false
	    && log.Open(options.logFile.c_str(), options.logMaxSize, options.logBackups) < 0) {
		log.Logmsg(LOG_ERR, "unable to open log file %s: %s", options.logFile.c_str(),
			   MyStrerror(errno));
		FreeLocale();
		return EXIT_FAILURE;
	}

	log.SetJournal(options.options & LOGJOURNAL);

	log.Logmsg(LOG_INFO, "program launch (%s, %s)", PACKAGE_STRING,
		   options.options & SYNCMODE ? "sync tasks" : "shutdown check");

	if (options.options & VERBOSE) {
		PrintConfiguration(&options, log);
	}

	if (options.options & SYNCMODE) {
		ret = SyncMain(&options, log);
	} else {
		ProcessExecutor executor(log);
		SystemClock clock;
		ret = ShutdownCheck(&options, executor, clock, log);
	}

	log.Logmsg(LOG_INFO, "program termination");

	if (log.Close() < 0) {
		ret = EXIT_FAILURE;
	}

	FreeLocale();

	return ret;
}
