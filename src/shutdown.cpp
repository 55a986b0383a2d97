/*
 * Copyright 2013-2020 Christian Lockley
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
#include "exe.hpp"
#include "clock.hpp"
#include "logutils.hpp"
#include "network_tester.hpp"
#include "shutdown.hpp"

const char *MonitorStateName(monitorState_t state)
{
	switch (state) {
	case MONITOR_CHECKING:
		return "checking";
	case MONITOR_WAITING:
		return "waiting";
	case MONITOR_ABORTED:
		return "aborted";
	case MONITOR_COMMITTED:
		return "committed";
	case MONITOR_FAULT:
		return "fault";
	default:
		return "unknown";
	}
}

//At least two rounds after the first one must fail before a shutdown is committed.
bool CheckOfflinePolicy(time_t requiredOffline, time_t interval)
{
	if (requiredOffline == 0) {
		return true;
	}

	if (requiredOffline < 0 || interval <= 0) {
		return false;
	}

	return requiredOffline > 2 * interval;
}

std::unique_ptr<OfflineMonitor> OfflineMonitor::Create(Prober &prober, Clock &clock, Logger &log,
						       const std::vector<std::string> &hosts,
						       time_t requiredOffline, time_t interval)
{
	if (hosts.empty()) {
		log.Logmsg(LOG_ERR, "no hosts to check");
		return std::unique_ptr<OfflineMonitor>();
	}

	if (CheckOfflinePolicy(requiredOffline, interval) == false) {
		log.Logmsg(LOG_ERR, "interval (%lis) must be less than half of the required offline time (%lis)",
			   (long)interval, (long)requiredOffline);
		return std::unique_ptr<OfflineMonitor>();
	}

	return std::unique_ptr<OfflineMonitor>(new OfflineMonitor(prober, clock, log, hosts,
								  requiredOffline, interval));
}

monitorState_t OfflineMonitor::Check()
{
	rounds += 1;

	switch (AnyHostAlive(prober, hosts, log)) {
	case PROBE_ALIVE:
		state = MONITOR_ABORTED;
		break;
	case PROBE_DEAD:
		state = MONITOR_WAITING;
		break;
	default:
		state = MONITOR_FAULT;
		break;
	}

	return state;
}

monitorState_t OfflineMonitor::Run()
{
	if (state != MONITOR_CHECKING) {
		return state;
	}

	log.Logmsg(LOG_INFO, "pinging hosts...");

	if (Check() != MONITOR_WAITING) {
		return state;
	}

	if (requiredOffline == 0) {
		log.Logmsg(LOG_INFO, "none of the listed hosts seems to be up");
		state = MONITOR_COMMITTED;
		return state;
	}

	const double deadline = clock.Now() + (double)requiredOffline;

	log.Logmsg(LOG_INFO, "none of the listed hosts seems to be up, checking every %lis for %lis",
		   (long)interval, (long)requiredOffline);

	while (clock.Now() < deadline) {
		clock.Sleep(interval);

		state = MONITOR_CHECKING;

		if (Check() != MONITOR_WAITING) {
			return state;
		}

		log.Logmsg(LOG_DEBUG, "round %lu: all hosts down", rounds);
	}

	log.Logmsg(LOG_INFO, "none of the listed hosts was up for %lis", (long)requiredOffline);

	state = MONITOR_COMMITTED;

	return state;
}

int Shutdown(Executor &executor, const struct cfgoptions *const cfg, Logger &log)
{
	assert(cfg != NULL);

	if (cfg->options & NOACTION) {
		log.Logmsg(LOG_INFO, "no-action set, not running '%s'",
			   JoinArgv(cfg->shutdownCommand).c_str());
		return 0;
	}

	int ret = executor.Execute(cfg->shutdownCommand, -1);

	if (ret < 0) {
		return -1;
	}

	log.Logmsg(LOG_INFO, "'%s' returncode: %i", JoinArgv(cfg->shutdownCommand).c_str(), ret);

	return 0;
}

int ShutdownCheck(const struct cfgoptions *const cfg, Executor &executor, Clock &clock, Logger &log)
{
	assert(cfg != NULL);

	PingProber prober(executor, log, cfg->pingCommand);
	time_t requiredOffline = cfg->options & ONESHOT ? 0 : cfg->requiredOffline;

	std::unique_ptr<OfflineMonitor> monitor = OfflineMonitor::Create(prober, clock, log, cfg->hosts,
									 requiredOffline, cfg->interval);

	if (!monitor) {
		return EXIT_FAILURE;
	}

	monitorState_t state = monitor->Run();

	log.Logmsg(LOG_DEBUG, "monitor finished after %lu rounds: %s",
		   monitor->GetRounds(), MonitorStateName(state));

	switch (state) {
	case MONITOR_ABORTED:
		log.Logmsg(LOG_INFO, "at least one host is up, exit program");
		return EXIT_SUCCESS;
	case MONITOR_COMMITTED:
		log.Logmsg(LOG_INFO, "invoke shutdown");
		if (Shutdown(executor, cfg, log) < 0) {
			return EXIT_FAILURE;
		}
		return EXIT_SUCCESS;
	default:
		log.Logmsg(LOG_ERR, "unable to determine host reachability");
		return EXIT_FAILURE;
	}
}
