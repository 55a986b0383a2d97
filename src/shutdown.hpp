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

#ifndef SHUTDOWN_H
#define SHUTDOWN_H
#include "hostguard.hpp"

class Clock;
class Executor;
class Logger;
class Prober;

enum monitorState_t {
	MONITOR_CHECKING,
	MONITOR_WAITING,
	MONITOR_ABORTED,
	MONITOR_COMMITTED,
	MONITOR_FAULT,
};

const char *MonitorStateName(monitorState_t state);
bool CheckOfflinePolicy(time_t requiredOffline, time_t interval);

/*
 * Decides whether the machine is powered off. The first round of probes runs
 * immediately; if every host is down the monitor keeps probing every
 * interval seconds until requiredOffline seconds have passed. A single
 * answering host at any round aborts. A requiredOffline of zero commits
 * after the first round.
 */
class OfflineMonitor {
	Prober &prober;
	Clock &clock;
	Logger &log;
	std::vector<std::string> hosts;
	time_t requiredOffline;
	time_t interval;
	monitorState_t state = MONITOR_CHECKING;
	unsigned long rounds = 0;
	OfflineMonitor(Prober &p, Clock &c, Logger &l, const std::vector<std::string> &h,
		       time_t required, time_t i) : prober(p), clock(c), log(l), hosts(h),
		       requiredOffline(required), interval(i) {
	}
	monitorState_t Check();
public:
	static std::unique_ptr<OfflineMonitor> Create(Prober &, Clock &, Logger &,
						      const std::vector<std::string> &,
						      time_t requiredOffline, time_t interval);
	monitorState_t Run();
	monitorState_t GetState() const {
		return state;
	}
	unsigned long GetRounds() const {
		return rounds;
	}
};

int Shutdown(Executor &executor, const struct cfgoptions *const cfg, Logger &log);
int ShutdownCheck(const struct cfgoptions *const cfg, Executor &executor, Clock &clock, Logger &log);
#endif
