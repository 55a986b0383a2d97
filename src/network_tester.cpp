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

#include "hostguard.hpp"
#include "logutils.hpp"
#include "exe.hpp"
#include "network_tester.hpp"

int PingProber::Probe(const char *const host)
{
	assert(host != NULL);

	std::vector<std::string> argv(command);
	argv.push_back(host);

	log.Logmsg(LOG_INFO, "pinging host '%s'...", host);

	int ret = executor.Execute(argv, -1);

	if (ret < 0) {
		return PROBE_FAULT;
	}

	if (ret == 0) {
		log.Logmsg(LOG_INFO, "ping returned with code 0, host is up");
		return PROBE_ALIVE;
	}

	log.Logmsg(LOG_INFO, "ping returned with code %i, host is down", ret);

	return PROBE_DEAD;
}

//Hosts are probed in order; the first one that answers ends the round.
int AnyHostAlive(Prober &prober, const std::vector<std::string> &hosts, Logger &log)
{
	for (size_t i = 0; i < hosts.size(); i++) {
		int ret = prober.Probe(hosts[i].c_str());

		if (ret == PROBE_FAULT) {
			log.Logmsg(LOG_ERR, "unable to probe host '%s'", hosts[i].c_str());
			return PROBE_FAULT;
		}

		if (ret == PROBE_ALIVE) {
			return PROBE_ALIVE;
		}
	}

	return PROBE_DEAD;
}
