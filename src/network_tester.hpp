#ifndef NETWORK_TESTER_H
#define NETWORK_TESTER_H
#include <string>
#include <vector>

class Executor;
class Logger;

enum {
	PROBE_FAULT = -1,
	PROBE_DEAD = 0,
	PROBE_ALIVE = 1,
};

class Prober {
public:
	virtual ~Prober() {
	}
	virtual int Probe(const char *const host) = 0;
};

class PingProber : public Prober {
	Executor &executor;
	Logger &log;
	std::vector<std::string> command;
public:
	PingProber(Executor &e, Logger &l, const std::vector<std::string> &cmd) : executor(e), log(l), command(cmd) {
	}
	virtual int Probe(const char *const host);
};

int AnyHostAlive(Prober &prober, const std::vector<std::string> &hosts, Logger &log);
#endif
