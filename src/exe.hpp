#ifndef EXE_H
#define EXE_H
#include <string>
#include <vector>

class Logger;

struct spawnattr_t {
	int outputFd = -1;
	int nice = 0;
	std::string *output = NULL;
};

int SpawnAttr(const spawnattr_t *const spawnattr, const std::vector<std::string> &argv);

//Runs an external command to completion. Returns its exit status, or -1 when
//the command could not be started. With outputFd < 0 the command's output is
//captured and logged at debug level, otherwise stdout and stderr go to outputFd.
class Executor {
public:
	virtual ~Executor() {
	}
	virtual int Execute(const std::vector<std::string> &argv, int outputFd) = 0;
};

class ProcessExecutor : public Executor {
	Logger &log;
	int niceness = 0;
public:
	explicit ProcessExecutor(Logger &l) : log(l) {
	}
	void SetNice(int n) {
		niceness = n;
	}
	virtual int Execute(const std::vector<std::string> &argv, int outputFd);
};
#endif
