#ifndef SYNCTASK_H
#define SYNCTASK_H
#include "hostguard.hpp"

class Clock;
class Executor;
class Logger;

std::vector<std::string> RsyncCommand(const std::string &rsyncBinary, const std::string &source,
				      const std::string &target);

class SyncTask {
	std::string name;
	std::string source;
	std::string target;
	std::string logDirectory;
	std::string captureFile;
	int exitStatus = -1;
	double duration = 0.0;
	bool ran = false;
	SyncTask(const synctask_t &task, const std::string &dir) : name(task.name),
		source(task.source), target(task.target), logDirectory(dir) {
	}
	int OpenCaptureFile(Logger &log);
public:
	static std::unique_ptr<SyncTask> Create(const synctask_t &, const std::string &logDirectory, Logger &);
	int Run(Executor &, Clock &, const std::string &rsyncBinary, Logger &);
	const std::string &GetName() const {
		return name;
	}
	const std::string &GetCaptureFile() const {
		return captureFile;
	}
	bool HasRun() const {
		return ran;
	}
	int GetExitStatus() const {
		return exitStatus;
	}
	double GetDuration() const {
		return duration;
	}
};

int RunSyncTasks(const struct cfgoptions *const cfg, Executor &executor, Clock &clock, Logger &log);
#endif
