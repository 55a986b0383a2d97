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
#include "sub.hpp"
#include "exe.hpp"
#include "clock.hpp"
#include "logutils.hpp"
#include "synctask.hpp"

std::vector<std::string> RsyncCommand(const std::string &rsyncBinary, const std::string &source,
				      const std::string &target)
{
	std::vector<std::string> argv = {rsyncBinary, "--archive", "--verbose", "--hard-links",
		"--delete", "--fuzzy", "--stats"};

	argv.push_back(source);
	argv.push_back(target);

	return argv;
}

std::unique_ptr<SyncTask> SyncTask::Create(const synctask_t &task, const std::string &logDirectory,
					   Logger &log)
{
	log.Logmsg(LOG_INFO, "setting up task '%s'", task.name.c_str());

	if (task.name.empty() || task.name.find('/') != std::string::npos) {
		log.Logmsg(LOG_ERR, "invalid task name: '%s'", task.name.c_str());
		return std::unique_ptr<SyncTask>();
	}

	if (IsDirectory(task.source.c_str()) == false) {
		log.Logmsg(LOG_ERR, "source is no directory: %s", task.source.c_str());
		return std::unique_ptr<SyncTask>();
	}

	if (IsDirectory(task.target.c_str()) == false) {
		log.Logmsg(LOG_ERR, "target is no directory: %s", task.target.c_str());
		return std::unique_ptr<SyncTask>();
	}

	if (HasTrailingSeparator(task.source.c_str())) {
		log.Logmsg(LOG_ERR, "source has trailing slash: %s", task.source.c_str());
		return std::unique_ptr<SyncTask>();
	}

	if (IsDirectory(logDirectory.c_str()) == false) {
		log.Logmsg(LOG_ERR, "rsync log directory is no directory: %s", logDirectory.c_str());
		return std::unique_ptr<SyncTask>();
	}

	return std::unique_ptr<SyncTask>(new SyncTask(task, logDirectory));
}

int SyncTask::OpenCaptureFile(Logger &log)
{
	std::string base = logDirectory + "/rsync_stdouterr_" + name + "_" + TimeString(time(NULL));

	for (int i = 0; i < 100; i++) {
		std::string path = base;

		if (i > 0) {
			path += "-" + std::to_string(i);
		}
		path += ".log";

		int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);

		if (fd >= 0) {
			captureFile = path;
			log.Logmsg(LOG_INFO, "opening file '%s' for capturing rsync's stdout/err", path.c_str());
			return fd;
		}

		if (errno != EEXIST) {
			log.Logmsg(LOG_ERR, "unable to open %s: %s", path.c_str(), MyStrerror(errno));
			return -1;
		}
	}

	log.Logmsg(LOG_ERR, "unable to find an unused log file name for task '%s'", name.c_str());

	return -1;
}

int SyncTask::Run(Executor &executor, Clock &clock, const std::string &rsyncBinary, Logger &log)
{
	log.Logmsg(LOG_INFO, "starting task '%s'", name.c_str());

	int fd = OpenCaptureFile(log);

	if (fd < 0) {
		return -1;
	}

	std::vector<std::string> argv = RsyncCommand(rsyncBinary, source, target);

	log.Logmsg(LOG_INFO, "rsync cmd: %s", JoinArgv(argv).c_str());
	log.Logmsg(LOG_INFO, "running rsync");

	double start = clock.Now();

	int ret = executor.Execute(argv, fd);

	if (ret < 0) {
		log.Logmsg(LOG_ERR, "rsync could not be run for task '%s'", name.c_str());
		close(fd);
		return -1;
	}

	ran = true;
	exitStatus = ret;
	duration = clock.Now() - start;

	if (ret == 0) {
		log.Logmsg(LOG_INFO, "rsync returncode is 0");
	} else {
		log.Logmsg(LOG_ERR, "rsync returncode not 0: %i", ret);
	}

	log.Logmsg(LOG_INFO, "rsync runtime (walltime): %s", SecondsToHms(duration).c_str());

	if (dprintf(fd, "\nwrapper info: rsync exitcode: %i\n", ret) < 0
	    || dprintf(fd, "wrapper info: rsync runtime (walltime): %s\n", SecondsToHms(duration).c_str()) < 0) {
		log.Logmsg(LOG_ERR, "unable to write summary to %s: %s", captureFile.c_str(), MyStrerror(errno));
	}

	if (close(fd) < 0) {
		log.Logmsg(LOG_ERR, "close failed: %s: %s", captureFile.c_str(), MyStrerror(errno));
	}

	log.Logmsg(LOG_INFO, "task '%s' finished", name.c_str());

	return ret;
}

int RunSyncTasks(const struct cfgoptions *const cfg, Executor &executor, Clock &clock, Logger &log)
{
	assert(cfg != NULL);

	double start = clock.Now();

	if (cfg->rsyncBinary.find('/') != std::string::npos && IsExe(cfg->rsyncBinary.c_str(), false) < 0) {
		log.Logmsg(LOG_WARNING, "%s: invalid executable image", cfg->rsyncBinary.c_str());
	}

	std::vector<std::unique_ptr<SyncTask> > tasks;

	for (size_t i = 0; i < cfg->tasks.size(); i++) {
		std::unique_ptr<SyncTask> task = SyncTask::Create(cfg->tasks[i], cfg->rsyncLogDirectory, log);

		if (!task) {
			return EXIT_FAILURE;
		}

		tasks.push_back(std::move(task));
	}

	if (tasks.empty()) {
		log.Logmsg(LOG_WARNING, "no sync tasks configured");
	}

	log.Logmsg(LOG_INFO, "running tasks");

	unsigned long failed = 0;

	for (size_t i = 0; i < tasks.size(); i++) {
		if (tasks[i]->Run(executor, clock, cfg->rsyncBinary, log) != 0) {
			failed += 1;
		}
	}

	log.Logmsg(LOG_INFO, "task iteration done");

	for (size_t i = 0; i < tasks.size(); i++) {
		if (tasks[i]->HasRun()) {
			log.Logmsg(LOG_INFO, "  %-20s exit %3i  %s", tasks[i]->GetName().c_str(),
				   tasks[i]->GetExitStatus(), SecondsToHms(tasks[i]->GetDuration()).c_str());
		} else {
			log.Logmsg(LOG_INFO, "  %-20s not run", tasks[i]->GetName().c_str());
		}
	}

	if (failed > 0) {
		log.Logmsg(LOG_WARNING, "%lu of %zu tasks failed", failed, tasks.size());
	}

	log.Logmsg(LOG_INFO, "program runtime (walltime): %s", SecondsToHms(clock.Now() - start).c_str());

	return EXIT_SUCCESS;
}
