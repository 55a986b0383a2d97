/*
 * Copyright 2014-2020 Christian Lockley
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
#include "pidfile.hpp"
#include "sub.hpp"
#include "logutils.hpp"

Pidfile::~Pidfile()
{
	if (fd != -1) {
		close(fd);
	}
}

static pid_t ReadPid(const char *const path)
{
	int tmp = open(path, O_RDONLY | O_CLOEXEC);

	if (tmp < 0) {
		return -1;
	}

	char buf[64] = { 0 };
	ssize_t n = pread(tmp, buf, sizeof(buf) - 1, 0);
	close(tmp);

	if (n < 0) {
		return -1;
	}

	errno = 0;
	pid_t pid = (pid_t) strtol(buf, (char **)NULL, 10);

	if (errno != 0) {
		return -1;
	}

	return pid;
}

//A pid file is created empty and written right after. An empty file that
//is older than this is left over from a crash.
#define PIDFILE_WRITE_GRACE 10

static bool IsFreshEmptyFile(const char *const path)
{
	struct stat buf;

	if (stat(path, &buf) < 0 || buf.st_size != 0) {
		return false;
	}

	return time(NULL) - buf.st_mtime < PIDFILE_WRITE_GRACE;
}

//Fails when the file names a process that is still alive; a stale file is replaced.
int Pidfile::Open(const char *const path)
{
	assert(path != NULL);

	name = path;
	mode_t oumask = umask(0027);

	for (int attempt = 0; attempt < 3; attempt++) {
		fd = open(path, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);

		if (fd >= 0) {
			umask(oumask);
			return fd;
		}

		if (errno != EEXIST) {
			log.Logmsg(LOG_ERR, "open failed: %s: %s", path, MyStrerror(errno));
			umask(oumask);
			return -1;
		}

		if (IsFreshEmptyFile(path)) {
			log.Logmsg(LOG_ERR, "%s: another instance is starting up", path);
			umask(oumask);
			return -1;
		}

		pid_t pid = ReadPid(path);

		if (pid > 0 && (kill(pid, 0) == 0 || errno != ESRCH)) {
			log.Logmsg(LOG_ERR, "%s: another instance is running (pid %i)", path, (int)pid);
			umask(oumask);
			return -1;
		}

		log.Logmsg(LOG_INFO, "removing stale pid file %s", path);

		if (remove(path) < 0 && errno != ENOENT) {
			log.Logmsg(LOG_ERR, "remove failed: %s: %s", path, MyStrerror(errno));
			umask(oumask);
			return -1;
		}
	}

	umask(oumask);
	return -1;
}

int Pidfile::Write(pid_t pid)
{
	if (dprintf(fd, "%d\n", pid) < 0) {
		log.Logmsg(LOG_ERR, "unable to write pid to %s: %s",
			   name.c_str(), MyStrerror(errno));
		return -1;
	}

	if (fsync(fd) < 0) {
		log.Logmsg(LOG_WARNING, "fsync failed: %s: %s", name.c_str(), MyStrerror(errno));
	}

	return 0;
}

int Pidfile::Delete()
{
	if (name.empty()) {
		return -1;
	}

	if (fd == -1) {
		return 0;
	}

	close(fd);
	fd = -1;

	if (remove(name.c_str()) < 0) {
		log.Logmsg(LOG_ERR, "remove failed: %s", MyStrerror(errno));
		return -2;
	}

	return 0;
}
