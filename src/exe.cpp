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
#include "sub.hpp"
#include "exe.hpp"

#define READ 0
#define WRITE 1

static void ClosePipe(int *fd)
{
	if (fd[READ] != -1) {
		close(fd[READ]);
		fd[READ] = -1;
	}

	if (fd[WRITE] != -1) {
		close(fd[WRITE]);
		fd[WRITE] = -1;
	}
}

//Only async-signal-safe calls past this point; the parent reads the errno
//from the close-on-exec pipe and reports the failure.
static void __attribute__ ((noreturn)) ChildFailed(int fd)
{
	int e = errno;
	WriteAll(fd, &e, sizeof(e));
	_exit(127);
}

int SpawnAttr(const spawnattr_t *const spawnattr, const std::vector<std::string> &argv)
{
	assert(spawnattr != NULL);

	if (argv.empty()) {
		errno = EINVAL;
		return -1;
	}

	std::vector<char *> args;
	for (size_t i = 0; i < argv.size(); i++) {
		args.push_back(const_cast<char *>(argv[i].c_str()));
	}
	args.push_back(NULL);

	int status[2] = {-1, -1};
	int out[2] = {-1, -1};

	if (pipe2(status, O_CLOEXEC) < 0) {
		return -1;
	}

	if (spawnattr->outputFd < 0 && spawnattr->output != NULL) {
		if (pipe2(out, O_CLOEXEC) < 0) {
			int e = errno;
			ClosePipe(status);
			errno = e;
			return -1;
		}
	}

	pid_t worker = fork();

	if (worker < 0) {
		int e = errno;
		ClosePipe(status);
		ClosePipe(out);
		errno = e;
		return -1;
	}

	if (worker == 0) {
		int fd = spawnattr->outputFd >= 0 ? spawnattr->outputFd : out[WRITE];

		if (fd >= 0) {
			if (dup2(fd, STDOUT_FILENO) < 0 || dup2(fd, STDERR_FILENO) < 0) {
				ChildFailed(status[WRITE]);
			}
		}

		if (spawnattr->nice != 0) {
			errno = 0;
			if (nice(spawnattr->nice) == -1 && errno != 0) {
				ChildFailed(status[WRITE]);
			}
		}

		execvp(args[0], args.data());

		ChildFailed(status[WRITE]);
	}

	close(status[WRITE]);
	status[WRITE] = -1;

	if (out[READ] != -1) {
		close(out[WRITE]);
		out[WRITE] = -1;

		char buf[4096];
		ssize_t n = 0;
		while ((n = read(out[READ], buf, sizeof(buf))) != 0) {
			if (n < 0) {
				if (errno == EINTR) {
					continue;
				}
				break;
			}
			spawnattr->output->append(buf, (size_t)n);
		}
		ClosePipe(out);
	}

	int childErrno = 0;
	ssize_t n = 0;
	while ((n = read(status[READ], &childErrno, sizeof(childErrno))) < 0 && errno == EINTR) ;
	ClosePipe(status);

	int ret = 0;
	while (waitpid(worker, &ret, 0) != worker) {
		if (errno != EINTR) {
			return -1;
		}
	}

	if (n == (ssize_t)sizeof(childErrno)) {
		errno = childErrno;
		return -1;
	}

	if (WIFEXITED(ret)) {
		return WEXITSTATUS(ret);
	}

	if (WIFSIGNALED(ret)) {
		return 128 + WTERMSIG(ret);
	}

	return 1;
}

int ProcessExecutor::Execute(const std::vector<std::string> &argv, int outputFd)
{
	spawnattr_t attr;
	std::string output;

	attr.outputFd = outputFd;
	attr.nice = niceness;

	if (outputFd < 0) {
		attr.output = &output;
	}

	log.Logmsg(LOG_DEBUG, "calling %s", JoinArgv(argv).c_str());

	int ret = SpawnAttr(&attr, argv);

	if (ret < 0) {
		log.Logmsg(LOG_ERR, "unable to execute %s: %s",
			   argv.empty() ? "(null)" : argv[0].c_str(), MyStrerror(errno));
		return -1;
	}

	if (output.empty() == false) {
		log.Logmsg(LOG_DEBUG, "%s output:\n%s", argv[0].c_str(), output.c_str());
	}

	return ret;
}
