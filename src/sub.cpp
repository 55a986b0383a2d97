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

/*
 * This file contains functions that are used be more than one module.
 */
#include "hostguard.hpp"
#include "sub.hpp"

int WriteAll(int fd, const void *buf, size_t len)
{
	const char *p = (const char *)buf;

	while (len > 0) {
		ssize_t ret = write(fd, p, len);

		if (ret < 0) {
			if (errno == EINTR) {
				continue;
			}
			return -1;
		}

		p += ret;
		len -= (size_t)ret;
	}

	return 0;
}

long ConvertStringToInt(const char *const str)
{
	if (str == NULL) {
		return -1;
	}
	char *endptr = NULL;
	long ret = strtol((str), &endptr, 10);

	if (*endptr != '\0') {
		if (errno == 0) {
			errno = ERANGE;
		}
		return -1;
	}

	return ret;
}

int IsExe(const char *pathname, bool returnfildes)
{
	struct stat buffer;

	if (pathname == NULL)
		return -1;

	int fildes = open(pathname, O_RDONLY | O_CLOEXEC);

	if (fildes == -1)
		return -1;

	if (fstat(fildes, &buffer) != 0) {
		close(fildes);
		return -1;
	}

	if (S_ISREG(buffer.st_mode) == 0) {
		close(fildes);
		return -1;
	}

	if (!(buffer.st_mode & S_IXUSR)) {
		close(fildes);
		return -1;
	}

	if (returnfildes == true)	//For use with fexecve
		return fildes;

	close(fildes);
	return 0;
}

bool IsDirectory(const char *const pathname)
{
	struct stat buf;

	if (pathname == NULL || stat(pathname, &buf) != 0) {
		return false;
	}

	return S_ISDIR(buf.st_mode);
}

//rsync copies the directory itself into the target only when the source has no trailing slash
bool HasTrailingSeparator(const char *const pathname)
{
	size_t len = strlen(pathname);

	return len > 0 && pathname[len - 1] == '/';
}

std::string SecondsToHms(double seconds)
{
	if (seconds < 0) {
		seconds = 0;
	}

	long hours = (long)(seconds / 3600);
	long minutes = (long)((seconds - hours * 3600.0) / 60);
	double rest = seconds - hours * 3600.0 - minutes * 60.0;

	char buf[64];
	snprintf(buf, sizeof(buf), "%li:%li:%.2f", hours, minutes, rest);

	return buf;
}

std::string TimeString(time_t t)
{
	struct tm tm = { };
	char buf[32] = { '\0' };

	localtime_r(&t, &tm);
	strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);

	return buf;
}

std::string JoinArgv(const std::vector<std::string> &argv)
{
	std::string ret;

	for (size_t i = 0; i < argv.size(); i++) {
		if (i > 0) {
			ret += ' ';
		}
		ret += argv[i];
	}

	return ret;
}
