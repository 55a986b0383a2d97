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
#include "logfile.hpp"

RotatingFile::~RotatingFile()
{
	Close();
}

std::string RotatingFile::BackupName(int n) const
{
	return path + "." + std::to_string(n);
}

int RotatingFile::Reopen(int flags)
{
	int tmp = open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC | flags, S_IRUSR | S_IWUSR | S_IRGRP);

	if (tmp == -1) {
		return -1;
	}

	struct stat buf;

	if (fstat(tmp, &buf) < 0) {
		int e = errno;
		close(tmp);
		errno = e;
		return -1;
	}

	if (!S_ISREG(buf.st_mode)) {
		close(tmp);
		errno = EINVAL;
		return -1;
	}

	fd = tmp;
	size = buf.st_size;

	return 0;
}

int RotatingFile::Open(const char *const pathname, off_t max, int backups)
{
	assert(pathname != NULL);

	if (pathname == NULL || max < 0 || backups < 0) {
		errno = EINVAL;
		return -1;
	}

	Close();

	path = pathname;
	maxBytes = max;
	backupCount = backups;

	return Reopen(O_APPEND);
}

int RotatingFile::Rotate()
{
	if (fd == -1) {
		errno = EBADF;
		return -1;
	}

	close(fd);
	fd = -1;

	if (backupCount > 0) {
		for (int i = backupCount - 1; i > 0; i -= 1) {
			std::string src = BackupName(i);

			if (access(src.c_str(), F_OK) != 0) {
				continue;
			}

			if (rename(src.c_str(), BackupName(i + 1).c_str()) < 0) {
				goto error;
			}
		}

		if (rename(path.c_str(), BackupName(1).c_str()) < 0) {
			goto error;
		}
	}

	return Reopen(O_APPEND | O_TRUNC);
 error:
	int e = errno;
	Reopen(O_APPEND);
	errno = e;
	return -1;
}

int RotatingFile::Write(const char *buf, size_t len)
{
	if (fd == -1) {
		errno = EBADF;
		return -1;
	}

	if (maxBytes > 0 && backupCount > 0 && size > 0 && size + (off_t)len >= maxBytes) {
		if (Rotate() < 0) {
			rotateError = errno;
		}
		if (fd == -1) {
			return -1;
		}
	}

	if (WriteAll(fd, buf, len) < 0) {
		return -1;
	}

	size += (off_t)len;

	return 0;
}

int RotatingFile::Close()
{
	if (fd == -1) {
		return 0;
	}

	int ret = close(fd);
	fd = -1;
	size = 0;

	return ret;
}
