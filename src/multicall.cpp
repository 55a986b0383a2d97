/*
 * Copyright 2016-2017 Christian Lockley
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
#include <string.h>
#include <stdio.h>
#include <errno.h>
#include "multicall.hpp"

const char *ExeNameFromPath(const char *const path)
{
	const char *base = strrchr(path, '/');

	if (base == NULL) {
		return path;
	}

	return base + 1;
}

//Name this process was started as, "hostguard-sync" selects the sync tasks.
const char *GetExeName(void)
{
	static char buf[1024] = {'\0'};

	if (buf[0] != '\0') {
		return buf;
	}

	FILE* fp = fopen("/proc/self/cmdline", "r");

	if (fp == NULL) {
		return buf;
	}

	char tmp[sizeof(buf)] = {'\0'};
	size_t n = fread(tmp, 1, sizeof(tmp) - 1, fp);

	fclose(fp);

	if (n == 0) {
		return buf;
	}

	strncpy(buf, ExeNameFromPath(tmp), sizeof(buf) - 1);

	return buf;
}
