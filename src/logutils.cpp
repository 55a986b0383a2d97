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
#include "logutils.hpp"
#include <clocale>
#include <locale.h>
#include <sys/uio.h>
#define SD_JOURNAL_SUPPRESS_LOCATION
#include <systemd/sd-journal.h>

#define KRED  "\x1B[31m"
#define KYEL  "\x1B[33m"
#define KRESET "\x1B[0m"

static locale_t locale = (locale_t)0;

enum {
	SHORT,
	LONG
};

static const int ipri[] = { LOG_EMERG, LOG_ALERT, LOG_CRIT, LOG_ERR, LOG_WARNING,
	LOG_NOTICE, LOG_INFO, LOG_DEBUG
};

static const char * const spri[][2] = {
		{"LOG_EMERG", "LOG_Emergency"},
		{"LOG_ALERT", ""},
		{"LOG_CRIT", "LOG_Critical"},
		{"LOG_ERR", "LOG_Error"},
		{"LOG_WARNING", ""},
		{"LOG_NOTICE", ""},
		{"LOG_INFO", ""},
		{"LOG_DEBUG", ""}
};

static const char * const names[] = {
	"EMERGENCY", "ALERT", "CRITICAL", "ERROR", "WARNING", "NOTICE", "INFO", "DEBUG"
};

const char *PriorityName(int priority)
{
	return names[LOG_PRI(priority)];
}

static int SystemdSyslog(int priority, const char *msg)
{
	char m[2100] = {"MESSAGE="};
	char p[64] = { '\0' };

	struct iovec iov[3] = { };

	snprintf(p, sizeof(p) - 1, "PRIORITY=%i", LOG_PRI(priority));

	strncat(m, msg, sizeof(m) - strlen(m) - 1);

	iov[0].iov_base = m;
	iov[0].iov_len = strlen(m);

	iov[1].iov_base = p;
	iov[1].iov_len = strlen(p);

	iov[2].iov_base = (void *)"SYSLOG_IDENTIFIER=" PACKAGE_NAME;
	iov[2].iov_len = strlen("SYSLOG_IDENTIFIER=" PACKAGE_NAME);

	return sd_journal_sendv(iov, 3);
}

//"2013-01-01 12:00:00,000", local time with milliseconds
static void FormatTimestamp(char *buf, size_t len)
{
	struct timespec ts = { };
	struct tm tm = { };

	clock_gettime(CLOCK_REALTIME, &ts);
	localtime_r(&ts.tv_sec, &tm);

	size_t n = strftime(buf, len, "%Y-%m-%d %H:%M:%S", &tm);
	snprintf(buf + n, len - n, ",%03ld", ts.tv_nsec / 1000000);
}

Logger::~Logger()
{
	Close();
}

int Logger::Open(const char *const fileName, off_t maxBytes, int backupCount)
{
	assert(fileName != NULL);

	if (file.Open(fileName, maxBytes, backupCount) < 0) {
		return -1;
	}

	return 0;
}

int Logger::Close()
{
	return file.Close();
}

void Logger::SetConsole(bool x)
{
	console = x;
}

void Logger::SetConsoleFd(int fd)
{
	consoleFd = fd;
}

void Logger::SetJournal(bool x)
{
	journal = x;
}

bool Logger::IsTty()
{
	if (console == false) {
		return false;
	}

	if (isatty(consoleFd) == 0) {
		return false;
	}
	return true;
}

const char *Logger::SetTextColor(int priority)
{
	if (IsTty() == false) {
		return "";
	}

	switch (LOG_PRI(priority)) {
	case LOG_EMERG:
	case LOG_ALERT:
	case LOG_CRIT:
	case LOG_ERR:
		return KRED;
	case LOG_WARNING:
		return KYEL;
	default:
		return "";
	}
}

bool Logger::IsEnabled(int priority) const
{
	return (LOG_MASK(LOG_PRI(priority)) & logMask) != 0 && noLog == false;
}

bool Logger::LogUpToInt(long pri, bool cmdln)
{
	if (pri < 0 || pri > 7) {
		if (cmdln) {
			Logmsg(LOG_ERR, "illegal command line option argument for -l/--loglevel");
			return false;
		}
		Logmsg(LOG_ERR, "illegal value for configuration file entry named"
		       " \"log-up-to\": %li", pri);
		return false;
	}

	noLog = false;
	logMask = LOG_UPTO(ipri[pri]);

	return true;
}

bool Logger::LogUpToString(const char *const str, bool cmdln)
{
	std::string tmp(str);

	for (size_t i = 0; i < tmp.size(); i += 1) {
		if (tmp[i] == '-' || ispunct(tmp[i])) {
			tmp[i] = '_';
		}
		tmp[i] = toupper(tmp[i]);
	}

	if (tmp.find("LOG_") == std::string::npos) {
		tmp.insert(0, "LOG_");
	}

	if (strcasecmp(tmp.c_str(), "log_none") == 0) {
		noLog = true;
		return true;
	}

	bool matched = false;

	for (size_t i = 0; i < ARRAY_SIZE(spri); i += 1) {
		if (strcasecmp(tmp.c_str(), spri[i][SHORT]) == 0
		    || strcasecmp(tmp.c_str(), spri[i][LONG]) == 0) {
			noLog = false;
			logMask = LOG_UPTO(ipri[i]);
			matched = true;
		}
	}

	if (matched == false && cmdln == false) {
		Logmsg(LOG_ERR, "illegal value for configuration file entry named"
		       " \"log-up-to\": %s", str);
	} else if (matched == false) {
		Logmsg(LOG_ERR, "illegal command line option argument for [ -l | --loglevel ]");
	}

	return matched;
}

bool Logger::LogUpTo(const char *const str, bool cmdln)
{
	assert(str != NULL);

	if (str == NULL) {
		return false;
	}

	errno = 0;

	long logPri = ConvertStringToInt(str);

	if (errno != 0 || *str == '\0') {
		return LogUpToString(str, cmdln);
	}

	return LogUpToInt(logPri, cmdln);
}

void Logger::WriteConsole(const char *color, const char *line)
{
	std::string buf(color);

	buf += line;

	if (*color != '\0') {
		buf.insert(buf.size() - 1, KRESET);
	}

	if (WriteAll(consoleFd, buf.c_str(), buf.size()) < 0) {
		console = false;
	}
}

void Logger::Vlogmsg(int priority, const char *const fmt, va_list ap)
{
	assert(fmt != NULL);

	if (IsEnabled(priority) == false) {
		return;
	}

	char msg[2048];
	char stamp[64];
	char line[2048 + 128];

	vsnprintf(msg, sizeof(msg), fmt, ap);

	size_t len = strlen(msg);
	while (len > 0 && msg[len - 1] == '\n') {
		msg[--len] = '\0';
	}

	FormatTimestamp(stamp, sizeof(stamp));

	int n = snprintf(line, sizeof(line), "%s - %s - %s\n", stamp, PriorityName(priority), msg);

	if (n < 0) {
		return;
	}

	if ((size_t)n >= sizeof(line)) {
		n = sizeof(line) - 1;
		line[n - 1] = '\n';
	}

	if (console) {
		WriteConsole(SetTextColor(priority), line);
	}

	if (file.IsOpen() && file.Write(line, (size_t)n) < 0 && console) {
		char err[256];
		snprintf(err, sizeof(err), "%s - %s - unable to write log file %s: %s\n",
			 stamp, PriorityName(LOG_ERR), file.GetPath(), MyStrerror(errno));
		WriteConsole(SetTextColor(LOG_ERR), err);
	}

	int rotateErrno = file.TakeRotateError();

	if (rotateErrno == 0) {
		rotateFailed = false;
	} else if (rotateFailed == false) {
		//reported once until a rotation succeeds again
		rotateFailed = true;

		char err[256];
		int len = snprintf(err, sizeof(err), "%s - %s - unable to rotate log file %s: %s\n",
				   stamp, PriorityName(LOG_ERR), file.GetPath(), MyStrerror(rotateErrno));

		if (console) {
			WriteConsole(SetTextColor(LOG_ERR), err);
		}

		if (len > 0 && (size_t)len < sizeof(err) && file.IsOpen()
		    && file.Write(err, (size_t)len) < 0 && console) {
			WriteConsole(SetTextColor(LOG_ERR), "unable to write log file\n");
		}
	}

	if (journal && SystemdSyslog(priority, msg) < 0) {
		journal = false;
	}
}

void Logger::Logmsg(int priority, const char *const fmt, ...)
{
	va_list args;

	va_start(args, fmt);
	Vlogmsg(priority, fmt, args);
	va_end(args);
}

bool MyStrerrorInit(void)
{
	locale = newlocale(LC_CTYPE_MASK|LC_NUMERIC_MASK|LC_TIME_MASK|
			   LC_COLLATE_MASK|LC_MONETARY_MASK|LC_MESSAGES_MASK,
			   "",(locale_t)0);

	if (locale == (locale_t)0) {
		return false;
	}

	return true;
}

void FreeLocale(void)
{
	if (locale != (locale_t)0) {
		freelocale(locale);
		locale = (locale_t)0;
	}
}

char * MyStrerror(int error)
{
	if (locale == (locale_t)0) {
		return strerror(error);
	}

	return strerror_l(error, locale);
}
