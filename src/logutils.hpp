#ifndef LOGUTILS_H
#define LOGUTILS_H
#include <cstdarg>
#include <syslog.h>
#include <unistd.h>
#include "logfile.hpp"

#ifndef LOG_PRIMASK
#define	LOG_PRIMASK 0x07
#endif

#ifndef LOG_PRI
#define LOG_PRI(p) ((p) & LOG_PRIMASK)
#endif

#ifndef LOG_MASK
#define	LOG_MASK(pri)	(1 << (pri))
#endif

#ifndef LOG_UPTO
#define	LOG_UPTO(pri)	((1 << ((pri)+1)) - 1)
#endif

class Logger {
	RotatingFile file;
	unsigned int logMask = LOG_UPTO(LOG_DEBUG);
	int consoleFd = STDERR_FILENO;
	bool console = true;
	bool journal = false;
	bool noLog = false;
	bool rotateFailed = false;
	bool IsTty();
	const char *SetTextColor(int);
	bool LogUpToString(const char *const, bool);
	void WriteConsole(const char *, const char *);
public:
	Logger() {
	}
	~Logger();
	Logger(const Logger &) = delete;
	Logger &operator=(const Logger &) = delete;
	int Open(const char *const, off_t, int);
	int Close();
	void SetConsole(bool);
	void SetConsoleFd(int);
	void SetJournal(bool);
	bool LogUpTo(const char *const, bool);
	bool LogUpToInt(long, bool);
	bool IsEnabled(int) const;
	const RotatingFile &GetFile() const {
		return file;
	}
	void Logmsg(int priority, const char *const fmt, ...) __attribute__ ((format (printf, 3, 4)));
	void Vlogmsg(int priority, const char *const fmt, va_list ap) __attribute__ ((format (printf, 3, 0)));
};

const char *PriorityName(int);
bool MyStrerrorInit(void);
void FreeLocale(void);
char * MyStrerror(int);
#endif
