#ifndef PIDFILE_H
#define PIDFILE_H
#include <sys/types.h>
#include <unistd.h>
#include <string>

class Logger;

class Pidfile {
	std::string name;
	int fd = -1;
	Logger &log;
public:
	explicit Pidfile(Logger &l) : log(l) {
	}
	~Pidfile();
	Pidfile(const Pidfile &) = delete;
	Pidfile &operator=(const Pidfile &) = delete;
	int Open(const char *const);
	int Write(pid_t);
	int Delete();
};
#endif
