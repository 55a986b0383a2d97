#ifndef CLOCK_H
#define CLOCK_H
#include <ctime>

//Time source of the shutdown decision loop and the sync task runner.
class Clock {
public:
	virtual ~Clock() {
	}
	//seconds on a clock that does not jump with the wall clock
	virtual double Now() = 0;
	virtual void Sleep(time_t seconds) = 0;
};

class SystemClock : public Clock {
public:
	virtual double Now();
	virtual void Sleep(time_t seconds);
};
#endif
