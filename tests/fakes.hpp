#ifndef HOSTGUARD_TESTS_FAKES_H
#define HOSTGUARD_TESTS_FAKES_H

#include <gtest/gtest.h>
#include <algorithm>
#include <dirent.h>
#include <ftw.h>
#include <fstream>
#include <functional>
#include <sstream>

#include "hostguard.hpp"
#include "clock.hpp"
#include "exe.hpp"
#include "network_tester.hpp"
#include "sub.hpp"

//Records every command and answers with whatever the handler returns.
class FakeExecutor : public Executor {
public:
	std::vector<std::vector<std::string> > calls;
	std::function<int(const std::vector<std::string> &, int)> handler;
	virtual int Execute(const std::vector<std::string> &argv, int outputFd) {
		calls.push_back(argv);
		if (handler) {
			return handler(argv, outputFd);
		}
		return 0;
	}
	size_t CountCalls(const std::string &program) const {
		size_t n = 0;
		for (size_t i = 0; i < calls.size(); i++) {
			if (calls[i].empty() == false && calls[i][0] == program) {
				n++;
			}
		}
		return n;
	}
};

//Sleeping only advances the fake time.
class FakeClock : public Clock {
public:
	double now = 1000.0;
	std::vector<time_t> sleeps;
	virtual double Now() {
		return now;
	}
	virtual void Sleep(time_t seconds) {
		sleeps.push_back(seconds);
		now += (double)seconds;
	}
};

class ScriptedProber : public Prober {
public:
	std::vector<std::string> probed;
	std::function<int(const char *)> handler;
	virtual int Probe(const char *const host) {
		probed.push_back(host);
		if (handler) {
			return handler(host);
		}
		return PROBE_DEAD;
	}
};

static inline int RemoveEntry(const char *path, const struct stat *, int, struct FTW *)
{
	return remove(path);
}

//Scratch directory that is removed with everything in it.
class TempDir {
	std::string path;
public:
	TempDir() {
		char tmpl[] = "/tmp/hostguard-test-XXXXXX";
		char *p = mkdtemp(tmpl);
		EXPECT_TRUE(p != NULL);
		if (p != NULL) {
			path = p;
		}
	}
	~TempDir() {
		if (path.empty() == false) {
			nftw(path.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
		}
	}
	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;
	const std::string &Path() const {
		return path;
	}
	std::string Sub(const std::string &name) const {
		return path + "/" + name;
	}
	std::string MakeDir(const std::string &name) const {
		std::string dir = Sub(name);
		EXPECT_EQ(0, mkdir(dir.c_str(), 0755));
		return dir;
	}
};

static inline std::string ReadFile(const std::string &path)
{
	std::ifstream in(path.c_str());
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

static inline bool FileExists(const std::string &path)
{
	return access(path.c_str(), F_OK) == 0;
}

static inline void WriteFile(const std::string &path, const std::string &content)
{
	std::ofstream out(path.c_str());
	out << content;
}

#endif
