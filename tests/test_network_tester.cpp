#include "fakes.hpp"
#include "logutils.hpp"

class NetworkTesterTest : public ::testing::Test {
protected:
	Logger log;
	FakeExecutor executor;
	std::vector<std::string> ping = {"ping", "-c", "1", "-w", "5"};

	void SetUp() override {
		log.SetConsole(false);
	}
};

TEST_F(NetworkTesterTest, ExitStatusMapsToReachability) {
	PingProber prober(executor, log, ping);
	int status = 0;
	executor.handler = [&status](const std::vector<std::string> &, int) { return status; };

	EXPECT_EQ(PROBE_ALIVE, prober.Probe("host"));
	status = 1;
	EXPECT_EQ(PROBE_DEAD, prober.Probe("host"));
	status = 2;
	EXPECT_EQ(PROBE_DEAD, prober.Probe("host"));
	status = -1;
	EXPECT_EQ(PROBE_FAULT, prober.Probe("host"));
}

TEST_F(NetworkTesterTest, OutputIsCapturedNotRedirected) {
	PingProber prober(executor, log, ping);
	int fd = 0;
	executor.handler = [&fd](const std::vector<std::string> &, int outputFd) {
		fd = outputFd;
		return 0;
	};

	prober.Probe("192.168.1.10");
	EXPECT_LT(fd, 0);
	EXPECT_EQ("192.168.1.10", executor.calls[0].back());
}

TEST_F(NetworkTesterTest, FirstAnsweringHostEndsRound) {
	ScriptedProber prober;
	prober.handler = [](const char *host) {
		return strcmp(host, "b") == 0 ? (int)PROBE_ALIVE : (int)PROBE_DEAD;
	};
	std::vector<std::string> hosts = {"a", "b", "c"};

	EXPECT_EQ(PROBE_ALIVE, AnyHostAlive(prober, hosts, log));
	std::vector<std::string> expected = {"a", "b"};
	EXPECT_EQ(expected, prober.probed);
}

TEST_F(NetworkTesterTest, AllDeadProbesEveryHost) {
	ScriptedProber prober;
	std::vector<std::string> hosts = {"a", "b", "c"};

	EXPECT_EQ(PROBE_DEAD, AnyHostAlive(prober, hosts, log));
	EXPECT_EQ(hosts, prober.probed);
}

TEST_F(NetworkTesterTest, FaultStopsRound) {
	ScriptedProber prober;
	prober.handler = [](const char *) { return (int)PROBE_FAULT; };
	std::vector<std::string> hosts = {"a", "b"};

	EXPECT_EQ(PROBE_FAULT, AnyHostAlive(prober, hosts, log));
	EXPECT_EQ(1U, prober.probed.size());
}
