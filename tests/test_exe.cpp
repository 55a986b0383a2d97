#include "fakes.hpp"
#include "logutils.hpp"

class ProcessExecutorTest : public ::testing::Test {
protected:
	Logger log;

	void SetUp() override {
		log.SetConsole(false);
	}
};

TEST_F(ProcessExecutorTest, ReturnsExitStatus) {
	ProcessExecutor executor(log);

	EXPECT_EQ(0, executor.Execute({"true"}, -1));
	EXPECT_EQ(1, executor.Execute({"false"}, -1));
	EXPECT_EQ(3, executor.Execute({"sh", "-c", "exit 3"}, -1));
}

TEST_F(ProcessExecutorTest, KilledChildMapsAbove128) {
	ProcessExecutor executor(log);

	EXPECT_EQ(128 + SIGKILL, executor.Execute({"sh", "-c", "kill -9 $$"}, -1));
}

TEST_F(ProcessExecutorTest, MissingProgramIsLaunchFailure) {
	ProcessExecutor executor(log);

	EXPECT_EQ(-1, executor.Execute({"/nonexistent/hostguard-no-such-program"}, -1));
	EXPECT_EQ(-1, executor.Execute({}, -1));
}

TEST_F(ProcessExecutorTest, OutputGoesToGivenDescriptor) {
	TempDir tmp;
	std::string path = tmp.Sub("out.log");
	int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	ASSERT_GE(fd, 0);
	ProcessExecutor executor(log);

	EXPECT_EQ(0, executor.Execute({"sh", "-c", "echo out; echo err >&2"}, fd));
	close(fd);

	std::string content = ReadFile(path);
	EXPECT_NE(std::string::npos, content.find("out\n"));
	EXPECT_NE(std::string::npos, content.find("err\n"));
}

TEST_F(ProcessExecutorTest, CapturedOutputIsLoggedAtDebug) {
	TempDir tmp;
	std::string path = tmp.Sub("hostguard.log");
	ASSERT_EQ(0, log.Open(path.c_str(), 0, 0));
	ProcessExecutor executor(log);

	EXPECT_EQ(0, executor.Execute({"sh", "-c", "echo 64 bytes from host"}, -1));
	log.Close();

	std::string content = ReadFile(path);
	EXPECT_NE(std::string::npos, content.find("DEBUG - calling sh -c echo 64 bytes from host"));
	EXPECT_NE(std::string::npos, content.find("64 bytes from host\n"));
}

TEST_F(ProcessExecutorTest, NiceLevelApplies) {
	TempDir tmp;
	std::string before = tmp.Sub("before");
	std::string after = tmp.Sub("after");
	ProcessExecutor executor(log);

	int fd = open(before.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	ASSERT_GE(fd, 0);
	EXPECT_EQ(0, executor.Execute({"nice"}, fd));
	close(fd);

	executor.SetNice(5);
	fd = open(after.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	ASSERT_GE(fd, 0);
	EXPECT_EQ(0, executor.Execute({"nice"}, fd));
	close(fd);

	int base = atoi(ReadFile(before).c_str());
	int niced = atoi(ReadFile(after).c_str());
	EXPECT_EQ(std::min(base + 5, 19), niced);
}

TEST(SpawnAttrTest, CapturesIntoString) {
	spawnattr_t attr;
	std::string output;
	attr.output = &output;

	EXPECT_EQ(0, SpawnAttr(&attr, {"sh", "-c", "printf hello"}));
	EXPECT_EQ("hello", output);
}

TEST(SpawnAttrTest, LaunchFailureSetsErrno) {
	spawnattr_t attr;

	errno = 0;
	EXPECT_EQ(-1, SpawnAttr(&attr, {"/nonexistent/hostguard-no-such-program"}));
	EXPECT_EQ(ENOENT, errno);
}
