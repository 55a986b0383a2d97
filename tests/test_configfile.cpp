#include "fakes.hpp"
#include "configfile.hpp"
#include "logutils.hpp"

class ConfigFileTest : public ::testing::Test {
protected:
	TempDir tmp;
	Logger log;
	cfgoptions cfg;
	std::string path;

	void SetUp() override {
		log.SetConsole(false);
		path = tmp.Sub("hostguard.conf");
		cfg.confile = path.c_str();
	}

	int Load(const std::string &content) {
		WriteFile(path, content);
		return ReadConfigurationFile(&cfg, log);
	}
};

TEST_F(ConfigFileTest, MissingFileKeepsDefaults) {
	EXPECT_EQ(0, ReadConfigurationFile(&cfg, log));
	EXPECT_FALSE(cfg.haveConfigFile);
	EXPECT_EQ(0, cfg.requiredOffline);
	EXPECT_EQ(DEFAULT_INTERVAL, cfg.interval);
	EXPECT_EQ(DEFAULT_LOG_MAX_SIZE, cfg.logMaxSize);
	EXPECT_EQ(DEFAULT_LOG_BACKUPS, cfg.logBackups);
	std::vector<std::string> ping = {"ping", "-c", "1", "-w", "5"};
	EXPECT_EQ(ping, cfg.pingCommand);
	EXPECT_TRUE(cfg.hosts.empty());
	EXPECT_TRUE(cfg.tasks.empty());
}

TEST_F(ConfigFileTest, ShutdownSettings) {
	ASSERT_EQ(0, Load("hosts = [\"nas\", \"192.168.1.20\"];\n"
			  "required-offline = 1800;\n"
			  "interval = 120;\n"
			  "ping-command = [\"ping\", \"-c\", \"2\", \"-W\", \"1\"];\n"
			  "shutdown-command = [\"/usr/bin/systemctl\", \"poweroff\"];\n"));

	EXPECT_TRUE(cfg.haveConfigFile);
	std::vector<std::string> hosts = {"nas", "192.168.1.20"};
	EXPECT_EQ(hosts, cfg.hosts);
	EXPECT_EQ(1800, cfg.requiredOffline);
	EXPECT_EQ(120, cfg.interval);
	EXPECT_EQ(5U, cfg.pingCommand.size());
	EXPECT_EQ("-W", cfg.pingCommand[3]);
	std::vector<std::string> shutdown = {"/usr/bin/systemctl", "poweroff"};
	EXPECT_EQ(shutdown, cfg.shutdownCommand);
}

TEST_F(ConfigFileTest, SyncSettings) {
	ASSERT_EQ(0, Load("rsync-binary = \"/opt/bin/rsync\";\n"
			  "rsync-log-directory = \"/var/log/rsync\";\n"
			  "nice = 10;\n"
			  "pid-pathname = \"/run/hostguard-sync.pid\";\n"
			  "sync-tasks = (\n"
			  "  { name = \"home\"; source = \"/home\"; target = \"/mnt/backup\"; },\n"
			  "  { name = \"etc\"; source = \"/etc\"; target = \"/mnt/backup\"; }\n"
			  ");\n"));

	EXPECT_EQ("/opt/bin/rsync", cfg.rsyncBinary);
	EXPECT_EQ("/var/log/rsync", cfg.rsyncLogDirectory);
	EXPECT_EQ(10, cfg.nice);
	EXPECT_TRUE(cfg.options & USEPIDFILE);
	EXPECT_EQ("/run/hostguard-sync.pid", cfg.pidfileName);
	ASSERT_EQ(2U, cfg.tasks.size());
	EXPECT_EQ("home", cfg.tasks[0].name);
	EXPECT_EQ("/home", cfg.tasks[0].source);
	EXPECT_EQ("etc", cfg.tasks[1].name);
	EXPECT_EQ("/mnt/backup", cfg.tasks[1].target);
}

TEST_F(ConfigFileTest, LoggingSettings) {
	ASSERT_EQ(0, Load("log-file = \"/var/log/hostguard.log\";\n"
			  "log-max-size = 1024;\n"
			  "log-backups = 3;\n"
			  "log-up-to = \"warning\";\n"
			  "log-journal = true;\n"));

	EXPECT_EQ("/var/log/hostguard.log", cfg.logFile);
	EXPECT_EQ(1024, cfg.logMaxSize);
	EXPECT_EQ(3, cfg.logBackups);
	EXPECT_TRUE(cfg.options & LOGJOURNAL);
	EXPECT_FALSE(log.IsEnabled(LOG_INFO));
	EXPECT_TRUE(log.IsEnabled(LOG_WARNING));
}

TEST_F(ConfigFileTest, CommandLineLevelWins) {
	ASSERT_TRUE(log.LogUpTo("debug", true));
	cfg.options |= LOGLVLSETCMDLN;

	ASSERT_EQ(0, Load("log-up-to = \"err\";\n"));
	EXPECT_TRUE(log.IsEnabled(LOG_DEBUG));
}

TEST_F(ConfigFileTest, SyntaxErrorIsFatal) {
	EXPECT_EQ(-1, Load("hosts = [\"nas\"\n"));
}

TEST_F(ConfigFileTest, NonPositiveIntervalIsFatal) {
	EXPECT_EQ(-1, Load("interval = 0;\n"));
}

TEST_F(ConfigFileTest, NegativeRequiredOfflineIsFatal) {
	EXPECT_EQ(-1, Load("required-offline = -5;\n"));
}

TEST_F(ConfigFileTest, HostsMustBeStrings) {
	EXPECT_EQ(-1, Load("hosts = \"nas\";\n"));
}

TEST_F(ConfigFileTest, EmptyShutdownCommandIsFatal) {
	EXPECT_EQ(-1, Load("shutdown-command = [];\n"));
}

TEST_F(ConfigFileTest, IncompleteSyncTaskIsFatal) {
	EXPECT_EQ(-1, Load("sync-tasks = ( { name = \"home\"; source = \"/home\"; } );\n"));
}

TEST_F(ConfigFileTest, NiceOutOfRangeFallsBack) {
	ASSERT_EQ(0, Load("nice = 40;\n"));
	EXPECT_EQ(0, cfg.nice);
}
