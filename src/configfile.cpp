/*
 * Copyright 2013-2017 Christian Lockley
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
#include "configfile.hpp"
#include <libconfig.h>

static const char *LibconfigWraperConfigSettingSourceFile(const config_setting_t *
						   setting)
{
	const char *fileName = config_setting_source_file(setting);

	if (fileName == NULL)
		return "(NULL)";

	return fileName;
}

static bool LoadConfigurationFile(config_t *const config, const char *const fileName,
				  struct cfgoptions *const cfg, Logger &log)
{
	assert(config != NULL);
	assert(fileName != NULL);

	if (config_read_file(config, fileName) == CONFIG_TRUE) {
		cfg->haveConfigFile = true;
		return true;
	}

	if (config_error_type(config) == CONFIG_ERR_FILE_IO) {
		log.Logmsg(LOG_WARNING, "unable to open configuration file: %s", fileName);
		log.Logmsg(LOG_WARNING, "using default values");
		cfg->haveConfigFile = false;
		return true;
	}

	log.Logmsg(LOG_ERR, "%s:%d: %s",
		   config_error_file(config) == NULL ? fileName : config_error_file(config),
		   config_error_line(config), config_error_text(config));

	return false;
}

static int LookupStringArray(const config_t *const config, const char *const name,
			     std::vector<std::string> *const out, Logger &log)
{
	const config_setting_t *setting = config_lookup(config, name);

	if (setting == NULL) {
		return 0;
	}

	if (config_setting_is_array(setting) == CONFIG_FALSE) {
		log.Logmsg(LOG_ERR, "%s:%i: illegal type for configuration file entry"
			   " \"%s\" expected array",
			   LibconfigWraperConfigSettingSourceFile(setting),
			   config_setting_source_line(setting), name);
		return -1;
	}

	std::vector<std::string> tmp;

	for (int cnt = 0; cnt < config_setting_length(setting); cnt++) {
		const char *value = config_setting_get_string_elem(setting, cnt);

		if (value == NULL) {
			log.Logmsg(LOG_ERR, "%s:%i: illegal type for configuration file entry"
				   " \"%s\" expected array of strings",
				   LibconfigWraperConfigSettingSourceFile(setting),
				   config_setting_source_line(setting), name);
			return -1;
		}

		tmp.push_back(value);
	}

	out->swap(tmp);

	return 1;
}

static int LookupSyncTasks(const config_t *const config, struct cfgoptions *const cfg, Logger &log)
{
	const config_setting_t *setting = config_lookup(config, "sync-tasks");

	if (setting == NULL) {
		return 0;
	}

	if (config_setting_is_list(setting) == CONFIG_FALSE && config_setting_is_array(setting) == CONFIG_FALSE) {
		log.Logmsg(LOG_ERR, "%s:%i: illegal type for configuration file entry"
			   " \"sync-tasks\" expected list",
			   LibconfigWraperConfigSettingSourceFile(setting),
			   config_setting_source_line(setting));
		return -1;
	}

	for (int cnt = 0; cnt < config_setting_length(setting); cnt++) {
		const config_setting_t *elem = config_setting_get_elem(setting, cnt);
		const char *name = NULL;
		const char *source = NULL;
		const char *target = NULL;

		if (config_setting_is_group(elem) == CONFIG_FALSE
		    || config_setting_lookup_string(elem, "name", &name) == CONFIG_FALSE
		    || config_setting_lookup_string(elem, "source", &source) == CONFIG_FALSE
		    || config_setting_lookup_string(elem, "target", &target) == CONFIG_FALSE) {
			log.Logmsg(LOG_ERR, "%s:%i: sync task needs a name, source and target",
				   LibconfigWraperConfigSettingSourceFile(elem),
				   config_setting_source_line(elem));
			return -1;
		}

		synctask_t task;
		task.name = name;
		task.source = source;
		task.target = target;
		cfg->tasks.push_back(task);
	}

	return 0;
}

static int ReadSettings(const config_t *const config, struct cfgoptions *const cfg, Logger &log)
{
	const char *str = NULL;
	int tmp = 0;

	if (config_lookup_string(config, "log-file", &str) == CONFIG_TRUE) {
		cfg->logFile = str;
	}

	if (!(cfg->options & LOGLVLSETCMDLN)) {
		if (config_lookup_string(config, "log-up-to", &str) == CONFIG_TRUE) {
			if (log.LogUpTo(str, false) == false) {
				return -1;
			}
			cfg->logUpto = str;
		} else if (config_lookup_int(config, "log-up-to", &tmp) == CONFIG_TRUE) {
			if (log.LogUpToInt(tmp, false) == false) {
				return -1;
			}
		}
	}

	if (config_lookup_int(config, "log-max-size", &tmp) == CONFIG_TRUE) {
		if (tmp < 0) {
			log.Logmsg(LOG_ERR, "illegal value for configuration file entry named \"log-max-size\"");
			log.Logmsg(LOG_ERR, "using default value");
			cfg->logMaxSize = DEFAULT_LOG_MAX_SIZE;
		} else {
			cfg->logMaxSize = tmp;
		}
	}

	if (config_lookup_int(config, "log-backups", &tmp) == CONFIG_TRUE) {
		if (tmp < 0 || tmp > 999) {
			log.Logmsg(LOG_ERR, "illegal value for configuration file entry named \"log-backups\"");
			log.Logmsg(LOG_ERR, "using default value");
			cfg->logBackups = DEFAULT_LOG_BACKUPS;
		} else {
			cfg->logBackups = tmp;
		}
	}

	if (config_lookup_bool(config, "log-journal", &tmp) == CONFIG_TRUE) {
		if (tmp) {
			cfg->options |= LOGJOURNAL;
		}
	}

	if (LookupStringArray(config, "hosts", &cfg->hosts, log) < 0) {
		return -1;
	}

	if (config_lookup_int(config, "required-offline", &tmp) == CONFIG_TRUE) {
		if (tmp < 0) {
			log.Logmsg(LOG_ERR, "illegal value for configuration file entry named \"required-offline\"");
			return -1;
		}
		cfg->requiredOffline = (time_t)tmp;
	}

	if (config_lookup_int(config, "interval", &tmp) == CONFIG_TRUE) {
		if (tmp <= 0) {
			log.Logmsg(LOG_ERR, "illegal value for configuration file entry named \"interval\"");
			return -1;
		}
		cfg->interval = (time_t)tmp;
	}

	if (LookupStringArray(config, "ping-command", &cfg->pingCommand, log) < 0) {
		return -1;
	}

	if (LookupStringArray(config, "shutdown-command", &cfg->shutdownCommand, log) < 0) {
		return -1;
	}

	if (cfg->pingCommand.empty() || cfg->shutdownCommand.empty()) {
		log.Logmsg(LOG_ERR, "\"ping-command\" and \"shutdown-command\" must not be empty");
		return -1;
	}

	if (config_lookup_string(config, "rsync-binary", &str) == CONFIG_TRUE) {
		cfg->rsyncBinary = str;
	}

	if (config_lookup_string(config, "rsync-log-directory", &str) == CONFIG_TRUE) {
		cfg->rsyncLogDirectory = str;
	}

	if (config_lookup_int(config, "nice", &tmp) == CONFIG_TRUE) {
		if (tmp < -20 || tmp > 19) {
			log.Logmsg(LOG_ERR, "illegal value for configuration file entry named \"nice\"");
			log.Logmsg(LOG_ERR, "using default value");
			cfg->nice = 0;
		} else {
			cfg->nice = tmp;
		}
	}

	if (config_lookup_string(config, "pid-pathname", &str) == CONFIG_TRUE) {
		cfg->pidfileName = str;
		cfg->options |= USEPIDFILE;
	}

	if (LookupSyncTasks(config, cfg, log) < 0) {
		return -1;
	}

	return 0;
}

int ReadConfigurationFile(struct cfgoptions *const cfg, Logger &log)
{
	assert(cfg != NULL);

	config_t config;

	config_init(&config);

	if (LoadConfigurationFile(&config, cfg->confile, cfg, log) == false) {
		config_destroy(&config);
		return -1;
	}

	config_set_auto_convert(&config, CONFIG_TRUE);

	int ret = ReadSettings(&config, cfg, log);

	config_destroy(&config);

	return ret;
}
