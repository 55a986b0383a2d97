#ifndef CONFIGFILE_H
#define CONFIGFILE_H
#include "hostguard.hpp"

class Logger;

int ReadConfigurationFile(struct cfgoptions *const cfg, Logger &log);
#endif
