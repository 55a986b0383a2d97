#ifndef SUB_H
#define SUB_H
#include "hostguard.hpp"

int WriteAll(int fd, const void *buf, size_t len);
long ConvertStringToInt(const char *const str);
int IsExe(const char *pathname, bool returnfildes);
bool IsDirectory(const char *const pathname);
bool HasTrailingSeparator(const char *const pathname);
std::string SecondsToHms(double seconds);
std::string TimeString(time_t t);
std::string JoinArgv(const std::vector<std::string> &argv);
#endif
