#ifndef MULTICALL_H
#define MULTICALL_H
const char *GetExeName(void);
const char *ExeNameFromPath(const char *const path);
#endif
