#ifndef LOGFILE_H
#define LOGFILE_H
#include <string>
#include <sys/types.h>

//Append-only log file that is rotated before a write would reach maxBytes.
//Rotated files are named path.1 (newest) up to path.backupCount. Without
//backups the file is never rotated.
class RotatingFile {
	std::string path;
	off_t maxBytes = 0;
	int backupCount = 0;
	int fd = -1;
	off_t size = 0;
	int rotateError = 0;
	std::string BackupName(int) const;
	int Reopen(int flags);
public:
	RotatingFile() {
	}
	~RotatingFile();
	RotatingFile(const RotatingFile &) = delete;
	RotatingFile &operator=(const RotatingFile &) = delete;
	int Open(const char *const, off_t, int);
	int Write(const char *, size_t);
	int Rotate();
	int Close();
	bool IsOpen() const {
		return fd != -1;
	}
	off_t GetSize() const {
		return size;
	}
	const char *GetPath() const {
		return path.c_str();
	}
	//errno of the last failed rotation, cleared by the call
	int TakeRotateError() {
		int e = rotateError;
		rotateError = 0;
		return e;
	}
};
#endif
