// RAII wrapper for the temporary output file written before it is renamed
// into place. Closes the fd on scope exit and unlinks the temporary path
// unless the file was committed.
#ifndef BIBSANE_SRC_COMMON_SCOPED_FD_H_
#define BIBSANE_SRC_COMMON_SCOPED_FD_H_

#include <string>
#include <utility>

#include <unistd.h>

namespace BibSane {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			if (fd >= 0) ::close(fd);
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }

	// Close now and report the result; close() can surface delayed write errors.
	int Close() {
		int rc = 0;
		if (fd >= 0) {
			rc = ::close(fd);
			fd = -1;
		}
		return rc;
	}
};

// Removes a temporary file on scope exit unless Release() was called.
class ScopedUnlink {
public:
	explicit ScopedUnlink(std::string path) : path_(std::move(path)) {}
	~ScopedUnlink() {
		if (!path_.empty()) {
			::unlink(path_.c_str());
		}
	}

	ScopedUnlink(const ScopedUnlink&) = delete;
	ScopedUnlink& operator=(const ScopedUnlink&) = delete;

	void Release() { path_.clear(); }

private:
	std::string path_;
};

} // namespace BibSane

#endif  // BIBSANE_SRC_COMMON_SCOPED_FD_H_
