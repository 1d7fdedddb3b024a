#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <sys/stat.h>

namespace rcd::core {

// mkdir -p. Failures are reported on stderr; the caller notices when the
// file under it cannot be opened.
inline void ensure_dir(const std::string &path) {
	if (path.empty())
		return;
	std::string cur;
	size_t i = 0;
	if (path[0] == '/') {
		cur = "/";
		i = 1;
	}
	while (i <= path.size()) {
		const size_t next = path.find('/', i);
		const size_t end = (next == std::string::npos) ? path.size() : next;
		const std::string part = path.substr(i, end - i);
		i = (next == std::string::npos) ? path.size() + 1 : next + 1;
		if (part.empty() || part == ".")
			continue;
		if (!cur.empty() && cur.back() != '/')
			cur += "/";
		cur += part;
		if (part == "..")
			continue;
		const int rc = mkdir(cur.c_str(), 0755);
		if (rc == 0 || errno == EEXIST)
			continue;
		const int err = errno;
		std::fprintf(stderr,
					 "ensure_dir: failed to create directory '%s': %s "
					 "(errno=%d)\n",
					 cur.c_str(), std::strerror(err), err);
		return;
	}
}

inline std::string dir_of(const std::string &path) {
	const size_t pos = path.find_last_of('/');
	if (pos == std::string::npos || pos == 0)
		return std::string();
	return path.substr(0, pos);
}

inline void ensure_dir_for(const std::string &file_path) {
	ensure_dir(dir_of(file_path));
}

} // namespace rcd::core
