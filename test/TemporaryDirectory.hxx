// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef VPLAY_TEST_TEMPORARY_DIRECTORY_HXX
#define VPLAY_TEST_TEMPORARY_DIRECTORY_HXX

#include "system/Error.hxx"

#include <string>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <stdio.h>
#include <sys/stat.h>
#include <stdlib.h>
#include <unistd.h>

/**
 * A temporary directory which is deleted, together with all files
 * created with WriteFile(), by the destructor.
 */
class TemporaryDirectory {
	std::string path;

	std::vector<std::string> files;

public:
	TemporaryDirectory() {
		char buffer[] = "/tmp/vplay-test-XXXXXX";
		if (mkdtemp(buffer) == nullptr)
			throw MakeErrno("mkdtemp() failed");

		path = buffer;
	}

	~TemporaryDirectory() noexcept {
		for (auto i = files.rbegin(); i != files.rend(); ++i)
			remove(i->c_str());

		rmdir(path.c_str());
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * Returns the absolute path of a (possibly non-existing)
	 * file in this directory.
	 */
	std::string Child(std::string_view name) const {
		std::string result = path;
		result.push_back('/');
		result.append(name);
		return result;
	}

	/**
	 * Create a file with the given contents.
	 *
	 * @return the absolute path
	 */
	std::string WriteFile(std::string_view name, std::string_view contents) {
		auto child = Child(name);

		FILE *file = fopen(child.c_str(), "wb");
		if (file == nullptr)
			throw MakeErrno("fopen() failed");

		const bool ok = fwrite(contents.data(), 1, contents.size(),
				       file) == contents.size();
		fclose(file);
		if (!ok)
			throw std::runtime_error("fwrite() failed");

		files.push_back(child);
		return child;
	}

	/**
	 * Create an empty subdirectory.
	 */
	std::string MakeDirectory(std::string_view name) {
		auto child = Child(name);
		if (mkdir(child.c_str(), 0700) < 0)
			throw MakeErrno("mkdir() failed");

		files.push_back(child);
		return child;
	}
};

#endif
