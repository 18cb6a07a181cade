// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Path.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <pwd.h>
#include <stdlib.h>
#include <unistd.h>

#include <utility>

using std::string_view_literals::operator""sv;

std::string
GetHomeDir() noexcept
{
	if (const char *home = getenv("HOME"); home != nullptr && *home != 0)
		return home;

	if (const auto *pw = getpwuid(getuid()); pw != nullptr)
		return pw->pw_dir;

	return {};
}

static std::string
GetHome()
{
	auto result = GetHomeDir();
	if (result.empty())
		throw std::runtime_error("problems getting home for current user");

	return result;
}

static std::string
GetHome(const std::string &user)
{
	const auto *pw = getpwnam(user.c_str());
	if (pw == nullptr)
		throw FmtRuntimeError("no such user: \"{}\"", user);

	return pw->pw_dir;
}

static std::string
GetVariable(std::string_view name)
{
	if (name == "HOME"sv)
		return GetHome();
	else if (name == "XDG_CONFIG_HOME"sv) {
		if (const char *v = getenv("XDG_CONFIG_HOME");
		    v != nullptr && *v == '/')
			return v;

		return GetHome() + "/.config";
	} else
		throw FmtRuntimeError("Unknown variable: \"{}\"", name);
}

/**
 * Split at the first slash; the slash itself belongs to the second
 * part.
 */
static std::pair<std::string_view, std::string_view>
SplitFirstSegment(std::string_view path) noexcept
{
	const auto slash = path.find('/');
	if (slash == path.npos)
		return {path, {}};

	return {path.substr(0, slash), path.substr(slash)};
}

std::string
ParsePath(std::string_view path)
{
	if (path.starts_with('~')) {
		path.remove_prefix(1);

		const auto [user, rest] = SplitFirstSegment(path);
		auto home = user.empty()
			? GetHome()
			: GetHome(std::string{user});

		return home.append(rest);
	} else if (path.starts_with('$')) {
		path.remove_prefix(1);

		const auto [name, rest] = SplitFirstSegment(path);
		return GetVariable(name).append(rest);
	} else if (!path.starts_with('/')) {
		throw FmtRuntimeError("not an absolute path: \"{}\"", path);
	} else {
		return std::string{path};
	}
}
