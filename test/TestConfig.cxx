// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ConfigGlue.hxx"
#include "config/Check.hxx"
#include "config/Parser.hxx"
#include "config/Path.hxx"
#include "LogInit.hxx"
#include "output/Init.hxx"
#include "output/Interface.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <system_error>

#include <stdlib.h>

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;
using std::chrono_literals::operator""min;

/**
 * Expect ReadConfigFile() to fail with a message containing the given
 * string.
 */
static void
ExpectConfigError(std::string_view contents, const char *expected)
{
	TemporaryDirectory directory;

	try {
		LoadConfigString(directory, "vplay.conf", contents);
		FAIL() << "no error for: " << contents;
	} catch (const std::runtime_error &e) {
		const auto msg = GetFullMessage(e);
		EXPECT_NE(msg.find(expected), msg.npos) << msg;
	}
}

TEST(ConfigParser, Bool)
{
	EXPECT_TRUE(ParseBool("yes"));
	EXPECT_TRUE(ParseBool("TRUE"));
	EXPECT_TRUE(ParseBool("1"));
	EXPECT_FALSE(ParseBool("no"));
	EXPECT_FALSE(ParseBool("false"));
	EXPECT_FALSE(ParseBool("0"));
	EXPECT_THROW(ParseBool("maybe"), std::runtime_error);
}

TEST(ConfigParser, Unsigned)
{
	EXPECT_EQ(ParseUnsigned("0"), 0u);
	EXPECT_EQ(ParseUnsigned("42"), 42u);
	EXPECT_THROW(ParseUnsigned("-1"), std::runtime_error);
	EXPECT_THROW(ParseUnsigned("4x"), std::runtime_error);
	EXPECT_THROW(ParsePositive("0"), std::runtime_error);
}

TEST(ConfigParser, Duration)
{
	EXPECT_EQ(ParseDuration("10"), 10s);
	EXPECT_EQ(ParseDuration("3s"), 3s);
	EXPECT_EQ(ParseDuration("250ms"), 250ms);
	EXPECT_EQ(ParseDuration("2 min"), 2min);
	EXPECT_THROW(ParseDuration(""), std::runtime_error);
	EXPECT_THROW(ParseDuration("-5"), std::runtime_error);
	EXPECT_THROW(ParseDuration("5h"), std::runtime_error);
}

TEST(ConfigPath, Absolute)
{
	EXPECT_EQ(ParsePath("/var/lib/vplay"), "/var/lib/vplay");
	EXPECT_THROW(ParsePath("relative/path"), std::runtime_error);
	EXPECT_THROW(ParsePath("$NO_SUCH_VARIABLE/x"), std::runtime_error);
}

TEST(ConfigPath, Home)
{
	setenv("HOME", "/home/test", 1);
	EXPECT_EQ(GetHomeDir(), "/home/test");
	EXPECT_EQ(ParsePath("~"), "/home/test");
	EXPECT_EQ(ParsePath("~/music/a.mp3"), "/home/test/music/a.mp3");
	EXPECT_EQ(ParsePath("$HOME/x.log"), "/home/test/x.log");

	unsetenv("XDG_CONFIG_HOME");
	EXPECT_EQ(ParsePath("$XDG_CONFIG_HOME/vplay"), "/home/test/.config/vplay");

	setenv("XDG_CONFIG_HOME", "/etc/xdg", 1);
	EXPECT_EQ(ParsePath("$XDG_CONFIG_HOME/vplay"), "/etc/xdg/vplay");
	unsetenv("XDG_CONFIG_HOME");
}

TEST(ConfigFile, Params)
{
	TemporaryDirectory directory;
	const auto config = LoadConfigString(directory, "vplay.conf",
					     "# comment\n"
					     "\n"
					     "log_level \"verbose\"\n"
					     "play_timeout \"500 ms\"  # trailing\n"
					     "log_file \"/tmp/vplay.log\"\n");

	ASSERT_NE(config.GetParam(ConfigOption::LOG_LEVEL), nullptr);
	EXPECT_EQ(config.GetParam(ConfigOption::LOG_LEVEL)->value, "verbose");
	ASSERT_NE(config.GetParam(ConfigOption::LOG_FILE), nullptr);
	EXPECT_EQ(config.GetParam(ConfigOption::LOG_FILE)->GetPath(),
		  "/tmp/vplay.log");
	EXPECT_EQ(config.GetDuration(ConfigOption::PLAY_TIMEOUT, 1ms, 10s), 500ms);

	const auto *param = config.GetParam(ConfigOption::PLAY_TIMEOUT);
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->line, 4);
}

TEST(ConfigFile, Defaults)
{
	const ConfigData config;
	EXPECT_EQ(config.GetParam(ConfigOption::LOG_LEVEL), nullptr);
	EXPECT_EQ(config.GetParam(ConfigOption::LOG_FILE), nullptr);
	EXPECT_EQ(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
		return s == nullptr;
	}), true);
	EXPECT_EQ(config.GetDuration(ConfigOption::PLAY_TIMEOUT, 1ms, 10s), 10s);
	EXPECT_EQ(config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT), nullptr);
}

TEST(ConfigFile, LastParamWins)
{
	TemporaryDirectory directory;
	const auto config = LoadConfigString(directory, "vplay.conf",
					     "play_timeout \"1\"\n"
					     "play_timeout \"2\"\n");

	EXPECT_EQ(config.GetDuration(ConfigOption::PLAY_TIMEOUT, 1ms, 10s), 2s);
}

TEST(ConfigFile, TimeoutTooSmall)
{
	TemporaryDirectory directory;
	const auto config = LoadConfigString(directory, "vplay.conf",
					     "play_timeout \"0\"\n");

	try {
		config.GetDuration(ConfigOption::PLAY_TIMEOUT, 1ms, 10s);
		FAIL() << "GetDuration() did not throw";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e), "Error on line 1; Value is too small");
	}
}

TEST(ConfigFile, Blocks)
{
	TemporaryDirectory directory;
	const auto config = LoadConfigString(directory, "vplay.conf",
					     "audio_output {\n"
					     "  type \"alsa\"\n"
					     "  name \"My Sound Card\"\n"
					     "  device \"hw:0,0\" # comment\n"
					     "}\n"
					     "decoder {\n"
					     "  plugin \"ffmpeg\"\n"
					     "  enabled \"no\"\n"
					     "}\n"
					     "decoder {\n"
					     "  plugin \"mpg123\"\n"
					     "}\n");

	const auto *output = config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	ASSERT_NE(output, nullptr);
	EXPECT_EQ(output->line, 1);
	EXPECT_STREQ(output->GetBlockValue("type"), "alsa");
	EXPECT_STREQ(output->GetBlockValue("name"), "My Sound Card");
	EXPECT_STREQ(output->GetBlockValue("device"), "hw:0,0");
	EXPECT_EQ(output->GetBlockValue("mixer"), nullptr);

	const auto *ffmpeg = config.FindBlock(ConfigBlockOption::DECODER,
					      "plugin", "ffmpeg");
	ASSERT_NE(ffmpeg, nullptr);
	EXPECT_FALSE(ffmpeg->GetBlockValue("enabled", true));

	const auto *mpg123 = config.FindBlock(ConfigBlockOption::DECODER,
					      "plugin", "mpg123");
	ASSERT_NE(mpg123, nullptr);
	EXPECT_TRUE(mpg123->GetBlockValue("enabled", true));

	EXPECT_EQ(config.FindBlock(ConfigBlockOption::DECODER,
				   "plugin", "flac"), nullptr);
}

TEST(ConfigFile, UnusedOptions)
{
	TemporaryDirectory directory;
	const auto config = LoadConfigString(directory, "vplay.conf",
					     "audio_output {\n"
					     "  type \"null\"\n"
					     "  synk \"no\"\n"
					     "}\n"
					     "decoder {\n"
					     "  plugin \"nonexistent\"\n"
					     "}\n");

	const auto *output = config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	ASSERT_NE(output, nullptr);
	EXPECT_FALSE(output->used);

	/* creating the output marks the settings it knows */
	EXPECT_NE(audio_output_new(*output), nullptr);
	EXPECT_TRUE(output->used);
	ASSERT_EQ(output->block_params.size(), 2u);
	EXPECT_TRUE(output->block_params[0].used);
	EXPECT_FALSE(output->block_params[1].used);

	/* the decoder block was never looked at */
	const auto &decoder = config.GetBlockList(ConfigBlockOption::DECODER).front();
	EXPECT_FALSE(decoder.used);

	/* logs one warning for "synk" */
	CheckUnusedOptions(config);
}

TEST(ConfigFile, Include)
{
	TemporaryDirectory directory;
	directory.MakeDirectory("conf.d");
	directory.WriteFile("conf.d/output.conf",
			    "audio_output {\n"
			    "  type \"null\"\n"
			    "}\n");

	const auto config = LoadConfigString(directory, "vplay.conf",
					     "log_level \"warning\"\n"
					     "include \"conf.d/output.conf\"\n");

	ASSERT_NE(config.GetParam(ConfigOption::LOG_LEVEL), nullptr);
	EXPECT_EQ(config.GetParam(ConfigOption::LOG_LEVEL)->value, "warning");

	const auto *output = config.GetBlock(ConfigBlockOption::AUDIO_OUTPUT);
	ASSERT_NE(output, nullptr);
	EXPECT_STREQ(output->GetBlockValue("type"), "null");
}

TEST(ConfigFile, Errors)
{
	ExpectConfigError("volume \"50\"\n", "unrecognized parameter: volume");
	ExpectConfigError("log_level\n", "Value missing");
	ExpectConfigError("log_level \"info\" x\n", "Unknown tokens after value");
	ExpectConfigError("log_level \"info\n", "Missing closing '\"'");
	ExpectConfigError("audio_output \"x\"\n", "'{' expected");
	ExpectConfigError("audio_output {\n type \"null\"\n", "Expected '}' before end-of-file");
	ExpectConfigError("audio_output {\n"
			  " type \"null\"\n"
			  " type \"alsa\"\n"
			  "}\n",
			  "\"type\" is duplicate, first defined on line 2");
	ExpectConfigError("audio_output {\n}\n"
			  "audio_output {\n}\n",
			  "is first defined on line 1 and redefined on line 3");
	ExpectConfigError("include \"missing.conf\"\n", "missing.conf");
}

TEST(ConfigFile, ErrorLocation)
{
	TemporaryDirectory directory;

	try {
		LoadConfigString(directory, "broken.conf",
				 "log_level \"info\"\n"
				 "bogus \"1\"\n");
		FAIL() << "no error";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error in line 2 of \"" + directory.Child("broken.conf") +
			  "\"; unrecognized parameter: bogus");
	}
}

TEST(ConfigFile, Missing)
{
	ConfigData data;
	EXPECT_THROW(ReadConfigFile(data, "/nonexistent/vplay.conf"),
		     std::system_error);
}

TEST(LogInit, LogLevel)
{
	TemporaryDirectory directory;

	for (const char *level : {"error", "warning", "notice", "info", "verbose"}) {
		const auto config = LoadConfigString(directory, level,
						     std::string{"log_level \""} + level + "\"\n");
		EXPECT_NO_THROW(log_init(config, false, true)) << level;
	}

	const auto config = LoadConfigString(directory, "bad",
					     "log_level \"loud\"\n");
	try {
		log_init(config, false, true);
		FAIL() << "log_init() did not throw";
	} catch (const std::runtime_error &e) {
		EXPECT_EQ(GetFullMessage(e),
			  "Error on line 1; unknown log level \"loud\"");
	}

	/* --verbose overrides the configured level */
	EXPECT_NO_THROW(log_init(config, true, true));

	log_deinit();
}
