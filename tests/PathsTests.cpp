#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include "deploy_wrapper/Config.hpp"
#include "deploy_wrapper/Paths.hpp"

using namespace deploywrap;

TEST(Paths, DailyLogFileForDate) {
	const fs::path p = dailyLogFile(fs::path("logs"), "DeployWrapper", "2026-10-19");
	EXPECT_EQ(p, fs::path("logs") / "DeployWrapper_2026-10-19.log");
}

TEST(Paths, DailyLogFileForToday) {
	const fs::path p = dailyLogFile(fs::path("logs"), "DeployWrapper");
	EXPECT_EQ(p.parent_path(), fs::path("logs"));
	EXPECT_TRUE(std::regex_match(p.filename().string(), std::regex(R"(DeployWrapper_\d{4}-\d{2}-\d{2}\.log)")))
		<< p.filename().string();
}

TEST(Paths, ResolveToolPath) {
	EXPECT_TRUE(resolveToolPath("").empty());

	const fs::path abs = fs::temp_directory_path() / "ServiceUI.exe";
	EXPECT_EQ(resolveToolPath(abs.string()), abs);

	const fs::path rel = resolveToolPath("ServiceUI.exe");
	EXPECT_TRUE(rel.is_absolute());
	EXPECT_EQ(rel.filename(), fs::path("ServiceUI.exe"));
	EXPECT_EQ(rel.parent_path(), selfDir().lexically_normal());
}

TEST(Paths, CreateDirectory) {
	const fs::path dir = fs::temp_directory_path() / "deploy_wrapper_paths_test" / "a" / "b";
	std::error_code ec;
	fs::remove_all(dir.parent_path().parent_path(), ec);

	std::string error;
	EXPECT_TRUE(createDirectory(dir, &error)) << error;
	EXPECT_TRUE(fs::is_directory(dir));
	EXPECT_TRUE(createDirectory(dir, &error)) << error;

	fs::remove_all(dir.parent_path().parent_path(), ec);
}

TEST(Paths, CreateDirectoryOverFileFails) {
	const fs::path file = fs::temp_directory_path() / "deploy_wrapper_paths_test_file";
	{
		std::ofstream f(file.string());
		f << "x";
	}
	std::string error;
	EXPECT_FALSE(createDirectory(file / "sub", &error));
	EXPECT_FALSE(error.empty());

	std::error_code ec;
	fs::remove(file, ec);
}

TEST(Config, DefaultsResolveAgainstWrapperDirectory) {
	const WrapperConfig c = makeDefaultConfig();
	EXPECT_FALSE(c.version.empty());
	EXPECT_EQ(c.logFilePrefix, "DeployWrapper");
	EXPECT_FALSE(c.logDir.empty());
	EXPECT_EQ(c.launcherExe.parent_path(), selfDir().lexically_normal());
	EXPECT_EQ(c.toolkitExe.parent_path(), selfDir().lexically_normal());
	ASSERT_EQ(c.launcherArgs.size(), 1u);
	EXPECT_EQ(c.launcherArgs[0], "-process:explorer.exe");
}
