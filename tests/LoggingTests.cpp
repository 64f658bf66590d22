#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <glog/logging.h>
#include "deploy_wrapper/Config.hpp"
#include "deploy_wrapper/Logging.hpp"
#include "deploy_wrapper/Paths.hpp"

using namespace deploywrap;

namespace {

	std::string readFile(const fs::path& p)
	{
		std::ifstream in(p, std::ios::binary);
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	class LoggingTest : public ::testing::Test {
	protected:
		void SetUp() override
		{
			root_ = fs::temp_directory_path() / (std::string("deploy_wrapper_logging_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
			std::error_code ec;
			fs::remove_all(root_, ec);
			fs::create_directories(root_, ec);
			ASSERT_FALSE(ec) << ec.message();
		}

		void TearDown() override
		{
			shutdownLogging();
			//---После теста журнал снова идёт только в stderr
			FLAGS_logtostderr = true;
			std::error_code ec;
			fs::remove_all(root_, ec);
		}

		WrapperConfig configWithLogDir(const fs::path& dir) const
		{
			WrapperConfig c;
			c.version = "test";
			c.logDir = dir;
			c.logFilePrefix = "DeployWrapper";
			return c;
		}

		fs::path root_;
	};
}

TEST_F(LoggingTest, WritesAllSeveritiesToSingleDailyFile) {
	const fs::path dir = root_ / "logs";
	const WrapperConfig config = configWithLogDir(dir);

	const fs::path logFile = initLogging("deploy_wrapper_tests", config);
	ASSERT_FALSE(logFile.empty());
	EXPECT_EQ(logFile, dailyLogFile(dir, "DeployWrapper"));

	LOG(INFO) << "info-marker-5d1c";
	LOG(WARNING) << "warning-marker-9a7e";
	shutdownLogging();

	ASSERT_TRUE(fs::exists(logFile));
	const std::string text = readFile(logFile);
	EXPECT_NE(text.find("info-marker-5d1c"), std::string::npos);
	EXPECT_NE(text.find("warning-marker-9a7e"), std::string::npos);

	size_t files = 0;
	for (const auto& e : fs::directory_iterator(dir))
	{
		++files;
		EXPECT_EQ(e.path().filename(), logFile.filename());
	}
	EXPECT_EQ(files, 1u);
}

TEST_F(LoggingTest, SecondRunAppendsToSameFile) {
	const fs::path dir = root_ / "logs";
	const WrapperConfig config = configWithLogDir(dir);

	const fs::path first = initLogging("deploy_wrapper_tests", config);
	ASSERT_FALSE(first.empty());
	LOG(INFO) << "first-run-marker-31b0";
	shutdownLogging();

	const fs::path second = initLogging("deploy_wrapper_tests", config);
	ASSERT_EQ(second, first);
	LOG(INFO) << "second-run-marker-c84f";
	shutdownLogging();

	const std::string text = readFile(first);
	EXPECT_NE(text.find("first-run-marker-31b0"), std::string::npos);
	EXPECT_NE(text.find("second-run-marker-c84f"), std::string::npos);
}

TEST_F(LoggingTest, FallsBackToStderrWhenDirectoryCannotBeCreated) {
	const fs::path blocker = root_ / "not_a_dir";
	{
		std::ofstream f(blocker.string());
		f << "x";
	}
	const WrapperConfig config = configWithLogDir(blocker / "logs");

	const fs::path logFile = initLogging("deploy_wrapper_tests", config);

	EXPECT_TRUE(logFile.empty());
	EXPECT_TRUE(FLAGS_logtostderr);
	std::error_code ec;
	EXPECT_FALSE(fs::exists(blocker / "logs", ec));
}
