#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/prctl.h>
#include "deploy_wrapper/IProcessInspector.hpp"
#include "deploy_wrapper/Platform.hpp"

using namespace deploywrap;

namespace {
	//---Имя образа текущего (тестового) процесса
	std::string selfImageName()
	{
		return std::filesystem::read_symlink("/proc/self/exe").filename().string();
	}

	std::string selfComm()
	{
		std::ifstream in("/proc/self/comm");
		std::string comm;
		std::getline(in, comm);
		return comm;
	}

	//---Временное переименование comm основного потока тестового процесса
	class ScopedComm final {
	public:
		explicit ScopedComm(const char* name) : saved_(selfComm())
		{
			::prctl(PR_SET_NAME, name, 0, 0, 0);
		}
		~ScopedComm()
		{
			::prctl(PR_SET_NAME, saved_.c_str(), 0, 0, 0);
		}

	private:
		std::string saved_;
	};
}

TEST(ProcessInspectorLinux, FindsOwnProcess) {
	const auto inspector = makeProcessInspector();
	ASSERT_TRUE(inspector);
	EXPECT_TRUE(inspector->isRunning(selfImageName()));
}

TEST(ProcessInspectorLinux, IgnoresCaseAndExeSuffix) {
	const auto inspector = makeProcessInspector();
	std::string upper = selfImageName();
	std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return (char)std::toupper(c); });
	EXPECT_TRUE(inspector->isRunning(upper));
	EXPECT_TRUE(inspector->isRunning(selfImageName() + ".exe"));
}

TEST(ProcessInspectorLinux, BlankNameIsNotRunning) {
	const auto inspector = makeProcessInspector();
	EXPECT_FALSE(inspector->isRunning(""));
	EXPECT_FALSE(inspector->isRunning("   "));
}

TEST(ProcessInspectorLinux, UnknownNameIsNotRunning) {
	const auto inspector = makeProcessInspector();
	EXPECT_FALSE(inspector->isRunning("deploy-wrapper-no-such-process-7f3a"));
}

TEST(ProcessInspectorLinux, MatchesFullComm) {
	const ScopedComm comm("dwtestcomm");
	ASSERT_EQ(selfComm(), "dwtestcomm");

	const auto inspector = makeProcessInspector();
	EXPECT_TRUE(inspector->isRunning("dwtestcomm"));
}

TEST(ProcessInspectorLinux, LongNameDoesNotMatchTruncatedCommOfOtherImage) {
	//---Ядро обрезает comm до "averyverylongap"; образ процесса известен и называется иначе
	const ScopedComm comm("averyverylongappname");
	ASSERT_EQ(selfComm(), "averyverylongap");

	const auto inspector = makeProcessInspector();
	EXPECT_FALSE(inspector->isRunning("averyverylongappnameX2"));
	EXPECT_FALSE(inspector->isRunning("averyverylongappname"));
}
