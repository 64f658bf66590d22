#include <gtest/gtest.h>
#include <sstream>
#include "deploy_wrapper/Wrapper.hpp"
#include "Fakes.hpp"

using namespace deploywrap;

namespace {
	DeploymentRequest request(bool install, bool uninstall, bool dnd = false, bool force = false)
	{
		DeploymentRequest r;
		r.targetProcess = "outlook";
		r.install = install;
		r.uninstall = uninstall;
		r.doNotDisturb = dnd;
		r.forceInteractive = force;
		return r;
	}
}

TEST(Wrapper, ConflictingFlagsExitWithoutLookupOrInvocation) {
	const WrapperConfig config{};
	const test::FakeInspector inspector(false);
	test::FakeInvoker invoker;
	std::ostringstream out;

	const int code = runWrapper(request(true, true), config, inspector, invoker, out);

	EXPECT_EQ(code, 1);
	EXPECT_TRUE(inspector.queried.empty());
	EXPECT_TRUE(invoker.calls.empty());
	EXPECT_NE(out.str().find("cannot be used together"), std::string::npos);
}

TEST(Wrapper, DeferredRunDoesNotInvoke) {
	const WrapperConfig config{};
	const test::FakeInspector inspector(true);
	test::FakeInvoker invoker;
	std::ostringstream out;

	const int code = runWrapper(request(false, true, true), config, inspector, invoker, out);

	EXPECT_EQ(code, 60012);
	EXPECT_EQ(inspector.queried.size(), 1u);
	EXPECT_TRUE(invoker.calls.empty());
	EXPECT_NE(out.str().find("deferred"), std::string::npos);
}

TEST(Wrapper, InvokesWithDecisionAndPrintsStatus) {
	const WrapperConfig config{};
	const test::FakeInspector inspector(true);
	test::FakeInvoker invoker;
	std::ostringstream out;

	const int code = runWrapper(request(true, false), config, inspector, invoker, out);

	EXPECT_EQ(code, 0);
	ASSERT_EQ(invoker.calls.size(), 1u);
	EXPECT_EQ(invoker.calls[0].type, DeploymentType::Install);
	EXPECT_EQ(invoker.calls[0].mode, DeployMode::Interactive);
	EXPECT_NE(out.str().find("DeploymentType: Install, DeployMode: Interactive, TargetProcess: outlook"), std::string::npos);
	EXPECT_NE(out.str().find("Exit code: 0"), std::string::npos);
}

TEST(Wrapper, PassesInvokerExitCodeThrough) {
	const WrapperConfig config{};
	const test::FakeInspector inspector(false);
	test::FakeInvoker invoker;
	invoker.result = InvocationResult{ true, 3010, {} };
	std::ostringstream out;

	const int code = runWrapper(request(false, true), config, inspector, invoker, out);

	EXPECT_EQ(code, 3010);
	ASSERT_EQ(invoker.calls.size(), 1u);
	EXPECT_EQ(invoker.calls[0].type, DeploymentType::Uninstall);
	EXPECT_EQ(invoker.calls[0].mode, DeployMode::Silent);
	EXPECT_NE(out.str().find("Exit code: 3010"), std::string::npos);
}

TEST(Wrapper, LaunchFailureIsNotFatal) {
	const WrapperConfig config{};
	const test::FakeInspector inspector(false);
	test::FakeInvoker invoker;
	invoker.result = InvocationResult{ false, 0, "Launcher executable does not exist: ServiceUI.exe" };
	std::ostringstream out;

	const int code = runWrapper(request(true, false, false, true), config, inspector, invoker, out);

	EXPECT_EQ(code, 0);
	ASSERT_EQ(invoker.calls.size(), 1u);
	EXPECT_EQ(invoker.calls[0].mode, DeployMode::Interactive);
	EXPECT_NE(out.str().find("Exit code: 0"), std::string::npos);
}

TEST(Wrapper, StatusLineFormat) {
	EXPECT_EQ(formatStatusLine({ DeploymentType::Uninstall, DeployMode::Silent }, ""),
		"DeploymentType: Uninstall, DeployMode: Silent, TargetProcess: ");
}
