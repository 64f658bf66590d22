#include "deploy_wrapper/LauncherInvoker.hpp"
#include "deploy_wrapper/Process.hpp"

#include <sstream>
#include <system_error>
#include <glog/logging.h>

namespace deploywrap {

	LauncherInvoker::LauncherInvoker(const WrapperConfig& config)
		: config_(config)
	{
	}
	//------------------------------------------------------------
	//	Формирование аргументов запускателя
	//------------------------------------------------------------
	std::vector<std::string> LauncherInvoker::buildArgs(DeploymentType type, DeployMode mode) const
	{
		std::vector<std::string> args(config_.launcherArgs.begin(), config_.launcherArgs.end());
		args.push_back(config_.toolkitExe.string());
		args.push_back("-DeploymentType");
		args.push_back(toString(type));
		args.push_back("-DeployMode");
		args.push_back(toString(mode));
		return args;
	}
	//------------------------------------------------------------
	//	Запуск PSADT. Ошибки запуска возвращаются в результате
	//------------------------------------------------------------
	InvocationResult LauncherInvoker::invoke(DeploymentType type, DeployMode mode)
	{
		InvocationResult result;

		//---Запускатель не найден → не пытаемся запускать
		std::error_code ec;
		if (config_.launcherExe.empty() || !fs::exists(config_.launcherExe, ec))
		{
			result.message = "Launcher executable does not exist: " + config_.launcherExe.string();
			LOG(ERROR) << result.message;
			return result;
		}

		const std::vector<std::string> args = buildArgs(type, mode);
		{
			std::ostringstream os;
			os << config_.launcherExe.string();
			for (const auto& a : args) os << ' ' << a;
			LOG(INFO) << "Starting: " << os.str();
		}

		process::RunOptions opt;
		opt.workingDir = config_.workingDir;

		process::RunResult rr;
		if (!process::run(config_.launcherExe, args, rr, opt))
		{
			result.started = rr.started;
			result.message = rr.message.empty() ? "Failed to run " + config_.launcherExe.string() : rr.message;
			LOG(ERROR) << result.message << " (sysError=" << rr.sysError << ")";
			return result;
		}

		result.started = true;
		result.exitCode = rr.exitCode;
		LOG(INFO) << "Launcher exited with code " << rr.exitCode;
		return result;
	}

}; //---namespace deploywrap
