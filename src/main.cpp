#include <iostream>
#include <glog/logging.h>
#include "deploy_wrapper/Cli.hpp"
#include "deploy_wrapper/Config.hpp"
#include "deploy_wrapper/IProcessInspector.hpp"
#include "deploy_wrapper/LauncherInvoker.hpp"
#include "deploy_wrapper/Logging.hpp"
#include "deploy_wrapper/Platform.hpp"
#include "deploy_wrapper/Wrapper.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const deploywrap::CliOptions opt = deploywrap::parseCli(argc, argv);

	//---Справка / версия / некорректная команда
	if (opt.cmd == deploywrap::Command::Help || opt.cmd == deploywrap::Command::Invalid)
	{
		if (opt.cmd == deploywrap::Command::Invalid) std::cerr << opt.error << "\n\n";
		deploywrap::printHelp(std::cout);
		return (opt.cmd == deploywrap::Command::Invalid) ? 2 : 0;
	}

	const deploywrap::WrapperConfig config = deploywrap::makeDefaultConfig();

	if (opt.cmd == deploywrap::Command::Version)
	{
		std::cout << "deploy-wrapper " << config.version << "\n";
		return 0;
	}

	//---Журнал за текущие сутки
	const auto logFile = deploywrap::initLogging(argv[0], config);
	LOG(INFO) << "deploy-wrapper " << config.version << " started";
	if (!logFile.empty()) LOG(INFO) << "Log file: " << logFile.string();

	const auto inspector = deploywrap::makeProcessInspector();
	deploywrap::LauncherInvoker invoker(config);

	//---Запуск обёртки с заданными опциями
	const int code = deploywrap::runWrapper(opt.request, config, *inspector, invoker, std::cout);

	deploywrap::shutdownLogging();
	return code;
}
