#include "deploy_wrapper/Config.hpp"
#include "deploy_wrapper/Paths.hpp"

#ifndef DEPLOY_WRAPPER_VERSION
#define DEPLOY_WRAPPER_VERSION "0.0.0"
#endif

#ifndef DEPLOY_WRAPPER_LAUNCHER
#ifdef _WIN32
#define DEPLOY_WRAPPER_LAUNCHER "ServiceUI.exe"
#else
#define DEPLOY_WRAPPER_LAUNCHER "ServiceUI"
#endif
#endif

#ifndef DEPLOY_WRAPPER_TOOLKIT
#ifdef _WIN32
#define DEPLOY_WRAPPER_TOOLKIT "Invoke-AppDeployToolkit.exe"
#else
#define DEPLOY_WRAPPER_TOOLKIT "Invoke-AppDeployToolkit"
#endif
#endif

namespace deploywrap {

	//------------------------------------------------------------
	//	Конфигурация по умолчанию
	//------------------------------------------------------------
	WrapperConfig makeDefaultConfig()
	{
		WrapperConfig c;
		c.version = DEPLOY_WRAPPER_VERSION;

		c.logDir = defaultLogDir();
		c.logFilePrefix = "DeployWrapper";

		//---ServiceUI запускает PSADT в сессии, где работает explorer.exe
		c.launcherExe = resolveToolPath(DEPLOY_WRAPPER_LAUNCHER);
		c.launcherArgs = { "-process:explorer.exe" };
		c.toolkitExe = resolveToolPath(DEPLOY_WRAPPER_TOOLKIT);
		c.workingDir = selfDir();

		return c;
	}

} // namespace deploywrap
