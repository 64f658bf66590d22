#pragma once
#include <string>
#include <vector>
#include "Config.hpp"
#include "IDeploymentInvoker.hpp"

namespace deploywrap {

	//---Запуск PSADT через запускатель сессии пользователя:
	//	<launcherExe> <launcherArgs...> <toolkitExe> -DeploymentType <type> -DeployMode <mode>
	class LauncherInvoker final : public IDeploymentInvoker {
	public:
		explicit LauncherInvoker(const WrapperConfig& config);

		InvocationResult invoke(DeploymentType type, DeployMode mode) override;

		//---Аргументы запускателя (без пути к самому запускателю)
		std::vector<std::string> buildArgs(DeploymentType type, DeployMode mode) const;

	private:
		const WrapperConfig& config_;
	};

};//---namespace deploywrap
