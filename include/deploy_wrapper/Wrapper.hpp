#pragma once
#include <iostream>
#include <string>
#include "Config.hpp"
#include "Deployment.hpp"

namespace deploywrap {

	class IProcessInspector;
	class IDeploymentInvoker;

	//---Оркестратор одного запуска:
	//	проверка флагов → проверка процесса → (отложить) → решение → запуск PSADT → код завершения.
	//	Строки состояния пишутся в out, подробности в журнал
	int runWrapper(const DeploymentRequest& request, const WrapperConfig& config,
		const IProcessInspector& inspector, IDeploymentInvoker& invoker, std::ostream& out);

	//---Строка состояния перед запуском PSADT
	std::string formatStatusLine(const DeploymentDecision& decision, const std::string& targetProcess);

};//---namespace deploywrap
