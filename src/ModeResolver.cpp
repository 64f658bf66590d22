#include "deploy_wrapper/ModeResolver.hpp"
#include "deploy_wrapper/IProcessInspector.hpp"

#include <glog/logging.h>

namespace deploywrap {

	//------------------------------------------------------------
	//	Код завершения для статуса
	//------------------------------------------------------------
	int Resolution::exitCode() const
	{
		switch (status)
		{
		case ResolveStatus::ConflictingMode:	return kExitConflictingMode;
		case ResolveStatus::Deferred:			return kExitDeferred;
		case ResolveStatus::Ok:					break;
		}
		return 0;
	}
	//------------------------------------------------------------
	//	Правила выбора DeploymentType / DeployMode
	//------------------------------------------------------------
	Resolution resolve(const DeploymentRequest& request, bool isProcessRunning)
	{
		Resolution r;

		//---Взаимоисключающие флаги: состояние процесса не учитывается
		if (request.install && request.uninstall)
		{
			r.status = ResolveStatus::ConflictingMode;
			return r;
		}
		r.processChecked = true;
		r.processRunning = isProcessRunning;

		//---Не беспокоить: отложить, если пользователь работает с приложением
		if (isProcessRunning && request.doNotDisturb)
		{
			r.status = ResolveStatus::Deferred;
			return r;
		}

		r.decision.deploymentType = request.uninstall ? DeploymentType::Uninstall : DeploymentType::Install;
		r.decision.deployMode = (isProcessRunning || request.forceInteractive) ? DeployMode::Interactive : DeployMode::Silent;
		return r;
	}

	ModeResolver::ModeResolver(const WrapperConfig& config, const IProcessInspector& inspector)
		: config_(config), inspector_(inspector)
	{
	}
	//------------------------------------------------------------
	//	Разрешение режима с одной проверкой процесса
	//------------------------------------------------------------
	Resolution ModeResolver::resolve(const DeploymentRequest& request) const
	{
		//---Конфликт флагов: список процессов не запрашиваем
		if (request.install && request.uninstall)
		{
			Resolution r;
			r.status = ResolveStatus::ConflictingMode;
			return r;
		}

		const bool running = inspector_.isRunning(request.targetProcess);
		if (request.targetProcess.empty())
			LOG(INFO) << "[" << config_.logFilePrefix << " " << config_.version << "] No target process specified";
		else
			LOG(INFO) << "[" << config_.logFilePrefix << " " << config_.version << "] Target process '"
				<< request.targetProcess << "' running: " << (running ? "yes" : "no");

		return deploywrap::resolve(request, running);
	}

}; //---namespace deploywrap
