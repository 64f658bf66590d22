#include "deploy_wrapper/Wrapper.hpp"
#include "deploy_wrapper/IDeploymentInvoker.hpp"
#include "deploy_wrapper/IProcessInspector.hpp"
#include "deploy_wrapper/ModeResolver.hpp"

#include <sstream>
#include <glog/logging.h>

namespace deploywrap {

	namespace {
		//------------------------------------------------------------
		//	Запрос в журнал
		//------------------------------------------------------------
		static std::string describe(const DeploymentRequest& r)
		{
			std::ostringstream os;
			os << "Install=" << r.install
				<< " Uninstall=" << r.uninstall
				<< " DoNotDisturb=" << r.doNotDisturb
				<< " ForceInteractive=" << r.forceInteractive
				<< " TargetProcess='" << r.targetProcess << "'";
			return os.str();
		}
	} // namespace

	//------------------------------------------------------------
	//	Строка состояния
	//------------------------------------------------------------
	std::string formatStatusLine(const DeploymentDecision& decision, const std::string& targetProcess)
	{
		std::ostringstream os;
		os << "DeploymentType: " << toString(decision.deploymentType)
			<< ", DeployMode: " << toString(decision.deployMode)
			<< ", TargetProcess: " << targetProcess;
		return os.str();
	}
	//------------------------------------------------------------
	//	Оркестратор
	//------------------------------------------------------------
	int runWrapper(const DeploymentRequest& request, const WrapperConfig& config,
		const IProcessInspector& inspector, IDeploymentInvoker& invoker, std::ostream& out)
	{
		LOG(INFO) << "Request: " << describe(request);

		//---Проверка флагов и процесса
		const ModeResolver resolver(config, inspector);
		const Resolution resolution = resolver.resolve(request);

		if (resolution.status == ResolveStatus::ConflictingMode)
		{
			const char* msg = "Install and Uninstall cannot be used together.";
			out << msg << "\n";
			LOG(ERROR) << msg << " Exit code " << resolution.exitCode();
			return resolution.exitCode();
		}
		//---Ожидаемый исход: Intune повторит попытку позже
		if (resolution.status == ResolveStatus::Deferred)
		{
			std::ostringstream os;
			os << "Process '" << request.targetProcess << "' is running and DoNotDisturb is set. Deployment deferred.";
			out << os.str() << "\n";
			LOG(WARNING) << os.str() << " Exit code " << resolution.exitCode();
			return resolution.exitCode();
		}

		//---Решение принято
		const DeploymentDecision& d = resolution.decision;
		const std::string status = formatStatusLine(d, request.targetProcess);
		out << status << std::endl;
		LOG(INFO) << status;

		//---Запуск PSADT: ошибки запуска не прерывают обёртку
		const InvocationResult result = invoker.invoke(d.deploymentType, d.deployMode);
		if (!result.started)
		{
			LOG(ERROR) << "Deployment could not be started: "
				<< (result.message.empty() ? std::string("unknown error") : result.message);
		}

		out << "Exit code: " << result.exitCode << std::endl;
		LOG(INFO) << "Exit code: " << result.exitCode;
		return result.exitCode;
	}

}; //---namespace deploywrap
