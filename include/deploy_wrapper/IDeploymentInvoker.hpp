#pragma once
#include <string>
#include "Deployment.hpp"

namespace deploywrap {

	//---Результат запуска PSADT
	struct InvocationResult final {
		bool started = false;		//	Удалось ли запустить внешний процесс
		int exitCode = 0;			//	Код завершения (0, если процесс не запустился)
		std::string message;		//	Описание ошибки запуска
	};

	//---Интерфейс запуска PSADT с выбранными параметрами
	//	Ошибки запуска не пробрасываются: они возвращаются в InvocationResult::message
	class IDeploymentInvoker {
	public:
		virtual ~IDeploymentInvoker() = default;

		virtual InvocationResult invoke(DeploymentType type, DeployMode mode) = 0;
	};
};//---namespace deploywrap
