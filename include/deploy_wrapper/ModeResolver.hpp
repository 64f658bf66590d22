#pragma once
#include "Config.hpp"
#include "Deployment.hpp"

namespace deploywrap {

	class IProcessInspector;

	//---Итог разрешения режима
	enum class ResolveStatus {
		Ok,					//	Решение принято, можно запускать PSADT
		ConflictingMode,	//	-Install и -Uninstall одновременно
		Deferred			//	Процесс запущен и задан -DoNotDisturb
	};

	struct Resolution final {
		ResolveStatus status = ResolveStatus::Ok;
		DeploymentDecision decision;		//	Имеет смысл только при status == Ok
		bool processChecked = false;		//	Выполнялась ли проверка процесса
		bool processRunning = false;		//	Результат проверки процесса

		bool ok() const { return status == ResolveStatus::Ok; }

		//---Код завершения для статусов-ошибок (0 для Ok)
		int exitCode() const;
	};

	//---Правила выбора режима. Чистая функция: без побочных эффектов и скрытого состояния
	//	1. install && uninstall              → ConflictingMode (код 1)
	//	2. isProcessRunning && doNotDisturb  → Deferred (код 60012)
	//	3. DeploymentType = uninstall ? Uninstall : Install
	//	4. DeployMode = (isProcessRunning || forceInteractive) ? Interactive : Silent
	Resolution resolve(const DeploymentRequest& request, bool isProcessRunning);

	//---Резолвер с проверкой процесса через инспектор.
	//	Конфликт флагов проверяется до обращения к списку процессов
	class ModeResolver final {
	public:
		ModeResolver(const WrapperConfig& config, const IProcessInspector& inspector);

		Resolution resolve(const DeploymentRequest& request) const;

	private:
		const WrapperConfig& config_;
		const IProcessInspector& inspector_;
	};

};//---namespace deploywrap
