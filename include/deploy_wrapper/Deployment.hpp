#pragma once
#include <string>

namespace deploywrap {

	//---Коды завершения, которые ожидает оркестратор (Intune)
	constexpr int kExitConflictingMode = 1;		//	Заданы одновременно -Install и -Uninstall
	constexpr int kExitDeferred = 60012;		//	Процесс запущен и задан -DoNotDisturb: повторить позже

	//---Тип развёртывания (-DeploymentType)
	enum class DeploymentType {
		Install,
		Uninstall
	};

	//---Режим развёртывания (-DeployMode)
	enum class DeployMode {
		Interactive,
		Silent
	};

	//---Запрос на развёртывание, собранный из командной строки
	struct DeploymentRequest final {

		std::string targetProcess;		//	Имя процесса без расширения (может быть пустым)

		//---Флаги
		bool install = false;			//	-Install
		bool uninstall = false;			//	-Uninstall (несовместим с -Install)
		bool doNotDisturb = false;		//	-DoNotDisturb: не прерывать пользователя
		bool forceInteractive = false;	//	-ForceInteractive: интерактивный режим в любом случае
	};

	//---Решение резолвера. Вычисляется один раз и больше не меняется
	struct DeploymentDecision final {
		DeploymentType deploymentType = DeploymentType::Install;
		DeployMode deployMode = DeployMode::Silent;
	};

	bool operator==(const DeploymentDecision& a, const DeploymentDecision& b);
	bool operator!=(const DeploymentDecision& a, const DeploymentDecision& b);

	//---Текстовые значения, передаваемые в PSADT
	const char* toString(DeploymentType t);
	const char* toString(DeployMode m);

};//---namespace deploywrap
