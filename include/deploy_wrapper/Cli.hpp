#pragma once
#include <string>
#include <iostream>
#include "Deployment.hpp"

namespace deploywrap {

	//---Команды CLI
	enum class Command {
		Run,		//	Разрешить режим и запустить PSADT
		Help,
		Version,
		Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		Command cmd = Command::Run;
		DeploymentRequest request;

		std::string error;		//	Причина Command::Invalid
	};

	//---Разбор аргументов. Ключи без учёта регистра, префикс "-" или "--".
	//	-Install и -Uninstall вместе разбираются успешно: конфликт проверяет резолвер
	CliOptions parseCli(int argc, const char* const* argv);
	void printHelp(std::ostream& os);

};//---namespace deploywrap
