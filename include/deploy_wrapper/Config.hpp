#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace deploywrap {

	namespace fs = std::filesystem;

	//---Конфигурация обёртки. Собирается один раз при старте и дальше только читается
	struct WrapperConfig final {

		std::string version;					//	Версия обёртки (пишется в журнал)

		//---Журнал
		fs::path logDir;						//	Папка с журналами
		std::string logFilePrefix;				//	Префикс файла: <prefix>_<YYYY-MM-DD>.log

		//---Запуск PSADT
		fs::path launcherExe;					//	Запускатель в сессии пользователя (ServiceUI)
		std::vector<std::string> launcherArgs;	//	Аргументы запускателя перед путём к PSADT
		fs::path toolkitExe;					//	Invoke-AppDeployToolkit
		fs::path workingDir;					//	Рабочий каталог для запускателя
	};

	//---Конфигурация по умолчанию:
	//	пути к инструментам разрешаются относительно папки с исполняемым файлом обёртки
	WrapperConfig makeDefaultConfig();

};//---namespace deploywrap
