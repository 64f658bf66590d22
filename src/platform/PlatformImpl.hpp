#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace deploywrap {

	//---Интерфейс проверки запущенных процессов
	class IProcessInspector;

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Папка журналов по умолчанию
		fs::path defaultLogDir();
		//---Создание инспектора процессов для текущей платформы
		std::unique_ptr<IProcessInspector> makeProcessInspector();
	}

} // namespace deploywrap
