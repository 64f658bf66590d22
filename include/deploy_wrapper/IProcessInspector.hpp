#pragma once
#include <string>

namespace deploywrap {

	//---Интерфейс проверки запущенного процесса по имени
	//	Пустое имя → false. "Процесс не найден" и "не удалось получить список процессов"
	//	не различаются: в обоих случаях false, исключения не выбрасываются
	class IProcessInspector {
	public:
		virtual ~IProcessInspector() = default;

		virtual bool isRunning(const std::string& processName) const = 0;
	};
};//---namespace deploywrap
