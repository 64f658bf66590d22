#pragma once
#include <memory>

namespace deploywrap {

	//---Интерфейс проверки запущенных процессов
	class IProcessInspector;

	//---Создание инспектора процессов для текущей платформы
	std::unique_ptr<IProcessInspector> makeProcessInspector();

};//---namespace deploywrap
