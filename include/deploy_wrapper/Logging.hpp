#pragma once
#include <filesystem>
#include "Config.hpp"

namespace deploywrap {

	//---Инициализация glog: все уровни пишутся в один дописываемый файл за сутки
	//	<logDir>/<prefix>_<YYYY-MM-DD>.log и дублируются в stderr.
	//	Возвращает путь к файлу журнала (пустой, если папку журналов создать не удалось)
	std::filesystem::path initLogging(const char* programName, const WrapperConfig& config);

	//---Сброс буферов и завершение glog
	void shutdownLogging();

};//---namespace deploywrap
