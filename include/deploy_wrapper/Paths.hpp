#pragma once
#include <filesystem>
#include <string>

namespace deploywrap {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл обёртки (зависит от платформы)
	fs::path selfDir();

	//--Определение пути к внешнему инструменту (ServiceUI, PSADT):
	//	Если arg пустой → возвращается пустой путь
	//	Если arg относительный путь → selfDir() / arg
	//	Если arg абсолютный путь → остаётся без изменений
	fs::path resolveToolPath(const std::string& arg);

	//---Папка журналов по умолчанию (зависит от платформы)
	fs::path defaultLogDir();

	//---Файл журнала за текущие сутки: <logDir>/<prefix>_<YYYY-MM-DD>.log
	fs::path dailyLogFile(const fs::path& logDir, const std::string& prefix);

	//---То же, для заданной даты (в формате YYYY-MM-DD)
	fs::path dailyLogFile(const fs::path& logDir, const std::string& prefix, const std::string& date);

	//---Создание директории, если она не существует
	bool createDirectory(const fs::path& dirPath, std::string* error);

};//---namespace deploywrap
