#include "deploy_wrapper/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace deploywrap {

	//------------------------------------------------------------
	//	Директория, в которой находится исполняемый файл обёртки
	//------------------------------------------------------------
	fs::path selfDir() {

		//---Получение пути к собственному исполняемому файлу
		const fs::path exe = platform::selfExePath();

		//---Возврат родительской директории или текущей директории, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		std::error_code ec;
		return fs::current_path(ec);
	}
	//------------------------------------------------------------
	//	Определение пути к внешнему инструменту
	//------------------------------------------------------------
	fs::path resolveToolPath(const std::string& arg) {

		if (arg.empty())
		{
			return {};
		}

		fs::path p(arg);

		//---Если путь относительный → формирование абсолютного пути относительно selfDir
		if (p.is_relative())
		{
			p = (selfDir() / p).lexically_normal();
		}
		return p;
	}
	//------------------------------------------------------------
	//	Папка журналов по умолчанию
	//------------------------------------------------------------
	fs::path defaultLogDir() {
		return platform::defaultLogDir();
	}
	//------------------------------------------------------------
	//	Файл журнала за текущие (локальные) сутки
	//------------------------------------------------------------
	fs::path dailyLogFile(const fs::path& logDir, const std::string& prefix) {

		const std::time_t now = std::time(nullptr);
		std::tm local{};
#ifdef _WIN32
		localtime_s(&local, &now);
#else
		localtime_r(&now, &local);
#endif
		std::ostringstream date;
		date << std::put_time(&local, "%Y-%m-%d");

		return dailyLogFile(logDir, prefix, date.str());
	}

	fs::path dailyLogFile(const fs::path& logDir, const std::string& prefix, const std::string& date) {
		return logDir / (prefix + "_" + date + ".log");
	}
	//------------------------------------------------------------
	//	Создание директории, если она не существует
	//------------------------------------------------------------
	bool createDirectory(const fs::path& dirPath, std::string* error)
	{
		std::error_code ec;

		//---Директория уже существует
		if (fs::is_directory(dirPath, ec)) return true;

		//---Создаем директорию
		fs::create_directories(dirPath, ec);
		if (ec)
		{
			if (error) *error = "Error creating directory " + dirPath.string() + ": " + ec.message();
			return false;
		}
		return true;
	}
} // namespace deploywrap
