#include "deploy_wrapper/Logging.hpp"
#include "deploy_wrapper/Paths.hpp"

#include <string>
#include <glog/logging.h>

namespace deploywrap {

	//------------------------------------------------------------
	//	Инициализация логгера
	//------------------------------------------------------------
	std::filesystem::path initLogging(const char* programName, const WrapperConfig& config) {

		//---Файл журнала за текущие сутки
		const fs::path logFile = dailyLogFile(config.logDir, config.logFilePrefix);

		//---Создание директории для логов
		std::string dirError;
		const bool haveDir = !config.logDir.empty() && createDirectory(config.logDir, &dirError);

		//---Имя файла без метки времени и PID: повторные запуски за сутки дописывают один файл
		FLAGS_timestamp_in_logfile_name = false;
		google::SetLogFilenameExtension(".log");

		//---Без папки журналов пишем только в stderr
		FLAGS_logtostderr = !haveDir;
		if (haveDir)
		{
			//---INFO-файл получает сообщения всех уровней; отдельные файлы для остальных уровней не нужны
			google::SetLogDestination(google::GLOG_INFO, (logFile.parent_path() / logFile.stem()).string().c_str());
			google::SetLogSymlink(google::GLOG_INFO, "");
		}
		google::SetLogDestination(google::GLOG_WARNING, "");
		google::SetLogDestination(google::GLOG_ERROR, "");
		google::SetLogDestination(google::GLOG_FATAL, "");

		if (!google::IsGoogleLoggingInitialized()) google::InitGoogleLogging(programName);

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = true;
		FLAGS_colorlogtostderr = true;

		if (!haveDir)
		{
			LOG(WARNING) << (dirError.empty() ? "Log directory is not configured" : dirError)
				<< ". Logging to stderr only";
			return {};
		}
		return logFile;
	}
	//------------------------------------------------------------
	//	Завершение логгера
	//------------------------------------------------------------
	void shutdownLogging() {
		if (!google::IsGoogleLoggingInitialized()) return;
		google::FlushLogFiles(google::GLOG_INFO);
		google::ShutdownGoogleLogging();
	}

}; //---namespace deploywrap
