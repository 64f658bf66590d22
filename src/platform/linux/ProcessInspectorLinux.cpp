#if defined(__linux__)

#include "deploy_wrapper/IProcessInspector.hpp"
#include "deploy_wrapper/ProcessName.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <glog/logging.h>

namespace deploywrap {

    namespace fs = std::filesystem;

    namespace {

        //---Имя записи /proc состоит только из цифр → это PID
        static bool isPidDir(const std::string& name)
        {
            if (name.empty()) return false;
            for (char c : name)
            {
                if (c < '0' || c > '9') return false;
            }
            return true;
        }

        //---Первая строка файла (comm)
        static std::string readFirstLine(const fs::path& p)
        {
            std::ifstream in(p);
            std::string line;
            if (in) std::getline(in, line);
            return line;
        }

        //---argv[0] из /proc/<pid>/cmdline (аргументы разделены '\0')
        static std::string readArgv0(const fs::path& p)
        {
            std::ifstream in(p, std::ios::binary);
            std::string arg0;
            if (in) std::getline(in, arg0, '\0');
            return arg0;
        }

        //---Проверка одного процесса: образ (exe), argv[0], затем comm
        static bool pidMatches(const fs::path& pidDir, const std::string& name)
        {
            std::error_code ec;
            const fs::path exe = fs::read_symlink(pidDir / "exe", ec);
            bool haveImage = !ec;
            if (haveImage && matchesProcessName(name, exe.filename().string())) return true;

            //---Ссылка exe недоступна без прав на чужие процессы → смотрим cmdline
            if (!haveImage)
            {
                const std::string arg0 = readArgv0(pidDir / "cmdline");
                haveImage = !arg0.empty();
                if (matchesProcessName(name, arg0)) return true;
            }

            //---Обрезанный comm сравниваем по префиксу только если полного имени образа нет
            return matchesCommName(name, readFirstLine(pidDir / "comm"), !haveImage);
        }
    }

    //---Проверка запущенных процессов через /proc
    class ProcfsProcessInspector final : public IProcessInspector {
    public:
        bool isRunning(const std::string& processName) const override
        {
            const std::string name = normalizeProcessName(processName);
            if (name.empty()) return false;

            std::error_code ec;
            fs::directory_iterator it("/proc", ec);
            if (ec)
            {
                LOG(WARNING) << "Failed to enumerate /proc: " << ec.message() << ". Treating '" << name << "' as not running";
                return false;
            }

            for (; it != fs::directory_iterator(); it.increment(ec))
            {
                const std::string entry = it->path().filename().string();
                if (!isPidDir(entry)) continue;

                //---Процесс мог завершиться во время обхода: ошибки чтения просто дают "нет совпадения"
                if (pidMatches(it->path(), name))
                {
                    LOG(INFO) << "Process '" << name << "' is running (pid " << entry << ")";
                    return true;
                }
            }
            if (ec)
            {
                LOG(WARNING) << "Error while enumerating /proc: " << ec.message();
            }
            return false;
        }
    };

} // namespace deploywrap

namespace deploywrap::platform {

    //---Фабричная функция для создания инспектора процессов Linux
    std::unique_ptr<IProcessInspector> makeProcessInspector()
    {
        return std::make_unique<deploywrap::ProcfsProcessInspector>();
    }

} // namespace deploywrap::platform

#endif // __linux__
