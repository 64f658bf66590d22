#ifdef _WIN32

#include "deploy_wrapper/IProcessInspector.hpp"
#include "deploy_wrapper/ProcessName.hpp"

#include <windows.h>
#include <tlhelp32.h>
#include <memory>
#include <string>
#include <glog/logging.h>

namespace deploywrap {

    namespace {

        //---Имя образа из PROCESSENTRY32W в UTF-8
        static std::string wideToUtf8(const wchar_t* w)
        {
            const int n = WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
            if (n <= 1) return {};
            std::string s((size_t)n, '\0');
            WideCharToMultiByte(CP_UTF8, 0, w, -1, s.data(), n, nullptr, nullptr);
            s.resize((size_t)n - 1);
            return s;
        }
    }

    //---Проверка запущенных процессов через снимок Toolhelp32
    class ToolhelpProcessInspector final : public IProcessInspector {
    public:
        bool isRunning(const std::string& processName) const override
        {
            const std::string name = normalizeProcessName(processName);
            if (name.empty()) return false;

            HANDLE hSnapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
            if (hSnapshot == INVALID_HANDLE_VALUE)
            {
                LOG(WARNING) << "CreateToolhelp32Snapshot failed with error " << GetLastError()
                    << ". Treating '" << name << "' as not running";
                return false;
            }

            PROCESSENTRY32W pe;
            ZeroMemory(&pe, sizeof(pe));
            pe.dwSize = sizeof(pe);

            bool found = false;
            for (BOOL ok = Process32FirstW(hSnapshot, &pe); ok; ok = Process32NextW(hSnapshot, &pe))
            {
                if (matchesProcessName(name, wideToUtf8(pe.szExeFile)))
                {
                    LOG(INFO) << "Process '" << name << "' is running (pid " << pe.th32ProcessID << ")";
                    found = true;
                    break;
                }
            }

            CloseHandle(hSnapshot);
            return found;
        }
    };

} // namespace deploywrap

namespace deploywrap::platform {

    //---Фабричная функция для создания инспектора процессов Windows
    std::unique_ptr<IProcessInspector> makeProcessInspector()
    {
        return std::make_unique<deploywrap::ToolhelpProcessInspector>();
    }

} // namespace deploywrap::platform

#endif // _WIN32
