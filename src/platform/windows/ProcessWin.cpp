#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include <windows.h>
#include <string_view>
#include <system_error>
#include <vector>
#include <glog/logging.h>

namespace deploywrap::process::detail {

	//--- Преобразование строки UTF-8 в широкую строку (UTF-16) для Windows API
    static std::wstring utf8ToWide(const std::string& s)
    {
        //---Проверка на пустую строку
        if (s.empty()) return {};
        //---Выходной буфер пустой. получаем требуемое число wide-символов
        int n = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), nullptr, 0);
        if (n <= 0)
        {
            LOG(ERROR) << "Failed to convert argument from UTF-8: " << s;
            return {};
        }
        //---Инициализируем широкую строку символами \0
        std::wstring w((size_t)n, L'\0');
        //---Пишем широкие символы
        MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.c_str(), (int)s.size(), w.data(), n);
        return w;
    }

    //---Quoting аргумента под CreateProcess (правило backslashes+quotes)
    static std::wstring quoteWindowsArg(std::wstring_view arg)
    {
        //---Кавычки нужны если пустой аргумент, есть пробелы, табуляции, переводы строк или кавычки
        const bool needQuotes =
            arg.empty() || (arg.find_first_of(L" \t\n\v\"") != std::wstring_view::npos);

        //---Если кавычки не нужны, аргумент идёт как есть
        if (!needQuotes) return std::wstring(arg);

        //---Резервируем память (аргумент + 2 кавычки)
        std::wstring out;
        out.reserve(arg.size() + 2);
        out.push_back(L'"');                // открывающая кавычка

        //---Счетчик последовательных обратных слешей
        std::size_t bsCount = 0;
        for (wchar_t ch : arg)
        {
            //---Обратный слеш
            if (ch == L'\\')
            {
                ++bsCount;                  // считаем слеши подряд
                out.push_back(L'\\');       // слеш копируем как есть
                continue;
            }
            //---Кавычка
            if (ch == L'"')
            {
                //--удвоить backslash'и перед кавычкой и экранировать кавычку
                out.append(bsCount, L'\\'); // удваиваем слеши перед кавычкой
                bsCount = 0;                // сбрасываем счетчик
                out.push_back(L'\\');       // экранирующий слеш
                out.push_back(L'"');        // сама кавычка
                continue;
            }
            //---Любой другой символ
            bsCount = 0;                    // слеши перед ним не особые
            out.push_back(ch);
        }

        //---Закрывающая кавычка
        out.append(bsCount, L'\\');         // удваиваем слеши перед закрывающей кавычкой
        out.push_back(L'"');                // закрывающая кавычка
        return out;
    }
	//---Построение командной строки для CreateProcess
    static std::wstring buildCommandLine(const fs::path& exe, const std::vector<std::string>& args)
    {
        std::wstring cmd = quoteWindowsArg(exe.wstring());
        for (const auto& a : args)
        {
            cmd.push_back(L' ');
            cmd += quoteWindowsArg(utf8ToWide(a));
        }
        return cmd;
    }
    //---Заполнение ошибки по GetLastError()
    static bool failWith(RunResult& out, const char* what, const fs::path& exe)
    {
        out.sysError = GetLastError();
        out.message = std::string(what) + " (" + exe.string() + "): " +
            std::system_category().message((int)out.sysError);
        return false;
    }
	//---Платформенно-специфичная реализация запуска процесса для Windows
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args, RunResult& out, const RunOptions& opt)
    {
        out = {};

        const std::wstring cmdLine = buildCommandLine(exe, args);

        STARTUPINFOW si{};
        si.cb = sizeof(si);

        PROCESS_INFORMATION pi{};

        //---CreateProcessW может менять буфер командной строки
        std::vector<wchar_t> buf(cmdLine.begin(), cmdLine.end());
        buf.push_back(L'\0');

        const std::wstring cwdW = opt.workingDir.empty() ? L"" : opt.workingDir.wstring();
        const wchar_t* cwdPtr = opt.workingDir.empty() ? nullptr : cwdW.c_str();

        //---Создание процесса
        BOOL ok = CreateProcessW(
            exe.wstring().c_str(), // Имя исполняемого файла
            buf.data(),            // Командная строка (mutable)
            nullptr, nullptr,      // Атрибуты безопасности
            FALSE,                 // Без наследования дескрипторов
            0,                     // ServiceUI сам создаёт окно в сессии пользователя
            nullptr,               // Переменные окружения (наследовать от родителя)
            cwdPtr,                // Рабочая директория (nullptr = текущая директория)
            &si,
            &pi
        );

        if (!ok) return failWith(out, "CreateProcessW failed", exe);

        out.started = true;
        CloseHandle(pi.hThread);

        //---Ждём завершения без таймаута
        if (WaitForSingleObject(pi.hProcess, INFINITE) == WAIT_FAILED)
        {
            failWith(out, "WaitForSingleObject failed", exe);
            CloseHandle(pi.hProcess);
            return false;
        }

        DWORD code = 0;
        if (!GetExitCodeProcess(pi.hProcess, &code))
        {
            failWith(out, "GetExitCodeProcess failed", exe);
            CloseHandle(pi.hProcess);
            return false;
        }

        CloseHandle(pi.hProcess);
        out.exitCode = (int)code;
        return true;
    }

} // namespace deploywrap::process::detail
#endif
