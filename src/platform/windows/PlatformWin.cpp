#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <shlobj.h>

namespace deploywrap::platform {

	//---Получение пути к собственному исполняемому файлу
    fs::path selfExePath()
    {
        wchar_t buf[MAX_PATH]{};
        DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
        if (n == 0 || n >= MAX_PATH) return {};
        return fs::path(buf);
    }

	//---Папка журналов Intune Management Extension в ProgramData
    fs::path defaultLogDir()
    {
        PWSTR wpath = nullptr;
        HRESULT hr = SHGetKnownFolderPath(FOLDERID_ProgramData, 0, nullptr, &wpath);
        if (FAILED(hr) || !wpath)
        {
            CoTaskMemFree(wpath);
            return fs::path(L"C:\\ProgramData\\Microsoft\\IntuneManagementExtension\\Logs");
        }
        fs::path base(wpath);
        CoTaskMemFree(wpath);
        return base / L"Microsoft" / L"IntuneManagementExtension" / L"Logs";
    }

} // namespace deploywrap::platform
#endif
