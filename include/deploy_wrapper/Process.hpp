#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace deploywrap::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        fs::path workingDir;          // Рабочий каталог для запускаемого процесса (опционально)
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс (true - да, false - ошибка запуска)
        int exitCode = 0;             // Код завершения процесса (128 + сигнал на Linux)
        std::uint32_t sysError = 0;   // Код системной ошибки (GetLastError() на Windows или errno на Linux)
        std::string message;          // Текст ошибки запуска/ожидания
    };
    //---Запускает внешний процесс и ждёт его завершения
    // 
    // Параметры:
    //   exe - путь к исполняемому файлу
    //   args - аргументы командной строки для передачи процессу
    //   out - структура для записи результатов выполнения (передается по ссылке)
    //   opt - опции запуска процесса (по умолчанию пустые)
    // Возвращает:
    //   true - если процесс успешно запущен и завершился (независимо от exitCode)
    //   false - если процесс не удалось запустить или дождаться
    // Примечание:
    //   Функция блокирующая, таймаута нет
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

} // namespace deploywrap::process
