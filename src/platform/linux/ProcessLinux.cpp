#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace deploywrap::process::detail {

    //---Текст ошибки по errno
    static std::string errnoText(const char* what, int err)
    {
        return std::string(what) + ": " + std::strerror(err);
    }

    //---Ожидание дочернего процесса с повтором при EINTR
    static pid_t waitChild(pid_t pid, int* status)
    {
        pid_t r;
        do {
            r = ::waitpid(pid, status, 0);
        } while (r < 0 && errno == EINTR);
        return r;
    }

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---Канал для передачи errno из дочернего процесса, если exec не удался.
        //   При успешном exec канал закрывается (O_CLOEXEC) и родитель читает 0 байт
        int errPipe[2];
        if (::pipe2(errPipe, O_CLOEXEC) < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.message = errnoText("pipe2", errno);
            return false;
        }

        //---argv собираем до fork: в дочернем процессе только async-signal-safe вызовы
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        const std::string cwd = opt.workingDir.string();

        pid_t pid = ::fork();
        if (pid < 0)
        {
            const int err = errno;
            ::close(errPipe[0]);
            ::close(errPipe[1]);
            out.sysError = (std::uint32_t)err;
            out.message = errnoText("fork", err);
            return false;
        }

        if (pid == 0)
        {
            ::close(errPipe[0]);

            int err = 0;
            if (!cwd.empty() && ::chdir(cwd.c_str()) < 0)
            {
                err = errno;
            }
            else
            {
                ::execv(argv[0], argv.data());
                err = errno;
            }
            ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        ::close(errPipe[1]);

        //---Читаем errno дочернего процесса (если exec не удался)
        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(errPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        ::close(errPipe[0]);

        int status = 0;
        if (n == (ssize_t)sizeof(childErr))
        {
            //---Процесс не запустился: забираем зомби и сообщаем об ошибке
            (void)waitChild(pid, &status);
            out.sysError = (std::uint32_t)childErr;
            out.message = errnoText(("Failed to start " + exe.string()).c_str(), childErr);
            return false;
        }

        out.started = true;

        if (waitChild(pid, &status) < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.message = errnoText("waitpid", errno);
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

} // namespace deploywrap::process::detail
#endif
