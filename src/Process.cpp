#include "deploy_wrapper/Process.hpp"
#include "platform/ProcessImpl.hpp"

namespace deploywrap::process {

// Оболочка над платформенно-специфичной реализацией detail::runPlatform()
// (ProcessWin.cpp / ProcessLinux.cpp)
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        return detail::runPlatform(exe, args, out, opt);
    }

} // namespace deploywrap::process
