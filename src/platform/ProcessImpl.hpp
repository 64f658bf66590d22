#pragma once
#include "deploy_wrapper/Process.hpp"

namespace deploywrap::process::detail {

    // Platform-specific implementation (defined in ProcessWin.cpp / ProcessLinux.cpp)
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

} // namespace deploywrap::process::detail
