#include "ExternalCommand.hpp"

#include <cstdlib>
#include <filesystem>
#if !defined(_WIN32)
#include <sys/wait.h>
#endif

std::string shell_quote(const std::string& arg)
{
    if(!arg.empty() && arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=./:,@%") == std::string::npos)
    {
        return arg;
    }

    std::string quoted = "'";
    for(const char c : arg)
    {
        if(c == '\''){quoted += "'\\''";}
        else{quoted += c;}
    }
    quoted += "'";
    return quoted;
}

std::string build_command_line(const std::vector<std::string>& args)
{
    std::string cmd;
    for(size_t i = 0; i < args.size(); ++i)
    {
        if(i){cmd += ' ';}
        cmd += shell_quote(args.at(i));
    }
    return cmd;
}

void run_command(const std::vector<std::string>& args, const std::string& logFile)
{
    if(args.empty())
    {
        throw StageError("Can not run an empty command");
    }

    std::string cmd = build_command_line(args);
    if(!logFile.empty())
    {
        std::filesystem::path logPath(logFile);
        if(logPath.has_parent_path()){std::filesystem::create_directories(logPath.parent_path());}
        cmd += " >> " + shell_quote(logFile) + " 2>&1";
    }

    int ret = std::system(cmd.c_str());
    if(ret == -1)
    {
        throw ExternalToolError(args.front(), ret, logFile);
    }
    int exitCode = ret;
#if !defined(_WIN32)
    if(WIFEXITED(ret))
    {
        exitCode = WEXITSTATUS(ret);
    }
    else if(WIFSIGNALED(ret))
    {
        exitCode = 128 + WTERMSIG(ret);
    }
#endif
    if(exitCode != 0)
    {
        throw ExternalToolError(args.front(), exitCode, logFile);
    }
}
