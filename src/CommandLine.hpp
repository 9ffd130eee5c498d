#pragma once

#include <string>
#include <vector>
#include "CommonTypes.hpp"

// Разбивает строку команды на аргументы по правилам POSIX shell
// (кавычки и обратный слэш, без подстановок). false при незакрытой кавычке
// или висящем '\'.
bool splitCommand(const std::string& cmdline, std::vector<std::string>& out, std::string& err);

// --command=... --logfile=... [--restart] [--timeout=N] [debug]
// Форма "--key value" тоже принимается.
bool parseArgs(int argc, char* argv[], ProcessConfig& config, std::string& err);

void printUsage(const char* prog);
