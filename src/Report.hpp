#pragma once
#include <string>

class Logger;
struct RunStatistics;

std::string formatReport(const RunStatistics& stats);

// Итоговый отчёт сеанса, одной записью в лог
void generateReport(Logger& logger, const RunStatistics& stats);
