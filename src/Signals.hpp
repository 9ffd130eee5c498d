#pragma once
#include <string>

// SIGINT/SIGTERM только запоминаются; цикл мониторинга проверяет их сам.
bool installSignalHandlers(std::string& err);

// Номер последнего полученного сигнала или 0
int pendingSignal();

// Забывает полученный сигнал
void clearPendingSignal();
