#ifndef INCLUDE_JUDGEBOX_LOGGER_H_
#define INCLUDE_JUDGEBOX_LOGGER_H_

// Must be called before any runner forks; keeps the console sink mutex consistent across fork
void InitLogger();
// 0 = warn, 1 = info, 2+ = debug
void SetVerbosity(int verbosity);

#endif  // INCLUDE_JUDGEBOX_LOGGER_H_
