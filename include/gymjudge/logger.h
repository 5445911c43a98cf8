#ifndef INCLUDE_GYMJUDGE_LOGGER_H_
#define INCLUDE_GYMJUDGE_LOGGER_H_

// Must be called before any thread forks a sandbox
void InitLogger();

#endif  // INCLUDE_GYMJUDGE_LOGGER_H_
