#ifndef INCLUDE_SQLJUDGE_LOGGER_H_
#define INCLUDE_SQLJUDGE_LOGGER_H_

// Keep console sink mutexes consistent across fork()
void InitLogger();

#endif  // INCLUDE_SQLJUDGE_LOGGER_H_
