#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

// Call once from main before any thread is started
void InitLogger();

#endif  // INCLUDE_RUNBOX_LOGGER_H_
