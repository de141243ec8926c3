#ifndef INCLUDE_SCRIPTBOX_LOGGER_H_
#define INCLUDE_SCRIPTBOX_LOGGER_H_

// Make the default logger safe to use across fork(); call once before spawning any worker
void InitLogger();

#endif  // INCLUDE_SCRIPTBOX_LOGGER_H_
