#ifndef INCLUDE_SCRIPTBOX_UTILS_H_
#define INCLUDE_SCRIPTBOX_UTILS_H_

#include <string>

#include "execution.h"

long GetUniqueExecutionId();

const char* ExecutionStatusName(ExecutionStatus);
const char* CallOutcomeName(CallOutcome);

#endif  // INCLUDE_SCRIPTBOX_UTILS_H_
