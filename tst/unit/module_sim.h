//
// Simulate the Valkey Module Environment
//
#ifndef VALKEYDAGSELMODULE_TST_UNIT_MODULE_SIM_H_
#define VALKEYDAGSELMODULE_TST_UNIT_MODULE_SIM_H_

#include <cstddef>
#include <string>

extern size_t malloced;     // Total currently allocated memory
void setupValkeyModulePointers();
std::string test_getLogText();

// Pretend the wall clock moved forward by delta milliseconds
void test_advanceMilliseconds(long long delta);

#endif  // VALKEYDAGSELMODULE_TST_UNIT_MODULE_SIM_H_
