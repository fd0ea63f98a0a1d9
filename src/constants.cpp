#include "constants.h"

const char* getSystemStateString(SystemState state) {
    switch (state) {
        case SYS_INITIALIZING: return "INITIALIZING";
        case SYS_MONITORING: return "MONITORING";
        case SYS_ERROR: return "ERROR";
        case SYS_STOPPING: return "STOPPING";
        default: return "UNKNOWN";
    }
}
