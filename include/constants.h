#pragma once

#include <stddef.h>
#include <stdint.h>

// Application
const char* const APP_NAME = "TiltMonitor";
const char* const APP_VERSION = "1.0.0";
const char* const DEFAULT_CONFIG_FILE = ".env";

// Serial link to the inclinometer (RS-485 adapter)
const unsigned int SERIAL_BAUD_RATE = 115200;
const size_t SERIAL_READ_CHUNK_SIZE = 256;

// Poll command: read 6 registers from 0x003D at address 0x50, CRC precomputed
const uint8_t READ_ANGLE_COMMAND[] = {0x50, 0x03, 0x00, 0x3D, 0x00, 0x06, 0x59, 0x85};
const size_t READ_ANGLE_COMMAND_SIZE = sizeof(READ_ANGLE_COMMAND);

// Response frame layout
const size_t FRAME_SIZE = 17;
const uint8_t FRAME_MAGIC[] = {0x50, 0x03, 0x0C};
const size_t FRAME_MAGIC_SIZE = sizeof(FRAME_MAGIC);
const size_t FRAME_CRC_OFFSET = 15;          // CRC covers bytes [0, 15)
const size_t FRAME_AXIS_X_OFFSET = 3;
const size_t FRAME_AXIS_Y_OFFSET = 7;
const size_t FRAME_AXIS_Z_OFFSET = 11;

// CRC16/Modbus
const uint16_t CRC16_MODBUS_POLY = 0xA001;
const uint16_t CRC16_MODBUS_INIT = 0xFFFF;

// Frame error reasons (also written to the daily log)
const char* const FRAME_ERROR_CRC = "CRC validation failed";
const char* const FRAME_ERROR_NO_FRAME = "No valid frame found";

// Delivery
const char* const PLACEHOLDER_DEVICE_ID = "tiltmeter_default";
const char* const BACKUP_RECORD_PREFIX = "$$$";
const char* const BACKUP_RECORD_SUFFIX = "###";
const char* const HTTP_USER_AGENT = "TiltMonitor/1.0";

// Daily log
const char* const DEFAULT_SENSOR_LOG_DIR = "../sensor_log";
const char* const SENSOR_LOG_PREFIX = "sensor_log_";
const char* const SENSOR_LOG_SUFFIX = ".json";

// Syslog Constants
const int SYSLOG_PORT = 514;                        // Standard syslog UDP port
const char* const SYSLOG_HOSTNAME = "TiltMonitor";  // Hostname for syslog messages
const char* const SYSLOG_TAG = "tiltmonitor";       // Application tag for syslog
const int SYSLOG_FACILITY = 16;                     // Local use facility (local0 = 16)

// System metric sources
const char* const CPU_TEMPERATURE_PATH = "/sys/class/thermal/thermal_zone0/temp";
const char* const CPU_VOLTAGE_COMMAND = "vcgencmd measure_volts core 2>/dev/null";
const char* const WIRELESS_STATUS_PATH = "/proc/net/wireless";
const char* const MEMINFO_PATH = "/proc/meminfo";
const char* const DISK_USAGE_PATH = "/";

// Monitoring intervals
const unsigned long STATUS_PUBLISH_INTERVAL_MS = 60000;  // 1 minute

// System States
enum SystemState {
    SYS_INITIALIZING,
    SYS_MONITORING,
    SYS_ERROR,
    SYS_STOPPING
};

const char* getSystemStateString(SystemState state);
