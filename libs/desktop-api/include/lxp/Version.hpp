#pragma once
#include <cstdint>
#include <limits>

namespace lxp {

constexpr uint16_t VERSION_MAJOR = 0;
constexpr uint16_t VERSION_MINOR = 3;
constexpr uint16_t VERSION_PATCH = 0;

constexpr const char* DEFAULT_APP_NAME = "Loxerpaper";

// freedesktop.org notification urgency hint values
constexpr uint8_t FDO_URGENCY_LOW = 0;
constexpr uint8_t FDO_URGENCY_NORMAL = 1;
constexpr uint8_t FDO_URGENCY_CRITICAL = 2;
constexpr int FDO_EXPIRE_DEFAULT = -1;

// QtDBus reply timeout for Notify; the server decides how long a call takes
constexpr int DBUS_CALL_NO_TIMEOUT = std::numeric_limits<int>::max();

// xdg-open exit statuses
constexpr int XDG_OPEN_SYNTAX_ERROR = 1;
constexpr int XDG_OPEN_FILE_MISSING = 2;
constexpr int XDG_OPEN_TOOL_MISSING = 3;
constexpr int XDG_OPEN_ACTION_FAILED = 4;

// Toasts longer than this use the "long" duration (~25 s on screen)
constexpr int TOAST_LONG_THRESHOLD_MS = 25000;

// Windows 8 is the first release with toast notifications
constexpr int TOAST_MIN_WINDOWS_MAJOR = 6;
constexpr int TOAST_MIN_WINDOWS_MINOR = 2;

// AUMID registered by every Windows install; used when no app identity is configured
constexpr const char* POWERSHELL_APP_ID =
    "{1AC14E77-02E7-4E5D-B744-2EB1AE5198B7}\\WindowsPowerShell\\v1.0\\powershell.exe";

} // namespace lxp
