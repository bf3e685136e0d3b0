#pragma once

#define QTRAJ_VERSION_MAJOR 0
#define QTRAJ_VERSION_MINOR 1
#define QTRAJ_VERSION_PATCH 0
#define QTRAJ_VERSION_STRING "0.1.0"

namespace qtraj {

inline const char* version() noexcept { return QTRAJ_VERSION_STRING; }

} // namespace qtraj
