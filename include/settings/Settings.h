#pragma once

#include <QSettings>

namespace SketchPad {

inline constexpr const char* kOrganizationName = "SketchPad";
inline constexpr const char* kApplicationName = "SketchPad";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace SketchPad
