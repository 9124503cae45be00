#include "canvas/CanvasConfig.h"
#include "settings/CanvasSettingsManager.h"

CanvasConfig CanvasConfig::fromSettings(DrawMode mode)
{
    const auto &settings = CanvasSettingsManager::instance();

    CanvasConfig config;
    config.size = settings.loadCanvasSize();
    config.backgroundColor = settings.loadBackgroundColor();
    config.drawMode = mode;
    config.lineWidth = settings.loadLineWidth();
    config.lineColor = settings.loadLineColor();
    return config;
}
