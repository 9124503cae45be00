#include <QApplication>

#include "canvas/CanvasPanel.h"
#include "settings/Settings.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(SketchPad::kApplicationName);
    app.setOrganizationName(SketchPad::kOrganizationName);
    app.setApplicationVersion("1.0.0");

    CanvasPanel panel;
    panel.setWindowTitle(QStringLiteral("SketchPad"));
    panel.addDrawCanvas(DrawMode::Freehand);
    panel.addDrawCanvas(DrawMode::Polyline);
    panel.addShapeCanvas();
    panel.show();
    panel.setFocus();

    return app.exec();
}
