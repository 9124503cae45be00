#ifndef ITEMLAYER_H
#define ITEMLAYER_H

#include <QObject>
#include <QPainter>
#include <QPointF>
#include <QRectF>
#include <map>
#include <memory>
#include <vector>

#include "canvas/IDrawingSurface.h"
#include "items/CanvasItem.h"

// Retained-mode item store backing one canvas
class ItemLayer : public QObject, public IDrawingSurface
{
    Q_OBJECT

public:
    explicit ItemLayer(QObject *parent = nullptr);
    ~ItemLayer() override;

    // IDrawingSurface
    ItemId createLine(const QPointF &from, const QPointF &to,
                      const QColor &color, int width) override;
    ItemId createShape(ShapeKind kind, const QRectF &bounds,
                       const QColor &outline, int width) override;
    bool deleteItem(ItemId id) override;
    bool contains(ItemId id) const override;
    QVector<ItemId> allItems() const override;
    bool moveItem(ItemId id, const QPointF &delta) override;
    bool setItemRect(ItemId id, const QRectF &rect) override;
    QRectF itemRect(ItemId id) const override;
    bool scaleItem(ItemId id, const QPointF &anchor, qreal factor) override;
    bool setOutlineColor(ItemId id, const QColor &color) override;
    QColor outlineColor(ItemId id) const override;
    bool setFillColor(ItemId id, const QColor &color) override;
    QColor fillColor(ItemId id) const override;
    std::optional<ItemId> findClosest(const QPointF &pos, qreal halo) const override;
    void showText(const QString &tag, const QPointF &pos, const QString &text,
                  const QColor &color, Qt::Alignment alignment = Qt::AlignCenter) override;
    void removeText(const QString &tag) override;
    QString text(const QString &tag) const override;
    void scheduleOnce(int delayMs, std::function<void()> callback) override;

    void draw(QPainter &painter) const;

    bool isEmpty() const { return m_items.empty(); }
    size_t itemCount() const { return m_items.size(); }
    CanvasItem* item(ItemId id);
    const CanvasItem* item(ItemId id) const;

signals:
    void changed();

private:
    struct Entry {
        ItemId id;
        std::unique_ptr<CanvasItem> item;
    };

    ItemId insert(std::unique_ptr<CanvasItem> item);
    std::vector<Entry>::iterator find(ItemId id);
    std::vector<Entry>::const_iterator find(ItemId id) const;

    // Stacking order: later entries are drawn on top
    std::vector<Entry> m_items;
    std::map<QString, ItemId> m_textTags;
    ItemId m_nextId = 1;
};

#endif // ITEMLAYER_H
