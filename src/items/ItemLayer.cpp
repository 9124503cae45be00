#include "items/ItemLayer.h"
#include "items/LineSegmentItem.h"
#include "items/ShapeItem.h"
#include "items/TextLabelItem.h"

#include <QDebug>
#include <QTimer>
#include <algorithm>
#include <limits>

ItemLayer::ItemLayer(QObject *parent)
    : QObject(parent)
{
}

ItemLayer::~ItemLayer() = default;

ItemId ItemLayer::insert(std::unique_ptr<CanvasItem> item)
{
    ItemId id = m_nextId++;
    m_items.push_back({id, std::move(item)});
    emit changed();
    return id;
}

std::vector<ItemLayer::Entry>::iterator ItemLayer::find(ItemId id)
{
    return std::find_if(m_items.begin(), m_items.end(),
        [id](const Entry &entry) { return entry.id == id; });
}

std::vector<ItemLayer::Entry>::const_iterator ItemLayer::find(ItemId id) const
{
    return std::find_if(m_items.cbegin(), m_items.cend(),
        [id](const Entry &entry) { return entry.id == id; });
}

CanvasItem* ItemLayer::item(ItemId id)
{
    auto it = find(id);
    return it != m_items.end() ? it->item.get() : nullptr;
}

const CanvasItem* ItemLayer::item(ItemId id) const
{
    auto it = find(id);
    return it != m_items.cend() ? it->item.get() : nullptr;
}

ItemId ItemLayer::createLine(const QPointF &from, const QPointF &to,
                             const QColor &color, int width)
{
    return insert(std::make_unique<LineSegmentItem>(from, to, color, width));
}

ItemId ItemLayer::createShape(ShapeKind kind, const QRectF &bounds,
                              const QColor &outline, int width)
{
    return insert(std::make_unique<ShapeItem>(kind, bounds, outline, width));
}

bool ItemLayer::deleteItem(ItemId id)
{
    auto it = find(id);
    if (it == m_items.end()) {
        return false;
    }
    m_items.erase(it);

    for (auto tagIt = m_textTags.begin(); tagIt != m_textTags.end(); ++tagIt) {
        if (tagIt->second == id) {
            m_textTags.erase(tagIt);
            break;
        }
    }

    emit changed();
    return true;
}

bool ItemLayer::contains(ItemId id) const
{
    return find(id) != m_items.cend();
}

QVector<ItemId> ItemLayer::allItems() const
{
    QVector<ItemId> ids;
    ids.reserve(static_cast<int>(m_items.size()));
    for (const auto &entry : m_items) {
        ids.append(entry.id);
    }
    return ids;
}

bool ItemLayer::moveItem(ItemId id, const QPointF &delta)
{
    CanvasItem *target = item(id);
    if (!target) {
        return false;
    }
    target->translate(delta);
    emit changed();
    return true;
}

bool ItemLayer::setItemRect(ItemId id, const QRectF &rect)
{
    CanvasItem *target = item(id);
    if (!target || !target->setRect(rect)) {
        return false;
    }
    emit changed();
    return true;
}

QRectF ItemLayer::itemRect(ItemId id) const
{
    const CanvasItem *target = item(id);
    if (!target) {
        return QRectF();
    }
    if (auto *shape = dynamic_cast<const ShapeItem*>(target)) {
        return shape->rect();
    }
    return target->boundingRect();
}

bool ItemLayer::scaleItem(ItemId id, const QPointF &anchor, qreal factor)
{
    CanvasItem *target = item(id);
    if (!target) {
        return false;
    }
    target->scale(anchor, factor);
    emit changed();
    return true;
}

bool ItemLayer::setOutlineColor(ItemId id, const QColor &color)
{
    CanvasItem *target = item(id);
    if (!target) {
        return false;
    }
    target->setOutlineColor(color);
    emit changed();
    return true;
}

QColor ItemLayer::outlineColor(ItemId id) const
{
    const CanvasItem *target = item(id);
    return target ? target->outlineColor() : QColor();
}

bool ItemLayer::setFillColor(ItemId id, const QColor &color)
{
    CanvasItem *target = item(id);
    if (!target) {
        return false;
    }
    target->setFillColor(color);
    emit changed();
    return true;
}

QColor ItemLayer::fillColor(ItemId id) const
{
    const CanvasItem *target = item(id);
    return target ? target->fillColor() : QColor();
}

std::optional<ItemId> ItemLayer::findClosest(const QPointF &pos, qreal halo) const
{
    std::optional<ItemId> best;
    qreal bestDistance = std::numeric_limits<qreal>::max();

    // Walk from the top so the topmost item wins a tie
    for (auto it = m_items.crbegin(); it != m_items.crend(); ++it) {
        if (!it->item->isHittable()) {
            continue;
        }
        qreal distance = it->item->distanceTo(pos);
        if (distance <= halo && distance < bestDistance) {
            bestDistance = distance;
            best = it->id;
        }
    }
    return best;
}

void ItemLayer::showText(const QString &tag, const QPointF &pos, const QString &text,
                         const QColor &color, Qt::Alignment alignment)
{
    removeText(tag);
    ItemId id = insert(std::make_unique<TextLabelItem>(pos, text, color, alignment));
    m_textTags[tag] = id;
}

void ItemLayer::removeText(const QString &tag)
{
    auto it = m_textTags.find(tag);
    if (it == m_textTags.end()) {
        return;
    }
    ItemId id = it->second;
    m_textTags.erase(it);
    deleteItem(id);
}

QString ItemLayer::text(const QString &tag) const
{
    auto it = m_textTags.find(tag);
    if (it == m_textTags.end()) {
        return QString();
    }
    auto *label = dynamic_cast<const TextLabelItem*>(item(it->second));
    return label ? label->text() : QString();
}

void ItemLayer::scheduleOnce(int delayMs, std::function<void()> callback)
{
    if (!callback) {
        return;
    }
    // Bound to this layer: never fires once the layer is gone
    QTimer::singleShot(delayMs, this, std::move(callback));
}

void ItemLayer::draw(QPainter &painter) const
{
    for (const auto &entry : m_items) {
        entry.item->draw(painter);
    }
}
