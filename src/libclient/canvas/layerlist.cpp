// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/layerlist.h"
#include <QDebug>
#include <QLoggingCategory>
#include <QUuid>

Q_DECLARE_LOGGING_CATEGORY(lcIbCanvas)

namespace canvas {

LayerListItem LayerListItem::makeDefault()
{
	LayerListItem item;
	item.id = DEFAULT_LAYER_ID;
	item.name = QStringLiteral("Layer 1");
	return item;
}

LayerListModel::LayerListModel(QObject *parent)
	: QAbstractListModel(parent)
	, m_items{LayerListItem::makeDefault()}
	, m_activeLayerId(DEFAULT_LAYER_ID)
{
}

int LayerListModel::rowCount(const QModelIndex &parent) const
{
	if(parent.isValid())
		return 0;
	return m_items.size();
}

QVariant LayerListModel::data(const QModelIndex &index, int role) const
{
	if(!index.isValid() || index.row() < 0 || index.row() >= m_items.size()) {
		return QVariant();
	}

	const LayerListItem &item = m_items.at(index.row());
	switch(role) {
	case Qt::DisplayRole:
	case NameRole:
		return item.name;
	case IdRole:
		return item.id;
	case IsVisibleRole:
		return item.visible;
	case IsLockedRole:
		return item.locked;
	case OpacityRole:
		return item.opacity;
	case ZIndexRole:
		return item.zIndex;
	case IsActiveRole:
		return item.id == m_activeLayerId;
	}

	return QVariant();
}

QHash<int, QByteArray> LayerListModel::roleNames() const
{
	QHash<int, QByteArray> roles;
	roles[IdRole] = "id";
	roles[NameRole] = "name";
	roles[IsVisibleRole] = "visible";
	roles[IsLockedRole] = "locked";
	roles[OpacityRole] = "opacity";
	roles[ZIndexRole] = "zIndex";
	roles[IsActiveRole] = "active";
	return roles;
}

int LayerListModel::layerRow(const QString &id) const
{
	for(int i = 0; i < m_items.size(); ++i) {
		if(m_items.at(i).id == id) {
			return i;
		}
	}
	return -1;
}

const LayerListItem *LayerListModel::layer(const QString &id) const
{
	int row = layerRow(id);
	return row < 0 ? nullptr : &m_items.at(row);
}

bool LayerListModel::setActiveLayer(const QString &id)
{
	int row = layerRow(id);
	if(row < 0) {
		qCWarning(lcIbCanvas, "Can't activate unknown layer %s",
			qUtf8Printable(id));
		return false;
	}

	if(id != m_activeLayerId) {
		int oldRow = layerRow(m_activeLayerId);
		m_activeLayerId = id;
		if(oldRow >= 0) {
			emitRowChanged(oldRow);
		}
		emitRowChanged(row);
		emit activeLayerChanged(id);
	}
	return true;
}

QSet<QString> LayerListModel::visibleLayerIds() const
{
	QSet<QString> ids;
	for(const LayerListItem &item : m_items) {
		if(item.visible) {
			ids.insert(item.id);
		}
	}
	return ids;
}

qreal LayerListModel::opacityOf(const QString &id) const
{
	const LayerListItem *item = layer(id);
	return item ? item->opacity : 1.0;
}

int LayerListModel::zIndexOf(const QString &id) const
{
	const LayerListItem *item = layer(id);
	return item ? item->zIndex : 0;
}

bool LayerListModel::isLocked(const QString &id) const
{
	const LayerListItem *item = layer(id);
	return item && item->locked;
}

QVector<Stroke>
LayerListModel::filterForRender(const QVector<Stroke> &strokes) const
{
	QSet<QString> visible = visibleLayerIds();
	QVector<Stroke> result;
	for(const Stroke &s : strokes) {
		if(visible.contains(s.layerId)) {
			result.append(s);
		}
	}
	return result;
}

QVector<CanvasObject>
LayerListModel::filterForRender(const QVector<CanvasObject> &objects) const
{
	QSet<QString> visible = visibleLayerIds();
	QVector<CanvasObject> result;
	for(const CanvasObject &o : objects) {
		if(visible.contains(o.layerId)) {
			result.append(o);
		}
	}
	return result;
}

bool LayerListModel::reorder(int oldIndex, int newIndex)
{
	int count = m_items.size();
	if(oldIndex < 0 || oldIndex >= count || newIndex < 0 || newIndex > count) {
		qCWarning(lcIbCanvas, "Layer move %d -> %d out of range", oldIndex,
			newIndex);
		return false;
	}

	// Moving onto itself or just below itself doesn't change anything
	if(newIndex == oldIndex || newIndex == oldIndex + 1) {
		return true;
	}

	beginMoveRows(QModelIndex(), oldIndex, oldIndex, QModelIndex(), newIndex);
	LayerListItem item = m_items.takeAt(oldIndex);
	m_items.insert(newIndex > oldIndex ? newIndex - 1 : newIndex, item);
	endMoveRows();

	renumber();
	return true;
}

QString LayerListModel::addLayer()
{
	LayerListItem item;
	item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
	item.name = QStringLiteral("Layer %1").arg(m_items.size() + 1);

	int maxZ = -1;
	for(const LayerListItem &i : m_items) {
		maxZ = qMax(maxZ, i.zIndex);
	}
	item.zIndex = maxZ + 1;

	beginInsertRows(QModelIndex(), 0, 0);
	m_items.prepend(item);
	endInsertRows();

	setActiveLayer(item.id);
	return item.id;
}

bool LayerListModel::deleteLayer(const QString &id)
{
	int row = layerRow(id);
	if(row < 0) {
		qCWarning(lcIbCanvas, "Can't delete unknown layer %s",
			qUtf8Printable(id));
		return false;
	}

	if(m_items.size() <= 1) {
		qCDebug(lcIbCanvas, "Not deleting the last layer");
		return false;
	}

	beginRemoveRows(QModelIndex(), row, row);
	m_items.removeAt(row);
	endRemoveRows();

	emit layerDeleted(id);

	if(m_activeLayerId == id) {
		setActiveLayer(m_items.first().id);
	}
	return true;
}

bool LayerListModel::renameLayer(const QString &id, const QString &name)
{
	int row = layerRow(id);
	if(row < 0) {
		return false;
	}
	m_items[row].name = name;
	emitRowChanged(row);
	return true;
}

bool LayerListModel::setLayerVisible(const QString &id, bool visible)
{
	int row = layerRow(id);
	if(row < 0) {
		return false;
	}
	m_items[row].visible = visible;
	emitRowChanged(row);
	return true;
}

bool LayerListModel::setLayerLocked(const QString &id, bool locked)
{
	int row = layerRow(id);
	if(row < 0) {
		return false;
	}
	m_items[row].locked = locked;
	emitRowChanged(row);
	return true;
}

bool LayerListModel::setLayerOpacity(const QString &id, qreal opacity)
{
	int row = layerRow(id);
	if(row < 0) {
		return false;
	}
	m_items[row].opacity = qBound(0.0, opacity, 1.0);
	emitRowChanged(row);
	return true;
}

void LayerListModel::reset()
{
	beginResetModel();
	m_items = {LayerListItem::makeDefault()};
	endResetModel();

	if(m_activeLayerId != DEFAULT_LAYER_ID) {
		m_activeLayerId = DEFAULT_LAYER_ID;
		emit activeLayerChanged(m_activeLayerId);
	}
}

void LayerListModel::renumber()
{
	int count = m_items.size();
	for(int i = 0; i < count; ++i) {
		m_items[i].zIndex = count - 1 - i;
	}
	emit dataChanged(index(0), index(count - 1), {ZIndexRole});
}

void LayerListModel::emitRowChanged(int row)
{
	QModelIndex idx = index(row);
	emit dataChanged(idx, idx);
}

}
