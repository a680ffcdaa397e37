// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/cursorlist.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/canvas/userlist.h"
#include <QLoggingCategory>
#include <QSet>
#include <algorithm>

Q_LOGGING_CATEGORY(lcIbCanvas, "net.inkboard.canvas", QtWarningMsg)

namespace canvas {

CanvasModel::CanvasModel(QObject *parent)
	: QObject(parent)
	, m_layerlist(new LayerListModel(this))
	, m_cursors(new CursorListModel(this))
	, m_userlist(new UserListModel(this))
{
	connect(
		m_layerlist, &LayerListModel::layerDeleted, this,
		&CanvasModel::purgeLayer);
}

const Stroke *CanvasModel::stroke(const QString &id) const
{
	int i = strokeIndex(id);
	return i < 0 ? nullptr : &m_strokes.at(i);
}

const CanvasObject *CanvasModel::object(const QString &id) const
{
	int i = objectIndex(id);
	return i < 0 ? nullptr : &m_objects.at(i);
}

int CanvasModel::objectIndex(const QString &id) const
{
	for(int i = 0; i < m_objects.size(); ++i) {
		if(m_objects.at(i).id == id) {
			return i;
		}
	}
	return -1;
}

bool CanvasModel::addStroke(const Stroke &stroke)
{
	if(stroke.id.isEmpty() || !checkLayer(stroke.layerId, "stroke")) {
		return false;
	}

	int i = strokeIndex(stroke.id);
	if(i < 0) {
		m_strokes.append(stroke);
	} else {
		m_strokes[i] = stroke;
	}
	emit strokesChanged();
	return true;
}

bool CanvasModel::removeStroke(const QString &id)
{
	int i = strokeIndex(id);
	if(i < 0) {
		qCDebug(lcIbCanvas, "Stroke %s not found", qUtf8Printable(id));
		return false;
	}
	m_strokes.removeAt(i);
	emit strokesChanged();
	return true;
}

bool CanvasModel::addObject(const CanvasObject &object)
{
	if(object.id.isEmpty() || !checkLayer(object.layerId, "object")) {
		return false;
	}

	int i = objectIndex(object.id);
	if(i < 0) {
		m_objects.append(object);
	} else {
		m_objects[i] = object;
	}
	emit objectsChanged();
	return true;
}

bool CanvasModel::updateObject(const QString &id, const QJsonObject &patch)
{
	int i = objectIndex(id);
	if(i < 0) {
		qCWarning(lcIbCanvas, "Update of unknown object %s", qUtf8Printable(id));
		return false;
	}

	if(!m_objects[i].applyProperties(patch)) {
		return false;
	}
	emit objectsChanged();
	return true;
}

bool CanvasModel::replaceObject(const CanvasObject &object)
{
	int i = objectIndex(object.id);
	if(i < 0) {
		qCWarning(
			lcIbCanvas, "Replacement of unknown object %s",
			qUtf8Printable(object.id));
		return false;
	}

	if(!checkLayer(object.layerId, "object")) {
		return false;
	}

	m_objects[i] = object;
	emit objectsChanged();
	return true;
}

bool CanvasModel::removeObject(const QString &id)
{
	int i = objectIndex(id);
	if(i < 0) {
		qCDebug(lcIbCanvas, "Object %s not found", qUtf8Printable(id));
		return false;
	}
	m_objects.removeAt(i);
	emit objectsChanged();
	return true;
}

void CanvasModel::clear()
{
	m_strokes.clear();
	m_pending.clear();
	m_pendingOrder.clear();
	m_objects.clear();
	emit strokesChanged();
	emit pendingStrokesChanged();
	emit objectsChanged();
}

void CanvasModel::setStrokes(const QVector<Stroke> &strokes)
{
	m_strokes.clear();
	for(const Stroke &s : strokes) {
		if(!s.completed) {
			continue;
		}
		if(m_layerlist->hasLayer(s.layerId)) {
			m_strokes.append(s);
		} else {
			qCWarning(
				lcIbCanvas, "Snapshot stroke %s is on unknown layer %s",
				qUtf8Printable(s.id), qUtf8Printable(s.layerId));
		}
	}
	emit strokesChanged();

	// A stroke in progress either finished before the snapshot was taken or
	// its end will never reach us
	if(!m_pending.isEmpty()) {
		qCDebug(
			lcIbCanvas, "Dropping %d pending strokes", int(m_pending.size()));
		m_pending.clear();
		m_pendingOrder.clear();
		emit pendingStrokesChanged();
	}
}

void CanvasModel::restore(
	const QVector<Stroke> &strokes, const QVector<CanvasObject> &objects)
{
	QVector<Stroke> restoredStrokes;
	for(const Stroke &s : strokes) {
		if(strokeIndex(s.id) < 0 && m_layerlist->hasLayer(s.layerId)) {
			restoredStrokes.append(s);
		}
	}
	m_strokes = restoredStrokes + m_strokes;

	QVector<CanvasObject> restoredObjects;
	for(const CanvasObject &o : objects) {
		if(objectIndex(o.id) < 0 && m_layerlist->hasLayer(o.layerId)) {
			restoredObjects.append(o);
		}
	}
	m_objects = restoredObjects + m_objects;

	emit strokesChanged();
	emit objectsChanged();
}

bool CanvasModel::beginRemoteStroke(const Stroke &header)
{
	if(header.id.isEmpty() || !checkLayer(header.layerId, "remote stroke")) {
		return false;
	}

	Stroke stroke = header;
	stroke.points.clear();
	stroke.completed = false;
	if(!m_pending.contains(stroke.id)) {
		m_pendingOrder.append(stroke.id);
	}
	m_pending.insert(stroke.id, stroke);
	emit pendingStrokesChanged();
	return true;
}

bool CanvasModel::appendRemotePoints(
	const QString &id, const PointVector &points)
{
	QHash<QString, Stroke>::iterator it = m_pending.find(id);
	if(it == m_pending.end()) {
		qCDebug(lcIbCanvas, "Points for unknown stroke %s", qUtf8Printable(id));
		return false;
	}
	it->points += points;
	emit pendingStrokesChanged();
	return true;
}

bool CanvasModel::finishRemoteStroke(const QString &id)
{
	QHash<QString, Stroke>::iterator it = m_pending.find(id);
	if(it == m_pending.end()) {
		qCDebug(lcIbCanvas, "End of unknown stroke %s", qUtf8Printable(id));
		return false;
	}

	Stroke stroke = *it;
	m_pending.erase(it);
	m_pendingOrder.removeOne(id);
	emit pendingStrokesChanged();

	stroke.completed = true;
	return addStroke(stroke);
}

Scene CanvasModel::scene(
	const QVector<Stroke> &liveStrokes,
	const QVector<CanvasObject> &liveObjects) const
{
	QSet<QString> visible = m_layerlist->visibleLayerIds();
	Scene scene;

	auto addItem = [&](const auto &item, bool pending) {
		if(visible.contains(item.layerId)) {
			scene.append(SceneItem{
				item, m_layerlist->opacityOf(item.layerId),
				m_layerlist->zIndexOf(item.layerId), pending});
		}
	};

	for(const Stroke &s : m_strokes) {
		addItem(s, false);
	}
	for(const QString &id : m_pendingOrder) {
		addItem(m_pending.value(id), true);
	}
	for(const Stroke &s : liveStrokes) {
		addItem(s, true);
	}
	for(const CanvasObject &o : m_objects) {
		addItem(o, false);
	}
	for(const CanvasObject &o : liveObjects) {
		addItem(o, true);
	}

	std::stable_sort(
		scene.begin(), scene.end(),
		[](const SceneItem &a, const SceneItem &b) {
			return a.zIndex < b.zIndex;
		});
	return scene;
}

void CanvasModel::purgeLayer(const QString &layerId)
{
	auto onLayer = [&](const auto &item) {
		return item.layerId == layerId;
	};

	m_strokes.erase(
		std::remove_if(m_strokes.begin(), m_strokes.end(), onLayer),
		m_strokes.end());
	m_objects.erase(
		std::remove_if(m_objects.begin(), m_objects.end(), onLayer),
		m_objects.end());

	QStringList::iterator it = m_pendingOrder.begin();
	while(it != m_pendingOrder.end()) {
		if(m_pending.value(*it).layerId == layerId) {
			m_pending.remove(*it);
			it = m_pendingOrder.erase(it);
		} else {
			++it;
		}
	}

	qCDebug(lcIbCanvas, "Purged layer %s", qUtf8Printable(layerId));
	emit strokesChanged();
	emit pendingStrokesChanged();
	emit objectsChanged();
}

void CanvasModel::reset()
{
	clear();
	m_layerlist->reset();
	m_cursors->clear();
	m_userlist->reset();
}

bool CanvasModel::checkLayer(const QString &layerId, const char *what) const
{
	if(m_layerlist->hasLayer(layerId)) {
		return true;
	}
	qCWarning(
		lcIbCanvas, "Rejecting %s on unknown layer %s", what,
		qUtf8Printable(layerId));
	return false;
}

int CanvasModel::strokeIndex(const QString &id) const
{
	for(int i = 0; i < m_strokes.size(); ++i) {
		if(m_strokes.at(i).id == id) {
			return i;
		}
	}
	return -1;
}

}
