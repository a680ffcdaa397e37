// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_CANVASMODEL_H
#define LIBCLIENT_CANVAS_CANVASMODEL_H
#include "libclient/canvas/canvasobject.h"
#include "libclient/canvas/stroke.h"
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QStringList>
#include <QVector>
#include <variant>

namespace canvas {

class CursorListModel;
class LayerListModel;
class UserListModel;

//! A single drawable thing, tagged with how to composite it
struct SceneItem {
	std::variant<Stroke, CanvasObject> item;
	qreal opacity;
	int zIndex;
	bool pending;
};

typedef QVector<SceneItem> Scene;

/**
 * @brief The in-memory contents of a board
 *
 * Holds finalized strokes, remote strokes that are still being drawn and
 * shape/text objects, plus the layer stack and presence models. Every
 * mutation checks that the layer it refers to exists. Rejected mutations
 * return false and leave the model untouched.
 */
class CanvasModel final : public QObject {
	Q_OBJECT
public:
	explicit CanvasModel(QObject *parent = nullptr);

	LayerListModel *layerlist() const { return m_layerlist; }
	CursorListModel *cursors() const { return m_cursors; }
	UserListModel *userlist() const { return m_userlist; }

	const QVector<Stroke> &strokes() const { return m_strokes; }
	const QVector<CanvasObject> &objects() const { return m_objects; }
	const QHash<QString, Stroke> &pendingStrokes() const { return m_pending; }

	const Stroke *stroke(const QString &id) const;
	const CanvasObject *object(const QString &id) const;
	int objectIndex(const QString &id) const;

	/**
	 * @brief Add a finalized stroke
	 *
	 * A stroke with an ID that is already present replaces the old one.
	 */
	bool addStroke(const Stroke &stroke);
	bool removeStroke(const QString &id);

	//! Add an object, replacing any existing object with the same ID
	bool addObject(const CanvasObject &object);

	//! Apply a partial properties object to an existing object
	bool updateObject(const QString &id, const QJsonObject &patch);

	//! Replace an existing object's state wholesale
	bool replaceObject(const CanvasObject &object);

	bool removeObject(const QString &id);

	//! Remove all strokes, pending strokes and objects. Layers are kept.
	void clear();

	/**
	 * @brief Replace the finalized strokes with a board snapshot
	 *
	 * Strokes that are not completed or that refer to an unknown layer are
	 * skipped. Pending remote strokes are dropped.
	 */
	void setStrokes(const QVector<Stroke> &strokes);

	/**
	 * @brief Put back strokes and objects that were cleared
	 *
	 * The restored items go below anything added since. Items whose ID is
	 * already present or whose layer is gone are skipped.
	 */
	void restore(
		const QVector<Stroke> &strokes, const QVector<CanvasObject> &objects);

	//! Start tracking a stroke that a peer is drawing
	bool beginRemoteStroke(const Stroke &header);

	//! Append points to a pending remote stroke
	bool appendRemotePoints(const QString &id, const PointVector &points);

	//! Move a pending remote stroke into the finalized collection
	bool finishRemoteStroke(const QString &id);

	/**
	 * @brief Build the drawable scene
	 *
	 * Contains everything on visible layers, ordered from the bottommost
	 * layer to the topmost one. Within a layer, finalized strokes come first,
	 * then pending strokes and finally objects, each in insertion order.
	 * The live items are the local user's unfinished stroke and shape.
	 */
	Scene scene(
		const QVector<Stroke> &liveStrokes = QVector<Stroke>(),
		const QVector<CanvasObject> &liveObjects =
			QVector<CanvasObject>()) const;

public slots:
	//! Remove everything on the given layer
	void purgeLayer(const QString &layerId);

	//! Go back to an empty board with only the default layer
	void reset();

signals:
	void strokesChanged();
	void pendingStrokesChanged();
	void objectsChanged();

private:
	bool checkLayer(const QString &layerId, const char *what) const;
	int strokeIndex(const QString &id) const;

	LayerListModel *m_layerlist;
	CursorListModel *m_cursors;
	UserListModel *m_userlist;

	QVector<Stroke> m_strokes;
	QHash<QString, Stroke> m_pending;
	QStringList m_pendingOrder;
	QVector<CanvasObject> m_objects;
};

}

#endif
