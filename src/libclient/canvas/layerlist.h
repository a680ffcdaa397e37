// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_LAYERLIST_H
#define LIBCLIENT_CANVAS_LAYERLIST_H
#include "libclient/canvas/canvasobject.h"
#include "libclient/canvas/stroke.h"
#include <QAbstractListModel>
#include <QSet>
#include <QVector>

namespace canvas {

struct LayerListItem {
	//! Layer ID
	QString id;

	//! Layer title
	QString name;

	//! Layer visibility (local only)
	bool visible = true;

	//! Locked layers can't be drawn on
	bool locked = false;

	//! Layer opacity in range [0, 1]
	qreal opacity = 1.0;

	//! Stacking order, higher is on top
	int zIndex = 0;

	//! The layer every fresh board starts out with
	static LayerListItem makeDefault();
};

}

Q_DECLARE_TYPEINFO(canvas::LayerListItem, Q_MOVABLE_TYPE);

namespace canvas {

/**
 * @brief The layer stack of a board
 *
 * Rows are ordered from the topmost layer to the bottommost one, i.e. by
 * descending zIndex. There is always at least one layer and the active layer
 * is always one of them.
 */
class LayerListModel final : public QAbstractListModel {
	Q_OBJECT
public:
	enum LayerListRoles {
		IdRole = Qt::UserRole + 1,
		NameRole,
		IsVisibleRole,
		IsLockedRole,
		OpacityRole,
		ZIndexRole,
		IsActiveRole,
	};

	LayerListModel(QObject *parent = nullptr);

	int rowCount(const QModelIndex &parent = QModelIndex()) const override;
	QVariant
	data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
	QHash<int, QByteArray> roleNames() const override;

	const QVector<LayerListItem> &layerItems() const { return m_items; }

	int layerRow(const QString &id) const;
	bool hasLayer(const QString &id) const { return layerRow(id) >= 0; }

	//! Get a layer by its ID, or nullptr if there is no such layer
	const LayerListItem *layer(const QString &id) const;

	const QString &activeLayerId() const { return m_activeLayerId; }
	const LayerListItem *activeLayer() const { return layer(m_activeLayerId); }
	bool setActiveLayer(const QString &id);

	QSet<QString> visibleLayerIds() const;

	//! Get the opacity of the given layer, 1.0 if there is no such layer
	qreal opacityOf(const QString &id) const;

	//! Get the zIndex of the given layer, 0 if there is no such layer
	int zIndexOf(const QString &id) const;

	bool isLocked(const QString &id) const;

	//! Keep only strokes on visible layers
	QVector<Stroke> filterForRender(const QVector<Stroke> &strokes) const;

	//! Keep only objects on visible layers
	QVector<CanvasObject>
	filterForRender(const QVector<CanvasObject> &objects) const;

	/**
	 * @brief Move a layer to a new position in the list
	 *
	 * The destination is given as the row before which the layer is inserted
	 * prior to its removal, like QAbstractItemModel::beginMoveRows expects.
	 * All zIndexes are renumbered afterwards so they stay dense and unique.
	 *
	 * @return false if an index is out of range
	 */
	bool reorder(int oldIndex, int newIndex);

	/**
	 * @brief Add a new layer on top of the stack
	 *
	 * The new layer gets a generated ID and becomes the active one.
	 * @return the new layer's ID
	 */
	QString addLayer();

	/**
	 * @brief Delete a layer
	 *
	 * The last remaining layer can't be deleted. If the active layer is
	 * deleted, the topmost remaining layer becomes active.
	 */
	bool deleteLayer(const QString &id);

	bool renameLayer(const QString &id, const QString &name);
	bool setLayerVisible(const QString &id, bool visible);
	bool setLayerLocked(const QString &id, bool locked);

	//! Set a layer's opacity, clamped to [0, 1]
	bool setLayerOpacity(const QString &id, qreal opacity);

	//! Go back to a single default layer
	void reset();

signals:
	//! A layer was removed. Its contents should be removed as well.
	void layerDeleted(const QString &id);

	void activeLayerChanged(const QString &id);

private:
	void renumber();
	void emitRowChanged(int row);

	QVector<LayerListItem> m_items;
	QString m_activeLayerId;
};

}

#endif
