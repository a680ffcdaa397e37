// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/layerlist.h"
#include <QSignalSpy>
#include <QtTest/QtTest>

using canvas::LayerListModel;

class TestLayerList final : public QObject {
	Q_OBJECT
private slots:
	void testDefaultLayer()
	{
		LayerListModel layers;
		QCOMPARE(layers.rowCount(), 1);
		QCOMPARE(layers.activeLayerId(), canvas::DEFAULT_LAYER_ID);
		const canvas::LayerListItem *item = layers.activeLayer();
		QVERIFY(item);
		QCOMPARE(item->name, QStringLiteral("Layer 1"));
		QVERIFY(item->visible);
		QVERIFY(!item->locked);
		QCOMPARE(item->opacity, 1.0);
		QCOMPARE(item->zIndex, 0);
	}

	void testAddLayer()
	{
		LayerListModel layers;
		QSignalSpy activeChanged(&layers, &LayerListModel::activeLayerChanged);
		QString id = layers.addLayer();
		QVERIFY(!id.isEmpty());
		QCOMPARE(layers.rowCount(), 2);
		QCOMPARE(layers.layerRow(id), 0);
		QCOMPARE(layers.activeLayerId(), id);
		QCOMPARE(layers.zIndexOf(id), 1);
		QCOMPARE(layers.layer(id)->name, QStringLiteral("Layer 2"));
		QCOMPARE(activeChanged.count(), 1);

		QCOMPARE(
			layers.data(layers.index(0), LayerListModel::IsActiveRole).toBool(),
			true);
		QCOMPARE(
			layers.data(layers.index(1), LayerListModel::IsActiveRole).toBool(),
			false);
	}

	void testCannotDeleteLastLayer()
	{
		LayerListModel layers;
		QVERIFY(!layers.deleteLayer(canvas::DEFAULT_LAYER_ID));
		QCOMPARE(layers.rowCount(), 1);
		QVERIFY(!layers.deleteLayer(QStringLiteral("nonexistent")));
	}

	void testDeleteActiveLayer()
	{
		LayerListModel layers;
		QString top = layers.addLayer();
		QString middle = layers.addLayer();
		QCOMPARE(layers.activeLayerId(), middle);

		QVERIFY(layers.deleteLayer(middle));
		QCOMPARE(layers.rowCount(), 2);
		QCOMPARE(layers.activeLayerId(), top);

		QVERIFY(layers.deleteLayer(canvas::DEFAULT_LAYER_ID));
		QCOMPARE(layers.activeLayerId(), top);
	}

	void testDeleteCascades()
	{
		canvas::CanvasModel model;
		LayerListModel *layers = model.layerlist();
		QString other = layers->addLayer();

		canvas::Stroke kept;
		kept.id = QStringLiteral("kept");
		kept.completed = true;
		QVERIFY(model.addStroke(kept));

		canvas::Stroke doomed;
		doomed.id = QStringLiteral("doomed");
		doomed.layerId = other;
		doomed.completed = true;
		QVERIFY(model.addStroke(doomed));

		canvas::CanvasObject object;
		object.id = QStringLiteral("rect");
		object.layerId = other;
		QVERIFY(model.addObject(object));

		canvas::Stroke pending;
		pending.id = QStringLiteral("pending");
		pending.layerId = other;
		QVERIFY(model.beginRemoteStroke(pending));

		QVERIFY(layers->deleteLayer(other));
		QCOMPARE(int(model.strokes().size()), 1);
		QCOMPARE(model.strokes().first().id, QStringLiteral("kept"));
		QVERIFY(model.objects().isEmpty());
		QVERIFY(model.pendingStrokes().isEmpty());

		// Nothing can be added to the deleted layer anymore
		QVERIFY(!model.addStroke(doomed));
	}

	void testReorder()
	{
		LayerListModel layers;
		QString a = layers.addLayer();
		QString b = layers.addLayer();
		// Rows: b, a, default
		QCOMPARE(layers.layerRow(b), 0);
		QCOMPARE(layers.layerRow(canvas::DEFAULT_LAYER_ID), 2);

		// Move the bottom layer to the top
		QVERIFY(layers.reorder(2, 0));
		QCOMPARE(layers.layerRow(canvas::DEFAULT_LAYER_ID), 0);
		QCOMPARE(layers.layerRow(b), 1);
		QCOMPARE(layers.layerRow(a), 2);

		// Move the top layer below the next one
		QVERIFY(layers.reorder(0, 2));
		QCOMPARE(layers.layerRow(b), 0);
		QCOMPARE(layers.layerRow(canvas::DEFAULT_LAYER_ID), 1);

		// zIndexes are dense and follow the row order
		for(int row = 0; row < layers.rowCount(); ++row) {
			QCOMPARE(
				layers.layerItems().at(row).zIndex,
				layers.rowCount() - 1 - row);
		}

		QVERIFY(!layers.reorder(3, 0));
		QVERIFY(!layers.reorder(0, 4));
		QVERIFY(!layers.reorder(-1, 0));
	}

	void testVisibilityAndOpacity()
	{
		LayerListModel layers;
		QString other = layers.addLayer();
		QVERIFY(layers.setLayerVisible(other, false));
		QVERIFY(!layers.visibleLayerIds().contains(other));
		QVERIFY(layers.visibleLayerIds().contains(canvas::DEFAULT_LAYER_ID));

		QVERIFY(layers.setLayerOpacity(other, 1.5));
		QCOMPARE(layers.opacityOf(other), 1.0);
		QVERIFY(layers.setLayerOpacity(other, -1.0));
		QCOMPARE(layers.opacityOf(other), 0.0);
		QCOMPARE(layers.opacityOf(QStringLiteral("nonexistent")), 1.0);

		QVERIFY(layers.setLayerLocked(other, true));
		QVERIFY(layers.isLocked(other));
		QVERIFY(layers.renameLayer(other, QStringLiteral("Sketch")));
		QCOMPARE(layers.layer(other)->name, QStringLiteral("Sketch"));
		QVERIFY(!layers.renameLayer(QStringLiteral("nonexistent"), "x"));
	}

	void testFilterForRender()
	{
		LayerListModel layers;
		QString hidden = layers.addLayer();
		layers.setLayerVisible(hidden, false);

		canvas::Stroke visible;
		visible.id = QStringLiteral("v");
		canvas::Stroke invisible;
		invisible.id = QStringLiteral("h");
		invisible.layerId = hidden;

		QVector<canvas::Stroke> filtered =
			layers.filterForRender(QVector<canvas::Stroke>{visible, invisible});
		QCOMPARE(int(filtered.size()), 1);
		QCOMPARE(filtered.first().id, QStringLiteral("v"));
	}

	void testReset()
	{
		LayerListModel layers;
		layers.addLayer();
		layers.addLayer();
		layers.reset();
		QCOMPARE(layers.rowCount(), 1);
		QCOMPARE(layers.activeLayerId(), canvas::DEFAULT_LAYER_ID);
	}
};

QTEST_MAIN(TestLayerList)
#include "layerlist.moc"
