// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/layerlist.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QSignalSpy>
#include <QtTest/QtTest>

using canvas::CanvasModel;
using canvas::CanvasObject;
using canvas::SceneItem;
using canvas::Stroke;

namespace {

Stroke makeStroke(const QString &id, const QString &layerId, bool completed)
{
	Stroke s;
	s.id = id;
	s.layerId = layerId;
	s.points = {canvas::StrokePoint(0.0, 0.0)};
	s.completed = completed;
	return s;
}

CanvasObject makeObject(const QString &id, const QString &layerId)
{
	CanvasObject o;
	o.id = id;
	o.layerId = layerId;
	o.width = 10.0;
	o.height = 10.0;
	return o;
}

QString itemId(const SceneItem &item)
{
	if(const Stroke *s = std::get_if<Stroke>(&item.item)) {
		return s->id;
	}
	return std::get<CanvasObject>(item.item).id;
}

QStringList sceneIds(const canvas::Scene &scene)
{
	QStringList ids;
	for(const SceneItem &item : scene) {
		ids.append(itemId(item));
	}
	return ids;
}

}

class TestCanvasModel final : public QObject {
	Q_OBJECT
private slots:
	void testRemoteStroke()
	{
		CanvasModel model;
		QSignalSpy strokesChanged(&model, &CanvasModel::strokesChanged);

		Stroke header = makeStroke("r", canvas::DEFAULT_LAYER_ID, false);
		header.color = 0xff00ff00;
		QVERIFY(model.beginRemoteStroke(header));
		QVERIFY(model.pendingStrokes().contains("r"));
		QVERIFY(model.pendingStrokes().value("r").points.isEmpty());

		QVERIFY(model.appendRemotePoints(
			"r", {canvas::StrokePoint(1.0, 1.0), canvas::StrokePoint(2.0, 2.0)}));
		QVERIFY(model.appendRemotePoints("r", {canvas::StrokePoint(3.0, 3.0)}));
		QVERIFY(!model.appendRemotePoints("nope", {canvas::StrokePoint()}));
		QCOMPARE(strokesChanged.count(), 0);

		QVERIFY(model.finishRemoteStroke("r"));
		QVERIFY(model.pendingStrokes().isEmpty());
		const Stroke *s = model.stroke("r");
		QVERIFY(s);
		QVERIFY(s->completed);
		QCOMPARE(s->color, 0xff00ff00u);
		QCOMPARE(int(s->points.size()), 3);
		QCOMPARE(s->points.at(2).x(), 3.0);
		QCOMPARE(strokesChanged.count(), 1);

		QVERIFY(!model.finishRemoteStroke("r"));
	}

	void testRejectUnknownLayer()
	{
		CanvasModel model;
		QVERIFY(!model.addStroke(makeStroke("s", "missing", true)));
		QVERIFY(!model.beginRemoteStroke(makeStroke("s", "missing", false)));
		QVERIFY(!model.addObject(makeObject("o", "missing")));
		QVERIFY(model.strokes().isEmpty());
		QVERIFY(model.pendingStrokes().isEmpty());
		QVERIFY(model.objects().isEmpty());
	}

	void testObjectLastWriterWins()
	{
		CanvasModel model;
		QVERIFY(model.addObject(makeObject("o", canvas::DEFAULT_LAYER_ID)));
		CanvasObject moved = makeObject("o", canvas::DEFAULT_LAYER_ID);
		moved.x = 42.0;
		QVERIFY(model.addObject(moved));
		QCOMPARE(int(model.objects().size()), 1);
		QCOMPARE(model.objects().first().x, 42.0);
	}

	void testUpdateObject()
	{
		CanvasModel model;
		model.addObject(makeObject("o", canvas::DEFAULT_LAYER_ID));

		QVERIFY(model.updateObject(
			"o", QJsonObject{{"x", 5.0}, {"color", "#ffff0000"}}));
		QCOMPARE(model.object("o")->x, 5.0);
		QCOMPARE(model.object("o")->color, 0xffff0000u);
		QCOMPARE(model.object("o")->width, 10.0);

		// A malformed patch is rejected as a whole
		QVERIFY(!model.updateObject("o", QJsonObject{{"x", 9.0}, {"y", "up"}}));
		QCOMPARE(model.object("o")->x, 5.0);

		QVERIFY(!model.updateObject("missing", QJsonObject{{"x", 1.0}}));
	}

	void testSetStrokes()
	{
		CanvasModel model;
		model.addStroke(makeStroke("old", canvas::DEFAULT_LAYER_ID, true));
		model.setStrokes({
			makeStroke("a", canvas::DEFAULT_LAYER_ID, true),
			makeStroke("unfinished", canvas::DEFAULT_LAYER_ID, false),
			makeStroke("elsewhere", "missing", true),
			makeStroke("b", canvas::DEFAULT_LAYER_ID, true),
		});
		QCOMPARE(int(model.strokes().size()), 2);
		QCOMPARE(model.strokes().at(0).id, QStringLiteral("a"));
		QCOMPARE(model.strokes().at(1).id, QStringLiteral("b"));
	}

	void testSetStrokesDropsPending()
	{
		CanvasModel model;
		QVERIFY(model.beginRemoteStroke(
			makeStroke("remote", canvas::DEFAULT_LAYER_ID, false)));
		model.setStrokes({makeStroke("a", canvas::DEFAULT_LAYER_ID, true)});
		QVERIFY(model.pendingStrokes().isEmpty());
		QCOMPARE(int(model.scene().size()), 1);
	}

	void testSceneOrder()
	{
		CanvasModel model;
		canvas::LayerListModel *layers = model.layerlist();
		QString top = layers->addLayer();

		model.addObject(makeObject("top-object", top));
		model.addStroke(makeStroke("top-stroke", top, true));
		model.addObject(makeObject("object", canvas::DEFAULT_LAYER_ID));
		model.addStroke(makeStroke("stroke1", canvas::DEFAULT_LAYER_ID, true));
		model.beginRemoteStroke(
			makeStroke("remote", canvas::DEFAULT_LAYER_ID, false));
		model.addStroke(makeStroke("stroke2", canvas::DEFAULT_LAYER_ID, true));

		canvas::Scene scene = model.scene(
			{makeStroke("live", canvas::DEFAULT_LAYER_ID, false)},
			{makeObject("live-object", top)});
		QCOMPARE(
			sceneIds(scene),
			QStringList({
				"stroke1", "stroke2", "remote", "live", "object",
				"top-stroke", "top-object", "live-object"}));

		QVERIFY(!scene.at(0).pending);
		QVERIFY(scene.at(2).pending);
		QVERIFY(scene.at(3).pending);
		QCOMPARE(scene.at(0).zIndex, 0);
		QCOMPARE(scene.at(5).zIndex, 1);
	}

	void testSceneHidesInvisibleLayers()
	{
		CanvasModel model;
		canvas::LayerListModel *layers = model.layerlist();
		QString hidden = layers->addLayer();
		layers->setLayerOpacity(canvas::DEFAULT_LAYER_ID, 0.25);

		model.addStroke(makeStroke("shown", canvas::DEFAULT_LAYER_ID, true));
		model.addStroke(makeStroke("hidden", hidden, true));
		layers->setLayerVisible(hidden, false);

		canvas::Scene scene = model.scene();
		QCOMPARE(sceneIds(scene), QStringList({"shown"}));
		QCOMPARE(scene.first().opacity, 0.25);

		// Hidden content still exists
		QVERIFY(model.stroke("hidden"));
	}

	void testSceneFollowsReorder()
	{
		CanvasModel model;
		canvas::LayerListModel *layers = model.layerlist();
		QString other = layers->addLayer();
		model.addStroke(makeStroke("bottom", canvas::DEFAULT_LAYER_ID, true));
		model.addStroke(makeStroke("top", other, true));
		QCOMPARE(sceneIds(model.scene()), QStringList({"bottom", "top"}));

		layers->reorder(1, 0);
		QCOMPARE(sceneIds(model.scene()), QStringList({"top", "bottom"}));
	}

	void testRestore()
	{
		CanvasModel model;
		model.addStroke(makeStroke("a", canvas::DEFAULT_LAYER_ID, true));
		QVector<Stroke> snapshot = model.strokes();
		model.clear();
		model.addStroke(makeStroke("b", canvas::DEFAULT_LAYER_ID, true));
		model.restore(snapshot, {});
		QCOMPARE(int(model.strokes().size()), 2);
		QCOMPARE(model.strokes().at(0).id, QStringLiteral("a"));

		// Restoring again does not duplicate anything
		model.restore(snapshot, {});
		QCOMPARE(int(model.strokes().size()), 2);
	}

	void testReset()
	{
		CanvasModel model;
		model.layerlist()->addLayer();
		model.addStroke(makeStroke("a", canvas::DEFAULT_LAYER_ID, true));
		model.addObject(makeObject("o", canvas::DEFAULT_LAYER_ID));
		model.reset();
		QVERIFY(model.strokes().isEmpty());
		QVERIFY(model.objects().isEmpty());
		QCOMPARE(model.layerlist()->rowCount(), 1);
	}

	void testStrokeSnapshotParsing()
	{
		QJsonObject json =
			QJsonDocument::fromJson(R"({
				"id": "s1", "user_id": "u1", "tool": "eraser",
				"color": "#ff123456", "size": 8, "layer_id": "default",
				"completed": true,
				"points": [{"x": 1, "y": 2, "pressure": 0.9, "tilt": 0,
							"timestamp": 1000}, {"x": 3, "y": 4}]
			})")
				.object();
		std::optional<Stroke> stroke = Stroke::fromJson(json);
		QVERIFY(stroke.has_value());
		QVERIFY(stroke->tool == canvas::StrokeTool::Eraser);
		QCOMPARE(stroke->color, 0xff123456u);
		QCOMPARE(stroke->size, 8.0);
		QCOMPARE(int(stroke->points.size()), 2);
		QCOMPARE(stroke->points.at(0).pressure(), 0.9);
		QCOMPARE(stroke->points.at(1).pressure(), 0.5);
		QCOMPARE(stroke->points.at(0).timestampMs(), qint64(1000));

		json[QStringLiteral("points")] = QJsonArray{QJsonObject{{"x", 1}}};
		QVERIFY(!Stroke::fromJson(json).has_value());
	}
};

QTEST_MAIN(TestCanvasModel)
#include "canvasmodel.moc"
