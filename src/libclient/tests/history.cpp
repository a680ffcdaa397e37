// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/history.h"
#include <QtTest/QtTest>

using canvas::Action;
using canvas::CanvasModel;
using canvas::CanvasObject;
using canvas::History;
using canvas::Stroke;

namespace {

Stroke makeStroke(const QString &id)
{
	Stroke s;
	s.id = id;
	s.points = {canvas::StrokePoint(1.0, 2.0), canvas::StrokePoint(3.0, 4.0)};
	s.completed = true;
	return s;
}

CanvasObject makeRect(const QString &id, qreal x)
{
	CanvasObject o;
	o.id = id;
	o.x = x;
	o.y = 10.0;
	o.width = 20.0;
	o.height = 30.0;
	return o;
}

}

class TestHistory final : public QObject {
	Q_OBJECT
private slots:
	void testDepthLimit()
	{
		History history;
		QCOMPARE(history.maxDepth(), History::DEFAULT_MAX_DEPTH);
		for(int i = 0; i < 150; ++i) {
			history.push(canvas::action::AddStroke{
				makeStroke(QStringLiteral("s%1").arg(i))});
		}
		QCOMPARE(history.undoCount(), 100);

		// The oldest entries were dropped
		const canvas::action::AddStroke *oldest =
			std::get_if<canvas::action::AddStroke>(
				&history.undoStack().front());
		QVERIFY(oldest);
		QCOMPARE(oldest->stroke.id, QStringLiteral("s50"));
	}

	void testShrinkDepth()
	{
		History history(10);
		for(int i = 0; i < 10; ++i) {
			history.push(canvas::action::AddStroke{
				makeStroke(QStringLiteral("s%1").arg(i))});
		}
		history.setMaxDepth(3);
		QCOMPARE(history.undoCount(), 3);
	}

	void testUndoRedo()
	{
		History history;
		QVERIFY(!history.canUndo());
		QVERIFY(!history.undo().has_value());

		history.push(canvas::action::AddStroke{makeStroke("a")});
		history.push(canvas::action::AddStroke{makeStroke("b")});

		std::optional<Action> undone = history.undo();
		QVERIFY(undone.has_value());
		QCOMPARE(
			std::get<canvas::action::AddStroke>(*undone).stroke.id,
			QStringLiteral("b"));
		QCOMPARE(history.undoCount(), 1);
		QCOMPARE(history.redoCount(), 1);

		std::optional<Action> redone = history.redo();
		QVERIFY(redone.has_value());
		QCOMPARE(
			std::get<canvas::action::AddStroke>(*redone).stroke.id,
			QStringLiteral("b"));
		QCOMPARE(history.undoCount(), 2);
		QVERIFY(!history.canRedo());
	}

	void testPushClearsRedo()
	{
		History history;
		history.push(canvas::action::AddStroke{makeStroke("a")});
		history.undo();
		QVERIFY(history.canRedo());
		history.push(canvas::action::AddStroke{makeStroke("b")});
		QVERIFY(!history.canRedo());
	}

	void testRevertReplayStroke()
	{
		CanvasModel model;
		Action add = canvas::action::AddStroke{makeStroke("a")};
		QVERIFY(canvas::replay(model, add));
		QCOMPARE(int(model.strokes().size()), 1);
		QVERIFY(canvas::revert(model, add));
		QVERIFY(model.strokes().isEmpty());

		QVERIFY(model.addStroke(makeStroke("b")));
		Action del = canvas::action::DeleteStroke{makeStroke("b")};
		QVERIFY(canvas::replay(model, del));
		QVERIFY(!model.stroke("b"));
		QVERIFY(canvas::revert(model, del));
		QVERIFY(model.stroke("b"));
	}

	void testRevertReplayObject()
	{
		CanvasModel model;
		CanvasObject before = makeRect("o", 0.0);
		CanvasObject after = makeRect("o", 50.0);
		QVERIFY(model.addObject(before));

		Action update = canvas::action::UpdateObject{before, after};
		QVERIFY(canvas::replay(model, update));
		QCOMPARE(model.object("o")->x, 50.0);
		QVERIFY(canvas::revert(model, update));
		QCOMPARE(model.object("o")->x, 0.0);

		Action del = canvas::action::DeleteObject{before};
		QVERIFY(canvas::replay(model, del));
		QVERIFY(model.objects().isEmpty());
		QVERIFY(canvas::revert(model, del));
		QVERIFY(*model.object("o") == before);
	}

	void testRevertClear()
	{
		CanvasModel model;
		model.addStroke(makeStroke("a"));
		model.addObject(makeRect("o", 0.0));

		Action clear =
			canvas::action::ClearCanvas{model.strokes(), model.objects()};
		QVERIFY(canvas::replay(model, clear));
		QVERIFY(model.strokes().isEmpty());
		QVERIFY(model.objects().isEmpty());

		// Something drawn after the clear stays on top of the restored items
		model.addStroke(makeStroke("later"));
		QVERIFY(canvas::revert(model, clear));
		QCOMPARE(int(model.strokes().size()), 2);
		QCOMPARE(model.strokes().at(0).id, QStringLiteral("a"));
		QCOMPARE(model.strokes().at(1).id, QStringLiteral("later"));
		QCOMPARE(int(model.objects().size()), 1);
	}

	void testUndoRedoRoundTrip()
	{
		// Applying then undoing then redoing ends up in the applied state
		CanvasModel model;
		History history;
		model.addObject(makeRect("o", 0.0));

		QVector<Action> actions = {
			canvas::action::AddStroke{makeStroke("a")},
			canvas::action::AddObject{makeRect("p", 5.0)},
			canvas::action::UpdateObject{makeRect("o", 0.0), makeRect("o", 9.0)},
			canvas::action::DeleteStroke{makeStroke("a")},
		};
		for(const Action &a : actions) {
			QVERIFY(canvas::replay(model, a));
			history.push(a);
		}
		QVector<Stroke> strokes = model.strokes();
		QVector<CanvasObject> objects = model.objects();

		while(std::optional<Action> a = history.undo()) {
			QVERIFY(canvas::revert(model, *a));
		}
		QVERIFY(model.strokes().isEmpty());
		QCOMPARE(int(model.objects().size()), 1);
		QCOMPARE(model.objects().first().x, 0.0);

		while(std::optional<Action> a = history.redo()) {
			QVERIFY(canvas::replay(model, *a));
		}
		QVERIFY(model.strokes() == strokes);
		QVERIFY(model.objects() == objects);
	}
};

QTEST_MAIN(TestHistory)
#include "history.moc"
