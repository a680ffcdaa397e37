// SPDX-License-Identifier: GPL-3.0-or-later
#include "fakemessagequeue.h"
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/cursorlist.h"
#include "libclient/canvas/history.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/document.h"
#include "libclient/net/client.h"
#include "libclient/settings.h"
#include "libclient/tools/toolcontroller.h"
#include <QTemporaryDir>
#include <QtTest/QtTest>

using net::MessageType;

class TestDocument final : public QObject {
	Q_OBJECT
private slots:
	void init()
	{
		QVERIFY(m_dir.isValid());
		m_settings = new libclient::settings::Settings;
		m_settings->reset(m_dir.filePath(QStringLiteral("document.ini")));
	}

	void cleanup() { delete m_settings; }

	void testAppliesSettings()
	{
		m_settings->setHistoryDepth(7);
		m_settings->setColor(QStringLiteral("#ff00ff00"));
		m_settings->setStrokeSize(9.0);
		m_settings->setCursorStaleMs(1234);
		m_settings->setDisplayName(QStringLiteral("Tester"));

		FakeMessageQueue *queue = new FakeMessageQueue;
		Document doc(*m_settings, queue);
		QCOMPARE(doc.history()->maxDepth(), 7);
		QCOMPARE(doc.toolController()->color(), 0xff00ff00u);
		QCOMPARE(doc.toolController()->strokeSize(), 9.0);
		QCOMPARE(doc.canvas()->cursors()->staleMs(), 1234);
		QCOMPARE(doc.client()->displayName(), QStringLiteral("Tester"));
		QVERIFY(!doc.client()->userId().isEmpty());
		QCOMPARE(doc.toolController()->userId(), doc.client()->userId());

		// Later changes are picked up too
		m_settings->setColor(QStringLiteral("#ff0000ff"));
		QCOMPARE(doc.toolController()->color(), 0xff0000ffu);
		m_settings->setColor(QStringLiteral("not a color"));
		QCOMPARE(doc.toolController()->color(), 0xff0000ffu);
	}

	void testConnectJoinsConfiguredBoard()
	{
		m_settings->setBoardId(QStringLiteral("b7"));
		FakeMessageQueue *queue = new FakeMessageQueue;
		Document doc(*m_settings, queue);
		doc.connectToServer();
		QCOMPARE(doc.boardId(), QStringLiteral("b7"));
		QCOMPARE(queue->lastUrl, QUrl(m_settings->serverUrl()));
		net::MessageList joins = queue->sentOfType(MessageType::JoinBoard);
		QCOMPARE(int(joins.size()), 1);
		QCOMPARE(joins.first().boardId(), QStringLiteral("b7"));
	}

	void testSwitchBoardDropsLocalWork()
	{
		FakeMessageQueue *queue = new FakeMessageQueue;
		Document doc(*m_settings, queue);
		doc.connectToServer(QUrl("ws://example.invalid/ws"), "b1");
		queue->inject(net::Message(
			MessageType::BoardState, {{"board_id", "b1"}}));
		doc.client()->drainInbox();

		tools::ToolController *ctrl = doc.toolController();
		ctrl->setActiveTool(tools::Type::Rectangle);
		ctrl->pointerDown(QPointF(0, 0), 0.5, 0.0, 0);
		ctrl->pointerMove(QPointF(50, 50), 0.5, 0.0, 0);
		QCOMPARE(int(doc.scene().size()), 1);

		doc.switchBoard("b2");
		QVERIFY(ctrl->liveObjects().isEmpty());
		QVERIFY(doc.scene().isEmpty());
		ctrl->pointerUp();
		QVERIFY(doc.canvas()->objects().isEmpty());
	}

	void testLayers()
	{
		Document doc(*m_settings, new FakeMessageQueue);
		QString layer = doc.addLayer();
		QCOMPARE(doc.canvas()->layerlist()->activeLayerId(), layer);
		QVERIFY(doc.reorderLayer(0, 2));
		QCOMPARE(doc.canvas()->layerlist()->layerRow(layer), 1);
		QVERIFY(doc.deleteLayer(layer));
		QVERIFY(!doc.deleteLayer(canvas::DEFAULT_LAYER_ID));
	}

	void testReset()
	{
		FakeMessageQueue *queue = new FakeMessageQueue;
		Document doc(*m_settings, queue);
		doc.connectToServer(QUrl("ws://example.invalid/ws"), "b1");
		doc.addLayer();
		doc.reset();
		QCOMPARE(int(queue->sentOfType(MessageType::LeaveBoard).size()), 1);
		QVERIFY(doc.boardId().isEmpty());
		QVERIFY(!queue->isConnected());
		QCOMPARE(doc.canvas()->layerlist()->rowCount(), 1);
	}

private:
	QTemporaryDir m_dir;
	libclient::settings::Settings *m_settings = nullptr;
};

QTEST_MAIN(TestDocument)
#include "document.moc"
