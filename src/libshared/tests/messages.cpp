// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/message.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest/QtTest>

using net::Message;
using net::MessageType;

class TestMessages final : public QObject {
	Q_OBJECT
private slots:
	void testTypeNames()
	{
		QCOMPARE(
			Message::typeName(MessageType::StrokeStart),
			QStringLiteral("stroke_start"));
		QVERIFY(
			Message::typeFromName(QStringLiteral("board_state")) ==
			MessageType::BoardState);
		QVERIFY(
			Message::typeFromName(QStringLiteral("no_such_event")) ==
			MessageType::Unknown);
		QVERIFY(Message::typeName(MessageType::Unknown).isEmpty());
	}

	void testSerialize()
	{
		Message msg(
			MessageType::CursorMove,
			{{QStringLiteral("x"), 10.5}, {QStringLiteral("y"), 20}});
		QJsonArray args = QJsonDocument::fromJson(msg.serialize()).array();
		QCOMPARE(args.size(), 2);
		QCOMPARE(args.at(0).toString(), QStringLiteral("cursor_move"));
		QCOMPARE(args.at(1).toObject().value("x").toDouble(), 10.5);
		QCOMPARE(args.at(1).toObject().value("y").toInt(), 20);

		Message copy = Message::deserialize(msg.serialize());
		QVERIFY(copy.equals(msg));
		QVERIFY(copy.type() == MessageType::CursorMove);
	}

	void testDeserializeUnknownEvent()
	{
		Message msg = Message::deserialize(
			R"(["something_new",{"board_id":"b1"}])");
		QVERIFY(!msg.isNull());
		QVERIFY(msg.type() == MessageType::Unknown);
		QCOMPARE(msg.name(), QStringLiteral("something_new"));
		QCOMPARE(msg.boardId(), QStringLiteral("b1"));
	}

	void testDeserializeMissingData()
	{
		Message msg = Message::deserialize(R"(["board_cleared"])");
		QVERIFY(!msg.isNull());
		QVERIFY(msg.type() == MessageType::BoardCleared);
		QVERIFY(msg.payload().isEmpty());
		QVERIFY(msg.boardId().isEmpty());
	}

	void testDeserializeExtraArguments()
	{
		Message msg = Message::deserialize(R"(["user_count",{"count":2},7])");
		QVERIFY(msg.type() == MessageType::UserCount);
		QCOMPARE(msg.payload().value("count").toInt(), 2);
	}

	void testDeserializeInvalid_data()
	{
		QTest::addColumn<QByteArray>("frame");
		QTest::newRow("not json") << QByteArray("hello");
		QTest::newRow("object")
			<< QByteArray(R"({"event":"user_left","data":{}})");
		QTest::newRow("empty") << QByteArray("[]");
		QTest::newRow("numeric event") << QByteArray("[1,2,3]");
		QTest::newRow("empty event") << QByteArray(R"(["",{}])");
		QTest::newRow("array data") << QByteArray(R"(["user_left",[1]])");
	}

	void testDeserializeInvalid()
	{
		QFETCH(QByteArray, frame);
		QVERIFY(Message::deserialize(frame).isNull());
	}
};

QTEST_MAIN(TestMessages)
#include "messages.moc"
