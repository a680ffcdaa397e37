// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/websocketmessagequeue.h"
#include <QHostAddress>
#include <QSignalSpy>
#include <QWebSocket>
#include <QWebSocketServer>
#include <QtTest/QtTest>

// A minimal Socket.IO server that echoes back every event sent to it.
// Used by the actual test case.
class EchoServer final : public QObject {
	Q_OBJECT
public:
	EchoServer()
		: m_server(new QWebSocketServer(
			  QStringLiteral("echo"), QWebSocketServer::NonSecureMode, this))
	{
		connect(
			m_server, &QWebSocketServer::newConnection, this,
			&EchoServer::acceptNew);
	}

	bool listen()
	{
		if(!m_server->listen(QHostAddress::LocalHost)) {
			qWarning() << "Couldn't start echo server:"
					   << m_server->errorString();
			return false;
		}
		return true;
	}

	QUrl url() const
	{
		return QUrl(QStringLiteral("ws://127.0.0.1:%1")
						.arg(m_server->serverPort()));
	}

	void closeAll()
	{
		for(QWebSocket *s : m_clients) {
			s->close();
		}
	}

	void sendToAll(const QString &frame)
	{
		for(QWebSocket *s : m_clients) {
			s->sendTextMessage(frame);
		}
	}

	//! Reset to a well-behaved server
	void reset()
	{
		received.clear();
		refuseNamespace = false;
		pingInterval = 25000;
		pingTimeout = 20000;
	}

	QStringList received;
	bool refuseNamespace = false;
	int pingInterval = 25000;
	int pingTimeout = 20000;

private slots:
	void acceptNew()
	{
		QWebSocket *s;
		while((s = m_server->nextPendingConnection())) {
			m_clients.append(s);
			connect(s, &QWebSocket::disconnected, this, [this, s]() {
				m_clients.removeAll(s);
				s->deleteLater();
			});
			connect(
				s, &QWebSocket::textMessageReceived, this,
				[this, s](const QString &text) {
					receiveText(s, text);
				});
			connect(
				s, &QWebSocket::binaryMessageReceived, s,
				[s](const QByteArray &bytes) {
					s->sendBinaryMessage(bytes);
				});
			s->sendTextMessage(
				QStringLiteral("0{\"sid\":\"e1\",\"upgrades\":[],"
							   "\"pingInterval\":%1,\"pingTimeout\":%2}")
					.arg(pingInterval)
					.arg(pingTimeout));
		}
	}

private:
	void receiveText(QWebSocket *s, const QString &text)
	{
		received.append(text);
		if(text == QStringLiteral("40")) {
			if(refuseNamespace) {
				s->sendTextMessage(QStringLiteral("44{\"message\":\"Not allowed\"}"));
			} else {
				s->sendTextMessage(QStringLiteral("40{\"sid\":\"s1\"}"));
			}
		} else if(text.startsWith(QStringLiteral("42"))) {
			s->sendTextMessage(text);
		} else if(text.startsWith(QStringLiteral("41"))) {
			s->close();
		}
	}

	QWebSocketServer *m_server;
	QVector<QWebSocket *> m_clients;
};


// The actual test case
class TestMessageQueue final : public QObject {
	Q_OBJECT
private slots:
	void initTestCase()
	{
		m_server = new EchoServer;
		QVERIFY(m_server->listen());
	}

	void cleanupTestCase() { delete m_server; }

	void init() { m_server->reset(); }

	void testEcho()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		QSignalSpy available(&mq, &net::MessageQueue::messageAvailable);
		net::Message msg(
			net::MessageType::CursorMove,
			{{QStringLiteral("x"), 1.0}, {QStringLiteral("y"), 2.0}});
		mq.send(msg);
		QVERIFY(available.wait());

		QVERIFY(mq.isPending());
		net::MessageList received;
		mq.receive(received);
		QCOMPARE(received.size(), 1);
		QVERIFY(received.first().equals(msg));
		QVERIFY(!mq.isPending());

		QCOMPARE(m_server->received.first(), QStringLiteral("40"));
		QVERIFY(m_server->received.last().startsWith(
			QStringLiteral("42[\"cursor_move\",{")));
	}

	void testServerEvents()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		QSignalSpy available(&mq, &net::MessageQueue::messageAvailable);
		m_server->sendToAll(QStringLiteral("42[\"user_count\",{\"count\":3}]"));
		m_server->sendToAll(QStringLiteral("427[\"user_count\",{\"count\":4}]"));
		m_server->sendToAll(QStringLiteral("42/,[\"board_cleared\",{}]"));
		QTRY_COMPARE(available.count(), 3);

		net::MessageList received;
		mq.receive(received);
		QCOMPARE(received.size(), 3);
		QCOMPARE(received.at(0).payload().value("count").toInt(), 3);
		QCOMPARE(received.at(1).payload().value("count").toInt(), 4);
		QVERIFY(received.at(2).type() == net::MessageType::BoardCleared);
	}

	void testPingReply()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		m_server->sendToAll(QStringLiteral("2"));
		QTRY_VERIFY(m_server->received.contains(QStringLiteral("3")));
		QVERIFY(mq.isConnected());
	}

	void testPingTimeout()
	{
		m_server->pingInterval = 50;
		m_server->pingTimeout = 50;
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		// The server never pings, so the connection is considered dead
		QSignalSpy disconnected(&mq, &net::MessageQueue::disconnected);
		QVERIFY(disconnected.wait());
		QCOMPARE(disconnected.first().first().toBool(), false);
		QVERIFY(!mq.isConnected());
	}

	void testNamespaceRefused()
	{
		m_server->refuseNamespace = true;
		net::WebSocketMessageQueue mq;
		QSignalSpy failed(&mq, &net::MessageQueue::connectionFailed);
		QSignalSpy connected(&mq, &net::MessageQueue::connected);
		mq.connectToServer(m_server->url());
		QVERIFY(failed.wait());
		QCOMPARE(failed.first().first().toString(), QStringLiteral("Not allowed"));
		QCOMPARE(connected.count(), 0);
		QVERIFY(!mq.isConnected());
	}

	void testEndpointUrl_data()
	{
		QTest::addColumn<QString>("url");
		QTest::addColumn<QString>("expected");
		QTest::newRow("bare")
			<< QStringLiteral("ws://localhost:8000")
			<< QStringLiteral("ws://localhost:8000/socket.io/?EIO=4&transport=websocket");
		QTest::newRow("root")
			<< QStringLiteral("wss://example.com/")
			<< QStringLiteral("wss://example.com/socket.io/?EIO=4&transport=websocket");
		QTest::newRow("complete")
			<< QStringLiteral("ws://localhost:8000/socket.io/?EIO=4&transport=websocket")
			<< QStringLiteral("ws://localhost:8000/socket.io/?EIO=4&transport=websocket");
		QTest::newRow("custom path")
			<< QStringLiteral("ws://localhost:8000/relay/")
			<< QStringLiteral("ws://localhost:8000/relay/?EIO=4&transport=websocket");
	}

	void testEndpointUrl()
	{
		QFETCH(QString, url);
		QFETCH(QString, expected);
		QCOMPARE(
			net::WebSocketMessageQueue::endpointUrl(QUrl(url)).toString(),
			expected);
	}

	void testBadData()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		// The server sends back binary frames as they are
		QSignalSpy bad(&mq, &net::MessageQueue::badData);
		QWebSocket *socket = mq.findChild<QWebSocket *>();
		QVERIFY(socket);
		socket->sendBinaryMessage(QByteArray("\x01\x02\x03", 3));
		QVERIFY(bad.wait());
		QCOMPARE(bad.first().first().toInt(), 3);

		// Echoed back as a malformed event
		socket->sendTextMessage(QStringLiteral("42not json"));
		QVERIFY(bad.wait());

		// Events for other namespaces are not ours
		m_server->sendToAll(QStringLiteral("42/admin,[\"user_count\",{}]"));
		QVERIFY(bad.wait());
		QCOMPARE(bad.count(), 3);
		QVERIFY(!mq.isPending());
	}

	void testLocalDisconnect()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		QSignalSpy disconnected(&mq, &net::MessageQueue::disconnected);
		mq.disconnectFromServer();
		QVERIFY(disconnected.count() > 0 || disconnected.wait());
		QCOMPARE(disconnected.first().first().toBool(), true);
		QVERIFY(!mq.isConnected());

		// Not connected: this is silently dropped
		QSignalSpy sent(&mq, &net::MessageQueue::bytesSent);
		mq.send(net::Message(net::MessageType::ClearBoard));
		QCOMPARE(sent.count(), 0);
	}

	void testRemoteDisconnect()
	{
		net::WebSocketMessageQueue mq;
		QVERIFY(connectQueue(mq));

		QSignalSpy disconnected(&mq, &net::MessageQueue::disconnected);
		m_server->closeAll();
		QVERIFY(disconnected.wait());
		QCOMPARE(disconnected.first().first().toBool(), false);
	}

	void testConnectionFailed()
	{
		// Grab a free port and close it again so nobody is listening there
		QWebSocketServer placeholder(
			QStringLiteral("placeholder"), QWebSocketServer::NonSecureMode);
		QVERIFY(placeholder.listen(QHostAddress::LocalHost));
		quint16 port = placeholder.serverPort();
		placeholder.close();

		net::WebSocketMessageQueue mq;
		QSignalSpy failed(&mq, &net::MessageQueue::connectionFailed);
		QSignalSpy connected(&mq, &net::MessageQueue::connected);
		mq.connectToServer(
			QUrl(QStringLiteral("ws://127.0.0.1:%1").arg(port)));
		QVERIFY(failed.wait());
		QCOMPARE(connected.count(), 0);
		QVERIFY(!mq.isConnected());
	}

private:
	bool connectQueue(net::WebSocketMessageQueue &mq)
	{
		QSignalSpy connected(&mq, &net::MessageQueue::connected);
		mq.connectToServer(m_server->url());
		return connected.wait() && mq.isConnected();
	}

	EchoServer *m_server = nullptr;
};

QTEST_MAIN(TestMessageQueue)
#include "messagequeue.moc"
