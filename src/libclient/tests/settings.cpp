// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/settings.h"
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QUuid>
#include <QtTest/QtTest>

using libclient::settings::Settings;

class TestSettings final : public QObject {
	Q_OBJECT
private slots:
	void init()
	{
		QVERIFY(m_dir.isValid());
		m_path = m_dir.filePath(
			QStringLiteral("%1.ini").arg(QUuid::createUuid().toString(
				QUuid::WithoutBraces)));
	}

	void testDefaults()
	{
		Settings settings;
		settings.reset(m_path);
		QCOMPARE(settings.serverUrl(), QStringLiteral("ws://localhost:8000/socket.io/?EIO=4&transport=websocket"));
		QCOMPARE(settings.boardId(), QStringLiteral("default"));
		QCOMPARE(settings.reconnectAttempts(), 10);
		QCOMPARE(settings.reconnectDelayMs(), 1000);
		QCOMPARE(settings.historyDepth(), 100);
		QCOMPARE(settings.cursorStaleMs(), 5000);
		QCOMPARE(settings.strokeSize(), 4.0);
		QCOMPARE(settings.color(), QStringLiteral("#ffffffff"));
		QVERIFY(!settings.logFile());
	}

	void testSubmit()
	{
		{
			Settings settings;
			settings.reset(m_path);
			QSignalSpy changed(&settings, &Settings::historyDepthChanged);
			settings.setHistoryDepth(42);
			QCOMPARE(changed.count(), 1);
			QCOMPARE(changed.first().first().toInt(), 42);
			QCOMPARE(settings.historyDepth(), 42);
			QVERIFY(settings.submit());
		}

		Settings reopened;
		reopened.reset(m_path);
		QCOMPARE(reopened.historyDepth(), 42);
	}

	void testRevert()
	{
		Settings settings;
		settings.reset(m_path);
		settings.setBoardId(QStringLiteral("other"));
		QCOMPARE(settings.boardId(), QStringLiteral("other"));

		QSignalSpy changed(&settings, &Settings::boardIdChanged);
		settings.revert();
		QCOMPARE(settings.boardId(), QStringLiteral("default"));
		QCOMPARE(changed.count(), 1);
		QCOMPARE(changed.first().first().toString(), QStringLiteral("default"));
	}

	void testEnsureIdentity()
	{
		QString userId;
		QString displayName;
		{
			Settings settings;
			settings.reset(m_path);
			settings.ensureIdentity();
			userId = settings.userId();
			displayName = settings.displayName();
			QVERIFY(!QUuid(userId).isNull());
			QVERIFY(displayName.contains(QLatin1Char(' ')));
		}

		// The identity sticks around
		Settings reopened;
		reopened.reset(m_path);
		reopened.ensureIdentity();
		QCOMPARE(reopened.userId(), userId);
		QCOMPARE(reopened.displayName(), displayName);
	}

private:
	QTemporaryDir m_dir;
	QString m_path;
};

QTEST_MAIN(TestSettings)
#include "settings.moc"
