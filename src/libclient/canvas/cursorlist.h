// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_CURSORLIST_H
#define LIBCLIENT_CANVAS_CURSORLIST_H
#include <QAbstractListModel>
#include <QVector>

namespace canvas {

//! A remote user's pointer position
struct CursorInfo {
	QString userId;
	QString displayName;
	qreal x;
	qreal y;
	quint32 color;
	qint64 lastUpdate;
};

/**
 * @brief Remote cursor presence
 *
 * Every update schedules an expiry check for when the staleness window has
 * passed. The check only removes the cursor if it wasn't updated again in the
 * meantime.
 */
class CursorListModel final : public QAbstractListModel {
	Q_OBJECT
public:
	enum CursorListRoles {
		UserIdRole = Qt::UserRole + 1,
		DisplayNameRole,
		XRole,
		YRole,
		ColorRole,
	};

	static constexpr int DEFAULT_STALE_MS = 5000;

	explicit CursorListModel(QObject *parent = nullptr);

	int rowCount(const QModelIndex &parent = QModelIndex()) const override;
	QVariant
	data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
	QHash<int, QByteArray> roleNames() const override;

	const QVector<CursorInfo> &cursors() const { return m_cursors; }
	const CursorInfo *cursor(const QString &userId) const;

	int staleMs() const { return m_staleMs; }
	void setStaleMs(int staleMs) { m_staleMs = staleMs; }

	/**
	 * @brief Insert or update a cursor
	 * @param now the current time in milliseconds
	 */
	void updateCursor(
		const QString &userId, const QString &displayName, qreal x, qreal y,
		qint64 now);

	/**
	 * @brief Run all expiry checks that are due at the given time
	 *
	 * The timers armed by updateCursor don't go through this. They drop
	 * their own check when they fire, whatever the current time is.
	 */
	void expire(qint64 now);

	void clear();

	/**
	 * @brief Get the ARGB color of a user's cursor
	 *
	 * The hue is derived from the user ID, so every client shows the same
	 * user in the same color.
	 */
	static quint32 colorForUser(const QString &userId);

signals:
	void cursorRemoved(const QString &userId);

private:
	struct ExpiryCheck {
		QString userId;
		qint64 due;
		qint64 stamp;
	};

	int indexOf(const QString &userId) const;
	void evictIfStale(const QString &userId, qint64 stamp);
	void removeIfUnchanged(const QString &userId, qint64 stamp);

	QVector<CursorInfo> m_cursors;
	QVector<ExpiryCheck> m_checks;
	int m_staleMs;
};

}

#endif
