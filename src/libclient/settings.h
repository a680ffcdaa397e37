// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_SETTINGS_H
#define LIBCLIENT_SETTINGS_H
#include <QDebug>
#include <QHash>
#include <QLoggingCategory>
#include <QObject>
#include <QRecursiveMutex>
#include <QSettings>
#include <QVariant>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(lcIbSettings)

namespace libclient {
namespace settings {

class Settings;

struct SettingMeta final {
	const char *key;
	QVariant (*const getDefaultValue)();
	void (*const notify)(Settings &);
};

/**
 * An interface to application-wide settings.
 *
 * Changed values are kept pending until submit() writes them out, so a
 * caller can still revert() them. Every setting has a getter, a setter and a
 * change signal generated from settings_table.h.
 */
class Settings final : public QObject {
	Q_OBJECT
public:
	explicit Settings(QObject *parent = nullptr);
	~Settings() override;

	//! Open the settings file at the given path, or the default one
	void reset(const QString &path = QString());

	QString path() const;

#define IB_SETTINGS_HEADER
#include "libclient/settings_table.h"
#undef IB_SETTINGS_HEADER

	/**
	 * @brief Make sure a user id and display name exist
	 *
	 * Missing values are generated and stored, so the same identity is used
	 * the next time the application is started.
	 */
	void ensureIdentity();

	void revert();
	bool submit();
	void trySubmit();

protected:
	QVariant get(const SettingMeta &setting) const;
	bool set(const SettingMeta &setting, QVariant value);

private:
	std::unique_ptr<QSettings> m_settings;
	QHash<const SettingMeta *, QVariant> m_pending;
	mutable QRecursiveMutex m_mutex;
};

}
}

#endif
