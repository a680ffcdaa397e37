// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/settings.h"
#include "libclient/utils/namegenerator.h"
#include <QCoreApplication>
#include <QMutexLocker>
#include <QUuid>

Q_LOGGING_CATEGORY(lcIbSettings, "net.inkboard.settings", QtWarningMsg)

namespace libclient {
namespace settings {

#define IB_SETTINGS_BODY
#include "libclient/settings_table.h"
#undef IB_SETTINGS_BODY

Settings::Settings(QObject *parent)
	: QObject(parent)
{
	reset();
}

Settings::~Settings()
{
	if(!m_pending.isEmpty()) {
		qCWarning(lcIbSettings, "Pending settings on destruction");
		trySubmit();
	}
}

void Settings::reset(const QString &path)
{
	QMutexLocker locker{&m_mutex};
	m_pending.clear();
	if(path.isEmpty()) {
		m_settings.reset(new QSettings(
			QSettings::IniFormat, QSettings::UserScope,
			QCoreApplication::organizationName(),
			QCoreApplication::applicationName()));
	} else {
		m_settings.reset(new QSettings(path, QSettings::IniFormat));
	}
	m_settings->setFallbacksEnabled(false);
	qCDebug(lcIbSettings, "Using settings file %s",
		qUtf8Printable(m_settings->fileName()));
}

QString Settings::path() const
{
	QMutexLocker locker{&m_mutex};
	return m_settings->fileName();
}

void Settings::ensureIdentity()
{
	if(userId().isEmpty()) {
		setUserId(QUuid::createUuid().toString(QUuid::WithoutBraces));
	}
	if(displayName().trimmed().isEmpty()) {
		setDisplayName(utils::generateDisplayName());
	}
	trySubmit();
}

void Settings::revert()
{
	QMutexLocker locker{&m_mutex};
	const auto pending = m_pending.keys();

	// Changes must be cleared before emitting events or else they will be
	// used when the value is retrieved
	m_pending.clear();

	for(const SettingMeta *setting : pending) {
		(setting->notify)(*this);
	}
}

bool Settings::submit()
{
	QMutexLocker locker{&m_mutex};
	if(m_pending.isEmpty()) {
		return true;
	}

	for(auto entry = m_pending.cbegin(); entry != m_pending.cend(); ++entry) {
		m_settings->setValue(QString::fromUtf8(entry.key()->key), entry.value());
	}
	m_settings->sync();
	m_pending.clear();
	return m_settings->status() == QSettings::NoError;
}

void Settings::trySubmit()
{
	if(!submit()) {
		qCWarning(lcIbSettings, "Error submitting settings to %s",
			qUtf8Printable(path()));
	}
}

QVariant Settings::get(const SettingMeta &setting) const
{
	QMutexLocker locker{&m_mutex};
	auto it = m_pending.constFind(&setting);
	if(it != m_pending.constEnd()) {
		return it.value();
	}
	return m_settings->value(
		QString::fromUtf8(setting.key), setting.getDefaultValue());
}

bool Settings::set(const SettingMeta &setting, QVariant value)
{
	QMutexLocker locker{&m_mutex};
	auto it = m_pending.constFind(&setting);
	if(it == m_pending.constEnd() || it.value() != value) {
		m_pending[&setting] = value;
		(setting.notify)(*this);
		return true;
	}
	return false;
}

}
}
