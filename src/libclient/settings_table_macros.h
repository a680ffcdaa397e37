// SPDX-License-Identifier: GPL-3.0-or-later
// No include guard: this header is included twice by settings_table.h, once to
// define the SETTING macro and once to undefine it again.
#ifdef SETTING
#	undef SETTING
#elif defined(IB_SETTINGS_HEADER)
#	define SETTING(name, upperName, key, Type, defaultValue) \
	protected: \
		static const ::libclient::settings::SettingMeta meta##upperName; \
	public: \
		using upperName##Type = Type; \
		Type name() const \
		{ \
			const QVariant value = get(meta##upperName); \
			if(value.canConvert<Type>()) { \
				return value.value<Type>(); \
			} else { \
				qCWarning(lcIbSettings) \
					<< #name << "cannot convert from" << value.typeName() \
					<< "- defaulting"; \
				return defaultValue; \
			} \
		} \
		void set##upperName(Type value) \
		{ \
			set(meta##upperName, QVariant::fromValue(value)); \
		} \
		Q_SIGNAL void name##Changed(Type value);
#elif defined(IB_SETTINGS_BODY)
#	define SETTING(name, upperName, key, Type, defaultValue) \
	const ::libclient::settings::SettingMeta Settings::meta##upperName = { \
		key, \
		[]() { \
			return QVariant::fromValue(Type(defaultValue)); \
		}, \
		[](Settings &settings) { \
			emit settings.name##Changed(settings.name()); \
		}};
#endif
