#pragma once

#include <QString>
#include <QVariant>

namespace lxp {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g. "notifications.enabled").
    /// Returns an invalid QVariant if the key is unknown.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Unknown keys are rejected and false is returned.
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    virtual bool save() = 0;
};

} // namespace lxp
