#pragma once

#include <QObject>
#include "IConfigService.hpp"

namespace lxp {

class YamlConfig;

/// IConfigService over a YamlConfig. Does not own the YamlConfig.
class ConfigService : public QObject, public IConfigService {
    Q_OBJECT
public:
    explicit ConfigService(YamlConfig* config, const QString& configPath, QObject* parent = nullptr);

    QVariant value(const QString& key) const override;
    bool setValue(const QString& key, const QVariant& value) override;
    bool save() override;

    QString configPath() const { return configPath_; }

signals:
    void configChanged(const QString& path, const QVariant& value);

private:
    YamlConfig* config_;
    QString configPath_;
};

} // namespace lxp
