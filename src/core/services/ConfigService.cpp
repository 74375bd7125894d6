#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>

namespace lxp {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (!config_->setValueByPath(key, val)) {
        BOOST_LOG_TRIVIAL(warning) << "[ConfigService] unknown config key '" << key.toStdString() << "'";
        return false;
    }
    emit configChanged(key, val);
    return true;
}

bool ConfigService::save()
{
    if (!config_->save(configPath_)) {
        BOOST_LOG_TRIVIAL(error) << "[ConfigService] failed to write " << configPath_.toStdString();
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[ConfigService] saved " << configPath_.toStdString();
    return true;
}

} // namespace lxp
