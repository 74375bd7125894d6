#pragma once

#include <QStringList>
#include <QVariant>
#include <string>
#include <yaml-cpp/yaml.h>

namespace lxp {

/// Lay a user document over the defaults tree.
/// A key that is a section (map) in the defaults must stay a section, so a
/// getter never subscripts a scalar. Leaves and unknown keys take the user's
/// value, null keeps the default. Throws YAML::RepresentationException naming
/// the dotted key whose shape is wrong.
inline YAML::Node overlayOnDefaults(const YAML::Node& defaults, const YAML::Node& overlay,
                                    const std::string& path = std::string())
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);

    if (!defaults.IsMap())
        return YAML::Clone(overlay);

    if (!overlay.IsMap()) {
        const std::string where = path.empty() ? std::string("top level") : "'" + path + "'";
        throw YAML::RepresentationException(overlay.Mark(), where + " must be a mapping");
    }

    YAML::Node result = YAML::Clone(defaults);
    for (const auto& entry : overlay) {
        const std::string key = entry.first.as<std::string>();
        const std::string keyPath = path.empty() ? key : path + "." + key;
        const YAML::Node base = defaults[key];
        result[key] = base.IsDefined() ? overlayOnDefaults(base, entry.second, keyPath)
                                       : YAML::Clone(entry.second);
    }
    return result;
}

/// Follow a dotted key through nested maps without inserting anything.
inline bool findNode(const YAML::Node& root, const QStringList& parts, YAML::Node* found)
{
    YAML::Node current;
    current.reset(root);
    for (const QString& part : parts) {
        if (!current.IsMap())
            return false;
        const YAML::Node& section = current;
        const YAML::Node child = section[part.toStdString()];
        if (!child.IsDefined())
            return false;
        current.reset(child);
    }
    found->reset(current);
    return true;
}

enum class LeafType { Bool, Int, String };

/// Decode a scalar with yaml-cpp's own rules (yes/no/on/off are booleans).
/// Returns an invalid QVariant when the scalar is not of that type.
inline QVariant decodeLeaf(const YAML::Node& node, LeafType type)
{
    if (!node.IsScalar())
        return {};

    switch (type) {
    case LeafType::Bool: {
        bool flag = false;
        if (YAML::convert<bool>::decode(node, flag))
            return flag;
        break;
    }
    case LeafType::Int: {
        int number = 0;
        if (YAML::convert<int>::decode(node, number))
            return number;
        break;
    }
    case LeafType::String:
        return QString::fromStdString(node.Scalar());
    }
    return {};
}

inline LeafType leafTypeOf(const YAML::Node& node)
{
    if (decodeLeaf(node, LeafType::Bool).isValid())
        return LeafType::Bool;
    if (decodeLeaf(node, LeafType::Int).isValid())
        return LeafType::Int;
    return LeafType::String;
}

} // namespace lxp
