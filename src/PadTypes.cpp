#include "PadTypes.h"

#include <QJsonArray>

namespace {
constexpr const char *kPlaybackTypeNames[] = {"sequential", "round-robin", "random"};
constexpr const char *kBehaviorNames[] = {"continue", "stop", "restart"};
}  // namespace

QString playbackTypeName(PlaybackType type) {
    return QString::fromLatin1(kPlaybackTypeNames[static_cast<int>(type)]);
}

PlaybackType playbackTypeFromName(const QString &name, PlaybackType fallback) {
    const QString key = name.trimmed().toLower();
    for (int i = 0; i < 3; ++i) {
        if (key == QLatin1String(kPlaybackTypeNames[i])) {
            return static_cast<PlaybackType>(i);
        }
    }
    if (key == "roundrobin" || key == "round_robin") {
        return PlaybackType::RoundRobin;
    }
    return fallback;
}

QString activePadBehaviorName(ActivePadBehavior behavior) {
    return QString::fromLatin1(kBehaviorNames[static_cast<int>(behavior)]);
}

ActivePadBehavior activePadBehaviorFromName(const QString &name, ActivePadBehavior fallback) {
    const QString key = name.trimmed().toLower();
    for (int i = 0; i < 3; ++i) {
        if (key == QLatin1String(kBehaviorNames[i])) {
            return static_cast<ActivePadBehavior>(i);
        }
    }
    return fallback;
}

QString PadAddress::playbackKey() const {
    return QString("pad-%1-%2-%3").arg(profileId).arg(pageIndex).arg(padIndex);
}

QString PadAddress::armedKey() const {
    return QString("armed-%1-%2-%3").arg(profileId).arg(pageIndex).arg(padIndex);
}

PadConfiguration PadConfiguration::cleared(const PadAddress &address) {
    PadConfiguration config;
    config.profileId = address.profileId;
    config.pageIndex = address.pageIndex;
    config.padIndex = address.padIndex;
    config.playbackType = PlaybackType::RoundRobin;
    return config;
}

QJsonObject padConfigurationToJson(const PadConfiguration &config) {
    QJsonObject obj;
    obj["id"] = config.id;
    obj["profileId"] = config.profileId;
    obj["pageIndex"] = config.pageIndex;
    obj["padIndex"] = config.padIndex;
    QJsonArray clips;
    for (qint64 id : config.audioFileIds) {
        clips.append(id);
    }
    obj["audioFileIds"] = clips;
    obj["playbackType"] = playbackTypeName(config.playbackType);
    if (!config.name.isEmpty()) {
        obj["name"] = config.name;
    }
    if (!config.keyBinding.isEmpty()) {
        obj["keyBinding"] = config.keyBinding;
    }
    obj["createdAt"] = config.createdAt.toString(Qt::ISODateWithMs);
    obj["updatedAt"] = config.updatedAt.toString(Qt::ISODateWithMs);
    return obj;
}

PadConfiguration padConfigurationFromJson(const QJsonObject &obj) {
    PadConfiguration config;
    config.id = obj.value("id").toInteger(0);
    config.profileId = obj.value("profileId").toInt(-1);
    config.pageIndex = obj.value("pageIndex").toInt(0);
    config.padIndex = obj.value("padIndex").toInt(-1);
    const QJsonArray clips = obj.value("audioFileIds").toArray();
    for (const QJsonValue &value : clips) {
        const qint64 id = value.toInteger(0);
        if (id > 0) {
            config.audioFileIds.push_back(id);
        }
    }
    config.playbackType = playbackTypeFromName(obj.value("playbackType").toString());
    config.name = obj.value("name").toString();
    config.keyBinding = obj.value("keyBinding").toString();
    config.createdAt = QDateTime::fromString(obj.value("createdAt").toString(), Qt::ISODateWithMs);
    config.updatedAt = QDateTime::fromString(obj.value("updatedAt").toString(), Qt::ISODateWithMs);
    return config;
}
