#include "SwapJournal.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace {
QJsonObject addressToJson(const PadAddress &address) {
    QJsonObject obj;
    obj["profileId"] = address.profileId;
    obj["pageIndex"] = address.pageIndex;
    obj["padIndex"] = address.padIndex;
    return obj;
}

PadAddress addressFromJson(const QJsonObject &obj) {
    return PadAddress{obj.value("profileId").toInt(-1), obj.value("pageIndex").toInt(0),
                      obj.value("padIndex").toInt(-1)};
}

QJsonValue snapshotToJson(const std::optional<PadConfiguration> &snapshot) {
    return snapshot ? QJsonValue(padConfigurationToJson(*snapshot)) : QJsonValue();
}

std::optional<PadConfiguration> snapshotFromJson(const QJsonValue &value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    return padConfigurationFromJson(value.toObject());
}
}  // namespace

SwapJournal::SwapJournal(const QString &path) : m_path(path) {}

bool SwapJournal::exists() const {
    return isEnabled() && QFile::exists(m_path);
}

bool SwapJournal::write(const Record &record, QString *errorText) {
    if (!isEnabled()) {
        return true;
    }
    QJsonObject root;
    root["from"] = addressToJson(record.from);
    root["to"] = addressToJson(record.to);
    root["fromSnapshot"] = snapshotToJson(record.fromSnapshot);
    root["toSnapshot"] = snapshotToJson(record.toSnapshot);
    root["completedSteps"] = record.completedSteps;

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return false;
    }
    return true;
}

std::optional<SwapJournal::Record> SwapJournal::read(QString *errorText) const {
    if (!exists()) {
        return std::nullopt;
    }
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorText) {
            *errorText = file.errorString();
        }
        return std::nullopt;
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (!doc.isObject()) {
        if (errorText) {
            *errorText = QString("Corrupt swap journal: %1").arg(err.errorString());
        }
        return std::nullopt;
    }
    const QJsonObject root = doc.object();
    Record record;
    record.from = addressFromJson(root.value("from").toObject());
    record.to = addressFromJson(root.value("to").toObject());
    record.fromSnapshot = snapshotFromJson(root.value("fromSnapshot"));
    record.toSnapshot = snapshotFromJson(root.value("toSnapshot"));
    record.completedSteps = root.value("completedSteps").toInt(0);
    if (!record.from.isValid() || !record.to.isValid()) {
        if (errorText) {
            *errorText = "Swap journal names an invalid pad";
        }
        return std::nullopt;
    }
    return record;
}

bool SwapJournal::remove() {
    if (!exists()) {
        return true;
    }
    return QFile::remove(m_path);
}
