#pragma once

#include <QJsonObject>
#include <QMap>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

// Description of a redundant process start, forwarded to the running instance.
struct LaunchRequest {
    QStringList arguments;               // command line without the program name
    QMap<QString, QString> environment;

    static LaunchRequest fromProcess(const QStringList& arguments, const QProcessEnvironment& env);

    QJsonObject toJson() const;
    // Returns false when `json` is not a launch request.
    static bool fromJson(const QJsonObject& json, LaunchRequest* out, QString* error = nullptr);

    bool operator==(const LaunchRequest& other) const
    {
        return arguments == other.arguments && environment == other.environment;
    }
};
