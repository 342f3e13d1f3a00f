#include "LaunchRequest.h"

#include <QJsonArray>

LaunchRequest LaunchRequest::fromProcess(const QStringList& arguments, const QProcessEnvironment& env)
{
    LaunchRequest request;
    request.arguments = arguments;
    const QStringList keys = env.keys();
    for (const QString& key : keys) {
        request.environment.insert(key, env.value(key));
    }
    return request;
}

QJsonObject LaunchRequest::toJson() const
{
    QJsonObject env;
    for (auto it = environment.constBegin(); it != environment.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }
    QJsonObject o;
    o["arguments"] = QJsonArray::fromStringList(arguments);
    o["environment"] = env;
    return o;
}

bool LaunchRequest::fromJson(const QJsonObject& json, LaunchRequest* out, QString* error)
{
    const QJsonValue args = json.value("arguments");
    const QJsonValue env = json.value("environment");
    if (!args.isArray() || !env.isObject()) {
        if (error) *error = QStringLiteral("launch request needs an arguments array and an environment object");
        return false;
    }

    LaunchRequest request;
    const QJsonArray argArray = args.toArray();
    for (const QJsonValue& v : argArray) {
        if (!v.isString()) {
            if (error) *error = QStringLiteral("launch arguments must be strings");
            return false;
        }
        request.arguments.append(v.toString());
    }
    const QJsonObject envObject = env.toObject();
    for (auto it = envObject.constBegin(); it != envObject.constEnd(); ++it) {
        request.environment.insert(it.key(), it.value().toString());
    }

    if (out) *out = request;
    return true;
}
