#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QtNetwork/QLocalSocket>
#include <memory>

#include "../src/AskpassChannel.h"
#include "../src/IpcClient.h"
#include "../src/IpcServer.h"
#include "../src/LaunchChannel.h"
#include "../src/LifecycleChannel.h"
#include "TestHelpers.h"

namespace {

class RecordingLaunchService : public LaunchService {
public:
    bool start(const LaunchRequest& request, QString* error) override
    {
        received.append(request);
        if (reject) {
            if (error) *error = "busy";
            return false;
        }
        return true;
    }
    QList<LaunchRequest> received;
    bool reject = false;
};

class FixedCredentials : public CredentialPromptService {
public:
    Credentials askpass(const QString& id, const QString& host, const QString&) override
    {
        lastId = id;
        lastHost = host;
        return Credentials{"octocat", "hunter2"};
    }
    QString lastId;
    QString lastHost;
};

class EchoChannel : public IpcChannel {
public:
    IpcReply call(const QString& command, const QJsonValue& arg) override
    {
        if (command == "echo") return IpcReply::success(arg);
        return IpcReply::failure("unknown");
    }
};

EndpointAddress addressIn(const QTemporaryDir& dir, const QString& name = "test.sock")
{
    return EndpointAddress{dir.filePath(name)};
}

// Connects a client synchronously from the test's point of view.
bool connectClient(IpcClient& client, const EndpointAddress& address, IpcClient::ConnectStatus* status = nullptr)
{
    bool done = false;
    IpcClient::ConnectStatus result = IpcClient::ConnectStatus::Failed;
    client.connectTo(address, [&](IpcClient::ConnectStatus s, const QString&) {
        result = s;
        done = true;
    });
    if (!waitFor([&]() { return done; })) return false;
    if (status) *status = result;
    return result == IpcClient::ConnectStatus::Connected;
}

IpcReply callAndWait(IpcClient& client, const QString& channel, const QString& command, const QJsonValue& arg)
{
    bool done = false;
    IpcReply reply = IpcReply::failure("timeout");
    client.call(channel, command, arg, [&](const IpcReply& r) {
        reply = r;
        done = true;
    });
    waitFor([&]() { return done; });
    return reply;
}

} // namespace

TEST_CASE("IpcServer reports AddressInUse for a second listener", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    IpcServer first;
    REQUIRE(first.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    REQUIRE(first.isListening());

    IpcServer second;
    QString error;
    REQUIRE(second.listen(addressIn(dir), &error) == IpcServer::ListenStatus::AddressInUse);
    REQUIRE_FALSE(second.isListening());
}

TEST_CASE("IpcServer fails on an unusable location", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcServer server;
    QString error;
    REQUIRE(server.listen(EndpointAddress{dir.filePath("missing/dir/test.sock")}, &error) == IpcServer::ListenStatus::Failed);
    REQUIRE_FALSE(error.isEmpty());
}

TEST_CASE("IpcServer dispatches to registered channels", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    RecordingLaunchService launches;
    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel(LaunchChannel::NAME, std::make_unique<LaunchChannel>(launches));
    server.registerChannel("echo", std::make_unique<EchoChannel>());
    server.setReady();

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    IpcReply echo = callAndWait(client, "echo", "echo", QJsonValue("hello"));
    REQUIRE(echo.ok);
    REQUIRE(echo.result.toString() == "hello");

    LaunchRequest request;
    request.arguments = QStringList{"-n", "file.txt"};
    request.environment.insert("HOME", "/home/alice");
    bool launched = false;
    QString launchError;
    LaunchChannelClient(client).start(request, [&](bool ok, const QString& error) {
        launched = ok;
        launchError = error;
    });
    REQUIRE(waitFor([&]() { return launches.received.size() == 1; }));
    REQUIRE(waitFor([&]() { return launched; }));
    REQUIRE(launches.received.first() == request);
}

TEST_CASE("IpcServer answers unknown channels and commands with errors", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    RecordingLaunchService launches;
    launches.reject = true;
    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel(LaunchChannel::NAME, std::make_unique<LaunchChannel>(launches));
    server.setReady();

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    IpcReply unknownChannel = callAndWait(client, "nope", "start", QJsonValue());
    REQUIRE_FALSE(unknownChannel.ok);
    REQUIRE(unknownChannel.error.contains("unknown channel"));

    IpcReply unknownCommand = callAndWait(client, "launch", "stop", QJsonValue());
    REQUIRE_FALSE(unknownCommand.ok);

    IpcReply malformed = callAndWait(client, "launch", "start", QJsonValue(42));
    REQUIRE_FALSE(malformed.ok);
    REQUIRE(launches.received.isEmpty());

    LaunchRequest request;
    IpcReply rejected = callAndWait(client, "launch", "start", request.toJson());
    REQUIRE_FALSE(rejected.ok);
    REQUIRE(rejected.error == "busy");

    // the connection survives failed requests
    REQUIRE(client.isConnected());
}

TEST_CASE("IpcServer holds requests until ready", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    bool answered = false;
    IpcReply reply;
    client.call("echo", "echo", QJsonValue(1), [&](const IpcReply& r) { reply = r; answered = true; });

    REQUIRE(waitFor([&]() { return server.pendingRequestCount() == 1; }));
    REQUIRE_FALSE(answered);

    // registered after the request arrived, still served
    server.registerChannel("echo", std::make_unique<EchoChannel>());
    server.setReady();
    REQUIRE(waitFor([&]() { return answered; }));
    REQUIRE(reply.ok);
    REQUIRE(reply.result.toInt() == 1);
}

TEST_CASE("IpcServer serves concurrent clients independently", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    RecordingLaunchService launches;
    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel(LaunchChannel::NAME, std::make_unique<LaunchChannel>(launches));
    server.setReady();

    IpcClient a;
    IpcClient b;
    REQUIRE(connectClient(a, addressIn(dir)));
    REQUIRE(connectClient(b, addressIn(dir)));

    LaunchRequest ra; ra.arguments = QStringList{"one"};
    LaunchRequest rb; rb.arguments = QStringList{"two"};
    int acks = 0;
    LaunchChannelClient(a).start(ra, [&](bool ok, const QString&) { if (ok) ++acks; });
    LaunchChannelClient(b).start(rb, [&](bool ok, const QString&) { if (ok) ++acks; });

    REQUIRE(waitFor([&]() { return acks == 2; }));
    REQUIRE(launches.received.size() == 2);
    REQUIRE(server.connectionCount() == 2);
}

TEST_CASE("AskpassChannel returns the prompted credentials", "[ipc][askpass]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    FixedCredentials prompt;
    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel(AskpassChannel::NAME, std::make_unique<AskpassChannel>(prompt));
    server.setReady();

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    QJsonObject arg;
    arg["id"] = "42";
    arg["host"] = "github.com";
    arg["command"] = "fetch";
    IpcReply reply = callAndWait(client, "askpass", "askpass", arg);
    REQUIRE(reply.ok);
    REQUIRE(reply.result.toObject().value("username").toString() == "octocat");
    REQUIRE(reply.result.toObject().value("password").toString() == "hunter2");
    REQUIRE(prompt.lastId == "42");
    REQUIRE(prompt.lastHost == "github.com");

    IpcReply missingId = callAndWait(client, "askpass", "askpass", QJsonObject());
    REQUIRE_FALSE(missingId.ok);
}

TEST_CASE("LifecycleChannel acknowledges before exiting", "[ipc][lifecycle]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    int exitCode = -1;
    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel(LifecycleChannel::NAME, std::make_unique<LifecycleChannel>([&](int code) {
        exitCode = code;
        server.dispose();
    }));
    server.setReady();

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));
    IpcReply reply = callAndWait(client, "lifecycle", "exit", QJsonValue(3));
    REQUIRE(reply.ok);
    REQUIRE(waitFor([&]() { return exitCode == 3; }));
    REQUIRE(server.isDisposed());
}

TEST_CASE("IpcServer dispose is idempotent and releases the endpoint", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.registerChannel("echo", std::make_unique<EchoChannel>());
    server.setReady();

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    server.dispose();
    server.dispose();
    REQUIRE(server.isDisposed());
    REQUIRE_FALSE(server.isListening());
    REQUIRE_FALSE(server.hasChannel("echo"));
#ifndef Q_OS_WIN
    REQUIRE_FALSE(QFile::exists(addressIn(dir).path));
#endif

    REQUIRE(waitFor([&]() { return !client.isConnected(); }));

    // the endpoint can be bound again
    IpcServer next;
    REQUIRE(next.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
}

TEST_CASE("IpcServer drops clients that violate the framing", "[ipc][server]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcServer server;
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);
    server.setReady();

    QLocalSocket raw;
    raw.connectToServer(addressIn(dir).path);
    REQUIRE(raw.waitForConnected(1000));
    REQUIRE(waitFor([&]() { return server.connectionCount() == 1; }));

    QByteArray junk(4, char(0x7f));
    raw.write(junk);
    raw.flush();
    REQUIRE(waitFor([&]() { return server.connectionCount() == 0; }));
}

TEST_CASE("IpcClient fails pending calls when disposed", "[ipc][client]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcServer server; // never ready: calls stay pending
    REQUIRE(server.listen(addressIn(dir)) == IpcServer::ListenStatus::Listening);

    IpcClient client;
    REQUIRE(connectClient(client, addressIn(dir)));

    bool failed = false;
    client.call("echo", "echo", QJsonValue(), [&](const IpcReply& r) { failed = !r.ok; });
    REQUIRE(client.pendingCallCount() == 1);

    client.dispose();
    client.dispose();
    REQUIRE(failed);
    REQUIRE(client.pendingCallCount() == 0);
    REQUIRE_FALSE(client.isConnected());
}

TEST_CASE("IpcClient reports a missing endpoint as a failure", "[ipc][client]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);
    QTemporaryDir dir;

    IpcClient client;
    IpcClient::ConnectStatus status = IpcClient::ConnectStatus::Connected;
    REQUIRE_FALSE(connectClient(client, addressIn(dir, "nobody.sock"), &status));
    REQUIRE(status == IpcClient::ConnectStatus::Failed);
}
