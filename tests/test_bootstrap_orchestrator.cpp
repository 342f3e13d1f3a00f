#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <QList>
#include <QTimer>
#include <memory>

#include "../src/BootstrapOrchestrator.h"
#include "../src/HandleCleaner.h"
#include "../src/InstanceBinder.h"
#include "../src/LaunchForwarder.h"
#include "../src/PlatformIntegration.h"
#include "TestHelpers.h"

namespace {

class ScriptedBinder : public InstanceBinder {
public:
    explicit ScriptedBinder(QList<BindResult::Status> script) : m_script(std::move(script)) {}

    BindResult bind(const EndpointAddress& address) override
    {
        addresses.append(address);
        const BindResult::Status s = calls < m_script.size() ? m_script[calls] : BindResult::Status::OtherError;
        ++calls;
        switch (s) {
        case BindResult::Status::Bound: return BindResult::bound(std::make_unique<IpcServer>());
        case BindResult::Status::AddressInUse: return BindResult::addressInUse();
        case BindResult::Status::OtherError: break;
        }
        return BindResult::otherError("permission denied");
    }

    int calls = 0;
    QList<EndpointAddress> addresses;

private:
    QList<BindResult::Status> m_script;
};

class ScriptedForwarder : public LaunchForwarder {
public:
    explicit ScriptedForwarder(QList<ForwardResult> script, bool deferred = false)
        : m_script(std::move(script)), m_deferred(deferred) {}

    void connectAndForward(const EndpointAddress&, const LaunchRequest& request, Callback done) override
    {
        requests.append(request);
        const ForwardResult r = calls < m_script.size()
            ? m_script[calls]
            : ForwardResult::failed(StartupError::ForwardFailed, "unscripted");
        ++calls;
        if (m_deferred) {
            QTimer::singleShot(0, [done, r]() { done(r); });
        } else {
            done(r);
        }
    }

    int calls = 0;
    QList<LaunchRequest> requests;

private:
    QList<ForwardResult> m_script;
    bool m_deferred;
};

class CountingCleaner : public HandleCleaner {
public:
    CleanupResult removeStaleHandle(const EndpointAddress&) override
    {
        ++calls;
        return fail ? CleanupResult::failed("read-only file system") : CleanupResult::removed(true);
    }
    int calls = 0;
    bool fail = false;
};

class RecordingPlatform : public PlatformIntegration {
public:
    explicit RecordingPlatform(bool stale = true) : stale(stale) {}
    void showDockPresence() override { ++shows; }
    void hideDockPresence() override { ++hides; }
    bool staleHandlesPossible() const override { return stale; }
    bool stale;
    int shows = 0;
    int hides = 0;
};

const EndpointAddress ADDRESS{"/tmp/lodestar-test.sock"};

LaunchRequest sampleRequest()
{
    LaunchRequest r;
    r.arguments = QStringList{"--diff", "a.txt", "b.txt"};
    r.environment.insert("HOME", "/home/alice");
    return r;
}

using B = BindResult::Status;

} // namespace

TEST_CASE("Orchestrator binds on the first attempt", "[bootstrap]") {
    ScriptedBinder binder({B::Bound});
    ScriptedForwarder forwarder({});
    CountingCleaner cleaner;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);

    int finishedCount = 0;
    QObject::connect(&orch, &BootstrapOrchestrator::finished, [&](const StartupOutcome&) { ++finishedCount; });
    orch.start();

    REQUIRE(orch.state() == BootstrapOrchestrator::State::Bound);
    REQUIRE(orch.outcome().kind == StartupOutcome::Kind::Bound);
    REQUIRE(orch.outcome().exitCode() == 0);
    REQUIRE(finishedCount == 1);
    REQUIRE(binder.calls == 1);
    REQUIRE(binder.addresses.first() == ADDRESS);
    REQUIRE(forwarder.calls == 0);
    REQUIRE(cleaner.calls == 0);
    REQUIRE(platform.shows == 1);

    std::unique_ptr<IpcServer> server = orch.takeServer();
    REQUIRE(server != nullptr);
    REQUIRE(orch.takeServer() == nullptr);
}

TEST_CASE("Orchestrator hands off to a live instance", "[bootstrap]") {
    ScriptedBinder binder({B::AddressInUse});
    ScriptedForwarder forwarder({ForwardResult::sent()});
    CountingCleaner cleaner;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch.start();

    REQUIRE(orch.state() == BootstrapOrchestrator::State::Terminating);
    REQUIRE(orch.outcome().kind == StartupOutcome::Kind::HandedOff);
    REQUIRE(orch.outcome().error == StartupError::HandedOff);
    REQUIRE(orch.outcome().exitCode() == 0);
    REQUIRE(binder.calls == 1);
    REQUIRE(forwarder.calls == 1);
    REQUIRE(forwarder.requests.first() == sampleRequest());
    REQUIRE(cleaner.calls == 0);
    REQUIRE(platform.hides == 1);
    REQUIRE(orch.takeServer() == nullptr);
}

TEST_CASE("Orchestrator cleans a stale handle and rebinds once", "[bootstrap]") {
    ScriptedBinder binder({B::AddressInUse, B::Bound});
    ScriptedForwarder forwarder({ForwardResult::connectionRefused("ECONNREFUSED")});
    CountingCleaner cleaner;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);

    QList<BootstrapOrchestrator::State> states;
    QObject::connect(&orch, &BootstrapOrchestrator::stateChanged, [&](BootstrapOrchestrator::State s) { states.append(s); });
    orch.start();

    using S = BootstrapOrchestrator::State;
    REQUIRE(states == QList<S>{S::Binding, S::Forwarding, S::Cleaning, S::Binding, S::Bound});
    REQUIRE(orch.outcome().kind == StartupOutcome::Kind::Bound);
    REQUIRE(orch.outcome().bindAttempts == 2);
    REQUIRE(orch.outcome().cleanupAttempts == 1);
    REQUIRE(cleaner.calls == 1);
    REQUIRE_FALSE(orch.retryAvailable());
    // hidden for the hand-off attempt, shown again once bound
    REQUIRE(platform.hides == 1);
    REQUIRE(platform.shows == 1);
    REQUIRE(orch.takeServer() != nullptr);
}

TEST_CASE("Orchestrator never binds a third time", "[bootstrap]") {
    SECTION("second bind finds the address in use") {
        ScriptedBinder binder({B::AddressInUse, B::AddressInUse, B::Bound});
        ScriptedForwarder forwarder({ForwardResult::connectionRefused("refused"), ForwardResult::sent()});
        CountingCleaner cleaner;
        RecordingPlatform platform;
        BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
        orch.start();

        REQUIRE(orch.state() == BootstrapOrchestrator::State::Fatal);
        REQUIRE(orch.outcome().error == StartupError::RetryExhausted);
        REQUIRE(orch.outcome().exitCode() == 1);
        REQUIRE(binder.calls == 2);
        REQUIRE(forwarder.calls == 1);
        REQUIRE(cleaner.calls == 1);
    }
    SECTION("second bind fails otherwise") {
        ScriptedBinder binder({B::AddressInUse, B::OtherError, B::Bound});
        ScriptedForwarder forwarder({ForwardResult::connectionRefused("refused")});
        CountingCleaner cleaner;
        RecordingPlatform platform;
        BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
        orch.start();

        REQUIRE(orch.outcome().kind == StartupOutcome::Kind::Fatal);
        REQUIRE(orch.outcome().error == StartupError::RetryExhausted);
        REQUIRE(orch.outcome().message == "permission denied");
        REQUIRE(binder.calls == 2);
    }
}

TEST_CASE("Orchestrator does not retry where stale handles cannot occur", "[bootstrap]") {
    ScriptedBinder binder({B::AddressInUse, B::Bound});
    ScriptedForwarder forwarder({ForwardResult::connectionRefused("refused")});
    CountingCleaner cleaner;
    RecordingPlatform platform(false);
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch.start();

    REQUIRE(orch.state() == BootstrapOrchestrator::State::Fatal);
    REQUIRE(orch.outcome().error == StartupError::StaleHandleUnrecoverable);
    REQUIRE(orch.outcome().exitCode() == 1);
    REQUIRE(cleaner.calls == 0);
    REQUIRE(binder.calls == 1);
    REQUIRE(orch.retryAvailable());
}

TEST_CASE("Orchestrator stops when the stale handle cannot be removed", "[bootstrap]") {
    ScriptedBinder binder({B::AddressInUse, B::Bound});
    ScriptedForwarder forwarder({ForwardResult::connectionRefused("refused")});
    CountingCleaner cleaner;
    cleaner.fail = true;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch.start();

    REQUIRE(orch.outcome().kind == StartupOutcome::Kind::Fatal);
    REQUIRE(orch.outcome().error == StartupError::HandleRemovalFailed);
    REQUIRE(orch.outcome().message == "read-only file system");
    REQUIRE(cleaner.calls == 1);
    REQUIRE(binder.calls == 1);
}

TEST_CASE("Orchestrator propagates bind and forward failures", "[bootstrap]") {
    SECTION("bind fails for another reason") {
        ScriptedBinder binder({B::OtherError});
        ScriptedForwarder forwarder({});
        CountingCleaner cleaner;
        RecordingPlatform platform;
        BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
        orch.start();

        REQUIRE(orch.outcome().error == StartupError::BindFailedOther);
        REQUIRE(orch.outcome().exitCode() == 1);
        REQUIRE(forwarder.calls == 0);
    }
    SECTION("forwarding fails") {
        ScriptedBinder binder({B::AddressInUse});
        ScriptedForwarder forwarder({ForwardResult::failed(StartupError::ForwardFailed, "broken pipe")});
        CountingCleaner cleaner;
        RecordingPlatform platform;
        BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
        orch.start();

        REQUIRE(orch.outcome().error == StartupError::ForwardFailed);
        REQUIRE(orch.outcome().message == "broken pipe");
        REQUIRE(cleaner.calls == 0);
    }
    SECTION("test session refuses to hand off") {
        ScriptedBinder binder({B::AddressInUse});
        ScriptedForwarder forwarder({ForwardResult::failed(StartupError::TestSessionConflict, "tests need their own instance")});
        CountingCleaner cleaner;
        RecordingPlatform platform;
        BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
        orch.start();

        REQUIRE(orch.outcome().kind == StartupOutcome::Kind::Fatal);
        REQUIRE(orch.outcome().error == StartupError::TestSessionConflict);
        REQUIRE(orch.outcome().exitCode() == 1);
    }
}

TEST_CASE("Orchestrator ignores a second start", "[bootstrap]") {
    ScriptedBinder binder({B::Bound, B::Bound});
    ScriptedForwarder forwarder({});
    CountingCleaner cleaner;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch.start();
    orch.start();
    REQUIRE(binder.calls == 1);
}

TEST_CASE("Orchestrator waits for the forwarder's answer", "[bootstrap]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);

    ScriptedBinder binder({B::AddressInUse});
    ScriptedForwarder forwarder({ForwardResult::sent()}, true);
    CountingCleaner cleaner;
    RecordingPlatform platform;
    BootstrapOrchestrator orch(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch.start();

    REQUIRE(orch.state() == BootstrapOrchestrator::State::Forwarding);
    REQUIRE_FALSE(orch.outcome().isTerminal());
    REQUIRE(waitFor([&]() { return orch.outcome().isTerminal(); }));
    REQUIRE(orch.outcome().kind == StartupOutcome::Kind::HandedOff);
}

TEST_CASE("Orchestrator destroyed mid-forward ignores the late answer", "[bootstrap]") {
    int argc = 0; char* argv[] = {nullptr}; QCoreApplication app(argc, argv);

    ScriptedBinder binder({B::AddressInUse});
    ScriptedForwarder forwarder({ForwardResult::sent()}, true);
    CountingCleaner cleaner;
    RecordingPlatform platform;
    auto orch = std::make_unique<BootstrapOrchestrator>(ADDRESS, sampleRequest(), binder, forwarder, cleaner, platform);
    orch->start();
    orch.reset();

    QCoreApplication::processEvents();
    REQUIRE(forwarder.calls == 1);
}
