#pragma once

#include <QString>

// Platform side effects the single-instance startup triggers but does not own.
class PlatformIntegration {
public:
    virtual ~PlatformIntegration() = default;

    // The dock icon is shown once we own the endpoint and hidden while a
    // redundant start hands off to the running instance.
    virtual void showDockPresence() = 0;
    virtual void hideDockPresence() = 0;

    // Whether a refused connection can mean a leftover handle worth deleting.
    virtual bool staleHandlesPossible() const = 0;
};

class DesktopPlatformIntegration : public PlatformIntegration {
public:
    explicit DesktopPlatformIntegration(bool staleHandlesPossible);

    // Named pipes are exclusive and vanish with their owner, so Windows never leaves stale handles.
    static bool defaultStaleHandlesPossible();

    // Groups all windows of one installation under one taskbar entry / desktop file.
    static QString appUserModelId(const QString& productName, bool isBuilt);

    void showDockPresence() override;
    void hideDockPresence() override;
    bool staleHandlesPossible() const override { return m_staleHandlesPossible; }

    bool dockVisible() const { return m_dockVisible; }

private:
    bool m_staleHandlesPossible;
    bool m_dockVisible = true;
};
