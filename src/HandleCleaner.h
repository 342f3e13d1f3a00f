#pragma once

#include "StartupResult.h"

// Removes the filesystem object behind an endpoint nobody listens on.
class HandleCleaner {
public:
    virtual ~HandleCleaner() = default;
    virtual CleanupResult removeStaleHandle(const EndpointAddress& address) = 0;
};

class FileHandleCleaner : public HandleCleaner {
public:
    // A missing handle counts as removed. Any other failure is reported.
    CleanupResult removeStaleHandle(const EndpointAddress& address) override;
};
