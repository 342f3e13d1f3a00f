#pragma once

#include "StartupResult.h"

// Server role: tries to become the listening owner of the endpoint.
class InstanceBinder {
public:
    virtual ~InstanceBinder() = default;
    virtual BindResult bind(const EndpointAddress& address) = 0;
};

class LocalInstanceBinder : public InstanceBinder {
public:
    BindResult bind(const EndpointAddress& address) override;
};
