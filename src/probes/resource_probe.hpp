#pragma once

#include <string>
#include <core/types.hpp>

// A backend that can describe the machines jobs would run on.
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;

    // Partition list (scheduler backends) or the single local node.
    // An empty filter means every partition.
    virtual Result<ResourceSet> resources(const std::string& partition_filter) = 0;

    virtual const char* name() const = 0;
};

struct ProbeOptions {
    int timeout_ms = 5000;
    int max_parallel = 8;
};
