#pragma once
#include "PermissionTypes.hpp"
#include <string>

// Side-effect-free read of the OS microphone authorization.
// Implementations: AVFoundationAuthorization (macOS).
class IAuthorizationSource {
public:
    virtual ~IAuthorizationSource() = default;

    virtual PermissionStatus query() = 0;

    // Name for logging
    virtual std::string name() const = 0;
};
