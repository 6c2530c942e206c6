#pragma once
#include "IAuthorizationSource.hpp"

// macOS microphone authorization via
// +[AVCaptureDevice authorizationStatusForMediaType:AVMediaTypeAudio].
//
//   NotDetermined         -> Unknown
//   Restricted / Denied   -> Denied
//   Authorized            -> Granted
//
// Only compiled on Apple platforms (src/permission/AVFoundationAuthorization.mm).
class AVFoundationAuthorization : public IAuthorizationSource {
public:
    PermissionStatus query() override;
    std::string name() const override { return "AVFoundation"; }
};
