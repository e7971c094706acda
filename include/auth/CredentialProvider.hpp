#pragma once

#include <optional>
#include <string>

namespace ts::auth {

// Source of bearer tokens for the remote store. Token refresh is the
// provider's business; the sync core only asks whether one is available.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual std::optional<std::string> validAccessToken() = 0;
};

}
