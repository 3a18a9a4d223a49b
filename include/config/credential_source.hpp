#pragma once

#include "core/error.hpp"

#include <string>

namespace ingestgate {

/**
 * @brief OAuth client credentials used for every stream creation
 *
 * Never logged. The same pair is passed uniformly to the provider.
 */
struct Credentials {
    std::string client_id;
    std::string client_secret;
};

/**
 * @brief Reads client credentials from environment variables
 *
 * Suitable for 12-factor deployments: the variable names come from the
 * [credentials] section, the values only from the environment.
 */
class CredentialSource {
public:
    CredentialSource(std::string client_id_var, std::string client_secret_var);

    /**
     * @brief Resolve both secrets
     * @return Credentials, or INTERNAL_ERROR naming the missing variable
     */
    [[nodiscard]] Result<Credentials> load() const;

    const std::string& client_id_var() const { return client_id_var_; }
    const std::string& client_secret_var() const { return client_secret_var_; }

private:
    std::string client_id_var_;
    std::string client_secret_var_;
};

} // namespace ingestgate
