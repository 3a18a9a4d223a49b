#include "config/credential_source.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>

namespace ingestgate {

CredentialSource::CredentialSource(std::string client_id_var, std::string client_secret_var)
    : client_id_var_(std::move(client_id_var)),
      client_secret_var_(std::move(client_secret_var)) {}

Result<Credentials> CredentialSource::load() const {
    const char* id = std::getenv(client_id_var_.c_str());
    const char* secret = std::getenv(client_secret_var_.c_str());

    const bool has_id = id && *id;
    const bool has_secret = secret && *secret;
    if (!has_id || !has_secret) {
        return Result<Credentials>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("{} and {} must be set",
                        client_id_var_, client_secret_var_));
    }

    utils::log::info(std::format("Credentials loaded from environment ({}, {})",
        client_id_var_, client_secret_var_));
    return Result<Credentials>::ok(Credentials{id, secret});
}

} // namespace ingestgate
