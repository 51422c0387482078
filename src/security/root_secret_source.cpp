#include "security/root_secret_source.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>

namespace llmshield {

// ============================================================================
// Environment
// ============================================================================

EnvRootSecretSource::EnvRootSecretSource(std::string env_var_name)
    : env_var_name_(std::move(env_var_name)) {}

SecureString EnvRootSecretSource::load() const {
    const char* value = std::getenv(env_var_name_.c_str());
    if (!value || *value == '\0') {
        throw ConfigurationValidationError(
            std::format("Root secret environment variable '{}' is not set", env_var_name_));
    }
    utils::log::info(std::format("Root secret loaded from environment variable '{}'", env_var_name_));
    return SecureString(std::string(value));
}

// ============================================================================
// File
// ============================================================================

FileRootSecretSource::FileRootSecretSource(std::string path)
    : path_(std::move(path)) {}

SecureString FileRootSecretSource::load() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw ConfigurationValidationError(
            std::format("Root secret file '{}' cannot be opened", path_));
    }

    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (!contents.empty() && contents.back() == '\n') contents.pop_back();
    if (!contents.empty() && contents.back() == '\r') contents.pop_back();

    if (contents.empty()) {
        throw ConfigurationValidationError(std::format("Root secret file '{}' is empty", path_));
    }
    utils::log::info(std::format("Root secret loaded from file '{}'", path_));
    return SecureString(std::move(contents));
}

// ============================================================================
// Inline
// ============================================================================

InlineRootSecretSource::InlineRootSecretSource(std::string secret)
    : secret_(std::move(secret)) {}

InlineRootSecretSource::~InlineRootSecretSource() {
    if (!secret_.empty()) {
        OPENSSL_cleanse(secret_.data(), secret_.size());
    }
}

SecureString InlineRootSecretSource::load() const {
    if (secret_.empty()) {
        throw ConfigurationValidationError("Inline root secret is empty");
    }
    return SecureString(std::string(secret_));
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<IRootSecretSource> make_root_secret_source(const RootSecretConfig& config) {
    if (config.source == "env") {
        return std::make_shared<EnvRootSecretSource>(config.env_var);
    }
    if (config.source == "file") {
        return std::make_shared<FileRootSecretSource>(config.file);
    }
    if (config.source == "inline") {
        utils::log::warn("Root secret is configured inline; use 'env' or 'file' outside development");
        return std::make_shared<InlineRootSecretSource>(config.value);
    }
    throw ConfigurationValidationError(
        std::format("Unknown root secret source '{}' (expected env, file or inline)", config.source));
}

} // namespace llmshield
