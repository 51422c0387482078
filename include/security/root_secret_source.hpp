#pragma once

#include "core/secure_buffer.hpp"

#include <memory>
#include <string>

namespace llmshield {

/**
 * @brief Where the vault's root secret comes from
 *
 * The root secret is never persisted by the vault. It is read once at
 * construction and combined with the pepper for every key derivation.
 */
class IRootSecretSource {
public:
    virtual ~IRootSecretSource() = default;

    /// @throws ConfigurationValidationError if the secret cannot be read
    [[nodiscard]] virtual SecureString load() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/// Reads the secret from an environment variable (default LLMSHIELD_ROOT_SECRET).
class EnvRootSecretSource : public IRootSecretSource {
public:
    explicit EnvRootSecretSource(std::string env_var_name = "LLMSHIELD_ROOT_SECRET");

    [[nodiscard]] SecureString load() const override;
    [[nodiscard]] std::string name() const override { return "env:" + env_var_name_; }

private:
    std::string env_var_name_;
};

/// Reads the secret from a file; one trailing newline is dropped.
class FileRootSecretSource : public IRootSecretSource {
public:
    explicit FileRootSecretSource(std::string path);

    [[nodiscard]] SecureString load() const override;
    [[nodiscard]] std::string name() const override { return "file:" + path_; }

private:
    std::string path_;
};

/// Secret given directly in configuration (tests, development).
class InlineRootSecretSource : public IRootSecretSource {
public:
    explicit InlineRootSecretSource(std::string secret);
    ~InlineRootSecretSource() override;

    [[nodiscard]] SecureString load() const override;
    [[nodiscard]] std::string name() const override { return "inline"; }

private:
    std::string secret_;
};

struct RootSecretConfig {
    std::string source = "env";     // env | file | inline
    std::string env_var = "LLMSHIELD_ROOT_SECRET";
    std::string file;
    std::string value;
};

/// @throws ConfigurationValidationError on an unknown source kind
[[nodiscard]] std::shared_ptr<IRootSecretSource> make_root_secret_source(const RootSecretConfig& config);

} // namespace llmshield
