/**
 * @file errors.h
 * @brief Error taxonomy of the update automation
 *
 * Every error kind is its own immutable type carrying only its own fields.
 * All free text (and every source/URL field) is sanitized exactly once, at
 * construction. ErrorKind closes the set so consumers can match on it
 * exhaustively; DependabotError makes any kind throwable.
 */

#pragma once

#include "dependabot/errors/error_type.h"
#include "dependabot/errors/message_sanitizer.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace dependabot::errors {

/**
 * @brief Sanitized message storage shared by every error kind
 */
class ErrorRecord {
public:
    /**
     * @brief Sanitized message, or std::nullopt when none was given
     */
    [[nodiscard]] const std::optional<SanitizedMessage>& getMessage() const noexcept {
        return message_;
    }

    bool operator==(const ErrorRecord& other) const = default;

protected:
    explicit ErrorRecord(const std::optional<std::string>& message);

private:
    std::optional<SanitizedMessage> message_;
};

/**
 * @brief Error kind with no state besides an optional message
 */
template <ErrorType Type>
class MarkerError : public ErrorRecord {
public:
    static constexpr ErrorType kType = Type;

    explicit MarkerError(const std::optional<std::string>& message = std::nullopt)
        : ErrorRecord(message) {}

    bool operator==(const MarkerError& other) const = default;
};

using OutOfDisk = MarkerError<ErrorType::OUT_OF_DISK>;
using OutOfMemory = MarkerError<ErrorType::OUT_OF_MEMORY>;
using NotImplemented = MarkerError<ErrorType::NOT_IMPLEMENTED>;
using DependencyFileNotEvaluatable = MarkerError<ErrorType::DEPENDENCY_FILE_NOT_EVALUATABLE>;
using DependencyFileNotResolvable = MarkerError<ErrorType::DEPENDENCY_FILE_NOT_RESOLVABLE>;
using ConfigFileFileNotFound = MarkerError<ErrorType::CONFIG_FILE_NOT_FOUND>;
using InconsistentRegistryResponse = MarkerError<ErrorType::INCONSISTENT_REGISTRY_RESPONSE>;
using AllVersionsIgnored = MarkerError<ErrorType::ALL_VERSIONS_IGNORED>;
using UnexpectedExternalCode = MarkerError<ErrorType::UNEXPECTED_EXTERNAL_CODE>;

// ============================================================================
// Repo level errors
// ============================================================================

class DirectoryNotFound : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::DIRECTORY_NOT_FOUND;

    explicit DirectoryNotFound(std::string directoryName,
                               const std::optional<std::string>& message = std::nullopt);

    [[nodiscard]] const std::string& getDirectoryName() const noexcept { return directoryName_; }

    bool operator==(const DirectoryNotFound& other) const = default;

private:
    std::string directoryName_;
};

class BranchNotFound : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::BRANCH_NOT_FOUND;

    explicit BranchNotFound(std::string branchName,
                            const std::optional<std::string>& message = std::nullopt);

    [[nodiscard]] const std::string& getBranchName() const noexcept { return branchName_; }

    bool operator==(const BranchNotFound& other) const = default;

private:
    std::string branchName_;
};

/**
 * @brief Structured repository location
 */
struct RepositorySource {
    std::string provider = "github";
    std::string repo;                   ///< "owner/name"
    std::string directory;
    std::string branch;
    std::string hostname = "github.com";

    /// @brief Browsable URL: https://{hostname}/{repo}
    [[nodiscard]] std::string url() const;

    bool operator==(const RepositorySource& other) const = default;
};

class RepoNotFound : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::REPO_NOT_FOUND;

    explicit RepoNotFound(RepositorySource source,
                          const std::optional<std::string>& message = std::nullopt);

    /**
     * @brief Construct from a raw source string
     *
     * The string is run through MessageSanitizer::sanitizeSource.
     */
    explicit RepoNotFound(const std::string& source,
                          const std::optional<std::string>& message = std::nullopt);

    [[nodiscard]] const std::variant<RepositorySource, std::string>& getSource() const noexcept {
        return source_;
    }

    /// @brief url() of a structured source, or the sanitized string
    [[nodiscard]] std::string getSourceUrl() const;

    bool operator==(const RepoNotFound& other) const = default;

private:
    std::variant<RepositorySource, std::string> source_;
};

// ============================================================================
// File level errors
// ============================================================================

class ToolVersionNotSupported : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::TOOL_VERSION_NOT_SUPPORTED;

    ToolVersionNotSupported(std::string toolName,
                            std::string detectedVersion,
                            std::string supportedVersions);

    [[nodiscard]] const std::string& getToolName() const noexcept { return toolName_; }
    [[nodiscard]] const std::string& getDetectedVersion() const noexcept { return detectedVersion_; }
    [[nodiscard]] const std::string& getSupportedVersions() const noexcept { return supportedVersions_; }

    bool operator==(const ToolVersionNotSupported& other) const = default;

private:
    std::string toolName_;
    std::string detectedVersion_;
    std::string supportedVersions_;
};

/**
 * @brief Common part of errors about one dependency file
 */
class DependencyFileError : public ErrorRecord {
public:
    [[nodiscard]] const std::string& getFilePath() const noexcept { return filePath_; }

    /**
     * @brief Last path segment ("/a/b/c.txt" -> "c.txt")
     * @throws std::logic_error if the path has no segments
     */
    [[nodiscard]] std::string getFileName() const;

    /**
     * @brief All but the last segment, always starting with '/'
     *
     * "/a/b/c.txt" -> "/a/b", "c.txt" -> "/"
     *
     * @throws std::logic_error if the path has no segments
     */
    [[nodiscard]] std::string getDirectory() const;

    bool operator==(const DependencyFileError& other) const = default;

protected:
    DependencyFileError(const std::string& filePath, const std::string& message);

private:
    std::string filePath_;
};

class DependencyFileNotFound : public DependencyFileError {
public:
    static constexpr ErrorType kType = ErrorType::DEPENDENCY_FILE_NOT_FOUND;

    /// Default message: "{filePath} not found"
    explicit DependencyFileNotFound(std::string filePath,
                                    const std::optional<std::string>& message = std::nullopt);

    bool operator==(const DependencyFileNotFound& other) const = default;
};

class DependencyFileNotParseable : public DependencyFileError {
public:
    static constexpr ErrorType kType = ErrorType::DEPENDENCY_FILE_NOT_PARSEABLE;

    /// Default message: "{filePath} not parseable"
    explicit DependencyFileNotParseable(std::string filePath,
                                        const std::optional<std::string>& message = std::nullopt);

    bool operator==(const DependencyFileNotParseable& other) const = default;
};

// ============================================================================
// Source level errors
// ============================================================================

/**
 * @brief Registry/feed failure; the source is stored sanitized
 */
class PrivateSourceError : public ErrorRecord {
public:
    [[nodiscard]] const std::string& getSource() const noexcept { return source_; }

    bool operator==(const PrivateSourceError& other) const = default;

protected:
    PrivateSourceError(std::string sanitizedSource, const std::string& messagePrefix);

private:
    std::string source_;
};

class PrivateSourceAuthenticationFailure : public PrivateSourceError {
public:
    static constexpr ErrorType kType = ErrorType::PRIVATE_SOURCE_AUTHENTICATION_FAILURE;

    explicit PrivateSourceAuthenticationFailure(const std::string& source);

    bool operator==(const PrivateSourceAuthenticationFailure& other) const = default;
};

class PrivateSourceTimedOut : public PrivateSourceError {
public:
    static constexpr ErrorType kType = ErrorType::PRIVATE_SOURCE_TIMED_OUT;

    explicit PrivateSourceTimedOut(const std::string& source);

    bool operator==(const PrivateSourceTimedOut& other) const = default;
};

class PrivateSourceCertificateFailure : public PrivateSourceError {
public:
    static constexpr ErrorType kType = ErrorType::PRIVATE_SOURCE_CERTIFICATE_FAILURE;

    explicit PrivateSourceCertificateFailure(const std::string& source);

    bool operator==(const PrivateSourceCertificateFailure& other) const = default;
};

class MissingEnvironmentVariable : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::MISSING_ENVIRONMENT_VARIABLE;

    explicit MissingEnvironmentVariable(std::string environmentVariable);

    [[nodiscard]] const std::string& getEnvironmentVariable() const noexcept {
        return environmentVariable_;
    }

    bool operator==(const MissingEnvironmentVariable& other) const = default;

private:
    std::string environmentVariable_;
};

// ============================================================================
// Dependency level errors
// ============================================================================

class GitDependenciesNotReachable : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::GIT_DEPENDENCIES_NOT_REACHABLE;

    /**
     * @brief Each URL is stripped of basic-auth credentials individually
     *
     * Callers holding a single URL pass a one-element vector.
     */
    explicit GitDependenciesNotReachable(const std::vector<std::string>& dependencyUrls);

    [[nodiscard]] const std::vector<std::string>& getDependencyUrls() const noexcept {
        return dependencyUrls_;
    }

    bool operator==(const GitDependenciesNotReachable& other) const = default;

private:
    struct AlreadyFiltered {};

    GitDependenciesNotReachable(std::vector<std::string> filteredUrls, AlreadyFiltered);

    std::vector<std::string> dependencyUrls_;
};

class GitDependencyReferenceNotFound : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::GIT_DEPENDENCY_REFERENCE_NOT_FOUND;

    explicit GitDependencyReferenceNotFound(std::string dependency);

    [[nodiscard]] const std::string& getDependency() const noexcept { return dependency_; }

    bool operator==(const GitDependencyReferenceNotFound& other) const = default;

private:
    std::string dependency_;
};

class PathDependenciesNotReachable : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::PATH_DEPENDENCIES_NOT_REACHABLE;

    explicit PathDependenciesNotReachable(std::vector<std::string> dependencies);

    [[nodiscard]] const std::vector<std::string>& getDependencies() const noexcept {
        return dependencies_;
    }

    bool operator==(const PathDependenciesNotReachable& other) const = default;

private:
    std::vector<std::string> dependencies_;
};

class GoModulePathMismatch : public ErrorRecord {
public:
    static constexpr ErrorType kType = ErrorType::GO_MODULE_PATH_MISMATCH;

    GoModulePathMismatch(std::string goMod, std::string declaredPath, std::string discoveredPath);

    [[nodiscard]] const std::string& getGoMod() const noexcept { return goMod_; }
    [[nodiscard]] const std::string& getDeclaredPath() const noexcept { return declaredPath_; }
    [[nodiscard]] const std::string& getDiscoveredPath() const noexcept { return discoveredPath_; }

    bool operator==(const GoModulePathMismatch& other) const = default;

private:
    std::string goMod_;
    std::string declaredPath_;
    std::string discoveredPath_;
};

// ============================================================================
// Closed taxonomy
// ============================================================================

using ErrorKind = std::variant<
    OutOfDisk,
    OutOfMemory,
    NotImplemented,
    DirectoryNotFound,
    BranchNotFound,
    RepoNotFound,
    ToolVersionNotSupported,
    DependencyFileNotFound,
    DependencyFileNotParseable,
    DependencyFileNotEvaluatable,
    DependencyFileNotResolvable,
    ConfigFileFileNotFound,
    PrivateSourceAuthenticationFailure,
    PrivateSourceTimedOut,
    PrivateSourceCertificateFailure,
    MissingEnvironmentVariable,
    InconsistentRegistryResponse,
    GitDependenciesNotReachable,
    GitDependencyReferenceNotFound,
    PathDependenciesNotReachable,
    GoModulePathMismatch,
    AllVersionsIgnored,
    UnexpectedExternalCode
>;

/**
 * @brief ErrorType of whichever kind @p kind holds
 */
ErrorType typeOf(const ErrorKind& kind) noexcept;

/**
 * @brief Throwable wrapper around one error kind
 *
 * what() and getMessage() return the kind's sanitized message, or
 * errorTypeName() when the kind was raised without one.
 *
 * @example
 * throw DependabotError(DependencyFileNotFound("/Gemfile"));
 * ...
 * catch (const DependabotError& e) {
 *     if (auto* notFound = e.as<DependencyFileNotFound>()) { ... }
 * }
 */
class DependabotError : public std::runtime_error {
private:
    ErrorKind kind_;
    std::string message_;

public:
    explicit DependabotError(ErrorKind kind);

    [[nodiscard]] const ErrorKind& getKind() const noexcept { return kind_; }

    [[nodiscard]] ErrorType getType() const noexcept { return typeOf(kind_); }

    [[nodiscard]] const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Pointer to the held kind if it is a @p Kind, else nullptr
     */
    template <typename Kind>
    [[nodiscard]] const Kind* as() const noexcept {
        return std::get_if<Kind>(&kind_);
    }
};

} // namespace dependabot::errors
