/**
 * @file errors.cpp
 * @brief Error taxonomy implementation
 */

#include "dependabot/errors/errors.h"
#include "dependabot/utils/string_utils.h"

#include <type_traits>
#include <utility>

namespace dependabot::errors {

namespace {

const MessageSanitizer& sanitizer() {
    return MessageSanitizer::instance();
}

// Path segments with trailing empty ones dropped: "/a/b/" -> ["", "a", "b"]
std::vector<std::string> pathSegments(const std::string& path) {
    std::vector<std::string> segments = utils::split(path, '/');
    while (!segments.empty() && segments.back().empty()) {
        segments.pop_back();
    }
    return segments;
}

} // namespace

ErrorRecord::ErrorRecord(const std::optional<std::string>& message)
    : message_(sanitizer().sanitizeOptional(message)) {}

// ============================================================================
// Repo level errors
// ============================================================================

DirectoryNotFound::DirectoryNotFound(std::string directoryName,
                                     const std::optional<std::string>& message)
    : ErrorRecord(message),
      directoryName_(std::move(directoryName)) {}

BranchNotFound::BranchNotFound(std::string branchName,
                               const std::optional<std::string>& message)
    : ErrorRecord(message),
      branchName_(std::move(branchName)) {}

std::string RepositorySource::url() const {
    return "https://" + hostname + "/" + repo;
}

RepoNotFound::RepoNotFound(RepositorySource source,
                           const std::optional<std::string>& message)
    : ErrorRecord(message),
      source_(std::move(source)) {}

RepoNotFound::RepoNotFound(const std::string& source,
                           const std::optional<std::string>& message)
    : ErrorRecord(message),
      source_(sanitizer().sanitizeSource(source)) {}

std::string RepoNotFound::getSourceUrl() const {
    if (const auto* structured = std::get_if<RepositorySource>(&source_)) {
        return structured->url();
    }
    return std::get<std::string>(source_);
}

// ============================================================================
// File level errors
// ============================================================================

ToolVersionNotSupported::ToolVersionNotSupported(std::string toolName,
                                                 std::string detectedVersion,
                                                 std::string supportedVersions)
    : ErrorRecord("Dependabot detected the following " + toolName +
                  " requirement for your project: '" + detectedVersion + "'." +
                  "\n\nCurrently, the following " + toolName +
                  " versions are supported in Dependabot: " + supportedVersions + "."),
      toolName_(std::move(toolName)),
      detectedVersion_(std::move(detectedVersion)),
      supportedVersions_(std::move(supportedVersions)) {}

DependencyFileError::DependencyFileError(const std::string& filePath, const std::string& message)
    : ErrorRecord(message),
      filePath_(filePath) {}

std::string DependencyFileError::getFileName() const {
    std::vector<std::string> segments = pathSegments(filePath_);
    if (segments.empty()) {
        throw std::logic_error("Dependency file path has no segments: '" + filePath_ + "'");
    }
    return segments.back();
}

std::string DependencyFileError::getDirectory() const {
    std::vector<std::string> segments = pathSegments(filePath_);
    if (segments.empty()) {
        throw std::logic_error("Dependency file path has no segments: '" + filePath_ + "'");
    }
    segments.pop_back();

    // Directory should always start with a `/`
    std::string directory = utils::join(segments, "/");
    size_t firstNonSlash = directory.find_first_not_of('/');
    if (firstNonSlash == std::string::npos) {
        return "/";
    }
    return "/" + directory.substr(firstNonSlash);
}

DependencyFileNotFound::DependencyFileNotFound(std::string filePath,
                                               const std::optional<std::string>& message)
    : DependencyFileError(filePath, message ? *message : filePath + " not found") {}

DependencyFileNotParseable::DependencyFileNotParseable(std::string filePath,
                                                       const std::optional<std::string>& message)
    : DependencyFileError(filePath, message ? *message : filePath + " not parseable") {}

// ============================================================================
// Source level errors
// ============================================================================

PrivateSourceError::PrivateSourceError(std::string sanitizedSource, const std::string& messagePrefix)
    : ErrorRecord(messagePrefix + sanitizedSource),
      source_(std::move(sanitizedSource)) {}

PrivateSourceAuthenticationFailure::PrivateSourceAuthenticationFailure(const std::string& source)
    : PrivateSourceError(sanitizer().sanitizeSource(source),
                         "The following source could not be reached as it requires "
                         "authentication (and any provided details were invalid or lacked "
                         "the required permissions): ") {}

PrivateSourceTimedOut::PrivateSourceTimedOut(const std::string& source)
    : PrivateSourceError(sanitizer().sanitizeSource(source),
                         "The following source timed out: ") {}

PrivateSourceCertificateFailure::PrivateSourceCertificateFailure(const std::string& source)
    : PrivateSourceError(sanitizer().sanitizeSource(source),
                         "Could not verify the SSL certificate for ") {}

MissingEnvironmentVariable::MissingEnvironmentVariable(std::string environmentVariable)
    : ErrorRecord("Missing environment variable " + environmentVariable),
      environmentVariable_(std::move(environmentVariable)) {}

// ============================================================================
// Dependency level errors
// ============================================================================

GitDependenciesNotReachable::GitDependenciesNotReachable(const std::vector<std::string>& dependencyUrls)
    : GitDependenciesNotReachable(
          [&dependencyUrls]() {
              std::vector<std::string> filtered;
              filtered.reserve(dependencyUrls.size());
              for (const auto& url : dependencyUrls) {
                  filtered.push_back(sanitizer().filterSensitiveData(url));
              }
              return filtered;
          }(),
          AlreadyFiltered{}) {}

GitDependenciesNotReachable::GitDependenciesNotReachable(std::vector<std::string> filteredUrls,
                                                         AlreadyFiltered)
    : ErrorRecord("The following git URLs could not be retrieved: " +
                  utils::join(filteredUrls, ", ")),
      dependencyUrls_(std::move(filteredUrls)) {}

GitDependencyReferenceNotFound::GitDependencyReferenceNotFound(std::string dependency)
    : ErrorRecord("The branch or reference specified for " + dependency +
                  " could not be retrieved"),
      dependency_(std::move(dependency)) {}

PathDependenciesNotReachable::PathDependenciesNotReachable(std::vector<std::string> dependencies)
    : ErrorRecord("The following path based dependencies could not be retrieved: " +
                  utils::join(dependencies, ", ")),
      dependencies_(std::move(dependencies)) {}

GoModulePathMismatch::GoModulePathMismatch(std::string goMod,
                                           std::string declaredPath,
                                           std::string discoveredPath)
    : ErrorRecord("The module path '" + declaredPath + "' found in " + goMod +
                  " doesn't match the actual path '" + discoveredPath +
                  "' in the dependency's go.mod"),
      goMod_(std::move(goMod)),
      declaredPath_(std::move(declaredPath)),
      discoveredPath_(std::move(discoveredPath)) {}

// ============================================================================
// Closed taxonomy
// ============================================================================

ErrorType typeOf(const ErrorKind& kind) noexcept {
    return std::visit([](const auto& k) { return std::decay_t<decltype(k)>::kType; }, kind);
}

namespace {

std::string renderMessage(const ErrorKind& kind) {
    return std::visit([](const auto& k) -> std::string {
        if (const auto& message = k.getMessage()) {
            return message->str();
        }
        return errorTypeName(std::decay_t<decltype(k)>::kType);
    }, kind);
}

} // namespace

DependabotError::DependabotError(ErrorKind kind)
    : std::runtime_error(renderMessage(kind)),
      kind_(std::move(kind)),
      message_(std::runtime_error::what()) {}

} // namespace dependabot::errors
