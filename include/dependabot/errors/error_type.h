/**
 * @file error_type.h
 * @brief Identifiers for every recognized error kind
 */

#pragma once

#include <string>

namespace dependabot::errors {

/// @brief Error kind discriminator
enum class ErrorType {
    // General
    OUT_OF_DISK,
    OUT_OF_MEMORY,
    NOT_IMPLEMENTED,

    // Repo level
    DIRECTORY_NOT_FOUND,
    BRANCH_NOT_FOUND,
    REPO_NOT_FOUND,

    // File level
    TOOL_VERSION_NOT_SUPPORTED,
    DEPENDENCY_FILE_NOT_FOUND,
    DEPENDENCY_FILE_NOT_PARSEABLE,
    DEPENDENCY_FILE_NOT_EVALUATABLE,
    DEPENDENCY_FILE_NOT_RESOLVABLE,

    // Config file
    CONFIG_FILE_NOT_FOUND,

    // Source level
    PRIVATE_SOURCE_AUTHENTICATION_FAILURE,
    PRIVATE_SOURCE_TIMED_OUT,
    PRIVATE_SOURCE_CERTIFICATE_FAILURE,
    MISSING_ENVIRONMENT_VARIABLE,
    INCONSISTENT_REGISTRY_RESPONSE,  ///< Registry API disagrees with the update process

    // Dependency level
    GIT_DEPENDENCIES_NOT_REACHABLE,
    GIT_DEPENDENCY_REFERENCE_NOT_FOUND,
    PATH_DEPENDENCIES_NOT_REACHABLE,
    GO_MODULE_PATH_MISMATCH,
    ALL_VERSIONS_IGNORED,            ///< Every candidate update is ignored
    UNEXPECTED_EXTERNAL_CODE         ///< Parsing would execute external code
};

/// @brief Wire identifier (e.g. "dependency_file_not_found")
inline std::string errorTypeToString(ErrorType t) {
    switch (t) {
        case ErrorType::OUT_OF_DISK:                           return "out_of_disk";
        case ErrorType::OUT_OF_MEMORY:                         return "out_of_memory";
        case ErrorType::NOT_IMPLEMENTED:                       return "not_implemented";
        case ErrorType::DIRECTORY_NOT_FOUND:                   return "directory_not_found";
        case ErrorType::BRANCH_NOT_FOUND:                      return "branch_not_found";
        case ErrorType::REPO_NOT_FOUND:                        return "repo_not_found";
        case ErrorType::TOOL_VERSION_NOT_SUPPORTED:            return "tool_version_not_supported";
        case ErrorType::DEPENDENCY_FILE_NOT_FOUND:             return "dependency_file_not_found";
        case ErrorType::DEPENDENCY_FILE_NOT_PARSEABLE:         return "dependency_file_not_parseable";
        case ErrorType::DEPENDENCY_FILE_NOT_EVALUATABLE:       return "dependency_file_not_evaluatable";
        case ErrorType::DEPENDENCY_FILE_NOT_RESOLVABLE:        return "dependency_file_not_resolvable";
        case ErrorType::CONFIG_FILE_NOT_FOUND:                 return "config_file_not_found";
        case ErrorType::PRIVATE_SOURCE_AUTHENTICATION_FAILURE: return "private_source_authentication_failure";
        case ErrorType::PRIVATE_SOURCE_TIMED_OUT:              return "private_source_timed_out";
        case ErrorType::PRIVATE_SOURCE_CERTIFICATE_FAILURE:    return "private_source_certificate_failure";
        case ErrorType::MISSING_ENVIRONMENT_VARIABLE:          return "missing_environment_variable";
        case ErrorType::INCONSISTENT_REGISTRY_RESPONSE:        return "inconsistent_registry_response";
        case ErrorType::GIT_DEPENDENCIES_NOT_REACHABLE:        return "git_dependencies_not_reachable";
        case ErrorType::GIT_DEPENDENCY_REFERENCE_NOT_FOUND:    return "git_dependency_reference_not_found";
        case ErrorType::PATH_DEPENDENCIES_NOT_REACHABLE:       return "path_dependencies_not_reachable";
        case ErrorType::GO_MODULE_PATH_MISMATCH:               return "go_module_path_mismatch";
        case ErrorType::ALL_VERSIONS_IGNORED:                  return "all_versions_ignored";
        case ErrorType::UNEXPECTED_EXTERNAL_CODE:              return "unexpected_external_code";
    }
    return "unknown_error";
}

/// @brief Qualified kind name, rendered when an error carries no message
inline std::string errorTypeName(ErrorType t) {
    switch (t) {
        case ErrorType::OUT_OF_DISK:                           return "Dependabot::OutOfDisk";
        case ErrorType::OUT_OF_MEMORY:                         return "Dependabot::OutOfMemory";
        case ErrorType::NOT_IMPLEMENTED:                       return "Dependabot::NotImplemented";
        case ErrorType::DIRECTORY_NOT_FOUND:                   return "Dependabot::DirectoryNotFound";
        case ErrorType::BRANCH_NOT_FOUND:                      return "Dependabot::BranchNotFound";
        case ErrorType::REPO_NOT_FOUND:                        return "Dependabot::RepoNotFound";
        case ErrorType::TOOL_VERSION_NOT_SUPPORTED:            return "Dependabot::ToolVersionNotSupported";
        case ErrorType::DEPENDENCY_FILE_NOT_FOUND:             return "Dependabot::DependencyFileNotFound";
        case ErrorType::DEPENDENCY_FILE_NOT_PARSEABLE:         return "Dependabot::DependencyFileNotParseable";
        case ErrorType::DEPENDENCY_FILE_NOT_EVALUATABLE:       return "Dependabot::DependencyFileNotEvaluatable";
        case ErrorType::DEPENDENCY_FILE_NOT_RESOLVABLE:        return "Dependabot::DependencyFileNotResolvable";
        case ErrorType::CONFIG_FILE_NOT_FOUND:                 return "Dependabot::ConfigFileFileNotFound";
        case ErrorType::PRIVATE_SOURCE_AUTHENTICATION_FAILURE: return "Dependabot::PrivateSourceAuthenticationFailure";
        case ErrorType::PRIVATE_SOURCE_TIMED_OUT:              return "Dependabot::PrivateSourceTimedOut";
        case ErrorType::PRIVATE_SOURCE_CERTIFICATE_FAILURE:    return "Dependabot::PrivateSourceCertificateFailure";
        case ErrorType::MISSING_ENVIRONMENT_VARIABLE:          return "Dependabot::MissingEnvironmentVariable";
        case ErrorType::INCONSISTENT_REGISTRY_RESPONSE:        return "Dependabot::InconsistentRegistryResponse";
        case ErrorType::GIT_DEPENDENCIES_NOT_REACHABLE:        return "Dependabot::GitDependenciesNotReachable";
        case ErrorType::GIT_DEPENDENCY_REFERENCE_NOT_FOUND:    return "Dependabot::GitDependencyReferenceNotFound";
        case ErrorType::PATH_DEPENDENCIES_NOT_REACHABLE:       return "Dependabot::PathDependenciesNotReachable";
        case ErrorType::GO_MODULE_PATH_MISMATCH:               return "Dependabot::GoModulePathMismatch";
        case ErrorType::ALL_VERSIONS_IGNORED:                  return "Dependabot::AllVersionsIgnored";
        case ErrorType::UNEXPECTED_EXTERNAL_CODE:              return "Dependabot::UnexpectedExternalCode";
    }
    return "Dependabot::DependabotError";
}

} // namespace dependabot::errors
