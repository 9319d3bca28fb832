/**
 * @file error_report.cpp
 * @brief JSON rendering and logging of taxonomy errors
 */

#include "dependabot/errors/error_report.h"

#include <type_traits>
#include <spdlog/spdlog.h>

namespace dependabot::errors {

namespace {

Json::Value toJsonArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

void addKindFields(Json::Value& detail, const DirectoryNotFound& e) {
    detail["directory-name"] = e.getDirectoryName();
}

void addKindFields(Json::Value& detail, const BranchNotFound& e) {
    detail["branch-name"] = e.getBranchName();
}

void addKindFields(Json::Value& detail, const RepoNotFound& e) {
    detail["source"] = e.getSourceUrl();
}

void addKindFields(Json::Value& detail, const ToolVersionNotSupported& e) {
    detail["tool-name"] = e.getToolName();
    detail["detected-version"] = e.getDetectedVersion();
    detail["supported-versions"] = e.getSupportedVersions();
}

void addKindFields(Json::Value& detail, const DependencyFileError& e) {
    detail["file-path"] = e.getFilePath();
}

void addKindFields(Json::Value& detail, const PrivateSourceError& e) {
    detail["source"] = e.getSource();
}

void addKindFields(Json::Value& detail, const MissingEnvironmentVariable& e) {
    detail["environment-variable"] = e.getEnvironmentVariable();
}

void addKindFields(Json::Value& detail, const GitDependenciesNotReachable& e) {
    detail["dependency-urls"] = toJsonArray(e.getDependencyUrls());
}

void addKindFields(Json::Value& detail, const GitDependencyReferenceNotFound& e) {
    detail["dependency"] = e.getDependency();
}

void addKindFields(Json::Value& detail, const PathDependenciesNotReachable& e) {
    detail["dependencies"] = toJsonArray(e.getDependencies());
}

void addKindFields(Json::Value& detail, const GoModulePathMismatch& e) {
    detail["go-mod"] = e.getGoMod();
    detail["declared-path"] = e.getDeclaredPath();
    detail["discovered-path"] = e.getDiscoveredPath();
}

// Marker kinds carry nothing besides the message
template <ErrorType Type>
void addKindFields(Json::Value&, const MarkerError<Type>&) {}

} // namespace

Json::Value errorDetails(const ErrorKind& kind) {
    return std::visit([](const auto& k) {
        Json::Value detail(Json::objectValue);
        if (const auto& message = k.getMessage()) {
            detail["message"] = message->str();
        }
        addKindFields(detail, k);
        return detail;
    }, kind);
}

Json::Value toJson(const DependabotError& error) {
    Json::Value report;
    report["error-type"] = errorTypeToString(error.getType());
    report["error-detail"] = errorDetails(error.getKind());
    return report;
}

std::string toJsonString(const DependabotError& error) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact JSON
    return Json::writeString(writer, toJson(error));
}

void logError(const std::string& logContext, const DependabotError& error) {
    spdlog::error("[{}] {}: {}", logContext, errorTypeToString(error.getType()), error.getMessage());
}

} // namespace dependabot::errors
