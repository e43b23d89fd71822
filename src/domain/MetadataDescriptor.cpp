/**
 * @file MetadataDescriptor.cpp
 * @brief Implementation of MetadataDescriptor.
 */
#include "domain/MetadataDescriptor.hpp"

namespace sourceproof::domain {

namespace {

std::string StringAt(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

} // namespace

MetadataDescriptor::MetadataDescriptor(nlohmann::json document)
    : m_document(std::move(document)) {
    if (m_document.is_object() && m_document.contains("settings")) {
        m_settings = m_document["settings"];
    }
}

std::string MetadataDescriptor::language() const {
    return StringAt(m_document, "language");
}

std::string MetadataDescriptor::compilerVersion() const {
    if (!m_document.is_object() || !m_document.contains("compiler")) return {};
    return StringAt(m_document["compiler"], "version");
}

nlohmann::json MetadataDescriptor::compilationTargetJson() const {
    if (m_settings.is_object() && m_settings.contains("compilationTarget")) {
        return m_settings["compilationTarget"];
    }
    return nlohmann::json::object();
}

std::optional<CompilationTarget> MetadataDescriptor::compilationTarget() const {
    const nlohmann::json target = compilationTargetJson();
    if (!target.is_object() || target.size() != 1) {
        return std::nullopt;
    }

    auto it = target.begin();
    if (!it.value().is_string() || it.value().get<std::string>().empty()) {
        return std::nullopt;
    }
    return CompilationTarget{it.key(), it.value().get<std::string>()};
}

std::map<std::string, DeclaredSource> MetadataDescriptor::sources() const {
    std::map<std::string, DeclaredSource> declared;
    if (!m_document.is_object() || !m_document.contains("sources") || !m_document["sources"].is_object()) {
        return declared;
    }

    for (auto it = m_document["sources"].begin(); it != m_document["sources"].end(); ++it) {
        DeclaredSource entry;
        entry.keccak256 = StringAt(it.value(), "keccak256");
        // An empty literal is treated as absent, same as a missing key.
        std::string content = StringAt(it.value(), "content");
        if (!content.empty()) {
            entry.content = std::move(content);
        }
        declared.emplace(it.key(), std::move(entry));
    }
    return declared;
}

} // namespace sourceproof::domain
