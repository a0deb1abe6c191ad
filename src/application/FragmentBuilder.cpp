/**
 * @file FragmentBuilder.cpp
 * @brief Implementation of FragmentBuilder.
 */

#include "application/FragmentBuilder.hpp"
#include "domain/ResultNormalizer.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace archlens::application {

using domain::LayerGroup;
using domain::ModuleRecord;
using domain::PatternClassification;
using domain::PatternName;
using domain::RelationshipRecord;
using domain::ResultNormalizer;

namespace {

const char* const kRecognizedFields[] = {
    "modules", "relationships", "pattern", "summary", "layers", "entryPoints", "coreComponents"};

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Value of a string field, or empty when absent or not a string.
std::string StringField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return Trim(it->get<std::string>());
}

// First non-empty string among several alternate spellings of one field.
std::string FirstStringField(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        std::string value = StringField(obj, key);
        if (!value.empty()) return value;
    }
    return "";
}

const nlohmann::json& FieldOrNull(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json kNull;
    if (!obj.is_object()) return kNull;
    auto it = obj.find(key);
    return it == obj.end() ? kNull : *it;
}

double ClampConfidence(double value) {
    // Percent-style answers ("85") are scaled down before clamping.
    if (value > 1.0 && value <= 100.0) value /= 100.0;
    return std::clamp(value, 0.0, 1.0);
}

void AppendUnique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

bool FragmentBuilder::HasRecognizedField(const nlohmann::json& doc) {
    if (!doc.is_object()) return false;
    for (const char* field : kRecognizedFields) {
        if (doc.contains(field)) return true;
    }
    return false;
}

std::vector<std::string> FragmentBuilder::BuildStringList(const nlohmann::json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (!item.is_string()) continue;
        std::string text = Trim(item.get<std::string>());
        if (!text.empty()) out.push_back(std::move(text));
    }
    return out;
}

std::vector<ModuleRecord> FragmentBuilder::BuildModules(const nlohmann::json& value,
                                                        const std::vector<domain::SourceFile>& batch) {
    std::vector<ModuleRecord> modules;
    if (!value.is_array()) return modules;

    for (const auto& item : value) {
        if (item.is_string()) {
            std::string path = Trim(item.get<std::string>());
            if (!path.empty()) modules.push_back(ResultNormalizer::SynthesizeModule(path));
            continue;
        }
        if (!item.is_object()) continue;

        ModuleRecord module;
        module.name = StringField(item, "name");
        module.path = StringField(item, "path");
        if (module.path.empty() && !module.name.empty()) {
            auto owner = std::find_if(batch.begin(), batch.end(), [&module](const domain::SourceFile& f) {
                return f.path.find(module.name) != std::string::npos;
            });
            module.path = owner != batch.end() ? owner->path : module.name;
        }
        if (module.path.empty()) continue;
        if (module.name.empty()) module.name = ResultNormalizer::ModuleNameFromPath(module.path);

        module.type = domain::ParseModuleType(StringField(item, "type"))
                          .value_or(ResultNormalizer::InferModuleType(module.path));
        module.layer = domain::ParseLayer(StringField(item, "layer"))
                           .value_or(ResultNormalizer::InferLayer(module.path));
        module.description = StringField(item, "description");
        module.exports = BuildStringList(FieldOrNull(item, "exports"));
        module.imports = BuildStringList(FieldOrNull(item, "imports"));
        modules.push_back(std::move(module));
    }
    return modules;
}

std::vector<RelationshipRecord> FragmentBuilder::BuildRelationships(const nlohmann::json& value) {
    std::vector<RelationshipRecord> relationships;
    if (!value.is_array()) return relationships;

    for (const auto& item : value) {
        if (!item.is_object()) continue;

        const std::string from = FirstStringField(item, {"from", "source", "parentModule", "parent"});
        const std::string description = StringField(item, "description");
        const auto strength = domain::ParseStrength(StringField(item, "strength"))
                                  .value_or(domain::RelationshipStrength::Medium);

        const nlohmann::json& children = FieldOrNull(item, "childModules");
        if (children.is_array()) {
            const auto type = domain::ParseRelationshipType(StringField(item, "type"))
                                  .value_or(domain::RelationshipType::Uses);
            for (const auto& child : BuildStringList(children)) {
                if (from.empty()) break;
                relationships.push_back({from, child, type, strength, description});
            }
            continue;
        }

        const std::string to = FirstStringField(item, {"to", "target", "childModule", "child"});
        if (from.empty() || to.empty()) continue;
        const auto type = domain::ParseRelationshipType(StringField(item, "type"))
                              .value_or(domain::RelationshipType::Depends);
        relationships.push_back({from, to, type, strength, description});
    }
    return relationships;
}

PatternClassification FragmentBuilder::BuildPattern(const nlohmann::json& value,
                                                    const std::vector<ModuleRecord>& modules,
                                                    const std::vector<RelationshipRecord>& relationships) {
    if (value.is_string()) {
        const std::string text = Trim(value.get<std::string>());
        const PatternName name = ResultNormalizer::CanonicalPatternName(text);
        return {name, name != PatternName::Unknown ? 0.8 : 0.5, text};
    }

    if (value.is_object()) {
        PatternClassification pattern;
        pattern.name = ResultNormalizer::CanonicalPatternName(StringField(value, "name"));

        const nlohmann::json& confidence = FieldOrNull(value, "confidence");
        if (confidence.is_number() && confidence.get<double>() > 0.0) {
            pattern.confidence = ClampConfidence(confidence.get<double>());
        } else {
            pattern.confidence = pattern.name != PatternName::Unknown ? 0.7 : 0.3;
        }

        pattern.description = StringField(value, "description");
        if (pattern.description.empty()) {
            pattern.description = "Architecture pattern: " + domain::ToString(pattern.name);
        }
        return pattern;
    }

    return ResultNormalizer::ClassifyPattern(modules, relationships);
}

std::vector<LayerGroup> FragmentBuilder::BuildLayers(const nlohmann::json& value,
                                                     const std::vector<ModuleRecord>& modules) {
    if (!value.is_array() || value.empty()) {
        return ResultNormalizer::GroupByLayers(modules);
    }

    std::vector<LayerGroup> layers;
    for (const auto& item : value) {
        LayerGroup group;
        if (item.is_string()) {
            group.name = Trim(item.get<std::string>());
        } else if (item.is_object()) {
            group.name = StringField(item, "name");
            for (const auto& path : BuildStringList(FieldOrNull(item, "modules"))) {
                AppendUnique(group.modules, path);
            }
        }
        if (group.name.empty()) continue;

        if (group.modules.empty()) {
            const std::string lowered = ToLower(group.name);
            for (const auto& module : modules) {
                const std::string layerName = domain::ToString(module.layer);
                if (lowered.find(layerName) != std::string::npos || layerName.find(lowered) != std::string::npos) {
                    AppendUnique(group.modules, module.path);
                }
            }
        }
        layers.push_back(std::move(group));
    }

    if (layers.empty()) {
        return ResultNormalizer::GroupByLayers(modules);
    }
    return layers;
}

domain::RecoveryFragment FragmentBuilder::Build(const nlohmann::json& doc,
                                                const std::vector<domain::SourceFile>& batch,
                                                domain::RecoveryTier tier) {
    domain::RecoveryFragment fragment;
    fragment.tier = tier;
    fragment.modules = BuildModules(FieldOrNull(doc, "modules"), batch);
    fragment.relationships = BuildRelationships(FieldOrNull(doc, "relationships"));

    if (fragment.modules.empty()) {
        for (const auto& file : batch) {
            fragment.modules.push_back(ResultNormalizer::SynthesizeModule(file));
        }
    }

    fragment.pattern = BuildPattern(FieldOrNull(doc, "pattern"), fragment.modules, fragment.relationships);
    fragment.layers = BuildLayers(FieldOrNull(doc, "layers"), fragment.modules);

    fragment.summary = StringField(doc, "summary");
    if (fragment.summary.empty()) {
        fragment.summary = "Chunk analysis: " + std::to_string(fragment.modules.size()) + " modules, " +
                           std::to_string(fragment.relationships.size()) + " relationships";
    }

    fragment.entryPoints = BuildStringList(FieldOrNull(doc, "entryPoints"));
    fragment.coreComponents = BuildStringList(FieldOrNull(doc, "coreComponents"));
    return fragment;
}

} // namespace archlens::application
