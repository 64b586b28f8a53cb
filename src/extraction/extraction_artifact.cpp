#include <codegraph/extraction/extraction_artifact.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace codegraph::extraction {

using nlohmann::json;

namespace {

template <typename T> std::optional<T> optionalField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

template <typename T> std::vector<T> listField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return {};
    return it->get<std::vector<T>>();
}

void commonToJson(json& j, const TypeCommon& t) {
    j["name"] = t.name;
    j["file"] = t.file;
    j["package"] = t.package;
    j["line"] = t.line;
    j["end_line"] = t.endLine;
    j["modifiers"] = t.modifiers;
    j["deprecated"] = t.deprecated;
}

void commonFromJson(const json& j, TypeCommon& t) {
    t.name = j.at("name").get<std::string>();
    t.file = j.value("file", std::string{});
    t.package = j.value("package", std::string{});
    t.line = j.value("line", 0);
    t.endLine = j.value("end_line", t.line);
    t.modifiers = listField<std::string>(j, "modifiers");
    t.deprecated = j.value("deprecated", false);
}

json classToJson(const ClassDecl& c) {
    json j;
    commonToJson(j, c);
    j["extends"] = c.extends;
    j["implements"] = c.implements;
    j["is_abstract"] = c.isAbstract;
    j["is_final"] = c.isFinal;
    j["estimated_lines"] = c.estimatedLines;
    return j;
}

ClassDecl classFromJson(const json& j) {
    ClassDecl c;
    commonFromJson(j, c);
    c.extends = listField<std::string>(j, "extends");
    c.implements = listField<std::string>(j, "implements");
    c.isAbstract = j.value("is_abstract", false);
    c.isFinal = j.value("is_final", false);
    c.estimatedLines = j.value("estimated_lines", std::max(0, c.endLine - c.line));
    return c;
}

json interfaceToJson(const InterfaceDecl& i) {
    json j;
    commonToJson(j, i);
    j["extends"] = i.extends;
    j["method_count"] = i.methodCount;
    return j;
}

InterfaceDecl interfaceFromJson(const json& j) {
    InterfaceDecl i;
    commonFromJson(j, i);
    i.extends = listField<std::string>(j, "extends");
    i.methodCount = j.value("method_count", 0);
    return i;
}

} // namespace

void to_json(json& j, const CallSite& c) {
    j = json{{"method_name", c.methodName}, {"kind", callKindToString(c.kind)}};
    if (c.targetClass)
        j["target_class"] = *c.targetClass;
    if (c.qualifier)
        j["qualifier"] = *c.qualifier;
}

void from_json(const json& j, CallSite& c) {
    c.methodName = j.at("method_name").get<std::string>();
    c.targetClass = optionalField<std::string>(j, "target_class");
    c.qualifier = optionalField<std::string>(j, "qualifier");
    auto kind = callKindFromString(j.value("kind", std::string{"same_class"}));
    if (!kind) {
        throw std::invalid_argument("unknown call kind: " + j.value("kind", std::string{}));
    }
    c.kind = *kind;
}

void to_json(json& j, const ParameterRecord& p) {
    j = json{{"name", p.name}, {"type", p.type}};
}

void from_json(const json& j, ParameterRecord& p) {
    p.name = j.value("name", std::string{});
    p.type = j.value("type", std::string{});
}

void to_json(json& j, const MethodRecord& m) {
    j = json{{"name", m.name},
             {"file", m.file},
             {"line", m.line},
             {"end_line", m.endLine},
             {"method_signature", m.signature},
             {"parameters", m.parameters},
             {"modifiers", m.modifiers},
             {"is_static", m.isStatic},
             {"is_abstract", m.isAbstract},
             {"is_final", m.isFinal},
             {"is_private", m.isPrivate},
             {"is_public", m.isPublic},
             {"return_type", m.returnType},
             {"estimated_lines", m.estimatedLines},
             {"cyclomatic_complexity", m.cyclomaticComplexity},
             {"deprecated", m.deprecated},
             {"code", m.code},
             {"calls", m.calls}};
    j["class_name"] = m.className ? json(*m.className) : json(nullptr);
    j["containing_type"] =
        m.containingType ? json(typeKindToString(*m.containingType)) : json(nullptr);
}

void from_json(const json& j, MethodRecord& m) {
    m.name = j.at("name").get<std::string>();
    m.file = j.value("file", std::string{});
    m.line = j.value("line", 0);
    m.endLine = j.value("end_line", m.line);
    m.signature = j.value("method_signature", std::string{});
    m.className = optionalField<std::string>(j, "class_name");
    if (auto kind = optionalField<std::string>(j, "containing_type")) {
        m.containingType = *kind == "interface" ? TypeKind::Interface : TypeKind::Class;
    }
    m.parameters = listField<ParameterRecord>(j, "parameters");
    m.modifiers = listField<std::string>(j, "modifiers");
    m.isStatic = j.value("is_static", false);
    m.isAbstract = j.value("is_abstract", false);
    m.isFinal = j.value("is_final", false);
    m.isPrivate = j.value("is_private", false);
    m.isPublic = j.value("is_public", false);
    m.returnType = j.value("return_type", std::string{"void"});
    m.estimatedLines = j.value("estimated_lines", std::max(1, m.endLine - m.line + 1));
    m.cyclomaticComplexity = j.value("cyclomatic_complexity", 1);
    m.deprecated = j.value("deprecated", false);
    m.code = j.value("code", std::string{});
    m.calls = listField<CallSite>(j, "calls");
}

void to_json(json& j, const ImportRecord& i) {
    j = json{{"import_path", i.importPath},
             {"is_static", i.isStatic},
             {"is_wildcard", i.isWildcard},
             {"import_type", importTypeToString(i.importType)}};
}

void from_json(const json& j, ImportRecord& i) {
    i.importPath = j.at("import_path").get<std::string>();
    i.isStatic = j.value("is_static", false);
    i.isWildcard = j.value("is_wildcard", false);
    i.importType = importTypeFromString(j.value("import_type", std::string{}))
                       .value_or(ImportType::External);
}

void to_json(json& j, const DocRecord& d) {
    j = json{{"kind", d.kind},
             {"scope", docScopeToString(d.scope)},
             {"owner", d.owner},
             {"text", d.text},
             {"start_line", d.startLine},
             {"end_line", d.endLine}};
}

void from_json(const json& j, DocRecord& d) {
    d.kind = j.value("kind", std::string{"javadoc"});
    d.scope = docScopeFromString(j.value("scope", std::string{})).value_or(DocScope::File);
    d.owner = j.value("owner", std::string{});
    d.text = j.value("text", std::string{});
    d.startLine = j.value("start_line", 0);
    d.endLine = j.value("end_line", d.startLine);
}

void to_json(json& j, const FileRecord& f) {
    json classes = json::array();
    json interfaces = json::array();
    for (const auto& t : f.types) {
        if (const auto* c = std::get_if<ClassDecl>(&t))
            classes.push_back(classToJson(*c));
        else
            interfaces.push_back(interfaceToJson(std::get<InterfaceDecl>(t)));
    }
    j = json{{"path", f.path},
             {"code", f.code},
             {"package", f.package},
             {"language", f.language},
             {"ecosystem", f.ecosystem},
             {"methods", f.methods},
             {"classes", std::move(classes)},
             {"interfaces", std::move(interfaces)},
             {"imports", f.imports},
             {"docs", f.docs},
             {"total_lines", f.totalLines},
             {"code_lines", f.codeLines},
             {"method_count", f.methodCount()},
             {"class_count", f.classCount()},
             {"interface_count", f.interfaceCount()}};
}

void from_json(const json& j, FileRecord& f) {
    f.path = j.at("path").get<std::string>();
    f.code = j.value("code", std::string{});
    f.package = j.value("package", std::string{});
    f.language = j.value("language", std::string{"java"});
    f.ecosystem = j.value("ecosystem", std::string{"maven"});
    f.methods = listField<MethodRecord>(j, "methods");
    f.imports = listField<ImportRecord>(j, "imports");
    f.docs = listField<DocRecord>(j, "docs");
    f.totalLines = j.value("total_lines", 0);
    f.codeLines = j.value("code_lines", 0);

    f.types.clear();
    if (auto it = j.find("classes"); it != j.end() && it->is_array()) {
        for (const auto& c : *it)
            f.types.emplace_back(classFromJson(c));
    }
    if (auto it = j.find("interfaces"); it != j.end() && it->is_array()) {
        for (const auto& i : *it)
            f.types.emplace_back(interfaceFromJson(i));
    }
    // Restore declaration order
    std::stable_sort(f.types.begin(), f.types.end(), [](const auto& a, const auto& b) {
        return commonOf(a).line < commonOf(b).line;
    });
}

json artifactToJson(const std::vector<FileRecord>& records) {
    json out = json::array();
    for (const auto& r : records)
        out.push_back(r);
    return out;
}

Result<std::vector<FileRecord>> artifactFromJson(const json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "Extraction artifact must be a JSON array"};
    }
    std::vector<FileRecord> records;
    records.reserve(doc.size());
    for (std::size_t idx = 0; idx < doc.size(); ++idx) {
        const auto& entry = doc[idx];
        if (!entry.is_object()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Extraction artifact entry {} is not an object", idx)};
        }
        try {
            records.push_back(entry.get<FileRecord>());
        } catch (const json::exception& e) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Extraction artifact entry {}: {}", idx, e.what())};
        } catch (const std::invalid_argument& e) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Extraction artifact entry {}: {}", idx, e.what())};
        }
    }
    return records;
}

Result<void> saveArtifact(const std::vector<FileRecord>& records,
                          const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Error{ErrorCode::IOError, "Cannot open artifact for writing: " + path.string()};
    }
    ofs << artifactToJson(records).dump(2) << '\n';
    ofs.close();
    if (!ofs) {
        return Error{ErrorCode::IOError, "Failed to write artifact: " + path.string()};
    }
    spdlog::info("Saved extraction artifact with {} files to {}", records.size(), path.string());
    return {};
}

Result<std::vector<FileRecord>> loadArtifact(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Error{ErrorCode::FileNotFound, "Extraction artifact not found: " + path.string()};
    }
    json doc;
    try {
        ifs >> doc;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Malformed extraction artifact {}: {}", path.string(), e.what())};
    }
    return artifactFromJson(doc);
}

} // namespace codegraph::extraction
