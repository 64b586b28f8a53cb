#include <codegraph/graph/graph_schema.h>
#include <codegraph/graph/graph_writer.h>
#include <codegraph/graph/schema_guard.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace codegraph::graph {

using extraction::CallKind;
using extraction::ClassDecl;
using extraction::DocScope;
using extraction::FileRecord;
using extraction::ImportType;
using extraction::InterfaceDecl;
using extraction::MethodRecord;
using extraction::TypeKind;

namespace {

std::string typeKey(const std::string& file, const std::string& name) {
    return file + "::" + name;
}

std::string parentDirectory(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

std::string lastSegment(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

const char* labelFor(TypeKind kind) {
    return kind == TypeKind::Interface ? kInterface : kClass;
}

/**
 * Match a Class/Interface by declared type name. A lowercase qualifier is
 * taken as a package ("a.b.Base"); an uppercase one as an enclosing type
 * ("Outer.Inner"), in which case only the simple name is compared.
 */
NodeMatch typeMatch(const std::string& declaredType, std::vector<std::string> labels) {
    NodeMatch match;
    match.labels = std::move(labels);
    auto base = baseTypeName(declaredType);
    auto dot = base.rfind('.');
    if (dot == std::string::npos) {
        match.properties.emplace_back("name", base);
        return match;
    }
    auto qualifier = base.substr(0, dot);
    match.properties.emplace_back("name", base.substr(dot + 1));
    if (!qualifier.empty() && std::islower(static_cast<unsigned char>(qualifier.front())))
        match.properties.emplace_back("package", qualifier);
    return match;
}

std::string simpleName(const std::string& declaredType) {
    auto base = baseTypeName(declaredType);
    auto dot = base.rfind('.');
    return dot == std::string::npos ? base : base.substr(dot + 1);
}

// Writes requests in fixed-size batches and tallies the report
class BatchSink {
public:
    BatchSink(GraphStore& store, std::size_t batchSize, WriteReport& report)
        : store_(store), batchSize_(std::max<std::size_t>(1, batchSize)), report_(report) {}

    Result<void> nodes(const char* what, const std::vector<GraphNode>& items) {
        return inBatches(what, items, [&](const std::vector<GraphNode>& batch) -> Result<void> {
            auto r = store_.upsertNodes(batch);
            if (!r)
                return r.error();
            report_.nodeWrites += r.value();
            return {};
        });
    }

    Result<void> edges(const char* what, const std::vector<GraphEdge>& items) {
        return inBatches(what, items, [&](const std::vector<GraphEdge>& batch) -> Result<void> {
            auto r = store_.mergeEdges(batch);
            if (!r)
                return r.error();
            report_.relationshipWrites += r.value().written;
            report_.unresolvedLinks += r.value().unresolved;
            return {};
        });
    }

    Result<void> uniqueEdges(const char* what, const std::vector<UniqueMatchEdge>& items) {
        return inBatches(what, items,
                         [&](const std::vector<UniqueMatchEdge>& batch) -> Result<void> {
                             auto r = store_.mergeEdgesToUniqueMatch(batch);
                             if (!r)
                                 return r.error();
                             report_.relationshipWrites += r.value().written;
                             report_.unresolvedLinks += r.value().unresolved;
                             return {};
                         });
    }

private:
    template <typename T, typename Fn>
    Result<void> inBatches(const char* what, const std::vector<T>& items, Fn&& fn) {
        for (std::size_t start = 0; start < items.size(); start += batchSize_) {
            auto end = std::min(items.size(), start + batchSize_);
            std::vector<T> batch(items.begin() + static_cast<std::ptrdiff_t>(start),
                                 items.begin() + static_cast<std::ptrdiff_t>(end));
            if (auto r = fn(batch); !r) {
                spdlog::error("Writing {} failed at batch starting {}: {}", what, start,
                              r.error().message);
                return r;
            }
            ++report_.batchesWritten;
        }
        if (!items.empty())
            spdlog::debug("Wrote {} {}", items.size(), what);
        return {};
    }

    GraphStore& store_;
    std::size_t batchSize_;
    WriteReport& report_;
};

Result<void> validateEmbeddings(const EmbeddingSet& files, const EmbeddingSet& methods,
                                std::size_t fileCount, std::size_t methodCount) {
    if (!files.empty() && files.size() != fileCount) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("{} file embeddings for {} files", files.size(), fileCount)};
    }
    if (!methods.empty() && methods.size() != methodCount) {
        return Error{ErrorCode::InvalidData, fmt::format("{} method embeddings for {} methods",
                                                         methods.size(), methodCount)};
    }
    if (!files.empty() && !methods.empty() && files.width() != methods.width()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("File embeddings have width {} but method embeddings {}",
                                 files.width(), methods.width())};
    }
    return {};
}

} // namespace

std::vector<std::string> ancestorDirectories(const std::string& relativePath) {
    std::vector<std::string> dirs{""};
    std::size_t pos = 0;
    while ((pos = relativePath.find('/', pos)) != std::string::npos) {
        dirs.push_back(relativePath.substr(0, pos));
        ++pos;
    }
    return dirs;
}

std::string baseTypeName(const std::string& declaredType) {
    std::string out;
    int depth = 0;
    for (char c : declaredType) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c != '[' && c != ']' &&
                   !std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    while (out.size() >= 3 && out.compare(out.size() - 3, 3, "...") == 0)
        out.erase(out.size() - 3);
    return out;
}

GraphWriter::GraphWriter(GraphStore& store, WriterOptions options)
    : store_(store), options_(std::move(options)) {}

Result<WriteReport> GraphWriter::write(const std::vector<FileRecord>& input,
                                       const manifest::DependencyMap& dependencies,
                                       const EmbeddingSet& fileEmbeddings,
                                       const EmbeddingSet& methodEmbeddings) {
    std::vector<const FileRecord*> records;
    records.reserve(input.size());
    std::size_t methodCount = 0;
    for (const auto& r : input) {
        records.push_back(&r);
        methodCount += r.methods.size();
    }
    std::sort(records.begin(), records.end(),
              [](const FileRecord* a, const FileRecord* b) { return a->path < b->path; });

    if (auto v = validateEmbeddings(fileEmbeddings, methodEmbeddings, records.size(), methodCount);
        !v) {
        return v.error();
    }

    SchemaGuard guard(store_);
    if (auto g = guard.ensure(); !g) {
        return g.error();
    }

    const bool withEmbeddings = !fileEmbeddings.empty() || !methodEmbeddings.empty();
    const std::size_t batchSize =
        withEmbeddings ? options_.batchSizeWithEmbeddings : options_.batchSize;
    const std::string embeddingType =
        options_.embeddingType.empty() ? std::string("unknown") : options_.embeddingType;

    WriteReport report;
    BatchSink sink(store_, batchSize, report);
    spdlog::info("Writing graph for {} files ({} methods, batch size {})", records.size(),
                 methodCount, batchSize);

    // Directories
    {
        std::set<std::string> dirs;
        for (const auto* r : records) {
            auto ancestors = ancestorDirectories(r->path);
            dirs.insert(ancestors.begin(), ancestors.end());
        }
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        for (const auto& d : dirs) {
            nodes.push_back(GraphNode{kDirectory, d, {{"path", d}, {"name", lastSegment(d)}}});
            if (!d.empty()) {
                edges.push_back(GraphEdge{{kDirectory, parentDirectory(d)}, {kDirectory, d},
                                          kContains});
            }
        }
        if (auto r = sink.nodes("directories", nodes); !r)
            return r.error();
        if (auto r = sink.edges("directory hierarchy", edges); !r)
            return r.error();
    }

    // Files
    {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        for (std::size_t i = 0; i < records.size(); ++i) {
            const auto& r = *records[i];
            nlohmann::json props = {{"path", r.path},
                                    {"name", lastSegment(r.path)},
                                    {"language", r.language},
                                    {"ecosystem", r.ecosystem},
                                    {"package", r.package},
                                    {"total_lines", r.totalLines},
                                    {"code_lines", r.codeLines},
                                    {"method_count", r.methodCount()},
                                    {"class_count", r.classCount()},
                                    {"interface_count", r.interfaceCount()}};
            if (!fileEmbeddings.empty()) {
                props["embedding"] = fileEmbeddings.vectors[i];
                props["embedding_type"] = embeddingType;
            }
            nodes.push_back(GraphNode{kFile, r.path, std::move(props)});
            edges.push_back(GraphEdge{{kDirectory, parentDirectory(r.path)}, {kFile, r.path},
                                      kContains});
        }
        if (auto r = sink.nodes("files", nodes); !r)
            return r.error();
        if (auto r = sink.edges("directory files", edges); !r)
            return r.error();
    }

    // Classes and interfaces
    std::map<std::string, std::string> superclassOf; // type key -> declared superclass
    {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        for (const auto* r : records) {
            for (const auto& decl : r->types) {
                const auto& common = extraction::commonOf(decl);
                auto key = typeKey(common.file, common.name);
                nlohmann::json props = {{"name", common.name},
                                        {"file", common.file},
                                        {"package", common.package},
                                        {"line", common.line},
                                        {"end_line", common.endLine},
                                        {"modifiers", common.modifiers},
                                        {"deprecated", common.deprecated}};
                const char* label = labelFor(extraction::kindOf(decl));
                if (const auto* c = std::get_if<ClassDecl>(&decl)) {
                    props["is_abstract"] = c->isAbstract;
                    props["is_final"] = c->isFinal;
                    props["estimated_lines"] = c->estimatedLines;
                    if (!c->extends.empty())
                        superclassOf.emplace(key, c->extends.front());
                } else {
                    props["method_count"] = std::get<InterfaceDecl>(decl).methodCount;
                }
                nodes.push_back(GraphNode{label, key, std::move(props)});
                edges.push_back(GraphEdge{{kFile, r->path}, {label, key}, kDefines});
            }
        }
        if (auto r = sink.nodes("types", nodes); !r)
            return r.error();
        if (auto r = sink.edges("type definitions", edges); !r)
            return r.error();
    }

    // Inheritance, now that every type is known
    {
        std::vector<UniqueMatchEdge> edges;
        for (const auto* r : records) {
            for (const auto& decl : r->types) {
                const auto& common = extraction::commonOf(decl);
                NodeRef src{labelFor(extraction::kindOf(decl)), typeKey(common.file, common.name)};
                if (const auto* c = std::get_if<ClassDecl>(&decl)) {
                    for (const auto& base : c->extends)
                        edges.push_back({src, typeMatch(base, {kClass}), kExtends});
                    for (const auto& iface : c->implements)
                        edges.push_back({src, typeMatch(iface, {kInterface}), kImplements});
                } else {
                    for (const auto& base : std::get<InterfaceDecl>(decl).extends)
                        edges.push_back({src, typeMatch(base, {kInterface}), kExtends});
                }
            }
        }
        if (auto r = sink.uniqueEdges("inheritance", edges); !r)
            return r.error();
    }

    // Methods and ownership
    {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        std::size_t flat = 0;
        for (const auto* r : records) {
            for (const auto& m : r->methods) {
                nlohmann::json props = {{"id", m.signature},
                                        {"method_signature", m.signature},
                                        {"name", m.name},
                                        {"file", m.file},
                                        {"line", m.line},
                                        {"end_line", m.endLine},
                                        {"modifiers", m.modifiers},
                                        {"is_static", m.isStatic},
                                        {"is_abstract", m.isAbstract},
                                        {"is_final", m.isFinal},
                                        {"is_private", m.isPrivate},
                                        {"is_public", m.isPublic},
                                        {"return_type", m.returnType},
                                        {"estimated_lines", m.estimatedLines},
                                        {"cyclomatic_complexity", m.cyclomaticComplexity},
                                        {"deprecated", m.deprecated}};
                if (m.className)
                    props["class_name"] = *m.className;
                if (m.containingType)
                    props["containing_type"] = extraction::typeKindToString(*m.containingType);
                if (!methodEmbeddings.empty()) {
                    props["embedding"] = methodEmbeddings.vectors[flat];
                    props["embedding_type"] = embeddingType;
                }
                ++flat;
                nodes.push_back(GraphNode{kMethod, m.signature, std::move(props)});

                edges.push_back(GraphEdge{{kFile, r->path}, {kMethod, m.signature}, kDeclares});
                if (m.className) {
                    auto owner = labelFor(m.containingType.value_or(TypeKind::Class));
                    edges.push_back(GraphEdge{{owner, typeKey(m.file, *m.className)},
                                              {kMethod, m.signature},
                                              kContainsMethod});
                }
            }
        }
        if (auto r = sink.nodes("methods", nodes); !r)
            return r.error();
        if (auto r = sink.edges("method ownership", edges); !r)
            return r.error();
    }

    // Parameters
    {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        std::vector<UniqueMatchEdge> typeEdges;
        for (const auto* r : records) {
            for (const auto& m : r->methods) {
                for (std::size_t i = 0; i < m.parameters.size(); ++i) {
                    const auto& p = m.parameters[i];
                    auto key = m.signature + "@" + std::to_string(i);
                    nodes.push_back(GraphNode{kParameter, key,
                                              {{"method_signature", m.signature},
                                               {"index", i},
                                               {"name", p.name},
                                               {"type", p.type}}});
                    edges.push_back(GraphEdge{{kMethod, m.signature},
                                              {kParameter, key},
                                              kHasParameter,
                                              {{"index", i}}});
                    if (!baseTypeName(p.type).empty()) {
                        typeEdges.push_back(
                            {{kParameter, key}, typeMatch(p.type, {kClass, kInterface}), kOfType});
                    }
                }
            }
        }
        if (auto r = sink.nodes("parameters", nodes); !r)
            return r.error();
        if (auto r = sink.edges("method parameters", edges); !r)
            return r.error();
        if (auto r = sink.uniqueEdges("parameter types", typeEdges); !r)
            return r.error();
    }

    // Imports and external dependencies
    {
        std::vector<GraphNode> imports;
        std::vector<GraphEdge> importEdges;
        std::map<std::string, GraphNode> deps;
        std::vector<GraphEdge> depEdges;
        for (const auto* r : records) {
            for (const auto& imp : r->imports) {
                imports.push_back(
                    GraphNode{kImport,
                              imp.importPath,
                              {{"import_path", imp.importPath},
                               {"is_static", imp.isStatic},
                               {"is_wildcard", imp.isWildcard},
                               {"import_type", extraction::importTypeToString(imp.importType)}}});
                importEdges.push_back(
                    GraphEdge{{kFile, r->path}, {kImport, imp.importPath}, kImports});

                if (imp.importType != ImportType::External)
                    continue;
                auto match = dependencies.lookup(imp.importPath);
                if (match.package.empty())
                    continue;
                nlohmann::json props = {{"package", match.package},
                                        {"language", "java"},
                                        {"ecosystem", "maven"}};
                if (match.groupId)
                    props["group_id"] = *match.groupId;
                if (match.artifactId)
                    props["artifact_id"] = *match.artifactId;
                if (match.version)
                    props["version"] = *match.version;
                deps.try_emplace(match.package,
                                 GraphNode{kExternalDependency, match.package, std::move(props)});
                depEdges.push_back(GraphEdge{{kImport, imp.importPath},
                                             {kExternalDependency, match.package},
                                             kDependsOn});
            }
        }
        std::vector<GraphNode> depNodes;
        depNodes.reserve(deps.size());
        for (auto& [package, node] : deps)
            depNodes.push_back(std::move(node));

        if (auto r = sink.nodes("imports", imports); !r)
            return r.error();
        if (auto r = sink.edges("file imports", importEdges); !r)
            return r.error();
        if (auto r = sink.nodes("external dependencies", depNodes); !r)
            return r.error();
        if (auto r = sink.edges("import dependencies", depEdges); !r)
            return r.error();
    }

    // Calls and constructor targets
    {
        std::vector<UniqueMatchEdge> calls;
        std::vector<UniqueMatchEdge> instantiations;
        std::size_t skipped = 0;
        for (const auto* r : records) {
            for (const auto& m : r->methods) {
                NodeRef caller{kMethod, m.signature};
                for (const auto& call : m.calls) {
                    if (call.kind == CallKind::Constructor) {
                        instantiations.push_back(
                            {caller, typeMatch(call.targetClass.value_or(call.methodName), {kClass}),
                             kInstantiates});
                        continue;
                    }

                    NodeMatch target;
                    target.labels = {kMethod};
                    target.properties.emplace_back("name", call.methodName);
                    switch (call.kind) {
                        case CallKind::SameClass:
                        case CallKind::This:
                            if (!m.className) {
                                ++skipped;
                                continue;
                            }
                            target.properties.emplace_back("class_name", *m.className);
                            target.properties.emplace_back("file", m.file);
                            break;
                        case CallKind::Static:
                            target.properties.emplace_back(
                                "class_name", simpleName(call.targetClass.value_or("")));
                            target.properties.emplace_back("is_static", true);
                            break;
                        case CallKind::Instance:
                            target.properties.emplace_back("class_name",
                                                           call.targetClass.value_or(""));
                            break;
                        case CallKind::Super: {
                            auto it = m.className
                                          ? superclassOf.find(typeKey(m.file, *m.className))
                                          : superclassOf.end();
                            if (it == superclassOf.end()) {
                                ++skipped;
                                continue;
                            }
                            target.properties.emplace_back("class_name", simpleName(it->second));
                            break;
                        }
                        case CallKind::Constructor:
                            break;
                    }

                    nlohmann::json props = {{"type", extraction::callKindToString(call.kind)}};
                    if (call.qualifier)
                        props["qualifier"] = *call.qualifier;
                    calls.push_back({caller, std::move(target), kCalls, std::move(props)});
                }
            }
        }
        report.unresolvedLinks += skipped;
        if (auto r = sink.uniqueEdges("calls", calls); !r)
            return r.error();
        if (auto r = sink.uniqueEdges("constructor targets", instantiations); !r)
            return r.error();
    }

    // Documentation
    {
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
        for (const auto* r : records) {
            for (const auto& doc : r->docs) {
                NodeRef owner;
                switch (doc.scope) {
                    case DocScope::File:
                        owner = {kFile, r->path};
                        break;
                    case DocScope::Class:
                        owner = {kClass, typeKey(r->path, doc.owner)};
                        break;
                    case DocScope::Interface:
                        owner = {kInterface, typeKey(r->path, doc.owner)};
                        break;
                    case DocScope::Method:
                        owner = {kMethod, doc.owner};
                        break;
                }
                auto key = fmt::format("{}:{}@{}-{}", owner.label, owner.key, doc.startLine,
                                       doc.endLine);
                nodes.push_back(GraphNode{kDoc,
                                          key,
                                          {{"kind", doc.kind},
                                           {"scope", extraction::docScopeToString(doc.scope)},
                                           {"text", doc.text},
                                           {"file", r->path},
                                           {"owner_label", owner.label},
                                           {"owner_key", owner.key},
                                           {"start_line", doc.startLine},
                                           {"end_line", doc.endLine}}});
                edges.push_back(GraphEdge{owner, {kDoc, key}, kHasDoc});
            }
        }
        if (auto r = sink.nodes("docs", nodes); !r)
            return r.error();
        if (auto r = sink.edges("doc owners", edges); !r)
            return r.error();
    }

    spdlog::info("Graph write complete: {} batches, {} node writes, {} relationship writes, "
                 "{} unresolved links",
                 report.batchesWritten, report.nodeWrites, report.relationshipWrites,
                 report.unresolvedLinks);
    return report;
}

} // namespace codegraph::graph
