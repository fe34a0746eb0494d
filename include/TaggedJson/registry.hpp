#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "meta_schema.hpp"
#include "yyjson.hpp"

namespace TaggedJson {

// Deduplicating store of named schema components shared by one API document.
//
// create_schema() inserts a name at most once. The entry is reserved before the
// builder runs, so a type whose schema reaches itself again through nested
// register_type() calls terminates instead of recursing; other threads
// registering the same name wait for the first registration to complete.
//
// Builders run with the registry lock held by the calling thread. A builder may
// register further names itself, but must not hand registration to another
// thread and wait for it: that thread blocks on the lock and both deadlock.
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Returns true when `name` was inserted by this call
    template<class Builder>
    bool create_schema(std::string_view name, Builder&& build) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto [it, inserted] = schemas_.try_emplace(std::string(name));
        if(!inserted) {
            return false;
        }
        try {
            MetaSchema schema = std::invoke(std::forward<Builder>(build));
            schemas_.find(name)->second = std::move(schema);
        } catch(...) {
            schemas_.erase(std::string(name));
            throw;
        }
        return true;
    }

    bool contains(std::string_view name) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return schemas_.find(name) != schemas_.end();
    }

    std::optional<MetaSchema> find(std::string_view name) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = schemas_.find(name);
        if(it == schemas_.end() || !it->second) return std::nullopt;
        return *it->second;
    }

    std::size_t size() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return schemas_.size();
    }

    // Completed entries ordered by name
    std::vector<std::pair<std::string, MetaSchema>> schemas() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<std::pair<std::string, MetaSchema>> out;
        out.reserve(schemas_.size());
        for(const auto & [name, schema]: schemas_) {
            if(schema) out.emplace_back(name, *schema);
        }
        return out;
    }

private:
    mutable std::recursive_mutex mutex_;
    std::map<std::string, std::optional<MetaSchema>, std::less<>> schemas_;
};


// {"components":{"schemas":{"<name>":{...},...}}}
inline yyjson_mut_val* WriteComponents(const Registry& registry, yyjson_mut_doc* doc) {
    using schema_writer_detail::add_value;
    yyjson_mut_val* root = yyjson_mut_obj(doc);
    yyjson_mut_val* components = yyjson_mut_obj(doc);
    yyjson_mut_val* schemas = yyjson_mut_obj(doc);
    if(!root || !components || !schemas) return nullptr;
    for(const auto & [name, schema]: registry.schemas()) {
        if(!add_value(doc, schemas, name, WriteSchema(schema, doc))) return nullptr;
    }
    if(!add_value(doc, components, "schemas", schemas)) return nullptr;
    if(!add_value(doc, root, "components", components)) return nullptr;
    return root;
}

inline bool ComponentsToString(const Registry& registry, std::string& out,
                               yyjson_write_flag flags = TAGGEDJSON_WRITE_FLAGS) {
    YyjsonMutDocument doc;
    if(!doc.ok()) return false;
    yyjson_mut_val* root = WriteComponents(registry, doc.get());
    if(!root) return false;
    doc.set_root(root);
    return doc.write(out, flags);
}

inline bool SchemaToString(const SchemaRef& schema, std::string& out,
                           yyjson_write_flag flags = TAGGEDJSON_WRITE_FLAGS) {
    YyjsonMutDocument doc;
    if(!doc.ok()) return false;
    yyjson_mut_val* root = WriteSchema(schema, doc.get());
    if(!root) return false;
    doc.set_root(root);
    return doc.write(out, flags);
}

} // namespace TaggedJson
