#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <utility>

#include "declaration.hpp"
#include "errors.hpp"
#include "meta_schema.hpp"

namespace TaggedJson {

class SchemaBuildResult {
    SchemaBuildError m_error = SchemaBuildError::none;
    std::size_t m_errorCase = 0;
    MetaSchema m_schema;

public:
    SchemaBuildResult(SchemaBuildError err, std::size_t errorCase):
        m_error(err), m_errorCase(errorCase)
    {}
    explicit SchemaBuildResult(MetaSchema schema):
        m_schema(std::move(schema))
    {}

    operator bool() const {
        return m_error == SchemaBuildError::none;
    }
    SchemaBuildError error() const {
        return m_error;
    }
    std::size_t errorCase() const {
        return m_errorCase;
    }
    const MetaSchema& schema() const & {
        return m_schema;
    }
    MetaSchema&& schema() && {
        return std::move(m_schema);
    }
};

// Discriminated union schema:
//   {"type":"object", "title", "description", "externalDocs",
//    "properties":{<property>:{"type":"string","enum":[tags...]}},
//    "oneOf":[payload schemas...],
//    "discriminator":{"propertyName":<property>,"mapping":{<explicit tag>:<ref>...}}}
// Tags keep declaration order and duplicates. Only explicitly tagged cases get a
// mapping entry, and those must have a referenced (named) schema.
template<std::size_t N>
SchemaBuildResult BuildSchema(const UnionDeclaration<N>& decl, std::span<const ResolvedCase> resolved) {
    MetaSchema schema("object");
    if(decl.title) schema.title = std::string(*decl.title);
    if(decl.description) schema.description = std::string(*decl.description);
    if(decl.externalDocs) {
        MetaExternalDocument docs;
        docs.url = std::string(decl.externalDocs->url);
        if(decl.externalDocs->description) {
            docs.description = std::string(*decl.externalDocs->description);
        }
        schema.external_docs = std::move(docs);
    }

    MetaSchema tagSchema("string");
    MetaDiscriminatorObject discriminator;
    discriminator.property_name = std::string(decl.discriminatorProperty);

    for(const ResolvedCase& c: resolved) {
        SchemaRef ref = c.payload.schema_ref();
        if(c.hasExplicitTag) {
            auto name = ref.unwrap_reference();
            if(!name) {
                return SchemaBuildResult(SchemaBuildError::not_a_reference, c.caseIndex);
            }
            discriminator.mapping.emplace_back(std::string(c.tag), reference_string(*name));
        }
        tagSchema.enum_items.emplace_back(c.tag);
        schema.one_of.push_back(std::move(ref));
    }

    schema.properties.emplace_back(std::string(decl.discriminatorProperty), SchemaRef::Inline(std::move(tagSchema)));
    schema.discriminator = std::move(discriminator);
    return SchemaBuildResult(std::move(schema));
}

} // namespace TaggedJson
