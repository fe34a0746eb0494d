#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "errors.hpp"
#include "meta_schema.hpp"

namespace TaggedJson {

class Registry;

// What a union needs to know about one payload type, independent of its C++ type
struct PayloadInfo {
    std::string_view name;
    SchemaRef (*schema_ref)() = nullptr;
    void (*register_type)(Registry&) = nullptr;
};

struct CaseDeclaration {
    std::string_view identifier;
    std::size_t payloadCount = 1;
    PayloadInfo payload;
    std::optional<std::string_view> explicitTag;
};

struct ExternalDocsRef {
    std::string_view url;
    std::optional<std::string_view> description;
};

template<std::size_t N>
struct UnionDeclaration {
    std::string_view name;
    std::optional<std::string_view> title;
    std::optional<std::string_view> description;
    std::string_view discriminatorProperty;
    std::optional<ExternalDocsRef> externalDocs;
    std::array<CaseDeclaration, N> cases;
};

struct ResolvedCase {
    std::string_view tag;
    std::size_t caseIndex = 0;
    PayloadInfo payload;
    bool hasExplicitTag = false;
};

template<std::size_t N>
class ResolveResult {
    DeclarationError m_error = DeclarationError::none;
    std::size_t m_errorCase = 0;
    std::array<ResolvedCase, N> m_cases{};

public:
    constexpr ResolveResult() = default;
    constexpr ResolveResult(DeclarationError err, std::size_t errorCase):
        m_error(err), m_errorCase(errorCase)
    {}
    constexpr explicit ResolveResult(const std::array<ResolvedCase, N>& cases):
        m_cases(cases)
    {}

    constexpr operator bool() const {
        return m_error == DeclarationError::none;
    }
    constexpr DeclarationError error() const {
        return m_error;
    }
    // Index of the offending case for invalid_case_shape
    constexpr std::size_t errorCase() const {
        return m_errorCase;
    }
    constexpr const std::array<ResolvedCase, N>& cases() const {
        return m_cases;
    }
};

// Turns declared cases into (tag, payload) pairs in declaration order. The tag is
// the explicit tag when one is declared, else the payload type name. Tags are not
// checked for uniqueness here; see check_unique_tags().
template<std::size_t N>
constexpr ResolveResult<N> resolve(const UnionDeclaration<N>& decl) {
    if(decl.discriminatorProperty.empty()) {
        return ResolveResult<N>(DeclarationError::empty_property_name, 0);
    }
    std::array<ResolvedCase, N> resolved{};
    for(std::size_t i = 0; i < N; i ++) {
        const CaseDeclaration& c = decl.cases[i];
        if(c.payloadCount != 1) {
            return ResolveResult<N>(DeclarationError::invalid_case_shape, i);
        }
        resolved[i] = ResolvedCase{
            c.explicitTag ? *c.explicitTag : c.payload.name,
            i,
            c.payload,
            c.explicitTag.has_value()
        };
    }
    return ResolveResult<N>(resolved);
}

// duplicate_tag when two cases resolve to the same tag; `first`/`second` receive
// the indexes of the first colliding pair
constexpr DeclarationError check_unique_tags(std::span<const ResolvedCase> cases,
                                             std::size_t* first = nullptr,
                                             std::size_t* second = nullptr) {
    for(std::size_t i = 0; i < cases.size(); i ++) {
        for(std::size_t j = i + 1; j < cases.size(); j ++) {
            if(cases[i].tag == cases[j].tag) {
                if(first) *first = i;
                if(second) *second = j;
                return DeclarationError::duplicate_tag;
            }
        }
    }
    return DeclarationError::none;
}

} // namespace TaggedJson
