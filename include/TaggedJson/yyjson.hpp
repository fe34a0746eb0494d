#pragma once
#include <yyjson.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#ifndef TAGGEDJSON_WRITE_FLAGS
#define TAGGEDJSON_WRITE_FLAGS YYJSON_WRITE_NOFLAG
#endif

namespace TaggedJson {

namespace yyjson_detail {

struct DocDeleter {
    void operator()(yyjson_doc* doc) const noexcept { yyjson_doc_free(doc); }
};
struct MutDocDeleter {
    void operator()(yyjson_mut_doc* doc) const noexcept { yyjson_mut_doc_free(doc); }
};
struct CharsDeleter {
    void operator()(char* p) const noexcept { std::free(p); }
};

} // namespace yyjson_detail


// Owns an immutable yyjson document parsed from text
class YyjsonDocument {
public:
    explicit YyjsonDocument(std::string_view json, yyjson_read_flag flags = YYJSON_READ_NOFLAG)
        : doc_(yyjson_read_opts(const_cast<char*>(json.data()), json.size(), flags, nullptr, &err_))
    {}

    bool ok() const noexcept { return doc_ != nullptr; }
    yyjson_val* root() const noexcept { return doc_ ? yyjson_doc_get_root(doc_.get()) : nullptr; }
    const yyjson_read_err& error() const noexcept { return err_; }

private:
    yyjson_read_err err_{};
    std::unique_ptr<yyjson_doc, yyjson_detail::DocDeleter> doc_;
};


// Owns a mutable yyjson document that encoders build values into
class YyjsonMutDocument {
public:
    YyjsonMutDocument()
        : doc_(yyjson_mut_doc_new(nullptr))
    {}

    bool ok() const noexcept { return doc_ != nullptr; }
    yyjson_mut_doc* get() const noexcept { return doc_.get(); }

    yyjson_mut_val* root() const noexcept {
        return doc_ ? yyjson_mut_doc_get_root(doc_.get()) : nullptr;
    }
    void set_root(yyjson_mut_val* v) noexcept {
        yyjson_mut_doc_set_root(doc_.get(), v);
    }

    bool write(std::string& out, yyjson_write_flag flags = TAGGEDJSON_WRITE_FLAGS) const {
        if(!doc_) return false;
        std::size_t len = 0;
        std::unique_ptr<char, yyjson_detail::CharsDeleter> text(yyjson_mut_write(doc_.get(), flags, &len));
        if(!text) return false;
        out.assign(text.get(), len);
        return true;
    }

private:
    std::unique_ptr<yyjson_mut_doc, yyjson_detail::MutDocDeleter> doc_;
};

inline std::string_view string_of(yyjson_val* v) {
    return std::string_view(yyjson_get_str(v), yyjson_get_len(v));
}

} // namespace TaggedJson
