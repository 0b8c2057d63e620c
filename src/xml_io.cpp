
#include "lwarray/document.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <istream>
#include <limits>
#include <memory>
#include <sstream>
#include <vector>

#include <expat.h>
#include <zlib.h>

namespace lwarray {

namespace internal {

// Drives a ContentHandler from expat. Exceptions raised by the handler are
// parked, the parse is stopped, and the exception is rethrown from feed()
// once control is back on the C++ side.
class XmlReader {
public:
    XmlReader(Document& doc, const ReadOptions& opts)
        : handler_(doc, opts), parser_(::XML_ParserCreate(nullptr), &::XML_ParserFree) {
        if (!parser_) throw LwError(ErrorKind::XmlParse, "failed to create XML parser");
        ::XML_SetUserData(parser_.get(), this);
        ::XML_SetElementHandler(parser_.get(), &XmlReader::on_start, &XmlReader::on_end);
        ::XML_SetCharacterDataHandler(parser_.get(), &XmlReader::on_text);
    }

    void feed(const char* data, std::size_t len, bool final) {
        if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw LwError(ErrorKind::XmlParse, "XML chunk too large");
        }
        XML_Status st = ::XML_Parse(parser_.get(), data, static_cast<int>(len), final ? 1 : 0);
        if (pending_) std::rethrow_exception(pending_);
        if (st != XML_STATUS_OK) {
            std::ostringstream oss;
            oss << "XML error at line " << ::XML_GetCurrentLineNumber(parser_.get())
                << ", column " << ::XML_GetCurrentColumnNumber(parser_.get())
                << ": " << ::XML_ErrorString(::XML_GetErrorCode(parser_.get()));
            throw LwError(ErrorKind::XmlParse, oss.str());
        }
    }

private:
    ContentHandler handler_;
    std::unique_ptr<XML_ParserStruct, decltype(&::XML_ParserFree)> parser_;
    std::exception_ptr pending_{};

    template <typename F>
    void guarded(F&& f) {
        if (pending_) return;
        try {
            f();
        } catch (...) {
            pending_ = std::current_exception();
            ::XML_StopParser(parser_.get(), XML_FALSE);
        }
    }

    static void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char** atts) {
        auto* self = static_cast<XmlReader*>(user);
        self->guarded([&] {
            Attributes attrs;
            for (std::size_t i = 0; atts[i] != nullptr; i += 2) {
                attrs.emplace_back(atts[i], atts[i + 1]);
            }
            self->handler_.start_element(name, std::move(attrs));
        });
    }

    static void XMLCALL on_end(void* user, const XML_Char* name) {
        auto* self = static_cast<XmlReader*>(user);
        self->guarded([&] { self->handler_.end_element(name); });
    }

    static void XMLCALL on_text(void* user, const XML_Char* s, int len) {
        auto* self = static_cast<XmlReader*>(user);
        self->guarded([&] { self->handler_.characters(std::string_view(s, static_cast<std::size_t>(len))); });
    }
};

struct GzCloser {
    void operator()(gzFile f) const noexcept { ::gzclose(f); }
};
using GzFilePtr = std::unique_ptr<gzFile_s, GzCloser>;

static std::size_t effective_chunk(const ReadOptions& opts) {
    if (opts.chunk_size == 0) return 64u * 1024u;
    return std::min<std::size_t>(opts.chunk_size, 1u << 30);
}

} // namespace internal

// ------------------------------
// Loading
// ------------------------------

std::unique_ptr<Document> load_string(std::string_view xml, const ReadOptions& opts) {
    auto doc = std::make_unique<Document>();
    internal::XmlReader reader(*doc, opts);
    const std::size_t chunk = internal::effective_chunk(opts);
    std::size_t pos = 0;
    while (pos < xml.size()) {
        std::size_t n = std::min(chunk, xml.size() - pos);
        reader.feed(xml.data() + pos, n, false);
        pos += n;
    }
    reader.feed(nullptr, 0, true);
    return doc;
}

std::unique_ptr<Document> load_stream(std::istream& is, const ReadOptions& opts) {
    auto doc = std::make_unique<Document>();
    internal::XmlReader reader(*doc, opts);
    std::vector<char> buf(internal::effective_chunk(opts));
    while (is) {
        is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = is.gcount();
        if (got > 0) reader.feed(buf.data(), static_cast<std::size_t>(got), false);
    }
    if (is.bad()) throw LwError(ErrorKind::Io, "failed reading XML stream");
    reader.feed(nullptr, 0, true);
    return doc;
}

std::unique_ptr<Document> load_file(const std::filesystem::path& file, const ReadOptions& opts) {
    // gzread passes uncompressed files through unchanged
    internal::GzFilePtr gz(::gzopen(file.string().c_str(), "rb"));
    if (!gz) throw LwError(ErrorKind::Io, "failed to open file: " + file.string());

    auto doc = std::make_unique<Document>();
    internal::XmlReader reader(*doc, opts);
    std::vector<char> buf(internal::effective_chunk(opts));
    while (true) {
        int got = ::gzread(gz.get(), buf.data(), static_cast<unsigned>(buf.size()));
        if (got < 0) {
            int errnum = 0;
            const char* msg = ::gzerror(gz.get(), &errnum);
            throw LwError(errnum == Z_ERRNO ? ErrorKind::Io : ErrorKind::ZlibError,
                          "failed reading " + file.string() + ": " + (msg ? msg : "unknown error"));
        }
        if (got == 0) break;
        reader.feed(buf.data(), static_cast<std::size_t>(got), false);
    }
    reader.feed(nullptr, 0, true);
    return doc;
}

// ------------------------------
// Writing
// ------------------------------

std::string xml_escape(std::string_view s, bool attribute) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute) out += "&quot;";
                else out.push_back(c);
                break;
            // attribute value normalization would turn these into spaces
            case '\t':
                if (attribute) out += "&#9;";
                else out.push_back(c);
                break;
            case '\n':
                if (attribute) out += "&#10;";
                else out.push_back(c);
                break;
            case '\r':
                if (attribute) out += "&#13;";
                else out.push_back(c);
                break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

void write(std::ostream& os, const Document& doc) {
    doc.write(os, "");
    if (!os) throw LwError(ErrorKind::Io, "failed writing XML document");
}

std::string to_string(const Document& doc) {
    std::ostringstream oss;
    write(oss, doc);
    return oss.str();
}

void write_file(const std::filesystem::path& file, const Document& doc, const WriteOptions& opts) {
    if (!opts.gzip) {
        std::ofstream os(file, std::ios::binary | std::ios::trunc);
        if (!os) throw LwError(ErrorKind::Io, "failed to open for write: " + file.string());
        write(os, doc);
        os.flush();
        if (!os) throw LwError(ErrorKind::Io, "failed writing " + file.string());
        return;
    }

    if (opts.zlib_level < 0 || opts.zlib_level > 9) {
        throw LwError(ErrorKind::InvalidData, "zlib level must be in 0..9");
    }
    const std::string text = to_string(doc);
    const std::string mode = "wb" + std::to_string(opts.zlib_level);
    internal::GzFilePtr gz(::gzopen(file.string().c_str(), mode.c_str()));
    if (!gz) throw LwError(ErrorKind::Io, "failed to open for write: " + file.string());

    const char* p = text.data();
    std::size_t left = text.size();
    while (left > 0) {
        unsigned n = static_cast<unsigned>(std::min<std::size_t>(left, 1u << 30));
        int wrote = ::gzwrite(gz.get(), p, n);
        if (wrote <= 0) {
            int errnum = 0;
            const char* msg = ::gzerror(gz.get(), &errnum);
            throw LwError(ErrorKind::ZlibError, "gzwrite failed for " + file.string() + ": " + (msg ? msg : "unknown error"));
        }
        p += wrote;
        left -= static_cast<std::size_t>(wrote);
    }
    // gzclose flushes the final block; its status is the write status
    int rc = ::gzclose(gz.release());
    if (rc != Z_OK) throw LwError(ErrorKind::ZlibError, "failed to finish gzip stream for " + file.string());
}

} // namespace lwarray
