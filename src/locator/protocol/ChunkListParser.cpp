#include "ChunkListParser.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

namespace pl::locator {

namespace {

constexpr char kNamespaceSeparator = '|';
constexpr char kChunkTag[] = "chunk";
constexpr char kCopyTag[] = "copy";
constexpr char kOffsetAttr[] = "offset";
constexpr char kChunkSizeAttr[] = "chunk_size";
constexpr char kIpAddrAttr[] = "ip_addr";
constexpr char kNameAttr[] = "name";
constexpr char kVidAttr[] = "vid";
constexpr size_t kMaxFeedSlice = static_cast<size_t>(INT_MAX);

const char* LocalName(const char* name) {
    const char* sep = std::strrchr(name, kNamespaceSeparator);
    return sep ? sep + 1 : name;
}

bool AllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

bool ParseUint64(const std::string& text, uint64_t* out) {
    if (!out || !AllDigits(text)) {
        return false;
    }
    try {
        *out = static_cast<uint64_t>(std::stoull(text));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseInt32(const std::string& text, int32_t* out) {
    if (!out || text.empty()) {
        return false;
    }
    const std::string digits = text[0] == '-' ? text.substr(1) : text;
    if (!AllDigits(digits)) {
        return false;
    }
    try {
        long long value = std::stoll(text);
        if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
            return false;
        }
        *out = static_cast<int32_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ChunkListParser::ChunkListParser(uint64_t file_length, AddressResolver resolver)
    : resolver_(std::move(resolver)), file_length_(file_length) {
    parser_ = XML_ParserCreateNS(nullptr, kNamespaceSeparator);
    if (!parser_) {
        status_ = pl::msg::Status::InternalError("Failed to create XML decoder");
        return;
    }
    XML_SetUserData(parser_, this);
    XML_SetStartElementHandler(parser_, &ChunkListParser::OnStartElement);
    if (!resolver_) {
        status_ = pl::msg::Status::InvalidArgument("Address resolver is empty");
    }
}

ChunkListParser::~ChunkListParser() {
    if (parser_) {
        XML_ParserFree(parser_);
    }
}

pl::msg::Status ChunkListParser::Feed(const char* data, size_t length) {
    if (!status_.ok()) {
        return status_;
    }
    if (finished_) {
        return pl::msg::Status::InternalError("Feed after end of document");
    }
    if (!data && length > 0) {
        return pl::msg::Status::InvalidArgument("Input buffer is null");
    }

    size_t consumed = 0;
    while (consumed < length) {
        size_t slice = std::min(length - consumed, kMaxFeedSlice);
        enum XML_Status rc = XML_Parse(parser_, data + consumed, static_cast<int>(slice), XML_FALSE);
        pl::msg::Status st = ParseStatus(rc);
        if (!st.ok()) {
            return st;
        }
        consumed += slice;
        bytes_fed_ += slice;
    }
    return pl::msg::Status::Ok();
}

pl::msg::Status ChunkListParser::Finish(ChunkMap* out) {
    if (!out) {
        return pl::msg::Status::InvalidArgument("Output chunk map is null");
    }
    if (!status_.ok()) {
        return status_;
    }
    if (finished_) {
        return pl::msg::Status::InternalError("Document already finished");
    }
    finished_ = true;

    pl::msg::Status st = ParseStatus(XML_Parse(parser_, nullptr, 0, XML_TRUE));
    if (!st.ok()) {
        return st;
    }

    FlushPending();
    *out = std::move(records_);
    records_.clear();
    return pl::msg::Status::Ok();
}

void ChunkListParser::OnStartElement(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* self = static_cast<ChunkListParser*>(user_data);
    if (self) {
        self->HandleStartElement(name, attrs);
    }
}

void ChunkListParser::HandleStartElement(const char* name, const XML_Char** attrs) {
    if (!status_.ok() || !name) {
        return;
    }
    const char* local = LocalName(name);
    if (std::strcmp(local, kChunkTag) == 0) {
        HandleChunk(attrs);
    } else if (std::strcmp(local, kCopyTag) == 0) {
        HandleCopy(attrs);
    }
}

void ChunkListParser::HandleChunk(const XML_Char** attrs) {
    FlushPending();

    std::string offset_text;
    std::string size_text;
    if (!RequireAttribute(attrs, kChunkTag, kOffsetAttr, &offset_text) ||
        !RequireAttribute(attrs, kChunkTag, kChunkSizeAttr, &size_text)) {
        return;
    }

    uint64_t offset = 0;
    uint64_t length = 0;
    if (!ParseUint64(offset_text, &offset)) {
        Fail(pl::msg::Status::ProtocolError("invalid chunk offset '" + offset_text + "'"));
        return;
    }
    if (!ParseUint64(size_text, &length) || length == 0) {
        Fail(pl::msg::Status::ProtocolError("invalid chunk chunk_size '" + size_text + "'"));
        return;
    }
    pending_offset_ = offset;
    pending_length_ = length;
    have_chunk_ = true;
}

void ChunkListParser::HandleCopy(const XML_Char** attrs) {
    if (!have_chunk_) {
        Fail(pl::msg::Status::ProtocolError("copy element outside of a chunk"));
        return;
    }

    std::string ip_addr;
    std::string name;
    std::string vid_text;
    if (!RequireAttribute(attrs, kCopyTag, kIpAddrAttr, &ip_addr) ||
        !RequireAttribute(attrs, kCopyTag, kNameAttr, &name) ||
        !RequireAttribute(attrs, kCopyTag, kVidAttr, &vid_text)) {
        return;
    }

    int32_t vid = 0;
    if (!ParseInt32(vid_text, &vid)) {
        Fail(pl::msg::Status::ProtocolError("invalid copy vid '" + vid_text + "'"));
        return;
    }

    std::string address;
    pl::msg::Status st = resolver_(ip_addr, &address);
    if (!st.ok()) {
        Fail(st.code == pl::msg::StatusCode::kProtocolError ? st
                                                             : pl::msg::Status::ProtocolError(st.message));
        return;
    }

    // Health is not carried by this protocol version.
    pending_replicas_.push_back(ReplicaSlot{vid, ReplicaDescriptor(name, address, true, true)});
}

void ChunkListParser::FlushPending() {
    if (pending_replicas_.empty()) {
        return;
    }
    records_.emplace_back(ChunkDescriptor(pending_offset_, pending_length_), std::move(pending_replicas_),
                          file_length_);
    pending_replicas_.clear();
}

bool ChunkListParser::RequireAttribute(const XML_Char** attrs,
                                       const char* tag,
                                       const char* attr,
                                       std::string* out) {
    for (size_t i = 0; attrs && attrs[i] && attrs[i + 1]; i += 2) {
        if (std::strcmp(LocalName(attrs[i]), attr) == 0) {
            *out = attrs[i + 1];
            return true;
        }
    }
    Fail(pl::msg::Status::ProtocolError(std::string("missing attribute ") + attr + " on " + tag));
    return false;
}

void ChunkListParser::Fail(pl::msg::Status status) {
    if (!status_.ok()) {
        return;
    }
    status_ = std::move(status);
    pending_replicas_.clear();
    records_.clear();
    if (parser_) {
        XML_StopParser(parser_, XML_FALSE);
    }
}

pl::msg::Status ChunkListParser::ParseStatus(enum XML_Status rc) {
    if (!status_.ok()) {
        return status_;
    }
    if (rc == XML_STATUS_ERROR) {
        enum XML_Error code = XML_GetErrorCode(parser_);
        std::string message = std::string("malformed chunk_list at line ") +
                              std::to_string(XML_GetCurrentLineNumber(parser_)) + ": " +
                              XML_ErrorString(code);
        Fail(pl::msg::Status::ProtocolError(message));
        return status_;
    }
    return pl::msg::Status::Ok();
}

} // namespace pl::locator
