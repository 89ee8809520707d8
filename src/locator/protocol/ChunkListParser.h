#pragma once

#include <expat.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../../msg/status.h"
#include "../model/ChunkModel.h"
#include "AddressResolver.h"

namespace pl::locator {

// Incremental decoder for a chunk_list document:
//
//   <chunk_list>
//     <chunk offset="0" chunk_size="67108864">
//       <map>
//         <copy ip_addr="10.10.2.200" name="sn1" vid="1" />
//       </map>
//     </chunk>
//   </chunk_list>
//
// A chunk has no end marker in the event stream we act on, so its copies are
// buffered until the next chunk starts or the document ends. A chunk without
// copies produces no record.
class ChunkListParser {
public:
    explicit ChunkListParser(uint64_t file_length, AddressResolver resolver = CanonicalizeAddress);
    ~ChunkListParser();

    ChunkListParser(const ChunkListParser&) = delete;
    ChunkListParser& operator=(const ChunkListParser&) = delete;

    // May be called any number of times with arbitrary split points.
    pl::msg::Status Feed(const char* data, size_t length);
    // Ends the document, flushes the last chunk and hands over all records.
    // Nothing is written to out on failure.
    pl::msg::Status Finish(ChunkMap* out);

    const pl::msg::Status& status() const { return status_; }
    uint64_t bytes_fed() const { return bytes_fed_; }

private:
    static void OnStartElement(void* user_data, const XML_Char* name, const XML_Char** attrs);

    void HandleStartElement(const char* name, const XML_Char** attrs);
    void HandleChunk(const XML_Char** attrs);
    void HandleCopy(const XML_Char** attrs);
    void FlushPending();
    bool RequireAttribute(const XML_Char** attrs, const char* tag, const char* attr, std::string* out);
    void Fail(pl::msg::Status status);
    pl::msg::Status ParseStatus(enum XML_Status rc);

    XML_Parser parser_{nullptr};
    AddressResolver resolver_;
    uint64_t file_length_{0};
    uint64_t bytes_fed_{0};
    pl::msg::Status status_;
    bool finished_{false};

    bool have_chunk_{false};
    uint64_t pending_offset_{0};
    uint64_t pending_length_{0};
    std::vector<ReplicaSlot> pending_replicas_;
    ChunkMap records_;
};

} // namespace pl::locator
