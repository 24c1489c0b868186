#pragma once
#include "message.hpp"
#include <string>
#include <vector>

namespace spychat {

// Which on-disk shape a history blob was recognised as.
enum class HistoryEncoding {
    empty,          // blank blob
    canonical,      // {"format":"spychat.history","version":1,"messages":[...]}
    flat,           // [{"role":..., "content":...}, ...]
    parts,          // [{"kind":"request|response","parts":[...]}, ...]
    single_object,  // one legacy entry without the surrounding list
    raw_text        // anything else, kept as one assistant message
};

const char* encoding_name(HistoryEncoding e);

struct DecodedHistory {
    std::vector<Message> messages;
    HistoryEncoding encoding = HistoryEncoding::empty;
    size_t skipped = 0;  // malformed entries dropped from a list payload
};

// Pure conversion between stored blobs and Message sequences. decode() never
// throws: a blob that matches no known shape degrades to a single assistant
// message holding the raw text.
class HistoryCodec {
public:
    static constexpr const char* kFormatTag = "spychat.history";
    static constexpr int kVersion = 1;

    static std::vector<Message> decode(const std::string& raw);
    static DecodedHistory decode_detailed(const std::string& raw);
    static std::string encode(const std::vector<Message>& messages);
};

} // namespace spychat
