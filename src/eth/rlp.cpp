// ETHLEDGER - RLP Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/eth/rlp.h>

namespace ethledger {
namespace eth {

namespace {

constexpr Byte SHORT_STRING = 0x80;
constexpr Byte LONG_STRING = 0xb7;
constexpr Byte SHORT_LIST = 0xc0;
constexpr Byte LONG_LIST = 0xf7;
constexpr size_t SHORT_LIMIT = 55;

Bytes MinimalBigEndian(uint64_t value) {
    Bytes out;
    while (value > 0) {
        out.insert(out.begin(), static_cast<Byte>(value & 0xFF));
        value >>= 8;
    }
    return out;
}

Bytes EncodeHeader(size_t length, Byte shortBase, Byte longBase) {
    if (length <= SHORT_LIMIT) {
        return Bytes{static_cast<Byte>(shortBase + length)};
    }
    Bytes lenBytes = MinimalBigEndian(length);
    Bytes header{static_cast<Byte>(longBase + lenBytes.size())};
    header.insert(header.end(), lenBytes.begin(), lenBytes.end());
    return header;
}

/// Header of the item at data[pos]: payload offset and length
struct Header {
    bool isList;
    size_t offset;
    size_t length;
};

size_t ReadLength(const Bytes& data, size_t pos, size_t lenOfLen) {
    if (pos + lenOfLen > data.size()) {
        throw RLPError("truncated length");
    }
    if (data[pos] == 0) {
        throw RLPError("length has leading zero");
    }
    if (lenOfLen > sizeof(size_t)) {
        throw RLPError("length too large");
    }
    size_t length = 0;
    for (size_t i = 0; i < lenOfLen; ++i) {
        length = (length << 8) | data[pos + i];
    }
    if (length <= SHORT_LIMIT) {
        throw RLPError("long form used for short payload");
    }
    return length;
}

Header ReadHeader(const Bytes& data, size_t pos, size_t end) {
    if (pos >= end) {
        throw RLPError("unexpected end of input");
    }
    Byte prefix = data[pos];
    Header h{false, pos, 1};

    if (prefix < SHORT_STRING) {
        h.offset = pos;
        h.length = 1;
    } else if (prefix <= LONG_STRING) {
        h.offset = pos + 1;
        h.length = prefix - SHORT_STRING;
        if (h.length == 1 && h.offset < end && data[h.offset] < SHORT_STRING) {
            throw RLPError("single byte must be encoded as itself");
        }
    } else if (prefix < SHORT_LIST) {
        size_t lenOfLen = prefix - LONG_STRING;
        h.length = ReadLength(data, pos + 1, lenOfLen);
        h.offset = pos + 1 + lenOfLen;
    } else if (prefix <= LONG_LIST) {
        h.isList = true;
        h.offset = pos + 1;
        h.length = prefix - SHORT_LIST;
    } else {
        size_t lenOfLen = prefix - LONG_LIST;
        h.isList = true;
        h.length = ReadLength(data, pos + 1, lenOfLen);
        h.offset = pos + 1 + lenOfLen;
    }

    if (h.offset > end || h.length > end - h.offset) {
        throw RLPError("payload exceeds input");
    }
    return h;
}

RLPItem DecodeAt(const Bytes& data, size_t pos, size_t end, size_t& next, int depth) {
    if (depth > 64) {
        throw RLPError("nesting too deep");
    }
    Header h = ReadHeader(data, pos, end);
    next = h.offset + h.length;

    if (!h.isList) {
        return RLPItem::FromBytes(Bytes(data.begin() + h.offset,
                                        data.begin() + h.offset + h.length));
    }

    std::vector<RLPItem> items;
    size_t cursor = h.offset;
    size_t listEnd = h.offset + h.length;
    while (cursor < listEnd) {
        size_t after = 0;
        items.push_back(DecodeAt(data, cursor, listEnd, after, depth + 1));
        cursor = after;
    }
    return RLPItem::FromList(std::move(items));
}

} // anonymous namespace

// ============================================================================
// RLPItem
// ============================================================================

RLPItem RLPItem::FromBytes(Bytes bytes) {
    RLPItem item;
    item.bytes_ = std::move(bytes);
    return item;
}

RLPItem RLPItem::FromList(std::vector<RLPItem> items) {
    RLPItem item;
    item.isList_ = true;
    item.items_ = std::move(items);
    return item;
}

const Bytes& RLPItem::GetBytes() const {
    if (isList_) {
        throw RLPError("expected byte string, got list");
    }
    return bytes_;
}

const std::vector<RLPItem>& RLPItem::GetList() const {
    if (!isList_) {
        throw RLPError("expected list, got byte string");
    }
    return items_;
}

// ============================================================================
// Encoding
// ============================================================================

namespace rlp {

Bytes EncodeBytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < SHORT_STRING) {
        return data;
    }
    Bytes out = EncodeHeader(data.size(), SHORT_STRING, LONG_STRING);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes EncodeUint(uint64_t value) {
    return EncodeBytes(MinimalBigEndian(value));
}

Bytes EncodeList(const std::vector<Bytes>& encodedItems) {
    size_t total = 0;
    for (const auto& item : encodedItems) {
        total += item.size();
    }
    Bytes out = EncodeHeader(total, SHORT_LIST, LONG_LIST);
    out.reserve(out.size() + total);
    for (const auto& item : encodedItems) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

Bytes Encode(const RLPItem& item) {
    if (!item.IsList()) {
        return EncodeBytes(item.GetBytes());
    }
    std::vector<Bytes> encoded;
    encoded.reserve(item.GetList().size());
    for (const auto& child : item.GetList()) {
        encoded.push_back(Encode(child));
    }
    return EncodeList(encoded);
}

// ============================================================================
// Decoding
// ============================================================================

RLPItem Decode(const Bytes& data) {
    if (data.empty()) {
        throw RLPError("empty input");
    }
    size_t next = 0;
    RLPItem item = DecodeAt(data, 0, data.size(), next, 0);
    if (next != data.size()) {
        throw RLPError("trailing bytes after item");
    }
    return item;
}

uint64_t DecodeUint(const Bytes& data) {
    if (data.size() > 8) {
        throw RLPError("integer wider than 64 bits");
    }
    if (!data.empty() && data[0] == 0) {
        throw RLPError("integer has leading zero");
    }
    uint64_t value = 0;
    for (Byte b : data) {
        value = (value << 8) | b;
    }
    return value;
}

} // namespace rlp

} // namespace eth
} // namespace ethledger
