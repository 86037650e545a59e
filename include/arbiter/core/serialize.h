// ARBITER - Serialization Header
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Canonical little-endian encoding used for commitment preimages and for
// records written to the audit store. Decoding failures throw
// std::ios_base::failure.

#ifndef ARBITER_CORE_SERIALIZE_H
#define ARBITER_CORE_SERIALIZE_H

#include <arbiter/core/types.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace arbiter {

/// Largest length prefix accepted when decoding
constexpr uint64_t MAX_SERIALIZED_SIZE = 0x01000000;  // 16 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<Byte> data) : data_(std::move(data)) {}
    DataStream(const Byte* data, size_t len) : data_(data, data + len) {}
    explicit DataStream(const std::string& bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const Byte* data() const noexcept { return data_.data() + readPos_; }

    /// Everything written so far, including bytes already read
    const std::vector<Byte>& Bytes() const noexcept { return data_; }

    /// Unread bytes as a binary string (for key-value storage)
    std::string Str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void clear() {
        data_.clear();
        readPos_ = 0;
    }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const Byte*>(src), len);
    }

    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + readPos_, len);
        }
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<Byte*>(dst), len);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<Byte> data_;
    size_t readPos_{0};
};

// ============================================================================
// Fixed-Width Integers (little-endian)
// ============================================================================

template<typename Stream, typename UInt>
inline void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "unsigned only");
    Byte buf[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<Byte>(value >> (8 * i));
    }
    s.Write(buf, sizeof(UInt));
}

template<typename UInt, typename Stream>
inline UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "unsigned only");
    Byte buf[sizeof(UInt)];
    s.Read(buf, sizeof(UInt));
    UInt value = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(buf[i]) << (8 * i);
    }
    return value;
}

// ============================================================================
// CompactSize Length Prefix
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<Stream, uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFD);
        WriteLE<Stream, uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFE);
        WriteLE<Stream, uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<Stream, uint8_t>(s, 0xFF);
        WriteLE<Stream, uint64_t>(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    if (marker == 0xFD) {
        size = ReadLE<uint16_t>(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 0xFE) {
        size = ReadLE<uint32_t>(s);
        if (size <= 0xFFFF) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 0xFF) {
        size = ReadLE<uint64_t>(s);
        if (size <= 0xFFFFFFFFULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }
    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream> inline void Serialize(Stream& s, uint8_t a) { WriteLE<Stream, uint8_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint16_t a) { WriteLE<Stream, uint16_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { WriteLE<Stream, uint32_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { WriteLE<Stream, uint64_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int32_t a) { WriteLE<Stream, uint32_t>(s, static_cast<uint32_t>(a)); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a) { WriteLE<Stream, uint64_t>(s, static_cast<uint64_t>(a)); }
template<typename Stream> inline void Serialize(Stream& s, bool a) { WriteLE<Stream, uint8_t>(s, a ? 1 : 0); }

template<typename Stream> inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint16_t& a) { a = ReadLE<uint16_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ReadLE<uint32_t>(s)); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ReadLE<uint8_t>(s);
    if (v > 1) {
        throw std::ios_base::failure("invalid boolean encoding");
    }
    a = (v != 0);
}

// ============================================================================
// Strings, Hashes, Containers
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(static_cast<size_t>(size));
    if (size > 0) {
        s.Read(&str[0], static_cast<size_t>(size));
    }
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream> void Serialize(Stream& s, const Hash256& h) { s.Write(h.data(), Hash256::SIZE); }
template<typename Stream> void Unserialize(Stream& s, Hash256& h) { s.Read(h.data(), Hash256::SIZE); }
template<typename Stream> void Serialize(Stream& s, const Hash160& h) { s.Write(h.data(), Hash160::SIZE); }
template<typename Stream> void Unserialize(Stream& s, Hash160& h) { s.Read(h.data(), Hash160::SIZE); }

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v);
template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v);
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt);
template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt);

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    Serialize(s, opt.has_value());
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    bool present = false;
    Unserialize(s, present);
    if (present) {
        T value;
        Unserialize(s, value);
        opt = std::move(value);
    } else {
        opt.reset();
    }
}

// ============================================================================
// Enumerations (one byte on the wire)
// ============================================================================

template<typename Stream, typename Enum>
void SerializeEnum(Stream& s, Enum value) {
    Serialize(s, static_cast<uint8_t>(value));
}

/// Read an enum, rejecting values above maxValue
template<typename Stream, typename Enum>
void UnserializeEnum(Stream& s, Enum& value, Enum maxValue) {
    uint8_t raw = 0;
    Unserialize(s, raw);
    if (raw > static_cast<uint8_t>(maxValue)) {
        throw std::ios_base::failure("enum value out of range");
    }
    value = static_cast<Enum>(raw);
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace arbiter

#endif // ARBITER_CORE_SERIALIZE_H
