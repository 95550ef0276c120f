#include "state_codec.hpp"

#include "oracle_error.hpp"

#include "picosha2.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sr {

namespace {

std::string digestBytes(const std::string& data, std::size_t len) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(len),
                      hash.begin(), hash.end());
    return std::string(hash.begin(), hash.end());
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

[[noreturn]] void corrupted(const std::string& what) {
    throw OracleError(OracleErrc::StateCorrupted, "state blob corrupted: " + what);
}

class Reader {
public:
    Reader(const std::string& data, std::size_t end) : data_(data), pos_(0), end_(end) {}

    void expectMagic() {
        if (end_ - pos_ < kStateMagicSize ||
            data_.compare(pos_, kStateMagicSize, kStateMagic, kStateMagicSize) != 0) {
            corrupted("bad magic");
        }
        pos_ += kStateMagicSize;
    }

    std::uint64_t readU64() {
        if (end_ - pos_ < 8) {
            corrupted("truncated integer");
        }
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
        }
        pos_ += 8;
        return v;
    }

    std::string readString() {
        std::uint64_t len = readU64();
        if (len > end_ - pos_) {
            corrupted("truncated symbol");
        }
        std::string s = data_.substr(pos_, static_cast<std::size_t>(len));
        pos_ += static_cast<std::size_t>(len);
        return s;
    }

    bool atEnd() const { return pos_ == end_; }

private:
    const std::string& data_;
    std::size_t pos_;
    std::size_t end_;
};

} // namespace

std::string encodeState(const ReferenceStore& store) {
    std::string out;
    out.reserve(kStateMagicSize + 8 + store.size() * 40 + kStateDigestSize);
    out.append(kStateMagic, kStateMagicSize);
    writeU64(out, static_cast<std::uint64_t>(store.size()));
    for (const auto& entry : store.snapshot()) {
        writeString(out, entry.first);
        writeU64(out, entry.second.rate);
        writeU64(out, entry.second.resolveTime);
        writeU64(out, entry.second.requestId);
    }
    out.append(digestBytes(out, out.size()));
    return out;
}

ReferenceStore decodeState(const std::string& blob) {
    if (blob.size() < kStateMagicSize + 8 + kStateDigestSize) {
        corrupted("blob too short");
    }
    const std::size_t bodySize = blob.size() - kStateDigestSize;
    if (blob.compare(bodySize, kStateDigestSize, digestBytes(blob, bodySize)) != 0) {
        corrupted("digest mismatch");
    }

    Reader reader(blob, bodySize);
    reader.expectMagic();
    std::uint64_t count = reader.readU64();

    ReferenceStore::RecordMap records;
    for (std::uint64_t i = 0; i < count; ++i) {
        std::string symbol = reader.readString();
        RateRecord record;
        record.rate = reader.readU64();
        record.resolveTime = reader.readU64();
        record.requestId = reader.readU64();
        if (!records.emplace(std::move(symbol), record).second) {
            corrupted("duplicate symbol");
        }
    }
    if (!reader.atEnd()) {
        corrupted("trailing bytes");
    }
    return ReferenceStore(std::move(records));
}

std::string stateDigestHex(const std::string& blob) {
    return picosha2::hash256_hex_string(blob);
}

} // namespace sr
