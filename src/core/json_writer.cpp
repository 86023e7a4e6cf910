// IptvMux - IPTV Stream Multiplexing Proxy
// JSON Writer Implementation

#include "iptvmux/core/json_writer.hpp"

#include <cmath>
#include <iomanip>

namespace iptvmux {
namespace core {

std::string escapeJsonString(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonWriter::separate() {
    if (afterKey_) {
        afterKey_ = false;
        return;
    }
    if (!hasElements_.empty()) {
        if (hasElements_.back()) {
            out_ << ',';
        }
        hasElements_.back() = true;
    }
}

JsonWriter& JsonWriter::beginObject() {
    separate();
    out_ << '{';
    hasElements_.push_back(false);
    return *this;
}

JsonWriter& JsonWriter::endObject() {
    out_ << '}';
    if (!hasElements_.empty()) {
        hasElements_.pop_back();
    }
    return *this;
}

JsonWriter& JsonWriter::beginArray() {
    separate();
    out_ << '[';
    hasElements_.push_back(false);
    return *this;
}

JsonWriter& JsonWriter::endArray() {
    out_ << ']';
    if (!hasElements_.empty()) {
        hasElements_.pop_back();
    }
    return *this;
}

JsonWriter& JsonWriter::key(const std::string& name) {
    separate();
    out_ << '"' << escapeJsonString(name) << "\":";
    afterKey_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(const std::string& str) {
    separate();
    out_ << '"' << escapeJsonString(str) << '"';
    return *this;
}

JsonWriter& JsonWriter::value(const char* str) {
    return str ? value(std::string(str)) : null();
}

JsonWriter& JsonWriter::value(bool b) {
    separate();
    out_ << (b ? "true" : "false");
    return *this;
}

JsonWriter& JsonWriter::value(int64_t n) {
    separate();
    out_ << n;
    return *this;
}

JsonWriter& JsonWriter::value(uint64_t n) {
    separate();
    out_ << n;
    return *this;
}

JsonWriter& JsonWriter::value(double d) {
    if (!std::isfinite(d)) {
        return null();
    }
    separate();
    out_ << std::fixed << std::setprecision(3) << d;
    out_.unsetf(std::ios_base::floatfield);
    return *this;
}

JsonWriter& JsonWriter::null() {
    separate();
    out_ << "null";
    return *this;
}

} // namespace core
} // namespace iptvmux
