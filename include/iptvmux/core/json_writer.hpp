// IptvMux - IPTV Stream Multiplexing Proxy
// JSON Writer - Streaming builder for administrative responses

#ifndef IPTVMUX_CORE_JSON_WRITER_HPP
#define IPTVMUX_CORE_JSON_WRITER_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace iptvmux {
namespace core {

/**
 * @brief Escape a string for inclusion in a JSON string literal.
 */
std::string escapeJsonString(const std::string& str);

/**
 * @brief Compact JSON builder.
 *
 * Commas are inserted automatically. Inside an object every value must be
 * preceded by key(); the field() helpers do both.
 *
 * @code
 * JsonWriter json;
 * json.beginObject();
 * json.field("count", 2);
 * json.key("items").beginArray().value("a").value("b").endArray();
 * json.endObject();
 * std::string body = json.str();   // {"count":2,"items":["a","b"]}
 * @endcode
 */
class JsonWriter {
public:
    JsonWriter& beginObject();
    JsonWriter& endObject();
    JsonWriter& beginArray();
    JsonWriter& endArray();

    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& str);
    JsonWriter& value(const char* str);
    JsonWriter& value(bool b);
    JsonWriter& value(int64_t n);
    JsonWriter& value(uint64_t n);
    JsonWriter& value(int n) { return value(static_cast<int64_t>(n)); }
    JsonWriter& value(uint32_t n) { return value(static_cast<uint64_t>(n)); }
    JsonWriter& value(double d);
    JsonWriter& null();

    template<typename T>
    JsonWriter& field(const std::string& name, const T& v) {
        key(name);
        return value(v);
    }

    /**
     * @brief Write the value, or null when empty.
     */
    template<typename T>
    JsonWriter& field(const std::string& name, const std::optional<T>& v) {
        key(name);
        return v ? value(*v) : null();
    }

    std::string str() const { return out_.str(); }

private:
    void separate();

    std::ostringstream out_;
    // One entry per open container: true once it holds an element.
    std::vector<bool> hasElements_;
    bool afterKey_ = false;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_JSON_WRITER_HPP
