#include "value.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace auditstore {

namespace {

std::string format_number(double d) {
    if (!std::isfinite(d)) {
        return "null";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d) {
        std::snprintf(buf, sizeof(buf), "%.17g", d);
    }
    std::string out(buf);
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

void append_u16(std::string &out, unsigned unit) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", unit);
    out += buf;
}

// Decodes one UTF-8 sequence starting at s[i] and advances i past it.
// Overlong forms, surrogates and truncated sequences consume one byte and
// yield U+FFFD.
std::uint32_t next_code_point(const std::string &s, std::size_t &i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min = 0;
    if (lead >= 0xf0 && lead <= 0xf4) {
        extra = 3; cp = lead & 0x07u; min = 0x10000;
    } else if (lead >= 0xe0 && lead < 0xf0) {
        extra = 2; cp = lead & 0x0fu; min = 0x800;
    } else if (lead >= 0xc2 && lead < 0xe0) {
        extra = 1; cp = lead & 0x1fu; min = 0x80;
    } else {
        ++i;
        return 0xfffd;
    }
    if (i + extra >= s.size()) {
        ++i;
        return 0xfffd;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto next = static_cast<unsigned char>(s[i + k]);
        if ((next & 0xc0u) != 0x80u) {
            ++i;
            return 0xfffd;
        }
        cp = (cp << 6) | (next & 0x3fu);
    }
    if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        ++i;
        return 0xfffd;
    }
    i += extra + 1;
    return cp;
}

void write_value(std::ostringstream &oss, const Value &v, int indent, int depth, bool ascii_only);

// Shared by objects and arrays: opening bracket, one element per line when
// pretty-printing, closing bracket at the parent's depth.
template <typename Container, typename WriteElement>
void write_container(std::ostringstream &oss, const Container &items, char open, char close,
                     int indent, int depth, WriteElement write_element) {
    if (items.empty()) {
        oss << open << close;
        return;
    }

    const std::string pad = indent >= 0 ? std::string((depth + 1) * indent, ' ') : "";
    oss << open;
    bool first = true;
    for (const auto &item : items) {
        if (!first) {
            oss << (indent >= 0 ? "," : ", ");
        }
        first = false;
        if (indent >= 0) {
            oss << '\n' << pad;
        }
        write_element(item);
    }
    if (indent >= 0) {
        oss << '\n' << std::string(depth * indent, ' ');
    }
    oss << close;
}

void write_value(std::ostringstream &oss, const Value &v, int indent, int depth, bool ascii_only) {
    switch (v.kind()) {
    case ValueKind::Null: oss << "null"; return;
    case ValueKind::Bool: oss << (v.as_bool() ? "true" : "false"); return;
    case ValueKind::Integer: oss << v.as_integer(); return;
    case ValueKind::Number: oss << format_number(v.as_number()); return;
    case ValueKind::String: oss << '"' << json_escape(v.as_string(), ascii_only) << '"'; return;
    case ValueKind::Object:
        write_container(oss, v.as_object(), '{', '}', indent, depth,
                        [&](const Object::value_type &entry) {
                            oss << '"' << json_escape(entry.first, ascii_only) << "\": ";
                            write_value(oss, entry.second, indent, depth + 1, ascii_only);
                        });
        return;
    case ValueKind::Array:
        write_container(oss, v.as_array(), '[', ']', indent, depth,
                        [&](const Value &item) { write_value(oss, item, indent, depth + 1, ascii_only); });
        return;
    }
}

} // namespace

std::string value_kind_to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::Null: return "null";
    case ValueKind::Bool: return "bool";
    case ValueKind::Integer: return "integer";
    case ValueKind::Number: return "number";
    case ValueKind::String: return "string";
    case ValueKind::Object: return "object";
    case ValueKind::Array: return "array";
    }
    return "null";
}

std::string json_escape(const std::string &s, bool ascii_only) {
    std::string out;
    out.reserve(s.size() + 2);
    for (std::size_t i = 0; i < s.size();) {
        const char c = s[i];
        if (ascii_only && static_cast<unsigned char>(c) >= 0x80) {
            const std::uint32_t cp = next_code_point(s, i);
            if (cp > 0xffff) {
                append_u16(out, 0xd800 + ((cp - 0x10000) >> 10));
                append_u16(out, 0xdc00 + ((cp - 0x10000) & 0x3ff));
            } else {
                append_u16(out, cp);
            }
            continue;
        }
        ++i;
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
        }
    }
    return out;
}

std::string to_json(const Value &v, int indent, bool ascii_only) {
    std::ostringstream oss;
    write_value(oss, v, indent, 0, ascii_only);
    return oss.str();
}

} // namespace auditstore
