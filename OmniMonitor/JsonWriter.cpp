// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// JsonWriter.cpp
// =================================================================
#include "JsonWriter.h"
#include <cmath>
#include <cstdio>

namespace omnimon {

    void JsonWriter::separate() {
        if (afterKey_) {
            afterKey_ = false;
            return;
        }
        if (!first_.empty()) {
            if (!first_.back()) out_ += ',';
            first_.back() = false;
        }
    }

    void JsonWriter::beginObject() {
        separate();
        out_ += '{';
        first_.push_back(true);
    }

    void JsonWriter::endObject() {
        out_ += '}';
        if (!first_.empty()) first_.pop_back();
    }

    void JsonWriter::beginArray() {
        separate();
        out_ += '[';
        first_.push_back(true);
    }

    void JsonWriter::endArray() {
        out_ += ']';
        if (!first_.empty()) first_.pop_back();
    }

    void JsonWriter::key(std::string_view name) {
        separate();
        out_ += '"';
        out_ += escape(name);
        out_ += "\":";
        afterKey_ = true;
    }

    void JsonWriter::value(std::string_view s) {
        separate();
        out_ += '"';
        out_ += escape(s);
        out_ += '"';
    }

    void JsonWriter::value(int v) {
        separate();
        out_ += std::to_string(v);
    }

    void JsonWriter::value(long long v) {
        separate();
        out_ += std::to_string(v);
    }

    void JsonWriter::value(double v) {
        separate();
        out_ += formatNumber(v);
    }

    void JsonWriter::value(bool v) {
        separate();
        out_ += v ? "true" : "false";
    }

    void JsonWriter::null() {
        separate();
        out_ += "null";
    }

    void JsonWriter::raw(std::string_view json) {
        separate();
        out_ += json;
    }

    std::string JsonWriter::escape(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) {
            switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                }
                else {
                    out += static_cast<char>(c);
                }
            }
        }
        return out;
    }

    std::string JsonWriter::formatNumber(double v) {
        if (!std::isfinite(v)) return "null";
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.3f", v);
        std::string s(buf);
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
        if (s == "-0") s = "0";
        return s;
    }

} // namespace omnimon
