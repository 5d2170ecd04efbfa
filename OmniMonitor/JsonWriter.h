// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// JsonWriter.h
// Streaming JSON text builder for the HTTP and WebSocket payloads.
// =================================================================
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace omnimon {

    class JsonWriter {
    public:
        void beginObject();
        void endObject();
        void beginArray();
        void endArray();

        void key(std::string_view name);

        void value(std::string_view s);
        void value(const char* s) { value(std::string_view(s)); }
        void value(const std::string& s) { value(std::string_view(s)); }
        void value(int v);
        void value(long long v);
        void value(double v);
        void value(float v) { value(static_cast<double>(v)); }
        void value(bool v);
        void null();

        // Already-serialized JSON, inserted as one value
        void raw(std::string_view json);

        template<typename T>
        void field(std::string_view name, const T& v) {
            key(name);
            value(v);
        }

        // Absent values are omitted rather than written as null
        template<typename T>
        void field(std::string_view name, const std::optional<T>& v) {
            if (!v) return;
            key(name);
            value(*v);
        }

        const std::string& str() const { return out_; }

        static std::string escape(std::string_view s);

        // Up to three decimals, trailing zeros dropped; non-finite becomes null
        static std::string formatNumber(double v);

    private:
        void separate();

        std::string out_;
        // One entry per open container: true until its first element is written
        std::vector<bool> first_;
        bool afterKey_ = false;
    };

} // namespace omnimon
