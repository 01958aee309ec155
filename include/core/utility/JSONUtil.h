/*
 * JSONUtil.h - Minimal JSON document generation
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef JSONUTIL_H
#define JSONUTIL_H

namespace DiagStream {
namespace JSON {

/**
 * @brief Simple JSON utility class for document generation
 * 
 * Provides lightweight JSON output without external dependencies.
 * Designed for the flat result documents handed across the process
 * boundary; object members keep their insertion order.
 */
class JSONUtil {
public:
    /**
     * @brief Simple JSON value representation
     */
    struct Value {
        enum class Type {
            Null,
            Boolean,
            Integer,
            Unsigned,
            Real,
            String,
            Array,
            Object
        };

        Type type = Type::Null;
        bool boolean = false;
        int64_t integer = 0;
        uint64_t unsigned_integer = 0;
        double real = 0.0;
        std::string string;
        std::vector<Value> items;
        std::vector<std::pair<std::string, Value>> members;

        Value() = default;
        Value(bool b) : type(Type::Boolean), boolean(b) {}
        Value(int i) : type(Type::Integer), integer(i) {}
        Value(int64_t i) : type(Type::Integer), integer(i) {}
        Value(uint64_t u) : type(Type::Unsigned), unsigned_integer(u) {}
        Value(double d) : type(Type::Real), real(d) {}
        Value(const char* s) : type(Type::String), string(s ? s : "") {}
        Value(const std::string& s) : type(Type::String), string(s) {}

        static Value array() { Value v; v.type = Type::Array; return v; }
        static Value object() { Value v; v.type = Type::Object; return v; }

        /**
         * @brief Append an item to an array value
         * @return Reference to this value for chaining
         */
        Value& push(Value item);

        /**
         * @brief Set an object member, replacing an existing one with the same key
         * @return Reference to this value for chaining
         */
        Value& set(const std::string& key, Value value);

        /**
         * @brief Find an object member
         * @return Pointer to the member value, or nullptr if absent
         */
        const Value* get(const std::string& key) const;
    };

    /**
     * @brief Generate JSON text from a value tree
     * @param value The root value to serialize
     * @param indent Spaces per nesting level; 0 produces compact output
     * @return JSON string representation
     */
    static std::string generateJSON(const Value& value, int indent = 0);

    /**
     * @brief Escape a string for use inside JSON quotes
     * @param text The raw text
     * @return Escaped text (without surrounding quotes)
     */
    static std::string escapeJSON(const std::string& text);

private:
    static void writeValue(std::ostringstream& out, const Value& value, int indent, int depth);
    static void writeNewline(std::ostringstream& out, int indent, int depth);
};

} // namespace JSON
} // namespace DiagStream

#endif // JSONUTIL_H
