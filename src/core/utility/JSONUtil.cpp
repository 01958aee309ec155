/*
 * JSONUtil.cpp - Minimal JSON document generation
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

#include "diagstream.h"

namespace DiagStream {
namespace JSON {

JSONUtil::Value& JSONUtil::Value::push(Value item)
{
    type = Type::Array;
    items.push_back(std::move(item));
    return *this;
}

JSONUtil::Value& JSONUtil::Value::set(const std::string& key, Value value)
{
    type = Type::Object;
    for (auto& member : members) {
        if (member.first == key) {
            member.second = std::move(value);
            return *this;
        }
    }
    members.emplace_back(key, std::move(value));
    return *this;
}

const JSONUtil::Value* JSONUtil::Value::get(const std::string& key) const
{
    for (const auto& member : members) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

std::string JSONUtil::generateJSON(const Value& value, int indent)
{
    std::ostringstream out;
    writeValue(out, value, indent, 0);
    return out.str();
}

std::string JSONUtil::escapeJSON(const std::string& text)
{
    std::string result;
    result.reserve(text.length() + 8);

    for (unsigned char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                    result += escaped;
                } else {
                    result += static_cast<char>(c);
                }
                break;
        }
    }

    return result;
}

void JSONUtil::writeNewline(std::ostringstream& out, int indent, int depth)
{
    if (indent > 0) {
        out << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
    }
}

void JSONUtil::writeValue(std::ostringstream& out, const Value& value, int indent, int depth)
{
    switch (value.type) {
        case Value::Type::Null:
            out << "null";
            break;
        case Value::Type::Boolean:
            out << (value.boolean ? "true" : "false");
            break;
        case Value::Type::Integer:
            out << value.integer;
            break;
        case Value::Type::Unsigned:
            out << value.unsigned_integer;
            break;
        case Value::Type::Real:
            // JSON has no NaN/Infinity literals
            if (std::isfinite(value.real)) {
                std::ostringstream number;
                number << std::setprecision(15) << value.real;
                out << number.str();
            } else {
                out << "null";
            }
            break;
        case Value::Type::String:
            out << '"' << escapeJSON(value.string) << '"';
            break;
        case Value::Type::Array:
            out << '[';
            for (size_t i = 0; i < value.items.size(); ++i) {
                if (i > 0) out << ',';
                writeNewline(out, indent, depth + 1);
                writeValue(out, value.items[i], indent, depth + 1);
            }
            if (!value.items.empty()) writeNewline(out, indent, depth);
            out << ']';
            break;
        case Value::Type::Object:
            out << '{';
            for (size_t i = 0; i < value.members.size(); ++i) {
                if (i > 0) out << ',';
                writeNewline(out, indent, depth + 1);
                out << '"' << escapeJSON(value.members[i].first) << "\":";
                if (indent > 0) out << ' ';
                writeValue(out, value.members[i].second, indent, depth + 1);
            }
            if (!value.members.empty()) writeNewline(out, indent, depth);
            out << '}';
            break;
    }
}

} // namespace JSON
} // namespace DiagStream
