/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed, indented JSON to an ostream.
 * Doubles are written with a fixed number of significant digits
 * (default 12); NaN and Inf become null.
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("jd", 2448724.5);
 *     w.key("results").begin_array();
 *       w.value(0.6786);
 *     w.end_array();
 *   w.end_object();
 */

#ifndef LUNAR_JSON_WRITER_HPP
#define LUNAR_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>
#include <vector>

namespace lunar {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2, int precision = 12)
        : os_(os), indent_size_(indent_size), precision_(precision) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    // ── Keys ──

    JsonWriter& key(const std::string& k) {
        separate();
        write_string(k);
        os_ << ": ";
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        separate();
        write_string(v);
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(double v) {
        separate();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            char buf[40];
            std::snprintf(buf, sizeof(buf), "%.*g", precision_, v);
            os_ << buf;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        separate();
        os_ << (v ? "true" : "false");
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

    // Closes any scopes still open and ends the document with a newline
    void finish() {
        while (!has_items_.empty()) {
            close(open_chars_.back() == '{' ? '}' : ']');
        }
        os_ << '\n';
    }

private:
    std::ostream& os_;
    int indent_size_;
    int precision_;
    std::vector<bool> has_items_;   // one entry per open scope
    std::vector<char> open_chars_;
    bool after_key_ = false;

    JsonWriter& open(char c) {
        separate();
        os_ << c;
        has_items_.push_back(false);
        open_chars_.push_back(c);
        return *this;
    }

    JsonWriter& close(char c) {
        bool had_items = !has_items_.empty() && has_items_.back();
        if (!has_items_.empty()) {
            has_items_.pop_back();
            open_chars_.pop_back();
        }
        if (had_items) newline();
        os_ << c;
        return *this;
    }

    // Comma and indentation before a new member/element
    void separate() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (has_items_.empty()) return;
        if (has_items_.back()) os_ << ',';
        has_items_.back() = true;
        newline();
    }

    void newline() {
        os_ << '\n' << std::string(has_items_.size() * indent_size_, ' ');
    }

    void write_string(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

}  // namespace lunar

#endif  // LUNAR_JSON_WRITER_HPP
