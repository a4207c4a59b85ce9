#include "viewmark/snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>

#include "viewmark/constants.hpp"
#include "viewmark/log.hpp"

namespace viewmark {

namespace {

// ---- Writing ----

void write_string(std::ostream& out, const std::string& s) {
    out << '"';
    for (char ch : s) {
        switch (ch) {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n"; break;
        case '\r': out << "\\r"; break;
        case '\t': out << "\\t"; break;
        case '\b': out << "\\b"; break;
        case '\f': out << "\\f"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
                out << buf;
            } else {
                out << ch;
            }
        }
    }
    out << '"';
}

void write_float(std::ostream& out, float v) {
    // JSON has no NaN/Inf
    out << (std::isfinite(v) ? v : 0.0f);
}

void write_floats(std::ostream& out, std::initializer_list<float> values) {
    out << '[';
    bool first = true;
    for (float v : values) {
        if (!first) {
            out << ", ";
        }
        first = false;
        write_float(out, v);
    }
    out << ']';
}

void write_record(std::ostream& out, const Bookmark& bm, const std::string& indent) {
    out << indent << "{\n";
    out << indent << "  \"name\": ";
    write_string(out, bm.name);
    out << ",\n" << indent << "  \"pivot\": ";
    write_floats(out, {bm.pivot.x(), bm.pivot.y(), bm.pivot.z()});
    out << ",\n" << indent << "  \"rotation\": ";
    write_floats(out, {bm.rotation.x(), bm.rotation.y(), bm.rotation.z(), bm.rotation.w()});
    out << ",\n" << indent << "  \"size\": ";
    write_float(out, bm.size);
    out << ",\n" << indent << "  \"orthographic\": " << (bm.orthographic ? "true" : "false");
    out << ",\n" << indent << "  \"color\": ";
    write_floats(out, {bm.color.r, bm.color.g, bm.color.b, bm.color.a});
    out << ",\n" << indent << "  \"cameraDistance\": ";
    write_float(out, bm.camera_distance);
    out << ",\n" << indent << "  \"cameraPosition\": ";
    write_floats(out, {bm.camera_position.x(), bm.camera_position.y(), bm.camera_position.z()});
    out << "\n" << indent << "}";
}

void write_records(std::ostream& out, const std::vector<Bookmark>& records,
                   const std::string& indent) {
    if (records.empty()) {
        out << "[]";
        return;
    }
    out << "[\n";
    for (std::size_t i = 0; i < records.size(); ++i) {
        write_record(out, records[i], indent + "  ");
        out << (i + 1 < records.size() ? ",\n" : "\n");
    }
    out << indent << "]";
}

// ---- Reading ----

/// Reader for the snapshot layout. Unknown keys are skipped so files
/// written by newer versions still load.
class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    void skip_ws() {
        while (i_ < text_.size() &&
               (text_[i_] == ' ' || text_[i_] == '\t' ||
                text_[i_] == '\n' || text_[i_] == '\r')) {
            ++i_;
        }
    }

    bool at_end() {
        skip_ws();
        return i_ >= text_.size();
    }

    char peek() {
        skip_ws();
        if (i_ >= text_.size()) {
            fail("unexpected end of input");
        }
        return text_[i_];
    }

    bool consume(char ch) {
        if (peek() == ch) {
            ++i_;
            return true;
        }
        return false;
    }

    void expect(char ch) {
        if (!consume(ch)) {
            fail(std::string("expected '") + ch + "'");
        }
    }

    std::string read_string() {
        expect('"');
        std::string result;
        while (true) {
            if (i_ >= text_.size()) {
                fail("unterminated string");
            }
            char ch = text_[i_++];
            if (ch == '"') {
                break;
            }
            if (ch != '\\') {
                result += ch;
                continue;
            }
            if (i_ >= text_.size()) {
                fail("unterminated escape");
            }
            char esc = text_[i_++];
            switch (esc) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u':  append_utf8(result, read_hex4()); break;
            default:   fail("bad escape");
            }
        }
        return result;
    }

    double read_number() {
        skip_ws();
        std::size_t start = i_;
        while (i_ < text_.size() &&
               (text_[i_] == '-' || text_[i_] == '+' ||
                text_[i_] == '.' || text_[i_] == 'e' ||
                text_[i_] == 'E' ||
                (text_[i_] >= '0' && text_[i_] <= '9'))) {
            ++i_;
        }
        if (start == i_) {
            fail("expected number");
        }
        std::istringstream in(text_.substr(start, i_ - start));
        in.imbue(std::locale::classic());
        double value = 0.0;
        in >> value;
        if (in.fail() || !in.eof()) {
            fail("malformed number");
        }
        return value;
    }

    float read_float() {
        return static_cast<float>(read_number());
    }

    bool read_bool() {
        skip_ws();
        if (text_.compare(i_, 4, "true") == 0) {
            i_ += 4;
            return true;
        }
        if (text_.compare(i_, 5, "false") == 0) {
            i_ += 5;
            return false;
        }
        fail("expected boolean");
        return false;
    }

    /// Exactly `n` numbers in an array.
    std::vector<float> read_floats(std::size_t n) {
        std::vector<float> values;
        read_array([&]() { values.push_back(read_float()); });
        if (values.size() != n) {
            fail("expected " + std::to_string(n) + " numbers");
        }
        return values;
    }

    template <typename Fn>
    void read_object(Fn on_key) {
        enter();
        expect('{');
        if (!consume('}')) {
            do {
                std::string key = read_string();
                expect(':');
                on_key(key);
            } while (consume(','));
            expect('}');
        }
        --depth_;
    }

    template <typename Fn>
    void read_array(Fn on_item) {
        enter();
        expect('[');
        if (!consume(']')) {
            do {
                on_item();
            } while (consume(','));
            expect(']');
        }
        --depth_;
    }

    void skip_value() {
        char ch = peek();
        if (ch == '{') {
            read_object([this](const std::string&) { skip_value(); });
        } else if (ch == '[') {
            read_array([this]() { skip_value(); });
        } else if (ch == '"') {
            read_string();
        } else if (ch == 't' || ch == 'f') {
            read_bool();
        } else if (text_.compare(i_, 4, "null") == 0) {
            i_ += 4;
        } else {
            read_number();
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw SnapshotError("Snapshot parse error at offset " +
                            std::to_string(i_) + ": " + what);
    }

private:
    const std::string& text_;
    std::size_t i_ = 0;
    std::size_t depth_ = 0;

    void enter() {
        if (++depth_ > MAX_SNAPSHOT_DEPTH) {
            fail("nesting too deep");
        }
    }

    unsigned read_hex4() {
        if (i_ + 4 > text_.size()) {
            fail("short \\u escape");
        }
        unsigned code = 0;
        for (int k = 0; k < 4; ++k) {
            char ch = text_[i_++];
            code <<= 4;
            if (ch >= '0' && ch <= '9') {
                code |= static_cast<unsigned>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                code |= static_cast<unsigned>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                code |= static_cast<unsigned>(ch - 'A' + 10);
            } else {
                fail("bad hex digit");
            }
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }
};

Bookmark read_record(Reader& reader) {
    Bookmark bm;
    bool has_position = false;

    reader.read_object([&](const std::string& key) {
        if (key == "name") {
            bm.name = reader.read_string();
        } else if (key == "pivot") {
            auto v = reader.read_floats(3);
            bm.pivot = Vec3(v[0], v[1], v[2]);
        } else if (key == "rotation") {
            auto v = reader.read_floats(4);
            bm.rotation = Quat(v[3], v[0], v[1], v[2]);
        } else if (key == "size") {
            bm.size = reader.read_float();
        } else if (key == "orthographic") {
            bm.orthographic = reader.read_bool();
        } else if (key == "color") {
            auto v = reader.read_floats(4);
            bm.color = Rgba{v[0], v[1], v[2], v[3]};
        } else if (key == "cameraDistance") {
            bm.camera_distance = reader.read_float();
        } else if (key == "cameraPosition" || key == "cameraPositionAtSave") {
            auto v = reader.read_floats(3);
            bm.camera_position = Vec3(v[0], v[1], v[2]);
            has_position = true;
        } else {
            reader.skip_value();
        }
    });

    if (!has_position) {
        Pose pose;
        pose.pivot = bm.pivot;
        pose.rotation = bm.rotation;
        pose.distance = bm.camera_distance;
        bm.camera_position = camera_position(pose);
    }
    return bm;
}

std::vector<Bookmark> read_records(Reader& reader) {
    std::vector<Bookmark> records;
    reader.read_array([&]() { records.push_back(read_record(reader)); });
    return records;
}

Bucket read_bucket(Reader& reader) {
    Bucket bucket;
    reader.read_object([&](const std::string& key) {
        if (key == "key") {
            bucket.key = reader.read_string();
        } else if (key == "contextPath") {
            bucket.context_path = reader.read_string();
        } else if (key == "records") {
            bucket.records = read_records(reader);
        } else {
            reader.skip_value();
        }
    });
    return bucket;
}

/// Fold buckets that share a key into the first one with that key.
std::vector<Bucket> merge_duplicate_buckets(std::vector<Bucket> buckets) {
    std::vector<Bucket> merged;
    merged.reserve(buckets.size());
    for (auto& bucket : buckets) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&bucket](const Bucket& b) { return b.key == bucket.key; });
        if (it == merged.end()) {
            merged.push_back(std::move(bucket));
            continue;
        }
        logger()->warn("Merging duplicate bookmark context \"{}\"", bucket.key);
        if (it->context_path.empty()) {
            it->context_path = bucket.context_path;
        }
        it->records.insert(it->records.end(), bucket.records.begin(), bucket.records.end());
    }
    return merged;
}

} // anonymous namespace

Snapshot take_snapshot(const BookmarkStore& store) {
    Snapshot snapshot;
    snapshot.active_context = store.active_context();
    snapshot.has_active_context = true;
    snapshot.buckets = store.buckets();
    return snapshot;
}

std::string encode_snapshot(const Snapshot& snapshot) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out.precision(std::numeric_limits<float>::max_digits10);

    out << "{\n";
    out << "  \"activeContext\": ";
    write_string(out, snapshot.active_context);
    out << ",\n";
    out << "  \"buckets\": [";
    for (std::size_t i = 0; i < snapshot.buckets.size(); ++i) {
        const Bucket& bucket = snapshot.buckets[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\n";
        out << "      \"key\": ";
        write_string(out, bucket.key);
        out << ",\n      \"contextPath\": ";
        write_string(out, bucket.context_path);
        out << ",\n      \"records\": ";
        write_records(out, bucket.records, "      ");
        out << "\n    }";
    }
    out << (snapshot.buckets.empty() ? "],\n" : "\n  ],\n");
    out << "  \"legacyRecords\": ";
    write_records(out, snapshot.legacy_records, "  ");
    out << "\n}\n";
    return out.str();
}

std::string encode_snapshot(const BookmarkStore& store) {
    return encode_snapshot(take_snapshot(store));
}

Snapshot decode_snapshot(const std::string& json) {
    Snapshot snapshot;
    Reader reader(json);

    reader.read_object([&](const std::string& key) {
        if (key == "activeContext") {
            snapshot.active_context = reader.read_string();
            snapshot.has_active_context = true;
        } else if (key == "buckets") {
            reader.read_array([&]() { snapshot.buckets.push_back(read_bucket(reader)); });
        } else if (key == "legacyRecords" || key == "bookmarks") {
            auto legacy = read_records(reader);
            snapshot.legacy_records.insert(snapshot.legacy_records.end(),
                                           legacy.begin(), legacy.end());
        } else {
            reader.skip_value();
        }
    });

    if (!reader.at_end()) {
        reader.fail("trailing characters");
    }
    return snapshot;
}

Status restore_snapshot(BookmarkStore& store, const std::string& json) {
    Snapshot snapshot;
    try {
        snapshot = decode_snapshot(json);
    } catch (const SnapshotError& e) {
        logger()->warn("{}; starting with an empty bookmark store", e.what());
        store.clear();
        return Status::MALFORMED_SNAPSHOT;
    }

    snapshot.buckets = merge_duplicate_buckets(std::move(snapshot.buckets));

    ContextKey active = snapshot.has_active_context ? snapshot.active_context
                                                    : store.active_context();

    if (!snapshot.legacy_records.empty()) {
        Bucket* target = nullptr;
        for (auto& bucket : snapshot.buckets) {
            if (bucket.key == active) {
                target = &bucket;
                break;
            }
        }
        if (!target) {
            Bucket bucket;
            bucket.key = active;
            snapshot.buckets.push_back(std::move(bucket));
            target = &snapshot.buckets.back();
        }
        logger()->info("Migrating {} legacy bookmark(s) into context \"{}\"",
                       snapshot.legacy_records.size(), active);
        target->records.insert(target->records.end(),
                               snapshot.legacy_records.begin(),
                               snapshot.legacy_records.end());
        snapshot.legacy_records.clear();
    }

    store.assign(std::move(snapshot.buckets), active);
    return Status::OK;
}

Status load_store_file(BookmarkStore& store, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger()->debug("No bookmark file at {}", path);
        return Status::NO_OP;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return restore_snapshot(store, ss.str());
}

void save_store_file(const BookmarkStore& store, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw StoreFileError("Cannot write bookmark file: " + path);
    }
    file << encode_snapshot(store);
    if (!file) {
        throw StoreFileError("Failed writing bookmark file: " + path);
    }
}

} // namespace viewmark
