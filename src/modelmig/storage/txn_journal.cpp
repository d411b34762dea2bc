#include "modelmig/storage/txn_journal.h"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "modelmig/common/logger.h"

namespace modelmig {
namespace storage {

namespace {

enum ValueTag : uint8_t {
    TAG_NULL = 0,
    TAG_BOOL = 1,
    TAG_INT = 2,
    TAG_STRING = 3,
    TAG_STRINGS = 4
};

const char* kSegmentPrefix = "txnlog_";
const char* kOrphanPrefix = "orphan_";

void put_u8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&v);
    out.insert(out.end(), bytes, bytes + sizeof(uint32_t));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&v);
    out.insert(out.end(), bytes, bytes + sizeof(uint64_t));
}

void put_string(std::vector<uint8_t>& out, const std::string& s) {
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

void put_value(std::vector<uint8_t>& out, const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        put_u8(out, TAG_NULL);
    } else if (std::holds_alternative<bool>(value)) {
        put_u8(out, TAG_BOOL);
        put_u8(out, std::get<bool>(value) ? 1 : 0);
    } else if (std::holds_alternative<int64_t>(value)) {
        put_u8(out, TAG_INT);
        put_u64(out, static_cast<uint64_t>(std::get<int64_t>(value)));
    } else if (std::holds_alternative<std::string>(value)) {
        put_u8(out, TAG_STRING);
        put_string(out, std::get<std::string>(value));
    } else {
        const auto& list = std::get<std::vector<std::string>>(value);
        put_u8(out, TAG_STRINGS);
        put_u32(out, static_cast<uint32_t>(list.size()));
        for (const auto& item : list) {
            put_string(out, item);
        }
    }
}

// Bounds-checked cursor over an encoded entry
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {}

    bool u8(uint8_t& v) {
        if (offset_ + 1 > data_.size()) return false;
        v = data_[offset_++];
        return true;
    }

    bool u32(uint32_t& v) {
        if (offset_ + sizeof(uint32_t) > data_.size()) return false;
        std::memcpy(&v, data_.data() + offset_, sizeof(v));
        offset_ += sizeof(v);
        return true;
    }

    bool u64(uint64_t& v) {
        if (offset_ + sizeof(uint64_t) > data_.size()) return false;
        std::memcpy(&v, data_.data() + offset_, sizeof(v));
        offset_ += sizeof(v);
        return true;
    }

    bool str(std::string& s) {
        uint32_t len = 0;
        if (!u32(len) || offset_ + len > data_.size()) return false;
        s.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return true;
    }

    bool value(Value& v) {
        uint8_t tag = 0;
        if (!u8(tag)) return false;
        switch (tag) {
            case TAG_NULL:
                v = Value(std::monostate{});
                return true;
            case TAG_BOOL: {
                uint8_t b = 0;
                if (!u8(b)) return false;
                v = Value(std::in_place_type<bool>, b != 0);
                return true;
            }
            case TAG_INT: {
                uint64_t i = 0;
                if (!u64(i)) return false;
                v = Value(std::in_place_type<int64_t>, static_cast<int64_t>(i));
                return true;
            }
            case TAG_STRING: {
                std::string s;
                if (!str(s)) return false;
                v = Value(std::in_place_type<std::string>, std::move(s));
                return true;
            }
            case TAG_STRINGS: {
                uint32_t count = 0;
                if (!u32(count) || count > data_.size()) return false;
                std::vector<std::string> list;
                list.reserve(count);
                for (uint32_t i = 0; i < count; ++i) {
                    std::string s;
                    if (!str(s)) return false;
                    list.push_back(std::move(s));
                }
                v = Value(std::in_place_type<std::vector<std::string>>, std::move(list));
                return true;
            }
            default:
                return false;
        }
    }

    bool done() const { return offset_ == data_.size(); }

private:
    const std::vector<uint8_t>& data_;
    size_t offset_;
};

int segment_number(const std::string& path) {
    std::string filename = std::filesystem::path(path).filename().string();
    std::string digits = filename.substr(std::strlen(kSegmentPrefix));
    digits = digits.substr(0, digits.find('.'));
    try {
        return std::stoi(digits);
    } catch (const std::exception&) {
        return -1;
    }
}

} // namespace

TxnJournal::TxnJournal(const std::string& dir, size_t segment_bytes, bool sync)
    : dir_(dir), segment_bytes_(segment_bytes), sync_(sync), current_segment_(0) {
}

TxnJournal::~TxnJournal() {
    close();
}

core::Result<void> TxnJournal::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(dir_, ec)) {
        if (ec) {
            return core::InternalError("Failed to check journal directory existence: " + ec.message());
        }
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return core::InternalError("Failed to create journal directory: " + ec.message());
        }
    }
    if (!std::filesystem::is_directory(dir_, ec)) {
        return core::InternalError("Journal path is not a directory: " + dir_);
    }

    auto segments = list_segments();
    current_segment_ = segments.empty() ? 0 : std::max(0, segment_number(segments.back()));

    std::string segment_path = get_segment_path(current_segment_);
    current_file_.open(segment_path, std::ios::binary | std::ios::app);
    if (!current_file_.is_open()) {
        return core::InternalError("Failed to open journal segment file: " + segment_path);
    }
    if (!current_file_.good()) {
        return core::InternalError("Journal segment file is not in a good state: " + segment_path);
    }
    MODELMIG_DEBUG("Journal opened at {} (segment {})", dir_, current_segment_);
    return core::Result<void>();
}

void TxnJournal::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

core::Result<void> TxnJournal::append(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        // Rotate before writing so a failed rotation never follows a written record
        if (current_file_.is_open() && static_cast<size_t>(current_file_.tellp()) > segment_bytes_) {
            auto rotated = rotate_segment();
            if (!rotated.ok()) {
                MODELMIG_WARN("Journal rotation failed, staying on segment {}: {}",
                              current_segment_, rotated.error());
            }
        }

        auto serialized = serialize_entry(entry);
        if (!write_to_segment(current_file_, serialized, sync_)) {
            return core::InternalError("Failed to write to journal segment");
        }
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::InternalError("Journal append failed: " + std::string(e.what()));
    }
}

core::Result<void> TxnJournal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
        if (!current_file_.good()) {
            return core::InternalError("Failed to flush journal");
        }
    }
    return core::Result<void>();
}

core::Result<void> TxnJournal::replay(std::function<void(const JournalEntry&)> callback) {
    std::vector<std::string> segments;
    try {
        segments = list_segments();
    } catch (const std::filesystem::filesystem_error& e) {
        return core::InternalError("Journal replay failed: cannot access journal directory: " +
                                   std::string(e.what()));
    }

    uint64_t reached = 0;
    auto track = [&callback, &reached](const JournalEntry& entry) {
        callback(entry);
        reached = entry.revision;
    };

    for (size_t i = 0; i < segments.size(); ++i) {
        auto result = replay_segment(segments[i], track);
        if (!result.ok()) {
            return result.err().annotate("journal replay stopped at revision " + std::to_string(reached));
        }
        if (result.value().complete) {
            continue;
        }

        std::vector<std::string> later(segments.begin() + static_cast<std::ptrdiff_t>(i) + 1, segments.end());
        MODELMIG_WARN("Journal replay stopped in {} at revision {}; {} later segment(s) set aside",
                      segments[i], reached, later.size());
        return set_aside_after(segments[i], result.value(), later);
    }
    return core::Result<void>();
}

core::Result<void> TxnJournal::set_aside_after(const std::string& damaged_segment,
                                               const SegmentReplay& replayed,
                                               const std::vector<std::string>& later_segments) {
    std::error_code ec;
    std::filesystem::resize_file(damaged_segment, replayed.good_bytes, ec);
    if (ec) {
        return core::InternalError("Failed to truncate damaged journal segment " + damaged_segment +
                                   ": " + ec.message());
    }
    for (const auto& segment : later_segments) {
        std::filesystem::path path(segment);
        std::filesystem::path orphan = path.parent_path() / (kOrphanPrefix + path.filename().string());
        std::filesystem::rename(path, orphan, ec);
        if (ec) {
            return core::InternalError("Failed to set aside journal segment " + segment + ": " + ec.message());
        }
    }
    return core::Result<void>();
}

core::Result<void> TxnJournal::rewrite(const JournalEntry& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto old_segments = list_segments();
        int snapshot_segment = current_segment_ + 1;
        std::string snapshot_path = get_segment_path(snapshot_segment);

        std::ofstream snapshot_file(snapshot_path, std::ios::binary | std::ios::trunc);
        if (!snapshot_file.is_open()) {
            return core::InternalError("Failed to open journal snapshot segment: " + snapshot_path);
        }
        if (!write_to_segment(snapshot_file, serialize_entry(snapshot), true)) {
            return core::InternalError("Failed to write journal snapshot: " + snapshot_path);
        }
        snapshot_file.close();

        if (current_file_.is_open()) {
            current_file_.close();
        }
        for (const auto& segment : old_segments) {
            std::filesystem::remove(segment);
        }

        current_segment_ = snapshot_segment;
        current_file_.open(snapshot_path, std::ios::binary | std::ios::app);
        if (!current_file_.is_open()) {
            return core::InternalError("Failed to reopen journal segment: " + snapshot_path);
        }
        return core::Result<void>();
    } catch (const std::exception& e) {
        return core::InternalError("Journal rewrite failed: " + std::string(e.what()));
    }
}

std::vector<uint8_t> TxnJournal::serialize_entry(const JournalEntry& entry) {
    std::vector<uint8_t> result;
    put_u64(result, entry.revision);
    put_u8(result, entry.snapshot ? 1 : 0);
    put_u32(result, static_cast<uint32_t>(entry.writes.size()));

    for (const auto& write : entry.writes) {
        put_string(result, write.collection);
        put_string(result, write.id);
        put_u8(result, write.removed ? 1 : 0);
        put_u64(result, write.document.revision());
        put_u32(result, static_cast<uint32_t>(write.document.fields().size()));
        for (const auto& [name, value] : write.document.fields()) {
            put_string(result, name);
            put_value(result, value);
        }
    }
    return result;
}

std::optional<JournalEntry> TxnJournal::deserialize_entry(const std::vector<uint8_t>& data) {
    Reader reader(data);
    JournalEntry entry;

    uint8_t snapshot = 0;
    uint32_t write_count = 0;
    if (!reader.u64(entry.revision) || !reader.u8(snapshot) || !reader.u32(write_count)) {
        return std::nullopt;
    }
    entry.snapshot = snapshot != 0;

    // Each write needs at least its fixed-size header
    if (write_count > data.size()) {
        return std::nullopt;
    }

    for (uint32_t i = 0; i < write_count; ++i) {
        JournalEntry::Write write;
        uint8_t removed = 0;
        uint64_t revision = 0;
        uint32_t field_count = 0;
        if (!reader.str(write.collection) || !reader.str(write.id) ||
            !reader.u8(removed) || !reader.u64(revision) || !reader.u32(field_count)) {
            return std::nullopt;
        }
        if (field_count > data.size()) {
            return std::nullopt;
        }
        write.removed = removed != 0;
        for (uint32_t f = 0; f < field_count; ++f) {
            std::string name;
            Value value;
            if (!reader.str(name) || !reader.value(value)) {
                return std::nullopt;
            }
            write.document.set_value(name, value);
        }
        write.document.set_revision(revision);
        entry.writes.push_back(std::move(write));
    }

    if (!reader.done()) {
        return std::nullopt;
    }
    return entry;
}

bool TxnJournal::write_to_segment(std::ofstream& file, const std::vector<uint8_t>& data, bool flush_now) {
    if (!file.is_open()) {
        return false;
    }

    // Write data length first
    uint32_t data_length = static_cast<uint32_t>(data.size());
    file.write(reinterpret_cast<const char*>(&data_length), sizeof(data_length));
    file.write(reinterpret_cast<const char*>(data.data()), data.size());

    if (flush_now) {
        file.flush();
    }
    return file.good();
}

core::Result<void> TxnJournal::rotate_segment() {
    // Open the next segment first so a failure leaves the current one usable
    std::string next_path = get_segment_path(current_segment_ + 1);
    std::ofstream next(next_path, std::ios::binary | std::ios::app);
    if (!next.is_open()) {
        return core::InternalError("Failed to open new journal segment file: " + next_path);
    }

    current_file_.close();
    current_file_ = std::move(next);
    current_segment_++;
    MODELMIG_DEBUG("Journal rotated to segment {}", current_segment_);
    return core::Result<void>();
}

std::string TxnJournal::get_segment_path(int segment) const {
    std::ostringstream oss;
    oss << dir_ << "/" << kSegmentPrefix << std::setfill('0') << std::setw(6) << segment << ".log";
    return oss.str();
}

std::vector<std::string> TxnJournal::list_segments() const {
    std::vector<std::string> segment_files;
    if (!std::filesystem::exists(dir_)) {
        return segment_files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string filename = entry.path().filename().string();
        if (filename.rfind(kSegmentPrefix, 0) == 0) {
            segment_files.push_back(entry.path().string());
        }
    }
    // Zero-padded names sort by segment number
    std::sort(segment_files.begin(), segment_files.end());
    return segment_files;
}

core::Result<TxnJournal::SegmentReplay> TxnJournal::replay_segment(
    const std::string& segment_path, const std::function<void(const JournalEntry&)>& callback) {
    std::ifstream file(segment_path, std::ios::binary);
    if (!file.is_open()) {
        return core::InternalError("Failed to open journal segment for replay: " + segment_path);
    }

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);

    SegmentReplay replayed;
    if (file_size <= 0) {
        return replayed;
    }

    // Guards against a corrupted length field
    const uint32_t MAX_DATA_LENGTH = 256 * 1024 * 1024;

    while (true) {
        std::streampos current_pos = file.tellg();
        if (current_pos < 0 || current_pos >= file_size) {
            break;
        }
        replayed.complete = false;
        if (current_pos + static_cast<std::streampos>(sizeof(uint32_t)) > file_size) {
            MODELMIG_WARN("Journal segment {} has a truncated record header", segment_path);
            break;
        }

        uint32_t data_length = 0;
        file.read(reinterpret_cast<char*>(&data_length), sizeof(data_length));
        if (file.gcount() != sizeof(data_length)) {
            break;
        }
        if (data_length == 0 || data_length > MAX_DATA_LENGTH) {
            MODELMIG_WARN("Journal segment {} has a corrupt record length {}", segment_path, data_length);
            break;
        }

        std::streampos expected_end_pos = current_pos + static_cast<std::streampos>(sizeof(uint32_t) + data_length);
        if (expected_end_pos > file_size) {
            MODELMIG_WARN("Journal segment {} ends inside a record", segment_path);
            break;
        }

        std::vector<uint8_t> data(data_length);
        file.read(reinterpret_cast<char*>(data.data()), data_length);
        if (file.gcount() != static_cast<std::streamsize>(data_length)) {
            break;
        }

        auto entry = deserialize_entry(data);
        if (!entry.has_value()) {
            MODELMIG_WARN("Journal segment {} has an undecodable record", segment_path);
            break;
        }
        callback(entry.value());
        replayed.good_bytes = static_cast<uint64_t>(expected_end_pos);
        replayed.complete = true;
    }
    return replayed;
}

} // namespace storage
} // namespace modelmig
