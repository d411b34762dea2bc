#ifndef MODELMIG_STORAGE_TXN_JOURNAL_H_
#define MODELMIG_STORAGE_TXN_JOURNAL_H_

#include <cstdint>
#include <string>
#include <functional>
#include <fstream>
#include <vector>
#include <optional>
#include <mutex>
#include "modelmig/core/result.h"
#include "modelmig/storage/document.h"

namespace modelmig {
namespace storage {

/**
 * @brief The writes of one committed transaction, as recorded in the journal
 */
struct JournalEntry {
    struct Write {
        std::string collection;
        std::string id;
        bool removed = false;
        Document document;   // Full document after the write; empty when removed
    };

    uint64_t revision = 0;
    bool snapshot = false;   // Replaces all prior state when replayed
    std::vector<Write> writes;
};

/**
 * @brief Append-only, segmented log of committed transactions
 *
 * Each record is a 32-bit length followed by the encoded entry. Segments
 * are named txnlog_NNNNNN.log and replayed in order on startup. Replay
 * stops at the first damaged record: its segment is truncated to the
 * last good record and any later segments are renamed orphan_txnlog_*
 * so they are never replayed on top of the gap.
 */
class TxnJournal {
public:
    TxnJournal(const std::string& dir, size_t segment_bytes, bool sync);
    ~TxnJournal();

    core::Result<void> open(); // Creates the directory and opens the newest segment
    core::Result<void> append(const JournalEntry& entry);
    core::Result<void> flush();
    core::Result<void> replay(std::function<void(const JournalEntry&)> callback);

    // Replaces every segment with a single one holding `snapshot`
    core::Result<void> rewrite(const JournalEntry& snapshot);

    void close();

private:
    std::string dir_;
    size_t segment_bytes_;
    bool sync_;
    int current_segment_;
    std::ofstream current_file_;
    mutable std::mutex mutex_;  // Protects concurrent access to the journal

    std::vector<uint8_t> serialize_entry(const JournalEntry& entry);
    std::optional<JournalEntry> deserialize_entry(const std::vector<uint8_t>& data);
    bool write_to_segment(std::ofstream& file, const std::vector<uint8_t>& data, bool flush_now);
    core::Result<void> rotate_segment();
    std::string get_segment_path(int segment) const;
    std::vector<std::string> list_segments() const;

    struct SegmentReplay {
        uint64_t good_bytes = 0;   // Length of the prefix made of whole, decodable records
        bool complete = true;
    };
    core::Result<SegmentReplay> replay_segment(const std::string& segment_path,
                                               const std::function<void(const JournalEntry&)>& callback);
    core::Result<void> set_aside_after(const std::string& damaged_segment,
                                       const SegmentReplay& replayed,
                                       const std::vector<std::string>& later_segments);
};

} // namespace storage
} // namespace modelmig

#endif // MODELMIG_STORAGE_TXN_JOURNAL_H_
