/**
 * @file pid_record.hpp
 * @brief Persisted process identifier of the last started target
 *
 * The record is a small text file holding the decimal PID followed by a
 * newline. runctl adds a second line with the start time of that process
 * (field 22 of /proc/<pid>/stat), which tells the launched instance apart
 * from an unrelated process that later received the same PID. A record
 * without that line is still valid.
 *
 * Writes go to a temporary sibling file which is then renamed over the
 * record, so readers never observe a half-written PID.
 */

#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace runctl {

    /**
     * @brief Result of reading a PID Record
     */
    enum class RecordStatus {
        ABSENT,   ///< No record file
        VALID,    ///< Record holds a positive decimal PID
        CORRUPT   ///< Record exists but does not hold a PID
    };

    struct RecordContents {
        RecordStatus status = RecordStatus::ABSENT;
        pid_t pid = -1;        ///< Set when status == VALID
        std::optional<unsigned long long> start_time;  ///< Launch start time, if recorded
        std::string raw;       ///< File content as read, for diagnostics
    };

    /**
     * @brief Reads, writes and removes the PID Record file
     *
     * Usage:
     *   PidRecord record("/srv/app/app.pid");
     *   record.write(1234, 98765);
     *   auto contents = record.read();   // {VALID, 1234, 98765, "1234\n98765\n"}
     *   record.remove();
     *
     * All failures other than "file does not exist" throw
     * SupervisorError(IO_ERROR).
     */
    class PidRecord {
    public:
        explicit PidRecord(std::filesystem::path path);

        /**
         * @brief Reads the record
         *
         * @return RecordContents ABSENT, VALID with pid, or CORRUPT
         * @throws SupervisorError IO_ERROR if the path exists but can't be read
         *         as a regular file
         */
        [[nodiscard]] RecordContents read() const;

        /**
         * @brief Atomically replaces the record with pid
         *
         * Creates the parent directory if needed.
         *
         * @param pid Process identifier to persist
         * @param start_time Start time of pid in clock ticks since boot
         * @throws SupervisorError IO_ERROR on any filesystem failure
         */
        void write(pid_t pid, std::optional<unsigned long long> start_time = std::nullopt) const;

        /**
         * @brief Deletes the record
         *
         * @return true if a file was removed, false if there was none
         * @throws SupervisorError IO_ERROR if removal failed
         */
        bool remove() const;

        [[nodiscard]] bool exists() const;

        [[nodiscard]] std::filesystem::path get_path() const { return path_; }

        /**
         * @brief Parses record text into a PID
         *
         * Accepts optional surrounding whitespace around a positive decimal
         * integer that fits in pid_t. Anything else is rejected.
         *
         * @return pid_t The PID, or -1 if text is not a valid record
         */
        static pid_t parse(const std::string& text);

    private:
        std::filesystem::path path_;
    };

} // namespace runctl
