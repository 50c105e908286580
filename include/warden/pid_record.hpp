#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

namespace warden
{

/// The persisted handle between separate supervisor invocations: one file
/// holding the child's pid as decimal text.
///
/// Writes go through a temporary file and rename(), so readers see either
/// the old record or the new one. Mutating operations are expected to run
/// under lock(), which serializes start/stop/restart across processes.
class PidRecord
{
  public:
    /// Exclusive advisory lock on "<path>.lock", released on destruction
    class Lock
    {
      public:
        Lock() = default;
        ~Lock();

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        Lock(Lock&& other) noexcept;
        Lock& operator=(Lock&& other) noexcept;

        bool owns_lock() const
        {
            return fd_ >= 0;
        }

        void release();

      private:
        friend class PidRecord;
        explicit Lock(int fd) : fd_(fd) {}
        int fd_ = -1;
    };

    explicit PidRecord(std::filesystem::path path);

    const std::filesystem::path& path() const
    {
        return path_;
    }

    std::filesystem::path lock_path() const;

    /// @return the recorded pid, or nullopt when no record exists
    /// @throws RecordError if the file is unreadable or not a positive integer
    std::optional<int> read() const;

    /// Atomically replace the record. Creates missing parent directories.
    void write(int pid);

    /// @return true if a record was deleted
    bool remove();

    bool exists() const;

    /// Modification time of the record, i.e. when the pid was written
    std::optional<std::chrono::system_clock::time_point> modified_at() const;

    /// Acquire the record lock without blocking.
    /// @throws RecordBusyError if another invocation holds it
    Lock lock();

  private:
    std::filesystem::path path_;
};

} // namespace warden
